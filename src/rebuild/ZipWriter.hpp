#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace rebuild {

// Minimal ZIP archive writer ("store" / no compression).
//
// Used to package piece geometry exports (combined OBJ/MTL, one OBJ per piece,
// a JSON manifest) as a single download.
//
// Design notes:
// - Only the "store" method (compression=0) is supported.
// - ZIP64 is not supported (exports remain small).
// - Filenames are sanitized to prevent "zip slip" paths (no ".." segments).
// - Entry names must be unique after normalization.
// - CRC32 is computed using the project's Checksum utilities.

struct ZipWriterOptions {
  // If true, overwrite any existing file at `path`.
  bool overwrite = true;

  // If true, every entry carries the DOS epoch (1980-01-01 00:00) instead of
  // the current time, so identical inputs produce byte-identical archives.
  bool fixedTimestamp = true;
};

class ZipWriter {
public:
  ZipWriter() = default;
  ZipWriter(const ZipWriter&) = delete;
  ZipWriter& operator=(const ZipWriter&) = delete;

  ~ZipWriter();

  bool open(const std::filesystem::path& path, std::string& outError, const ZipWriterOptions& opt = ZipWriterOptions{});

  // Add an in-memory file.
  //
  // `zipPath` is the path *inside* the archive (backslashes are normalized).
  bool addFileFromBytes(const std::string& zipPath, const std::uint8_t* data, std::size_t size, std::string& outError);

  // Convenience.
  bool addFileFromString(const std::string& zipPath, const std::string& text, std::string& outError)
  {
    return addFileFromBytes(zipPath, reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), outError);
  }

  // Finish the archive (writes central directory + end-of-central-directory).
  bool finalize(std::string& outError);

  // Abort writing and close the file.
  void close();

  bool active() const { return m_open; }
  const std::filesystem::path& path() const { return m_path; }
  std::size_t entryCount() const { return m_entries.size(); }

  // Exposed for tests.
  static bool sanitizeZipPath(const std::string& in, std::string& out, std::string& outError);

private:
  struct Entry {
    std::string name;
    std::uint32_t crc32 = 0;
    std::uint32_t compSize = 0;
    std::uint32_t uncompSize = 0;
    std::uint32_t localHeaderOffset = 0;
    std::uint16_t dosTime = 0;
    std::uint16_t dosDate = 0;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;
  };

  bool writeCentralDirectory(std::string& outError);
  bool hasEntry(const std::string& name) const;

  void entryTimeDate(std::uint16_t& outTime, std::uint16_t& outDate) const;
  static void dosTimeDateFromTimeT(std::time_t t, std::uint16_t& outTime, std::uint16_t& outDate);

  bool m_open = false;
  bool m_finalized = false;
  ZipWriterOptions m_opt{};
  std::filesystem::path m_path;
  std::ofstream* m_ofsPtr = nullptr; // pimpl-ish; keeps header light
  std::vector<Entry> m_entries;
};

} // namespace rebuild
