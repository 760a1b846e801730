#include "rebuild/ZipWriter.hpp"

#include "rebuild/Checksum.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace rebuild {

namespace {

constexpr std::uint32_t kSigLocalHeader = 0x04034b50u;
constexpr std::uint32_t kSigCentralHeader = 0x02014b50u;
constexpr std::uint32_t kSigEndOfCentral = 0x06054b50u;
constexpr std::uint32_t kSigDataDescriptor = 0x08074b50u;

constexpr std::uint16_t kVersionMadeBy = 20;      // 2.0
constexpr std::uint16_t kVersionNeeded = 20;      // 2.0
constexpr std::uint16_t kMethodStore = 0;         // no compression
constexpr std::uint16_t kFlagDataDescriptor = 0x0008u;

// 1980-01-01 00:00:00, the earliest DOS timestamp.
constexpr std::uint16_t kDosEpochDate = (0 << 9) | (1 << 5) | 1;
constexpr std::uint16_t kDosEpochTime = 0;

void WriteLe16(std::ofstream& ofs, std::uint16_t v)
{
  const unsigned char b[2] = {static_cast<unsigned char>(v & 0xFFu),
                              static_cast<unsigned char>((v >> 8) & 0xFFu)};
  ofs.write(reinterpret_cast<const char*>(b), 2);
}

void WriteLe32(std::ofstream& ofs, std::uint32_t v)
{
  const unsigned char b[4] = {static_cast<unsigned char>(v & 0xFFu),
                              static_cast<unsigned char>((v >> 8) & 0xFFu),
                              static_cast<unsigned char>((v >> 16) & 0xFFu),
                              static_cast<unsigned char>((v >> 24) & 0xFFu)};
  ofs.write(reinterpret_cast<const char*>(b), 4);
}

std::uint32_t TellpU32(std::ofstream& ofs)
{
  const std::streampos p = ofs.tellp();
  if (p < 0) return 0;
  const std::uint64_t u = static_cast<std::uint64_t>(p);
  if (u > std::numeric_limits<std::uint32_t>::max()) return std::numeric_limits<std::uint32_t>::max();
  return static_cast<std::uint32_t>(u);
}

} // namespace

ZipWriter::~ZipWriter()
{
  close();
}

bool ZipWriter::open(const std::filesystem::path& path, std::string& outError, const ZipWriterOptions& opt)
{
  outError.clear();
  close();

  if (path.empty()) {
    outError = "ZipWriter path is empty";
    return false;
  }

  std::error_code ec;
  if (std::filesystem::exists(path, ec) && !ec) {
    if (!opt.overwrite) {
      outError = "ZipWriter target already exists: " + path.string();
      return false;
    }
    // A failed removal surfaces as an open failure below.
    std::filesystem::remove(path, ec);
  }

  // Ensure parent directory exists.
  const std::filesystem::path parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "ZipWriter unable to create directory: " + parent.string() + " (" + ec.message() + ")";
      return false;
    }
  }

  auto* ofs = new std::ofstream(path, std::ios::binary | std::ios::trunc);
  if (!(*ofs)) {
    delete ofs;
    outError = "ZipWriter unable to open file: " + path.string();
    return false;
  }

  m_path = path;
  m_opt = opt;
  m_ofsPtr = ofs;
  m_open = true;
  m_finalized = false;
  m_entries.clear();
  return true;
}

void ZipWriter::close()
{
  if (m_ofsPtr) {
    m_ofsPtr->close();
    delete m_ofsPtr;
    m_ofsPtr = nullptr;
  }
  m_open = false;
  m_finalized = false;
  m_entries.clear();
  m_path.clear();
}

void ZipWriter::entryTimeDate(std::uint16_t& outTime, std::uint16_t& outDate) const
{
  if (m_opt.fixedTimestamp) {
    outTime = kDosEpochTime;
    outDate = kDosEpochDate;
    return;
  }
  dosTimeDateFromTimeT(std::time(nullptr), outTime, outDate);
}

void ZipWriter::dosTimeDateFromTimeT(std::time_t t, std::uint16_t& outTime, std::uint16_t& outDate)
{
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  int year = tm.tm_year + 1900;
  if (year < 1980) year = 1980; // DOS time starts at 1980.
  if (year > 2107) year = 2107; // 7 bits.

  const int month = std::clamp(tm.tm_mon + 1, 1, 12);
  const int day = std::clamp(tm.tm_mday, 1, 31);
  const int hour = std::clamp(tm.tm_hour, 0, 23);
  const int minute = std::clamp(tm.tm_min, 0, 59);
  const int sec2 = std::clamp(tm.tm_sec / 2, 0, 29);

  outDate = static_cast<std::uint16_t>(((year - 1980) << 9) | (month << 5) | day);
  outTime = static_cast<std::uint16_t>((hour << 11) | (minute << 5) | sec2);
}

bool ZipWriter::sanitizeZipPath(const std::string& in, std::string& out, std::string& outError)
{
  outError.clear();
  out.clear();
  if (in.empty()) {
    outError = "zip path is empty";
    return false;
  }

  // Normalize slashes, then split on '/'. Leading slashes and "." segments
  // vanish here.
  std::vector<std::string> parts;
  std::string cur;
  for (char c : in) {
    if (c == '\\') c = '/';
    if (c == '/') {
      if (!cur.empty() && cur != ".") parts.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty() && cur != ".") parts.push_back(cur);

  if (parts.empty()) {
    outError = "zip path is empty after normalization";
    return false;
  }

  for (const auto& p : parts) {
    if (p == "..") {
      outError = "zip path contains '..' segment (blocked): " + in;
      return false;
    }
  }

  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.push_back('/');
    out += parts[i];
  }
  if (out.size() > std::numeric_limits<std::uint16_t>::max()) {
    outError = "zip path too long";
    out.clear();
    return false;
  }
  return true;
}

bool ZipWriter::hasEntry(const std::string& name) const
{
  return std::any_of(m_entries.begin(), m_entries.end(), [&](const Entry& e) { return e.name == name; });
}

bool ZipWriter::addFileFromBytes(const std::string& zipPath, const std::uint8_t* data, std::size_t size, std::string& outError)
{
  outError.clear();
  if (!m_open || !m_ofsPtr) {
    outError = "ZipWriter is not open";
    return false;
  }
  if (m_finalized) {
    outError = "ZipWriter already finalized";
    return false;
  }

  std::string name;
  if (!sanitizeZipPath(zipPath, name, outError)) {
    return false;
  }
  if (hasEntry(name)) {
    outError = "ZipWriter duplicate entry name: " + name;
    return false;
  }

  if (!data && size > 0) {
    outError = "ZipWriter addFileFromBytes called with null data";
    return false;
  }

  if (size > std::numeric_limits<std::uint32_t>::max()) {
    outError = "ZipWriter entry too large (ZIP64 not supported): " + name;
    return false;
  }

  std::ofstream& ofs = *m_ofsPtr;

  Entry e;
  e.name = name;
  e.flags = kFlagDataDescriptor;
  e.method = kMethodStore;
  entryTimeDate(e.dosTime, e.dosDate);
  e.localHeaderOffset = TellpU32(ofs);

  // Local file header (sizes/CRC deferred via data descriptor).
  WriteLe32(ofs, kSigLocalHeader);
  WriteLe16(ofs, kVersionNeeded);
  WriteLe16(ofs, e.flags);
  WriteLe16(ofs, e.method);
  WriteLe16(ofs, e.dosTime);
  WriteLe16(ofs, e.dosDate);
  WriteLe32(ofs, 0); // crc32
  WriteLe32(ofs, 0); // comp size
  WriteLe32(ofs, 0); // uncomp size
  WriteLe16(ofs, static_cast<std::uint16_t>(e.name.size()));
  WriteLe16(ofs, 0); // extra len
  ofs.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
  if (!ofs.good()) {
    outError = "ZipWriter write failed (local header)";
    return false;
  }

  // Data
  std::uint32_t crc = 0xFFFFFFFFu;
  if (size > 0) {
    crc = Crc32Update(crc, data, size);
    ofs.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  }
  if (!ofs.good()) {
    outError = "ZipWriter write failed (data)";
    return false;
  }

  e.uncompSize = static_cast<std::uint32_t>(size);
  e.compSize = static_cast<std::uint32_t>(size);
  e.crc32 = crc ^ 0xFFFFFFFFu;

  // Data descriptor
  WriteLe32(ofs, kSigDataDescriptor);
  WriteLe32(ofs, e.crc32);
  WriteLe32(ofs, e.compSize);
  WriteLe32(ofs, e.uncompSize);
  if (!ofs.good()) {
    outError = "ZipWriter write failed (data descriptor)";
    return false;
  }

  m_entries.push_back(e);
  return true;
}

bool ZipWriter::writeCentralDirectory(std::string& outError)
{
  outError.clear();
  if (!m_open || !m_ofsPtr) {
    outError = "ZipWriter is not open";
    return false;
  }

  if (m_entries.size() > std::numeric_limits<std::uint16_t>::max()) {
    outError = "ZipWriter too many entries (ZIP64 not supported)";
    return false;
  }

  std::ofstream& ofs = *m_ofsPtr;
  const std::uint32_t cdOffset = TellpU32(ofs);

  for (const Entry& e : m_entries) {
    WriteLe32(ofs, kSigCentralHeader);
    WriteLe16(ofs, kVersionMadeBy);
    WriteLe16(ofs, kVersionNeeded);
    WriteLe16(ofs, e.flags);
    WriteLe16(ofs, e.method);
    WriteLe16(ofs, e.dosTime);
    WriteLe16(ofs, e.dosDate);
    WriteLe32(ofs, e.crc32);
    WriteLe32(ofs, e.compSize);
    WriteLe32(ofs, e.uncompSize);
    WriteLe16(ofs, static_cast<std::uint16_t>(e.name.size()));
    WriteLe16(ofs, 0); // extra
    WriteLe16(ofs, 0); // comment
    WriteLe16(ofs, 0); // disk
    WriteLe16(ofs, 0); // int attrs
    WriteLe32(ofs, 0); // ext attrs
    WriteLe32(ofs, e.localHeaderOffset);
    ofs.write(e.name.data(), static_cast<std::streamsize>(e.name.size()));
    if (!ofs.good()) {
      outError = "ZipWriter write failed (central directory)";
      return false;
    }
  }

  const std::uint32_t cdEnd = TellpU32(ofs);
  const std::uint32_t cdSize = (cdEnd >= cdOffset) ? (cdEnd - cdOffset) : 0;

  // End of central directory record.
  WriteLe32(ofs, kSigEndOfCentral);
  WriteLe16(ofs, 0); // disk
  WriteLe16(ofs, 0); // start disk
  WriteLe16(ofs, static_cast<std::uint16_t>(m_entries.size()));
  WriteLe16(ofs, static_cast<std::uint16_t>(m_entries.size()));
  WriteLe32(ofs, cdSize);
  WriteLe32(ofs, cdOffset);
  WriteLe16(ofs, 0); // comment

  if (!ofs.good()) {
    outError = "ZipWriter write failed (end of central directory)";
    return false;
  }

  ofs.flush();
  if (!ofs.good()) {
    outError = "ZipWriter flush failed";
    return false;
  }
  return true;
}

bool ZipWriter::finalize(std::string& outError)
{
  outError.clear();
  if (!m_open || !m_ofsPtr) {
    outError = "ZipWriter is not open";
    return false;
  }
  if (m_finalized) {
    return true;
  }
  if (!writeCentralDirectory(outError)) {
    return false;
  }
  m_finalized = true;
  return true;
}

} // namespace rebuild
