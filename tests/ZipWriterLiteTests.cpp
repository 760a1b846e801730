#include "rebuild/PieceExport.hpp"
#include "rebuild/Pipeline.hpp"
#include "rebuild/ZipWriter.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                         \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";             \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                         \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static bool ReadFirst2Bytes(const fs::path& file, char outSig[2])
{
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) return false;
  ifs.read(outSig, 2);
  return ifs.gcount() == 2;
}

static void TestRejectsDuplicateEntryNames()
{
  using namespace rebuild;

  fs::path zipFile = MakeTempPath("rebuild_zip_dupe");
  zipFile += ".zip";

  std::error_code ec;
  fs::remove(zipFile, ec);

  ZipWriter zw;
  std::string err;
  ASSERT_TRUE(zw.open(zipFile, err));
  EXPECT_TRUE(err.empty());

  EXPECT_TRUE(zw.addFileFromString("a.txt", "hello", err));
  EXPECT_FALSE(zw.addFileFromString("a.txt", "world", err));
  EXPECT_TRUE(err.find("duplicate") != std::string::npos);

  // Normalization should also collide.
  err.clear();
  EXPECT_TRUE(zw.addFileFromString("foo\\bar.txt", "x", err));
  EXPECT_FALSE(zw.addFileFromString("foo/bar.txt", "y", err));
  EXPECT_TRUE(err.find("duplicate") != std::string::npos);

  EXPECT_TRUE(zw.finalize(err));
  zw.close();

  // Signature sanity check (local file header starts with 'PK').
  char sig[2] = {0, 0};
  ASSERT_TRUE(ReadFirst2Bytes(zipFile, sig));
  EXPECT_EQ(sig[0], 'P');
  EXPECT_EQ(sig[1], 'K');

  fs::remove(zipFile, ec);
}

static void TestBlocksZipSlipSegments()
{
  using namespace rebuild;

  fs::path zipFile = MakeTempPath("rebuild_zip_slip");
  zipFile += ".zip";

  std::error_code ec;
  fs::remove(zipFile, ec);

  ZipWriter zw;
  std::string err;
  ASSERT_TRUE(zw.open(zipFile, err));

  err.clear();
  EXPECT_FALSE(zw.addFileFromString("../evil.txt", "nope", err));
  EXPECT_TRUE(err.find("blocked") != std::string::npos);

  // Leading slashes are stripped.
  err.clear();
  EXPECT_TRUE(zw.addFileFromString("/ok.txt", "ok", err));

  EXPECT_TRUE(zw.finalize(err));
  zw.close();

  fs::remove(zipFile, ec);
}

static std::vector<char> ReadAllBytes(const fs::path& file)
{
  std::ifstream ifs(file, std::ios::binary);
  return std::vector<char>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static void TestSanitizeZipPath()
{
  using namespace rebuild;

  std::string out;
  std::string err;

  EXPECT_TRUE(ZipWriter::sanitizeZipPath("pieces\\piece-1.obj", out, err));
  EXPECT_EQ(out, std::string("pieces/piece-1.obj"));

  EXPECT_TRUE(ZipWriter::sanitizeZipPath("./a//b/./c.txt", out, err));
  EXPECT_EQ(out, std::string("a/b/c.txt"));

  EXPECT_FALSE(ZipWriter::sanitizeZipPath("a/../../b", out, err));
  EXPECT_TRUE(err.find("blocked") != std::string::npos);

  EXPECT_FALSE(ZipWriter::sanitizeZipPath("", out, err));
  EXPECT_FALSE(ZipWriter::sanitizeZipPath("/./", out, err));
}

static void TestFixedTimestampArchivesAreIdentical()
{
  using namespace rebuild;

  fs::path zipA = MakeTempPath("rebuild_zip_fixed_a");
  zipA += ".zip";
  fs::path zipB = MakeTempPath("rebuild_zip_fixed_b");
  zipB += ".zip";

  auto writeOne = [](const fs::path& p) -> bool {
    ZipWriter zw;
    std::string err;
    if (!zw.open(p, err)) return false;
    if (!zw.addFileFromString("notes/readme.txt", "salvage plan\n", err)) return false;
    if (!zw.addFileFromString("empty.bin", "", err)) return false;
    if (zw.entryCount() != 2) return false;
    return zw.finalize(err);
  };

  ASSERT_TRUE(writeOne(zipA));
  ASSERT_TRUE(writeOne(zipB));

  const std::vector<char> a = ReadAllBytes(zipA);
  const std::vector<char> b = ReadAllBytes(zipB);
  EXPECT_TRUE(!a.empty());
  EXPECT_TRUE(a == b);

  // End-of-central-directory record is the last 22 bytes (no comment).
  ASSERT_TRUE(a.size() >= 22);
  const std::size_t eocd = a.size() - 22;
  EXPECT_EQ(a[eocd + 0], 'P');
  EXPECT_EQ(a[eocd + 1], 'K');
  EXPECT_EQ(static_cast<int>(a[eocd + 2]), 5);
  EXPECT_EQ(static_cast<int>(a[eocd + 3]), 6);

  std::error_code ec;
  fs::remove(zipA, ec);
  fs::remove(zipB, ec);
}

static void TestPieceArchiveIsReproducible()
{
  using namespace rebuild;

  ProjectMetadata meta;
  meta.projectName = "Archive Check";
  meta.description = "brick warehouse with timber joists";
  FileManifest manifest;
  manifest.assets.push_back(UploadedFile{"warehouse.obj", 4096, ""});
  manifest.scans.push_back(UploadedFile{"warehouse.las", 8192, ""});

  const Report report = RunPipeline(meta, manifest);
  ASSERT_TRUE(!report.piecePlans.empty());

  fs::path zipA = MakeTempPath("rebuild_zip_pieces_a");
  zipA += ".zip";
  fs::path zipB = MakeTempPath("rebuild_zip_pieces_b");
  zipB += ".zip";

  std::string err;
  EXPECT_TRUE(ExportPieceArchive(zipA.string(), report, err));
  EXPECT_TRUE(err.empty());
  EXPECT_TRUE(ExportPieceArchive(zipB.string(), report, err));

  const std::vector<char> a = ReadAllBytes(zipA);
  const std::vector<char> b = ReadAllBytes(zipB);
  EXPECT_TRUE(a.size() > 100);
  EXPECT_TRUE(a == b);

  // Entry names are stored uncompressed, so they can be found in the raw bytes.
  const std::string raw(a.begin(), a.end());
  EXPECT_TRUE(raw.find("pieces.obj") != std::string::npos);
  EXPECT_TRUE(raw.find("pieces.mtl") != std::string::npos);
  EXPECT_TRUE(raw.find("pieces/piece-1.obj") != std::string::npos);
  EXPECT_TRUE(raw.find("manifest.json") != std::string::npos);
  EXPECT_TRUE(raw.find("report.json") != std::string::npos);

  // Entry bodies are stored too; manifest and report use the piece_id key.
  EXPECT_TRUE(raw.find("\"piece_id\": \"piece-1\"") != std::string::npos);
  EXPECT_TRUE(raw.find("\"id\":") == std::string::npos);

  std::error_code ec;
  fs::remove(zipA, ec);
  fs::remove(zipB, ec);
}

int main()
{
  TestRejectsDuplicateEntryNames();
  TestBlocksZipSlipSegments();
  TestSanitizeZipPath();
  TestFixedTimestampArchivesAreIdentical();
  TestPieceArchiveIsReproducible();

  if (g_failures == 0) {
    std::cout << "rebuild_zip_tests: OK\n";
    return 0;
  }

  std::cerr << "rebuild_zip_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
