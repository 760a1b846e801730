#include "cli/CliParse.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
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

static void TestParseI32()
{
  using namespace rebuild::cli;

  int v = 0;
  EXPECT_TRUE(ParseI32("0", &v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseI32("-1", &v));
  EXPECT_EQ(v, -1);
  EXPECT_TRUE(ParseI32("+7", &v));
  EXPECT_EQ(v, 7);

  // Leading/trailing junk should fail.
  EXPECT_FALSE(ParseI32("1.0", &v));
  EXPECT_FALSE(ParseI32("1 ", &v));
  EXPECT_FALSE(ParseI32(" 1", &v));
  EXPECT_FALSE(ParseI32("1a", &v));
  EXPECT_FALSE(ParseI32("", &v));
  EXPECT_FALSE(ParseI32("+", &v));

  // Overflow should fail.
  EXPECT_FALSE(ParseI32("2147483648", &v));
  EXPECT_FALSE(ParseI32("-2147483649", &v));
}

static void TestParseU64()
{
  using namespace rebuild::cli;

  std::uint64_t v = 0;
  EXPECT_TRUE(ParseU64("0", &v));
  EXPECT_EQ(v, 0u);
  EXPECT_TRUE(ParseU64("42", &v));
  EXPECT_EQ(v, 42u);
  EXPECT_TRUE(ParseU64("+7", &v));
  EXPECT_EQ(v, 7u);

  EXPECT_TRUE(ParseU64("0x10", &v));
  EXPECT_EQ(v, 16u);
  EXPECT_TRUE(ParseU64("0Xff", &v));
  EXPECT_EQ(v, 255u);

  EXPECT_TRUE(ParseU64("18446744073709551615", &v));
  EXPECT_EQ(v, std::numeric_limits<std::uint64_t>::max());

  EXPECT_FALSE(ParseU64("", &v));
  EXPECT_FALSE(ParseU64("-1", &v));
  EXPECT_FALSE(ParseU64("0x", &v));
  EXPECT_FALSE(ParseU64("0xg", &v));
  EXPECT_FALSE(ParseU64("18446744073709551616", &v));
  EXPECT_FALSE(ParseU64(" 1", &v));
}

static void TestParseBool01()
{
  using namespace rebuild::cli;

  bool b = false;

  EXPECT_TRUE(ParseBool01("0", &b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(ParseBool01("1", &b));
  EXPECT_TRUE(b);

  EXPECT_TRUE(ParseBool01("true", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseBool01("FALSE", &b));
  EXPECT_FALSE(b);

  EXPECT_TRUE(ParseBool01("on", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseBool01("OFF", &b));
  EXPECT_FALSE(b);

  EXPECT_TRUE(ParseBool01("Yes", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseBool01("no", &b));
  EXPECT_FALSE(b);

  EXPECT_FALSE(ParseBool01("", &b));
  EXPECT_FALSE(ParseBool01("maybe", &b));
  EXPECT_FALSE(ParseBool01("2", &b));
}

static void TestParseFileSpec()
{
  using namespace rebuild::cli;

  std::string name;
  std::uint64_t size = 7;

  EXPECT_TRUE(ParseFileSpec("tower.obj", &name, &size));
  EXPECT_EQ(name, std::string("tower.obj"));
  EXPECT_EQ(size, 0u);

  EXPECT_TRUE(ParseFileSpec("facade_scan.las:2048", &name, &size));
  EXPECT_EQ(name, std::string("facade_scan.las"));
  EXPECT_EQ(size, 2048u);

  // Only a trailing run of digits is a size.
  EXPECT_TRUE(ParseFileSpec("site:north.ply", &name, &size));
  EXPECT_EQ(name, std::string("site:north.ply"));
  EXPECT_EQ(size, 0u);

  EXPECT_TRUE(ParseFileSpec("a:b:10", &name, &size));
  EXPECT_EQ(name, std::string("a:b"));
  EXPECT_EQ(size, 10u);

  EXPECT_FALSE(ParseFileSpec("", &name, &size));
  EXPECT_FALSE(ParseFileSpec(":128", &name, &size));
  EXPECT_FALSE(ParseFileSpec("big.obj:99999999999999999999", &name, &size));
}

static void TestSplitCommaList()
{
  using namespace rebuild::cli;

  {
    const auto v = SplitCommaList("a,b,c");
    ASSERT_TRUE(v.size() == 3);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "b");
    EXPECT_EQ(v[2], "c");
  }

  {
    const auto v = SplitCommaList("a.obj, b.las:12, ,c, ");
    ASSERT_TRUE(v.size() == 3);
    EXPECT_EQ(v[0], "a.obj");
    EXPECT_EQ(v[1], "b.las:12");
    EXPECT_EQ(v[2], "c");
  }

  {
    const auto v = SplitCommaList("");
    EXPECT_TRUE(v.empty());
  }
}

static void TestEnsureParentDir()
{
  using namespace rebuild::cli;

  std::error_code ec;
  const fs::path base = MakeTempPath("rebuild_cli_parse_dirs");

  EXPECT_FALSE(EnsureParentDir(fs::path{}));

  const fs::path file = base / "c" / "d" / "report.json";
  EXPECT_TRUE(EnsureParentDir(file));
  EXPECT_TRUE(fs::exists(base / "c" / "d"));

  // Bare file names have no parent to create.
  EXPECT_TRUE(EnsureParentDir(fs::path("report.json")));

  fs::remove_all(base, ec);
}

int main()
{
  TestParseI32();
  TestParseU64();
  TestParseBool01();
  TestParseFileSpec();
  TestSplitCommaList();
  TestEnsureParentDir();

  if (g_failures == 0) {
    std::cout << "rebuild_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "rebuild_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
