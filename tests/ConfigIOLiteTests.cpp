#include "rebuild/ConfigIO.hpp"
#include "rebuild/Feasibility.hpp"
#include "rebuild/Json.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
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

static bool ApplyText(const std::string& text, rebuild::PipelineConfig& cfg, std::string& err)
{
  rebuild::JsonValue root;
  if (!rebuild::ParseJson(text, root, err)) return false;
  return rebuild::ApplyPipelineConfigJson(root, cfg, err);
}

static void TestJsonParseAndWrite()
{
  using namespace rebuild;

  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"b\": [1, 2.5, -3e2], \"a\": {\"s\": \"x\\ny\\u00e9\"}, \"n\": null, \"t\": true}", v, err));
  ASSERT_TRUE(v.isObject());

  // Insertion order is preserved on output.
  JsonWriteOptions compact;
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(v, compact),
            std::string("{\"b\":[1,2.5,-300],\"a\":{\"s\":\"x\\ny\xC3\xA9\"},\"n\":null,\"t\":true}"));

  // set() replaces in place.
  v.set("b", JsonValue::MakeString("replaced"));
  EXPECT_EQ(v.objectValue.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(v.objectValue[0].first, std::string("b"));
  EXPECT_TRUE(v.objectValue[0].second.isString());

  // Strict: no trailing commas, no comments, no trailing garbage.
  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_FALSE(ParseJson("{\"a\": 1} // c", v, err));
  EXPECT_FALSE(ParseJson("{\"a\": 1} x", v, err));
  EXPECT_FALSE(ParseJson("", v, err));
  EXPECT_FALSE(err.empty());

  EXPECT_EQ(JsonNumberText(3.0), std::string("3"));
  EXPECT_EQ(JsonNumberText(0.25), std::string("0.25"));
  EXPECT_EQ(JsonNumberText(-0.0), std::string("0"));
  EXPECT_EQ(JsonEscape(std::string("a\"b\\c\t")), std::string("a\\\"b\\\\c\\t"));
}

static void TestConfigRoundTrip()
{
  using namespace rebuild;

  PipelineConfig cfg;
  cfg.threads = 3;
  cfg.pieces.maxPieces = 20;
  cfg.pieces.angleStepDeg = 12.25;
  cfg.cutting.sawName = "Test band saw";
  cfg.finiteElement.nodeCount = 32;
  cfg.disaster.rules.resize(2);
  cfg.environmental.truckKeywords = {"lorry"};
  cfg.feasibility.reusableRules.push_back(ComponentRule{"stone", "dressed stone", "masonry"});
  cfg.costCarbon.costPerKg = 91.5;

  const std::string text = PipelineConfigToJson(cfg);
  EXPECT_TRUE(!text.empty() && text.back() == '\n');

  PipelineConfig loaded;
  std::string err;
  ASSERT_TRUE(ApplyText(text, loaded, err));
  EXPECT_TRUE(err.empty());

  EXPECT_EQ(PipelineConfigToJson(loaded), text);
  EXPECT_EQ(loaded.threads, 3);
  EXPECT_EQ(loaded.pieces.maxPieces, 20);
  EXPECT_EQ(loaded.cutting.sawName, std::string("Test band saw"));
  EXPECT_EQ(loaded.disaster.rules.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(loaded.feasibility.reusableRules.back().component, std::string("dressed stone"));
}

static void TestConfigMergeKeepsMissingKeys()
{
  using namespace rebuild;

  PipelineConfig cfg;
  const PipelineConfig defaults;

  std::string err;
  ASSERT_TRUE(ApplyText("{\"pieces\": {\"max_pieces\": 8}, \"cost_carbon\": {\"fixed_cost\": 1000}}", cfg, err));

  EXPECT_EQ(cfg.pieces.maxPieces, 8);
  EXPECT_EQ(cfg.pieces.minPieces, defaults.pieces.minPieces);
  EXPECT_EQ(cfg.costCarbon.fixedCost, 1000.0);
  EXPECT_EQ(cfg.costCarbon.costPerKg, defaults.costCarbon.costPerKg);
  EXPECT_EQ(cfg.cutting.sawName, defaults.cutting.sawName);
  EXPECT_EQ(cfg.disaster.rules.size(), defaults.disaster.rules.size());
  EXPECT_EQ(cfg.threads, defaults.threads);

  // Empty object is a no-op.
  const std::string before = PipelineConfigToJson(cfg);
  ASSERT_TRUE(ApplyText("{}", cfg, err));
  EXPECT_EQ(PipelineConfigToJson(cfg), before);

  // Lists replace wholesale.
  ASSERT_TRUE(ApplyText("{\"feasibility\": {\"reusable_rules\": [{\"keyword\": \"stone\", \"component\": "
                        "\"dressed stone\"}]}}",
                        cfg, err));
  ASSERT_TRUE(cfg.feasibility.reusableRules.size() == 1);

  std::vector<std::string> reusable;
  std::vector<std::string> needsNew;
  ClassifyComponents("Stone walls and brick piers", cfg.feasibility, reusable, needsNew);
  ASSERT_TRUE(reusable.size() == 1);
  EXPECT_EQ(reusable[0], std::string("dressed stone"));
}

static void TestConfigErrorsLeaveConfigUntouched()
{
  using namespace rebuild;

  PipelineConfig cfg;
  cfg.pieces.maxPieces = 9;
  const std::string before = PipelineConfigToJson(cfg);

  std::string err;

  // The first key applies before the bad one; the merge must still be discarded.
  EXPECT_FALSE(ApplyText("{\"threads\": 4, \"pieces\": {\"min_pieces\": 2, \"max_pieces\": \"eight\"}}", cfg, err));
  EXPECT_TRUE(err.find("pieces") != std::string::npos);
  EXPECT_TRUE(err.find("max_pieces") != std::string::npos);
  EXPECT_EQ(PipelineConfigToJson(cfg), before);

  EXPECT_FALSE(ApplyText("{\"cutting\": 5}", cfg, err));
  EXPECT_TRUE(err.find("cutting") != std::string::npos);

  EXPECT_FALSE(ApplyText("[1, 2]", cfg, err));
  EXPECT_FALSE(ApplyText("{\"disaster\": {\"rules\": [{\"hazard_keywords\": [\"flood\"]}]}}", cfg, err));
  EXPECT_FALSE(ApplyText("{\"feasibility\": {\"needs_new_rules\": [{\"keyword\": \"\", \"component\": \"x\"}]}}", cfg,
                         err));
  EXPECT_FALSE(ApplyText("{\"environmental\": {\"truck_keywords\": [\"truck\", 3]}}", cfg, err));

  EXPECT_EQ(PipelineConfigToJson(cfg), before);
}

static void TestConfigFileHelpers()
{
  using namespace rebuild;

  fs::path file = MakeTempPath("rebuild_config");
  file += ".json";

  PipelineConfig cfg;
  cfg.finiteElement.nodeCount = 24;
  cfg.structural.safetyFactorCap = 12.0;

  std::string err;
  ASSERT_TRUE(WritePipelineConfigJsonFile(file.string(), cfg, err));

  PipelineConfig loaded;
  ASSERT_TRUE(LoadPipelineConfigJsonFile(file.string(), loaded, err));
  EXPECT_EQ(loaded.finiteElement.nodeCount, 24);
  EXPECT_EQ(PipelineConfigToJson(loaded), PipelineConfigToJson(cfg));

  // Missing files report the path.
  const fs::path missing = MakeTempPath("rebuild_config_missing");
  EXPECT_FALSE(LoadPipelineConfigJsonFile(missing.string(), loaded, err));
  EXPECT_FALSE(err.empty());

  std::error_code ec;
  fs::remove(file, ec);
}

int main()
{
  TestJsonParseAndWrite();
  TestConfigRoundTrip();
  TestConfigMergeKeepsMissingKeys();
  TestConfigErrorsLeaveConfigUntouched();
  TestConfigFileHelpers();

  if (g_failures == 0) {
    std::cout << "rebuild_config_tests: OK\n";
    return 0;
  }

  std::cerr << "rebuild_config_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
