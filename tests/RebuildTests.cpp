#include "rebuild/ConfigIO.hpp"
#include "rebuild/CuttingPlan.hpp"
#include "rebuild/Disaster.hpp"
#include "rebuild/Environmental.hpp"
#include "rebuild/Feasibility.hpp"
#include "rebuild/FiniteElement.hpp"
#include "rebuild/Hash.hpp"
#include "rebuild/Json.hpp"
#include "rebuild/PieceExport.hpp"
#include "rebuild/Pieces.hpp"
#include "rebuild/Pipeline.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/ReportJson.hpp"
#include "rebuild/Seeds.hpp"
#include "rebuild/Structural.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace rebuild;

FileManifest MakeManifest(int assets, int scans)
{
  FileManifest m;
  for (int i = 0; i < assets; ++i) {
    m.assets.push_back(UploadedFile{"asset_" + std::to_string(i) + ".obj", 1024u * static_cast<std::uint64_t>(i + 1),
                                    "model/obj"});
  }
  for (int i = 0; i < scans; ++i) {
    m.scans.push_back(UploadedFile{"scan_" + std::to_string(i) + ".las", 4096u, ""});
  }
  return m;
}

ProjectMetadata MakeWarehouse()
{
  ProjectMetadata m;
  m.projectName = "Dock 7 Warehouse";
  m.description = "Three-storey brick warehouse with timber floors";
  m.transportPlan = "truck to rail yard -> barge";
  m.humanBuilt = true;
  m.siteLocation = "riverside historic district";
  m.soilProfile = "soft alluvial clay";
  m.hazardProfile = "Seasonal flood, high wind";
  m.demolitionNotes = "Salvage brick facade, timber joists and steel beams";
  m.lidarNotes = "Full interior scan, 3mm point spacing";
  return m;
}

bool AnyContains(const std::vector<std::string>& v, const std::string& needle)
{
  for (const std::string& s : v) {
    if (s.find(needle) != std::string::npos) return true;
  }
  return false;
}

int CountLinesWithPrefix(const std::string& text, const std::string& prefix)
{
  int n = 0;
  std::istringstream is(text);
  std::string line;
  while (std::getline(is, line)) {
    if (line.rfind(prefix, 0) == 0) ++n;
  }
  return n;
}

void TestSeedsDeterministicAndFieldSensitive()
{
  const ProjectMetadata meta = MakeWarehouse();
  const FileManifest manifest = MakeManifest(2, 1);

  const SeedSet a = DeriveSeeds(meta, manifest);
  const SeedSet b = DeriveSeeds(meta, manifest);
  EXPECT_TRUE(a == b);

  // Concern seeds are distinct from each other.
  EXPECT_NE(a.pieces, a.hazard);
  EXPECT_NE(a.hazard, a.environment);
  EXPECT_NE(a.feasibility, a.structural);

  ProjectMetadata renamed = meta;
  renamed.projectName = "Dock 8 Warehouse";
  EXPECT_NE(DeriveSeeds(renamed, manifest).metadataDigest, a.metadataDigest);

  // Blank metadata hashes the same every time; filling any field changes the digest.
  ProjectMetadata blankA;
  ProjectMetadata blankB;
  EXPECT_EQ(DigestMetadata(blankA), DigestMetadata(blankB));
  blankB.soilProfile = "clay";
  EXPECT_NE(DigestMetadata(blankA), DigestMetadata(blankB));

  // Piece seeds ignore the manifest, so more files only add pieces.
  const SeedSet more = DeriveSeeds(meta, MakeManifest(5, 1));
  EXPECT_EQ(more.pieces, a.pieces);
  EXPECT_NE(more.manifestDigest, a.manifestDigest);
}

void TestPipelineDeterministic()
{
  const ProjectMetadata meta = MakeWarehouse();
  const FileManifest manifest = MakeManifest(4, 2);

  const Report a = RunPipeline(meta, manifest);
  const Report b = RunPipeline(meta, manifest);

  EXPECT_TRUE(a == b);
  EXPECT_EQ(HashReport(a), HashReport(b));
  EXPECT_EQ(ReportToJsonString(a), ReportToJsonString(b));

  // A different project produces a different report.
  ProjectMetadata other = meta;
  other.hazardProfile = "earthquake zone";
  const Report c = RunPipeline(other, manifest);
  EXPECT_TRUE(a != c);
  EXPECT_NE(HashReport(a), HashReport(c));
}

void TestPieceCountMonotonicAndPrefixStable()
{
  const ProjectMetadata meta = MakeWarehouse();

  EXPECT_EQ(ComputePieceCount(0, 0), 3);
  EXPECT_EQ(ComputePieceCount(3, 1), 5);
  EXPECT_EQ(ComputePieceCount(10000, 10000), 12);
  EXPECT_EQ(ComputePieceCount(-5, -5), 3);

  std::vector<Piece> prev;
  for (int assets = 0; assets <= 14; ++assets) {
    const PipelineRun run = RunPipelineDetailed(meta, MakeManifest(assets, 1), PipelineConfig{});
    const std::vector<Piece>& pieces = run.stages.pieces;

    EXPECT_TRUE(pieces.size() >= prev.size());
    for (std::size_t i = 0; i < prev.size() && i < pieces.size(); ++i) {
      EXPECT_TRUE(pieces[i] == prev[i]);
    }
    for (std::size_t i = 0; i < pieces.size(); ++i) {
      EXPECT_EQ(pieces[i].id, "piece-" + std::to_string(i + 1));
    }
    prev = pieces;
  }
}

void TestBoundedOutputsAtExtremeFileCounts()
{
  const ProjectMetadata meta = MakeWarehouse();
  const PipelineConfig cfg;

  for (int files : {0, 1, 10000}) {
    const Report r = RunPipeline(meta, MakeManifest(files, files));

    EXPECT_TRUE(r.piecePlans.size() >= static_cast<std::size_t>(cfg.pieces.minPieces));
    EXPECT_TRUE(r.piecePlans.size() <= static_cast<std::size_t>(cfg.pieces.maxPieces));

    const FeasibilityVerdict& v = r.materialFeasibility;
    EXPECT_TRUE(v.recycledRatio >= 0.0 && v.recycledRatio <= 1.0);
    EXPECT_TRUE(r.costAndCarbon.netCost >= 0.0);
    EXPECT_TRUE(r.costAndCarbon.co2SavedTons >= 0.0);
    EXPECT_TRUE(r.costAndCarbon.reclaimedMassKg <= r.costAndCarbon.totalMassKg);
    EXPECT_TRUE(r.reuseBreakdown.reusedPct >= 0.0 && r.reuseBreakdown.reusedPct <= 100.0);
    EXPECT_TRUE(std::fabs(r.reuseBreakdown.reusedPct + r.reuseBreakdown.newPct - 100.0) < 0.011);

    for (const PiecePlan& pp : r.piecePlans) {
      EXPECT_TRUE(pp.piece.massKg >= cfg.pieces.minMassKg && pp.piece.massKg <= cfg.pieces.maxMassKg);
      EXPECT_TRUE(pp.piece.reuseScore >= 0.0 && pp.piece.reuseScore <= 100.0);
      EXPECT_TRUE(pp.piece.optimalCutAngle >= 0.0 && pp.piece.optimalCutAngle < 180.0);
      EXPECT_TRUE(pp.adjustedWasteReduction + 1e-9 >= pp.piece.wasteReduction);
      EXPECT_TRUE(pp.adjustedWasteReduction <= cfg.cutting.maxAdjustedWasteReduction);
    }

    for (const Metric& m : r.disasterSimulation) {
      if (m.key.size() > 9 && m.key.compare(m.key.size() - 9, 9, "_severity") == 0) {
        EXPECT_TRUE(m.number >= 0.0 && m.number <= 1.0);
      }
    }
  }
}

void TestEmptyRequestStillProducesFullReport()
{
  ProjectRequest request;
  std::vector<InputIssue> issues;
  const Report r = RunPipelineRequest(request, PipelineConfig{}, &issues);

  EXPECT_TRUE(issues.empty());
  EXPECT_EQ(r.projectName, std::string(kDefaultProjectName));
  EXPECT_FALSE(r.summary.empty());
  EXPECT_TRUE(r.piecePlans.size() >= 1);
  EXPECT_FALSE(r.cuttingInstructions.empty());
  EXPECT_FALSE(r.materialFeasibility.suggestedPlanChanges.empty());
  EXPECT_FALSE(r.disasterSimulation.empty());
  EXPECT_FALSE(r.structuralAnalysis.empty());
  EXPECT_FALSE(r.finiteElementAnalysis.empty());
  EXPECT_FALSE(r.finiteElementNodes.empty());
  EXPECT_FALSE(r.pollutionModel.empty());
  EXPECT_FALSE(r.environmentalImpact.empty());
  EXPECT_FALSE(r.recommendations.empty());
  EXPECT_TRUE(r.aiEngineering.empty());

  // Every wire key is present in the JSON form.
  const JsonValue j = ReportToJson(r);
  ASSERT_TRUE(j.isObject());
  const char* keys[] = {"project_name",          "summary",         "piece_plans",
                        "cutting_instructions",  "reuse_breakdown", "material_feasibility",
                        "disaster_simulation",   "structural_analysis", "finite_element_analysis",
                        "pollution_model",       "environmental_impact", "cost_and_carbon",
                        "recommendations",       "ai_engineering"};
  ASSERT_TRUE(j.objectValue.size() == sizeof(keys) / sizeof(keys[0]));
  for (std::size_t i = 0; i < j.objectValue.size(); ++i) {
    EXPECT_EQ(j.objectValue[i].first, std::string(keys[i]));
    EXPECT_FALSE(j.objectValue[i].second.isNull());
  }

  const JsonValue* plans = FindJsonMember(j, "piece_plans");
  ASSERT_TRUE(plans && plans->isArray() && !plans->arrayValue.empty());
  const JsonValue& first = plans->arrayValue[0];
  EXPECT_TRUE(FindJsonMember(first, "piece_id") != nullptr);
  EXPECT_TRUE(FindJsonMember(first, "id") == nullptr);
  EXPECT_TRUE(FindJsonMember(first, "mass_kg") != nullptr);
  const JsonValue* com = FindJsonMember(first, "center_of_mass");
  ASSERT_TRUE(com && com->isObject());
  EXPECT_TRUE(FindJsonMember(*com, "z") != nullptr);
  EXPECT_TRUE(FindJsonMember(first, "adjusted_waste_reduction") != nullptr);

  const JsonValue* fea = FindJsonMember(j, "finite_element_analysis");
  ASSERT_TRUE(fea && fea->isObject());
  const JsonValue* nodes = FindJsonMember(*fea, "nodes");
  ASSERT_TRUE(nodes && nodes->isArray());
  EXPECT_EQ(nodes->arrayValue.size(), r.finiteElementNodes.size());

  const JsonValue withoutNodes = ReportToJson(r, false);
  const JsonValue* fea2 = FindJsonMember(withoutNodes, "finite_element_analysis");
  ASSERT_TRUE(fea2 != nullptr);
  EXPECT_TRUE(FindJsonMember(*fea2, "nodes") == nullptr);
}

void TestAdaptiveRoofNeedsNewComponents()
{
  const FeasibilityConfig cfg = DefaultFeasibilityConfig();

  std::vector<std::string> reusable;
  std::vector<std::string> needsNew;
  bool roofNew = false;

  ClassifyComponents("Strip the Adaptive Roof and keep the steel beams", cfg, reusable, needsNew, &roofNew);
  EXPECT_TRUE(roofNew);
  EXPECT_TRUE(AnyContains(needsNew, "roof"));
  EXPECT_FALSE(AnyContains(reusable, "roof"));
  EXPECT_TRUE(AnyContains(reusable, "steel"));

  ClassifyComponents("Brick walls on a concrete base", cfg, reusable, needsNew, &roofNew);
  EXPECT_FALSE(roofNew);
  EXPECT_TRUE(AnyContains(reusable, "brick"));
  EXPECT_FALSE(AnyContains(needsNew, "roof"));

  // No component may land in both lists.
  ClassifyComponents("adaptive roof, roof trusses, brick, membrane, new core", cfg, reusable, needsNew);
  for (const std::string& r : reusable) {
    EXPECT_TRUE(std::find(needsNew.begin(), needsNew.end(), r) == needsNew.end());
  }

  // Through the whole pipeline.
  ProjectMetadata meta = MakeWarehouse();
  meta.demolitionNotes = "replace with adaptive roof; brick cladding retained";
  const Report r = RunPipeline(meta, MakeManifest(2, 1));
  EXPECT_TRUE(AnyContains(r.materialFeasibility.needsNewComponents, "roof"));
  EXPECT_FALSE(AnyContains(r.materialFeasibility.reusableComponents, "roof"));
  EXPECT_TRUE(AnyContains(r.materialFeasibility.reusableComponents, "brick"));
  EXPECT_TRUE(r.materialFeasibility.recycledRatio > 0.0 && r.materialFeasibility.recycledRatio < 1.0);
}

void TestCircularHabitatScenario()
{
  RawProjectFields raw;
  raw.projectName = "Circular Habitat Test";
  raw.hazardProfile = "Flood + storm surge";

  ProjectRequest request;
  request.fields = raw;
  request.manifest = MakeManifest(3, 1);

  const Report a = RunPipelineRequest(request, PipelineConfig{});
  const Report b = RunPipelineRequest(request, PipelineConfig{});

  EXPECT_EQ(a.projectName, std::string("Circular Habitat Test"));
  EXPECT_EQ(a.piecePlans.size(), static_cast<std::size_t>(5));
  EXPECT_TRUE(a.piecePlans == b.piecePlans);
  EXPECT_TRUE(a.cuttingInstructions == b.cuttingInstructions);

  for (const Report* r : {&a, &b}) {
    const Metric* sev = FindMetric(r->disasterSimulation, "flood_severity");
    ASSERT_TRUE(sev != nullptr);
    EXPECT_TRUE(sev->isNumber());
    EXPECT_TRUE(sev->number > 0.0);
    const Metric* flood = FindMetric(r->disasterSimulation, "flood");
    ASSERT_TRUE(flood != nullptr);
    EXPECT_TRUE(flood->isText() && !flood->text.empty());
  }

  EXPECT_TRUE(a.summary.find("Circular Habitat Test") != std::string::npos);
  EXPECT_TRUE(a.summary.find("5 salvageable pieces") != std::string::npos);

  // Every piece gets its own cutting steps.
  for (const PiecePlan& pp : a.piecePlans) {
    EXPECT_TRUE(AnyContains(a.cuttingInstructions, "[" + pp.piece.id + "]"));
  }
}

void TestThreadedMatchesSequential()
{
  const ProjectMetadata meta = MakeWarehouse();
  const FileManifest manifest = MakeManifest(6, 3);

  PipelineConfig seq;
  seq.threads = 1;
  PipelineConfig par;
  par.threads = 4;
  PipelineConfig hw;
  hw.threads = 0;

  const Report a = RunPipeline(meta, manifest, seq, "narrative text");
  const Report b = RunPipeline(meta, manifest, par, "narrative text");
  const Report c = RunPipeline(meta, manifest, hw, "narrative text");

  EXPECT_TRUE(a == b);
  EXPECT_TRUE(a == c);
  EXPECT_EQ(HashReport(a), HashReport(b));
  EXPECT_EQ(a.aiEngineering, std::string("narrative text"));

  EXPECT_EQ(ResolveThreadCount(1), 1);
  EXPECT_EQ(ResolveThreadCount(3), 3);
  EXPECT_TRUE(ResolveThreadCount(0) >= 1);
  EXPECT_TRUE(ResolveThreadCount(-2) >= 1);
}

void TestFiniteElementTable()
{
  const ProjectMetadata meta = MakeWarehouse();
  const FileManifest manifest = MakeManifest(2, 2);

  const Report r = RunPipeline(meta, manifest);
  EXPECT_EQ(r.finiteElementNodes.size(), static_cast<std::size_t>(FiniteElementConfig{}.nodeCount));
  for (std::size_t i = 0; i < r.finiteElementNodes.size(); ++i) {
    const FeaNode& n = r.finiteElementNodes[i];
    EXPECT_EQ(n.index, static_cast<int>(i));
    EXPECT_TRUE(n.utilization >= 0.0 && n.utilization <= 1.0);
    EXPECT_TRUE(n.stressMpa >= 0.0);
  }

  const Metric* count = FindMetric(r.finiteElementAnalysis, "node_count");
  ASSERT_TRUE(count != nullptr);
  EXPECT_EQ(count->number, static_cast<double>(r.finiteElementNodes.size()));
  const Metric* critical = FindMetric(r.finiteElementAnalysis, "critical_node");
  ASSERT_TRUE(critical != nullptr);
  EXPECT_TRUE(critical->text.rfind("node-", 0) == 0);

  EXPECT_EQ(ClampNodeCount(0), 1);
  EXPECT_EQ(ClampNodeCount(100000), kMaxFiniteElementNodes);

  PipelineConfig cfg;
  cfg.finiteElement.nodeCount = 5;
  EXPECT_EQ(RunPipeline(meta, manifest, cfg).finiteElementNodes.size(), static_cast<std::size_t>(5));
}

void TestStructuralMetrics()
{
  const Report r = RunPipeline(MakeWarehouse(), MakeManifest(3, 0));

  const char* keys[] = {"piece_count",   "total_mass_kg", "mean_piece_mass", "mass_std_dev",
                        "global_stress_index", "load_factor", "shear_margin", "safety_factor",
                        "vibration_risk", "integrity_score", "integrity_rating"};
  for (const char* k : keys) {
    EXPECT_TRUE(FindMetric(r.structuralAnalysis, k) != nullptr);
  }

  EXPECT_EQ(MetricNumber(r.structuralAnalysis, "piece_count"), static_cast<double>(r.piecePlans.size()));
  EXPECT_TRUE(MetricNumber(r.structuralAnalysis, "safety_factor") <= 99.0);

  const Metric* rating = FindMetric(r.structuralAnalysis, "integrity_rating");
  ASSERT_TRUE(rating != nullptr && rating->isText());
  const std::string& s = rating->text;
  EXPECT_TRUE(s == "robust" || s == "adequate" || s == "marginal" || s == "critical");

  EXPECT_EQ(std::string(IntegrityRatingName(80.0)), std::string("robust"));
  EXPECT_EQ(std::string(IntegrityRatingName(10.0)), std::string("critical"));

  const MassStats empty = ComputeMassStats({});
  EXPECT_EQ(empty.count, 0);
  EXPECT_EQ(empty.stdDev, 0.0);
}

void TestHumanBuiltParsingWarnings()
{
  bool b = false;
  EXPECT_TRUE(ParseHumanBuiltFlag(" YES ", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(ParseHumanBuiltFlag("False", &b));
  EXPECT_FALSE(b);
  EXPECT_TRUE(ParseHumanBuiltFlag("1", &b));
  EXPECT_TRUE(b);
  EXPECT_FALSE(ParseHumanBuiltFlag("maybe", &b));
  EXPECT_FALSE(ParseHumanBuiltFlag("on", &b));
  EXPECT_FALSE(ParseHumanBuiltFlag("off", &b));

  RawProjectFields raw;
  raw.humanBuilt = "definitely";
  raw.projectName = "   ";
  std::vector<InputIssue> issues;
  const ProjectMetadata m = NormalizeProjectFields(raw, &issues);
  EXPECT_FALSE(m.humanBuilt);
  EXPECT_EQ(m.projectName, std::string(kDefaultProjectName));
  ASSERT_TRUE(issues.size() == 1);
  EXPECT_EQ(issues[0].field, std::string("human_built"));

  // Absent flag is silent.
  issues.clear();
  RawProjectFields none;
  (void)NormalizeProjectFields(none, &issues);
  EXPECT_TRUE(issues.empty());

  // Malformed flag reports the same as an explicit false.
  ProjectRequest bad;
  bad.fields.humanBuilt = "definitely";
  ProjectRequest no;
  no.fields.humanBuilt = "false";
  issues.clear();
  const Report rb = RunPipelineRequest(bad, PipelineConfig{}, &issues);
  const Report rn = RunPipelineRequest(no, PipelineConfig{});
  EXPECT_EQ(issues.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(rb == rn);
}

void TestRequestJsonParsing()
{
  const std::string text =
      "{\n"
      "  \"project_name\": \"Pier Shed\",\n"
      "  \"human_built\": true,\n"
      "  \"hazard_profile\": \"coastal flood\",\n"
      "  \"asset_files\": [{\"filename\": \"shed.obj\", \"size\": 2048}, \"roof.ply\"],\n"
      "  \"scan_files\": [{\"name\": \"shed.las\", \"size\": 10, \"content_type\": \"application/octet-stream\"}],\n"
      "  \"ai_engineering\": \"Use the gantry for the north bay.\"\n"
      "}\n";

  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));

  ProjectRequest req;
  ASSERT_TRUE(ParseProjectRequestJson(root, req, err));
  ASSERT_TRUE(req.fields.projectName.has_value());
  EXPECT_EQ(*req.fields.projectName, std::string("Pier Shed"));
  EXPECT_EQ(req.manifest.assetCount(), 2);
  EXPECT_EQ(req.manifest.scanCount(), 1);
  EXPECT_EQ(req.manifest.assets[0].sizeBytes, static_cast<std::uint64_t>(2048));
  EXPECT_EQ(req.manifest.assets[1].filename, std::string("roof.ply"));
  EXPECT_EQ(req.manifest.scans[0].filename, std::string("shed.las"));

  std::vector<InputIssue> issues;
  const Report r = RunPipelineRequest(req, PipelineConfig{}, &issues);
  EXPECT_TRUE(issues.empty());
  EXPECT_EQ(r.projectName, std::string("Pier Shed"));
  EXPECT_EQ(r.piecePlans.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(r.aiEngineering, std::string("Use the gantry for the north bay."));

  // Wrong types are outer-layer errors.
  JsonValue bad;
  ASSERT_TRUE(ParseJson("{\"project_name\": 5}", bad, err));
  ProjectRequest badReq;
  EXPECT_FALSE(ParseProjectRequestJson(bad, badReq, err));
  EXPECT_TRUE(err.find("project_name") != std::string::npos);

  ASSERT_TRUE(ParseJson("{\"asset_files\": [{\"size\": 3}]}", bad, err));
  EXPECT_FALSE(ParseProjectRequestJson(bad, badReq, err));

  ASSERT_TRUE(ParseJson("[]", bad, err));
  EXPECT_FALSE(ParseProjectRequestJson(bad, badReq, err));
}

void TestObjExportGeometry()
{
  const Report r = RunPipeline(MakeWarehouse(), MakeManifest(4, 1));
  std::vector<Piece> pieces;
  for (const PiecePlan& pp : r.piecePlans) pieces.push_back(pp.piece);
  ASSERT_TRUE(!pieces.empty());

  std::ostringstream obj;
  std::ostringstream mtl;
  PieceExportStats stats;
  std::string err;
  ASSERT_TRUE(WritePiecesObjMtl(obj, mtl, pieces, PieceExportConfig{}, &stats, &err));

  const std::uint64_t n = static_cast<std::uint64_t>(pieces.size());
  EXPECT_EQ(stats.vertices, 8 * n);
  EXPECT_EQ(stats.faces, 6 * n);

  const std::string objText = obj.str();
  EXPECT_EQ(CountLinesWithPrefix(objText, "v "), static_cast<int>(8 * n));
  EXPECT_EQ(CountLinesWithPrefix(objText, "f "), static_cast<int>(6 * n));
  EXPECT_EQ(CountLinesWithPrefix(objText, "o piece-"), static_cast<int>(n));
  EXPECT_EQ(CountLinesWithPrefix(objText, "mtllib pieces.mtl"), 1);
  EXPECT_EQ(CountLinesWithPrefix(objText, "usemtl "), static_cast<int>(n));

  const std::string mtlText = mtl.str();
  EXPECT_EQ(CountLinesWithPrefix(mtlText, "newmtl "), 3);

  // Last face of the last piece references the last vertex block.
  EXPECT_TRUE(objText.find("f " + std::to_string(8 * n - 7) + " ") != std::string::npos);

  const std::string single = PieceObjText(pieces[0]);
  EXPECT_EQ(CountLinesWithPrefix(single, "v "), 8);
  EXPECT_EQ(CountLinesWithPrefix(single, "f "), 6);

  EXPECT_EQ(PieceBoxHeight(0.0), 0.25);
  EXPECT_EQ(PieceBoxHeight(120.0), 1.0);
  EXPECT_EQ(PieceBoxHeight(1.0e6), 2.5);

  EXPECT_EQ(std::string(ReuseMaterialName(75.0)), std::string("reuse_high"));
  EXPECT_EQ(std::string(ReuseMaterialName(60.0)), std::string("reuse_mid"));
  EXPECT_EQ(std::string(ReuseMaterialName(41.0)), std::string("reuse_low"));

  PieceExportConfig broken;
  broken.boxWidthM = 0.0;
  std::ostringstream o2;
  std::ostringstream m2;
  EXPECT_FALSE(WritePiecesObjMtl(o2, m2, pieces, broken, nullptr, &err));
  EXPECT_FALSE(err.empty());
}

void TestPieceCountHardCap()
{
  PipelineConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"pieces\": {\"min_pieces\": 2000000, \"max_pieces\": 2000000}}", root, err));
  ASSERT_TRUE(ApplyPipelineConfigJson(root, cfg, err));

  EXPECT_EQ(ComputePieceCount(0, 0, cfg.pieces), kMaxPieces);
  EXPECT_EQ(ComputePieceCount(1000000, 1000000, cfg.pieces), kMaxPieces);

  const PipelineRun run = RunPipelineDetailed(MakeWarehouse(), MakeManifest(1, 0), cfg);
  EXPECT_EQ(run.stages.pieces.size(), static_cast<std::size_t>(kMaxPieces));
  EXPECT_EQ(run.report.piecePlans.size(), static_cast<std::size_t>(kMaxPieces));
  // Four lines per piece plus the rail trailer.
  EXPECT_EQ(run.report.cuttingInstructions.size(), static_cast<std::size_t>(4 * kMaxPieces + 1));

  PieceConfig huge;
  huge.minPieces = std::numeric_limits<int>::max();
  huge.maxPieces = std::numeric_limits<int>::max();
  huge.assetWeight = std::numeric_limits<int>::max();
  EXPECT_EQ(ComputePieceCount(std::numeric_limits<int>::max(), 0, huge), kMaxPieces);

  PieceConfig inverted;
  inverted.minPieces = -5;
  inverted.maxPieces = -10;
  EXPECT_EQ(ComputePieceCount(3, 1, inverted), 1);
}

void TestEnvironmentalMonotoneAndBounded()
{
  const EnvironmentalConfig cfg;

  EXPECT_EQ(CountTransportLegs("", cfg.legSeparators), 0);
  EXPECT_EQ(CountTransportLegs(" ,, ; ", cfg.legSeparators), 0);
  EXPECT_EQ(CountTransportLegs("rail", cfg.legSeparators), 1);
  EXPECT_EQ(CountTransportLegs("truck to depot -> rail, barge", cfg.legSeparators), 4);
  EXPECT_EQ(CountTransportLegs("Truck THEN rail", cfg.legSeparators), 2);

  const ProjectMetadata meta = MakeWarehouse();
  const SeedSet seeds = DeriveSeeds(meta, MakeManifest(2, 1));

  const char* keys[] = {"light_db",           "noise_db",           "sound_peak_db",
                        "light_intrusion_lux", "nighttime_glare_index", "sound_pollution_index",
                        "light_pollution_index"};

  EnvironmentalResult prev = EstimateEnvironmentalImpact(meta, 0, seeds, cfg);
  for (int count = 1; count <= 400; ++count) {
    const EnvironmentalResult cur = EstimateEnvironmentalImpact(meta, count, seeds, cfg);
    for (const char* k : keys) {
      EXPECT_TRUE(MetricNumber(cur.impact, k, -1.0) >= MetricNumber(prev.impact, k, -1.0));
    }
    EXPECT_TRUE(cur.pollution.size() == 2);
    prev = cur;
  }

  // Far past every cap.
  const EnvironmentalResult big = EstimateEnvironmentalImpact(meta, 1000000, seeds, cfg);
  EXPECT_EQ(MetricNumber(big.impact, "noise_db"), cfg.maxNoiseDb);
  EXPECT_EQ(MetricNumber(big.impact, "light_db"), cfg.maxLightDb);
  EXPECT_TRUE(MetricNumber(big.impact, "sound_peak_db") <= cfg.maxPeakDb);
  EXPECT_EQ(MetricNumber(big.impact, "light_intrusion_lux"), cfg.maxLux);
  EXPECT_TRUE(MetricNumber(big.impact, "sound_pollution_index") <= 1.0);
  EXPECT_TRUE(MetricNumber(big.impact, "light_pollution_index") <= 1.0);

  // More transport legs never lower the noise estimate.
  ProjectMetadata shortHaul;
  shortHaul.transportPlan = "rail";
  ProjectMetadata longHaul;
  longHaul.transportPlan = "rail, barge, rail";
  const EnvironmentalResult a = EstimateEnvironmentalImpact(shortHaul, 5, seeds, cfg);
  const EnvironmentalResult b = EstimateEnvironmentalImpact(longHaul, 5, seeds, cfg);
  EXPECT_EQ(MetricNumber(b.impact, "transport_legs"), 3.0);
  EXPECT_TRUE(MetricNumber(b.impact, "noise_db") > MetricNumber(a.impact, "noise_db"));
}

void TestCuttingPlanClampsOutOfRangePieces()
{
  ProjectMetadata meta;
  meta.humanBuilt = true;
  meta.transportPlan = "rail";

  Piece bad;
  bad.id = "piece-9";
  bad.index = 8;
  bad.massKg = -50.0;
  bad.optimalCutAngle = 720.0;
  bad.wasteReduction = std::numeric_limits<double>::quiet_NaN();

  const PieceCutPlan plan = PlanPieceCut(bad, meta);
  EXPECT_EQ(plan.pieceId, std::string("piece-9"));
  ASSERT_TRUE(plan.lines.size() == 4);
  for (const std::string& line : plan.lines) {
    EXPECT_TRUE(line.rfind("[piece-9] ", 0) == 0);
    EXPECT_TRUE(line.find("nan") == std::string::npos);
    EXPECT_TRUE(line.find("inf") == std::string::npos);
  }
  EXPECT_TRUE(plan.lines[0].find("clamp 0.00 kg") != std::string::npos);
  EXPECT_TRUE(plan.lines[1].find("cut at 180.00 deg") != std::string::npos);
  EXPECT_TRUE(plan.lines[1].find("retain 0.00%") != std::string::npos);
  // NaN waste clamps to 0, then the human-built and rail bonuses apply.
  EXPECT_EQ(plan.adjustedWasteReduction, 4.0);

  Piece wild = bad;
  wild.optimalCutAngle = -30.0;
  wild.wasteReduction = 1.0e9;
  wild.massKg = std::numeric_limits<double>::infinity();
  const PieceCutPlan clamped = PlanPieceCut(wild, meta);
  ASSERT_TRUE(clamped.lines.size() == 4);
  EXPECT_TRUE(clamped.lines[1].find("cut at 0.00 deg") != std::string::npos);
  EXPECT_EQ(clamped.adjustedWasteReduction, CuttingPlanConfig{}.maxAdjustedWasteReduction);
}

double Severity(const DisasterResult& r, const std::string& category)
{
  return MetricNumber(r.metrics, category + "_severity", -1.0);
}

const HazardAssessment* FindHazard(const DisasterResult& r, const std::string& category)
{
  for (const HazardAssessment& a : r.hazards) {
    if (a.category == category) return &a;
  }
  return nullptr;
}

void TestDisasterKeywordsPerCategory()
{
  const DisasterConfig cfg = DefaultDisasterConfig();

  ProjectMetadata calm;
  calm.projectName = "Keyword Check";
  // One seed set for every variant, so only the keyword boosts differ.
  const SeedSet seeds = DeriveSeeds(calm, FileManifest{});
  const DisasterResult base = SimulateDisasters(calm, seeds, cfg);
  ASSERT_TRUE(base.hazards.size() == 5);
  for (const HazardAssessment& a : base.hazards) {
    EXPECT_FALSE(a.declared);
    EXPECT_TRUE(a.severity >= cfg.baseMin - 1e-9 && a.severity <= cfg.baseMax + 1e-9);
  }

  // Storm and quake wording declares wind and seismic only.
  ProjectMetadata stormy = calm;
  stormy.hazardProfile = "Hurricane season; EARTHQUAKE history";
  const DisasterResult hit = SimulateDisasters(stormy, seeds, cfg);
  for (const char* cat : {"wind", "seismic"}) {
    const HazardAssessment* a = FindHazard(hit, cat);
    ASSERT_TRUE(a != nullptr);
    EXPECT_TRUE(a->declared);
    EXPECT_TRUE(Severity(hit, cat) >= cfg.alertSeverity);
    EXPECT_TRUE(std::fabs(Severity(hit, cat) - Severity(base, cat) - cfg.keywordBoost) < 0.0015);
  }
  for (const char* cat : {"flood", "fire", "landslide"}) {
    EXPECT_EQ(Severity(hit, cat), Severity(base, cat));
  }
  const Metric* declared = FindMetric(hit.metrics, "declared_hazards");
  ASSERT_TRUE(declared && declared->isText());
  EXPECT_EQ(declared->text, std::string("wind, seismic"));

  ProjectMetadata storm = calm;
  storm.hazardProfile = "storm";
  EXPECT_TRUE(FindHazard(SimulateDisasters(storm, seeds, cfg), "wind")->declared);
  ProjectMetadata seismic = calm;
  seismic.hazardProfile = "Seismic retrofit pending";
  EXPECT_TRUE(FindHazard(SimulateDisasters(seismic, seeds, cfg), "seismic")->declared);

  // Soil wording boosts flood (alluvial, saturated) and landslide (clay) by the soil step.
  ProjectMetadata soil = calm;
  soil.soilProfile = "Saturated alluvial clay";
  const DisasterResult soilHit = SimulateDisasters(soil, seeds, cfg);
  for (const char* cat : {"flood", "landslide"}) {
    EXPECT_TRUE(FindHazard(soilHit, cat)->soilHit);
    EXPECT_FALSE(FindHazard(soilHit, cat)->declared);
    EXPECT_TRUE(std::fabs(Severity(soilHit, cat) - Severity(base, cat) - cfg.soilBoost) < 0.0015);
  }
  EXPECT_EQ(Severity(soilHit, "wind"), Severity(base, "wind"));
  EXPECT_EQ(Severity(soilHit, "seismic"), Severity(base, "seismic"));

  // Site wording boosts by the site step.
  ProjectMetadata site = calm;
  site.siteLocation = "River delta lowland";
  const DisasterResult siteHit = SimulateDisasters(site, seeds, cfg);
  EXPECT_TRUE(FindHazard(siteHit, "flood")->siteHit);
  EXPECT_TRUE(std::fabs(Severity(siteHit, "flood") - Severity(base, "flood") - cfg.siteBoost) < 0.0015);
  EXPECT_EQ(Severity(siteHit, "wind"), Severity(base, "wind"));
  EXPECT_EQ(Severity(siteHit, "seismic"), Severity(base, "seismic"));
}

void TestSawNameFlowsIntoReportText()
{
  PipelineConfig cfg;
  cfg.cutting.sawName = "Husqvarna wire saw";
  const Report r = RunPipeline(MakeWarehouse(), MakeManifest(2, 1), cfg);

  EXPECT_TRUE(r.summary.find("Husqvarna wire saw") != std::string::npos);
  EXPECT_TRUE(r.summary.find("KUKA") == std::string::npos);
  EXPECT_TRUE(AnyContains(r.materialFeasibility.suggestedPlanChanges, "Husqvarna wire saw"));
  EXPECT_FALSE(AnyContains(r.materialFeasibility.suggestedPlanChanges, "KUKA"));
  EXPECT_FALSE(AnyContains(r.cuttingInstructions, "KUKA"));

  const Report d = RunPipeline(MakeWarehouse(), MakeManifest(2, 1));
  EXPECT_TRUE(d.summary.find(CuttingPlanConfig{}.sawName) != std::string::npos);
}

} // namespace

int main()
{
  TestSeedsDeterministicAndFieldSensitive();
  TestPipelineDeterministic();
  TestPieceCountMonotonicAndPrefixStable();
  TestBoundedOutputsAtExtremeFileCounts();
  TestEmptyRequestStillProducesFullReport();
  TestAdaptiveRoofNeedsNewComponents();
  TestCircularHabitatScenario();
  TestThreadedMatchesSequential();
  TestFiniteElementTable();
  TestStructuralMetrics();
  TestHumanBuiltParsingWarnings();
  TestRequestJsonParsing();
  TestObjExportGeometry();
  TestPieceCountHardCap();
  TestEnvironmentalMonotoneAndBounded();
  TestCuttingPlanClampsOutOfRangePieces();
  TestDisasterKeywordsPerCategory();
  TestSawNameFlowsIntoReportText();

  if (g_failures == 0) {
    std::cout << "rebuild_tests: OK\n";
    return 0;
  }

  std::cerr << "rebuild_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
