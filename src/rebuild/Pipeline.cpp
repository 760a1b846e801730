#include "rebuild/Pipeline.hpp"

#include "rebuild/Recommendations.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <thread>

namespace rebuild {

namespace {

// Each task writes only its own StageOutputs member, so running them on any
// number of threads yields the same outputs as running them in order.
void RunTasks(std::vector<std::function<void()>>& tasks, int threads)
{
  threads = std::min<int>(threads, static_cast<int>(tasks.size()));
  if (threads <= 1) {
    for (auto& task : tasks) task();
    return;
  }

  std::atomic<std::size_t> next{0};
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));

  for (int t = 0; t < threads; ++t) {
    pool.emplace_back([&]() {
      for (;;) {
        const std::size_t i = next.fetch_add(1);
        if (i >= tasks.size()) break;
        tasks[i]();
      }
    });
  }
  for (auto& th : pool) th.join();
}

} // namespace

int ResolveThreadCount(int requested)
{
  int threads = requested;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) threads = 1;
  }
  return threads;
}

PipelineRun RunPipelineDetailed(const ProjectMetadata& meta, const FileManifest& manifest, const PipelineConfig& cfg,
                                const std::string& narrative)
{
  PipelineRun run;
  run.seeds = DeriveSeeds(meta, manifest);

  StageOutputs& st = run.stages;
  st.pieces = DecomposePieces(run.seeds, manifest.assetCount(), manifest.scanCount(), cfg.pieces);

  const SeedSet& seeds = run.seeds;
  const std::vector<Piece>& pieces = st.pieces;
  const int pieceCount = static_cast<int>(pieces.size());

  std::vector<std::function<void()>> tasks;
  tasks.reserve(6);
  tasks.emplace_back([&]() { st.cutting = GenerateCuttingPlan(pieces, meta, cfg.cutting); });
  tasks.emplace_back([&]() { st.structural = AnalyzeStructure(meta, pieces, seeds, cfg.structural); });
  tasks.emplace_back([&]() { st.finiteElement = EstimateFiniteElements(meta, pieces, seeds, cfg.finiteElement); });
  tasks.emplace_back([&]() { st.disaster = SimulateDisasters(meta, seeds, cfg.disaster); });
  tasks.emplace_back(
      [&]() { st.environmental = EstimateEnvironmentalImpact(meta, pieceCount, seeds, cfg.environmental); });
  tasks.emplace_back(
      [&]() { st.feasibility = AssessFeasibility(meta, pieces, seeds, cfg.feasibility, cfg.cutting.sawName); });

  RunTasks(tasks, ResolveThreadCount(cfg.threads));

  st.costCarbon = AccountCostCarbon(pieces, st.feasibility.verdict, cfg.costCarbon);
  st.recommendations = BuildRecommendations(st.feasibility.breakdown, meta, st.disaster, st.structural);

  run.report = AssembleReport(meta, st, narrative);
  return run;
}

Report RunPipeline(const ProjectMetadata& meta, const FileManifest& manifest, const PipelineConfig& cfg,
                   const std::string& narrative)
{
  return RunPipelineDetailed(meta, manifest, cfg, narrative).report;
}

Report RunPipelineRequest(const ProjectRequest& request, const PipelineConfig& cfg, std::vector<InputIssue>* outIssues)
{
  const ProjectMetadata meta = NormalizeProjectFields(request.fields, outIssues);
  return RunPipeline(meta, request.manifest, cfg, request.narrative);
}

} // namespace rebuild
