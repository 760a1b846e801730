#pragma once

#include "rebuild/PipelineConfig.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Report.hpp"
#include "rebuild/Seeds.hpp"

#include <string>
#include <vector>

namespace rebuild {

// One pipeline run with its intermediates, for tooling and tests.
struct PipelineRun {
  SeedSet seeds;
  StageOutputs stages;
  Report report;
};

// Seeds -> pieces -> fan-out stages -> cost/carbon -> recommendations ->
// report. Total over its input domain: never throws for any metadata or
// manifest shape.
PipelineRun RunPipelineDetailed(const ProjectMetadata& meta, const FileManifest& manifest, const PipelineConfig& cfg,
                                const std::string& narrative = {});

Report RunPipeline(const ProjectMetadata& meta, const FileManifest& manifest, const PipelineConfig& cfg = {},
                   const std::string& narrative = {});

// Normalizes the raw request fields (collecting warnings) and runs.
Report RunPipelineRequest(const ProjectRequest& request, const PipelineConfig& cfg,
                          std::vector<InputIssue>* outIssues = nullptr);

// Resolves PipelineConfig::threads (0 => hardware concurrency, never < 1).
int ResolveThreadCount(int requested);

} // namespace rebuild
