#pragma once

#include "rebuild/Json.hpp"
#include "rebuild/PipelineConfig.hpp"

#include <string>

namespace rebuild {

// JSON helpers for PipelineConfig.
//
// Goals:
//  - Enable lightweight, dependency-free config editing (CI, tooling).
//  - Support partial "override" JSON (merge semantics): missing keys leave the
//    existing config unchanged.
//
// The JSON field names are snake_case. Layout:
//
//   {
//     "threads": 1,
//     "pieces": {...}, "cutting": {...}, "structural": {...},
//     "finite_element": {...}, "disaster": {..., "rules": [...]},
//     "environmental": {...}, "feasibility": {..., "reusable_rules": [...]},
//     "cost_carbon": {...}
//   }
//
// Array-valued keys (rules, keyword lists) replace the whole list when present.

JsonValue PipelineConfigToJsonValue(const PipelineConfig& cfg);

// Serialize to JSON (pretty-printed, trailing newline).
std::string PipelineConfigToJson(const PipelineConfig& cfg, int indentSpaces = 2);

// Apply JSON overrides into an existing config (merge semantics).
bool ApplyPipelineConfigJson(const JsonValue& root, PipelineConfig& ioCfg, std::string& outError);

// File helpers.
bool WritePipelineConfigJsonFile(const std::string& path, const PipelineConfig& cfg, std::string& outError,
                                 int indentSpaces = 2);
bool LoadPipelineConfigJsonFile(const std::string& path, PipelineConfig& ioCfg, std::string& outError);

} // namespace rebuild
