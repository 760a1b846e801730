#pragma once

#include "rebuild/Json.hpp"
#include "rebuild/Metrics.hpp"
#include "rebuild/Report.hpp"

#include <string>

namespace rebuild {

// Report -> JSON using the wire field names consumed by the rendering layer:
//
//   project_name, summary, piece_plans, cutting_instructions, reuse_breakdown,
//   material_feasibility, disaster_simulation, structural_analysis,
//   finite_element_analysis, pollution_model, environmental_impact,
//   cost_and_carbon, recommendations, ai_engineering
//
// Keys are emitted in that order. finite_element_analysis carries the summary
// metrics followed by a "nodes" array.

JsonValue MetricMapToJson(const MetricMap& m);
JsonValue PiecePlanToJson(const PiecePlan& p);
JsonValue ReportToJson(const Report& report, bool includeFeaNodes = true);

std::string ReportToJsonString(const Report& report, const JsonWriteOptions& opt = {});
bool WriteReportJsonFile(const std::string& path, const Report& report, std::string& outError,
                         const JsonWriteOptions& opt = {});

} // namespace rebuild
