#pragma once

#include "rebuild/Disaster.hpp"
#include "rebuild/Feasibility.hpp"
#include "rebuild/Metrics.hpp"
#include "rebuild/ProjectInputs.hpp"

#include <string>
#include <vector>

namespace rebuild {

// Ordered advice list: reuse level, roof share, LiDAR coverage, dominant
// hazard, structural integrity, then a closing path-planning line that is
// always present.
std::vector<std::string> BuildRecommendations(const ReuseBreakdown& reuse, const ProjectMetadata& meta,
                                              const DisasterResult& disaster, const MetricMap& structural);

} // namespace rebuild
