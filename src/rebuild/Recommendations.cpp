#include "rebuild/Recommendations.hpp"

#include "rebuild/Text.hpp"

namespace rebuild {

namespace {

constexpr double kLowReusePct = 60.0;
constexpr double kRoofAdvicePct = 10.0;
constexpr double kHazardAdviceSeverity = 0.5;

} // namespace

std::vector<std::string> BuildRecommendations(const ReuseBreakdown& reuse, const ProjectMetadata& meta,
                                              const DisasterResult& disaster, const MetricMap& structural)
{
  std::vector<std::string> recs;

  if (reuse.reusedPct < kLowReusePct) {
    recs.push_back("Increase selective demolition to expose longer beams for reuse.");
  } else {
    recs.push_back("Current demolition strategy already optimizes reclaimed beams.");
  }

  if (reuse.roofNewPct > kRoofAdvicePct) {
    recs.push_back("Consider modular polycarbonate roofing to reduce new material share.");
  }

  if (!ContainsKeyword(meta.lidarNotes, "lidar")) {
    recs.push_back("Add higher resolution LiDAR scans for better fitting tolerance.");
  }

  if (const HazardAssessment* dom = disaster.dominant()) {
    if (dom->severity >= kHazardAdviceSeverity) {
      recs.push_back("Prioritize " + dom->category + " mitigation (severity " + FormatFixed(dom->severity, 2) +
                     "): " + dom->description + ".");
    }
  }

  if (const Metric* rating = FindMetric(structural, "integrity_rating")) {
    if (rating->isText() && (rating->text == "marginal" || rating->text == "critical")) {
      recs.push_back("Structural integrity is " + rating->text + " (score " +
                     FormatFixed(MetricNumber(structural, "integrity_score"), 1) +
                     "); install temporary shoring before cutting.");
    }
  }

  recs.push_back("Run pre-demolition robotic path planning to reduce handling time.");
  return recs;
}

} // namespace rebuild
