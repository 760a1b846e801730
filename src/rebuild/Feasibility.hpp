#pragma once

#include "rebuild/Pieces.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Seeds.hpp"

#include <string>
#include <vector>

namespace rebuild {

// keyword (in demolition notes) -> component name. Components sharing a group
// compete: a needs-new hit removes every reusable component of its group.
struct ComponentRule {
  std::string keyword;
  std::string component;
  std::string group;
};

struct FeasibilityConfig {
  std::vector<ComponentRule> reusableRules;
  std::vector<ComponentRule> needsNewRules;

  // Reuse breakdown.
  double ratioBaseWeight = 0.6; // reused = mean reuse * (base + ratioWeight * recycled_ratio) * factors
  double ratioWeight = 0.4;
  double conditionJitter = 0.03; // seeded, +/- share
  double railFactor = 1.1;
  double seismicFactor = 0.9;
  double maxReusedPct = 95.0;

  double roofShareDeclared = 0.3; // roof share of new material when a roof is needs-new
  double roofShareDefault = 0.15;
  double maxRoofNewPct = 30.0;
  double volumePerPieceM3 = 1.2;

  double conveyorBufferBelowPct = 70.0;

  std::vector<std::string> railKeywords = {"rail"};
  std::vector<std::string> seismicKeywords = {"earthquake", "seismic"};
  std::vector<std::string> floodKeywords = {"flood"};
};

std::vector<ComponentRule> DefaultReusableRules();
std::vector<ComponentRule> DefaultNeedsNewRules();
FeasibilityConfig DefaultFeasibilityConfig();

struct ReuseBreakdown {
  double reusedPct = 0.0;  // [0, maxReusedPct]
  double newPct = 0.0;     // 100 - reused
  double roofNewPct = 0.0; // [0, maxRoofNewPct]
  double reclaimedVolumeM3 = 0.0;

  bool operator==(const ReuseBreakdown& o) const
  {
    return reusedPct == o.reusedPct && newPct == o.newPct && roofNewPct == o.roofNewPct &&
           reclaimedVolumeM3 == o.reclaimedVolumeM3;
  }
};

struct FeasibilityVerdict {
  std::vector<std::string> reusableComponents;
  std::vector<std::string> needsNewComponents;
  std::vector<std::string> suggestedPlanChanges;
  double recycledRatio = 0.0; // [0,1]
  double roofNewPct = 0.0;

  bool operator==(const FeasibilityVerdict& o) const
  {
    return reusableComponents == o.reusableComponents && needsNewComponents == o.needsNewComponents &&
           suggestedPlanChanges == o.suggestedPlanChanges && recycledRatio == o.recycledRatio &&
           roofNewPct == o.roofNewPct;
  }
};

struct FeasibilityResult {
  FeasibilityVerdict verdict;
  ReuseBreakdown breakdown;
  bool roofNeedsNew = false;
};

// Component classification only (no plan changes, ratio or breakdown).
void ClassifyComponents(const std::string& demolitionNotes, const FeasibilityConfig& cfg,
                        std::vector<std::string>& outReusable, std::vector<std::string>& outNeedsNew,
                        bool* outRoofNeedsNew = nullptr);

// sawName is quoted in the plan-change templates (CuttingPlanConfig::sawName).
FeasibilityResult AssessFeasibility(const ProjectMetadata& meta, const std::vector<Piece>& pieces, const SeedSet& seeds,
                                    const FeasibilityConfig& cfg, const std::string& sawName);

} // namespace rebuild
