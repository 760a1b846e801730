#pragma once

#include "rebuild/Metrics.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Seeds.hpp"

#include <string>
#include <vector>

namespace rebuild {

// Keyword rule for one disaster category. Matching is case-insensitive
// substring search over the corresponding metadata field.
struct HazardRule {
  std::string category;
  std::vector<std::string> hazardKeywords; // hazard_profile
  std::vector<std::string> soilKeywords;   // soil_profile
  std::vector<std::string> siteKeywords;   // site_location

  std::string calmText;  // reported when the hazard is not declared
  std::string alertText; // reported when declared or severity crosses alertSeverity
};

struct DisasterConfig {
  std::vector<HazardRule> rules;

  // Seeded per-category base severity in [baseMin, baseMax).
  double baseMin = 0.05;
  double baseMax = 0.2;

  double keywordBoost = 0.45;
  double soilBoost = 0.15;
  double siteBoost = 0.1;

  double alertSeverity = 0.5;

  // Likelihood labels: < moderate => low, < high => moderate, < severe => high.
  double moderateAt = 0.25;
  double highAt = 0.5;
  double severeAt = 0.75;
};

// flood, wind, seismic, fire, landslide.
std::vector<HazardRule> DefaultHazardRules();
DisasterConfig DefaultDisasterConfig();

struct HazardAssessment {
  std::string category;
  bool declared = false; // hazard keyword present
  bool soilHit = false;
  bool siteHit = false;
  double severity = 0.0; // [0,1]
  std::string likelihood;
  std::string description;
};

struct DisasterResult {
  std::vector<HazardAssessment> hazards; // rule order

  // Per category: <cat>, <cat>_severity, <cat>_likelihood;
  // then declared_hazards, dominant_hazard.
  MetricMap metrics;

  // Highest severity (first on ties); nullptr when there are no rules.
  const HazardAssessment* dominant() const;
};

const char* LikelihoodLabel(double severity, const DisasterConfig& cfg);

DisasterResult SimulateDisasters(const ProjectMetadata& meta, const SeedSet& seeds, const DisasterConfig& cfg);

} // namespace rebuild
