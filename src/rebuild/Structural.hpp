#pragma once

#include "rebuild/Metrics.hpp"
#include "rebuild/Pieces.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Seeds.hpp"

#include <vector>

namespace rebuild {

struct StructuralConfig {
  double stressCoefficient = 0.85;  // global_stress_index = k * mean mass / piece count
  double safetyNumerator = 150.0;   // safety_factor = numerator / (stress + eps)
  double safetyFactorCap = 99.0;
  double vibrationCoefficient = 0.25; // vibration_risk = k * std dev of mass

  double baseLoadFactor = 1.2;
  double loadFactorJitter = 0.15;       // seeded, [0, jitter)
  double textLengthScale = 400.0;       // chars per unit of soil/hazard load
  double maxTextLoad = 0.2;             // cap per text field
  double nonHumanBuiltPenalty = 0.05;

  double baseShearMargin = 0.45;
  double shearJitter = 0.05;            // seeded, +/- jitter
  double shearLoadSensitivity = 0.25;

  double targetSafetyFactor = 2.0;
  double vibrationLimit = 10.0;

  // integrity_rating thresholds on integrity_score.
  double robustScore = 75.0;
  double adequateScore = 50.0;
  double marginalScore = 30.0;
};

struct MassStats {
  int count = 0;
  double total = 0.0;
  double mean = 0.0;
  double stdDev = 0.0; // population
};

MassStats ComputeMassStats(const std::vector<Piece>& pieces);

const char* IntegrityRatingName(double score, const StructuralConfig& cfg = {});

// Keys: piece_count, total_mass_kg, mean_piece_mass, mass_std_dev,
// global_stress_index, load_factor, shear_margin, safety_factor,
// vibration_risk, integrity_score, integrity_rating.
MetricMap AnalyzeStructure(const ProjectMetadata& meta, const std::vector<Piece>& pieces, const SeedSet& seeds,
                           const StructuralConfig& cfg = {});

} // namespace rebuild
