#pragma once

#include "rebuild/Metrics.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Seeds.hpp"

#include <string>
#include <vector>

namespace rebuild {

struct EnvironmentalConfig {
  // Noise (dB).
  double baseNoiseDb = 55.0;
  double noisePerPieceDb = 1.5;
  double noisePerLegDb = 2.0;
  double transportCharsPerDb = 40.0;
  double maxTransportTextDb = 8.0;
  double noiseJitterDb = 3.0; // seeded, [0, jitter)
  double truckMultiplier = 1.3;
  double maxNoiseDb = 95.0;
  double quietDb = 40.0; // sound_pollution_index = 0 at this level

  // Light (dB-equivalent sky glow).
  double baseLightDb = 45.0;
  double ruralDensity = 0.8;
  double urbanDensity = 1.1;
  double lightPerPieceDb = 0.8;
  double maxLightDb = 90.0;

  double floodPeakMultiplier = 1.2;
  double maxPeakDb = 120.0;

  // Light intrusion (lux).
  double baseLux = 320.0;
  double historicBuffer = 0.9;
  double luxPerPiece = 15.0;
  double maxLux = 2000.0;
  double glareDivisor = 12.0;

  std::vector<std::string> truckKeywords = {"truck", "lorry", "haul"};
  std::vector<std::string> ruralKeywords = {"rural", "countryside", "farm"};
  std::vector<std::string> historicKeywords = {"historic", "heritage", "listed"};
  std::vector<std::string> floodKeywords = {"flood"};
  std::vector<std::string> legSeparators = {"->", ",", ";", "+", " then ", " to "};
};

struct EnvironmentalResult {
  MetricMap pollution; // light_db, noise_db

  // pollution keys plus sound_peak_db, light_intrusion_lux,
  // nighttime_glare_index, sound_pollution_index, light_pollution_index,
  // transport_legs.
  MetricMap impact;
};

// Non-empty segments between separators; 0 for a blank plan.
int CountTransportLegs(const std::string& transportPlan, const std::vector<std::string>& separators);

// Monotone non-decreasing in pieceCount; every value bounded by the caps.
EnvironmentalResult EstimateEnvironmentalImpact(const ProjectMetadata& meta, int pieceCount, const SeedSet& seeds,
                                                const EnvironmentalConfig& cfg = {});

} // namespace rebuild
