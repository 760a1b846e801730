#pragma once

#include "rebuild/Feasibility.hpp"
#include "rebuild/Pieces.hpp"

#include <vector>

namespace rebuild {

// Fixed per-unit-mass accounting constants. Currency is unitless in the
// report; the defaults read as USD.
struct CostCarbonConfig {
  double fixedCost = 250000.0;
  double costPerKg = 85.0;
  double savingsPerKg = 140.0;
  double maxSavingsShare = 0.8; // savings never exceed this share of baseline
  double co2TonsPerKg = 0.0018;
  double valuePerKg = 95.0;
};

struct CostCarbonResult {
  double baselineCost = 0.0;
  double reclaimedSavings = 0.0;
  double netCost = 0.0;      // >= 0
  double co2SavedTons = 0.0; // >= 0
  double recycledMaterialValue = 0.0;
  double totalMassKg = 0.0;
  double reclaimedMassKg = 0.0;

  bool operator==(const CostCarbonResult& o) const
  {
    return baselineCost == o.baselineCost && reclaimedSavings == o.reclaimedSavings && netCost == o.netCost &&
           co2SavedTons == o.co2SavedTons && recycledMaterialValue == o.recycledMaterialValue &&
           totalMassKg == o.totalMassKg && reclaimedMassKg == o.reclaimedMassKg;
  }
};

// reclaimed mass = sum(mass * reuse/100 * recycled_ratio).
double ReclaimedMassKg(const std::vector<Piece>& pieces, double recycledRatio);

CostCarbonResult AccountCostCarbon(const std::vector<Piece>& pieces, const FeasibilityVerdict& verdict,
                                   const CostCarbonConfig& cfg = {});

} // namespace rebuild
