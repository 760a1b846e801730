#include "rebuild/CostCarbon.hpp"

#include "rebuild/DeterministicMath.hpp"

#include <algorithm>

namespace rebuild {

double ReclaimedMassKg(const std::vector<Piece>& pieces, double recycledRatio)
{
  const double ratio = Clamp01(recycledRatio);
  double sum = 0.0;
  for (const Piece& p : pieces) {
    const double mass = ClampFinite(p.massKg, 0.0, 1.0e7);
    const double reuse = ClampFinite(p.reuseScore, 0.0, 100.0);
    sum += mass * (reuse / 100.0) * ratio;
  }
  return sum;
}

CostCarbonResult AccountCostCarbon(const std::vector<Piece>& pieces, const FeasibilityVerdict& verdict,
                                   const CostCarbonConfig& cfg)
{
  CostCarbonResult r;

  double total = 0.0;
  for (const Piece& p : pieces) total += ClampFinite(p.massKg, 0.0, 1.0e7);
  const double reclaimed = ReclaimedMassKg(pieces, verdict.recycledRatio);

  const double baseline = std::max(0.0, cfg.fixedCost + cfg.costPerKg * total);
  const double cap = baseline * ClampFinite(cfg.maxSavingsShare, 0.0, 1.0);
  const double savings = ClampFinite(reclaimed * cfg.savingsPerKg, 0.0, cap);

  r.totalMassKg = RoundTo(total, 2);
  r.reclaimedMassKg = RoundTo(reclaimed, 2);
  r.baselineCost = RoundTo(baseline, 2);
  r.reclaimedSavings = RoundTo(savings, 2);
  r.netCost = RoundTo(std::max(0.0, baseline - savings), 2);
  r.co2SavedTons = RoundTo(std::max(0.0, reclaimed * cfg.co2TonsPerKg), 3);
  r.recycledMaterialValue = RoundTo(std::max(0.0, reclaimed * cfg.valuePerKg), 2);
  return r;
}

} // namespace rebuild
