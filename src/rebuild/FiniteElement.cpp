#include "rebuild/FiniteElement.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Random.hpp"
#include "rebuild/Structural.hpp"

#include <algorithm>

namespace rebuild {

int ClampNodeCount(int requested)
{
  return std::clamp(requested, 1, kMaxFiniteElementNodes);
}

FiniteElementResult EstimateFiniteElements(const ProjectMetadata& meta, const std::vector<Piece>& pieces,
                                           const SeedSet& seeds, const FiniteElementConfig& cfg)
{
  FiniteElementResult out;

  const int n = ClampNodeCount(cfg.nodeCount);
  const int pieceCount = static_cast<int>(pieces.size());
  const MassStats ms = ComputeMassStats(pieces);

  const double massRatio =
      (cfg.referenceMassKg > 0.0) ? ClampFinite(ms.mean / cfg.referenceMassKg, 0.25, 4.0) : 1.0;
  const double stressScale = cfg.baseStressMpa * massRatio;

  double soilAmp = 1.0;
  if (cfg.soilTextScale > 0.0) {
    soilAmp += std::min(static_cast<double>(meta.soilProfile.size()) / cfg.soilTextScale, 1.0) *
               ClampFinite(cfg.soilDisplacementShare, 0.0, 1.0);
  }

  const std::uint32_t seed32 =
      static_cast<std::uint32_t>(seeds.structural ^ (seeds.structural >> 32));

  out.nodes.reserve(static_cast<std::size_t>(n));

  int critical = 0;
  double maxStress = 0.0;
  double maxDisp = 0.0;
  double sumUtil = 0.0;

  for (int i = 0; i < n; ++i) {
    // numpy-style linspace: a single node sits at the start value.
    const double t = (n > 1) ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
    const double ramp = cfg.loadStart + (cfg.loadEnd - cfg.loadStart) * t;

    const std::uint32_t h = HashIndex32(i, pieceCount, seed32);
    const double u01 = static_cast<double>(h) / 4294967296.0;
    const double noise = -cfg.loadNoise + 2.0 * cfg.loadNoise * u01;

    FeaNode node;
    node.index = i;
    node.load = ClampFinite(ramp + noise, 0.0, 100.0);
    node.stressMpa = node.load * stressScale;
    node.displacementMm = node.load * cfg.displacementPerLoadMm * soilAmp;
    node.utilization = (cfg.allowableStressMpa > 0.0) ? Clamp01(node.stressMpa / cfg.allowableStressMpa) : 1.0;

    if (i == 0 || node.stressMpa > maxStress) {
      maxStress = node.stressMpa;
      critical = i;
    }
    maxDisp = std::max(maxDisp, node.displacementMm);
    sumUtil += node.utilization;

    node.load = RoundTo(node.load, 4);
    node.stressMpa = RoundTo(node.stressMpa, 3);
    node.displacementMm = RoundTo(node.displacementMm, 3);
    node.utilization = RoundTo(node.utilization, 4);
    out.nodes.push_back(node);
  }

  const double maxUtil = (cfg.allowableStressMpa > 0.0) ? Clamp01(maxStress / cfg.allowableStressMpa) : 1.0;

  SetNumber(out.summary, "node_count", static_cast<double>(n));
  SetText(out.summary, "critical_node", "node-" + std::to_string(critical + 1));
  SetNumber(out.summary, "max_stress_mpa", RoundTo(maxStress, 2));
  SetNumber(out.summary, "max_displacement_mm", RoundTo(maxDisp, 2));
  SetNumber(out.summary, "mean_utilization_pct", RoundTo(100.0 * sumUtil / static_cast<double>(n), 1));
  SetNumber(out.summary, "stress_utilization_pct", RoundTo(100.0 * maxUtil, 1));
  return out;
}

} // namespace rebuild
