#pragma once

#include "rebuild/Metrics.hpp"
#include "rebuild/Pieces.hpp"
#include "rebuild/ProjectInputs.hpp"
#include "rebuild/Seeds.hpp"

#include <vector>

namespace rebuild {

// Synthetic node table. This is a reproducible stand-in for an FEA solve, not
// a solver: loads are a linear ramp plus hashed per-node noise.

struct FiniteElementConfig {
  int nodeCount = 16; // clamped to [1, 256]

  double loadStart = 0.7;
  double loadEnd = 1.3;
  double loadNoise = 0.08; // +/- per node

  double baseStressMpa = 18.0;
  double referenceMassKg = 120.0;
  double allowableStressMpa = 35.0;
  double displacementPerLoadMm = 12.0;

  // Soft/long soil descriptions amplify displacement by up to this share.
  double soilDisplacementShare = 0.25;
  double soilTextScale = 400.0;
};

inline constexpr int kMaxFiniteElementNodes = 256;

struct FeaNode {
  int index = 0;
  double load = 0.0;
  double stressMpa = 0.0;
  double displacementMm = 0.0;
  double utilization = 0.0; // [0,1]

  bool operator==(const FeaNode& o) const
  {
    return index == o.index && load == o.load && stressMpa == o.stressMpa && displacementMm == o.displacementMm &&
           utilization == o.utilization;
  }
};

struct FiniteElementResult {
  std::vector<FeaNode> nodes;

  // Keys: node_count, critical_node, max_stress_mpa, max_displacement_mm,
  // mean_utilization_pct, stress_utilization_pct.
  MetricMap summary;
};

int ClampNodeCount(int requested);

FiniteElementResult EstimateFiniteElements(const ProjectMetadata& meta, const std::vector<Piece>& pieces,
                                           const SeedSet& seeds, const FiniteElementConfig& cfg = {});

} // namespace rebuild
