#pragma once

#include "rebuild/CostCarbon.hpp"
#include "rebuild/CuttingPlan.hpp"
#include "rebuild/Disaster.hpp"
#include "rebuild/Environmental.hpp"
#include "rebuild/Feasibility.hpp"
#include "rebuild/FiniteElement.hpp"
#include "rebuild/Pieces.hpp"
#include "rebuild/Structural.hpp"

namespace rebuild {

// Every tunable of a run, passed explicitly to the entry point.
struct PipelineConfig {
  PieceConfig pieces{};
  CuttingPlanConfig cutting{};
  StructuralConfig structural{};
  FiniteElementConfig finiteElement{};
  DisasterConfig disaster = DefaultDisasterConfig();
  EnvironmentalConfig environmental{};
  FeasibilityConfig feasibility = DefaultFeasibilityConfig();
  CostCarbonConfig costCarbon{};

  // Worker threads for the fan-out stages. 0 => hardware concurrency.
  // The report is identical for every value.
  int threads = 1;
};

} // namespace rebuild
