#pragma once

#include "rebuild/CostCarbon.hpp"
#include "rebuild/CuttingPlan.hpp"
#include "rebuild/Disaster.hpp"
#include "rebuild/Environmental.hpp"
#include "rebuild/Feasibility.hpp"
#include "rebuild/FiniteElement.hpp"
#include "rebuild/Metrics.hpp"
#include "rebuild/Pieces.hpp"
#include "rebuild/ProjectInputs.hpp"

#include <string>
#include <vector>

namespace rebuild {

// Piece as reported: the decomposed piece plus the cutting-plan adjustment.
struct PiecePlan {
  Piece piece;
  double adjustedWasteReduction = 0.0;

  bool operator==(const PiecePlan& o) const
  {
    return piece == o.piece && adjustedWasteReduction == o.adjustedWasteReduction;
  }
};

// Raw per-stage results of one run, before assembly.
struct StageOutputs {
  std::vector<Piece> pieces;
  CuttingPlanResult cutting;
  MetricMap structural;
  FiniteElementResult finiteElement;
  DisasterResult disaster;
  EnvironmentalResult environmental;
  FeasibilityResult feasibility;
  CostCarbonResult costCarbon;
  std::vector<std::string> recommendations;
};

// Terminal aggregate. Every field is always present; empty stage results stay
// as empty lists/mappings.
struct Report {
  std::string projectName;
  std::string summary;

  std::vector<PiecePlan> piecePlans;
  std::vector<std::string> cuttingInstructions;

  ReuseBreakdown reuseBreakdown;
  FeasibilityVerdict materialFeasibility;

  MetricMap disasterSimulation;
  MetricMap structuralAnalysis;
  MetricMap finiteElementAnalysis;
  std::vector<FeaNode> finiteElementNodes;
  MetricMap pollutionModel;
  MetricMap environmentalImpact;

  CostCarbonResult costAndCarbon;
  std::vector<std::string> recommendations;

  // Opaque narrative text, passed through unchanged.
  std::string aiEngineering;

  bool operator==(const Report& o) const
  {
    return projectName == o.projectName && summary == o.summary && piecePlans == o.piecePlans &&
           cuttingInstructions == o.cuttingInstructions && reuseBreakdown == o.reuseBreakdown &&
           materialFeasibility == o.materialFeasibility && disasterSimulation == o.disasterSimulation &&
           structuralAnalysis == o.structuralAnalysis && finiteElementAnalysis == o.finiteElementAnalysis &&
           finiteElementNodes == o.finiteElementNodes && pollutionModel == o.pollutionModel &&
           environmentalImpact == o.environmentalImpact && costAndCarbon == o.costAndCarbon &&
           recommendations == o.recommendations && aiEngineering == o.aiEngineering;
  }
  bool operator!=(const Report& o) const { return !(*this == o); }
};

// "Processed <name> with <n> salvageable pieces. Estimated that <p>% ..."
std::string BuildSummary(const std::string& projectName, int pieceCount, double reusedPct, const std::string& sawName);

// Pure aggregation, no derivation beyond the summary text.
Report AssembleReport(const ProjectMetadata& meta, const StageOutputs& stages, const std::string& narrative);

} // namespace rebuild
