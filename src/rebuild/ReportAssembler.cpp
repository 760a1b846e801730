#include "rebuild/Report.hpp"

#include "rebuild/Text.hpp"

namespace rebuild {

std::string BuildSummary(const std::string& projectName, int pieceCount, double reusedPct,
                         const std::string& sawName)
{
  return "Processed " + projectName + " with " + std::to_string(pieceCount) +
         (pieceCount == 1 ? " salvageable piece. " : " salvageable pieces. ") + "Estimated that " +
         FormatFixed(reusedPct, 1) + "% of the structure can be reclaimed while " + sawName +
         " cutting plans cover every salvaged piece.";
}

Report AssembleReport(const ProjectMetadata& meta, const StageOutputs& stages, const std::string& narrative)
{
  Report r;
  r.projectName = meta.projectName;
  r.summary = BuildSummary(meta.projectName, static_cast<int>(stages.pieces.size()),
                           stages.feasibility.breakdown.reusedPct, stages.cutting.sawName);

  r.piecePlans.reserve(stages.pieces.size());
  for (std::size_t i = 0; i < stages.pieces.size(); ++i) {
    PiecePlan pp;
    pp.piece = stages.pieces[i];
    // Cutting plans are produced one per piece in the same order.
    if (i < stages.cutting.pieces.size()) {
      pp.adjustedWasteReduction = stages.cutting.pieces[i].adjustedWasteReduction;
    } else {
      pp.adjustedWasteReduction = pp.piece.wasteReduction;
    }
    r.piecePlans.push_back(std::move(pp));
  }

  r.cuttingInstructions = stages.cutting.flatten();
  r.reuseBreakdown = stages.feasibility.breakdown;
  r.materialFeasibility = stages.feasibility.verdict;

  r.disasterSimulation = stages.disaster.metrics;
  r.structuralAnalysis = stages.structural;
  r.finiteElementAnalysis = stages.finiteElement.summary;
  r.finiteElementNodes = stages.finiteElement.nodes;
  r.pollutionModel = stages.environmental.pollution;
  r.environmentalImpact = stages.environmental.impact;

  r.costAndCarbon = stages.costCarbon;
  r.recommendations = stages.recommendations;
  r.aiEngineering = narrative;
  return r;
}

} // namespace rebuild
