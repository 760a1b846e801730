#pragma once

#include "rebuild/Pieces.hpp"
#include "rebuild/ProjectInputs.hpp"

#include <string>
#include <vector>

namespace rebuild {

struct CuttingPlanConfig {
  std::string sawName = "KUKA beam saw";

  // Conveyor sync hint appended when the transport plan mentions a conveyor.
  double conveyorSpeedMps = 0.5;
  // Seconds of belt time per 100 kg on the per-piece conveyor line.
  double conveyorSecondsPer100Kg = 6.0;

  // Waste reduction adjustments.
  double humanBuiltBonus = 2.5;
  double railBonus = 1.5;
  double maxAdjustedWasteReduction = 60.0;

  // Tolerance quoted on the verify line.
  double verifyToleranceMm = 1.5;
};

struct PieceCutPlan {
  std::string pieceId;
  std::vector<std::string> lines;
  double adjustedWasteReduction = 0.0;
};

struct CuttingPlanResult {
  std::string sawName;
  std::vector<PieceCutPlan> pieces;
  // Lines appended after every per-piece set (transport hints).
  std::vector<std::string> trailer;

  // Flattened in execution order: every piece's lines, then the trailer.
  std::vector<std::string> flatten() const;
};

// Per-piece instruction set. Pure function of (piece, metadata, cfg).
PieceCutPlan PlanPieceCut(const Piece& piece, const ProjectMetadata& meta, const CuttingPlanConfig& cfg = {});

CuttingPlanResult GenerateCuttingPlan(const std::vector<Piece>& pieces, const ProjectMetadata& meta,
                                      const CuttingPlanConfig& cfg = {});

} // namespace rebuild
