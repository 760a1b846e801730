#include "rebuild/CuttingPlan.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Text.hpp"

namespace rebuild {

std::vector<std::string> CuttingPlanResult::flatten() const
{
  std::vector<std::string> out;
  std::size_t total = trailer.size();
  for (const PieceCutPlan& p : pieces) total += p.lines.size();
  out.reserve(total);

  for (const PieceCutPlan& p : pieces) {
    out.insert(out.end(), p.lines.begin(), p.lines.end());
  }
  out.insert(out.end(), trailer.begin(), trailer.end());
  return out;
}

PieceCutPlan PlanPieceCut(const Piece& piece, const ProjectMetadata& meta, const CuttingPlanConfig& cfg)
{
  // Upstream values are trusted only after clamping.
  const double angle = ClampFinite(piece.optimalCutAngle, 0.0, 180.0);
  const double waste = ClampFinite(piece.wasteReduction, 0.0, 100.0);
  const double mass = ClampFinite(piece.massKg, 0.0, 1.0e7);
  const double maxAdjusted = ClampFinite(cfg.maxAdjustedWasteReduction, 0.0, 100.0);

  PieceCutPlan plan;
  plan.pieceId = piece.id;

  const std::string tag = "[" + piece.id + "] ";
  const Vec3& c = piece.centerOfMass;

  plan.lines.push_back(tag + "Approach: position " + cfg.sawName + " at (" + FormatFixed(c.x, 2) + ", " + FormatFixed(c.y, 2) +
                       ", " + FormatFixed(c.z, 2) + ") m, clamp " + FormatFixed(mass, 2) + " kg section.");
  plan.lines.push_back(tag + "Slice: cut at " + FormatFixed(angle, 2) + " deg to retain " + FormatFixed(waste, 2) +
                       "% of volume for facade modules.");
  plan.lines.push_back(tag + "Verify: rescan cut face, tolerance +/-" + FormatFixed(cfg.verifyToleranceMm, 1) + " mm.");

  const double beltSeconds = ClampFinite(mass / 100.0 * cfg.conveyorSecondsPer100Kg, 0.0, 3600.0);
  plan.lines.push_back(tag + "Conveyor: release to belt after " + FormatFixed(beltSeconds, 1) + " s hold.");

  const std::string transport = ToLowerAscii(meta.transportPlan);
  double adjusted = waste;
  if (meta.humanBuilt) adjusted += cfg.humanBuiltBonus;
  if (ContainsLowered(transport, "rail")) adjusted += cfg.railBonus;
  plan.adjustedWasteReduction = RoundTo(ClampFinite(adjusted, 0.0, maxAdjusted), 2);

  return plan;
}

CuttingPlanResult GenerateCuttingPlan(const std::vector<Piece>& pieces, const ProjectMetadata& meta,
                                      const CuttingPlanConfig& cfg)
{
  CuttingPlanResult out;
  out.sawName = cfg.sawName;
  out.pieces.reserve(pieces.size());
  for (const Piece& p : pieces) {
    out.pieces.push_back(PlanPieceCut(p, meta, cfg));
  }

  const std::string transport = ToLowerAscii(meta.transportPlan);
  if (ContainsLowered(transport, "conveyor")) {
    out.trailer.push_back("Sync conveyor belt speed with scan throughput (" + FormatFixed(cfg.conveyorSpeedMps, 1) +
                          " m/s) to maintain continuous material flow.");
  }
  if (ContainsLowered(transport, "rail")) {
    out.trailer.push_back("Stage reclaimed pieces for rail loading in piece order; brace cut faces for transit.");
  }
  return out;
}

} // namespace rebuild
