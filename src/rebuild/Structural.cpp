#include "rebuild/Structural.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Random.hpp"

#include <algorithm>
#include <cmath>

namespace rebuild {

namespace {

constexpr std::uint64_t kLoadStream = 0x4C4F4144ULL;  // "LOAD"
constexpr std::uint64_t kShearStream = 0x53484552ULL; // "SHER"

double TextLoad(const std::string& text, const StructuralConfig& cfg)
{
  if (!(cfg.textLengthScale > 0.0)) return 0.0;
  const double v = static_cast<double>(text.size()) / cfg.textLengthScale;
  return std::min(v, cfg.maxTextLoad);
}

} // namespace

MassStats ComputeMassStats(const std::vector<Piece>& pieces)
{
  MassStats s;
  s.count = static_cast<int>(pieces.size());
  if (pieces.empty()) return s;

  for (const Piece& p : pieces) s.total += p.massKg;
  s.mean = s.total / static_cast<double>(pieces.size());

  double var = 0.0;
  for (const Piece& p : pieces) {
    const double d = p.massKg - s.mean;
    var += d * d;
  }
  var /= static_cast<double>(pieces.size());
  s.stdDev = std::sqrt(var);
  return s;
}

const char* IntegrityRatingName(double score, const StructuralConfig& cfg)
{
  if (score >= cfg.robustScore) return "robust";
  if (score >= cfg.adequateScore) return "adequate";
  if (score >= cfg.marginalScore) return "marginal";
  return "critical";
}

MetricMap AnalyzeStructure(const ProjectMetadata& meta, const std::vector<Piece>& pieces, const SeedSet& seeds,
                           const StructuralConfig& cfg)
{
  const MassStats ms = ComputeMassStats(pieces);
  const int n = std::max(1, ms.count);

  const double stress = cfg.stressCoefficient * ms.mean / static_cast<double>(n);
  const double safety = ClampFinite(cfg.safetyNumerator / (stress + 1e-3), 0.0, cfg.safetyFactorCap);
  const double vibration = cfg.vibrationCoefficient * ms.stdDev;

  // The seed is mixed with the piece count so the same text with more pieces
  // reads differently.
  const std::uint64_t seed = MixSeed(seeds.structural, static_cast<std::uint64_t>(ms.count));
  RNG loadRng(MixSeed(seed, kLoadStream));
  RNG shearRng(MixSeed(seed, kShearStream));

  double loadFactor = cfg.baseLoadFactor + loadRng.rangeDouble(0.0, cfg.loadFactorJitter);
  loadFactor += TextLoad(meta.soilProfile, cfg);
  loadFactor += TextLoad(meta.hazardProfile, cfg);
  if (!meta.humanBuilt) loadFactor += cfg.nonHumanBuiltPenalty;
  loadFactor = ClampFinite(loadFactor, 0.0, 10.0);

  double shear = cfg.baseShearMargin + shearRng.rangeDouble(-cfg.shearJitter, cfg.shearJitter);
  shear -= cfg.shearLoadSensitivity * (loadFactor - 1.0);
  shear = Clamp01(shear);

  const double safetyTerm = (cfg.targetSafetyFactor > 0.0) ? std::min(1.0, safety / cfg.targetSafetyFactor) : 1.0;
  const double vibrationTerm = (cfg.vibrationLimit > 0.0) ? 1.0 - Clamp01(vibration / cfg.vibrationLimit) : 1.0;
  const double score = 100.0 * Clamp01(0.35 * safetyTerm + 0.45 * Clamp01(shear / 0.5) + 0.2 * vibrationTerm);
  const double scoreRounded = RoundTo(score, 1);

  MetricMap m;
  SetNumber(m, "piece_count", static_cast<double>(ms.count));
  SetNumber(m, "total_mass_kg", RoundTo(ms.total, 2));
  SetNumber(m, "mean_piece_mass", RoundTo(ms.mean, 2));
  SetNumber(m, "mass_std_dev", RoundTo(ms.stdDev, 2));
  SetNumber(m, "global_stress_index", RoundTo(stress, 2));
  SetNumber(m, "load_factor", RoundTo(loadFactor, 3));
  SetNumber(m, "shear_margin", RoundTo(shear, 3));
  SetNumber(m, "safety_factor", RoundTo(safety, 2));
  SetNumber(m, "vibration_risk", RoundTo(vibration, 2));
  SetNumber(m, "integrity_score", scoreRounded);
  SetText(m, "integrity_rating", IntegrityRatingName(scoreRounded, cfg));
  return m;
}

} // namespace rebuild
