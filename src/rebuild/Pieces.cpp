#include "rebuild/Pieces.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Random.hpp"

#include <algorithm>
#include <cstdint>

namespace rebuild {

namespace {

// Sanitized copy: 1 <= min <= max <= kMaxPieces, ranges ordered.
PieceConfig Sanitize(const PieceConfig& in)
{
  PieceConfig c = in;
  c.minPieces = std::clamp(c.minPieces, 1, kMaxPieces);
  c.maxPieces = std::clamp(c.maxPieces, c.minPieces, kMaxPieces);
  c.assetWeight = std::max(0, c.assetWeight);
  c.scanWeight = std::max(0, c.scanWeight);

  if (!(c.minMassKg > 0.0)) c.minMassKg = 1.0;
  if (!(c.maxMassKg >= c.minMassKg)) c.maxMassKg = c.minMassKg;
  if (!(c.maxHeightM >= c.minHeightM)) c.maxHeightM = c.minHeightM;
  if (!(c.maxWasteReduction >= c.minWasteReduction)) c.maxWasteReduction = c.minWasteReduction;
  c.minReuseScore = ClampFinite(c.minReuseScore, 0.0, 100.0);
  c.maxReuseScore = ClampFinite(c.maxReuseScore, c.minReuseScore, 100.0);
  return c;
}

} // namespace

int ComputePieceCount(int assetCount, int scanCount, const PieceConfig& cfgIn)
{
  const PieceConfig cfg = Sanitize(cfgIn);

  const std::int64_t assets = std::max(0, assetCount);
  const std::int64_t scans = std::max(0, scanCount);
  const std::int64_t raw = assets * cfg.assetWeight + scans * cfg.scanWeight;
  const std::int64_t clamped =
      std::clamp<std::int64_t>(raw, static_cast<std::int64_t>(cfg.minPieces), static_cast<std::int64_t>(cfg.maxPieces));
  return static_cast<int>(clamped);
}

Piece MakePiece(std::uint64_t piecesSeed, int index, const PieceConfig& cfgIn)
{
  const PieceConfig cfg = Sanitize(cfgIn);
  RNG rng(MixSeed(piecesSeed, static_cast<std::uint64_t>(index) + 1u));

  Piece p;
  p.index = index;
  p.id = "piece-" + std::to_string(index + 1);

  // Draw order is part of the output contract: do not reorder.
  const double mass = cfg.baseMassKg + cfg.massSwingKg * FastSinRad(static_cast<double>(index)) +
                      rng.rangeDouble(-cfg.massJitterKg, cfg.massJitterKg);
  const double x = cfg.spacingM * static_cast<double>(index) + rng.rangeDouble(-cfg.spacingJitterM, cfg.spacingJitterM);
  const double y = rng.rangeDouble(cfg.minHeightM, cfg.maxHeightM);
  const double z = rng.rangeDouble(-cfg.depthJitterM, cfg.depthJitterM);
  const double angleJitter = rng.rangeDouble(-cfg.angleJitterDeg, cfg.angleJitterDeg);
  const double waste = rng.rangeDouble(cfg.minWasteReduction, cfg.maxWasteReduction);
  const double reuse = rng.rangeDouble(cfg.minReuseScore, cfg.maxReuseScore);

  p.massKg = RoundTo(ClampFinite(mass, cfg.minMassKg, cfg.maxMassKg), 2);
  p.centerOfMass.x = RoundTo(ClampFinite(x, -1.0e6, 1.0e6), 2);
  p.centerOfMass.y = RoundTo(ClampFinite(y, cfg.minHeightM, cfg.maxHeightM), 2);
  p.centerOfMass.z = RoundTo(ClampFinite(z, -AbsD(cfg.depthJitterM), AbsD(cfg.depthJitterM)), 2);

  const double angle = WrapPositive(static_cast<double>(index) * cfg.angleStepDeg + angleJitter, 180.0);
  p.optimalCutAngle = RoundTo(angle, 2);
  // Rounding can land exactly on 180.
  if (p.optimalCutAngle >= 180.0) p.optimalCutAngle = 0.0;

  p.wasteReduction = RoundTo(ClampFinite(waste, cfg.minWasteReduction, cfg.maxWasteReduction), 2);
  p.reuseScore = RoundTo(ClampFinite(reuse, cfg.minReuseScore, cfg.maxReuseScore), 2);
  return p;
}

std::vector<Piece> DecomposePieces(const SeedSet& seeds, int assetCount, int scanCount, const PieceConfig& cfg)
{
  const int count = ComputePieceCount(assetCount, scanCount, cfg);

  std::vector<Piece> pieces;
  pieces.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    pieces.push_back(MakePiece(seeds.pieces, i, cfg));
  }
  return pieces;
}

double TotalMassKg(const std::vector<Piece>& pieces)
{
  double sum = 0.0;
  for (const Piece& p : pieces) sum += p.massKg;
  return sum;
}

double MeanReuseScore(const std::vector<Piece>& pieces)
{
  if (pieces.empty()) return 0.0;
  double sum = 0.0;
  for (const Piece& p : pieces) sum += p.reuseScore;
  return sum / static_cast<double>(pieces.size());
}

} // namespace rebuild
