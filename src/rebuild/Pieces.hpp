#pragma once

#include "rebuild/Seeds.hpp"

#include <string>
#include <vector>

namespace rebuild {

struct Vec3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
};

// One salvageable unit. Created by DecomposePieces and read-only afterwards.
struct Piece {
  std::string id; // "piece-N", 1-based
  int index = 0;  // 0-based ordinal

  double massKg = 0.0;
  Vec3 centerOfMass;
  double reuseScore = 0.0;     // [0,100]
  double wasteReduction = 0.0; // percent of volume retained
  double optimalCutAngle = 0.0; // degrees, [0,180)

  bool operator==(const Piece& o) const
  {
    return id == o.id && index == o.index && massKg == o.massKg && centerOfMass == o.centerOfMass &&
           reuseScore == o.reuseScore && wasteReduction == o.wasteReduction &&
           optimalCutAngle == o.optimalCutAngle;
  }
};

inline constexpr int kMaxPieces = 256;

struct PieceConfig {
  // Piece count = clamp(assets * assetWeight + scans * scanWeight, minPieces, maxPieces).
  // Both bounds are clamped to [1, kMaxPieces].
  int minPieces = 3;
  int maxPieces = 12;
  int assetWeight = 1;
  int scanWeight = 2;

  double baseMassKg = 120.0;
  double massSwingKg = 20.0;  // amplitude of the sin(i) term
  double massJitterKg = 15.0; // +/- uniform jitter
  double minMassKg = 1.0;
  double maxMassKg = 10000.0;

  double spacingM = 0.5;      // center-of-mass x spacing between pieces
  double spacingJitterM = 0.25;
  double minHeightM = 0.1;
  double maxHeightM = 4.0;
  double depthJitterM = 0.5;

  double angleStepDeg = 17.5;
  double angleJitterDeg = 0.0;

  double minWasteReduction = 15.0;
  double maxWasteReduction = 40.0;
  double minReuseScore = 40.0;
  double maxReuseScore = 80.0;
};

// Count policy only. Never below max(1, minPieces).
int ComputePieceCount(int assetCount, int scanCount, const PieceConfig& cfg = {});

// Each piece draws from its own stream keyed by (pieces seed, ordinal), so the
// first N pieces are identical whatever the total count is.
Piece MakePiece(std::uint64_t piecesSeed, int index, const PieceConfig& cfg = {});

std::vector<Piece> DecomposePieces(const SeedSet& seeds, int assetCount, int scanCount,
                                   const PieceConfig& cfg = {});

// Aggregates used by several stages.
double TotalMassKg(const std::vector<Piece>& pieces);
double MeanReuseScore(const std::vector<Piece>& pieces);

} // namespace rebuild
