#pragma once

#include "rebuild/Pieces.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace rebuild {

struct Report;

// Wavefront OBJ/MTL export of the salvaged pieces.
//
// Each piece is a box (boxWidth x h x boxDepth) where
//   h = clamp(mass / massPerMeterKg, minHeightM, maxHeightM)
// rotated about +Y by the optimal cut angle and translated so that its centroid
// sits on the piece's center of mass. Pieces are grouped with `o <piece-id>`
// and shaded by reuse score band.
//
// Coordinate system: X/Z ground plane, +Y up, meters.

struct PieceExportConfig {
  // Name written into the OBJ "mtllib" line. Empty = derive from the mtl path
  // (file exports) or "pieces.mtl" (stream/archive exports).
  std::string mtlFileName;

  double boxWidthM = 0.6;
  double boxDepthM = 0.6;
  double massPerMeterKg = 120.0;
  double minHeightM = 0.25;
  double maxHeightM = 2.5;

  // Reuse score bands (>= high -> reuse_high, >= mid -> reuse_mid, else reuse_low).
  double highReuseScore = 70.0;
  double midReuseScore = 55.0;
};

struct PieceExportStats {
  std::uint64_t vertices = 0;
  std::uint64_t faces = 0;
};

// Box height for a given mass under cfg.
double PieceBoxHeight(double massKg, const PieceExportConfig& cfg = {});

const char* ReuseMaterialName(double reuseScore, const PieceExportConfig& cfg = {});

// Writes OBJ + MTL text to the given streams.
bool WritePiecesObjMtl(std::ostream& objOut, std::ostream& mtlOut, const std::vector<Piece>& pieces,
                       const PieceExportConfig& cfg = {}, PieceExportStats* outStats = nullptr,
                       std::string* outError = nullptr);

// Writes OBJ + MTL files.
bool ExportPiecesObjMtl(const std::string& objPath, const std::string& mtlPath, const std::vector<Piece>& pieces,
                        const PieceExportConfig& cfg = {}, PieceExportStats* outStats = nullptr,
                        std::string* outError = nullptr);

// Single-piece OBJ (no material library), used for the per-piece archive entries.
std::string PieceObjText(const Piece& piece, const PieceExportConfig& cfg = {});

struct PieceArchiveOptions {
  PieceExportConfig geometry;

  // Also store the full report as report.json.
  bool includeReport = true;
};

// ZIP archive with:
//   pieces.obj, pieces.mtl      combined export
//   pieces/<piece-id>.obj       one mesh per piece
//   manifest.json               project name, report hash, piece list
//   report.json                 (optional) the full report
//
// Entries carry a fixed timestamp so identical reports give identical bytes.
bool ExportPieceArchive(const std::string& zipPath, const Report& report, std::string& outError,
                        const PieceArchiveOptions& opt = {});

} // namespace rebuild
