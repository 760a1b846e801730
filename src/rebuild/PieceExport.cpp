#include "rebuild/PieceExport.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Hash.hpp"
#include "rebuild/Json.hpp"
#include "rebuild/Report.hpp"
#include "rebuild/ReportJson.hpp"
#include "rebuild/Text.hpp"
#include "rebuild/ZipWriter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>

namespace rebuild {

namespace {

struct V3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

void WriteMaterial(std::ostream& mtl, const char* name, double r, double g, double b)
{
  mtl << "newmtl " << name << "\n";
  mtl << "Kd " << std::fixed << std::setprecision(4) << Clamp01(r) << ' ' << Clamp01(g) << ' ' << Clamp01(b)
      << "\n";
  mtl << "Ka " << std::fixed << std::setprecision(4) << Clamp01(r * 0.15) << ' ' << Clamp01(g * 0.15) << ' '
      << Clamp01(b * 0.15) << "\n";
  mtl << "Ks 0.0000 0.0000 0.0000\n";
  mtl << "Ns 10.0000\n\n";
}

struct ObjWriter {
  std::ostream& obj;
  PieceExportStats* stats = nullptr;

  std::uint64_t nextIndex = 1; // OBJ indices are 1-based.
  std::string currentMtl;

  explicit ObjWriter(std::ostream& o, PieceExportStats* st) : obj(o), stats(st) {}

  void UseMaterial(const char* name)
  {
    if (!name) return;
    if (currentMtl == name) return;
    currentMtl = name;
    obj << "usemtl " << name << "\n";
  }

  std::uint64_t AddVertex(const V3& v)
  {
    obj << "v " << std::fixed << std::setprecision(6) << v.x << ' ' << v.y << ' ' << v.z << "\n";
    if (stats) stats->vertices++;
    return nextIndex++;
  }

  void AddQuad(std::uint64_t a, std::uint64_t b, std::uint64_t c, std::uint64_t d)
  {
    obj << "f " << a << ' ' << b << ' ' << c << ' ' << d << "\n";
    if (stats) stats->faces++;
  }

  // Bottom ring (0..3) then top ring (4..7), counter-clockwise seen from +Y.
  void AddBox(const V3 corners[8])
  {
    std::uint64_t idx[8];
    for (int i = 0; i < 8; ++i) idx[i] = AddVertex(corners[i]);

    AddQuad(idx[0], idx[1], idx[2], idx[3]); // bottom
    AddQuad(idx[4], idx[5], idx[6], idx[7]); // top
    AddQuad(idx[0], idx[4], idx[7], idx[3]);
    AddQuad(idx[1], idx[5], idx[6], idx[2]);
    AddQuad(idx[3], idx[2], idx[6], idx[7]);
    AddQuad(idx[0], idx[1], idx[5], idx[4]);
  }
};

void PieceCorners(const Piece& p, const PieceExportConfig& cfg, V3 out[8])
{
  const double hx = 0.5 * cfg.boxWidthM;
  const double hz = 0.5 * cfg.boxDepthM;
  const double hy = 0.5 * PieceBoxHeight(p.massKg, cfg);

  double s = 0.0;
  double c = 1.0;
  FastSinCosRad(p.optimalCutAngle * kDegToRad, s, c);

  const double lx[4] = {-hx, hx, hx, -hx};
  const double lz[4] = {-hz, -hz, hz, hz};

  for (int ring = 0; ring < 2; ++ring) {
    const double y = (ring == 0) ? -hy : hy;
    for (int i = 0; i < 4; ++i) {
      const double rx = lx[i] * c - lz[i] * s;
      const double rz = lx[i] * s + lz[i] * c;
      out[ring * 4 + i] = V3{p.centerOfMass.x + rx, p.centerOfMass.y + y, p.centerOfMass.z + rz};
    }
  }
}

void WriteHeader(std::ostream& obj)
{
  obj << "# ReBuild piece export\n";
  obj << "# Units: meters, +Y up\n";
}

} // namespace

double PieceBoxHeight(double massKg, const PieceExportConfig& cfg)
{
  const double lo = std::min(cfg.minHeightM, cfg.maxHeightM);
  const double hi = std::max(cfg.minHeightM, cfg.maxHeightM);
  if (!(cfg.massPerMeterKg > 0.0)) return lo;
  return ClampFinite(massKg / cfg.massPerMeterKg, lo, hi);
}

const char* ReuseMaterialName(double reuseScore, const PieceExportConfig& cfg)
{
  if (reuseScore >= cfg.highReuseScore) return "reuse_high";
  if (reuseScore >= cfg.midReuseScore) return "reuse_mid";
  return "reuse_low";
}

bool WritePiecesObjMtl(std::ostream& objOut, std::ostream& mtlOut, const std::vector<Piece>& pieces,
                       const PieceExportConfig& cfg, PieceExportStats* outStats, std::string* outError)
{
  if (outError) outError->clear();
  if (outStats) *outStats = PieceExportStats{};

  if (!(cfg.boxWidthM > 0.0) || !(cfg.boxDepthM > 0.0)) {
    if (outError) *outError = "box dimensions must be positive";
    return false;
  }

  objOut.imbue(std::locale::classic());
  mtlOut.imbue(std::locale::classic());

  mtlOut << "# ReBuild piece materials\n\n";
  WriteMaterial(mtlOut, "reuse_high", 0.25, 0.70, 0.35);
  WriteMaterial(mtlOut, "reuse_mid", 0.90, 0.75, 0.25);
  WriteMaterial(mtlOut, "reuse_low", 0.80, 0.30, 0.25);

  WriteHeader(objOut);
  objOut << "mtllib " << (cfg.mtlFileName.empty() ? std::string("pieces.mtl") : cfg.mtlFileName) << "\n";

  ObjWriter w(objOut, outStats);
  for (const Piece& p : pieces) {
    objOut << "o " << p.id << "\n";
    w.currentMtl.clear();
    w.UseMaterial(ReuseMaterialName(p.reuseScore, cfg));

    V3 corners[8];
    PieceCorners(p, cfg, corners);
    w.AddBox(corners);
  }

  if (!objOut || !mtlOut) {
    if (outError) *outError = "failed while writing obj/mtl output";
    return false;
  }
  return true;
}

bool ExportPiecesObjMtl(const std::string& objPath, const std::string& mtlPath, const std::vector<Piece>& pieces,
                        const PieceExportConfig& cfg, PieceExportStats* outStats, std::string* outError)
{
  if (outError) outError->clear();

  std::ofstream objFile(objPath, std::ios::binary);
  if (!objFile) {
    if (outError) *outError = "failed to open obj for writing: " + objPath;
    return false;
  }

  std::ofstream mtlFile(mtlPath, std::ios::binary);
  if (!mtlFile) {
    if (outError) *outError = "failed to open mtl for writing: " + mtlPath;
    return false;
  }

  PieceExportConfig local = cfg;
  if (local.mtlFileName.empty()) {
    local.mtlFileName = std::filesystem::path(mtlPath).filename().string();
  }

  return WritePiecesObjMtl(objFile, mtlFile, pieces, local, outStats, outError);
}

std::string PieceObjText(const Piece& piece, const PieceExportConfig& cfg)
{
  std::ostringstream obj;
  obj.imbue(std::locale::classic());
  WriteHeader(obj);
  obj << "o " << piece.id << "\n";

  ObjWriter w(obj, nullptr);
  V3 corners[8];
  PieceCorners(piece, cfg, corners);
  w.AddBox(corners);
  return obj.str();
}

bool ExportPieceArchive(const std::string& zipPath, const Report& report, std::string& outError,
                        const PieceArchiveOptions& opt)
{
  outError.clear();

  std::vector<Piece> pieces;
  pieces.reserve(report.piecePlans.size());
  for (const PiecePlan& pp : report.piecePlans) pieces.push_back(pp.piece);

  PieceExportConfig geo = opt.geometry;
  geo.mtlFileName = "pieces.mtl";

  std::ostringstream objText;
  std::ostringstream mtlText;
  PieceExportStats stats;
  std::string err;
  if (!WritePiecesObjMtl(objText, mtlText, pieces, geo, &stats, &err)) {
    outError = err;
    return false;
  }

  JsonValue manifest = JsonValue::MakeObject();
  manifest.set("project_name", JsonValue::MakeString(report.projectName));
  manifest.set("report_hash", JsonValue::MakeString(HexU64(HashReport(report))));
  manifest.set("vertices", JsonValue::MakeNumber(static_cast<double>(stats.vertices)));
  manifest.set("faces", JsonValue::MakeNumber(static_cast<double>(stats.faces)));
  JsonValue list = JsonValue::MakeArray();
  for (const Piece& p : pieces) {
    JsonValue e = JsonValue::MakeObject();
    e.set("piece_id", JsonValue::MakeString(p.id));
    e.set("file", JsonValue::MakeString("pieces/" + p.id + ".obj"));
    e.set("material", JsonValue::MakeString(ReuseMaterialName(p.reuseScore, geo)));
    e.set("box_height_m", JsonValue::MakeNumber(RoundTo(PieceBoxHeight(p.massKg, geo), 4)));
    list.push(std::move(e));
  }
  manifest.set("pieces", std::move(list));

  ZipWriter zip;
  ZipWriterOptions zopt;
  zopt.fixedTimestamp = true;
  if (!zip.open(zipPath, outError, zopt)) return false;

  if (!zip.addFileFromString("pieces.obj", objText.str(), outError)) return false;
  if (!zip.addFileFromString("pieces.mtl", mtlText.str(), outError)) return false;
  for (const Piece& p : pieces) {
    if (!zip.addFileFromString("pieces/" + p.id + ".obj", PieceObjText(p, geo), outError)) return false;
  }
  if (!zip.addFileFromString("manifest.json", JsonStringify(manifest) + "\n", outError)) return false;
  if (opt.includeReport) {
    if (!zip.addFileFromString("report.json", ReportToJsonString(report) + "\n", outError)) return false;
  }

  return zip.finalize(outError);
}

} // namespace rebuild
