#include "cli/CliParse.hpp"

#include "rebuild/ConfigIO.hpp"
#include "rebuild/Env.hpp"
#include "rebuild/Hash.hpp"
#include "rebuild/LogTee.hpp"
#include "rebuild/PieceExport.hpp"
#include "rebuild/Pipeline.hpp"
#include "rebuild/ReportJson.hpp"
#include "rebuild/Version.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

void PrintHelp()
{
  std::cout
      << "rebuild_cli (headless demolition/reuse analysis)\n\n"
      << "Usage:\n"
      << "  rebuild_cli [--request <request.json>] [--config <config.json>] [--out <report.json>]\n"
      << "              [--project-name <text>] [--description <text>] [--transport-plan <text>]\n"
      << "              [--human-built <true|false>] [--site-location <text>] [--soil-profile <text>]\n"
      << "              [--hazard-profile <text>] [--demolition-notes <text>] [--lidar-notes <text>]\n"
      << "              [--asset <name[:bytes]>]... [--scan <name[:bytes]>]...\n"
      << "              [--assets <a,b:123,...>] [--scans <a,b,...>] [--asset-dir <dir>] [--scan-dir <dir>]\n"
      << "              [--narrative <file>] [--threads <N>] [--fea-nodes <0|1>]\n"
      << "              [--export-obj <pieces.obj>] [--export-zip <pieces.zip>]\n"
      << "              [--log <file>] [--log-keep <N>] [--print-config] [--version]\n\n"
      << "Notes:\n"
      << "  - Fields from --request are applied first; individual flags override them.\n"
      << "  - --config merges JSON overrides into the default config. Without it, the\n"
      << "    REBUILD_CONFIG environment variable names the config file (if set).\n"
      << "  - --threads 0 uses the hardware concurrency. Output is identical for any N.\n"
      << "  - Without --out the report JSON is printed to stdout and status goes to stderr.\n"
      << "  - A stable 64-bit hash of the report is printed for regression checks.\n";
}

bool ReadTextFile(const std::string& path, std::string& out, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (!f.good() && !f.eof()) {
    outError = "failed to read file: " + path;
    return false;
  }
  out = oss.str();
  return true;
}

// Regular files directly under `dir`, sorted by name so the manifest order does
// not depend on the filesystem's enumeration order.
bool ListDirectoryFiles(const std::string& dir, std::vector<rebuild::UploadedFile>& out, std::string& outError)
{
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    outError = "failed to list directory '" + dir + "': " + ec.message();
    return false;
  }

  std::vector<rebuild::UploadedFile> found;
  for (const std::filesystem::directory_entry& e : it) {
    if (!e.is_regular_file(ec) || ec) continue;
    rebuild::UploadedFile f;
    f.filename = e.path().filename().string();
    const std::uintmax_t sz = e.file_size(ec);
    f.sizeBytes = ec ? 0 : static_cast<std::uint64_t>(sz);
    found.push_back(std::move(f));
  }

  std::sort(found.begin(), found.end(),
            [](const rebuild::UploadedFile& a, const rebuild::UploadedFile& b) { return a.filename < b.filename; });
  out.insert(out.end(), found.begin(), found.end());
  return true;
}

} // namespace

int main(int argc, char** argv)
{
  using namespace rebuild;

  std::string requestPath;
  std::string configPath;
  std::string outJson;
  std::string objPath;
  std::string zipPath;
  std::string narrativePath;
  std::string logPath;
  int logKeep = 3;
  bool printConfig = false;
  bool includeFeaNodes = true;
  std::optional<int> threads;

  RawProjectFields fieldOverrides;
  std::vector<UploadedFile> extraAssets;
  std::vector<UploadedFile> extraScans;
  std::vector<std::string> assetDirs;
  std::vector<std::string> scanDirs;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  auto addFileSpec = [](const std::string& spec, std::vector<UploadedFile>& dst) -> bool {
    UploadedFile f;
    if (!cli::ParseFileSpec(spec, &f.filename, &f.sizeBytes)) return false;
    dst.push_back(std::move(f));
    return true;
  };

  struct TextFlag {
    const char* name;
    std::optional<std::string> RawProjectFields::*field;
  };
  const TextFlag textFlags[] = {
      {"--project-name", &RawProjectFields::projectName},
      {"--description", &RawProjectFields::description},
      {"--transport-plan", &RawProjectFields::transportPlan},
      {"--human-built", &RawProjectFields::humanBuilt},
      {"--site-location", &RawProjectFields::siteLocation},
      {"--soil-profile", &RawProjectFields::soilProfile},
      {"--hazard-profile", &RawProjectFields::hazardProfile},
      {"--demolition-notes", &RawProjectFields::demolitionNotes},
      {"--lidar-notes", &RawProjectFields::lidarNotes},
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    const TextFlag* textFlag = nullptr;
    for (const TextFlag& tf : textFlags) {
      if (arg == tf.name) {
        textFlag = &tf;
        break;
      }
    }

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--version") {
      std::cout << "rebuild_cli " << FullVersionString() << "\n";
      return 0;
    } else if (textFlag) {
      if (!requireValue(i, val)) {
        std::cerr << arg << " requires a value\n";
        return 2;
      }
      fieldOverrides.*(textFlag->field) = val;
    } else if (arg == "--request") {
      if (!requireValue(i, val)) {
        std::cerr << "--request requires a path\n";
        return 2;
      }
      requestPath = val;
    } else if (arg == "--config") {
      if (!requireValue(i, val)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
      configPath = val;
    } else if (arg == "--out" || arg == "--json") {
      if (!requireValue(i, val)) {
        std::cerr << arg << " requires a path\n";
        return 2;
      }
      outJson = val;
    } else if (arg == "--asset" || arg == "--scan") {
      if (!requireValue(i, val) || !addFileSpec(val, (arg == "--asset") ? extraAssets : extraScans)) {
        std::cerr << arg << " requires <name[:bytes]>\n";
        return 2;
      }
    } else if (arg == "--assets" || arg == "--scans") {
      if (!requireValue(i, val)) {
        std::cerr << arg << " requires a comma-separated list\n";
        return 2;
      }
      for (const std::string& spec : cli::SplitCommaList(val)) {
        if (!addFileSpec(spec, (arg == "--assets") ? extraAssets : extraScans)) {
          std::cerr << arg << ": invalid file spec '" << spec << "'\n";
          return 2;
        }
      }
    } else if (arg == "--asset-dir" || arg == "--scan-dir") {
      if (!requireValue(i, val)) {
        std::cerr << arg << " requires a directory\n";
        return 2;
      }
      ((arg == "--asset-dir") ? assetDirs : scanDirs).push_back(val);
    } else if (arg == "--narrative") {
      if (!requireValue(i, val)) {
        std::cerr << "--narrative requires a path\n";
        return 2;
      }
      narrativePath = val;
    } else if (arg == "--threads") {
      int n = 1;
      if (!requireValue(i, val) || !cli::ParseI32(val, &n) || n < 0) {
        std::cerr << "--threads requires a non-negative integer\n";
        return 2;
      }
      threads = n;
    } else if (arg == "--fea-nodes") {
      if (!requireValue(i, val) || !cli::ParseBool01(val, &includeFeaNodes)) {
        std::cerr << "--fea-nodes requires 0 or 1\n";
        return 2;
      }
    } else if (arg == "--export-obj") {
      if (!requireValue(i, val)) {
        std::cerr << "--export-obj requires a path\n";
        return 2;
      }
      objPath = val;
    } else if (arg == "--export-zip") {
      if (!requireValue(i, val)) {
        std::cerr << "--export-zip requires a path\n";
        return 2;
      }
      zipPath = val;
    } else if (arg == "--log") {
      if (!requireValue(i, val)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
      logPath = val;
    } else if (arg == "--log-keep") {
      if (!requireValue(i, val) || !cli::ParseI32(val, &logKeep) || logKeep < 0) {
        std::cerr << "--log-keep requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--print-config") {
      printConfig = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n\n";
      PrintHelp();
      return 2;
    }
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions lo;
    lo.path = logPath;
    lo.keepFiles = logKeep;
    std::string err;
    if (!logTee.start(lo, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 1;
    }
  }

  // --- Config: defaults <- REBUILD_CONFIG or --config <- --threads ---
  PipelineConfig cfg{};
  if (configPath.empty()) {
    if (const std::optional<std::string> envPath = GetEnvVar(kConfigEnvVar)) {
      configPath = *envPath;
    }
  }
  if (!configPath.empty()) {
    std::string err;
    if (!LoadPipelineConfigJsonFile(configPath, cfg, err)) {
      std::cerr << "Failed to load config '" << configPath << "': " << err << "\n";
      return 2;
    }
  }
  if (threads) cfg.threads = *threads;

  if (printConfig) {
    std::cout << PipelineConfigToJson(cfg);
    return 0;
  }

  // --- Request: file <- flags ---
  ProjectRequest request;
  if (!requestPath.empty()) {
    std::string err;
    if (!LoadProjectRequestFile(requestPath, request, err)) {
      std::cerr << "Failed to load request '" << requestPath << "': " << err << "\n";
      return 2;
    }
  }

  for (const TextFlag& tf : textFlags) {
    const std::optional<std::string>& v = fieldOverrides.*(tf.field);
    if (v) request.fields.*(tf.field) = *v;
  }

  for (const std::string& dir : assetDirs) {
    std::string err;
    if (!ListDirectoryFiles(dir, request.manifest.assets, err)) {
      std::cerr << err << "\n";
      return 1;
    }
  }
  for (const std::string& dir : scanDirs) {
    std::string err;
    if (!ListDirectoryFiles(dir, request.manifest.scans, err)) {
      std::cerr << err << "\n";
      return 1;
    }
  }
  request.manifest.assets.insert(request.manifest.assets.end(), extraAssets.begin(), extraAssets.end());
  request.manifest.scans.insert(request.manifest.scans.end(), extraScans.begin(), extraScans.end());

  if (!narrativePath.empty()) {
    std::string err;
    if (!ReadTextFile(narrativePath, request.narrative, err)) {
      std::cerr << err << "\n";
      return 1;
    }
  }

  // JSON on stdout must stay parseable, so status lines move to stderr.
  std::ostream& status = outJson.empty() ? std::cerr : std::cout;

  std::vector<InputIssue> issues;
  const Report report = RunPipelineRequest(request, cfg, &issues);
  for (const InputIssue& issue : issues) {
    std::cerr << "warning: " << issue.field << ": " << issue.message << "\n";
  }

  if (outJson.empty()) {
    std::cout << JsonStringify(ReportToJson(report, includeFeaNodes)) << "\n";
  } else {
    cli::EnsureParentDir(outJson);
    std::string err;
    if (!WriteJsonFile(outJson, ReportToJson(report, includeFeaNodes), err)) {
      std::cerr << "Failed to write report: " << err << "\n";
      return 1;
    }
    status << "wrote " << outJson << "\n";
  }

  if (!objPath.empty()) {
    std::filesystem::path mtl = objPath;
    mtl.replace_extension(".mtl");
    cli::EnsureParentDir(objPath);

    std::vector<Piece> pieces;
    pieces.reserve(report.piecePlans.size());
    for (const PiecePlan& pp : report.piecePlans) pieces.push_back(pp.piece);

    PieceExportStats stats;
    std::string err;
    if (!ExportPiecesObjMtl(objPath, mtl.string(), pieces, PieceExportConfig{}, &stats, &err)) {
      std::cerr << "Failed to export OBJ: " << err << "\n";
      return 1;
    }
    status << "wrote " << objPath << " (" << stats.vertices << " vertices, " << stats.faces << " faces)\n";
  }

  if (!zipPath.empty()) {
    cli::EnsureParentDir(zipPath);
    std::string err;
    if (!ExportPieceArchive(zipPath, report, err)) {
      std::cerr << "Failed to write archive: " << err << "\n";
      return 1;
    }
    status << "wrote " << zipPath << "\n";
  }

  status << "pieces: " << report.piecePlans.size() << "\n";
  status << "report_hash: " << HexU64(HashReport(report)) << "\n";
  return 0;
}
