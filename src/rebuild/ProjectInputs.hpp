#pragma once

#include "rebuild/Json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rebuild {

// Request model.
//
// RawProjectFields is the untrusted textual form handed over by the upload
// layer (form fields, CLI flags, or a request JSON). NormalizeProjectFields()
// validates it once and produces the immutable ProjectMetadata every stage
// consumes. Normalization never fails: missing fields take documented defaults
// and unparseable values fall back to a safe default plus an InputIssue.

inline constexpr const char* kDefaultProjectName = "Untitled Project";

struct RawProjectFields {
  std::optional<std::string> projectName;
  std::optional<std::string> description;
  std::optional<std::string> transportPlan;
  std::optional<std::string> humanBuilt; // "true"/"false" text
  std::optional<std::string> siteLocation;
  std::optional<std::string> soilProfile;
  std::optional<std::string> hazardProfile;
  std::optional<std::string> demolitionNotes;
  std::optional<std::string> lidarNotes;
};

struct ProjectMetadata {
  std::string projectName = kDefaultProjectName;
  std::string description;
  std::string transportPlan;
  bool humanBuilt = false;
  std::string siteLocation;
  std::string soilProfile;
  std::string hazardProfile;
  std::string demolitionNotes;
  std::string lidarNotes;
};

struct UploadedFile {
  std::string filename;
  std::uint64_t sizeBytes = 0;
  std::string contentType;
};

struct FileManifest {
  std::vector<UploadedFile> assets;
  std::vector<UploadedFile> scans;

  int assetCount() const { return static_cast<int>(assets.size()); }
  int scanCount() const { return static_cast<int>(scans.size()); }
};

// A recoverable input problem (malformed flag/number). Never fatal.
struct InputIssue {
  std::string field;
  std::string message;
};

// Accepts true/false, 1/0, yes/no (case-insensitive, surrounding whitespace
// ignored). Returns false when the text is none of these.
bool ParseHumanBuiltFlag(std::string_view text, bool* out);

ProjectMetadata NormalizeProjectFields(const RawProjectFields& raw, std::vector<InputIssue>* outIssues = nullptr);

// Request JSON:
//   {
//     "project_name": "...", "description": "...", "transport_plan": "...",
//     "human_built": "true" | true, "site_location": "...", "soil_profile": "...",
//     "hazard_profile": "...", "demolition_notes": "...", "lidar_notes": "...",
//     "asset_files": [{"filename": "a.obj", "size": 1024, "content_type": "model/obj"}],
//     "scan_files": [...],
//     "ai_engineering": "..."
//   }
//
// Every key is optional. Non-string metadata values and malformed file entries
// are reported as errors; this is the outer layer, not the pipeline.
struct ProjectRequest {
  RawProjectFields fields;
  FileManifest manifest;
  std::string narrative;
};

bool ParseProjectRequestJson(const JsonValue& root, ProjectRequest& out, std::string& outError);
bool LoadProjectRequestFile(const std::string& path, ProjectRequest& out, std::string& outError);

} // namespace rebuild
