#include "rebuild/ProjectInputs.hpp"

#include "rebuild/Text.hpp"

#include <cmath>
#include <limits>

namespace rebuild {

namespace {

std::string TakeText(const std::optional<std::string>& v)
{
  return v ? *v : std::string();
}

bool ReadOptionalString(const JsonValue& root, const char* key, std::optional<std::string>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v || v->isNull()) return true; // missing => keep
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ReadFileList(const JsonValue& root, const char* key, std::vector<UploadedFile>& out, std::string& err)
{
  const JsonValue* arr = FindJsonMember(root, key);
  if (!arr || arr->isNull()) return true;
  if (!arr->isArray()) {
    err = std::string("expected array for key '") + key + "'";
    return false;
  }

  for (std::size_t i = 0; i < arr->arrayValue.size(); ++i) {
    const JsonValue& item = arr->arrayValue[i];
    UploadedFile f;

    // Bare strings are accepted as filenames with unknown size.
    if (item.isString()) {
      f.filename = item.stringValue;
      out.push_back(std::move(f));
      continue;
    }
    if (!item.isObject()) {
      err = std::string(key) + "[" + std::to_string(i) + "]: expected object or string";
      return false;
    }

    const JsonValue* name = FindJsonMember(item, "filename");
    if (!name) name = FindJsonMember(item, "name");
    if (!name || !name->isString()) {
      err = std::string(key) + "[" + std::to_string(i) + "]: missing string 'filename'";
      return false;
    }
    f.filename = name->stringValue;

    if (const JsonValue* size = FindJsonMember(item, "size")) {
      if (!size->isNumber() || !std::isfinite(size->numberValue) || size->numberValue < 0.0 ||
          size->numberValue > static_cast<double>(std::numeric_limits<std::uint64_t>::max() / 2)) {
        err = std::string(key) + "[" + std::to_string(i) + "]: 'size' must be a non-negative number";
        return false;
      }
      f.sizeBytes = static_cast<std::uint64_t>(size->numberValue);
    }

    if (const JsonValue* ct = FindJsonMember(item, "content_type")) {
      if (!ct->isString()) {
        err = std::string(key) + "[" + std::to_string(i) + "]: 'content_type' must be a string";
        return false;
      }
      f.contentType = ct->stringValue;
    }

    out.push_back(std::move(f));
  }
  return true;
}

} // namespace

bool ParseHumanBuiltFlag(std::string_view text, bool* out)
{
  if (!out) return false;
  const std::string s = ToLowerAscii(TrimAscii(text));
  if (s == "true" || s == "1" || s == "yes") {
    *out = true;
    return true;
  }
  if (s == "false" || s == "0" || s == "no") {
    *out = false;
    return true;
  }
  return false;
}

ProjectMetadata NormalizeProjectFields(const RawProjectFields& raw, std::vector<InputIssue>* outIssues)
{
  ProjectMetadata m;

  if (raw.projectName) {
    const std::string_view trimmed = TrimAscii(*raw.projectName);
    if (!trimmed.empty()) m.projectName = std::string(trimmed);
  }

  m.description = TakeText(raw.description);
  m.transportPlan = TakeText(raw.transportPlan);
  m.siteLocation = TakeText(raw.siteLocation);
  m.soilProfile = TakeText(raw.soilProfile);
  m.hazardProfile = TakeText(raw.hazardProfile);
  m.demolitionNotes = TakeText(raw.demolitionNotes);
  m.lidarNotes = TakeText(raw.lidarNotes);

  m.humanBuilt = false;
  if (raw.humanBuilt && !TrimAscii(*raw.humanBuilt).empty()) {
    bool b = false;
    if (ParseHumanBuiltFlag(*raw.humanBuilt, &b)) {
      m.humanBuilt = b;
    } else if (outIssues) {
      outIssues->push_back(InputIssue{"human_built", "unrecognized boolean '" + *raw.humanBuilt +
                                                         "', defaulting to false"});
    }
  }

  return m;
}

bool ParseProjectRequestJson(const JsonValue& root, ProjectRequest& out, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "project request must be a JSON object";
    return false;
  }

  RawProjectFields& f = out.fields;
  if (!ReadOptionalString(root, "project_name", f.projectName, outError)) return false;
  if (!ReadOptionalString(root, "description", f.description, outError)) return false;
  if (!ReadOptionalString(root, "transport_plan", f.transportPlan, outError)) return false;
  if (!ReadOptionalString(root, "site_location", f.siteLocation, outError)) return false;
  if (!ReadOptionalString(root, "soil_profile", f.soilProfile, outError)) return false;
  if (!ReadOptionalString(root, "hazard_profile", f.hazardProfile, outError)) return false;
  if (!ReadOptionalString(root, "demolition_notes", f.demolitionNotes, outError)) return false;
  if (!ReadOptionalString(root, "lidar_notes", f.lidarNotes, outError)) return false;

  // human_built is accepted either as a JSON boolean or as text; text is
  // validated later by NormalizeProjectFields so a bad value only warns.
  if (const JsonValue* hb = FindJsonMember(root, "human_built")) {
    if (hb->isBool()) {
      f.humanBuilt = hb->boolValue ? "true" : "false";
    } else if (hb->isString()) {
      f.humanBuilt = hb->stringValue;
    } else if (!hb->isNull()) {
      outError = "expected boolean or string for key 'human_built'";
      return false;
    }
  }

  if (!ReadFileList(root, "asset_files", out.manifest.assets, outError)) return false;
  if (!ReadFileList(root, "scan_files", out.manifest.scans, outError)) return false;

  std::optional<std::string> narrative;
  if (!ReadOptionalString(root, "ai_engineering", narrative, outError)) return false;
  if (narrative) out.narrative = *narrative;

  return true;
}

bool LoadProjectRequestFile(const std::string& path, ProjectRequest& out, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;
  if (!ParseProjectRequestJson(root, out, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace rebuild
