#include "rebuild/ConfigIO.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace rebuild {

namespace {

bool IsFiniteDouble(double v)
{
  return std::isfinite(v) != 0;
}

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }

JsonValue StringList(const std::vector<std::string>& v)
{
  JsonValue arr = JsonValue::MakeArray();
  for (const std::string& s : v) arr.push(JsonValue::MakeString(s));
  return arr;
}

// ---------------------------------------------------------------------------
// Merge helpers: missing => keep, wrong type => error.
// ---------------------------------------------------------------------------

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(dv));
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ApplyStringList(const JsonValue& root, const char* key, std::vector<std::string>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isArray()) {
    err = std::string("expected array of strings for key '") + key + "'";
    return false;
  }
  std::vector<std::string> out;
  out.reserve(v->arrayValue.size());
  for (const JsonValue& e : v->arrayValue) {
    if (!e.isString()) {
      err = std::string("expected array of strings for key '") + key + "'";
      return false;
    }
    out.push_back(e.stringValue);
  }
  io = std::move(out);
  return true;
}

// Looks up an optional sub-object. Returns false only on a type error.
bool GetSection(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = nullptr;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isObject()) {
    err = std::string("expected object for key '") + key + "'";
    return false;
  }
  *out = v;
  return true;
}

// ---------------------------------------------------------------------------
// Per-stage sections.
// ---------------------------------------------------------------------------

JsonValue PieceConfigToJson(const PieceConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("min_pieces", Num(c.minPieces));
  o.set("max_pieces", Num(c.maxPieces));
  o.set("asset_weight", Num(c.assetWeight));
  o.set("scan_weight", Num(c.scanWeight));
  o.set("base_mass_kg", Num(c.baseMassKg));
  o.set("mass_swing_kg", Num(c.massSwingKg));
  o.set("mass_jitter_kg", Num(c.massJitterKg));
  o.set("min_mass_kg", Num(c.minMassKg));
  o.set("max_mass_kg", Num(c.maxMassKg));
  o.set("spacing_m", Num(c.spacingM));
  o.set("spacing_jitter_m", Num(c.spacingJitterM));
  o.set("min_height_m", Num(c.minHeightM));
  o.set("max_height_m", Num(c.maxHeightM));
  o.set("depth_jitter_m", Num(c.depthJitterM));
  o.set("angle_step_deg", Num(c.angleStepDeg));
  o.set("angle_jitter_deg", Num(c.angleJitterDeg));
  o.set("min_waste_reduction", Num(c.minWasteReduction));
  o.set("max_waste_reduction", Num(c.maxWasteReduction));
  o.set("min_reuse_score", Num(c.minReuseScore));
  o.set("max_reuse_score", Num(c.maxReuseScore));
  return o;
}

bool ApplyPieceConfig(const JsonValue& o, PieceConfig& c, std::string& err)
{
  return ApplyI32(o, "min_pieces", c.minPieces, err) && ApplyI32(o, "max_pieces", c.maxPieces, err) &&
         ApplyI32(o, "asset_weight", c.assetWeight, err) && ApplyI32(o, "scan_weight", c.scanWeight, err) &&
         ApplyF64(o, "base_mass_kg", c.baseMassKg, err) && ApplyF64(o, "mass_swing_kg", c.massSwingKg, err) &&
         ApplyF64(o, "mass_jitter_kg", c.massJitterKg, err) && ApplyF64(o, "min_mass_kg", c.minMassKg, err) &&
         ApplyF64(o, "max_mass_kg", c.maxMassKg, err) && ApplyF64(o, "spacing_m", c.spacingM, err) &&
         ApplyF64(o, "spacing_jitter_m", c.spacingJitterM, err) && ApplyF64(o, "min_height_m", c.minHeightM, err) &&
         ApplyF64(o, "max_height_m", c.maxHeightM, err) && ApplyF64(o, "depth_jitter_m", c.depthJitterM, err) &&
         ApplyF64(o, "angle_step_deg", c.angleStepDeg, err) &&
         ApplyF64(o, "angle_jitter_deg", c.angleJitterDeg, err) &&
         ApplyF64(o, "min_waste_reduction", c.minWasteReduction, err) &&
         ApplyF64(o, "max_waste_reduction", c.maxWasteReduction, err) &&
         ApplyF64(o, "min_reuse_score", c.minReuseScore, err) && ApplyF64(o, "max_reuse_score", c.maxReuseScore, err);
}

JsonValue CuttingConfigToJson(const CuttingPlanConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("saw_name", JsonValue::MakeString(c.sawName));
  o.set("conveyor_speed_mps", Num(c.conveyorSpeedMps));
  o.set("conveyor_seconds_per_100kg", Num(c.conveyorSecondsPer100Kg));
  o.set("human_built_bonus", Num(c.humanBuiltBonus));
  o.set("rail_bonus", Num(c.railBonus));
  o.set("max_adjusted_waste_reduction", Num(c.maxAdjustedWasteReduction));
  o.set("verify_tolerance_mm", Num(c.verifyToleranceMm));
  return o;
}

bool ApplyCuttingConfig(const JsonValue& o, CuttingPlanConfig& c, std::string& err)
{
  return ApplyString(o, "saw_name", c.sawName, err) && ApplyF64(o, "conveyor_speed_mps", c.conveyorSpeedMps, err) &&
         ApplyF64(o, "conveyor_seconds_per_100kg", c.conveyorSecondsPer100Kg, err) &&
         ApplyF64(o, "human_built_bonus", c.humanBuiltBonus, err) && ApplyF64(o, "rail_bonus", c.railBonus, err) &&
         ApplyF64(o, "max_adjusted_waste_reduction", c.maxAdjustedWasteReduction, err) &&
         ApplyF64(o, "verify_tolerance_mm", c.verifyToleranceMm, err);
}

JsonValue StructuralConfigToJson(const StructuralConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("stress_coefficient", Num(c.stressCoefficient));
  o.set("safety_numerator", Num(c.safetyNumerator));
  o.set("safety_factor_cap", Num(c.safetyFactorCap));
  o.set("vibration_coefficient", Num(c.vibrationCoefficient));
  o.set("base_load_factor", Num(c.baseLoadFactor));
  o.set("load_factor_jitter", Num(c.loadFactorJitter));
  o.set("text_length_scale", Num(c.textLengthScale));
  o.set("max_text_load", Num(c.maxTextLoad));
  o.set("non_human_built_penalty", Num(c.nonHumanBuiltPenalty));
  o.set("base_shear_margin", Num(c.baseShearMargin));
  o.set("shear_jitter", Num(c.shearJitter));
  o.set("shear_load_sensitivity", Num(c.shearLoadSensitivity));
  o.set("target_safety_factor", Num(c.targetSafetyFactor));
  o.set("vibration_limit", Num(c.vibrationLimit));
  o.set("robust_score", Num(c.robustScore));
  o.set("adequate_score", Num(c.adequateScore));
  o.set("marginal_score", Num(c.marginalScore));
  return o;
}

bool ApplyStructuralConfig(const JsonValue& o, StructuralConfig& c, std::string& err)
{
  return ApplyF64(o, "stress_coefficient", c.stressCoefficient, err) &&
         ApplyF64(o, "safety_numerator", c.safetyNumerator, err) &&
         ApplyF64(o, "safety_factor_cap", c.safetyFactorCap, err) &&
         ApplyF64(o, "vibration_coefficient", c.vibrationCoefficient, err) &&
         ApplyF64(o, "base_load_factor", c.baseLoadFactor, err) &&
         ApplyF64(o, "load_factor_jitter", c.loadFactorJitter, err) &&
         ApplyF64(o, "text_length_scale", c.textLengthScale, err) &&
         ApplyF64(o, "max_text_load", c.maxTextLoad, err) &&
         ApplyF64(o, "non_human_built_penalty", c.nonHumanBuiltPenalty, err) &&
         ApplyF64(o, "base_shear_margin", c.baseShearMargin, err) && ApplyF64(o, "shear_jitter", c.shearJitter, err) &&
         ApplyF64(o, "shear_load_sensitivity", c.shearLoadSensitivity, err) &&
         ApplyF64(o, "target_safety_factor", c.targetSafetyFactor, err) &&
         ApplyF64(o, "vibration_limit", c.vibrationLimit, err) && ApplyF64(o, "robust_score", c.robustScore, err) &&
         ApplyF64(o, "adequate_score", c.adequateScore, err) && ApplyF64(o, "marginal_score", c.marginalScore, err);
}

JsonValue FiniteElementConfigToJson(const FiniteElementConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("node_count", Num(c.nodeCount));
  o.set("load_start", Num(c.loadStart));
  o.set("load_end", Num(c.loadEnd));
  o.set("load_noise", Num(c.loadNoise));
  o.set("base_stress_mpa", Num(c.baseStressMpa));
  o.set("reference_mass_kg", Num(c.referenceMassKg));
  o.set("allowable_stress_mpa", Num(c.allowableStressMpa));
  o.set("displacement_per_load_mm", Num(c.displacementPerLoadMm));
  o.set("soil_displacement_share", Num(c.soilDisplacementShare));
  o.set("soil_text_scale", Num(c.soilTextScale));
  return o;
}

bool ApplyFiniteElementConfig(const JsonValue& o, FiniteElementConfig& c, std::string& err)
{
  return ApplyI32(o, "node_count", c.nodeCount, err) && ApplyF64(o, "load_start", c.loadStart, err) &&
         ApplyF64(o, "load_end", c.loadEnd, err) && ApplyF64(o, "load_noise", c.loadNoise, err) &&
         ApplyF64(o, "base_stress_mpa", c.baseStressMpa, err) &&
         ApplyF64(o, "reference_mass_kg", c.referenceMassKg, err) &&
         ApplyF64(o, "allowable_stress_mpa", c.allowableStressMpa, err) &&
         ApplyF64(o, "displacement_per_load_mm", c.displacementPerLoadMm, err) &&
         ApplyF64(o, "soil_displacement_share", c.soilDisplacementShare, err) &&
         ApplyF64(o, "soil_text_scale", c.soilTextScale, err);
}

JsonValue HazardRuleToJson(const HazardRule& r)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("category", JsonValue::MakeString(r.category));
  o.set("hazard_keywords", StringList(r.hazardKeywords));
  o.set("soil_keywords", StringList(r.soilKeywords));
  o.set("site_keywords", StringList(r.siteKeywords));
  o.set("calm_text", JsonValue::MakeString(r.calmText));
  o.set("alert_text", JsonValue::MakeString(r.alertText));
  return o;
}

bool ParseHazardRules(const JsonValue& arr, std::vector<HazardRule>& out, std::string& err)
{
  if (!arr.isArray()) {
    err = "expected array for key 'rules'";
    return false;
  }
  std::vector<HazardRule> rules;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& e = arr.arrayValue[i];
    const std::string where = "disaster.rules[" + std::to_string(i) + "]";
    if (!e.isObject()) {
      err = where + ": expected object";
      return false;
    }
    HazardRule r;
    if (!ApplyString(e, "category", r.category, err) || !ApplyStringList(e, "hazard_keywords", r.hazardKeywords, err) ||
        !ApplyStringList(e, "soil_keywords", r.soilKeywords, err) ||
        !ApplyStringList(e, "site_keywords", r.siteKeywords, err) || !ApplyString(e, "calm_text", r.calmText, err) ||
        !ApplyString(e, "alert_text", r.alertText, err)) {
      err = where + ": " + err;
      return false;
    }
    if (r.category.empty()) {
      err = where + ": missing 'category'";
      return false;
    }
    rules.push_back(std::move(r));
  }
  out = std::move(rules);
  return true;
}

JsonValue DisasterConfigToJson(const DisasterConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("base_min", Num(c.baseMin));
  o.set("base_max", Num(c.baseMax));
  o.set("keyword_boost", Num(c.keywordBoost));
  o.set("soil_boost", Num(c.soilBoost));
  o.set("site_boost", Num(c.siteBoost));
  o.set("alert_severity", Num(c.alertSeverity));
  o.set("moderate_at", Num(c.moderateAt));
  o.set("high_at", Num(c.highAt));
  o.set("severe_at", Num(c.severeAt));
  JsonValue rules = JsonValue::MakeArray();
  for (const HazardRule& r : c.rules) rules.push(HazardRuleToJson(r));
  o.set("rules", std::move(rules));
  return o;
}

bool ApplyDisasterConfig(const JsonValue& o, DisasterConfig& c, std::string& err)
{
  if (!(ApplyF64(o, "base_min", c.baseMin, err) && ApplyF64(o, "base_max", c.baseMax, err) &&
        ApplyF64(o, "keyword_boost", c.keywordBoost, err) && ApplyF64(o, "soil_boost", c.soilBoost, err) &&
        ApplyF64(o, "site_boost", c.siteBoost, err) && ApplyF64(o, "alert_severity", c.alertSeverity, err) &&
        ApplyF64(o, "moderate_at", c.moderateAt, err) && ApplyF64(o, "high_at", c.highAt, err) &&
        ApplyF64(o, "severe_at", c.severeAt, err))) {
    return false;
  }
  if (const JsonValue* rules = FindJsonMember(o, "rules")) {
    if (!ParseHazardRules(*rules, c.rules, err)) return false;
  }
  return true;
}

JsonValue EnvironmentalConfigToJson(const EnvironmentalConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("base_noise_db", Num(c.baseNoiseDb));
  o.set("noise_per_piece_db", Num(c.noisePerPieceDb));
  o.set("noise_per_leg_db", Num(c.noisePerLegDb));
  o.set("transport_chars_per_db", Num(c.transportCharsPerDb));
  o.set("max_transport_text_db", Num(c.maxTransportTextDb));
  o.set("noise_jitter_db", Num(c.noiseJitterDb));
  o.set("truck_multiplier", Num(c.truckMultiplier));
  o.set("max_noise_db", Num(c.maxNoiseDb));
  o.set("quiet_db", Num(c.quietDb));
  o.set("base_light_db", Num(c.baseLightDb));
  o.set("rural_density", Num(c.ruralDensity));
  o.set("urban_density", Num(c.urbanDensity));
  o.set("light_per_piece_db", Num(c.lightPerPieceDb));
  o.set("max_light_db", Num(c.maxLightDb));
  o.set("flood_peak_multiplier", Num(c.floodPeakMultiplier));
  o.set("max_peak_db", Num(c.maxPeakDb));
  o.set("base_lux", Num(c.baseLux));
  o.set("historic_buffer", Num(c.historicBuffer));
  o.set("lux_per_piece", Num(c.luxPerPiece));
  o.set("max_lux", Num(c.maxLux));
  o.set("glare_divisor", Num(c.glareDivisor));
  o.set("truck_keywords", StringList(c.truckKeywords));
  o.set("rural_keywords", StringList(c.ruralKeywords));
  o.set("historic_keywords", StringList(c.historicKeywords));
  o.set("flood_keywords", StringList(c.floodKeywords));
  o.set("leg_separators", StringList(c.legSeparators));
  return o;
}

bool ApplyEnvironmentalConfig(const JsonValue& o, EnvironmentalConfig& c, std::string& err)
{
  return ApplyF64(o, "base_noise_db", c.baseNoiseDb, err) &&
         ApplyF64(o, "noise_per_piece_db", c.noisePerPieceDb, err) &&
         ApplyF64(o, "noise_per_leg_db", c.noisePerLegDb, err) &&
         ApplyF64(o, "transport_chars_per_db", c.transportCharsPerDb, err) &&
         ApplyF64(o, "max_transport_text_db", c.maxTransportTextDb, err) &&
         ApplyF64(o, "noise_jitter_db", c.noiseJitterDb, err) &&
         ApplyF64(o, "truck_multiplier", c.truckMultiplier, err) && ApplyF64(o, "max_noise_db", c.maxNoiseDb, err) &&
         ApplyF64(o, "quiet_db", c.quietDb, err) && ApplyF64(o, "base_light_db", c.baseLightDb, err) &&
         ApplyF64(o, "rural_density", c.ruralDensity, err) && ApplyF64(o, "urban_density", c.urbanDensity, err) &&
         ApplyF64(o, "light_per_piece_db", c.lightPerPieceDb, err) &&
         ApplyF64(o, "max_light_db", c.maxLightDb, err) &&
         ApplyF64(o, "flood_peak_multiplier", c.floodPeakMultiplier, err) &&
         ApplyF64(o, "max_peak_db", c.maxPeakDb, err) && ApplyF64(o, "base_lux", c.baseLux, err) &&
         ApplyF64(o, "historic_buffer", c.historicBuffer, err) && ApplyF64(o, "lux_per_piece", c.luxPerPiece, err) &&
         ApplyF64(o, "max_lux", c.maxLux, err) && ApplyF64(o, "glare_divisor", c.glareDivisor, err) &&
         ApplyStringList(o, "truck_keywords", c.truckKeywords, err) &&
         ApplyStringList(o, "rural_keywords", c.ruralKeywords, err) &&
         ApplyStringList(o, "historic_keywords", c.historicKeywords, err) &&
         ApplyStringList(o, "flood_keywords", c.floodKeywords, err) &&
         ApplyStringList(o, "leg_separators", c.legSeparators, err);
}

JsonValue ComponentRulesToJson(const std::vector<ComponentRule>& rules)
{
  JsonValue arr = JsonValue::MakeArray();
  for (const ComponentRule& r : rules) {
    JsonValue o = JsonValue::MakeObject();
    o.set("keyword", JsonValue::MakeString(r.keyword));
    o.set("component", JsonValue::MakeString(r.component));
    o.set("group", JsonValue::MakeString(r.group));
    arr.push(std::move(o));
  }
  return arr;
}

bool ApplyComponentRules(const JsonValue& root, const char* key, std::vector<ComponentRule>& io, std::string& err)
{
  const JsonValue* arr = FindJsonMember(root, key);
  if (!arr) return true;
  if (!arr->isArray()) {
    err = std::string("expected array for key '") + key + "'";
    return false;
  }
  std::vector<ComponentRule> rules;
  for (std::size_t i = 0; i < arr->arrayValue.size(); ++i) {
    const JsonValue& e = arr->arrayValue[i];
    const std::string where = std::string("feasibility.") + key + "[" + std::to_string(i) + "]";
    if (!e.isObject()) {
      err = where + ": expected object";
      return false;
    }
    ComponentRule r;
    if (!ApplyString(e, "keyword", r.keyword, err) || !ApplyString(e, "component", r.component, err) ||
        !ApplyString(e, "group", r.group, err)) {
      err = where + ": " + err;
      return false;
    }
    if (r.keyword.empty() || r.component.empty()) {
      err = where + ": 'keyword' and 'component' are required";
      return false;
    }
    rules.push_back(std::move(r));
  }
  io = std::move(rules);
  return true;
}

JsonValue FeasibilityConfigToJson(const FeasibilityConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("ratio_base_weight", Num(c.ratioBaseWeight));
  o.set("ratio_weight", Num(c.ratioWeight));
  o.set("condition_jitter", Num(c.conditionJitter));
  o.set("rail_factor", Num(c.railFactor));
  o.set("seismic_factor", Num(c.seismicFactor));
  o.set("max_reused_pct", Num(c.maxReusedPct));
  o.set("roof_share_declared", Num(c.roofShareDeclared));
  o.set("roof_share_default", Num(c.roofShareDefault));
  o.set("max_roof_new_pct", Num(c.maxRoofNewPct));
  o.set("volume_per_piece_m3", Num(c.volumePerPieceM3));
  o.set("conveyor_buffer_below_pct", Num(c.conveyorBufferBelowPct));
  o.set("rail_keywords", StringList(c.railKeywords));
  o.set("seismic_keywords", StringList(c.seismicKeywords));
  o.set("flood_keywords", StringList(c.floodKeywords));
  o.set("reusable_rules", ComponentRulesToJson(c.reusableRules));
  o.set("needs_new_rules", ComponentRulesToJson(c.needsNewRules));
  return o;
}

bool ApplyFeasibilityConfig(const JsonValue& o, FeasibilityConfig& c, std::string& err)
{
  return ApplyF64(o, "ratio_base_weight", c.ratioBaseWeight, err) &&
         ApplyF64(o, "ratio_weight", c.ratioWeight, err) &&
         ApplyF64(o, "condition_jitter", c.conditionJitter, err) && ApplyF64(o, "rail_factor", c.railFactor, err) &&
         ApplyF64(o, "seismic_factor", c.seismicFactor, err) && ApplyF64(o, "max_reused_pct", c.maxReusedPct, err) &&
         ApplyF64(o, "roof_share_declared", c.roofShareDeclared, err) &&
         ApplyF64(o, "roof_share_default", c.roofShareDefault, err) &&
         ApplyF64(o, "max_roof_new_pct", c.maxRoofNewPct, err) &&
         ApplyF64(o, "volume_per_piece_m3", c.volumePerPieceM3, err) &&
         ApplyF64(o, "conveyor_buffer_below_pct", c.conveyorBufferBelowPct, err) &&
         ApplyStringList(o, "rail_keywords", c.railKeywords, err) &&
         ApplyStringList(o, "seismic_keywords", c.seismicKeywords, err) &&
         ApplyStringList(o, "flood_keywords", c.floodKeywords, err) &&
         ApplyComponentRules(o, "reusable_rules", c.reusableRules, err) &&
         ApplyComponentRules(o, "needs_new_rules", c.needsNewRules, err);
}

JsonValue CostCarbonConfigToJson(const CostCarbonConfig& c)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("fixed_cost", Num(c.fixedCost));
  o.set("cost_per_kg", Num(c.costPerKg));
  o.set("savings_per_kg", Num(c.savingsPerKg));
  o.set("max_savings_share", Num(c.maxSavingsShare));
  o.set("co2_tons_per_kg", Num(c.co2TonsPerKg));
  o.set("value_per_kg", Num(c.valuePerKg));
  return o;
}

bool ApplyCostCarbonConfig(const JsonValue& o, CostCarbonConfig& c, std::string& err)
{
  return ApplyF64(o, "fixed_cost", c.fixedCost, err) && ApplyF64(o, "cost_per_kg", c.costPerKg, err) &&
         ApplyF64(o, "savings_per_kg", c.savingsPerKg, err) &&
         ApplyF64(o, "max_savings_share", c.maxSavingsShare, err) &&
         ApplyF64(o, "co2_tons_per_kg", c.co2TonsPerKg, err) && ApplyF64(o, "value_per_kg", c.valuePerKg, err);
}

} // namespace

JsonValue PipelineConfigToJsonValue(const PipelineConfig& cfg)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("threads", Num(cfg.threads));
  root.set("pieces", PieceConfigToJson(cfg.pieces));
  root.set("cutting", CuttingConfigToJson(cfg.cutting));
  root.set("structural", StructuralConfigToJson(cfg.structural));
  root.set("finite_element", FiniteElementConfigToJson(cfg.finiteElement));
  root.set("disaster", DisasterConfigToJson(cfg.disaster));
  root.set("environmental", EnvironmentalConfigToJson(cfg.environmental));
  root.set("feasibility", FeasibilityConfigToJson(cfg.feasibility));
  root.set("cost_carbon", CostCarbonConfigToJson(cfg.costCarbon));
  return root;
}

std::string PipelineConfigToJson(const PipelineConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = true;
  opt.indent = indentSpaces < 0 ? 0 : indentSpaces;
  return JsonStringify(PipelineConfigToJsonValue(cfg), opt) + "\n";
}

bool ApplyPipelineConfigJson(const JsonValue& root, PipelineConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "PipelineConfig JSON must be an object";
    return false;
  }

  // Work on a copy so a failed merge leaves ioCfg untouched.
  PipelineConfig cfg = ioCfg;
  std::string err;

  if (!ApplyI32(root, "threads", cfg.threads, err)) {
    outError = err;
    return false;
  }

  struct Section {
    const char* key;
    bool (*apply)(const JsonValue&, PipelineConfig&, std::string&);
  };

  static const Section kSections[] = {
      {"pieces", [](const JsonValue& o, PipelineConfig& c, std::string& e) { return ApplyPieceConfig(o, c.pieces, e); }},
      {"cutting",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) { return ApplyCuttingConfig(o, c.cutting, e); }},
      {"structural",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) { return ApplyStructuralConfig(o, c.structural, e); }},
      {"finite_element",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) {
         return ApplyFiniteElementConfig(o, c.finiteElement, e);
       }},
      {"disaster",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) { return ApplyDisasterConfig(o, c.disaster, e); }},
      {"environmental",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) {
         return ApplyEnvironmentalConfig(o, c.environmental, e);
       }},
      {"feasibility",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) {
         return ApplyFeasibilityConfig(o, c.feasibility, e);
       }},
      {"cost_carbon",
       [](const JsonValue& o, PipelineConfig& c, std::string& e) { return ApplyCostCarbonConfig(o, c.costCarbon, e); }},
  };

  for (const Section& s : kSections) {
    const JsonValue* section = nullptr;
    if (!GetSection(root, s.key, &section, err)) {
      outError = err;
      return false;
    }
    if (!section) continue;
    if (!s.apply(*section, cfg, err)) {
      outError = std::string(s.key) + ": " + err;
      return false;
    }
  }

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool WritePipelineConfigJsonFile(const std::string& path, const PipelineConfig& cfg, std::string& outError,
                                 int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = true;
  opt.indent = indentSpaces < 0 ? 0 : indentSpaces;
  if (!WriteJsonFile(path, PipelineConfigToJsonValue(cfg), outError, opt)) return false;
  outError.clear();
  return true;
}

bool LoadPipelineConfigJsonFile(const std::string& path, PipelineConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  std::string err;
  if (!LoadJsonFile(path, root, err)) {
    outError = err;
    return false;
  }

  if (!ApplyPipelineConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }

  outError.clear();
  return true;
}

} // namespace rebuild
