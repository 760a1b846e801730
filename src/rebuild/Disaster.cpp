#include "rebuild/Disaster.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Hash.hpp"
#include "rebuild/Random.hpp"
#include "rebuild/Text.hpp"

namespace rebuild {

namespace {

bool AnyLowered(const std::string& haystackLower, const std::vector<std::string>& keywords)
{
  for (const std::string& k : keywords) {
    if (ContainsLowered(haystackLower, k)) return true;
  }
  return false;
}

} // namespace

std::vector<HazardRule> DefaultHazardRules()
{
  std::vector<HazardRule> r;

  r.push_back(HazardRule{"flood",
                         {"flood", "storm surge", "inundation", "tsunami", "high water"},
                         {"clay", "silt", "alluvial", "saturated", "peat"},
                         {"coast", "river", "delta", "harbor", "harbour", "estuary", "lowland"},
                         "1.2m freeboard recommended",
                         "Raise plinth by 0.8m; relocate electrical rooms"});

  r.push_back(HazardRule{"wind",
                         {"storm", "hurricane", "typhoon", "cyclone", "tornado", "wind"},
                         {},
                         {"coast", "ridge", "exposed", "hilltop"},
                         "Vortex shedding mitigated with brise-soleil",
                         "Add tuned mass damper; double facade anchors"});

  r.push_back(HazardRule{"seismic",
                         {"earthquake", "seismic", "quake", "tremor"},
                         {"liquefaction", "loose sand", "fill", "reclaimed"},
                         {"fault", "seismic zone"},
                         "Peak drift 0.9% (within code limits)",
                         "Base isolation recommended; predicted drift 1.7%"});

  r.push_back(HazardRule{"fire",
                         {"fire", "wildfire", "bushfire"},
                         {"peat"},
                         {"forest", "woodland", "bush", "arid"},
                         "Standard compartmentation adequate",
                         "Specify intumescent coating on reused steel; add ember screens"});

  r.push_back(HazardRule{"landslide",
                         {"landslide", "mudslide", "rockfall", "slope failure"},
                         {"clay", "colluvium", "expansive", "shale"},
                         {"hill", "slope", "mountain", "cliff"},
                         "Slope stable under current grading",
                         "Install soil nails and drainage before demolition"});
  return r;
}

DisasterConfig DefaultDisasterConfig()
{
  DisasterConfig cfg;
  cfg.rules = DefaultHazardRules();
  return cfg;
}

const HazardAssessment* DisasterResult::dominant() const
{
  const HazardAssessment* best = nullptr;
  for (const HazardAssessment& h : hazards) {
    if (!best || h.severity > best->severity) best = &h;
  }
  return best;
}

const char* LikelihoodLabel(double severity, const DisasterConfig& cfg)
{
  if (severity < cfg.moderateAt) return "low";
  if (severity < cfg.highAt) return "moderate";
  if (severity < cfg.severeAt) return "high";
  return "severe";
}

DisasterResult SimulateDisasters(const ProjectMetadata& meta, const SeedSet& seeds, const DisasterConfig& cfg)
{
  DisasterResult out;

  const std::string hazard = ToLowerAscii(meta.hazardProfile);
  const std::string soil = ToLowerAscii(meta.soilProfile);
  const std::string site = ToLowerAscii(meta.siteLocation);

  const double baseLo = ClampFinite(cfg.baseMin, 0.0, 1.0);
  const double baseHi = ClampFinite(cfg.baseMax, baseLo, 1.0);

  out.hazards.reserve(cfg.rules.size());
  for (const HazardRule& rule : cfg.rules) {
    HazardAssessment a;
    a.category = rule.category;
    a.declared = AnyLowered(hazard, rule.hazardKeywords);
    a.soilHit = AnyLowered(soil, rule.soilKeywords);
    a.siteHit = AnyLowered(site, rule.siteKeywords);

    // Keyed by category name so adding or reordering rules leaves the other
    // categories unchanged.
    RNG rng(MixSeed(seeds.hazard, HashString(rule.category)));
    double severity = rng.rangeDouble(baseLo, baseHi);
    if (a.declared) severity += cfg.keywordBoost;
    if (a.soilHit) severity += cfg.soilBoost;
    if (a.siteHit) severity += cfg.siteBoost;
    a.severity = RoundTo(Clamp01(severity), 3);

    a.likelihood = LikelihoodLabel(a.severity, cfg);
    a.description = (a.declared || a.severity >= cfg.alertSeverity) ? rule.alertText : rule.calmText;
    out.hazards.push_back(std::move(a));
  }

  std::vector<std::string> declared;
  for (const HazardAssessment& a : out.hazards) {
    SetText(out.metrics, a.category, a.description);
    SetNumber(out.metrics, a.category + "_severity", a.severity);
    SetText(out.metrics, a.category + "_likelihood", a.likelihood);
    if (a.declared) declared.push_back(a.category);
  }

  SetText(out.metrics, "declared_hazards", declared.empty() ? std::string("none") : JoinStrings(declared, ", "));
  const HazardAssessment* dom = out.dominant();
  SetText(out.metrics, "dominant_hazard", dom ? dom->category : std::string("none"));
  return out;
}

} // namespace rebuild
