#include "rebuild/Feasibility.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Random.hpp"
#include "rebuild/Text.hpp"

#include <algorithm>

namespace rebuild {

namespace {

constexpr const char* kRoofGroup = "roof";

void PushUnique(std::vector<std::string>& v, const std::string& s)
{
  if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

} // namespace

std::vector<ComponentRule> DefaultReusableRules()
{
  return {
      {"brick", "salvaged brick cladding", "cladding"},
      {"timber", "timber joists", "timber"},
      {"joist", "timber joists", "timber"},
      {"steel", "precision steel nodes", "steel"},
      {"beam", "steel beams", "steel"},
      {"slab", "floor slabs", "floor"},
      {"facade", "facade panels", "facade"},
      {"fa\xC3\xA7" "ade", "facade panels", "facade"},
      {"glass", "glazing units", "glazing"},
      {"window", "glazing units", "glazing"},
      {"column", "structural columns", "structure"},
      {"roof", "roof structure", kRoofGroup},
  };
}

std::vector<ComponentRule> DefaultNeedsNewRules()
{
  return {
      {"adaptive roof", "adaptive roof assembly", kRoofGroup},
      {"membrane", "roof membranes", "envelope"},
      {"insulation", "insulation layers", "envelope"},
      {"waterproof", "waterproofing", "envelope"},
      {"new core", "primary core shear walls", "core"},
  };
}

FeasibilityConfig DefaultFeasibilityConfig()
{
  FeasibilityConfig cfg;
  cfg.reusableRules = DefaultReusableRules();
  cfg.needsNewRules = DefaultNeedsNewRules();
  return cfg;
}

void ClassifyComponents(const std::string& demolitionNotes, const FeasibilityConfig& cfg,
                        std::vector<std::string>& outReusable, std::vector<std::string>& outNeedsNew,
                        bool* outRoofNeedsNew)
{
  outReusable.clear();
  outNeedsNew.clear();
  if (outRoofNeedsNew) *outRoofNeedsNew = false;

  const std::string notes = ToLowerAscii(demolitionNotes);

  std::vector<std::string> blockedGroups;
  for (const ComponentRule& r : cfg.needsNewRules) {
    if (!ContainsLowered(notes, r.keyword)) continue;
    PushUnique(outNeedsNew, r.component);
    if (!r.group.empty()) PushUnique(blockedGroups, r.group);
    if (outRoofNeedsNew && r.group == kRoofGroup) *outRoofNeedsNew = true;
  }

  for (const ComponentRule& r : cfg.reusableRules) {
    if (!ContainsLowered(notes, r.keyword)) continue;
    if (!r.group.empty() && std::find(blockedGroups.begin(), blockedGroups.end(), r.group) != blockedGroups.end()) {
      continue;
    }
    // A component cannot be both reusable and needs-new.
    if (std::find(outNeedsNew.begin(), outNeedsNew.end(), r.component) != outNeedsNew.end()) continue;
    PushUnique(outReusable, r.component);
  }
}

FeasibilityResult AssessFeasibility(const ProjectMetadata& meta, const std::vector<Piece>& pieces, const SeedSet& seeds,
                                    const FeasibilityConfig& cfg, const std::string& sawName)
{
  FeasibilityResult out;
  FeasibilityVerdict& v = out.verdict;
  ReuseBreakdown& b = out.breakdown;

  ClassifyComponents(meta.demolitionNotes, cfg, v.reusableComponents, v.needsNewComponents, &out.roofNeedsNew);

  const std::size_t named = v.reusableComponents.size() + v.needsNewComponents.size();
  const double ratio =
      (named > 0) ? static_cast<double>(v.reusableComponents.size()) / static_cast<double>(named) : 0.0;
  v.recycledRatio = RoundTo(Clamp01(ratio), 3);

  // Reuse breakdown.
  RNG rng(seeds.feasibility);
  const double jitter = ClampFinite(cfg.conditionJitter, 0.0, 0.5);
  const double condition = 1.0 + rng.rangeDouble(-jitter, jitter);

  double reused = MeanReuseScore(pieces) * (cfg.ratioBaseWeight + cfg.ratioWeight * v.recycledRatio) * condition;
  if (ContainsAnyKeyword(meta.transportPlan, cfg.railKeywords)) reused *= cfg.railFactor;
  if (ContainsAnyKeyword(meta.hazardProfile, cfg.seismicKeywords)) reused *= cfg.seismicFactor;

  const double maxReused = ClampFinite(cfg.maxReusedPct, 0.0, 100.0);
  b.reusedPct = RoundTo(ClampFinite(reused, 0.0, maxReused), 2);
  b.newPct = RoundTo(std::max(0.0, 100.0 - b.reusedPct), 2);

  const double roofShare = out.roofNeedsNew ? cfg.roofShareDeclared : cfg.roofShareDefault;
  b.roofNewPct = RoundTo(ClampFinite(b.newPct * roofShare, 0.0, cfg.maxRoofNewPct), 2);
  b.reclaimedVolumeM3 = RoundTo(
      ClampFinite(b.reusedPct / 100.0 * static_cast<double>(pieces.size()) * cfg.volumePerPieceM3, 0.0, 1.0e9), 2);

  v.roofNewPct = b.roofNewPct;

  // Plan changes: fixed templates, fixed order.
  std::vector<std::string>& changes = v.suggestedPlanChanges;
  changes.push_back("Retune " + sawName + " cut angles for thicker slabs if more recycled share is needed.");
  if (!v.needsNewComponents.empty()) {
    changes.push_back("Procure new " + JoinStrings(v.needsNewComponents, ", ") +
                      " early; fabrication lead time drives the schedule.");
  }
  if (!v.reusableComponents.empty()) {
    changes.push_back("Schedule reuse inspection for " + JoinStrings(v.reusableComponents, ", ") +
                      " before cutting.");
  }
  if (out.roofNeedsNew) {
    changes.push_back("Swap to laminated skylights to keep the adaptive roof lightweight.");
  }
  if (b.reusedPct < cfg.conveyorBufferBelowPct) {
    changes.push_back("Relocate conveyor buffer closer to demolition face to limit waste.");
  }
  if (ContainsAnyKeyword(meta.hazardProfile, cfg.floodKeywords)) {
    changes.push_back("Raise reused modules by 0.6m to clear flood design level.");
  }
  if (named == 0) {
    changes.push_back("List salvageable components in the demolition notes to enable reuse classification.");
  }
  if (meta.humanBuilt) {
    changes.push_back("Budget manual disassembly of hand-built joints before robotic cutting.");
  }

  return out;
}

} // namespace rebuild
