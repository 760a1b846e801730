#include "rebuild/ReportJson.hpp"

namespace rebuild {

namespace {

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }
JsonValue Str(const std::string& s) { return JsonValue::MakeString(s); }

JsonValue StringList(const std::vector<std::string>& v)
{
  JsonValue arr = JsonValue::MakeArray();
  for (const std::string& s : v) arr.push(Str(s));
  return arr;
}

} // namespace

JsonValue MetricMapToJson(const MetricMap& m)
{
  JsonValue obj = JsonValue::MakeObject();
  for (const Metric& e : m) {
    obj.set(e.key, e.isNumber() ? Num(e.number) : Str(e.text));
  }
  return obj;
}

JsonValue PiecePlanToJson(const PiecePlan& pp)
{
  const Piece& p = pp.piece;

  JsonValue com = JsonValue::MakeObject();
  com.set("x", Num(p.centerOfMass.x));
  com.set("y", Num(p.centerOfMass.y));
  com.set("z", Num(p.centerOfMass.z));

  JsonValue obj = JsonValue::MakeObject();
  obj.set("piece_id", Str(p.id));
  obj.set("mass_kg", Num(p.massKg));
  obj.set("center_of_mass", std::move(com));
  obj.set("reuse_score", Num(p.reuseScore));
  obj.set("optimal_cut_angle", Num(p.optimalCutAngle));
  obj.set("waste_reduction", Num(p.wasteReduction));
  obj.set("adjusted_waste_reduction", Num(pp.adjustedWasteReduction));
  return obj;
}

JsonValue ReportToJson(const Report& r, bool includeFeaNodes)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("project_name", Str(r.projectName));
  root.set("summary", Str(r.summary));

  JsonValue plans = JsonValue::MakeArray();
  for (const PiecePlan& p : r.piecePlans) plans.push(PiecePlanToJson(p));
  root.set("piece_plans", std::move(plans));

  root.set("cutting_instructions", StringList(r.cuttingInstructions));

  {
    const ReuseBreakdown& b = r.reuseBreakdown;
    JsonValue obj = JsonValue::MakeObject();
    obj.set("reused_pct", Num(b.reusedPct));
    obj.set("new_pct", Num(b.newPct));
    obj.set("roof_new_pct", Num(b.roofNewPct));
    obj.set("reclaimed_volume_m3", Num(b.reclaimedVolumeM3));
    root.set("reuse_breakdown", std::move(obj));
  }

  {
    const FeasibilityVerdict& v = r.materialFeasibility;
    JsonValue obj = JsonValue::MakeObject();
    obj.set("reusable_components", StringList(v.reusableComponents));
    obj.set("needs_new_components", StringList(v.needsNewComponents));
    obj.set("suggested_plan_changes", StringList(v.suggestedPlanChanges));
    obj.set("recycled_ratio", Num(v.recycledRatio));
    obj.set("roof_new_pct", Num(v.roofNewPct));
    root.set("material_feasibility", std::move(obj));
  }

  root.set("disaster_simulation", MetricMapToJson(r.disasterSimulation));
  root.set("structural_analysis", MetricMapToJson(r.structuralAnalysis));

  {
    JsonValue fea = MetricMapToJson(r.finiteElementAnalysis);
    if (includeFeaNodes) {
      JsonValue nodes = JsonValue::MakeArray();
      for (const FeaNode& n : r.finiteElementNodes) {
        JsonValue o = JsonValue::MakeObject();
        o.set("node", Str("node-" + std::to_string(n.index + 1)));
        o.set("load", Num(n.load));
        o.set("stress_mpa", Num(n.stressMpa));
        o.set("displacement_mm", Num(n.displacementMm));
        o.set("utilization", Num(n.utilization));
        nodes.push(std::move(o));
      }
      fea.set("nodes", std::move(nodes));
    }
    root.set("finite_element_analysis", std::move(fea));
  }

  root.set("pollution_model", MetricMapToJson(r.pollutionModel));
  root.set("environmental_impact", MetricMapToJson(r.environmentalImpact));

  {
    const CostCarbonResult& c = r.costAndCarbon;
    JsonValue obj = JsonValue::MakeObject();
    obj.set("baseline_cost", Num(c.baselineCost));
    obj.set("reclaimed_savings", Num(c.reclaimedSavings));
    obj.set("net_cost", Num(c.netCost));
    obj.set("co2_saved_tons", Num(c.co2SavedTons));
    obj.set("recycled_material_value", Num(c.recycledMaterialValue));
    obj.set("total_mass_kg", Num(c.totalMassKg));
    obj.set("reclaimed_mass_kg", Num(c.reclaimedMassKg));
    root.set("cost_and_carbon", std::move(obj));
  }

  root.set("recommendations", StringList(r.recommendations));
  root.set("ai_engineering", Str(r.aiEngineering));
  return root;
}

std::string ReportToJsonString(const Report& report, const JsonWriteOptions& opt)
{
  return JsonStringify(ReportToJson(report), opt);
}

bool WriteReportJsonFile(const std::string& path, const Report& report, std::string& outError,
                         const JsonWriteOptions& opt)
{
  return WriteJsonFile(path, ReportToJson(report), outError, opt);
}

} // namespace rebuild
