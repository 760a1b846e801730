#include "rebuild/Hash.hpp"

#include "rebuild/Report.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace rebuild {

namespace {

void HashStringList(std::uint64_t& h, const std::vector<std::string>& v)
{
  HashU64(h, static_cast<std::uint64_t>(v.size()));
  for (const std::string& s : v) HashText(h, s);
}

void HashMetrics(std::uint64_t& h, const MetricMap& m)
{
  HashU64(h, static_cast<std::uint64_t>(m.size()));
  for (const Metric& e : m) {
    HashText(h, e.key);
    HashByte(h, static_cast<std::uint8_t>(e.kind));
    if (e.isNumber()) {
      HashF64(h, e.number);
    } else {
      HashText(h, e.text);
    }
  }
}

} // namespace

void HashBytes(std::uint64_t& h, const std::uint8_t* data, std::size_t size)
{
  for (std::size_t i = 0; i < size; ++i) HashByte(h, data[i]);
}

void HashU64(std::uint64_t& h, std::uint64_t v)
{
  // Little-endian byte order regardless of host.
  for (int i = 0; i < 8; ++i) {
    HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
  }
}

void HashF64(std::uint64_t& h, double v)
{
  // Normalize -0.0 so equal values hash equally.
  if (v == 0.0) v = 0.0;
  std::uint64_t bits = 0;
  static_assert(sizeof(bits) == sizeof(v), "double must be 64-bit");
  std::memcpy(&bits, &v, sizeof(bits));
  HashU64(h, bits);
}

void HashText(std::uint64_t& h, std::string_view s)
{
  HashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
  HashU64(h, static_cast<std::uint64_t>(s.size()));
}

std::uint64_t HashReport(const Report& r)
{
  std::uint64_t h = kFnvOffset;

  HashText(h, r.projectName);
  HashText(h, r.summary);

  HashU64(h, static_cast<std::uint64_t>(r.piecePlans.size()));
  for (const PiecePlan& pp : r.piecePlans) {
    const Piece& p = pp.piece;
    HashText(h, p.id);
    HashU64(h, static_cast<std::uint64_t>(p.index));
    HashF64(h, p.massKg);
    HashF64(h, p.centerOfMass.x);
    HashF64(h, p.centerOfMass.y);
    HashF64(h, p.centerOfMass.z);
    HashF64(h, p.reuseScore);
    HashF64(h, p.wasteReduction);
    HashF64(h, p.optimalCutAngle);
    HashF64(h, pp.adjustedWasteReduction);
  }

  HashStringList(h, r.cuttingInstructions);

  HashF64(h, r.reuseBreakdown.reusedPct);
  HashF64(h, r.reuseBreakdown.newPct);
  HashF64(h, r.reuseBreakdown.roofNewPct);
  HashF64(h, r.reuseBreakdown.reclaimedVolumeM3);

  const FeasibilityVerdict& v = r.materialFeasibility;
  HashStringList(h, v.reusableComponents);
  HashStringList(h, v.needsNewComponents);
  HashStringList(h, v.suggestedPlanChanges);
  HashF64(h, v.recycledRatio);
  HashF64(h, v.roofNewPct);

  HashMetrics(h, r.disasterSimulation);
  HashMetrics(h, r.structuralAnalysis);
  HashMetrics(h, r.finiteElementAnalysis);
  HashU64(h, static_cast<std::uint64_t>(r.finiteElementNodes.size()));
  for (const FeaNode& n : r.finiteElementNodes) {
    HashU64(h, static_cast<std::uint64_t>(n.index));
    HashF64(h, n.load);
    HashF64(h, n.stressMpa);
    HashF64(h, n.displacementMm);
    HashF64(h, n.utilization);
  }
  HashMetrics(h, r.pollutionModel);
  HashMetrics(h, r.environmentalImpact);

  const CostCarbonResult& c = r.costAndCarbon;
  HashF64(h, c.baselineCost);
  HashF64(h, c.reclaimedSavings);
  HashF64(h, c.netCost);
  HashF64(h, c.co2SavedTons);
  HashF64(h, c.recycledMaterialValue);
  HashF64(h, c.totalMassKg);
  HashF64(h, c.reclaimedMassKg);

  HashStringList(h, r.recommendations);
  HashText(h, r.aiEngineering);
  return h;
}

std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

} // namespace rebuild
