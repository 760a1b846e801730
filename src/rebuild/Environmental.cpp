#include "rebuild/Environmental.hpp"

#include "rebuild/DeterministicMath.hpp"
#include "rebuild/Random.hpp"
#include "rebuild/Text.hpp"

#include <algorithm>

namespace rebuild {

int CountTransportLegs(const std::string& transportPlan, const std::vector<std::string>& separators)
{
  const std::string text = ToLowerAscii(transportPlan);

  int legs = 0;
  std::size_t segStart = 0;
  std::size_t i = 0;

  auto closeSegment = [&](std::size_t end) {
    if (!TrimAscii(std::string_view(text).substr(segStart, end - segStart)).empty()) ++legs;
  };

  while (i < text.size()) {
    std::size_t matched = 0;
    for (const std::string& sep : separators) {
      if (sep.empty()) continue;
      if (text.compare(i, sep.size(), ToLowerAscii(sep)) == 0) {
        matched = sep.size();
        break;
      }
    }
    if (matched > 0) {
      closeSegment(i);
      i += matched;
      segStart = i;
    } else {
      ++i;
    }
  }
  closeSegment(text.size());
  return legs;
}

EnvironmentalResult EstimateEnvironmentalImpact(const ProjectMetadata& meta, int pieceCount, const SeedSet& seeds,
                                                const EnvironmentalConfig& cfg)
{
  EnvironmentalResult out;

  const double pieces = static_cast<double>(std::max(0, pieceCount));
  const int legs = CountTransportLegs(meta.transportPlan, cfg.legSeparators);

  RNG rng(seeds.environment);
  const double jitter = rng.rangeDouble(0.0, std::max(0.0, cfg.noiseJitterDb));

  double textDb = 0.0;
  if (cfg.transportCharsPerDb > 0.0) {
    textDb = std::min(static_cast<double>(meta.transportPlan.size()) / cfg.transportCharsPerDb, cfg.maxTransportTextDb);
  }

  double noise = cfg.baseNoiseDb + cfg.noisePerPieceDb * pieces + cfg.noisePerLegDb * static_cast<double>(legs) +
                 textDb + jitter;
  if (ContainsAnyKeyword(meta.transportPlan, cfg.truckKeywords)) noise *= cfg.truckMultiplier;
  noise = ClampFinite(noise, 0.0, cfg.maxNoiseDb);

  const double density = ContainsAnyKeyword(meta.siteLocation, cfg.ruralKeywords) ? cfg.ruralDensity : cfg.urbanDensity;
  const double light = ClampFinite(cfg.baseLightDb * density + cfg.lightPerPieceDb * pieces, 0.0, cfg.maxLightDb);

  double peak = noise;
  if (ContainsAnyKeyword(meta.hazardProfile, cfg.floodKeywords)) peak *= cfg.floodPeakMultiplier;
  peak = ClampFinite(peak, 0.0, cfg.maxPeakDb);

  double lux = cfg.baseLux;
  if (ContainsAnyKeyword(meta.description, cfg.historicKeywords)) lux *= cfg.historicBuffer;
  lux = ClampFinite(lux + cfg.luxPerPiece * pieces, 0.0, cfg.maxLux);

  const double glare = (cfg.glareDivisor > 0.0) ? lux / cfg.glareDivisor : 0.0;

  const double noiseSpan = cfg.maxNoiseDb - cfg.quietDb;
  const double soundIndex = (noiseSpan > 0.0) ? Clamp01((noise - cfg.quietDb) / noiseSpan) : 0.0;
  const double lightIndex = (cfg.maxLux > 0.0) ? Clamp01(lux / cfg.maxLux) : 0.0;

  const double lightDb = RoundTo(light, 1);
  const double noiseDb = RoundTo(noise, 1);

  SetNumber(out.pollution, "light_db", lightDb);
  SetNumber(out.pollution, "noise_db", noiseDb);

  out.impact = out.pollution;
  SetNumber(out.impact, "sound_peak_db", RoundTo(peak, 1));
  SetNumber(out.impact, "light_intrusion_lux", RoundTo(lux, 1));
  SetNumber(out.impact, "nighttime_glare_index", RoundTo(glare, 2));
  SetNumber(out.impact, "sound_pollution_index", RoundTo(soundIndex, 3));
  SetNumber(out.impact, "light_pollution_index", RoundTo(lightIndex, 3));
  SetNumber(out.impact, "transport_legs", static_cast<double>(legs));
  return out;
}

} // namespace rebuild
