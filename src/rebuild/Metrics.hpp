#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace rebuild {

// A named report metric: either a number or a short descriptive string.
//
// Metric mappings are stored as ordered vectors (not hash maps) so JSON output
// and report hashes are stable run to run.
struct Metric {
  enum class Kind : std::uint8_t {
    Number,
    Text,
  };

  std::string key;
  Kind kind = Kind::Number;
  double number = 0.0;
  std::string text;

  bool isNumber() const { return kind == Kind::Number; }
  bool isText() const { return kind == Kind::Text; }

  bool operator==(const Metric& o) const
  {
    return key == o.key && kind == o.kind && number == o.number && text == o.text;
  }
  bool operator!=(const Metric& o) const { return !(*this == o); }
};

using MetricMap = std::vector<Metric>;

inline void SetNumber(MetricMap& m, std::string key, double v)
{
  for (Metric& e : m) {
    if (e.key == key) {
      e.kind = Metric::Kind::Number;
      e.number = v;
      e.text.clear();
      return;
    }
  }
  Metric e;
  e.key = std::move(key);
  e.kind = Metric::Kind::Number;
  e.number = v;
  m.push_back(std::move(e));
}

inline void SetText(MetricMap& m, std::string key, std::string v)
{
  for (Metric& e : m) {
    if (e.key == key) {
      e.kind = Metric::Kind::Text;
      e.number = 0.0;
      e.text = std::move(v);
      return;
    }
  }
  Metric e;
  e.key = std::move(key);
  e.kind = Metric::Kind::Text;
  e.text = std::move(v);
  m.push_back(std::move(e));
}

inline const Metric* FindMetric(const MetricMap& m, const std::string& key)
{
  for (const Metric& e : m) {
    if (e.key == key) return &e;
  }
  return nullptr;
}

// Numeric lookup with a fallback for missing or text entries.
inline double MetricNumber(const MetricMap& m, const std::string& key, double fallback = 0.0)
{
  const Metric* e = FindMetric(m, key);
  return (e && e->isNumber()) ? e->number : fallback;
}

} // namespace rebuild
