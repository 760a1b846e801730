#pragma once

// Small text helpers shared by the keyword-driven stages.
//
// All matching is ASCII case-insensitive substring search: deterministic,
// locale-independent, and byte-transparent for UTF-8 input (non-ASCII bytes
// are compared verbatim).

#include <cctype>
#include <cstddef>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace rebuild {

inline char LowerAscii(char c)
{
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline std::string ToLowerAscii(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(LowerAscii(c));
  return out;
}

inline std::string_view TrimAscii(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) s.remove_suffix(1);
  return s;
}

// haystackLower must already be lowercased; the keyword is lowered here.
inline bool ContainsLowered(std::string_view haystackLower, std::string_view keyword)
{
  if (keyword.empty()) return false;
  const std::string k = ToLowerAscii(keyword);
  return haystackLower.find(k) != std::string_view::npos;
}

inline bool ContainsKeyword(std::string_view text, std::string_view keyword)
{
  return ContainsLowered(ToLowerAscii(text), keyword);
}

inline bool ContainsAnyKeyword(std::string_view text, const std::vector<std::string>& keywords)
{
  const std::string lower = ToLowerAscii(text);
  for (const std::string& k : keywords) {
    if (ContainsLowered(lower, k)) return true;
  }
  return false;
}

// Join with a separator ("a, b, c").
inline std::string JoinStrings(const std::vector<std::string>& parts, std::string_view sep)
{
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

// Fixed-point formatting in the classic locale ("12.50").
inline std::string FormatFixed(double v, int decimals)
{
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(decimals) << v;
  return oss.str();
}

} // namespace rebuild
