#pragma once

// Shared CLI parsing + a couple of small filesystem helpers.
//
// Kept header-only and free of pipeline types so the parsing rules (strict
// integers, boolean flags, file specs) can be unit tested on their own.

#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rebuild::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  // std::from_chars for signed ints is locale-independent and non-throwing.
  // It does not accept leading '+' on some standard library implementations.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  if (s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  if (s == "0" || s == "false" || s == "FALSE" || s == "False" || s == "off" || s == "OFF" ||
      s == "Off" || s == "no" || s == "NO" || s == "No") {
    *out = false;
    return true;
  }
  if (s == "1" || s == "true" || s == "TRUE" || s == "True" || s == "on" || s == "ON" ||
      s == "On" || s == "yes" || s == "YES" || s == "Yes") {
    *out = true;
    return true;
  }
  return false;
}

// "<name>[:<bytes>]" as given to --asset/--scan.
//
// The size suffix is optional; a trailing ":<digits>" is taken as the size,
// anything else after the last ':' stays part of the name. Empty names fail.
inline bool ParseFileSpec(std::string_view s, std::string* outName, std::uint64_t* outSize)
{
  if (!outName || !outSize) return false;

  std::string_view name = s;
  std::uint64_t size = 0;

  const std::size_t pos = s.rfind(':');
  if (pos != std::string_view::npos) {
    std::uint64_t v = 0;
    const std::string_view tail = s.substr(pos + 1);
    if (!tail.empty() && tail.find_first_not_of("0123456789") == std::string_view::npos) {
      if (!ParseU64(tail, &v)) return false;
      name = s.substr(0, pos);
      size = v;
    }
  }

  if (name.empty()) return false;
  *outName = std::string(name);
  *outSize = size;
  return true;
}

inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

} // namespace rebuild::cli
