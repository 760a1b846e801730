#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace rebuild {

// Environment variable naming a default pipeline config file for the CLI.
inline constexpr const char* kConfigEnvVar = "REBUILD_CONFIG";

// Cross-platform environment variable read. Empty values read as unset.
//
// MSVC warns that getenv is "unsafe" (C4996); _dupenv_s avoids the warning.
inline std::optional<std::string> GetEnvVar(const char* name)
{
  if (!name || !*name) return std::nullopt;

#if defined(_WIN32) && defined(_MSC_VER)
  char* buf = nullptr;
  std::size_t len = 0;
  if (_dupenv_s(&buf, &len, name) != 0 || !buf) return std::nullopt;

  std::string out(buf);
  std::free(buf);
  if (out.empty()) return std::nullopt;
  return out;
#else
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  return std::string(v);
#endif
}

} // namespace rebuild
