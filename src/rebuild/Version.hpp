#pragma once

#include <string>

// Build/version metadata.
//
// CMake defines these macros via rebuild_core's PUBLIC compile definitions
// (see CMakeLists.txt). The fallbacks keep the header usable in IDEs or
// non-CMake builds.

#ifndef REBUILD_VERSION_MAJOR
#define REBUILD_VERSION_MAJOR 0
#endif

#ifndef REBUILD_VERSION_MINOR
#define REBUILD_VERSION_MINOR 0
#endif

#ifndef REBUILD_VERSION_PATCH
#define REBUILD_VERSION_PATCH 0
#endif

#ifndef REBUILD_VERSION_STRING
#define REBUILD_VERSION_STRING "0.0.0"
#endif

#ifndef REBUILD_GIT_SHA
#define REBUILD_GIT_SHA "unknown"
#endif

namespace rebuild {

inline constexpr const char* VersionString()
{
  return REBUILD_VERSION_STRING;
}

inline std::string FullVersionString()
{
  std::string s = VersionString();
  const std::string sha = REBUILD_GIT_SHA;
  if (!sha.empty() && sha != "unknown") {
    s += " (";
    s += sha;
    s += ")";
  }
  return s;
}

} // namespace rebuild
