#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rebuild {

struct Report;

// Stable, cross-platform (endianness-independent) 64-bit FNV-1a hashing.
//
// Intended uses:
//  - seed derivation from request text (see Seeds.hpp)
//  - deterministic regression tests ("same request => same report hash")
//  - headless tooling/CI to compare pipeline outputs
//
// NOTE: The exact hash values are not a public API contract; they may change if
// the report layout changes. Tests should compare two runs of the same build
// rather than hard-coding constants.

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFnvPrime;
}

void HashBytes(std::uint64_t& h, const std::uint8_t* data, std::size_t size);
void HashU64(std::uint64_t& h, std::uint64_t v);
void HashF64(std::uint64_t& h, double v);

// Hashes the bytes followed by a length terminator, so ("ab","c") and
// ("a","bc") produce different digests when hashed in sequence.
void HashText(std::uint64_t& h, std::string_view s);

inline std::uint64_t HashString(std::string_view s)
{
  std::uint64_t h = kFnvOffset;
  HashText(h, s);
  return h;
}

// Hash every field of an assembled report.
std::uint64_t HashReport(const Report& report);

// "0x" + 16 lowercase hex digits.
std::string HexU64(std::uint64_t v);

} // namespace rebuild
