#pragma once

#include <cstdint>

namespace rebuild {

// SplitMix64: small, fast, high-quality generator for seeds / hashing.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Derive an independent sub-seed from a digest and a fixed salt.
//
// Two different salts never map the same digest to the same stream, which is
// what lets each pipeline stage vary independently of the others.
inline std::uint64_t MixSeed(std::uint64_t digest, std::uint64_t salt)
{
  std::uint64_t state = digest ^ (salt * 0xD6E8FEB86659FD93ULL);
  return SplitMix64Next(state);
}

// Deterministic stream of values. There is intentionally no time-based seeding:
// every pipeline value must be reproducible from the request alone.
struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  std::uint32_t nextU32() { return static_cast<std::uint32_t>(nextU64() >> 32); }

  // [0, 1) with 53 bits of precision.
  double nextF01()
  {
    const std::uint64_t u = nextU64() >> 11;
    return static_cast<double>(u) / static_cast<double>(1ULL << 53);
  }

  double rangeDouble(double minInclusive, double maxExclusive)
  {
    const double t = nextF01();
    return minInclusive + (maxExclusive - minInclusive) * t;
  }

  bool chance(double p) { return nextF01() < p; }
};

// Deterministic (index, salt) hash -> uint32.
// Used for per-node / per-piece noise that must not depend on call order.
inline std::uint32_t HashIndex32(int index, int salt, std::uint32_t seed)
{
  // Treat as unsigned to avoid UB on shifts.
  std::uint64_t v = static_cast<std::uint64_t>(static_cast<std::uint32_t>(index));
  v |= (static_cast<std::uint64_t>(static_cast<std::uint32_t>(salt)) << 32);
  v ^= (static_cast<std::uint64_t>(seed) * 0xD6E8FEB86659FD93ULL);

  // Finalize with splitmix mix steps (without state increment).
  v ^= v >> 30;
  v *= 0xBF58476D1CE4E5B9ULL;
  v ^= v >> 27;
  v *= 0x94D049BB133111EBULL;
  v ^= v >> 31;

  return static_cast<std::uint32_t>(v & 0xFFFFFFFFu);
}

} // namespace rebuild
