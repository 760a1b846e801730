#pragma once

#include <algorithm>
#include <cmath>

namespace rebuild {

// Deterministic math helpers for the analysis stages.
//
// Transcendental functions (std::sin/cos/...) may produce slightly different
// results across platforms/standard library implementations. Report values
// feed into hashes and regression comparisons, so every stage uses the
// approximations below instead of libm trig. std::round/std::sqrt are correctly
// rounded IEEE operations and remain fine to use.

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 6.28318530717958647692;
constexpr double kHalfPi = 1.57079632679489661923;
constexpr double kInvTwoPi = 0.15915494309189533577; // 1/(2*pi)
constexpr double kDegToRad = kPi / 180.0;

inline double AbsD(double x) { return (x < 0.0) ? -x : x; }

// Deterministic floor-to-int for finite inputs in a modest range.
inline long long FloorToInt(double x)
{
  long long i = static_cast<long long>(x); // trunc toward 0
  if (x < 0.0 && static_cast<double>(i) != x) {
    i -= 1;
  }
  return i;
}

// Wrap an angle in radians into [-pi, pi].
inline double WrapAnglePi(double rad)
{
  const double turns = rad * kInvTwoPi;
  const long long k = FloorToInt(turns);
  double frac = turns - static_cast<double>(k);
  if (frac < 0.0) frac += 1.0;

  double a = frac * kTwoPi; // [0,2pi)
  if (a > kPi) a -= kTwoPi;
  return a;
}

// Fast sine fit:
//   y = Bx + Cx|x|
//   y = P*(y|y| - y) + y
// for x in [-pi, pi].
inline double FastSinWrapped(double xWrapped)
{
  constexpr double B = 4.0 / kPi;
  constexpr double C = -4.0 / (kPi * kPi);

  double y = B * xWrapped + C * xWrapped * AbsD(xWrapped);

  // Improve peak accuracy.
  constexpr double P = 0.225;
  y = P * (y * AbsD(y) - y) + y;
  return y;
}

inline double FastSinRad(double rad) { return FastSinWrapped(WrapAnglePi(rad)); }

inline void FastSinCosRad(double rad, double& outSin, double& outCos)
{
  const double x = WrapAnglePi(rad);
  outSin = FastSinWrapped(x);

  double c = x + kHalfPi;
  if (c > kPi) c -= kTwoPi;
  outCos = FastSinWrapped(c);
}

// Wrap a scalar into [0, period).
inline double WrapPositive(double x, double period)
{
  if (!(period > 0.0)) return 0.0;
  const long long k = FloorToInt(x / period);
  double r = x - static_cast<double>(k) * period;
  if (r < 0.0) r += period;
  // Rare floating rounding can produce the period exactly.
  if (r >= period) r = 0.0;
  return r;
}

// Clamp that also maps NaN/Inf to the lower bound. Upstream values are clamped
// at the point of use rather than rejected.
inline double ClampFinite(double v, double lo, double hi)
{
  if (!std::isfinite(v)) return lo;
  return std::clamp(v, lo, hi);
}

inline double Clamp01(double v) { return ClampFinite(v, 0.0, 1.0); }

// Round half away from zero to a fixed number of decimals.
inline double RoundTo(double v, int decimals)
{
  if (!std::isfinite(v)) return 0.0;
  double scale = 1.0;
  for (int i = 0; i < decimals; ++i) scale *= 10.0;
  return std::round(v * scale) / scale;
}

} // namespace rebuild
