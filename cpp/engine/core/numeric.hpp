#pragma once
/*
===============================================================================
Fragment 1.3 — Core: Numeric Guards
File: cpp/engine/core/numeric.hpp
===============================================================================
*/

#include <cmath>
#include <type_traits>

namespace fuel {

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

inline bool is_positive(double x) noexcept {
  return is_finite(x) && x > 0.0;
}

template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// Never NaN/Inf.
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
  if (!is_finite(num) || !is_finite(den)) return fallback;
  if (den == 0.0) return fallback;
  const double q = num / den;
  return is_finite(q) ? q : fallback;
}

inline double positive_or(double x, double fallback) noexcept {
  return is_positive(x) ? x : fallback;
}

inline double nonneg_or(double x, double fallback) noexcept {
  return (is_finite(x) && x >= 0.0) ? x : fallback;
}

// Ties go toward +infinity (2.5 -> 3, -2.5 -> -2). Every published target in
// the goal tables is rounded this way, including negative remaining budgets.
inline double round_half_up(double x) noexcept {
  return std::floor(x + 0.5);
}

// round_to_nearest(2207.2, 10) == 2210
inline double round_to_nearest(double x, double step) noexcept {
  if (!(step > 0.0)) return x;
  return round_half_up(x / step) * step;
}

} // namespace fuel
