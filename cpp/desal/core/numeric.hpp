#pragma once
/*
===============================================================================
Core: Hardened Math Utilities
FILE: cpp/desal/core/numeric.hpp
===============================================================================
*/

#include <cmath>
#include <type_traits>

namespace desal {

// -----------------------------
// Constants
// -----------------------------
inline constexpr double kPi = 3.141592653589793238462643383279502884;

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// Clamp (generic for arithmetic)
// -----------------------------
template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
    static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
    return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// -----------------------------
// Safe division (never NaN/Inf)
// -----------------------------
inline double safe_div(double num, double den, double fallback = 0.0) noexcept {
    if (!is_finite(num) || !is_finite(den)) return fallback;
    if (den == 0.0) return fallback;
    const double q = num / den;
    return is_finite(q) ? q : fallback;
}

inline double safe_sqrt(double x, double fallback = 0.0) noexcept {
    if (!is_finite(x) || x < 0.0) return fallback;
    return std::sqrt(x);
}

// -----------------------------
// Unit helpers
// -----------------------------
inline constexpr double deg2rad(double deg) noexcept { return deg * (kPi / 180.0); }

// -----------------------------
// Common numeric guards
// -----------------------------
inline bool is_positive(double x) noexcept {
    return is_finite(x) && x > 0.0;
}

inline bool is_nonnegative(double x) noexcept {
    return is_finite(x) && x >= 0.0;
}

} // namespace desal
