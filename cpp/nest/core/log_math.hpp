// ============================================================================
// Core: Log-Space Math Utilities
// File: log_math.hpp
// ============================================================================
//
// Goal:
// - Centralize the numerically safe primitives the integrator relies on.
// - All probabilities are carried as natural logs; nothing here ever
//   exponentiates an un-rebased likelihood.
//
// Design notes:
// - Header-only, non-allocating.
// - -inf is a valid operand everywhere ("zero mass").
//
// ============================================================================

#pragma once

#include <cmath>
#include <limits>

namespace nest {

inline constexpr double kNegInf = -std::numeric_limits<double>::infinity();

// -----------------------------
// Finite checks
// -----------------------------
inline bool is_finite(double x) noexcept {
    return std::isfinite(x) != 0;
}

// -----------------------------
// Log-sum-exp
// -----------------------------
// log(exp(a) + exp(b)), exact when either side is -inf.
inline double logaddexp(double a, double b) noexcept {
    if (a == kNegInf) return b;
    if (b == kNegInf) return a;
    return (a > b) ? a + std::log1p(std::exp(b - a))
                   : b + std::log1p(std::exp(a - b));
}

// -----------------------------
// Safe math
// -----------------------------
inline double safe_sqrt(double x, double eps = 0.0) noexcept {
    // Negative (round-off) or NaN input clamps to eps; +inf passes through.
    const double y = (std::isnan(x) || x < eps) ? eps : x;
    return std::sqrt(y);
}

// log(1 - exp(-1/N)): log prior-volume fraction of the outermost shell.
inline double log_shell_width(int nlive) noexcept {
    return std::log(-std::expm1(-1.0 / static_cast<double>(nlive)));
}

} // namespace nest
