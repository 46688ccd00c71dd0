// ============================================================================
// Integrator: Remainder Estimator (Live-Point Bracket + Bootstrap)
// File: remainder.hpp
// ============================================================================
//
// Purpose:
// - Bound the evidence mass still held by the live (undrawn) points. Those
//   points are never individually consumed, so their contribution is
//   integrated as a staircase over the remaining volume with one shell
//   width per point.
//
// Staircase (live likelihoods ascending, L1 < L2 < ... < Ln):
//
//            x---   4
//        x---       3
//    x---           2        mid   : L1 + L2 + ... + Ln
//  x---             1        upper : L2 + ... + Ln + Ln   (Ln -> global Lmax)
//  |   |   |   |             lower : L1 + L1 + ... + Ln-1
//
// - Likelihoods are rebased to the best live point before exponentiating,
//   so every rebased term is <= 1 (no overflow) and only the tail can
//   underflow harmlessly.
// - Bootstrap: resample the live indices with replacement, sort them to keep
//   the edge structure, recompute upper/lower; the spread of all resulting
//   totals is the bootstrap error.
//
// Outputs (per call):
//   remainderZ             logwidth + log(sum Ls) + L0
//   remainderZerr          logZup - logZlo
//   totalZ                 logaddexp(logZ, remainderZ)
//   totalZerr              remainderZerr + sqrt(H/N)
//   totalZerr_bootstrapped bootstrap spread + sqrt(H/N)
//
// ============================================================================

#pragma once

#include "nest/core/rng.hpp"
#include "nest/integrator/point.hpp"

#include <cstddef>
#include <vector>

namespace nest {

struct RemainderInputs final {
    double logwidth = 0.0;
    double logZ = 0.0;
    double H = 0.0;
    double global_Lmax = 0.0;
    int nlive = 0;
    int bootstrap_rounds = 20;
};

struct RemainderEstimate final {
    double remainderZ = 0.0;
    double remainderZerr = 0.0;
    double totalZ = 0.0;
    double totalZerr = 0.0;
    double totalZerr_bootstrapped = 0.0;

    // Bracket detail, kept for diagnostics and tests.
    double logZup = 0.0;
    double logZlo = 0.0;
    double bootstrap_err = 0.0;
};

// Upper/lower staircase sums over rebased likelihoods, restricted to an
// ascending index multiset.
struct BracketSums final {
    double upper = 0.0;
    double lower = 0.0;
};

BracketSums bracket_sums(const std::vector<double>& Ls,
                         const std::vector<double>& LsMax,
                         const std::vector<std::size_t>& idx);

// Throws NestError(kInvalidInput) if `live` is empty, not ascending by L, or
// its best likelihood is not finite.
RemainderEstimate integrate_remainder(const std::vector<Point>& live,
                                      const RemainderInputs& in,
                                      Rng64& rng);

// Worst-case bound: all remaining volume at the global maximum likelihood.
struct ConservativeEstimate final {
    double max_contribution = 0.0; // Lmax + logVolremaining
    double logZ_gap = 0.0;         // logaddexp(max_contribution, logZ) - logZ
};

ConservativeEstimate conservative_remainder(double global_Lmax,
                                            double log_vol_remaining,
                                            double logZ) noexcept;

} // namespace nest
