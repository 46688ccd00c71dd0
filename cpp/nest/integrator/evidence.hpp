// ============================================================================
// Integrator: Evidence Accumulator
// File: evidence.hpp
// ============================================================================
//
// Purpose:
// - Numerically stable running merge of the evidence integral (logZ) and the
//   information statistic (H) as weighted points are folded in one at a time.
//
//   logZ' = logaddexp(logZ, w),                   w = logweight + L
//   H'    = exp(w - logZ') L + exp(logZ - logZ') (H + logZ) - logZ'
//
// - statistical_error(H, N) = sqrt(H / N) is the per-run evidence error that
//   the stopping rules compare against.
//
// Notes:
// - A weight of -inf is the identity: (logZ, H) come back unchanged.
// - logZ is non-decreasing across merges.
// - Inputs are assumed finite otherwise; -inf everywhere is not guarded.
//
// ============================================================================

#pragma once

namespace nest {

// Running scalars owned by the integration loop.
struct IntegrationState final {
    double logZ = 0.0;
    double H = 0.0;
    double log_vol_remaining = 0.0;
};

struct EvidenceUpdate final {
    double logZ = 0.0;
    double H = 0.0;
};

// Fold one point of log-likelihood L and log prior weight `logweight`.
EvidenceUpdate merge_evidence(double logZ, double H, double logweight, double L) noexcept;

// In-place convenience over IntegrationState.
void accumulate(IntegrationState& state, double logweight, double L) noexcept;

// Seed state from the very first point: logZ = logwidth + L, H = L - logZ.
IntegrationState seed_state(double logwidth, double L) noexcept;

// sqrt(H / N); negative H (round-off) gives 0.
double statistical_error(double H, int nlive) noexcept;

} // namespace nest
