// ============================================================================
// Integrator: Evidence Accumulator
// File: evidence.cpp
// ============================================================================

#include "nest/integrator/evidence.hpp"

#include "nest/core/log_math.hpp"

#include <cmath>

namespace nest {

EvidenceUpdate merge_evidence(double logZ, double H, double logweight, double L) noexcept {
    const double w = logweight + L;
    const double logZnew = logaddexp(logZ, w);

    EvidenceUpdate out;
    out.logZ = logZnew;
    if (w == kNegInf) {
        // exp(-inf) * L is 0, but keep H bitwise stable.
        out.H = H;
        return out;
    }
    out.H = std::exp(w - logZnew) * L
          + std::exp(logZ - logZnew) * (H + logZ)
          - logZnew;
    return out;
}

void accumulate(IntegrationState& state, double logweight, double L) noexcept {
    const EvidenceUpdate u = merge_evidence(state.logZ, state.H, logweight, L);
    state.logZ = u.logZ;
    state.H = u.H;
}

IntegrationState seed_state(double logwidth, double L) noexcept {
    IntegrationState s;
    s.logZ = logwidth + L;
    s.H = L - s.logZ;
    s.log_vol_remaining = 0.0;
    return s;
}

double statistical_error(double H, int nlive) noexcept {
    return safe_sqrt(H / static_cast<double>(nlive));
}

} // namespace nest
