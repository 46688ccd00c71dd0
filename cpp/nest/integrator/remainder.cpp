// ============================================================================
// Integrator: Remainder Estimator (Live-Point Bracket + Bootstrap)
// File: remainder.cpp
// ============================================================================

#include "nest/integrator/remainder.hpp"

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"
#include "nest/integrator/evidence.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace nest {

namespace {

bool ascending_by_L(const std::vector<Point>& live) {
    return std::is_sorted(live.begin(), live.end(),
                          [](const Point& a, const Point& b) { return a.L < b.L; });
}

} // namespace

BracketSums bracket_sums(const std::vector<double>& Ls,
                         const std::vector<double>& LsMax,
                         const std::vector<std::size_t>& idx) {
    NEST_REQUIRE(!idx.empty(), ErrorCode::kInvalidInput, "bracket_sums: empty index set");

    BracketSums s;
    // upper edge: L2 .. Ln, Ln
    for (std::size_t k = 1; k < idx.size(); ++k) s.upper += LsMax[idx[k]];
    s.upper += LsMax[idx.back()];

    // lower edge: L1, L1 .. Ln-1
    for (std::size_t k = 0; k + 1 < idx.size(); ++k) s.lower += Ls[idx[k]];
    s.lower += Ls[idx.front()];
    return s;
}

RemainderEstimate integrate_remainder(const std::vector<Point>& live,
                                      const RemainderInputs& in,
                                      Rng64& rng) {
    NEST_REQUIRE(!live.empty(), ErrorCode::kInvalidInput, "integrate_remainder: live set is empty");
    NEST_REQUIRE(ascending_by_L(live), ErrorCode::kInvalidInput,
                 "integrate_remainder: live set not ascending by likelihood");
    NEST_REQUIRE(in.nlive > 0, ErrorCode::kInvalidConfig, "integrate_remainder: nlive must be > 0");
    NEST_REQUIRE(in.bootstrap_rounds >= 1, ErrorCode::kInvalidConfig,
                 "integrate_remainder: bootstrap_rounds must be >= 1");

    const std::size_t n = live.size();
    const double L0 = live.back().L;
    NEST_REQUIRE(is_finite(L0), ErrorCode::kInvalidInput, "integrate_remainder: best live likelihood not finite");

    std::vector<double> Ls(n);
    for (std::size_t i = 0; i < n; ++i) Ls[i] = std::exp(live[i].L - L0);
    std::vector<double> LsMax = Ls;
    LsMax.back() = std::exp(in.global_Lmax - L0);

    std::vector<std::size_t> all(n);
    std::iota(all.begin(), all.end(), std::size_t{0});
    const BracketSums edge = bracket_sums(Ls, LsMax, all);

    const double logV = in.logwidth;
    const double logLmid = std::log(std::accumulate(Ls.begin(), Ls.end(), 0.0)) + L0;

    RemainderEstimate out;
    out.totalZ = logaddexp(in.logZ, logV + logLmid);
    out.logZup = logaddexp(in.logZ, logV + std::log(edge.upper) + L0);
    out.logZlo = logaddexp(in.logZ, logV + std::log(edge.lower) + L0);
    const double logZerr = out.logZup - out.logZlo;

    double bs_max = kNegInf;
    double bs_min = -kNegInf;
    std::vector<std::size_t> idx(n);
    for (int r = 0; r < in.bootstrap_rounds; ++r) {
        for (std::size_t k = 0; k < n; ++k) idx[k] = rng.next_index(n);
        std::sort(idx.begin(), idx.end());

        const BracketSums bs = bracket_sums(Ls, LsMax, idx);
        const double up = logaddexp(in.logZ, logV + std::log(bs.upper) + L0);
        const double lo = logaddexp(in.logZ, logV + std::log(bs.lower) + L0);
        bs_max = std::max({bs_max, up, lo});
        bs_min = std::min({bs_min, up, lo});
    }
    out.bootstrap_err = bs_max - bs_min;

    const double stat = statistical_error(in.H, in.nlive);
    out.remainderZ = logV + logLmid;
    out.remainderZerr = logZerr;
    out.totalZerr = logZerr + stat;
    out.totalZerr_bootstrapped = out.bootstrap_err + stat;
    return out;
}

ConservativeEstimate conservative_remainder(double global_Lmax,
                                            double log_vol_remaining,
                                            double logZ) noexcept {
    ConservativeEstimate c;
    c.max_contribution = global_Lmax + log_vol_remaining;
    c.logZ_gap = logaddexp(c.max_contribution, logZ) - logZ;
    return c;
}

} // namespace nest
