/*
================================================================================
Integrator: Nested Sampling Convergence Controller (Implementation)
FILE: cpp/nest/integrator/nested_integrator.cpp
================================================================================
*/

#include "nest/integrator/nested_integrator.hpp"

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"
#include "nest/core/logging.hpp"
#include "nest/core/rng.hpp"
#include "nest/integrator/evidence.hpp"
#include "nest/integrator/volume.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace nest {

namespace {

RemainderInputs remainder_inputs(const IntegrationState& state,
                                 double logwidth,
                                 const Sampler& sampler,
                                 const IntegratorSettings& settings) {
  RemainderInputs in;
  in.logwidth = logwidth;
  in.logZ = state.logZ;
  in.H = state.H;
  in.global_Lmax = sampler.max_loglike();
  in.nlive = sampler.nlive_points();
  in.bootstrap_rounds = settings.bootstrap_rounds;
  return in;
}

bool remainder_due(std::int64_t i, int nlive, int interval) noexcept {
  if (i == 1) return true;
  return i > nlive && (i - 1) % interval == 0;
}

}  // namespace

const char* to_string(StopReason r) noexcept {
  switch (r) {
    case StopReason::Converged:     return "Converged";
    case StopReason::NoImprovement: return "NoImprovement";
    case StopReason::MaxSamples:    return "MaxSamples";
    default:                        return "Unknown";
  }
}

double expected_iterations(int nlive,
                           double Lmax,
                           double logZ,
                           double stat_err,
                           double tolerance,
                           std::int64_t iteration) noexcept {
  const double lo = static_cast<double>(iteration + 1);
  const double hi = static_cast<double>(iteration + 100000);

  // log(exp(a + logZ) - exp(logZ)) == logZ + log(expm1(a))
  const double a = std::max(tolerance - stat_err, stat_err / 100.0);
  const double i_final = static_cast<double>(nlive) * (Lmax - logZ - std::log(std::expm1(a)));
  if (!is_finite(i_final)) return lo;
  return std::min(std::max(lo, i_final), hi);
}

IntegrationResult run_nested_integrator(Sampler& sampler,
                                        const IntegratorSettings& settings,
                                        const ProgressCallback& progress) {
  settings.validate_or_throw();
  const int N = sampler.nlive_points();
  NEST_REQUIRE(N > 0, ErrorCode::kInvalidConfig, "run_nested_integrator: nlive_points must be > 0");

  Rng64 rng(settings.seed);
  IntegrationResult out;

  double logwidth = log_shell_width(N);
  Point current = sampler.next();
  IntegrationState state = seed_state(logwidth, current.L);

  RemainderEstimate rem;
  StopReason reason = StopReason::Converged;
  std::int64_t i = 0;

  for (;;) {
    ++i;
    const VolumeStep step = shrink_volume(state.log_vol_remaining, N);
    logwidth = step.logwidth;
    state.log_vol_remaining = step.log_vol_remaining;

    out.weights.push_back(make_weight_record(current, logwidth));

    const double stat_err = statistical_error(state.H, N);

    if (remainder_due(i, N, settings.remainder_interval)) {
      rem = integrate_remainder(sampler.remainder(),
                                remainder_inputs(state, logwidth, sampler, settings), rng);
      if (log_enabled(LogLevel::DEBUG)) {
        std::ostringstream oss;
        oss << "remainder @" << i << ": lnZ=" << rem.totalZ
            << " bracket=" << rem.remainderZerr
            << " bootstrap=" << rem.bootstrap_err
            << " stat=" << stat_err;
        log(LogLevel::DEBUG, oss.str());
      }
    }

    if (i > N) {
      if (settings.max_samples && sampler.ndraws() >= *settings.max_samples) {
        reason = StopReason::MaxSamples;
        std::ostringstream oss;
        oss << "maximum number of samples reached (" << sampler.ndraws() << ")";
        log(LogLevel::WARN, oss.str());
        break;
      }

      const bool small_remainder = !settings.need_small_remainder ||
                                   rem.remainderZ < rem.totalZ + std::log(settings.max_remainder);
      const bool robust_ok = !settings.need_robust_remainder_error ||
                             rem.totalZerr_bootstrapped < settings.tolerance;
      if (rem.totalZerr < settings.tolerance && small_remainder && robust_ok) {
        reason = StopReason::Converged;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4)
            << "tolerance on error reached: total=" << rem.totalZerr
            << " (BS: " << rem.totalZerr_bootstrapped << ")"
            << " stat=" << stat_err
            << " remainder=" << rem.remainderZerr;
        log(LogLevel::INFO, oss.str());
        break;
      }

      // Remainder uncertainty is already swamped by the statistical error.
      if (rem.remainderZerr < stat_err / 10.0) {
        reason = StopReason::NoImprovement;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3)
            << "tolerance will not improve: remainder error (" << rem.remainderZerr
            << ") is much smaller than statistical error (" << stat_err << ")";
        log(LogLevel::INFO, oss.str());
        break;
      }
    }

    if (progress) {
      ProgressSnapshot snap;
      snap.iteration = i;
      snap.total_logZ = rem.totalZ;
      snap.stat_err = stat_err;
      snap.remainder_err = rem.remainderZerr;
      snap.current_logL = current.L;
      snap.logZ = state.logZ;
      snap.log_vol_remaining = state.log_vol_remaining;
      snap.ndraws = sampler.ndraws();
      snap.expected_iterations = expected_iterations(N, sampler.max_loglike(), state.logZ,
                                                     stat_err, settings.tolerance, i);
      snap.max_remainder_contribution =
          conservative_remainder(sampler.max_loglike(), state.log_vol_remaining, state.logZ)
              .max_contribution;
      progress(snap);
    }

    current = sampler.next();
    accumulate(state, logwidth, current.L);
    NEST_REQUIRE(!std::isnan(state.logZ) && !std::isnan(state.H), ErrorCode::kNumericalFailure,
                 "run_nested_integrator: evidence or information became NaN");
  }

  // Not needed for the integral itself, but posterior samples would otherwise
  // have a hole in the most likely region.
  const std::vector<Point> live = sampler.remainder();
  rem = integrate_remainder(live, remainder_inputs(state, logwidth, sampler, settings), rng);
  for (const Point& p : live) out.weights.push_back(make_weight_record(p, logwidth));

  double total_err = rem.totalZerr;
  if (settings.need_robust_remainder_error) {
    total_err = std::max(rem.totalZerr, rem.totalZerr_bootstrapped);
  }

  out.logZ = rem.totalZ;
  out.logZerr = total_err;
  out.samples = sampler.samples();
  out.information = state.H;
  out.niterations = i;
  out.ndraws = sampler.ndraws();
  out.stop_reason = reason;
  out.remainder = rem;

  if (log_enabled(LogLevel::INFO)) {
    std::ostringstream oss;
    oss << "lnZ = " << out.logZ << " +- " << out.logZerr
        << " (H=" << out.information << " nats, " << out.niterations
        << " iterations, " << out.ndraws << " draws, " << to_string(reason) << ")";
    log(LogLevel::INFO, oss.str());
  }
  return out;
}

}  // namespace nest
