#pragma once
/*
================================================================================
Integrator: Nested Sampling Convergence Controller
FILE: cpp/nest/integrator/nested_integrator.hpp

Purpose:
  - Drive a Sampler until the evidence is known to the requested precision,
    or the evaluation budget runs out.
  - Per iteration: draw, shrink volume, record weight, periodically
    re-estimate the live-point remainder, test stopping rules, fold the new
    point into (logZ, H).
  - On exit: integrate the remaining live set once more and append it to the
    weight sequence so posterior reconstruction has no hole at the peak.

Stopping rules (only once more than nlive iterations have elapsed):
  a. budget:    ndraws >= max_samples                 -> MaxSamples
  b. tolerance: totalZerr < tolerance
                AND remainder < max_remainder * Z      (if need_small_remainder)
                AND bootstrap error < tolerance        (if need_robust_remainder_error)
                                                      -> Converged
  c. no improvement: remainderZerr < sqrt(H/N) / 10   -> NoImprovement

Running out of budget is a normal outcome; compare logZerr to the requested
tolerance to tell it apart from convergence.
================================================================================
*/

#include "nest/integrator/point.hpp"
#include "nest/integrator/remainder.hpp"
#include "nest/integrator/sampler.hpp"
#include "nest/integrator/settings.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace nest {

enum class StopReason : int {
  Converged = 0,
  NoImprovement = 1,
  MaxSamples = 2,
};

const char* to_string(StopReason r) noexcept;

// One row of progress, emitted before each draw. Rendering is the caller's job.
struct ProgressSnapshot {
  std::int64_t iteration = 0;
  double total_logZ = 0.0;        // running estimate incl. remainder
  double stat_err = 0.0;          // sqrt(H / N)
  double remainder_err = 0.0;     // bracket width of the remainder
  double current_logL = 0.0;      // likelihood of the point just recorded
  double logZ = 0.0;              // accumulated evidence, remainder excluded
  double log_vol_remaining = 0.0;
  std::uint64_t ndraws = 0;
  double expected_iterations = 0.0;
  double max_remainder_contribution = 0.0;  // Lmax + logVolremaining
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

struct IntegrationResult {
  double logZ = 0.0;
  double logZerr = 0.0;
  std::vector<Point> samples;          // sampler history, untouched
  std::vector<WeightRecord> weights;   // draw order, then final live set
  double information = 0.0;            // H
  std::int64_t niterations = 0;
  std::uint64_t ndraws = 0;
  StopReason stop_reason = StopReason::Converged;
  RemainderEstimate remainder;         // final live-set integration
};

// Extrapolated total iteration count needed to reach `tolerance`, clamped to
// [iteration + 1, iteration + 100000]. Evaluated in log space.
double expected_iterations(int nlive,
                           double Lmax,
                           double logZ,
                           double stat_err,
                           double tolerance,
                           std::int64_t iteration) noexcept;

// Runs the loop. Sampler exceptions propagate unmodified.
// Throws ValidationError on bad settings or nlive_points <= 0.
IntegrationResult run_nested_integrator(Sampler& sampler,
                                        const IntegratorSettings& settings = IntegratorSettings::defaults(),
                                        const ProgressCallback& progress = {});

}  // namespace nest
