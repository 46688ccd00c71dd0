/*
  Nested Integrator End-to-End Selftest

  Objective
  ---------
  Drive the full convergence loop against samplers with known answers:
    1) Flat likelihood: logZ converges to L; remainder bracket collapses.
    2) 1-D Gaussian under a uniform prior on [-5, 5] (analytic logZ = -ln 10),
       with both the rejection and the constrained-MCMC sampler.
    3) Sample budget below what convergence needs: stops exactly at the
       budget and reports an error above tolerance.
    4) Bad configuration is rejected before the first draw; sampler
       exceptions reach the caller unmodified.

  Expected use
  ------------
      ./nested_integrator_selftest
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"
#include "nest/core/logging.hpp"
#include "nest/integrator/nested_integrator.hpp"
#include "nest/integrator/sampler.hpp"
#include "nest/sampling/mcmc_sampler.hpp"
#include "nest/sampling/model.hpp"
#include "nest/sampling/rejection_sampler.hpp"

namespace nest {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  got " << got << ", expected " << exp << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

// -----------------------------
// Test samplers
// -----------------------------

// Every point has the same likelihood; one draw per next().
class FlatSampler final : public Sampler {
 public:
  FlatSampler(int nlive, double L) : nlive_(nlive), L_(L) {
    for (int i = 0; i < nlive_; ++i) {
      history_.push_back(make_point());
    }
  }

  int nlive_points() const override { return nlive_; }
  double max_loglike() const override { return L_; }
  std::uint64_t ndraws() const override { return ndraws_; }
  const std::vector<Point>& samples() const override { return history_; }

  Point next() override {
    history_.push_back(make_point());
    return make_point();
  }

  std::vector<Point> remainder() const override {
    std::vector<Point> live;
    for (int i = 0; i < nlive_; ++i) {
      Point p;
      p.u = {(i + 0.5) / nlive_};
      p.x = p.u;
      p.L = L_;
      live.push_back(p);
    }
    return live;
  }

 private:
  Point make_point() {
    ++ndraws_;
    Point p;
    p.u = {0.5};
    p.x = {0.5};
    p.L = L_;
    return p;
  }

  int nlive_;
  double L_;
  std::uint64_t ndraws_ = 0;
  std::vector<Point> history_;
};

// Live likelihoods 0, 1, ..., N-1; every replacement sits one nat above the
// current best, so the remainder always dominates and never converges.
class LadderSampler final : public Sampler {
 public:
  explicit LadderSampler(int nlive) : nlive_(nlive) {
    for (int i = 0; i < nlive_; ++i) {
      Point p;
      p.u = {0.0};
      p.x = {0.0};
      p.L = static_cast<double>(i);
      live_.push_back(p);
      ++ndraws_;
    }
  }

  int nlive_points() const override { return nlive_; }
  double max_loglike() const override { return live_.back().L; }
  std::uint64_t ndraws() const override { return ndraws_; }
  const std::vector<Point>& samples() const override { return live_; }

  Point next() override {
    Point worst = live_.front();
    live_.erase(live_.begin());
    Point p;
    p.u = {0.0};
    p.x = {0.0};
    p.L = live_.back().L + 1.0;
    live_.push_back(p);
    ++ndraws_;
    return worst;
  }

  std::vector<Point> remainder() const override { return live_; }

 private:
  int nlive_;
  std::uint64_t ndraws_ = 0;
  std::vector<Point> live_;
};

struct SamplerExploded : std::runtime_error {
  SamplerExploded() : std::runtime_error("sampler exploded") {}
};

class ExplodingSampler final : public Sampler {
 public:
  int nlive_points() const override { return 10; }
  double max_loglike() const override { return 0.0; }
  std::uint64_t ndraws() const override { return 0; }
  const std::vector<Point>& samples() const override { return empty_; }
  Point next() override { throw SamplerExploded(); }
  std::vector<Point> remainder() const override { return empty_; }

 private:
  std::vector<Point> empty_;
};

sampling::Model gaussian_model() {
  sampling::Model m;
  m.ndim = 1;
  m.transform = [](const std::vector<double>& u) {
    return std::vector<double>{-5.0 + 10.0 * u[0]};
  };
  m.loglike = [](const std::vector<double>& x) {
    return -0.5 * x[0] * x[0] - 0.5 * std::log(2.0 * 3.141592653589793238462643383279502884);
  };
  return m;
}

// -----------------------------
// Tests
// -----------------------------
void test_flat_likelihood() {
  const int N = 200;
  const double L = -7.5;
  FlatSampler sampler(N, L);

  std::vector<ProgressSnapshot> snaps;
  const IntegrationResult r = run_nested_integrator(
      sampler, IntegratorSettings::defaults(),
      [&](const ProgressSnapshot& s) { snaps.push_back(s); });

  expect_near(r.logZ, L, 0.01, "flat: logZ converges to L");
  expect_true(r.stop_reason == StopReason::NoImprovement, "flat: stops on diminishing returns");
  expect_true(r.niterations == N + 1, "flat: stops at the first eligible iteration");
  expect_true(r.remainder.remainderZerr < 1e-12, "flat: remainder bracket collapses");
  expect_true(r.weights.size() == static_cast<std::size_t>(r.niterations + N),
              "flat: weights = iterations + final live set");
  expect_true(is_finite(r.information), "flat: information finite");

  expect_true(snaps.size() == static_cast<std::size_t>(r.niterations - 1),
              "flat: one progress snapshot per completed iteration");
  bool vol_dec = true;
  bool logz_nondec = true;
  for (std::size_t k = 1; k < snaps.size(); ++k) {
    if (!(snaps[k].log_vol_remaining < snaps[k - 1].log_vol_remaining)) vol_dec = false;
    if (snaps[k].logZ < snaps[k - 1].logZ) logz_nondec = false;
  }
  expect_true(vol_dec, "flat: logVolremaining strictly decreasing");
  expect_true(logz_nondec, "flat: accumulated logZ non-decreasing");
}

void test_flat_every_iteration_remainder() {
  FlatSampler sampler(30, 2.0);
  IntegratorSettings s;
  s.remainder_interval = 1;
  s.bootstrap_rounds = 5;
  const IntegrationResult r = run_nested_integrator(sampler, s);
  expect_true(r.niterations == 31, "flat: interval 1 still stops right after N iterations");
  expect_near(r.logZ, 2.0, 0.05, "flat: interval 1 logZ near L");
}

void check_gaussian(const IntegrationResult& r, std::string_view label) {
  const double analytic = -std::log(10.0);
  const std::string tag(label);

  expect_true(r.stop_reason != StopReason::MaxSamples, tag + ": converged without a budget");
  expect_true(r.logZerr > 0.0 && is_finite(r.logZerr), tag + ": logZerr finite and positive");
  if (!(std::fabs(r.logZ - analytic) < 3.0 * r.logZerr)) {
    fail(tag + ": |logZ - analytic| < 3 logZerr");
    std::cerr << "  logZ " << r.logZ << " analytic " << analytic << " logZerr " << r.logZerr << "\n";
  } else {
    pass(tag + ": |logZ - analytic| < 3 logZerr");
  }
  expect_true(r.weights.size() == static_cast<std::size_t>(r.niterations + 50),
              tag + ": weights = iterations + final live set");

  // Posterior weights should integrate to ~1 and centre on 0.
  double wsum = 0.0;
  double xmean = 0.0;
  for (const WeightRecord& w : r.weights) {
    const double wi = std::exp(w.logwidth + w.L - r.logZ);
    wsum += wi;
    xmean += wi * w.x[0];
  }
  xmean /= wsum;
  expect_near(wsum, 1.0, 0.1, tag + ": posterior weights sum to ~1");
  expect_near(xmean, 0.0, 0.5, tag + ": posterior mean ~ 0");
  expect_true(is_finite(r.information), tag + ": information finite");
}

void test_gaussian_rejection() {
  sampling::LiveSetSettings ls;
  ls.nlive_points = 50;
  ls.seed = 20131;
  sampling::RejectionSampler sampler(gaussian_model(), ls);

  IntegratorSettings s;
  s.tolerance = 0.05;
  const IntegrationResult r = run_nested_integrator(sampler, s);
  check_gaussian(r, "gaussian/rejection");
  expect_true(r.ndraws == sampler.ndraws(), "gaussian/rejection: ndraws passed through");
  expect_true(r.samples.size() == sampler.samples().size(), "gaussian/rejection: samples passed through");
}

void test_gaussian_mcmc() {
  sampling::LiveSetSettings ls;
  ls.nlive_points = 50;
  ls.seed = 777;
  sampling::McmcSettings mc;
  mc.nsteps = 25;
  sampling::McmcSampler sampler(gaussian_model(), ls, mc);

  IntegratorSettings s;
  s.tolerance = 0.05;
  const IntegrationResult r = run_nested_integrator(sampler, s);
  check_gaussian(r, "gaussian/mcmc");
}

void test_budget_stop() {
  const int N = 20;
  LadderSampler sampler(N);
  IntegratorSettings s;
  s.max_samples = 3 * N;

  const IntegrationResult r = run_nested_integrator(sampler, s);
  expect_true(r.stop_reason == StopReason::MaxSamples, "budget: stops on max_samples");
  expect_true(r.ndraws == static_cast<std::uint64_t>(3 * N), "budget: stops exactly at the draw budget");
  expect_true(r.niterations == 2 * N, "budget: iteration count = budget - initial live set");
  expect_true(r.logZerr > s.tolerance, "budget: reported error above tolerance");
  expect_true(r.weights.size() == static_cast<std::size_t>(r.niterations + N), "budget: live set appended");
}

void test_robust_error_reporting() {
  LadderSampler sampler(20);
  IntegratorSettings s;
  s.max_samples = 60;
  s.need_robust_remainder_error = true;

  const IntegrationResult r = run_nested_integrator(sampler, s);
  const double expected = std::max(r.remainder.totalZerr, r.remainder.totalZerr_bootstrapped);
  expect_true(r.logZerr == expected, "robust: reported error is max(bracket, bootstrap)");
}

void test_rejects_bad_config() {
  FlatSampler zero(0, 1.0);
  bool threw = false;
  try {
    (void)run_nested_integrator(zero);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "nlive_points 0 rejected");
  expect_true(zero.ndraws() == 0, "rejected before the first draw");

  FlatSampler ok(10, 1.0);
  IntegratorSettings s;
  s.tolerance = -1.0;
  threw = false;
  try {
    (void)run_nested_integrator(ok, s);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "negative tolerance rejected");

  sampling::LiveSetSettings ls;
  ls.nlive_points = 0;
  threw = false;
  try {
    sampling::RejectionSampler bad(gaussian_model(), ls);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "RejectionSampler rejects nlive_points 0");
}

void test_sampler_failure_propagates() {
  ExplodingSampler sampler;
  bool caught = false;
  try {
    (void)run_nested_integrator(sampler);
  } catch (const SamplerExploded&) {
    caught = true;
  }
  expect_true(caught, "sampler exception reaches caller unmodified");

  // Flat likelihood: no point can beat the constraint.
  sampling::Model flat;
  flat.ndim = 2;
  flat.loglike = [](const std::vector<double>&) { return 0.0; };
  sampling::LiveSetSettings ls;
  ls.nlive_points = 5;
  ls.max_attempts = 100;
  sampling::RejectionSampler rs(flat, ls);
  bool numerical = false;
  try {
    (void)rs.next();
  } catch (const NumericalError& e) {
    numerical = (e.code() == ErrorCode::kSamplerFailure);
  }
  expect_true(numerical, "rejection sampler gives up after max_attempts");

  sampling::McmcSampler ms(flat, ls);
  numerical = false;
  try {
    (void)ms.next();
  } catch (const NumericalError& e) {
    numerical = (e.code() == ErrorCode::kSamplerFailure);
  }
  expect_true(numerical, "mcmc sampler gives up after max_attempts");
}

// A proposal cap below the walk length ends the walk early; it only fails
// when the walk holds no point above the constraint.
void test_mcmc_attempt_cap_shorter_than_walk() {
  sampling::LiveSetSettings ls;
  ls.nlive_points = 20;
  ls.seed = 31;
  ls.max_attempts = 10;
  sampling::McmcSettings mc;
  mc.nsteps = 20;
  sampling::McmcSampler sampler(gaussian_model(), ls, mc);

  bool ok = true;
  double prev_worst = sampler.remainder().front().L;
  try {
    for (int k = 0; k < 30; ++k) {
      const std::uint64_t before = sampler.ndraws();
      const Point removed = sampler.next();
      if (!(removed.L <= prev_worst)) ok = false;
      if (sampler.ndraws() - before > ls.max_attempts) ok = false;
      const std::vector<Point> live = sampler.remainder();
      if (!(live.front().L > removed.L)) ok = false;
      prev_worst = live.front().L;
    }
  } catch (const NestError& e) {
    ok = false;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(ok, "mcmc: max_attempts < nsteps returns valid points without throwing");

  IntegratorSettings s;
  s.tolerance = 0.1;
  sampling::McmcSampler capped(gaussian_model(), ls, mc);
  bool ran = true;
  try {
    const IntegrationResult r = run_nested_integrator(capped, s);
    ran = is_finite(r.logZ) && r.logZerr > 0.0;
  } catch (const NestError& e) {
    ran = false;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(ran, "mcmc: capped walk completes a full integration");
}

}  // namespace
}  // namespace nest

int main() {
  nest::set_log_level(nest::LogLevel::WARN);

  nest::test_flat_likelihood();
  nest::test_flat_every_iteration_remainder();
  nest::test_gaussian_rejection();
  nest::test_gaussian_mcmc();
  nest::test_budget_stop();
  nest::test_robust_error_reporting();
  nest::test_rejects_bad_config();
  nest::test_sampler_failure_propagates();
  nest::test_mcmc_attempt_cap_shorter_than_walk();

  if (nest::g_fail_count != 0) {
    std::cerr << "\nnested_integrator_selftest: " << nest::g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nnested_integrator_selftest: all checks passed\n";
  return 0;
}
