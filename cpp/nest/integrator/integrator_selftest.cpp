/*
  Integrator Building-Block Selftest

  Objective
  ---------
  Deterministic microtests for the pieces the convergence loop is built from:
    1) Evidence accumulator: -inf identity, closed-form update, monotone logZ.
    2) Volume tracker: first shell width, strict shrinkage.
    3) Remainder estimator: hand-computed bracket, flat live set, bootstrap
       determinism and a seed-for-seed replay of the bootstrap spread.
    4) Conservative bound and iteration extrapolation.

  Expected use
  ------------
      ./integrator_selftest
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <string_view>
#include <vector>

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"
#include "nest/core/rng.hpp"
#include "nest/integrator/evidence.hpp"
#include "nest/integrator/nested_integrator.hpp"
#include "nest/integrator/remainder.hpp"
#include "nest/integrator/volume.hpp"

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

std::vector<Point> live_from(const std::vector<double>& logLs) {
  std::vector<Point> pts;
  for (std::size_t i = 0; i < logLs.size(); ++i) {
    Point p;
    p.u = {static_cast<double>(i) / static_cast<double>(logLs.size() + 1)};
    p.x = p.u;
    p.L = logLs[i];
    pts.push_back(p);
  }
  return pts;
}

// -----------------------------
// Evidence accumulator
// -----------------------------
void test_merge_identity() {
  const double logZ = -4.2;
  const double H = 1.3;
  const EvidenceUpdate u = merge_evidence(logZ, H, kNegInf, -2.0);
  expect_true(u.logZ == logZ, "merge with -inf weight keeps logZ");
  expect_true(u.H == H, "merge with -inf weight keeps H");
}

void test_merge_closed_form() {
  // Z = 0.5, new mass 0.25 * 2 = 0.5  ->  Z' = 1
  // H' = 0.5 ln2 + 0.5 (0.2 + ln 0.5) - 0 = 0.1
  const EvidenceUpdate u = merge_evidence(std::log(0.5), 0.2, std::log(0.25), std::log(2.0));
  expect_near(u.logZ, 0.0, 1e-14, "merge logZ matches direct sum");
  expect_near(u.H, 0.1, 1e-14, "merge H matches closed form");
}

void test_merge_monotone() {
  IntegrationState s = seed_state(log_shell_width(25), -50.0);
  bool monotone = true;
  bool finite = true;
  for (int i = 0; i < 500; ++i) {
    const double before = s.logZ;
    const double L = -50.0 + 0.1 * i;
    accumulate(s, log_shell_width(25) - i / 25.0, L);
    if (s.logZ < before) monotone = false;
    if (!is_finite(s.H)) finite = false;
  }
  expect_true(monotone, "logZ is non-decreasing over merges");
  expect_true(finite, "H stays finite over merges");
}

void test_seed_and_stat() {
  const double lw = log_shell_width(100);
  const IntegrationState s = seed_state(lw, -3.0);
  expect_near(s.logZ, lw - 3.0, 1e-14, "seed logZ = logwidth + L");
  expect_near(s.H, -lw, 1e-14, "seed H = L - logZ");
  expect_true(s.log_vol_remaining == 0.0, "seed starts at full prior volume");

  expect_near(statistical_error(0.5, 50), 0.1, 1e-15, "stat error sqrt(H/N)");
  expect_true(statistical_error(-1e-6, 50) == 0.0, "negative H gives zero stat error");
  expect_true(std::isinf(statistical_error(std::numeric_limits<double>::infinity(), 50)),
              "infinite H gives infinite stat error");
}

// -----------------------------
// Volume tracker
// -----------------------------
void test_volume_steps() {
  const int N = 10;
  const VolumeStep first = shrink_volume(0.0, N);
  expect_near(first.logwidth, std::log(1.0 - std::exp(-0.1)), 1e-14, "first logwidth = log(1 - exp(-1/N))");
  expect_near(first.log_vol_remaining, -0.1, 1e-15, "first logVol = -1/N");

  double logvol = 0.0;
  double prev_width = 1.0;
  bool vol_dec = true;
  bool width_dec = true;
  for (int i = 0; i < 1000; ++i) {
    const VolumeStep s = shrink_volume(logvol, N);
    if (!(s.log_vol_remaining < logvol)) vol_dec = false;
    if (!(s.logwidth < prev_width)) width_dec = false;
    logvol = s.log_vol_remaining;
    prev_width = s.logwidth;
  }
  expect_true(vol_dec, "logVolremaining strictly decreasing");
  expect_true(width_dec, "logwidth strictly decreasing");
  expect_near(logvol, -100.0, 1e-9, "1000 steps of N=10 remove 100 nats of volume");
}

// -----------------------------
// Remainder estimator
// -----------------------------
void test_remainder_hand_computed() {
  // Live likelihoods 1,2,3,4 (linear), global max 5, shell width 0.1, Z so far 1.
  //   mid   = 1+2+3+4 = 10   -> total 1 + 1.0
  //   upper = 2+3+5+5 = 15   -> total 1 + 1.5
  //   lower = 1+1+2+3 = 7    -> total 1 + 0.7
  const auto live = live_from({std::log(1.0), std::log(2.0), std::log(3.0), std::log(4.0)});
  RemainderInputs in;
  in.logwidth = std::log(0.1);
  in.logZ = 0.0;
  in.H = 0.5;
  in.global_Lmax = std::log(5.0);
  in.nlive = 4;

  Rng64 rng(11);
  const RemainderEstimate r = integrate_remainder(live, in, rng);

  expect_near(r.remainderZ, 0.0, 1e-12, "remainderZ = logwidth + log(sum L)");
  expect_near(r.totalZ, std::log(2.0), 1e-12, "totalZ = logaddexp(logZ, remainderZ)");
  expect_near(r.logZup, std::log(2.5), 1e-12, "upper bracket uses global Lmax twice");
  expect_near(r.logZlo, std::log(1.7), 1e-12, "lower bracket double counts the bottom");
  expect_near(r.remainderZerr, std::log(2.5 / 1.7), 1e-12, "remainderZerr = logZup - logZlo");

  const double stat = std::sqrt(0.5 / 4.0);
  expect_near(r.totalZerr, r.remainderZerr + stat, 1e-12, "totalZerr adds sqrt(H/N)");
  expect_near(r.totalZerr_bootstrapped, r.bootstrap_err + stat, 1e-12, "bootstrapped error adds sqrt(H/N)");
  expect_true(r.bootstrap_err >= 0.0 && is_finite(r.bootstrap_err), "bootstrap spread is finite and >= 0");
}

void test_remainder_flat() {
  const auto live = live_from(std::vector<double>(5, -3.0));
  RemainderInputs in;
  in.logwidth = std::log(0.01);
  in.logZ = -6.0;
  in.H = 0.8;
  in.global_Lmax = -3.0;
  in.nlive = 5;

  Rng64 rng(5);
  const RemainderEstimate r = integrate_remainder(live, in, rng);
  expect_near(r.logZup, r.totalZ, 1e-12, "flat live set: upper == mid");
  expect_near(r.logZlo, r.totalZ, 1e-12, "flat live set: lower == mid");
  expect_true(r.remainderZerr < 1e-12, "flat live set: bracket width ~ 0");
  expect_true(r.bootstrap_err < 1e-12, "flat live set: bootstrap spread ~ 0");
  expect_near(r.remainderZ, std::log(0.01) + std::log(5.0) - 3.0, 1e-12, "flat live set: remainderZ");
}

void test_bootstrap_identity_resample() {
  const std::vector<double> logLs{-9.0, -7.5, -7.0, -4.0, -3.5, -1.0};
  const double Lmax = -0.5;
  const double L0 = logLs.back();

  std::vector<double> Ls;
  for (double L : logLs) Ls.push_back(std::exp(L - L0));
  std::vector<double> LsMax = Ls;
  LsMax.back() = std::exp(Lmax - L0);

  const std::vector<std::size_t> identity{0, 1, 2, 3, 4, 5};
  const BracketSums b = bracket_sums(Ls, LsMax, identity);

  RemainderInputs in;
  in.logwidth = std::log(0.02);
  in.logZ = -5.0;
  in.H = 1.0;
  in.global_Lmax = Lmax;
  in.nlive = 6;

  Rng64 rng(99);
  const RemainderEstimate r = integrate_remainder(live_from(logLs), in, rng);

  expect_near(logaddexp(in.logZ, in.logwidth + std::log(b.upper) + L0), r.logZup, 1e-12,
              "identity resample reproduces the upper bracket");
  expect_near(logaddexp(in.logZ, in.logwidth + std::log(b.lower) + L0), r.logZlo, 1e-12,
              "identity resample reproduces the lower bracket");

  Rng64 rng_a(1234);
  Rng64 rng_b(1234);
  const RemainderEstimate a = integrate_remainder(live_from(logLs), in, rng_a);
  const RemainderEstimate c = integrate_remainder(live_from(logLs), in, rng_b);
  expect_true(a.bootstrap_err == c.bootstrap_err, "bootstrap is deterministic for a fixed seed");
}

// Recompute the bootstrap spread from the same seed: per round draw n indices,
// sort, take both staircase edges; spread is max - min over every total.
void test_bootstrap_replay() {
  const std::vector<double> logLs{-12.0, -8.0, -6.5, -5.0, -2.0, -1.5, 0.0};
  const std::size_t n = logLs.size();
  const double Lmax = 0.7;
  const double L0 = logLs.back();

  RemainderInputs in;
  in.logwidth = std::log(0.03);
  in.logZ = -3.0;
  in.H = 0.9;
  in.global_Lmax = Lmax;
  in.nlive = static_cast<int>(n);
  in.bootstrap_rounds = 9;

  Rng64 rng(4242);
  const RemainderEstimate r = integrate_remainder(live_from(logLs), in, rng);

  Rng64 replay(4242);
  double hi = kNegInf;
  double lo = -kNegInf;
  for (int round = 0; round < in.bootstrap_rounds; ++round) {
    std::vector<std::size_t> idx(n);
    for (std::size_t k = 0; k < n; ++k) idx[k] = replay.next_index(n);
    std::sort(idx.begin(), idx.end());

    double upper = 0.0;
    for (std::size_t k = 1; k < n; ++k) {
      upper += std::exp((idx[k] == n - 1 ? Lmax : logLs[idx[k]]) - L0);
    }
    upper += std::exp((idx[n - 1] == n - 1 ? Lmax : logLs[idx[n - 1]]) - L0);

    double lower = 0.0;
    for (std::size_t k = 0; k + 1 < n; ++k) lower += std::exp(logLs[idx[k]] - L0);
    lower += std::exp(logLs[idx[0]] - L0);

    const double up = logaddexp(in.logZ, in.logwidth + std::log(upper) + L0);
    const double dn = logaddexp(in.logZ, in.logwidth + std::log(lower) + L0);
    hi = std::max({hi, up, dn});
    lo = std::min({lo, up, dn});
  }

  expect_near(r.bootstrap_err, hi - lo, 1e-12, "bootstrap spread matches sorted-resample replay");
  expect_true(r.bootstrap_err > 0.0, "distinct live likelihoods give a non-zero bootstrap spread");
  expect_near(r.totalZerr_bootstrapped, (hi - lo) + std::sqrt(0.9 / 7.0), 1e-12,
              "bootstrapped total error = replayed spread + sqrt(H/N)");
}

void test_remainder_rejects_bad_input() {
  RemainderInputs in;
  in.nlive = 3;
  Rng64 rng(1);

  bool threw = false;
  try {
    (void)integrate_remainder({}, in, rng);
  } catch (const NestError& e) {
    threw = (e.code() == ErrorCode::kInvalidInput);
  }
  expect_true(threw, "empty live set rejected");

  threw = false;
  try {
    (void)integrate_remainder(live_from({-1.0, -3.0, -2.0}), in, rng);
  } catch (const NestError& e) {
    threw = (e.code() == ErrorCode::kInvalidInput);
  }
  expect_true(threw, "unsorted live set rejected");
}

// -----------------------------
// Conservative bound + ETA
// -----------------------------
void test_conservative_and_eta() {
  const ConservativeEstimate c = conservative_remainder(0.0, -1.0, 0.0);
  expect_near(c.max_contribution, -1.0, 1e-15, "conservative: Lmax + logVol");
  expect_near(c.logZ_gap, std::log1p(std::exp(-1.0)), 1e-14, "conservative: logZup - logZ");

  const double eta = expected_iterations(100, 0.0, -5.0, 0.05, 0.01, 250);
  expect_true(eta >= 251.0 && eta <= 100250.0, "expected iterations clamped to window");

  const double eta_far = expected_iterations(100, 1e6, -5.0, 0.05, 0.01, 10);
  expect_near(eta_far, 100010.0, 0.0, "expected iterations capped at +100000");
}

}  // namespace
}  // namespace nest

int main() {
  nest::test_merge_identity();
  nest::test_merge_closed_form();
  nest::test_merge_monotone();
  nest::test_seed_and_stat();
  nest::test_volume_steps();
  nest::test_remainder_hand_computed();
  nest::test_remainder_flat();
  nest::test_bootstrap_identity_resample();
  nest::test_bootstrap_replay();
  nest::test_remainder_rejects_bad_input();
  nest::test_conservative_and_eta();

  if (nest::g_fail_count != 0) {
    std::cerr << "\nintegrator_selftest: " << nest::g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nintegrator_selftest: all checks passed\n";
  return 0;
}
