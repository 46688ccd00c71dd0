/*
  Core Selftest

  Objective
  ---------
  Framework-free checks for the base layer every integrator module leans on:
    1) Log-space arithmetic is exact at -inf and does not overflow.
    2) The RNG is deterministic and stays in range.
    3) Errors carry their code and call site; settings reject bad values.
    4) Log level round-trips.

  Expected use
  ------------
      ./core_selftest
  Non-zero return code indicates failure.
*/

#include <atomic>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"
#include "nest/core/logging.hpp"
#include "nest/core/rng.hpp"
#include "nest/integrator/settings.hpp"
#include "nest/sampling/model.hpp"

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

template <class Fn>
void expect_validation_error(Fn&& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  expected ValidationError, nothing thrown\n";
  } catch (const ValidationError&) {
    pass(msg);
  }
}

void test_logaddexp() {
  expect_true(logaddexp(kNegInf, -3.0) == -3.0, "logaddexp(-inf, x) == x");
  expect_true(logaddexp(2.5, kNegInf) == 2.5, "logaddexp(x, -inf) == x");
  expect_true(logaddexp(kNegInf, kNegInf) == kNegInf, "logaddexp(-inf, -inf) == -inf");
  expect_near(logaddexp(std::log(2.0), std::log(2.0)), std::log(4.0), 1e-14, "logaddexp adds masses");
  expect_near(logaddexp(1000.0, 1000.0), 1000.0 + std::log(2.0), 1e-12, "logaddexp large operands do not overflow");
  expect_near(logaddexp(-1000.0, -1001.0), -1000.0 + std::log1p(std::exp(-1.0)), 1e-12,
              "logaddexp tiny operands do not underflow");
}

void test_safe_math() {
  expect_true(safe_sqrt(-1e-9) == 0.0, "safe_sqrt clamps negative to 0");
  expect_true(safe_sqrt(std::numeric_limits<double>::quiet_NaN()) == 0.0, "safe_sqrt maps NaN to 0");
  expect_near(safe_sqrt(0.25), 0.5, 1e-15, "safe_sqrt regular value");
  expect_true(std::isinf(safe_sqrt(std::numeric_limits<double>::infinity())),
              "safe_sqrt keeps +inf (infinite information is not zero error)");
  expect_near(log_shell_width(1), std::log(1.0 - std::exp(-1.0)), 1e-14, "log_shell_width(1)");
  expect_near(log_shell_width(400), std::log(1.0 - std::exp(-1.0 / 400.0)), 1e-12, "log_shell_width(400)");
}

void test_rng() {
  Rng64 a(42);
  Rng64 b(42);
  bool same = true;
  bool in_range = true;
  for (int i = 0; i < 1000; ++i) {
    const double ua = a.next_u01();
    if (ua != b.next_u01()) same = false;
    if (!(ua > 0.0 && ua < 1.0)) in_range = false;
  }
  expect_true(same, "Rng64 same seed -> same stream");
  expect_true(in_range, "Rng64 next_u01 in (0,1)");

  Rng64 c(7);
  bool idx_ok = true;
  for (int i = 0; i < 1000; ++i) {
    if (c.next_index(13) >= 13) idx_ok = false;
  }
  expect_true(idx_ok, "Rng64 next_index in [0,n)");

  Rng64 zero(0);
  expect_true(zero.next_u64() != 0, "Rng64 zero seed is remapped");

  Rng64 g(3);
  double sum = 0.0;
  double sum2 = 0.0;
  const int n = 20000;
  for (int i = 0; i < n; ++i) {
    const double z = g.next_normal();
    sum += z;
    sum2 += z * z;
  }
  expect_near(sum / n, 0.0, 0.05, "Rng64 next_normal mean ~ 0");
  expect_near(sum2 / n, 1.0, 0.05, "Rng64 next_normal variance ~ 1");
}

void test_errors() {
  try {
    NEST_REQUIRE(false, ErrorCode::kInvalidConfig, "bad knob");
    fail("NEST_REQUIRE(false) must throw");
  } catch (const ValidationError& e) {
    expect_true(e.code() == ErrorCode::kInvalidConfig, "ValidationError carries kInvalidConfig");
    expect_true(e.message() == "bad knob", "error message preserved");
    expect_true(!e.file().empty() && e.line() > 0, "error carries call site");
    expect_true(std::string(e.what()).find("InvalidConfig") != std::string::npos, "what() names the code");
  }

  try {
    NEST_THROW(ErrorCode::kSamplerFailure, "sampler stuck");
    fail("NEST_THROW must throw");
  } catch (const NumericalError& e) {
    expect_true(e.code() == ErrorCode::kSamplerFailure, "sampler failure maps to NumericalError");
  }

  try {
    NEST_THROW(ErrorCode::kInvalidInput, "bad live set");
    fail("NEST_THROW must throw");
  } catch (const NestError& e) {
    expect_true(e.code() == ErrorCode::kInvalidInput, "invalid input maps to NestError");
  }

  bool no_throw = true;
  try {
    NEST_REQUIRE(true, ErrorCode::kInternal, "never");
  } catch (const NestError&) {
    no_throw = false;
  }
  expect_true(no_throw, "NEST_REQUIRE(true) does not throw");
}

void test_settings() {
  bool defaults_ok = true;
  try {
    IntegratorSettings::defaults().validate_or_throw();
  } catch (const ValidationError&) {
    defaults_ok = false;
  }
  expect_true(defaults_ok, "default IntegratorSettings validate");
  expect_near(IntegratorSettings::defaults().tolerance, 0.01, 0.0, "default tolerance is 0.01");

  expect_validation_error([] {
    IntegratorSettings s;
    s.tolerance = 0.0;
    s.validate_or_throw();
  }, "tolerance 0 rejected");
  expect_validation_error([] {
    IntegratorSettings s;
    s.tolerance = std::numeric_limits<double>::quiet_NaN();
    s.validate_or_throw();
  }, "tolerance NaN rejected");
  expect_validation_error([] {
    IntegratorSettings s;
    s.max_samples = 0;
    s.validate_or_throw();
  }, "max_samples 0 rejected");
  expect_validation_error([] {
    IntegratorSettings s;
    s.max_remainder = 1.5;
    s.validate_or_throw();
  }, "max_remainder > 1 rejected");
  expect_validation_error([] {
    IntegratorSettings s;
    s.bootstrap_rounds = 0;
    s.validate_or_throw();
  }, "bootstrap_rounds 0 rejected");
  expect_validation_error([] {
    IntegratorSettings s;
    s.remainder_interval = 0;
    s.validate_or_throw();
  }, "remainder_interval 0 rejected");

  expect_validation_error([] {
    sampling::LiveSetSettings s;
    s.nlive_points = 0;
    s.validate_or_throw();
  }, "nlive_points 0 rejected");
  expect_validation_error([] {
    sampling::LiveSetSettings s;
    s.nlive_points = -5;
    s.validate_or_throw();
  }, "negative nlive_points rejected");
  expect_validation_error([] {
    sampling::McmcSettings s;
    s.initial_scale = 0.0;
    s.validate_or_throw();
  }, "mcmc scale 0 rejected");
  expect_validation_error([] {
    sampling::Model m;
    m.ndim = 2;
    m.validate_or_throw();
  }, "model without loglike rejected");
}

void test_logging() {
  const LogLevel before = get_log_level();
  set_log_level(LogLevel::WARN);
  expect_true(get_log_level() == LogLevel::WARN, "log level round-trips");
  expect_true(!log_enabled(LogLevel::INFO), "INFO suppressed at WARN");
  expect_true(log_enabled(LogLevel::ERROR), "ERROR emitted at WARN");
  log(LogLevel::INFO, "this line must not appear");

  static_assert(noexcept(log(LogLevel::WARN, std::string())), "log must be noexcept");
  static_assert(noexcept(set_log_level(LogLevel::INFO)), "set_log_level must be noexcept");

  // Concurrent writers: every call returns, none throws through.
  std::atomic<int> done{0};
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([t, &done] {
      for (int k = 0; k < 3; ++k) {
        log(LogLevel::WARN, "core_selftest writer " + std::to_string(t) + " line " + std::to_string(k));
      }
      done.fetch_add(1);
    });
  }
  for (std::thread& w : writers) w.join();
  expect_true(done.load() == 4, "concurrent log calls all return");
  set_log_level(before);
}

}  // namespace
}  // namespace nest

int main() {
  nest::test_logaddexp();
  nest::test_safe_math();
  nest::test_rng();
  nest::test_errors();
  nest::test_settings();
  nest::test_logging();

  if (nest::g_fail_count != 0) {
    std::cerr << "\ncore_selftest: " << nest::g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\ncore_selftest: all checks passed\n";
  return 0;
}
