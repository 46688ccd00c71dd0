/*
================================================================================
CLI: Evidence Integration Demo (nest_demo)
FILE: cpp/cli/nest_demo_main.cpp

Purpose:
  - Small harness that integrates a 1-D Gaussian likelihood under a uniform
    prior on [-5, 5] and prints the result next to the analytic evidence.
  - Exercises either concrete sampler end to end.

Usage:
  nest_demo [command]

Commands:
  rejection  - Integrate with the rejection sampler
  mcmc       - Integrate with the constrained MCMC sampler
  help       - Show help message (default)
================================================================================
*/

#include "nest/core/errors.hpp"
#include "nest/core/logging.hpp"
#include "nest/integrator/nested_integrator.hpp"
#include "nest/integrator/settings.hpp"
#include "nest/sampling/mcmc_sampler.hpp"
#include "nest/sampling/model.hpp"
#include "nest/sampling/rejection_sampler.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace nest;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3
};

void print_help() {
  std::cout << R"(
nest_demo - Nested Sampling evidence integration demo

Usage:
  nest_demo [command]

Commands:
  rejection     Integrate a 1-D Gaussian with the rejection sampler
  mcmc          Integrate a 1-D Gaussian with the constrained MCMC sampler
  help          Show this help message

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
)";
}

constexpr double kPi = 3.141592653589793238462643383279502884;
constexpr double kPriorWidth = 10.0;

sampling::Model make_gaussian_model() {
  sampling::Model m;
  m.ndim = 1;
  m.transform = [](const std::vector<double>& u) {
    return std::vector<double>{-0.5 * kPriorWidth + kPriorWidth * u[0]};
  };
  m.loglike = [](const std::vector<double>& x) {
    return -0.5 * x[0] * x[0] - 0.5 * std::log(2.0 * kPi);
  };
  return m;
}

void print_result(const IntegrationResult& r) {
  const double analytic = -std::log(kPriorWidth);

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "  lnZ:          " << r.logZ << " +- " << r.logZerr << "\n";
  std::cout << "  analytic lnZ: " << analytic << "\n";
  std::cout << "  deviation:    " << std::fabs(r.logZ - analytic) / r.logZerr << " sigma\n";
  std::cout << "  information:  " << r.information << " nats ("
            << r.information / std::log(2.0) << " bits)\n";
  std::cout << "  iterations:   " << r.niterations << "\n";
  std::cout << "  draws:        " << r.ndraws << "\n";
  std::cout << "  stop reason:  " << to_string(r.stop_reason) << "\n";
}

IntegratorSettings demo_settings() {
  IntegratorSettings s = IntegratorSettings::defaults();
  s.tolerance = 0.05;
  s.max_samples = 2'000'000;
  return s;
}

int cmd_rejection() {
  std::cout << "=== Rejection Sampler ===\n";

  try {
    sampling::LiveSetSettings ls;
    ls.nlive_points = 100;
    sampling::RejectionSampler sampler(make_gaussian_model(), ls);

    const IntegrationResult r = run_nested_integrator(sampler, demo_settings());
    print_result(r);
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_mcmc() {
  std::cout << "=== Constrained MCMC Sampler ===\n";

  try {
    sampling::LiveSetSettings ls;
    ls.nlive_points = 100;
    sampling::McmcSettings mc;
    mc.nsteps = 30;
    sampling::McmcSampler sampler(make_gaussian_model(), ls, mc);

    std::int64_t last_reported = 0;
    const IntegrationResult r = run_nested_integrator(
        sampler, demo_settings(), [&](const ProgressSnapshot& p) {
          if (p.iteration - last_reported < 100) return;
          last_reported = p.iteration;
          std::cout << "  [" << p.iteration << "/" << static_cast<std::int64_t>(p.expected_iterations)
                    << "] lnZ = " << std::setprecision(2) << p.total_logZ
                    << " +- " << std::setprecision(3) << p.stat_err << " + " << p.remainder_err
                    << " | L=" << std::setprecision(2) << p.current_logL << "\n";
        });
    print_result(r);
    std::cout << "  final step scale: " << sampler.scale() << "\n";
    return ExitCode::SUCCESS;

  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int main(int argc, char** argv) {
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd == "rejection") {
    return cmd_rejection();
  }

  if (cmd == "mcmc") {
    return cmd_mcmc();
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'nest_demo help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
