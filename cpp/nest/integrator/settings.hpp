#pragma once
/*
================================================================================
Integrator: Settings
FILE: cpp/nest/integrator/settings.hpp

Purpose:
  - Centralize every knob of the evidence integration loop into a single
    validated object.
  - Deterministic results: the bootstrap RNG seed lives here too, so the same
    settings + the same sampler stream reproduce the same run.

Hardening:
  - validate_or_throw() rejects nonsensical values before the first draw.
  - Conservative defaults (tolerance 0.01 nats, remainder below 10% of Z).
================================================================================
*/

#include <cmath>
#include <cstdint>
#include <optional>

#include "nest/core/errors.hpp"

namespace nest {

struct IntegratorSettings {
  // Target uncertainty on log Z (nats).
  double tolerance = 0.01;

  // Budget on cumulative likelihood evaluations; unset = no budget.
  std::optional<std::uint64_t> max_samples;

  // Require the live-point remainder to be a small fraction of Z before
  // accepting the tolerance rule.
  bool need_small_remainder = true;

  // Fraction threshold used by need_small_remainder.
  double max_remainder = 0.1;

  // Also require the bootstrap error within tolerance; report the larger of
  // bracket and bootstrap errors.
  bool need_robust_remainder_error = false;

  // Bootstrap resamples per remainder evaluation.
  int bootstrap_rounds = 20;

  // Once past nlive iterations, re-evaluate the remainder every this many.
  int remainder_interval = 10;

  // Seed for the bootstrap resampling stream.
  std::uint64_t seed = 1;

  void validate_or_throw() const {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
      throw ValidationError("IntegratorSettings: tolerance must be finite and > 0");
    }
    if (max_samples.has_value() && *max_samples == 0) {
      throw ValidationError("IntegratorSettings: max_samples must be >= 1 when set");
    }
    if (!std::isfinite(max_remainder) || max_remainder <= 0.0 || max_remainder > 1.0) {
      throw ValidationError("IntegratorSettings: max_remainder must be (0,1]");
    }
    if (bootstrap_rounds < 1 || bootstrap_rounds > 100000) {
      throw ValidationError("IntegratorSettings: bootstrap_rounds outside sane bounds");
    }
    if (remainder_interval < 1) {
      throw ValidationError("IntegratorSettings: remainder_interval must be >= 1");
    }
  }

  static IntegratorSettings defaults() {
    IntegratorSettings s;
    return s;
  }
};

}  // namespace nest
