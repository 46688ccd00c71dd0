#pragma once
/*
================================================================================
Sampling: Model + Live-Set Settings
FILE: cpp/nest/sampling/model.hpp

Purpose:
  - Model: what the concrete samplers evaluate.
      ndim      : dimension of the unit-cube prior space
      transform : u in (0,1)^ndim -> physical parameters x (identity if unset)
      loglike   : x -> natural-log likelihood
  - LiveSetSettings / McmcSettings: validated knobs of the concrete samplers.
================================================================================
*/

#include <cstdint>
#include <functional>
#include <vector>

#include "nest/core/errors.hpp"

namespace nest::sampling {

struct Model {
  int ndim = 1;
  std::function<std::vector<double>(const std::vector<double>&)> transform;
  std::function<double(const std::vector<double>&)> loglike;

  void validate_or_throw() const {
    if (ndim < 1 || ndim > 10000) {
      throw ValidationError("Model: ndim outside sane bounds");
    }
    if (!loglike) {
      throw ValidationError("Model: loglike is not set");
    }
  }
};

struct LiveSetSettings {
  // Live-point population size (N).
  int nlive_points = 400;

  // Seed for all sampler randomness.
  std::uint64_t seed = 1;

  // Likelihood evaluations allowed for a single next() before giving up.
  std::uint64_t max_attempts = 10'000'000;

  void validate_or_throw() const {
    if (nlive_points <= 0) {
      throw ValidationError("LiveSetSettings: nlive_points must be > 0");
    }
    if (max_attempts == 0) {
      throw ValidationError("LiveSetSettings: max_attempts must be > 0");
    }
  }
};

struct McmcSettings {
  // Random-walk steps per replacement.
  int nsteps = 20;

  // Initial proposal scale in unit-cube coordinates; adapted on the fly.
  double initial_scale = 0.1;

  void validate_or_throw() const {
    if (nsteps < 1 || nsteps > 100000) {
      throw ValidationError("McmcSettings: nsteps outside sane bounds");
    }
    if (!(initial_scale > 0.0 && initial_scale <= 1.0)) {
      throw ValidationError("McmcSettings: initial_scale must be (0,1]");
    }
  }
};

}  // namespace nest::sampling
