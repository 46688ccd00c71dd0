#pragma once
/*
================================================================================
Sampling: Rejection Sampler
FILE: cpp/nest/sampling/rejection_sampler.hpp

Purpose:
  - Simplest correct Sampler: replacement points are drawn uniformly from
    the whole unit cube until one beats the current worst likelihood.
  - Exact (independent draws) but the acceptance rate falls like the
    remaining prior volume; use for low dimension and validation runs.

Hardening:
  - max_attempts bounds a single next(); exceeding it throws NumericalError.
================================================================================
*/

#include "nest/core/rng.hpp"
#include "nest/integrator/sampler.hpp"
#include "nest/sampling/live_set.hpp"
#include "nest/sampling/model.hpp"

namespace nest::sampling {

class RejectionSampler final : public Sampler {
 public:
  RejectionSampler(Model model, const LiveSetSettings& settings);

  int nlive_points() const override { return nlive_; }
  double max_loglike() const override { return live_.max_loglike(); }
  std::uint64_t ndraws() const override { return live_.ndraws(); }
  const std::vector<Point>& samples() const override { return live_.history(); }

  Point next() override;
  std::vector<Point> remainder() const override { return live_.points(); }

 private:
  int nlive_;
  std::uint64_t max_attempts_;
  Rng64 rng_;
  LiveSet live_;
};

}  // namespace nest::sampling
