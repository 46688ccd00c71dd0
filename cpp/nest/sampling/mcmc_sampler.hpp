#pragma once
/*
================================================================================
Sampling: Constrained MCMC Sampler
FILE: cpp/nest/sampling/mcmc_sampler.hpp

Purpose:
  - Replacement points come from a short random walk started at a randomly
    chosen surviving live point, restricted to L > L_worst and the unit cube.
  - Gaussian proposals in unit-cube coordinates; the step scale adapts from
    the accept/reject tally (grow on acceptance-heavy walks, shrink otherwise).

Hardening:
  - A walk is cut short after max_attempts proposals. It returns its current
    point if that satisfies the constraint, otherwise (e.g. a flat
    likelihood) next() throws NumericalError.
================================================================================
*/

#include "nest/core/rng.hpp"
#include "nest/integrator/sampler.hpp"
#include "nest/sampling/live_set.hpp"
#include "nest/sampling/model.hpp"

namespace nest::sampling {

class McmcSampler final : public Sampler {
 public:
  McmcSampler(Model model, const LiveSetSettings& settings, const McmcSettings& mcmc = {});

  int nlive_points() const override { return nlive_; }
  double max_loglike() const override { return live_.max_loglike(); }
  std::uint64_t ndraws() const override { return live_.ndraws(); }
  const std::vector<Point>& samples() const override { return live_.history(); }

  Point next() override;
  std::vector<Point> remainder() const override { return live_.points(); }

  double scale() const noexcept { return scale_; }

 private:
  int nlive_;
  std::uint64_t max_attempts_;
  int nsteps_;
  double scale_;
  Rng64 rng_;
  LiveSet live_;
};

}  // namespace nest::sampling
