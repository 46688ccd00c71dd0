#pragma once
/*
================================================================================
Integrator: Sampler Contract
FILE: cpp/nest/integrator/sampler.hpp

Purpose:
  - The only view the integration loop has of point generation.
  - Concrete strategies (rejection, constrained MCMC, ...) implement this
    interface directly; the loop never knows which one it drives.

Contract:
  - nlive_points(): fixed live-set size, > 0.
  - max_loglike(): running maximum log-likelihood over everything evaluated.
  - ndraws():      cumulative likelihood evaluations (initial live set included).
  - samples():     full evaluation history, passed through to the result.
  - next():        removes the current worst live point, replaces it with a
                   new point of strictly higher likelihood, and returns the
                   removed one. May block arbitrarily long. Failures throw.
  - remainder():   the current live set, ascending by L.
================================================================================
*/

#include "nest/integrator/point.hpp"

#include <cstdint>
#include <vector>

namespace nest {

class Sampler {
 public:
  virtual ~Sampler() = default;

  virtual int nlive_points() const = 0;
  virtual double max_loglike() const = 0;
  virtual std::uint64_t ndraws() const = 0;
  virtual const std::vector<Point>& samples() const = 0;

  virtual Point next() = 0;
  virtual std::vector<Point> remainder() const = 0;
};

}  // namespace nest
