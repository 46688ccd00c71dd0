#pragma once
/*
================================================================================
Sampling: Live-Point Set
FILE: cpp/nest/sampling/live_set.hpp

Purpose:
  - Fixed-size live population kept ascending by L (front = worst).
  - Owns the bookkeeping every concrete sampler needs:
      * likelihood evaluation with draw counting
      * running maximum likelihood
      * history of every point that entered the set
  - Samplers hold one by composition; it is not a base class.
================================================================================
*/

#include "nest/core/rng.hpp"
#include "nest/integrator/point.hpp"
#include "nest/sampling/model.hpp"

#include <cstdint>
#include <vector>

namespace nest::sampling {

class LiveSet final {
 public:
  LiveSet(Model model, int nlive);

  // Draw the initial population from the prior.
  void populate(Rng64& rng);

  // Evaluate the model at u; counts one draw. NaN likelihood throws.
  Point evaluate(std::vector<double> u);

  // Remove the worst point, insert p (must beat the worst), return the removed one.
  Point replace_worst(Point p);

  const Point& worst() const;
  const std::vector<Point>& points() const noexcept { return live_; }
  int size() const noexcept { return static_cast<int>(live_.size()); }
  int ndim() const noexcept { return model_.ndim; }

  double max_loglike() const noexcept { return max_loglike_; }
  std::uint64_t ndraws() const noexcept { return ndraws_; }
  const std::vector<Point>& history() const noexcept { return history_; }

 private:
  void insert_sorted(Point p);

  Model model_;
  int nlive_;
  std::vector<Point> live_;
  std::vector<Point> history_;
  double max_loglike_;
  std::uint64_t ndraws_ = 0;
};

}  // namespace nest::sampling
