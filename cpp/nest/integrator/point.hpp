#pragma once
/*
================================================================================
Integrator: Point + Weight Record Types
FILE: cpp/nest/integrator/point.hpp

Purpose:
  - Point: one likelihood evaluation produced by a Sampler.
      u  : position in unit-cube prior coordinates
      x  : physical (transformed) parameters
      L  : natural-log likelihood
  - WeightRecord: a Point annotated with the log prior-volume slice it stands
    for. The ordered sequence of records (draw order) reconstructs posterior
    weights as exp(logwidth + L - logZ).

Notes:
  - Points are immutable once produced; the integrator only copies them.
================================================================================
*/

#include <vector>

namespace nest {

struct Point {
  std::vector<double> u;
  std::vector<double> x;
  double L = 0.0;
};

struct WeightRecord {
  std::vector<double> u;
  std::vector<double> x;
  double L = 0.0;
  double logwidth = 0.0;
};

inline WeightRecord make_weight_record(const Point& p, double logwidth) {
  return WeightRecord{p.u, p.x, p.L, logwidth};
}

}  // namespace nest
