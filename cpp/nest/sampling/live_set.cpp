/*
================================================================================
Sampling: Live-Point Set (Implementation)
FILE: cpp/nest/sampling/live_set.cpp
================================================================================
*/

#include "nest/sampling/live_set.hpp"

#include "nest/core/errors.hpp"
#include "nest/core/log_math.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace nest::sampling {

LiveSet::LiveSet(Model model, int nlive)
    : model_(std::move(model)), nlive_(nlive), max_loglike_(kNegInf) {
  model_.validate_or_throw();
  if (nlive_ <= 0) {
    throw ValidationError("LiveSet: nlive_points must be > 0");
  }
  live_.reserve(static_cast<std::size_t>(nlive_) + 1);
}

void LiveSet::populate(Rng64& rng) {
  live_.clear();
  for (int i = 0; i < nlive_; ++i) {
    std::vector<double> u(static_cast<std::size_t>(model_.ndim));
    for (double& ui : u) ui = rng.next_u01();
    insert_sorted(evaluate(std::move(u)));
  }
}

Point LiveSet::evaluate(std::vector<double> u) {
  Point p;
  p.x = model_.transform ? model_.transform(u) : u;
  p.u = std::move(u);
  p.L = model_.loglike(p.x);
  ++ndraws_;
  NEST_REQUIRE(!std::isnan(p.L), ErrorCode::kSamplerFailure, "LiveSet: likelihood returned NaN");
  if (p.L > max_loglike_) max_loglike_ = p.L;
  return p;
}

Point LiveSet::replace_worst(Point p) {
  NEST_REQUIRE(!live_.empty(), ErrorCode::kInternal, "LiveSet: not populated");
  NEST_REQUIRE(p.L > live_.front().L, ErrorCode::kSamplerFailure,
               "LiveSet: replacement does not beat the likelihood constraint");
  Point removed = std::move(live_.front());
  live_.erase(live_.begin());
  insert_sorted(std::move(p));
  return removed;
}

const Point& LiveSet::worst() const {
  NEST_REQUIRE(!live_.empty(), ErrorCode::kInternal, "LiveSet: not populated");
  return live_.front();
}

void LiveSet::insert_sorted(Point p) {
  history_.push_back(p);
  auto pos = std::upper_bound(live_.begin(), live_.end(), p.L,
                              [](double L, const Point& q) { return L < q.L; });
  live_.insert(pos, std::move(p));
}

}  // namespace nest::sampling
