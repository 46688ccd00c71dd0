/*
================================================================================
Sampling: Rejection Sampler (Implementation)
FILE: cpp/nest/sampling/rejection_sampler.cpp
================================================================================
*/

#include "nest/sampling/rejection_sampler.hpp"

#include "nest/core/errors.hpp"

#include <sstream>
#include <utility>

namespace nest::sampling {

namespace {

const LiveSetSettings& validated(const LiveSetSettings& s) {
  s.validate_or_throw();
  return s;
}

}  // namespace

RejectionSampler::RejectionSampler(Model model, const LiveSetSettings& settings)
    : nlive_(validated(settings).nlive_points),
      max_attempts_(settings.max_attempts),
      rng_(settings.seed),
      live_(std::move(model), settings.nlive_points) {
  live_.populate(rng_);
}

Point RejectionSampler::next() {
  const double Lmin = live_.worst().L;
  const std::size_t ndim = static_cast<std::size_t>(live_.ndim());

  for (std::uint64_t attempt = 0; attempt < max_attempts_; ++attempt) {
    std::vector<double> u(ndim);
    for (double& ui : u) ui = rng_.next_u01();
    Point p = live_.evaluate(std::move(u));
    if (p.L > Lmin) return live_.replace_worst(std::move(p));
  }

  std::ostringstream oss;
  oss << "RejectionSampler: no point above L=" << Lmin << " after " << max_attempts_ << " draws";
  NEST_THROW(ErrorCode::kSamplerFailure, oss.str());
}

}  // namespace nest::sampling
