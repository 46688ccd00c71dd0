/*
================================================================================
Sampling: Constrained MCMC Sampler (Implementation)
FILE: cpp/nest/sampling/mcmc_sampler.cpp
================================================================================
*/

#include "nest/sampling/mcmc_sampler.hpp"

#include "nest/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace nest::sampling {

namespace {

const LiveSetSettings& validated(const LiveSetSettings& s, const McmcSettings& m) {
  s.validate_or_throw();
  m.validate_or_throw();
  return s;
}

bool inside_unit_cube(const std::vector<double>& u) noexcept {
  for (double ui : u) {
    if (!(ui > 0.0 && ui < 1.0)) return false;
  }
  return true;
}

}  // namespace

McmcSampler::McmcSampler(Model model, const LiveSetSettings& settings, const McmcSettings& mcmc)
    : nlive_(validated(settings, mcmc).nlive_points),
      max_attempts_(settings.max_attempts),
      nsteps_(mcmc.nsteps),
      scale_(mcmc.initial_scale),
      rng_(settings.seed),
      live_(std::move(model), settings.nlive_points) {
  live_.populate(rng_);
}

Point McmcSampler::next() {
  const double Lmin = live_.worst().L;
  const auto& pts = live_.points();

  // Start from a survivor strictly above the constraint; ties with the worst
  // point (duplicates from a walk that accepted nothing) are skipped. With no
  // such survivor the walk starts at the worst point and must climb.
  const auto above = std::upper_bound(pts.begin(), pts.end(), Lmin,
                                      [](double L, const Point& q) { return L < q.L; });
  const std::size_t first = static_cast<std::size_t>(above - pts.begin());
  const std::size_t start =
      (first < pts.size()) ? first + rng_.next_index(pts.size() - first) : 0;
  Point cur = pts[start];

  int accepted = 0;
  int rejected = 0;
  std::uint64_t steps = 0;

  while (steps < static_cast<std::uint64_t>(nsteps_) || !(cur.L > Lmin)) {
    if (steps >= max_attempts_) {
      // Proposal cap reached while already holding a valid point: stop the walk.
      if (cur.L > Lmin) break;
      std::ostringstream oss;
      oss << "McmcSampler: no point above L=" << Lmin << " after " << steps << " proposals";
      NEST_THROW(ErrorCode::kSamplerFailure, oss.str());
    }
    ++steps;

    std::vector<double> u = cur.u;
    for (double& ui : u) ui += scale_ * rng_.next_normal();

    bool accept = false;
    if (inside_unit_cube(u)) {
      Point trial = live_.evaluate(std::move(u));
      if (trial.L > Lmin) {
        cur = std::move(trial);
        accept = true;
      }
    }

    if (accept) {
      ++accepted;
    } else {
      ++rejected;
    }

    if (accepted > rejected) {
      scale_ *= std::exp(1.0 / accepted);
    } else {
      scale_ /= std::exp(1.0 / rejected);
    }
    scale_ = std::clamp(scale_, 1e-12, 1.0);
  }

  return live_.replace_worst(std::move(cur));
}

}  // namespace nest::sampling
