// ============================================================================
// Integrator: Volume / Weight Tracker
// File: volume.hpp
// ============================================================================
//
// Standard N-live-point shrinkage: every iteration removes, on average, a
// fraction exp(-1/N) of the remaining prior volume.
//
//   logwidth_i         = log(1 - exp(-1/N)) + logVolremaining_{i-1}
//   logVolremaining_i  = logVolremaining_{i-1} - 1/N
//
// Pure step function: no state beyond the two scalars passed around.
//
// ============================================================================

#pragma once

#include "nest/core/log_math.hpp"

namespace nest {

struct VolumeStep final {
    double logwidth = 0.0;
    double log_vol_remaining = 0.0;
};

inline VolumeStep shrink_volume(double log_vol_remaining, int nlive) noexcept {
    VolumeStep s;
    s.logwidth = log_shell_width(nlive) + log_vol_remaining;
    s.log_vol_remaining = log_vol_remaining - 1.0 / static_cast<double>(nlive);
    return s;
}

} // namespace nest
