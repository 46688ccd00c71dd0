// ============================================================================
// Core: Deterministic RNG
// File: rng.hpp
// ============================================================================
//
// Purpose:
// - Seeded, reproducible random stream for bootstrap resampling and the
//   concrete samplers.
// - Same seed => same integration run, bit for bit.
//
// ============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace nest {

// Deterministic RNG (xorshift64*).
class Rng64 final {
public:
    explicit Rng64(std::uint64_t seed) : s_(seed ? seed : 0x9e3779b97f4a7c15ull) {}

    std::uint64_t next_u64() noexcept {
        std::uint64_t x = s_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s_ = x;
        return x * 2685821657736338717ull;
    }

    // Uniform in (0,1)
    double next_u01() noexcept {
        // Take top 53 bits -> double mantissa
        const std::uint64_t u = next_u64();
        const std::uint64_t m = (u >> 11) | 1ull; // ensure nonzero
        return static_cast<double>(m) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Uniform index in [0, n). n must be > 0.
    std::size_t next_index(std::size_t n) noexcept {
        return static_cast<std::size_t>(next_u64() % static_cast<std::uint64_t>(n));
    }

    // Box-Muller for standard normal
    double next_normal() noexcept {
        const double u1 = next_u01();
        const double u2 = next_u01();
        const double r = std::sqrt(-2.0 * std::log(u1));
        return r * std::cos(2.0 * 3.141592653589793238462643383279502884 * u2);
    }

private:
    std::uint64_t s_;
};

} // namespace nest
