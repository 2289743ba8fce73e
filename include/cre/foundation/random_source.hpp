#pragma once

/// @file random_source.hpp
/// @brief Seedable random number source injected into combat systems.

#include <cstdint>
#include <random>

namespace cre::foundation {

/// Mersenne-twister backed source of gameplay randomness.
///
/// A seed of 0 draws a seed from std::random_device; any other seed makes
/// status-effect damage and crit rolls reproducible.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 0);

    /// Uniform integer in the closed range [lo, hi]. Returns lo when hi < lo.
    int UniformInt(int lo, int hi);

    /// Uniform real in the half-open range [lo, hi).
    double UniformReal(double lo, double hi);

    void Reseed(uint64_t seed);

    [[nodiscard]] uint64_t Seed() const noexcept { return seed_; }

private:
    uint64_t seed_ = 0;
    std::mt19937 engine_;
};

} // namespace cre::foundation
