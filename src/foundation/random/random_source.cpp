/// @file random_source.cpp
/// @brief RandomSource engine seeding and draws.

#include "cre/foundation/random_source.hpp"

namespace cre::foundation {

RandomSource::RandomSource(uint64_t seed) {
    Reseed(seed);
}

void RandomSource::Reseed(uint64_t seed) {
    if (seed == 0) {
        std::random_device device;
        seed = (static_cast<uint64_t>(device()) << 32) | device();
        if (seed == 0) {
            seed = 1;
        }
    }
    seed_ = seed;
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32)};
    engine_.seed(seq);
}

int RandomSource::UniformInt(int lo, int hi) {
    if (hi <= lo) {
        return lo;
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

double RandomSource::UniformReal(double lo, double hi) {
    if (!(hi > lo)) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(engine_);
}

} // namespace cre::foundation
