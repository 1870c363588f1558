#ifndef SO_RANDOM_SOURCE_H
#define SO_RANDOM_SOURCE_H

#include <cstdint>
#include <random>

using RandomEngine = std::mt19937_64;

/**
 * Seedable source of independent random streams.
 *
 * Every stream index gets its own engine derived from (seed, index), so work
 * split over threads draws the same numbers however it is scheduled.
 */
struct RandomSource {
    explicit RandomSource(uint64_t seed) : seed(seed) {}

    RandomEngine stream(uint64_t index) const {
        std::seed_seq sequence{
            static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
            static_cast<uint32_t>(index), static_cast<uint32_t>(index >> 32)
        };
        return RandomEngine(sequence);
    }

    uint64_t seed;
};

#endif // SO_RANDOM_SOURCE_H
