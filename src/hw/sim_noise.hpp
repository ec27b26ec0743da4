#pragma once
#include <cstdint>
#include <random>

/**
 * @brief Seedable noise source for the field node simulation
 *
 * Every tick gets its own stream derived from (seed, tick), so a reading
 * depends only on the seed and the tick number and not on how many ticks
 * were generated before it. Jitter is uniform so that it stays bounded.
 */
class NoiseSimulator {
private:
    std::mt19937_64 rng_;

    /**
     * @brief SplitMix64 finalizer, spreads nearby seeds across the state space
     */
    static std::uint64_t mix(std::uint64_t x) {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

public:
    explicit NoiseSimulator(std::uint64_t seed) : rng_(mix(seed)) {}

    /**
     * @brief Stream for one tick of one simulation run
     * @param seed Run seed
     * @param tick Tick counter
     */
    static NoiseSimulator for_tick(std::uint64_t seed, std::uint64_t tick) {
        return NoiseSimulator(mix(seed) ^ mix(tick ^ 0xA0761D6478BD642FULL));
    }

    /**
     * @brief Uniform real jitter in [-amplitude, amplitude]
     */
    double jitter(double amplitude) {
        std::uniform_real_distribution<double> d(-amplitude, amplitude);
        return d(rng_);
    }

    /**
     * @brief Uniform integer in [lo, hi]
     */
    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> d(lo, hi);
        return d(rng_);
    }

    /**
     * @brief Bernoulli draw
     * @param p Probability of true
     */
    bool chance(double p) {
        std::bernoulli_distribution d(p);
        return d(rng_);
    }
};
