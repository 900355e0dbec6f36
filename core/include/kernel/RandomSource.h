#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

// Explicit random handle threaded through every operation that draws.
// Wraps a 64-bit Mersenne Twister; all draws go through uniform() or choice().
class RandomSource {
public:
    explicit RandomSource(std::uint64_t seed = 42) : rng_(seed) {}

    void seed(std::uint64_t seed) { rng_.seed(seed); }

    // Uniform draw in [0, 1)
    double uniform() {
        return unit_(rng_);
    }

    // Uniform index in [0, n); n must be > 0
    std::size_t choice(std::size_t n) {
        std::uniform_int_distribution<std::size_t> pick(0, n - 1);
        return pick(rng_);
    }

    std::mt19937_64& engine() { return rng_; }

    // Independent stream keyed by (seed, generation, phase, cell).
    // Same key always yields the same stream, whatever thread asks for it.
    static RandomSource forCell(std::uint64_t seed, std::uint64_t generation,
                                std::uint32_t phase, std::size_t cell);

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};
