/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_RNG_HPP
#define SIMULATION_RNG_HPP

#include <cstdint>
#include <random>

namespace CityScale {

/**
 * @brief The single seeded generator for all simulation randomness
 *
 * Owned by SimulationWorld and passed by reference to whatever needs a draw.
 * Only raw engine output is used (no std distributions) so sequences match
 * bit for bit across standard library implementations.
 */
class SimulationRng {
public:
    explicit SimulationRng(uint64_t seed) : m_seed(seed), m_engine(seed) {}

    uint64_t seed() const { return m_seed; }

    uint64_t nextU64() { return m_engine(); }

    // Uniform in [0, 1) with 53 bits of precision
    double uniform01() {
        return static_cast<double>(m_engine() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform in [lo, hi)
    float uniformRange(float lo, float hi) {
        return lo + static_cast<float>(uniform01() * static_cast<double>(hi - lo));
    }

    // Uniform integer in [0, bound), unbiased; bound must be non-zero
    uint64_t uniformBelow(uint64_t bound) {
        const uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
        uint64_t draw = m_engine();
        while (draw >= limit) {
            draw = m_engine();
        }
        return draw % bound;
    }

    void reseed(uint64_t seed) {
        m_seed = seed;
        m_engine.seed(seed);
    }

private:
    uint64_t m_seed;
    std::mt19937_64 m_engine;
};

} // namespace CityScale

#endif // SIMULATION_RNG_HPP
