/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DISTRICT_AGGREGATE_ENGINE_HPP
#define DISTRICT_AGGREGATE_ENGINE_HPP

#include "config/SimulationConfig.hpp"
#include "population/District.hpp"
#include <cstdint>

namespace CityScale {

class DistrictRegistry;

// Whole births and deaths applied to district populations in one advance
struct AggregateReport {
    uint32_t births{0};
    uint32_t deaths{0};

    AggregateReport& operator+=(const AggregateReport& other) {
        births += other.births;
        deaths += other.deaths;
        return *this;
    }
};

/**
 * @brief Closed-form advancement of district statistics
 *
 * Every update depends only on the district's state and the elapsed tick
 * count, so one call covering N ticks costs the same as a call covering one.
 */
class DistrictAggregateEngine {
public:
    explicit DistrictAggregateEngine(const AggregateConfig& config);

    /**
     * @brief Advances a district from lastAdvancedTick to tick
     *
     * Births are added to the Dependent category; deaths are removed across
     * categories by largest remainder. A tick at or before lastAdvancedTick
     * is a no-op.
     */
    AggregateReport advance(District& district, uint64_t tick) const;

    // True when the district's cadence calls for an advance at tick
    bool isDue(const District& district, uint64_t tick) const;

    /**
     * @brief Advances every due district, then runs a resource flow step
     * on the Statistical cadence
     */
    AggregateReport advanceAll(DistrictRegistry& districts, uint64_t tick) const;

    /**
     * @brief Moves stockpile along every adjacency, proportional to the gradient
     *
     * All flows are computed from the pre-flow stockpiles and applied
     * together, so district order does not matter. Outflows are scaled so
     * no stockpile goes negative.
     */
    void flowResources(DistrictRegistry& districts) const;

    // Effective death rate for the district's current hunger average
    double effectiveDeathRate(const District& district) const;

    const AggregateConfig& config() const { return m_config; }

private:
    AggregateConfig m_config;

    static void removeDeaths(District& district, uint32_t deaths);
};

} // namespace CityScale

#endif // DISTRICT_AGGREGATE_ENGINE_HPP
