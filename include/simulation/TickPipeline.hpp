/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TICK_PIPELINE_HPP
#define TICK_PIPELINE_HPP

#include "config/SimulationConfig.hpp"
#include "simulation/DistrictAggregateEngine.hpp"
#include "simulation/HydrationController.hpp"
#include "simulation/NeedsSystem.hpp"
#include "simulation/TemperatureSystem.hpp"
#include "simulation/ZoneClassifier.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>

namespace CityScale {

class SimulationWorld;

struct TickReport {
    uint64_t tick{0};
    ZoneCounts zones;
    size_t chunksRecomputed{0};
    AggregateReport aggregate;
    HydrationReport hydration;
    size_t needsUpdated{0};
    size_t liveIndividuals{0};
    double elapsedMs{0.0};
};

/**
 * @brief Runs one simulation tick in the fixed phase order
 *
 * zones -> temperature -> spatial index -> aggregates -> hydration -> needs
 *
 * Each phase sees the results of the one before it and nothing later.
 * External behaviour systems run after runTick() returns.
 */
class TickPipeline {
public:
    explicit TickPipeline(const SimulationConfig& config);

    TickReport runTick(SimulationWorld& world, TilePos poi);

    const ZoneClassifier& classifier() const { return m_classifier; }
    const DistrictAggregateEngine& aggregateEngine() const { return m_aggregate; }
    HydrationController& hydration() { return m_hydration; }

private:
    ZoneClassifier m_classifier;
    TemperatureSystem m_temperature;
    DistrictAggregateEngine m_aggregate;
    HydrationController m_hydration;
    NeedsSystem m_needs;
};

} // namespace CityScale

#endif // TICK_PIPELINE_HPP
