/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/TickPipeline.hpp"
#include "core/Logger.hpp"
#include "simulation/SimulationWorld.hpp"
#include <chrono>

namespace CityScale {

TickPipeline::TickPipeline(const SimulationConfig& config)
    : m_classifier(config.zones)
    , m_temperature(config.temperature)
    , m_aggregate(config.aggregate)
    , m_hydration(config.hydration)
    , m_needs(config.needs)
{
}

TickReport TickPipeline::runTick(SimulationWorld& world, TilePos poi) {
    auto start = std::chrono::high_resolution_clock::now();

    world.advanceTick();
    const uint64_t tick = world.currentTick();

    TickReport report;
    report.tick = tick;

    report.zones = m_classifier.update(poi, world.individuals(), world.districts());
    report.chunksRecomputed = m_temperature.update(world.tiles(), m_classifier, poi, tick);
    world.spatialIndex().rebuild(world.individuals());

    report.aggregate = m_aggregate.advanceAll(world.districts(), tick);
    world.applyAggregateReport(report.aggregate);

    report.hydration = m_hydration.update(world, m_classifier, poi);
    report.needsUpdated = m_needs.update(world.individuals(), tick);
    report.liveIndividuals = world.individuals().size();

#ifdef DEBUG
    validateWorld(world);
#endif

    auto end = std::chrono::high_resolution_clock::now();
    report.elapsedMs = static_cast<double>(
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count()) / 1000.0;
    return report;
}

} // namespace CityScale
