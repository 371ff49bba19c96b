/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/SimulationWorld.hpp"
#include "core/Logger.hpp"
#include "population/DistrictSerializer.hpp"
#include "simulation/DistrictAggregateEngine.hpp"
#include "world/TileStoreSerializer.hpp"
#include <cassert>
#include <string>

namespace CityScale {

SimulationWorld::SimulationWorld(const SimulationConfig& config, int32_t width, int32_t height)
    : m_config(config)
    , m_tiles(std::make_unique<TileStore>(width, height))
    , m_pathfinder(config.pathfinding)
    , m_rng(config.seed)
{
    m_config.validate();
    m_tiles->initializeTemperatures();
}

void SimulationWorld::setTiles(std::unique_ptr<TileStore> tiles) {
    if (!tiles) {
        SIMULATION_ERROR("setTiles called with no tile store");
        return;
    }
    m_tiles = std::move(tiles);
    m_pathfinder.build(*m_tiles);
    m_spatialIndex.clear();
    bindCity();
}

void SimulationWorld::applyDefaultRates(District& district) const {
    if (district.birthRate == 0.0) {
        district.birthRate = m_config.aggregate.defaultBirthRate;
    }
    if (district.baseDeathRate == 0.0) {
        district.baseDeathRate = m_config.aggregate.defaultDeathRate;
    }
    district.deathRate = district.baseDeathRate;
}

bool SimulationWorld::addDistrict(District district) {
    applyDefaultRates(district);
    district.lastAdvancedTick = m_tick;
    const uint32_t population = district.population;
    if (!m_districts.add(std::move(district))) {
        return false;
    }
    m_ledgerPopulation += population;
    return true;
}

void SimulationWorld::bindCity() {
    m_city.rebuildFromTiles(*m_tiles);
    m_districts.computeAdjacency();
    m_districts.bindBuildings(m_city);
}

LoadResult SimulationWorld::loadTiles(const std::string& path) {
    std::unique_ptr<TileStore> loaded;
    const LoadResult result = TileStoreSerializer::loadFromFile(path, loaded);
    if (result != LoadResult::SUCCESS) {
        return result;
    }
    setTiles(std::move(loaded));
    SIMULATION_INFO("Loaded " + std::to_string(m_tiles->width()) + "x" + std::to_string(m_tiles->height()) +
                    " tiles, " + std::to_string(m_city.buildingCount()) + " buildings");
    return result;
}

LoadResult SimulationWorld::loadDistricts(const std::string& path) {
    DistrictRegistry loaded;
    const LoadResult result = DistrictSerializer::loadFromFile(path, loaded);
    if (result != LoadResult::SUCCESS) {
        return result;
    }

    // Records belong to the districts being replaced
    m_individuals.clear();
    m_spatialIndex.clear();
    m_districts.clear();
    m_ledgerPopulation = 0;
    for (District& district : loaded.districts()) {
        addDistrict(std::move(district));
    }
    bindCity();
    SIMULATION_INFO("Loaded " + std::to_string(m_districts.size()) + " districts, population " +
                    std::to_string(m_ledgerPopulation));
    return result;
}

bool SimulationWorld::saveTiles(const std::string& path) const {
    return TileStoreSerializer::saveToFile(*m_tiles, path);
}

bool SimulationWorld::saveDistricts(const std::string& path) const {
    if (!m_individuals.empty()) {
        SIMULATION_WARN("Saving districts with " + std::to_string(m_individuals.size()) +
                        " live records not folded back in");
    }
    return DistrictSerializer::saveToFile(m_districts, path);
}

uint64_t SimulationWorld::countedPopulation() const {
    return m_districts.totalPopulation() + static_cast<uint64_t>(m_individuals.size());
}

void SimulationWorld::applyAggregateReport(const AggregateReport& report) {
    m_ledgerPopulation += report.births;
    m_ledgerPopulation -= report.deaths;
}

bool SimulationWorld::recordIndividualDeath(IndividualId id) {
    const Individual* record = m_individuals.find(id);
    if (!record) {
        SIMULATION_WARN("Death reported for unknown individual " + std::to_string(id));
        return false;
    }
    const DistrictId home = record->district;
    m_individuals.remove(id);
    --m_ledgerPopulation;
    m_lifecycle.push(LifecycleEvent{LifecycleEventType::Died, id, home, m_tick});
    return true;
}

bool validateWorld(const SimulationWorld& world) {
    bool valid = true;

    const uint64_t counted = world.countedPopulation();
    if (counted != world.ledgerPopulation()) {
        SIMULATION_CRITICAL("Population not conserved: counted " + std::to_string(counted) +
                            ", ledger " + std::to_string(world.ledgerPopulation()));
        valid = false;
    }

    for (const District& district : world.districts().districts()) {
        if (district.categorySum() != district.population) {
            SIMULATION_CRITICAL("District " + std::to_string(district.id) + " category sum " +
                                std::to_string(district.categorySum()) + " != population " +
                                std::to_string(district.population));
            valid = false;
        }
    }

    for (const Individual& record : world.individuals().records()) {
        const bool zoneValid = record.zone == Zone::Active || record.zone == Zone::Nearby ||
                               record.zone == Zone::Statistical;
        if (!zoneValid || record.id == INVALID_INDIVIDUAL) {
            SIMULATION_CRITICAL("Individual " + std::to_string(record.id) + " has an invalid tag");
            valid = false;
        }
        if (record.zone == Zone::Statistical && record.transition != Transition::Buffering &&
            record.transition != Transition::Hydrating) {
            SIMULATION_CRITICAL("Individual " + std::to_string(record.id) +
                                " is Statistical without a pending dehydration");
            valid = false;
        }
    }

    assert(valid && "world invariants violated");
    return valid;
}

} // namespace CityScale
