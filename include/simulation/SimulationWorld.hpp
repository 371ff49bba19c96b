/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_WORLD_HPP
#define SIMULATION_WORLD_HPP

#include "config/SimulationConfig.hpp"
#include "core/SimulationRng.hpp"
#include "pathfinding/HierarchicalPathfinder.hpp"
#include "population/DistrictRegistry.hpp"
#include "population/IndividualTable.hpp"
#include "population/LifecycleLog.hpp"
#include "spatial/SpatialIndex.hpp"
#include "utils/LoadResult.hpp"
#include "world/CityRegistry.hpp"
#include "world/TileStore.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace CityScale {

struct AggregateReport;

/**
 * @brief Root of all simulation state
 *
 * Owns the tile store, registries, individual records, spatial index,
 * pathfinder, the single seeded RNG, the tick counter, the population
 * ledger and the lifecycle log of spawns, despawns and deaths. Components receive it (or the parts they need) by reference;
 * nothing here is global.
 *
 * The ledger holds the total modeled population. Only births and deaths
 * move it; hydration and dehydration move people between districts and
 * records without touching it.
 */
class SimulationWorld {
public:
    /**
     * @throws std::invalid_argument if the configuration is invalid or the
     * grid dimensions are not positive
     */
    SimulationWorld(const SimulationConfig& config, int32_t width, int32_t height);

    // Replaces the tile store and rebuilds everything derived from it
    void setTiles(std::unique_ptr<TileStore> tiles);

    /**
     * @brief Registers a seeded district
     *
     * Zero birth and death rates are replaced with the configured defaults.
     * The district's population joins the ledger. Call bindCity() once all
     * districts are in.
     */
    bool addDistrict(District district);

    // Adjacency, building lists and placement tables for every district
    void bindCity();

    LoadResult loadTiles(const std::string& path);
    LoadResult loadDistricts(const std::string& path);
    bool saveTiles(const std::string& path) const;
    bool saveDistricts(const std::string& path) const;

    const SimulationConfig& config() const { return m_config; }

    TileStore& tiles() { return *m_tiles; }
    const TileStore& tiles() const { return *m_tiles; }
    CityRegistry& city() { return m_city; }
    const CityRegistry& city() const { return m_city; }
    DistrictRegistry& districts() { return m_districts; }
    const DistrictRegistry& districts() const { return m_districts; }
    IndividualTable& individuals() { return m_individuals; }
    const IndividualTable& individuals() const { return m_individuals; }
    SpatialIndex& spatialIndex() { return m_spatialIndex; }
    const SpatialIndex& spatialIndex() const { return m_spatialIndex; }
    HierarchicalPathfinder& pathfinder() { return m_pathfinder; }
    SimulationRng& rng() { return m_rng; }
    LifecycleLog& lifecycle() { return m_lifecycle; }
    const LifecycleLog& lifecycle() const { return m_lifecycle; }

    uint64_t currentTick() const { return m_tick; }
    void advanceTick() { ++m_tick; }

    PathResult findPath(TilePos start, TilePos goal) { return m_pathfinder.findPath(*m_tiles, start, goal); }

    IndividualId allocateIndividualId() { return m_nextIndividualId++; }

    // Total modeled population as tracked by births and deaths
    uint64_t ledgerPopulation() const { return m_ledgerPopulation; }

    // District populations plus live records, counted fresh
    uint64_t countedPopulation() const;

    void applyAggregateReport(const AggregateReport& report);

    /**
     * @brief Removes a record whose death was decided outside the core
     *
     * Logs a Died lifecycle event and takes the individual off the ledger.
     * @return false if no such record exists
     */
    bool recordIndividualDeath(IndividualId id);

private:
    SimulationConfig m_config;
    std::unique_ptr<TileStore> m_tiles;
    CityRegistry m_city;
    DistrictRegistry m_districts;
    IndividualTable m_individuals;
    SpatialIndex m_spatialIndex;
    HierarchicalPathfinder m_pathfinder;
    SimulationRng m_rng;
    LifecycleLog m_lifecycle;

    uint64_t m_tick{0};
    uint64_t m_ledgerPopulation{0};
    IndividualId m_nextIndividualId{1};

    void applyDefaultRates(District& district) const;
};

/**
 * @brief Checks conservation, per-district category sums and record zone tags
 *
 * Logs each violation at CRITICAL. In debug builds a violation also fails an
 * assertion, since it can only come from a programming error.
 * @return true if the world is consistent
 */
bool validateWorld(const SimulationWorld& world);

} // namespace CityScale

#endif // SIMULATION_WORLD_HPP
