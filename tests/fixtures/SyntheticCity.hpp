/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SYNTHETIC_CITY_HPP
#define SYNTHETIC_CITY_HPP

#include "config/SimulationConfig.hpp"
#include "population/District.hpp"
#include "simulation/SimulationWorld.hpp"
#include "world/TileStore.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace CityScale::Testing {

// Three 256x128 districts side by side on a 768x128 map. Each holds four
// 8x8 floor buildings within 40 tiles of its centroid.
constexpr int32_t CITY_WIDTH = 768;
constexpr int32_t CITY_HEIGHT = 128;
constexpr int32_t DISTRICT_WIDTH = 256;
constexpr int32_t BUILDING_SIDE = 8;
constexpr int BUILDINGS_PER_DISTRICT = 4;

inline TilePos districtCentroid(DistrictId id) {
    return TilePos{(id - 1) * DISTRICT_WIDTH + DISTRICT_WIDTH / 2, CITY_HEIGHT / 2};
}

inline BuildingId buildingIdFor(DistrictId district, int index) {
    return static_cast<BuildingId>(district) * 100 + static_cast<BuildingId>(index) + 1;
}

// Small radii so one district is Active and its neighbours are Statistical
inline SimulationConfig testConfig() {
    SimulationConfig config;
    config.zones.activeRadius = 100.0f;
    config.zones.nearbyRadius = 200.0f;
    config.aggregate.defaultBirthRate = 0.0;
    config.aggregate.defaultDeathRate = 0.0;
    config.seed = 12345;
    return config;
}

inline std::unique_ptr<TileStore> buildCityTiles() {
    auto tiles = std::make_unique<TileStore>(CITY_WIDTH, CITY_HEIGHT);
    for (int32_t y = 0; y < CITY_HEIGHT; ++y) {
        for (int32_t x = 0; x < CITY_WIDTH; ++x) {
            const DistrictId district = static_cast<DistrictId>(x / DISTRICT_WIDTH + 1);
            tiles->setTerrain(x, y, Terrain::Road);
            tiles->setDistrictId(x, y, district);
        }
    }

    for (DistrictId district = 1; district <= 3; ++district) {
        const TilePos centroid = districtCentroid(district);
        for (int j = 0; j < BUILDINGS_PER_DISTRICT; ++j) {
            const int32_t x0 = centroid.x - 28 + (j % 2) * 40;
            const int32_t y0 = centroid.y - 28 + (j / 2) * 40;
            for (int32_t y = y0; y < y0 + BUILDING_SIDE; ++y) {
                for (int32_t x = x0; x < x0 + BUILDING_SIDE; ++x) {
                    tiles->setTerrain(x, y, Terrain::Floor);
                    tiles->setBuildingId(x, y, buildingIdFor(district, j));
                    tiles->setBlockId(x, y, static_cast<BlockId>(district));
                }
            }
        }
    }

    tiles->initializeTemperatures();
    tiles->clearDirtyFlags();
    return tiles;
}

// Splits a population across occupations; the remainder goes to Dependent
inline OccupationCounts splitPopulation(uint32_t population) {
    OccupationCounts counts{};
    counts[static_cast<size_t>(Occupation::Laborer)] = population * 3 / 10;
    counts[static_cast<size_t>(Occupation::Artisan)] = population * 2 / 10;
    counts[static_cast<size_t>(Occupation::Merchant)] = population / 10;
    counts[static_cast<size_t>(Occupation::Servant)] = population / 10;
    counts[static_cast<size_t>(Occupation::Professional)] = population / 20;
    uint32_t assigned = 0;
    for (uint32_t c : counts) {
        assigned += c;
    }
    counts[static_cast<size_t>(Occupation::Dependent)] = population - assigned;
    return counts;
}

inline District makeDistrict(DistrictId id, uint32_t population) {
    District district = District::create(
        id, "District " + std::to_string(id),
        TileRect{(id - 1) * DISTRICT_WIDTH, 0, DISTRICT_WIDTH, CITY_HEIGHT});
    district.seedPopulation(splitPopulation(population));
    district.stockpile = 1000.0;
    return district;
}

inline std::unique_ptr<SimulationWorld> makeCityWorld(const SimulationConfig& config,
                                                      const std::array<uint32_t, 3>& populations) {
    auto world = std::make_unique<SimulationWorld>(config, CITY_WIDTH, CITY_HEIGHT);
    for (DistrictId id = 1; id <= 3; ++id) {
        world->addDistrict(makeDistrict(id, populations[id - 1]));
    }
    world->setTiles(buildCityTiles());
    return world;
}

} // namespace CityScale::Testing

#endif // SYNTHETIC_CITY_HPP
