/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CITY_REGISTRY_HPP
#define CITY_REGISTRY_HPP

#include "world/TileTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <vector>

namespace CityScale {

class TileStore;

struct Building {
    BuildingId id{NO_BUILDING};
    DistrictId district{NO_DISTRICT};
    BlockId block{NO_BLOCK};
    std::vector<TilePos> footprint;   // row-major scan order
    uint8_t floorCount{0};
};

struct Block {
    BlockId id{NO_BLOCK};
    DistrictId district{NO_DISTRICT};
    std::vector<BuildingId> buildings;
    uint32_t tileCount{0};
};

/**
 * @brief Building and block tables keyed by the ids stored in tile layers
 *
 * Entries live in dense arenas; tiles and districts refer to them only by
 * id. Footprints are never persisted and are rebuilt by scanning the tile
 * store after every load.
 */
class CityRegistry {
public:
    void rebuildFromTiles(const TileStore& tiles);
    void clear();

    const Building* findBuilding(BuildingId id) const;
    const Block* findBlock(BlockId id) const;

    const std::vector<Building>& buildings() const { return m_buildings; }
    const std::vector<Block>& blocks() const { return m_blocks; }
    size_t buildingCount() const { return m_buildings.size(); }
    size_t blockCount() const { return m_blocks.size(); }

    // Ascending ids; empty when the district has no buildings
    const std::vector<BuildingId>& buildingsInDistrict(DistrictId district) const;

    // Floors from footprint area in square metres (one tile = 1 m^2)
    static uint8_t estimateFloorCount(float area);

private:
    std::vector<Building> m_buildings;
    std::vector<Block> m_blocks;
    boost::container::flat_map<BuildingId, size_t> m_buildingIndex;
    boost::container::flat_map<BlockId, size_t> m_blockIndex;
    boost::container::flat_map<DistrictId, std::vector<BuildingId>> m_districtBuildings;
};

} // namespace CityScale

#endif // CITY_REGISTRY_HPP
