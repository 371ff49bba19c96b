/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/CityRegistry.hpp"
#include "core/Logger.hpp"
#include "world/TileStore.hpp"
#include <algorithm>
#include <string>
#include <unordered_map>

namespace CityScale {

void CityRegistry::clear() {
    m_buildings.clear();
    m_blocks.clear();
    m_buildingIndex.clear();
    m_blockIndex.clear();
    m_districtBuildings.clear();
}

void CityRegistry::rebuildFromTiles(const TileStore& tiles) {
    clear();
    size_t straddling = 0;

    // Scan-time lookups; the sorted flat maps are built once at the end
    std::unordered_map<BuildingId, size_t> buildingSlots;
    std::unordered_map<BlockId, size_t> blockSlots;

    for (int32_t y = 0; y < tiles.height(); ++y) {
        for (int32_t x = 0; x < tiles.width(); ++x) {
            const DistrictId district = tiles.getDistrictId(x, y);

            const BuildingId buildingId = tiles.getBuildingId(x, y);
            if (buildingId != NO_BUILDING) {
                auto it = buildingSlots.find(buildingId);
                if (it == buildingSlots.end()) {
                    Building building;
                    building.id = buildingId;
                    building.district = district;
                    building.block = tiles.getBlockId(x, y);
                    it = buildingSlots.emplace(buildingId, m_buildings.size()).first;
                    m_buildings.push_back(std::move(building));
                }
                Building& building = m_buildings[it->second];
                if (building.district != district) {
                    ++straddling;
                }
                building.footprint.push_back(TilePos{x, y});
            }

            const BlockId blockId = tiles.getBlockId(x, y);
            if (blockId != NO_BLOCK) {
                auto it = blockSlots.find(blockId);
                if (it == blockSlots.end()) {
                    Block block;
                    block.id = blockId;
                    block.district = district;
                    it = blockSlots.emplace(blockId, m_blocks.size()).first;
                    m_blocks.push_back(std::move(block));
                }
                ++m_blocks[it->second].tileCount;
            }
        }
    }

    std::sort(m_buildings.begin(), m_buildings.end(),
              [](const Building& a, const Building& b) { return a.id < b.id; });
    std::sort(m_blocks.begin(), m_blocks.end(),
              [](const Block& a, const Block& b) { return a.id < b.id; });

    m_buildingIndex.reserve(m_buildings.size());
    for (size_t i = 0; i < m_buildings.size(); ++i) {
        m_buildingIndex.emplace_hint(m_buildingIndex.end(), m_buildings[i].id, i);
    }
    m_blockIndex.reserve(m_blocks.size());
    for (size_t i = 0; i < m_blocks.size(); ++i) {
        m_blockIndex.emplace_hint(m_blockIndex.end(), m_blocks[i].id, i);
    }

    for (Building& building : m_buildings) {
        building.floorCount = estimateFloorCount(static_cast<float>(building.footprint.size()));
        if (building.district != NO_DISTRICT) {
            m_districtBuildings[building.district].push_back(building.id);
        }
        if (building.block != NO_BLOCK) {
            auto it = m_blockIndex.find(building.block);
            if (it != m_blockIndex.end()) {
                m_blocks[it->second].buildings.push_back(building.id);
            }
        }
    }
    for (auto& [district, ids] : m_districtBuildings) {
        std::sort(ids.begin(), ids.end());
    }
    for (Block& block : m_blocks) {
        std::sort(block.buildings.begin(), block.buildings.end());
    }

    if (straddling > 0) {
        REGISTRY_WARN(std::to_string(straddling) +
                      " building tiles lie outside their building's district");
    }
    REGISTRY_INFO("Rebuilt registry: " + std::to_string(m_buildings.size()) + " buildings, " +
                  std::to_string(m_blocks.size()) + " blocks");
}

const Building* CityRegistry::findBuilding(BuildingId id) const {
    auto it = m_buildingIndex.find(id);
    return it == m_buildingIndex.end() ? nullptr : &m_buildings[it->second];
}

const Block* CityRegistry::findBlock(BlockId id) const {
    auto it = m_blockIndex.find(id);
    return it == m_blockIndex.end() ? nullptr : &m_blocks[it->second];
}

const std::vector<BuildingId>& CityRegistry::buildingsInDistrict(DistrictId district) const {
    static const std::vector<BuildingId> empty;
    auto it = m_districtBuildings.find(district);
    return it == m_districtBuildings.end() ? empty : it->second;
}

uint8_t CityRegistry::estimateFloorCount(float area) {
    if (area < 50.0f) {
        return 2;
    } else if (area < 150.0f) {
        return 3;
    } else if (area < 400.0f) {
        return 4;
    }
    return 5;
}

} // namespace CityScale
