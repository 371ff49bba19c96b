/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/SpatialIndex.hpp"
#include "population/IndividualTable.hpp"
#include <algorithm>

namespace CityScale {

void SpatialIndex::clear() {
    m_cells.clear();
    m_indexedCount = 0;
}

void SpatialIndex::rebuild(const IndividualTable& individuals) {
    clear();
    m_cells.reserve(individuals.size());
    for (const Individual& individual : individuals.records()) {
        m_cells[packKey(individual.position.x, individual.position.y)].push_back(individual.id);
    }
    m_indexedCount = individuals.size();
}

const SpatialIndex::CellList& SpatialIndex::queryCell(int32_t x, int32_t y) const {
    static const CellList empty;
    auto it = m_cells.find(packKey(x, y));
    return it == m_cells.end() ? empty : it->second;
}

void SpatialIndex::queryArea(const TileRect& area, std::vector<IndividualId>& out) const {
    if (area.empty() || m_cells.empty()) {
        return;
    }

    const uint64_t tileCount = static_cast<uint64_t>(area.width) * static_cast<uint64_t>(area.height);
    if (tileCount <= m_cells.size()) {
        for (int32_t y = area.y; y < area.y + area.height; ++y) {
            for (int32_t x = area.x; x < area.x + area.width; ++x) {
                auto it = m_cells.find(packKey(x, y));
                if (it != m_cells.end()) {
                    out.insert(out.end(), it->second.begin(), it->second.end());
                }
            }
        }
        return;
    }

    // Large area: walk occupied cells instead, then restore row-major order
    std::vector<std::pair<TilePos, const CellList*>> hits;
    for (const auto& [key, list] : m_cells) {
        TilePos pos{static_cast<int32_t>(static_cast<uint32_t>(key >> 32)),
                    static_cast<int32_t>(static_cast<uint32_t>(key & 0xFFFFFFFFu))};
        if (area.contains(pos)) {
            hits.emplace_back(pos, &list);
        }
    }
    std::sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
        return a.first.y != b.first.y ? a.first.y < b.first.y : a.first.x < b.first.x;
    });
    for (const auto& [pos, list] : hits) {
        out.insert(out.end(), list->begin(), list->end());
    }
}

} // namespace CityScale
