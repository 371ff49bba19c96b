/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "population/Individual.hpp"
#include "world/TileTypes.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace CityScale {

class IndividualTable;

/**
 * @brief Tile-resolution lookup of individual records
 *
 * Rebuilt from scratch every tick; there is no incremental update. Only
 * records are indexed, so Statistical population never appears here.
 * Within a cell, ids keep the individual table's iteration order.
 *
 * The rebuild runs before hydration in the tick. Until the next rebuild the
 * index still lists records dissolved this tick and lacks records spawned
 * this tick, so callers must expect IndividualTable::find() to return
 * nullptr for an id it hands out.
 */
class SpatialIndex {
public:
    using CellList = boost::container::small_vector<IndividualId, 4>;

    void rebuild(const IndividualTable& individuals);
    void clear();

    // O(1); empty list for unoccupied or out-of-range tiles. Ids may be stale
    // after this tick's hydration phase, see above.
    const CellList& queryCell(int32_t x, int32_t y) const;

    // Appends the occupants of every covered tile in row-major order
    void queryArea(const TileRect& area, std::vector<IndividualId>& out) const;

    size_t occupiedCellCount() const { return m_cells.size(); }
    size_t indexedCount() const { return m_indexedCount; }

private:
    struct CellKeyHash {
        size_t operator()(uint64_t key) const noexcept {
            // splitmix64 finalizer; packed tile coordinates cluster badly otherwise
            key ^= key >> 30;
            key *= 0xbf58476d1ce4e5b9ULL;
            key ^= key >> 27;
            key *= 0x94d049bb133111ebULL;
            key ^= key >> 31;
            return static_cast<size_t>(key);
        }
    };

    static uint64_t packKey(int32_t x, int32_t y) {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
    }

    std::unordered_map<uint64_t, CellList, CellKeyHash> m_cells;
    size_t m_indexedCount{0};
};

} // namespace CityScale

#endif // SPATIAL_INDEX_HPP
