/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHUNK_HPP
#define CHUNK_HPP

#include "world/TileTypes.hpp"
#include <array>
#include <cstdint>
#include <ostream>

namespace CityScale {

constexpr int32_t CHUNK_SIZE = 64;
constexpr int32_t CHUNK_TILES = CHUNK_SIZE * CHUNK_SIZE;

struct ChunkCoord {
    int32_t cx{0};
    int32_t cy{0};

    bool operator==(const ChunkCoord& other) const { return cx == other.cx && cy == other.cy; }
    bool operator!=(const ChunkCoord& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const ChunkCoord& coord) {
    return os << "[" << coord.cx << ", " << coord.cy << "]";
}

// Inclusive chunk rectangle; empty when min > max on either axis
struct ChunkRange {
    int32_t minCx{0};
    int32_t minCy{0};
    int32_t maxCx{-1};
    int32_t maxCy{-1};

    bool empty() const { return minCx > maxCx || minCy > maxCy; }
    bool contains(ChunkCoord c) const {
        return c.cx >= minCx && c.cx <= maxCx && c.cy >= minCy && c.cy <= maxCy;
    }
};

/**
 * One 64x64 block of tiles. Layers are stored row-major by local offset
 * (ly * CHUNK_SIZE + lx). Tiles past the map edge in a partial chunk keep
 * their default values and are never addressed by the store.
 */
struct Chunk {
    std::array<uint8_t, CHUNK_TILES> terrain{};
    std::array<float, CHUNK_TILES> temperature{};
    std::array<BuildingId, CHUNK_TILES> building{};
    std::array<BlockId, CHUNK_TILES> block{};
    std::array<DistrictId, CHUNK_TILES> district{};

    uint64_t lastUpdatedTick{0};
    bool dirty{false};
    bool atEquilibrium{false};

    Terrain terrainAt(int32_t local) const { return static_cast<Terrain>(terrain[static_cast<size_t>(local)]); }
};

} // namespace CityScale

#endif // CHUNK_HPP
