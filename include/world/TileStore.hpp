/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_STORE_HPP
#define TILE_STORE_HPP

#include "world/Chunk.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace CityScale {

/**
 * @brief The full world grid, stored as a flat array of 64x64 chunks
 *
 * Tile (x, y) lives in chunk (x / 64, y / 64) at local offset
 * (y % 64) * 64 + (x % 64); the chunk slot is cy * chunksPerRow + cx.
 * Reads outside the grid return sentinels (Terrain::None, NaN, id 0) and
 * writes outside the grid are ignored.
 */
class TileStore {
public:
    /**
     * @throws std::invalid_argument if either dimension is not positive
     */
    TileStore(int32_t width, int32_t height);

    int32_t width() const { return m_width; }
    int32_t height() const { return m_height; }
    int32_t chunksPerRow() const { return m_chunksPerRow; }
    int32_t chunksPerColumn() const { return m_chunksPerColumn; }
    size_t chunkCount() const { return m_chunks.size(); }

    bool inBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }
    bool inBounds(TilePos pos) const { return inBounds(pos.x, pos.y); }
    bool chunkInBounds(int32_t cx, int32_t cy) const {
        return cx >= 0 && cy >= 0 && cx < m_chunksPerRow && cy < m_chunksPerColumn;
    }

    // Addressing
    static ChunkCoord toChunkCoord(int32_t x, int32_t y);
    static int32_t localOffset(int32_t x, int32_t y);
    size_t chunkIndex(int32_t cx, int32_t cy) const {
        return static_cast<size_t>(cy) * static_cast<size_t>(m_chunksPerRow) + static_cast<size_t>(cx);
    }
    static TilePos tileFromChunk(ChunkCoord chunk, int32_t local);

    Chunk& chunkAt(int32_t cx, int32_t cy) { return m_chunks[chunkIndex(cx, cy)]; }
    const Chunk& chunkAt(int32_t cx, int32_t cy) const { return m_chunks[chunkIndex(cx, cy)]; }

    // Tile bounds of a chunk clipped to the map
    TileRect chunkTileBounds(int32_t cx, int32_t cy) const;
    TilePos chunkCenter(int32_t cx, int32_t cy) const;

    // Layers
    Terrain getTerrain(int32_t x, int32_t y) const;
    void setTerrain(int32_t x, int32_t y, Terrain value);

    float getTemperature(int32_t x, int32_t y) const;
    void setTemperature(int32_t x, int32_t y, float value);

    BuildingId getBuildingId(int32_t x, int32_t y) const;
    void setBuildingId(int32_t x, int32_t y, BuildingId value);

    BlockId getBlockId(int32_t x, int32_t y) const;
    void setBlockId(int32_t x, int32_t y, BlockId value);

    DistrictId getDistrictId(int32_t x, int32_t y) const;
    void setDistrictId(int32_t x, int32_t y, DistrictId value);

    bool isWalkable(int32_t x, int32_t y) const { return CityScale::isWalkable(getTerrain(x, y)); }

    /**
     * @brief Inclusive chunk rectangle intersecting a width x height tile
     * region centred on center, clipped to the grid
     */
    ChunkRange visibleChunkRange(TilePos center, int32_t width, int32_t height) const;

    // Temperature
    /**
     * @brief Sets every tile to its terrain's equilibrium temperature and
     * marks all chunks at equilibrium. Called after construction and load.
     */
    void initializeTemperatures();

    /**
     * @brief Applies one tick of drift toward equilibrium
     *
     * New values are computed for the whole chunk before any is written.
     * @return true if the chunk reached equilibrium
     */
    bool relaxChunk(int32_t cx, int32_t cy, uint64_t tick, float relaxRate, float tolerance);

    /**
     * @brief Catches up a chunk that has not been simulated since
     * lastUpdatedTick in one step: new = target + (old - target) * (1 - rate)^elapsed
     */
    void fastForwardChunk(int32_t cx, int32_t cy, uint64_t tick, float relaxRate, float tolerance);

    // Bumped by every terrain mutation; the pathfinder compares against it
    uint64_t terrainRevision() const { return m_terrainRevision; }

    // Content-identifying marker carried by the persisted format
    uint64_t generation() const { return m_generation; }
    void setGeneration(uint64_t generation) { m_generation = generation; }

    void clearDirtyFlags();

private:
    int32_t m_width;
    int32_t m_height;
    int32_t m_chunksPerRow;
    int32_t m_chunksPerColumn;
    std::vector<Chunk> m_chunks;
    uint64_t m_terrainRevision{0};
    uint64_t m_generation{0};

    bool decayChunk(Chunk& chunk, double decay, float tolerance);
};

} // namespace CityScale

#endif // TILE_STORE_HPP
