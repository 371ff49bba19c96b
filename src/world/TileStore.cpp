/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TileStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace CityScale {

namespace {

int32_t floorDiv(int32_t value, int32_t divisor) {
    int32_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

int32_t positiveMod(int32_t value, int32_t divisor) {
    int32_t r = value % divisor;
    return r < 0 ? r + divisor : r;
}

} // namespace

const char* terrainName(Terrain terrain) {
    switch (terrain) {
        case Terrain::Grass: return "Grass";
        case Terrain::Water: return "Water";
        case Terrain::Stone: return "Stone";
        case Terrain::Dirt: return "Dirt";
        case Terrain::Sand: return "Sand";
        case Terrain::Road: return "Road";
        case Terrain::Floor: return "Floor";
        case Terrain::Wall: return "Wall";
        case Terrain::Door: return "Door";
        case Terrain::Courtyard: return "Courtyard";
        case Terrain::Garden: return "Garden";
        case Terrain::Bridge: return "Bridge";
        case Terrain::Fixture: return "Fixture";
        case Terrain::None: return "None";
        default: return "Unknown";
    }
}

TileStore::TileStore(int32_t width, int32_t height)
    : m_width(width), m_height(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("TileStore dimensions must be positive: " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
    m_chunksPerRow = (width + CHUNK_SIZE - 1) / CHUNK_SIZE;
    m_chunksPerColumn = (height + CHUNK_SIZE - 1) / CHUNK_SIZE;
    m_chunks.resize(static_cast<size_t>(m_chunksPerRow) * static_cast<size_t>(m_chunksPerColumn));

    TILESTORE_DEBUG("Created " + std::to_string(width) + "x" + std::to_string(height) +
                    " tile store with " + std::to_string(m_chunks.size()) + " chunks");
}

ChunkCoord TileStore::toChunkCoord(int32_t x, int32_t y) {
    return ChunkCoord{floorDiv(x, CHUNK_SIZE), floorDiv(y, CHUNK_SIZE)};
}

int32_t TileStore::localOffset(int32_t x, int32_t y) {
    return positiveMod(y, CHUNK_SIZE) * CHUNK_SIZE + positiveMod(x, CHUNK_SIZE);
}

TilePos TileStore::tileFromChunk(ChunkCoord chunk, int32_t local) {
    return TilePos{chunk.cx * CHUNK_SIZE + local % CHUNK_SIZE,
                   chunk.cy * CHUNK_SIZE + local / CHUNK_SIZE};
}

TileRect TileStore::chunkTileBounds(int32_t cx, int32_t cy) const {
    int32_t x0 = cx * CHUNK_SIZE;
    int32_t y0 = cy * CHUNK_SIZE;
    return TileRect{x0, y0, std::min(CHUNK_SIZE, m_width - x0), std::min(CHUNK_SIZE, m_height - y0)};
}

TilePos TileStore::chunkCenter(int32_t cx, int32_t cy) const {
    TileRect bounds = chunkTileBounds(cx, cy);
    return TilePos{bounds.x + bounds.width / 2, bounds.y + bounds.height / 2};
}

Terrain TileStore::getTerrain(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return Terrain::None;
    }
    ChunkCoord c = toChunkCoord(x, y);
    return chunkAt(c.cx, c.cy).terrainAt(localOffset(x, y));
}

void TileStore::setTerrain(int32_t x, int32_t y, Terrain value) {
    if (!inBounds(x, y) || !isValidTerrainByte(static_cast<uint8_t>(value))) {
        return;
    }
    ChunkCoord c = toChunkCoord(x, y);
    Chunk& chunk = chunkAt(c.cx, c.cy);
    chunk.terrain[static_cast<size_t>(localOffset(x, y))] = static_cast<uint8_t>(value);
    chunk.atEquilibrium = false;
    chunk.dirty = true;
    ++m_terrainRevision;
}

float TileStore::getTemperature(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    ChunkCoord c = toChunkCoord(x, y);
    return chunkAt(c.cx, c.cy).temperature[static_cast<size_t>(localOffset(x, y))];
}

void TileStore::setTemperature(int32_t x, int32_t y, float value) {
    if (!inBounds(x, y)) {
        return;
    }
    ChunkCoord c = toChunkCoord(x, y);
    Chunk& chunk = chunkAt(c.cx, c.cy);
    chunk.temperature[static_cast<size_t>(localOffset(x, y))] = value;
    chunk.atEquilibrium = false;
}

BuildingId TileStore::getBuildingId(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return NO_BUILDING;
    }
    ChunkCoord c = toChunkCoord(x, y);
    return chunkAt(c.cx, c.cy).building[static_cast<size_t>(localOffset(x, y))];
}

void TileStore::setBuildingId(int32_t x, int32_t y, BuildingId value) {
    if (!inBounds(x, y)) {
        return;
    }
    ChunkCoord c = toChunkCoord(x, y);
    Chunk& chunk = chunkAt(c.cx, c.cy);
    chunk.building[static_cast<size_t>(localOffset(x, y))] = value;
    chunk.dirty = true;
}

BlockId TileStore::getBlockId(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return NO_BLOCK;
    }
    ChunkCoord c = toChunkCoord(x, y);
    return chunkAt(c.cx, c.cy).block[static_cast<size_t>(localOffset(x, y))];
}

void TileStore::setBlockId(int32_t x, int32_t y, BlockId value) {
    if (!inBounds(x, y)) {
        return;
    }
    ChunkCoord c = toChunkCoord(x, y);
    Chunk& chunk = chunkAt(c.cx, c.cy);
    chunk.block[static_cast<size_t>(localOffset(x, y))] = value;
    chunk.dirty = true;
}

DistrictId TileStore::getDistrictId(int32_t x, int32_t y) const {
    if (!inBounds(x, y)) {
        return NO_DISTRICT;
    }
    ChunkCoord c = toChunkCoord(x, y);
    return chunkAt(c.cx, c.cy).district[static_cast<size_t>(localOffset(x, y))];
}

void TileStore::setDistrictId(int32_t x, int32_t y, DistrictId value) {
    if (!inBounds(x, y)) {
        return;
    }
    ChunkCoord c = toChunkCoord(x, y);
    Chunk& chunk = chunkAt(c.cx, c.cy);
    chunk.district[static_cast<size_t>(localOffset(x, y))] = value;
    chunk.dirty = true;
}

ChunkRange TileStore::visibleChunkRange(TilePos center, int32_t width, int32_t height) const {
    if (width <= 0 || height <= 0) {
        return ChunkRange{};
    }

    int32_t minX = center.x - width / 2;
    int32_t minY = center.y - height / 2;
    int32_t maxX = minX + width - 1;
    int32_t maxY = minY + height - 1;

    if (maxX < 0 || maxY < 0 || minX >= m_width || minY >= m_height) {
        return ChunkRange{};
    }

    ChunkCoord lo = toChunkCoord(std::max(minX, 0), std::max(minY, 0));
    ChunkCoord hi = toChunkCoord(std::min(maxX, m_width - 1), std::min(maxY, m_height - 1));
    return ChunkRange{lo.cx, lo.cy, hi.cx, hi.cy};
}

void TileStore::initializeTemperatures() {
    for (Chunk& chunk : m_chunks) {
        for (int32_t i = 0; i < CHUNK_TILES; ++i) {
            chunk.temperature[static_cast<size_t>(i)] = targetTemperature(chunk.terrainAt(i));
        }
        chunk.atEquilibrium = true;
    }
    TILESTORE_DEBUG("Initialized temperatures for " + std::to_string(m_chunks.size()) + " chunks");
}

bool TileStore::decayChunk(Chunk& chunk, double decay, float tolerance) {
    std::array<float, CHUNK_TILES> next;
    bool settled = true;

    for (int32_t i = 0; i < CHUNK_TILES; ++i) {
        const double target = targetTemperature(chunk.terrainAt(i));
        const double old = chunk.temperature[static_cast<size_t>(i)];
        double value = target + (old - target) * decay;
        if (std::abs(value - target) <= tolerance) {
            value = target;
        } else {
            settled = false;
        }
        next[static_cast<size_t>(i)] = static_cast<float>(value);
    }

    chunk.temperature = next;
    chunk.atEquilibrium = settled;
    return settled;
}

bool TileStore::relaxChunk(int32_t cx, int32_t cy, uint64_t tick, float relaxRate, float tolerance) {
    if (!chunkInBounds(cx, cy)) {
        return false;
    }
    Chunk& chunk = chunkAt(cx, cy);
    chunk.lastUpdatedTick = tick;
    if (chunk.atEquilibrium) {
        return true;
    }
    return decayChunk(chunk, 1.0 - static_cast<double>(relaxRate), tolerance);
}

void TileStore::fastForwardChunk(int32_t cx, int32_t cy, uint64_t tick, float relaxRate, float tolerance) {
    if (!chunkInBounds(cx, cy)) {
        return;
    }
    Chunk& chunk = chunkAt(cx, cy);
    if (tick <= chunk.lastUpdatedTick) {
        return;
    }
    const uint64_t elapsed = tick - chunk.lastUpdatedTick;
    chunk.lastUpdatedTick = tick;
    if (chunk.atEquilibrium) {
        return;
    }

    const double decay = std::pow(1.0 - static_cast<double>(relaxRate), static_cast<double>(elapsed));
    decayChunk(chunk, decay, tolerance);
}

void TileStore::clearDirtyFlags() {
    for (Chunk& chunk : m_chunks) {
        chunk.dirty = false;
    }
}

} // namespace CityScale
