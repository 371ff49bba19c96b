/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/TemperatureSystem.hpp"
#include "simulation/ZoneClassifier.hpp"
#include "world/TileStore.hpp"
#include <cmath>

namespace CityScale {

TemperatureSystem::TemperatureSystem(const TemperatureConfig& config)
    : m_config(config) {}

size_t TemperatureSystem::update(TileStore& tiles, const ZoneClassifier& classifier, TilePos poi,
                                 uint64_t tick) const {
    // Chunk centres within the Nearby radius all lie inside this square
    const int32_t reach = static_cast<int32_t>(std::ceil(classifier.config().nearbyRadius)) + CHUNK_SIZE;
    const ChunkRange range = tiles.visibleChunkRange(poi, 2 * reach, 2 * reach);
    if (range.empty()) {
        return 0;
    }

    size_t recomputed = 0;
    for (int32_t cy = range.minCy; cy <= range.maxCy; ++cy) {
        for (int32_t cx = range.minCx; cx <= range.maxCx; ++cx) {
            if (classifier.classifyChunk(tiles, poi, cx, cy) == Zone::Statistical) {
                continue;
            }
            Chunk& chunk = tiles.chunkAt(cx, cy);
            if (chunk.atEquilibrium) {
                chunk.lastUpdatedTick = tick;
                continue;
            }
            if (tick <= chunk.lastUpdatedTick) {
                continue;
            }
            if (tick - chunk.lastUpdatedTick == 1) {
                tiles.relaxChunk(cx, cy, tick, m_config.relaxRate, m_config.tolerance);
            } else {
                tiles.fastForwardChunk(cx, cy, tick, m_config.relaxRate, m_config.tolerance);
            }
            ++recomputed;
        }
    }
    return recomputed;
}

} // namespace CityScale
