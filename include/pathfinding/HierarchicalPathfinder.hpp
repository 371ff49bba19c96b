/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HIERARCHICAL_PATHFINDER_HPP
#define HIERARCHICAL_PATHFINDER_HPP

#include "config/SimulationConfig.hpp"
#include "pathfinding/LocalSearch.hpp"
#include "pathfinding/PathfindingTypes.hpp"
#include "world/Chunk.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace CityScale {

class TileStore;

/**
 * @brief HPA* over the chunk grid
 *
 * The abstract graph has one node per border-crossing tile. Entrances are
 * maximal runs of tile pairs that are walkable on both sides of a chunk
 * border; short runs get one crossing at their middle, long runs one at each
 * end. Intra-chunk edges carry the exact chunk-local shortest-path cost.
 *
 * Queries between the same or neighbouring chunks try a bounded tile-level
 * A* first. Everything else, and any local failure, goes through the
 * abstract graph and is refined back into tiles chunk by chunk.
 */
class HierarchicalPathfinder {
public:
    explicit HierarchicalPathfinder(const PathfindingConfig& config);

    // Precomputes the abstract graph for the current terrain
    void build(const TileStore& tiles);

    bool isBuilt() const { return m_built; }

    // True when terrain changed since the last build
    bool isStale(const TileStore& tiles) const;

    /**
     * @brief Finds an 8-way path from start to goal
     *
     * Rebuilds first if the graph is stale. Never throws; failures are
     * reported through PathResult::status.
     */
    PathResult findPath(const TileStore& tiles, TilePos start, TilePos goal);

    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const;

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    struct Edge {
        int32_t to;
        float cost;
    };

    struct Node {
        TilePos pos;
        ChunkCoord chunk;
        std::vector<Edge> edges;
    };

    PathfindingConfig m_config;
    std::vector<Node> m_nodes;
    std::vector<std::vector<int32_t>> m_chunkNodes;   // node ids per chunk slot
    std::unordered_map<TilePos, int32_t> m_nodeByTile;
    uint64_t m_builtRevision{0};
    bool m_built{false};

    LocalSearch m_local;
    std::vector<float> m_field;
    PathfindingStats m_stats{};

    int32_t nodeFor(const TileStore& tiles, TilePos pos);
    void addEntrances(const TileStore& tiles, TilePos first, int32_t length, bool vertical);
    void connectChunk(const TileStore& tiles, int32_t cx, int32_t cy);

    bool searchLocal(const TileStore& tiles, TilePos start, TilePos goal, PathResult& result);
    PathfindingResult searchAbstract(const TileStore& tiles, TilePos start, TilePos goal,
                                     std::vector<TilePos>& outWaypoints);
    bool refine(const TileStore& tiles, const std::vector<TilePos>& waypoints, PathResult& result);

    void recordOutcome(const PathResult& result);
};

} // namespace CityScale

#endif // HIERARCHICAL_PATHFINDER_HPP
