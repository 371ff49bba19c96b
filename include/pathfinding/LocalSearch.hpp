/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOCAL_SEARCH_HPP
#define LOCAL_SEARCH_HPP

#include "pathfinding/PathfindingTypes.hpp"
#include "world/TileTypes.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <queue>
#include <vector>

namespace CityScale {

class TileStore;

/**
 * @brief Tile-level searches confined to a rectangle of the map
 *
 * 8-way movement without corner cutting. A step costs the straight or
 * diagonal length times the mean movement weight of the two tiles, so
 * costs are symmetric. Work buffers are pooled and reused across calls.
 */
class LocalSearch {
public:
    struct Outcome {
        PathfindingResult status{PathfindingResult::NO_PATH_FOUND};
        float cost{0.0f};
        int expansions{0};
    };

    /**
     * @brief A* from start to goal without leaving bounds
     * @param nodeBudget expansions allowed before giving up with TIMEOUT
     * @param outPath receives start..goal inclusive on success (may be null)
     */
    Outcome findPath(const TileStore& tiles, const TileRect& bounds, TilePos start, TilePos goal,
                     int nodeBudget, std::vector<TilePos>* outPath);

    /**
     * @brief Dijkstra from source over every reachable tile in bounds
     *
     * outDist is indexed (y - bounds.y) * bounds.width + (x - bounds.x);
     * unreachable tiles hold infinity.
     * @return number of expanded tiles
     */
    int distanceField(const TileStore& tiles, const TileRect& bounds, TilePos source,
                      std::vector<float>& outDist);

    static float stepCost(const TileStore& tiles, TilePos from, TilePos to);
    static float octile(TilePos a, TilePos b);

private:
    struct NodePool {
        struct Node { int32_t index; float f; };
        struct Cmp {
            bool operator()(const Node& a, const Node& b) const {
                return a.f > b.f || (a.f == b.f && a.index > b.index);
            }
        };

        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<int32_t> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void reset(size_t size) {
            while (!openQueue.empty()) openQueue.pop();
            gScoreBuffer.assign(size, std::numeric_limits<float>::infinity());
            parentBuffer.assign(size, -1);
            closedBuffer.assign(size, 0);
        }
    };

    NodePool m_pool;

    template <typename Visit>
    static void forEachNeighbor(const TileStore& tiles, const TileRect& bounds, TilePos at, Visit&& visit);
};

} // namespace CityScale

#endif // LOCAL_SEARCH_HPP
