/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/LocalSearch.hpp"
#include "world/TileStore.hpp"
#include <cmath>
#include <cstdlib>

namespace CityScale {

namespace {

// Straight moves first, then diagonals
constexpr int DX8[8] = {1, -1, 0, 0, 1, 1, -1, -1};
constexpr int DY8[8] = {0, 0, 1, -1, 1, -1, 1, -1};

bool openInBounds(const TileStore& tiles, const TileRect& bounds, int32_t x, int32_t y) {
    return bounds.contains(TilePos{x, y}) && tiles.isWalkable(x, y);
}

} // namespace

float LocalSearch::stepCost(const TileStore& tiles, TilePos from, TilePos to) {
    const bool diagonal = from.x != to.x && from.y != to.y;
    const float step = diagonal ? COST_DIAGONAL : COST_STRAIGHT;
    const float weight = 0.5f * (movementWeight(tiles.getTerrain(from.x, from.y)) +
                                 movementWeight(tiles.getTerrain(to.x, to.y)));
    return step * weight;
}

float LocalSearch::octile(TilePos a, TilePos b) {
    const int dx = std::abs(a.x - b.x);
    const int dy = std::abs(a.y - b.y);
    const int dmin = std::min(dx, dy);
    const int dmax = std::max(dx, dy);
    return COST_DIAGONAL * static_cast<float>(dmin) + COST_STRAIGHT * static_cast<float>(dmax - dmin);
}

template <typename Visit>
void LocalSearch::forEachNeighbor(const TileStore& tiles, const TileRect& bounds, TilePos at, Visit&& visit) {
    for (int i = 0; i < 8; ++i) {
        const int32_t nx = at.x + DX8[i];
        const int32_t ny = at.y + DY8[i];
        if (!openInBounds(tiles, bounds, nx, ny)) {
            continue;
        }
        // No corner cutting: both orthogonal neighbours must be open
        if (i >= 4 && (!openInBounds(tiles, bounds, nx, at.y) || !openInBounds(tiles, bounds, at.x, ny))) {
            continue;
        }
        visit(TilePos{nx, ny});
    }
}

LocalSearch::Outcome LocalSearch::findPath(const TileStore& tiles, const TileRect& bounds, TilePos start,
                                           TilePos goal, int nodeBudget, std::vector<TilePos>* outPath) {
    Outcome outcome;
    if (outPath) {
        outPath->clear();
    }
    if (!openInBounds(tiles, bounds, start.x, start.y)) {
        outcome.status = PathfindingResult::INVALID_START;
        return outcome;
    }
    if (!openInBounds(tiles, bounds, goal.x, goal.y)) {
        outcome.status = PathfindingResult::INVALID_GOAL;
        return outcome;
    }

    const int32_t W = bounds.width;
    auto idx = [&](TilePos p) { return (p.y - bounds.y) * W + (p.x - bounds.x); };
    auto posOf = [&](int32_t i) { return TilePos{bounds.x + i % W, bounds.y + i / W}; };

    m_pool.reset(static_cast<size_t>(bounds.width) * static_cast<size_t>(bounds.height));
    auto& open = m_pool.openQueue;
    auto& gScore = m_pool.gScoreBuffer;
    auto& parent = m_pool.parentBuffer;
    auto& closed = m_pool.closedBuffer;

    const int32_t sIdx = idx(start);
    const int32_t gIdx = idx(goal);
    gScore[static_cast<size_t>(sIdx)] = 0.0f;
    open.push(NodePool::Node{sIdx, octile(start, goal)});

    while (!open.empty()) {
        if (outcome.expansions >= nodeBudget) {
            outcome.status = PathfindingResult::TIMEOUT;
            return outcome;
        }

        NodePool::Node cur = open.top();
        open.pop();
        if (closed[static_cast<size_t>(cur.index)]) {
            continue;
        }
        closed[static_cast<size_t>(cur.index)] = 1;
        ++outcome.expansions;

        if (cur.index == gIdx) {
            outcome.status = PathfindingResult::SUCCESS;
            outcome.cost = gScore[static_cast<size_t>(gIdx)];
            if (outPath) {
                for (int32_t i = gIdx; i >= 0; i = parent[static_cast<size_t>(i)]) {
                    outPath->push_back(posOf(i));
                }
                std::reverse(outPath->begin(), outPath->end());
            }
            return outcome;
        }

        const TilePos at = posOf(cur.index);
        const float gCur = gScore[static_cast<size_t>(cur.index)];
        forEachNeighbor(tiles, bounds, at, [&](TilePos next) {
            const size_t nIndex = static_cast<size_t>(idx(next));
            if (closed[nIndex]) {
                return;
            }
            const float tentative = gCur + stepCost(tiles, at, next);
            if (tentative < gScore[nIndex]) {
                gScore[nIndex] = tentative;
                parent[nIndex] = cur.index;
                open.push(NodePool::Node{static_cast<int32_t>(nIndex), tentative + octile(next, goal)});
            }
        });
    }

    outcome.status = PathfindingResult::NO_PATH_FOUND;
    return outcome;
}

int LocalSearch::distanceField(const TileStore& tiles, const TileRect& bounds, TilePos source,
                               std::vector<float>& outDist) {
    const size_t size = static_cast<size_t>(bounds.width) * static_cast<size_t>(bounds.height);
    outDist.assign(size, std::numeric_limits<float>::infinity());
    if (!openInBounds(tiles, bounds, source.x, source.y)) {
        return 0;
    }

    const int32_t W = bounds.width;
    auto idx = [&](TilePos p) { return (p.y - bounds.y) * W + (p.x - bounds.x); };
    auto posOf = [&](int32_t i) { return TilePos{bounds.x + i % W, bounds.y + i / W}; };

    m_pool.reset(size);
    auto& open = m_pool.openQueue;
    auto& closed = m_pool.closedBuffer;

    const int32_t sIdx = idx(source);
    outDist[static_cast<size_t>(sIdx)] = 0.0f;
    open.push(NodePool::Node{sIdx, 0.0f});

    int expansions = 0;
    while (!open.empty()) {
        NodePool::Node cur = open.top();
        open.pop();
        if (closed[static_cast<size_t>(cur.index)]) {
            continue;
        }
        closed[static_cast<size_t>(cur.index)] = 1;
        ++expansions;

        const TilePos at = posOf(cur.index);
        const float dCur = outDist[static_cast<size_t>(cur.index)];
        forEachNeighbor(tiles, bounds, at, [&](TilePos next) {
            const size_t nIndex = static_cast<size_t>(idx(next));
            if (closed[nIndex]) {
                return;
            }
            const float tentative = dCur + stepCost(tiles, at, next);
            if (tentative < outDist[nIndex]) {
                outDist[nIndex] = tentative;
                open.push(NodePool::Node{static_cast<int32_t>(nIndex), tentative});
            }
        });
    }
    return expansions;
}

} // namespace CityScale
