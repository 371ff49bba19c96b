/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "pathfinding/HierarchicalPathfinder.hpp"
#include "core/Logger.hpp"
#include "world/TileStore.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <queue>
#include <string>

namespace CityScale {

namespace {

constexpr float INF = std::numeric_limits<float>::infinity();

int32_t fieldIndex(const TileRect& bounds, TilePos pos) {
    return (pos.y - bounds.y) * bounds.width + (pos.x - bounds.x);
}

TileRect clipToMap(const TileStore& tiles, int32_t x0, int32_t y0, int32_t x1, int32_t y1) {
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, tiles.width());
    y1 = std::min(y1, tiles.height());
    return TileRect{x0, y0, x1 - x0, y1 - y0};
}

} // namespace

HierarchicalPathfinder::HierarchicalPathfinder(const PathfindingConfig& config)
    : m_config(config) {}

bool HierarchicalPathfinder::isStale(const TileStore& tiles) const {
    return !m_built || tiles.terrainRevision() != m_builtRevision;
}

size_t HierarchicalPathfinder::edgeCount() const {
    size_t count = 0;
    for (const auto& node : m_nodes) {
        count += node.edges.size();
    }
    return count;
}

int32_t HierarchicalPathfinder::nodeFor(const TileStore& tiles, TilePos pos) {
    auto it = m_nodeByTile.find(pos);
    if (it != m_nodeByTile.end()) {
        return it->second;
    }
    const int32_t id = static_cast<int32_t>(m_nodes.size());
    Node node;
    node.pos = pos;
    node.chunk = TileStore::toChunkCoord(pos.x, pos.y);
    m_nodes.push_back(std::move(node));
    m_nodeByTile.emplace(pos, id);
    m_chunkNodes[tiles.chunkIndex(m_nodes.back().chunk.cx, m_nodes.back().chunk.cy)].push_back(id);
    return id;
}

void HierarchicalPathfinder::addEntrances(const TileStore& tiles, TilePos first, int32_t length, bool vertical) {
    auto along = [&](int32_t t) {
        return vertical ? TilePos{first.x, first.y + t} : TilePos{first.x + t, first.y};
    };
    auto across = [&](TilePos p) {
        return vertical ? TilePos{p.x + 1, p.y} : TilePos{p.x, p.y + 1};
    };

    int32_t offsets[2] = {length / 2, 0};
    int offsetCount = 1;
    if (length > m_config.entranceSplitLength) {
        offsets[0] = 0;
        offsets[1] = length - 1;
        offsetCount = 2;
    }

    for (int i = 0; i < offsetCount; ++i) {
        const TilePos a = along(offsets[i]);
        const TilePos b = across(a);
        const int32_t na = nodeFor(tiles, a);
        const int32_t nb = nodeFor(tiles, b);
        const float cost = LocalSearch::stepCost(tiles, a, b);
        m_nodes[static_cast<size_t>(na)].edges.push_back(Edge{nb, cost});
        m_nodes[static_cast<size_t>(nb)].edges.push_back(Edge{na, cost});
    }
}

void HierarchicalPathfinder::connectChunk(const TileStore& tiles, int32_t cx, int32_t cy) {
    const auto& ids = m_chunkNodes[tiles.chunkIndex(cx, cy)];
    if (ids.size() < 2) {
        return;
    }
    const TileRect bounds = tiles.chunkTileBounds(cx, cy);
    for (int32_t from : ids) {
        m_local.distanceField(tiles, bounds, m_nodes[static_cast<size_t>(from)].pos, m_field);
        for (int32_t to : ids) {
            if (to == from) {
                continue;
            }
            const float d = m_field[static_cast<size_t>(fieldIndex(bounds, m_nodes[static_cast<size_t>(to)].pos))];
            if (d < INF) {
                m_nodes[static_cast<size_t>(from)].edges.push_back(Edge{to, d});
            }
        }
    }
}

void HierarchicalPathfinder::build(const TileStore& tiles) {
    m_nodes.clear();
    m_nodeByTile.clear();
    m_chunkNodes.assign(tiles.chunkCount(), {});

    for (int32_t cy = 0; cy < tiles.chunksPerColumn(); ++cy) {
        for (int32_t cx = 0; cx < tiles.chunksPerRow(); ++cx) {
            const TileRect bounds = tiles.chunkTileBounds(cx, cy);

            // Border with the chunk to the east
            if (tiles.chunkInBounds(cx + 1, cy)) {
                const int32_t x = bounds.x + bounds.width - 1;
                int32_t runStart = -1;
                for (int32_t y = bounds.y; y <= bounds.y + bounds.height; ++y) {
                    const bool open = y < bounds.y + bounds.height &&
                                      tiles.isWalkable(x, y) && tiles.isWalkable(x + 1, y);
                    if (open && runStart < 0) {
                        runStart = y;
                    } else if (!open && runStart >= 0) {
                        addEntrances(tiles, TilePos{x, runStart}, y - runStart, true);
                        runStart = -1;
                    }
                }
            }

            // Border with the chunk to the south
            if (tiles.chunkInBounds(cx, cy + 1)) {
                const int32_t y = bounds.y + bounds.height - 1;
                int32_t runStart = -1;
                for (int32_t x = bounds.x; x <= bounds.x + bounds.width; ++x) {
                    const bool open = x < bounds.x + bounds.width &&
                                      tiles.isWalkable(x, y) && tiles.isWalkable(x, y + 1);
                    if (open && runStart < 0) {
                        runStart = x;
                    } else if (!open && runStart >= 0) {
                        addEntrances(tiles, TilePos{runStart, y}, x - runStart, false);
                        runStart = -1;
                    }
                }
            }
        }
    }

    for (int32_t cy = 0; cy < tiles.chunksPerColumn(); ++cy) {
        for (int32_t cx = 0; cx < tiles.chunksPerRow(); ++cx) {
            connectChunk(tiles, cx, cy);
        }
    }

    m_builtRevision = tiles.terrainRevision();
    m_built = true;
    PATHFIND_INFO("Abstract graph built: " + std::to_string(m_nodes.size()) + " nodes, " +
                  std::to_string(edgeCount()) + " edges over " +
                  std::to_string(tiles.chunkCount()) + " chunks");
}

bool HierarchicalPathfinder::searchLocal(const TileStore& tiles, TilePos start, TilePos goal, PathResult& result) {
    const ChunkCoord sc = TileStore::toChunkCoord(start.x, start.y);
    const ChunkCoord gc = TileStore::toChunkCoord(goal.x, goal.y);
    const int32_t minCx = std::min(sc.cx, gc.cx) - 1;
    const int32_t minCy = std::min(sc.cy, gc.cy) - 1;
    const int32_t maxCx = std::max(sc.cx, gc.cx) + 1;
    const int32_t maxCy = std::max(sc.cy, gc.cy) + 1;
    const TileRect area = clipToMap(tiles, minCx * CHUNK_SIZE, minCy * CHUNK_SIZE,
                                    (maxCx + 1) * CHUNK_SIZE, (maxCy + 1) * CHUNK_SIZE);

    ++m_stats.localSearches;
    const LocalSearch::Outcome outcome =
        m_local.findPath(tiles, area, start, goal, m_config.localNodeBudget, &result.tiles);
    m_stats.totalExpansions += static_cast<uint64_t>(outcome.expansions);
    result.status = outcome.status;
    result.cost = outcome.cost;
    return outcome.status == PathfindingResult::SUCCESS;
}

PathfindingResult HierarchicalPathfinder::searchAbstract(const TileStore& tiles, TilePos start, TilePos goal,
                                                         std::vector<TilePos>& outWaypoints) {
    ++m_stats.abstractSearches;
    outWaypoints.clear();

    const ChunkCoord sc = TileStore::toChunkCoord(start.x, start.y);
    const ChunkCoord gc = TileStore::toChunkCoord(goal.x, goal.y);
    const TileRect startBounds = tiles.chunkTileBounds(sc.cx, sc.cy);
    const TileRect goalBounds = tiles.chunkTileBounds(gc.cx, gc.cy);
    const auto& startChunkNodes = m_chunkNodes[tiles.chunkIndex(sc.cx, sc.cy)];
    const auto& goalChunkNodes = m_chunkNodes[tiles.chunkIndex(gc.cx, gc.cy)];

    const int32_t realCount = static_cast<int32_t>(m_nodes.size());
    const int32_t START = realCount;
    const int32_t GOAL = realCount + 1;

    // Temporary edges from the start tile into its chunk's crossings
    std::vector<Edge> startEdges;
    m_stats.totalExpansions += static_cast<uint64_t>(m_local.distanceField(tiles, startBounds, start, m_field));
    for (int32_t id : startChunkNodes) {
        const float d = m_field[static_cast<size_t>(fieldIndex(startBounds, m_nodes[static_cast<size_t>(id)].pos))];
        if (d < INF) {
            startEdges.push_back(Edge{id, d});
        }
    }

    // Costs from goal-chunk crossings to the goal tile (symmetric step costs)
    std::unordered_map<int32_t, float> goalLinks;
    m_stats.totalExpansions += static_cast<uint64_t>(m_local.distanceField(tiles, goalBounds, goal, m_field));
    for (int32_t id : goalChunkNodes) {
        const float d = m_field[static_cast<size_t>(fieldIndex(goalBounds, m_nodes[static_cast<size_t>(id)].pos))];
        if (d < INF) {
            goalLinks.emplace(id, d);
        }
    }
    if (sc == gc) {
        const float direct = m_field[static_cast<size_t>(fieldIndex(goalBounds, start))];
        if (direct < INF) {
            startEdges.push_back(Edge{GOAL, direct});
        }
    }

    if (startEdges.empty()) {
        return PathfindingResult::NO_PATH_FOUND;
    }

    auto posOf = [&](int32_t id) {
        if (id == START) return start;
        if (id == GOAL) return goal;
        return m_nodes[static_cast<size_t>(id)].pos;
    };

    struct QueueNode { int32_t id; float f; };
    struct QueueCmp {
        bool operator()(const QueueNode& a, const QueueNode& b) const {
            return a.f > b.f || (a.f == b.f && a.id > b.id);
        }
    };

    const size_t total = static_cast<size_t>(realCount) + 2;
    std::vector<float> gScore(total, INF);
    std::vector<int32_t> parent(total, -1);
    std::vector<uint8_t> closed(total, 0);
    std::priority_queue<QueueNode, std::vector<QueueNode>, QueueCmp> open;

    gScore[static_cast<size_t>(START)] = 0.0f;
    open.push(QueueNode{START, LocalSearch::octile(start, goal)});

    int expansions = 0;
    auto relax = [&](int32_t from, int32_t to, float cost) {
        if (closed[static_cast<size_t>(to)]) {
            return;
        }
        const float tentative = gScore[static_cast<size_t>(from)] + cost;
        if (tentative < gScore[static_cast<size_t>(to)]) {
            gScore[static_cast<size_t>(to)] = tentative;
            parent[static_cast<size_t>(to)] = from;
            open.push(QueueNode{to, tentative + LocalSearch::octile(posOf(to), goal)});
        }
    };

    while (!open.empty()) {
        if (expansions >= m_config.abstractNodeBudget) {
            m_stats.totalExpansions += static_cast<uint64_t>(expansions);
            return PathfindingResult::TIMEOUT;
        }
        const QueueNode cur = open.top();
        open.pop();
        if (closed[static_cast<size_t>(cur.id)]) {
            continue;
        }
        closed[static_cast<size_t>(cur.id)] = 1;
        ++expansions;

        if (cur.id == GOAL) {
            for (int32_t id = GOAL; id >= 0; id = parent[static_cast<size_t>(id)]) {
                outWaypoints.push_back(posOf(id));
            }
            std::reverse(outWaypoints.begin(), outWaypoints.end());
            m_stats.totalExpansions += static_cast<uint64_t>(expansions);
            return PathfindingResult::SUCCESS;
        }

        if (cur.id == START) {
            for (const Edge& e : startEdges) {
                relax(START, e.to, e.cost);
            }
            continue;
        }

        for (const Edge& e : m_nodes[static_cast<size_t>(cur.id)].edges) {
            relax(cur.id, e.to, e.cost);
        }
        auto link = goalLinks.find(cur.id);
        if (link != goalLinks.end()) {
            relax(cur.id, GOAL, link->second);
        }
    }

    m_stats.totalExpansions += static_cast<uint64_t>(expansions);
    return PathfindingResult::NO_PATH_FOUND;
}

bool HierarchicalPathfinder::refine(const TileStore& tiles, const std::vector<TilePos>& waypoints,
                                    PathResult& result) {
    result.tiles.clear();
    result.cost = 0.0f;
    if (waypoints.empty()) {
        return false;
    }
    result.tiles.push_back(waypoints.front());

    std::vector<TilePos> segment;
    for (size_t i = 1; i < waypoints.size(); ++i) {
        const TilePos from = result.tiles.back();
        const TilePos to = waypoints[i];
        if (from == to) {
            continue;
        }
        const ChunkCoord fc = TileStore::toChunkCoord(from.x, from.y);
        const ChunkCoord tc = TileStore::toChunkCoord(to.x, to.y);
        if (fc != tc) {
            // Inter-chunk edges join adjacent border tiles
            result.cost += LocalSearch::stepCost(tiles, from, to);
            result.tiles.push_back(to);
            continue;
        }
        const LocalSearch::Outcome outcome = m_local.findPath(
            tiles, tiles.chunkTileBounds(fc.cx, fc.cy), from, to, m_config.localNodeBudget, &segment);
        m_stats.totalExpansions += static_cast<uint64_t>(outcome.expansions);
        if (outcome.status != PathfindingResult::SUCCESS) {
            PATHFIND_WARN("Refinement failed between (" + std::to_string(from.x) + ", " +
                          std::to_string(from.y) + ") and (" + std::to_string(to.x) + ", " +
                          std::to_string(to.y) + ")");
            return false;
        }
        result.cost += outcome.cost;
        result.tiles.insert(result.tiles.end(), segment.begin() + 1, segment.end());
    }
    return true;
}

void HierarchicalPathfinder::recordOutcome(const PathResult& result) {
    switch (result.status) {
        case PathfindingResult::SUCCESS: {
            ++m_stats.successfulPaths;
            const uint64_t n = m_stats.successfulPaths;
            m_stats.avgPathLength = static_cast<uint32_t>(
                (static_cast<uint64_t>(m_stats.avgPathLength) * (n - 1) + result.tiles.size()) / n);
            break;
        }
        case PathfindingResult::NO_PATH_FOUND: ++m_stats.noPathFound; break;
        case PathfindingResult::TIMEOUT: ++m_stats.timeouts; break;
        case PathfindingResult::INVALID_START: ++m_stats.invalidStarts; break;
        case PathfindingResult::INVALID_GOAL: ++m_stats.invalidGoals; break;
    }
}

PathResult HierarchicalPathfinder::findPath(const TileStore& tiles, TilePos start, TilePos goal) {
    ++m_stats.totalRequests;
    PathResult result;

    if (!tiles.inBounds(start) || !tiles.isWalkable(start.x, start.y)) {
        result.status = PathfindingResult::INVALID_START;
        recordOutcome(result);
        return result;
    }
    if (!tiles.inBounds(goal) || !tiles.isWalkable(goal.x, goal.y)) {
        result.status = PathfindingResult::INVALID_GOAL;
        recordOutcome(result);
        return result;
    }
    if (start == goal) {
        result.status = PathfindingResult::SUCCESS;
        result.tiles.push_back(start);
        recordOutcome(result);
        return result;
    }

    if (isStale(tiles)) {
        build(tiles);
    }

    const ChunkCoord sc = TileStore::toChunkCoord(start.x, start.y);
    const ChunkCoord gc = TileStore::toChunkCoord(goal.x, goal.y);
    const bool neighbouring = std::abs(sc.cx - gc.cx) <= 1 && std::abs(sc.cy - gc.cy) <= 1;
    if (neighbouring && searchLocal(tiles, start, goal, result)) {
        recordOutcome(result);
        return result;
    }

    std::vector<TilePos> waypoints;
    const PathfindingResult abstractStatus = searchAbstract(tiles, start, goal, waypoints);
    if (abstractStatus == PathfindingResult::SUCCESS && refine(tiles, waypoints, result)) {
        result.status = PathfindingResult::SUCCESS;
    } else {
        result.tiles.clear();
        result.cost = 0.0f;
        result.status = abstractStatus == PathfindingResult::SUCCESS ? PathfindingResult::NO_PATH_FOUND
                                                                     : abstractStatus;
    }

    recordOutcome(result);
    return result;
}

} // namespace CityScale
