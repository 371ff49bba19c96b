/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE HierarchicalPathfinderTests
#include <boost/test/unit_test.hpp>

#include "pathfinding/HierarchicalPathfinder.hpp"
#include "pathfinding/LocalSearch.hpp"
#include "world/TileStore.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

using namespace CityScale;

namespace {

// Checks adjacency, walkability and the no-corner-cutting rule for every step
void checkPathValid(const TileStore& tiles, const PathResult& result, TilePos start, TilePos goal) {
    BOOST_REQUIRE(!result.tiles.empty());
    BOOST_CHECK(result.tiles.front() == start);
    BOOST_CHECK(result.tiles.back() == goal);

    float cost = 0.0f;
    for (size_t i = 0; i < result.tiles.size(); ++i) {
        const TilePos p = result.tiles[i];
        BOOST_REQUIRE(tiles.isWalkable(p.x, p.y));
        if (i == 0) {
            continue;
        }
        const TilePos q = result.tiles[i - 1];
        const int dx = std::abs(p.x - q.x);
        const int dy = std::abs(p.y - q.y);
        BOOST_REQUIRE(dx <= 1 && dy <= 1 && (dx + dy) > 0);
        if (dx == 1 && dy == 1) {
            BOOST_REQUIRE(tiles.isWalkable(p.x, q.y));
            BOOST_REQUIRE(tiles.isWalkable(q.x, p.y));
        }
        cost += LocalSearch::stepCost(tiles, q, p);
    }
    BOOST_CHECK_CLOSE(result.cost, cost, 0.1f);
}

} // namespace

struct PathFixture {
    TileStore tiles{256, 256};
    PathfindingConfig config;

    PathFixture() {
        for (int32_t y = 0; y < tiles.height(); ++y) {
            for (int32_t x = 0; x < tiles.width(); ++x) {
                tiles.setTerrain(x, y, Terrain::Road);
            }
        }
    }

    void wallColumn(int32_t x, int32_t gapStart = -1, int32_t gapEnd = -1) {
        for (int32_t y = 0; y < tiles.height(); ++y) {
            if (y >= gapStart && y < gapEnd) {
                continue;
            }
            tiles.setTerrain(x, y, Terrain::Wall);
        }
    }
};

BOOST_FIXTURE_TEST_SUITE(LocalSearchTests, PathFixture)

BOOST_AUTO_TEST_CASE(TestStraightAndDiagonalCosts) {
    LocalSearch search;
    std::vector<TilePos> path;
    const TileRect bounds{0, 0, 64, 64};

    LocalSearch::Outcome straight = search.findPath(tiles, bounds, TilePos{1, 1}, TilePos{10, 1}, 10000, &path);
    BOOST_CHECK_EQUAL(straight.status, PathfindingResult::SUCCESS);
    BOOST_CHECK_CLOSE(straight.cost, 9.0f, 0.001f);
    BOOST_CHECK_EQUAL(path.size(), 10u);

    LocalSearch::Outcome diagonal = search.findPath(tiles, bounds, TilePos{0, 0}, TilePos{5, 5}, 10000, &path);
    BOOST_CHECK_EQUAL(diagonal.status, PathfindingResult::SUCCESS);
    BOOST_CHECK_CLOSE(diagonal.cost, 5.0f * COST_DIAGONAL, 0.001f);
    BOOST_CHECK_EQUAL(path.size(), 6u);
}

BOOST_AUTO_TEST_CASE(TestTerrainWeightsAreSymmetric) {
    tiles.setTerrain(5, 5, Terrain::Sand);
    const float there = LocalSearch::stepCost(tiles, TilePos{4, 5}, TilePos{5, 5});
    const float back = LocalSearch::stepCost(tiles, TilePos{5, 5}, TilePos{4, 5});
    BOOST_CHECK_EQUAL(there, back);
    BOOST_CHECK_CLOSE(there, 0.5f * (1.0f + 1.5f), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestNoCornerCutting) {
    tiles.setTerrain(5, 4, Terrain::Wall);
    tiles.setTerrain(4, 5, Terrain::Wall);
    LocalSearch search;
    std::vector<TilePos> path;
    LocalSearch::Outcome outcome =
        search.findPath(tiles, TileRect{0, 0, 64, 64}, TilePos{4, 4}, TilePos{5, 5}, 10000, &path);
    BOOST_CHECK_EQUAL(outcome.status, PathfindingResult::SUCCESS);
    BOOST_CHECK_GT(path.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestBudgetExhaustion) {
    LocalSearch search;
    LocalSearch::Outcome outcome =
        search.findPath(tiles, TileRect{0, 0, 64, 64}, TilePos{0, 0}, TilePos{63, 63}, 3, nullptr);
    BOOST_CHECK_EQUAL(outcome.status, PathfindingResult::TIMEOUT);
}

BOOST_AUTO_TEST_CASE(TestDistanceField) {
    wallColumn(10);
    LocalSearch search;
    std::vector<float> dist;
    const TileRect bounds{0, 0, 64, 64};
    const int expanded = search.distanceField(tiles, bounds, TilePos{0, 0}, dist);

    BOOST_CHECK_EQUAL(expanded, 10 * 64);
    BOOST_CHECK_EQUAL(dist[0], 0.0f);
    BOOST_CHECK_CLOSE(dist[static_cast<size_t>(0 * 64 + 9)], 9.0f, 0.001f);
    BOOST_CHECK(std::isinf(dist[static_cast<size_t>(0 * 64 + 20)]));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(HierarchicalTests, PathFixture)

BOOST_AUTO_TEST_CASE(TestSameChunkPath) {
    HierarchicalPathfinder pathfinder(config);
    PathResult result = pathfinder.findPath(tiles, TilePos{2, 2}, TilePos{20, 30});
    BOOST_REQUIRE_EQUAL(result.status, PathfindingResult::SUCCESS);
    checkPathValid(tiles, result, TilePos{2, 2}, TilePos{20, 30});
    BOOST_CHECK_CLOSE(result.cost, LocalSearch::octile(TilePos{2, 2}, TilePos{20, 30}), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestCrossChunkPathIsStitched) {
    HierarchicalPathfinder pathfinder(config);
    const TilePos start{3, 5};
    const TilePos goal{250, 240};
    PathResult result = pathfinder.findPath(tiles, start, goal);
    BOOST_REQUIRE_EQUAL(result.status, PathfindingResult::SUCCESS);
    checkPathValid(tiles, result, start, goal);

    // Abstract paths are near-optimal, never shorter than the octile bound
    const float lowerBound = LocalSearch::octile(start, goal);
    BOOST_CHECK_GE(result.cost, lowerBound - 0.01f);
    BOOST_CHECK_LE(result.cost, lowerBound * 1.25f);

    BOOST_CHECK(pathfinder.isBuilt());
    BOOST_CHECK_GT(pathfinder.nodeCount(), 0u);
    BOOST_CHECK_EQUAL(pathfinder.getStats().abstractSearches, 1u);
}

BOOST_AUTO_TEST_CASE(TestWallBlocksEverything) {
    wallColumn(128);
    HierarchicalPathfinder pathfinder(config);
    PathResult result = pathfinder.findPath(tiles, TilePos{10, 10}, TilePos{200, 10});
    BOOST_CHECK_EQUAL(result.status, PathfindingResult::NO_PATH_FOUND);
    BOOST_CHECK(result.tiles.empty());
    BOOST_CHECK_EQUAL(pathfinder.getStats().noPathFound, 1u);
}

BOOST_AUTO_TEST_CASE(TestPathThroughDistantGap) {
    wallColumn(128, 200, 204);
    HierarchicalPathfinder pathfinder(config);
    const TilePos start{10, 10};
    const TilePos goal{200, 10};
    PathResult result = pathfinder.findPath(tiles, start, goal);
    BOOST_REQUIRE_EQUAL(result.status, PathfindingResult::SUCCESS);
    checkPathValid(tiles, result, start, goal);

    bool crossedGap = false;
    for (const TilePos& p : result.tiles) {
        if (p.x == 128) {
            BOOST_CHECK(p.y >= 200 && p.y < 204);
            crossedGap = true;
        }
    }
    BOOST_CHECK(crossedGap);
}

BOOST_AUTO_TEST_CASE(TestNeighbouringChunksFallBackToAbstract) {
    // Start and goal in adjacent chunks, but the only opening is far outside
    // the local search margin
    wallColumn(64, 250, 253);
    HierarchicalPathfinder pathfinder(config);
    const TilePos start{60, 2};
    const TilePos goal{70, 2};
    PathResult result = pathfinder.findPath(tiles, start, goal);
    BOOST_REQUIRE_EQUAL(result.status, PathfindingResult::SUCCESS);
    checkPathValid(tiles, result, start, goal);
    BOOST_CHECK_EQUAL(pathfinder.getStats().localSearches, 1u);
    BOOST_CHECK_EQUAL(pathfinder.getStats().abstractSearches, 1u);
}

BOOST_AUTO_TEST_CASE(TestInvalidEndpoints) {
    tiles.setTerrain(5, 5, Terrain::Water);
    HierarchicalPathfinder pathfinder(config);

    BOOST_CHECK_EQUAL(pathfinder.findPath(tiles, TilePos{-1, 0}, TilePos{5, 6}).status,
                      PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(pathfinder.findPath(tiles, TilePos{5, 5}, TilePos{5, 6}).status,
                      PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(pathfinder.findPath(tiles, TilePos{5, 6}, TilePos{5, 5}).status,
                      PathfindingResult::INVALID_GOAL);
    BOOST_CHECK_EQUAL(pathfinder.findPath(tiles, TilePos{5, 6}, TilePos{999, 0}).status,
                      PathfindingResult::INVALID_GOAL);

    const PathfindingStats& stats = pathfinder.getStats();
    BOOST_CHECK_EQUAL(stats.totalRequests, 4u);
    BOOST_CHECK_EQUAL(stats.invalidStarts, 2u);
    BOOST_CHECK_EQUAL(stats.invalidGoals, 2u);
}

BOOST_AUTO_TEST_CASE(TestStartEqualsGoal) {
    HierarchicalPathfinder pathfinder(config);
    PathResult result = pathfinder.findPath(tiles, TilePos{7, 7}, TilePos{7, 7});
    BOOST_CHECK(result.found());
    BOOST_REQUIRE_EQUAL(result.tiles.size(), 1u);
    BOOST_CHECK_EQUAL(result.cost, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestRebuildAfterTerrainChange) {
    HierarchicalPathfinder pathfinder(config);
    pathfinder.build(tiles);
    BOOST_CHECK(!pathfinder.isStale(tiles));

    BOOST_CHECK(pathfinder.findPath(tiles, TilePos{10, 10}, TilePos{200, 10}).found());

    wallColumn(128);
    BOOST_CHECK(pathfinder.isStale(tiles));
    BOOST_CHECK_EQUAL(pathfinder.findPath(tiles, TilePos{10, 10}, TilePos{200, 10}).status,
                      PathfindingResult::NO_PATH_FOUND);
    BOOST_CHECK(!pathfinder.isStale(tiles));
}

BOOST_AUTO_TEST_CASE(TestAbstractBudgetTimesOut) {
    config.abstractNodeBudget = 3;
    HierarchicalPathfinder pathfinder(config);
    PathResult result = pathfinder.findPath(tiles, TilePos{3, 3}, TilePos{250, 250});
    BOOST_CHECK_EQUAL(result.status, PathfindingResult::TIMEOUT);
    BOOST_CHECK_EQUAL(pathfinder.getStats().timeouts, 1u);
}

BOOST_AUTO_TEST_CASE(TestEntrancePortalCounts) {
    // Two chunks side by side: one fully open border, split in two by a wall
    TileStore pair(128, 64);
    for (int32_t y = 0; y < 64; ++y) {
        for (int32_t x = 0; x < 128; ++x) {
            pair.setTerrain(x, y, Terrain::Road);
        }
    }
    // Short entrance rows 0..3, long entrance rows 5..63
    pair.setTerrain(63, 4, Terrain::Wall);

    HierarchicalPathfinder pathfinder(config);
    pathfinder.build(pair);

    // One crossing pair for the short run, two for the long run
    BOOST_CHECK_EQUAL(pathfinder.nodeCount(), 6u);
}

BOOST_AUTO_TEST_SUITE_END()
