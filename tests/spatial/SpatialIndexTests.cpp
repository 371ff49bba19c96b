/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpatialIndexTests
#include <boost/test/unit_test.hpp>

#include "population/IndividualTable.hpp"
#include "spatial/SpatialIndex.hpp"
#include <vector>

using namespace CityScale;

struct SpatialFixture {
    IndividualTable table;
    SpatialIndex index;

    void add(IndividualId id, int32_t x, int32_t y) {
        Individual record;
        record.id = id;
        record.position = TilePos{x, y};
        BOOST_REQUIRE(table.insert(record));
    }
};

BOOST_FIXTURE_TEST_SUITE(SpatialIndexTestSuite, SpatialFixture)

BOOST_AUTO_TEST_CASE(TestQueryCell) {
    add(1, 5, 5);
    add(2, 5, 5);
    add(3, 6, 5);
    index.rebuild(table);

    const auto& cell = index.queryCell(5, 5);
    BOOST_REQUIRE_EQUAL(cell.size(), 2u);
    BOOST_CHECK_EQUAL(cell[0], 1u);
    BOOST_CHECK_EQUAL(cell[1], 2u);
    BOOST_CHECK_EQUAL(index.queryCell(6, 5).size(), 1u);
    BOOST_CHECK(index.queryCell(7, 7).empty());
    BOOST_CHECK(index.queryCell(-100, 100000).empty());

    BOOST_CHECK_EQUAL(index.indexedCount(), 3u);
    BOOST_CHECK_EQUAL(index.occupiedCellCount(), 2u);
}

BOOST_AUTO_TEST_CASE(TestQueryAreaRowMajorOrder) {
    add(10, 3, 2);
    add(11, 1, 2);
    add(12, 2, 1);
    add(13, 8, 8);   // outside
    index.rebuild(table);

    std::vector<IndividualId> out;
    index.queryArea(TileRect{0, 0, 5, 5}, out);
    BOOST_REQUIRE_EQUAL(out.size(), 3u);
    BOOST_CHECK_EQUAL(out[0], 12u);
    BOOST_CHECK_EQUAL(out[1], 11u);
    BOOST_CHECK_EQUAL(out[2], 10u);
}

BOOST_AUTO_TEST_CASE(TestSmallAndLargeAreaPathsAgree) {
    // Small area walks tiles, large area walks occupied cells
    for (IndividualId id = 1; id <= 40; ++id) {
        add(id, static_cast<int32_t>((id * 7) % 13), static_cast<int32_t>((id * 5) % 11));
    }
    index.rebuild(table);

    std::vector<IndividualId> small;
    index.queryArea(TileRect{2, 2, 3, 3}, small);

    std::vector<IndividualId> viaCells;
    index.queryArea(TileRect{-1000, -1000, 3000, 3000}, viaCells);
    BOOST_CHECK_EQUAL(viaCells.size(), 40u);

    // Filter the full listing to the small rectangle, preserving order
    std::vector<IndividualId> filtered;
    for (IndividualId id : viaCells) {
        const TilePos pos = table.find(id)->position;
        if (TileRect{2, 2, 3, 3}.contains(pos)) {
            filtered.push_back(id);
        }
    }
    BOOST_CHECK_EQUAL_COLLECTIONS(small.begin(), small.end(), filtered.begin(), filtered.end());
}

BOOST_AUTO_TEST_CASE(TestRebuildReflectsRemovalsAndMoves) {
    add(1, 0, 0);
    add(2, 1, 1);
    index.rebuild(table);
    BOOST_CHECK_EQUAL(index.queryCell(0, 0).size(), 1u);

    table.remove(1);
    table.find(2)->position = TilePos{4, 4};
    index.rebuild(table);
    BOOST_CHECK(index.queryCell(0, 0).empty());
    BOOST_CHECK(index.queryCell(1, 1).empty());
    BOOST_CHECK_EQUAL(index.queryCell(4, 4).size(), 1u);
    BOOST_CHECK_EQUAL(index.indexedCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestEmptyArea) {
    add(1, 0, 0);
    index.rebuild(table);
    std::vector<IndividualId> out;
    index.queryArea(TileRect{0, 0, 0, 5}, out);
    BOOST_CHECK(out.empty());
}

BOOST_AUTO_TEST_SUITE_END()
