/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE DistrictTests
#include <boost/test/unit_test.hpp>

#include "population/DistrictRegistry.hpp"
#include "population/DistrictSerializer.hpp"
#include "population/IndividualTable.hpp"
#include "world/CityRegistry.hpp"
#include "world/TileStore.hpp"
#include <cstring>
#include <memory>
#include <sstream>
#include <string>

using namespace CityScale;

namespace {

OccupationCounts counts(uint32_t laborers, uint32_t dependents) {
    OccupationCounts c{};
    c[static_cast<size_t>(Occupation::Laborer)] = laborers;
    c[static_cast<size_t>(Occupation::Dependent)] = dependents;
    return c;
}

std::string saveToBytes(const DistrictRegistry& registry) {
    auto stream = std::make_shared<std::stringstream>(std::ios::in | std::ios::out | std::ios::binary);
    BinarySerial::Writer writer(stream);
    BOOST_REQUIRE(DistrictSerializer::save(registry, writer));
    return stream->str();
}

LoadResult loadFromBytes(const std::string& bytes, DistrictRegistry& out) {
    auto stream = std::make_shared<std::istringstream>(bytes, std::ios::in | std::ios::binary);
    BinarySerial::Reader reader(stream);
    return DistrictSerializer::load(reader, out);
}

Individual makeRecord(IndividualId id, TilePos pos) {
    Individual record;
    record.id = id;
    record.position = pos;
    return record;
}

} // namespace

BOOST_AUTO_TEST_SUITE(DistrictModelTests)

BOOST_AUTO_TEST_CASE(TestCreateSetsCentroid) {
    District d = District::create(4, "Harbour", TileRect{100, 200, 50, 40});
    BOOST_CHECK_EQUAL(d.id, 4u);
    BOOST_CHECK_EQUAL(d.name, "Harbour");
    BOOST_CHECK(d.centroid == (TilePos{125, 220}));
    BOOST_CHECK_EQUAL(d.zone, Zone::Statistical);
}

BOOST_AUTO_TEST_CASE(TestMembershipKeepsSumsInStep) {
    District d = District::create(1, "A", TileRect{0, 0, 10, 10});
    d.seedPopulation(counts(3, 2));
    BOOST_CHECK_EQUAL(d.population, 5u);
    BOOST_CHECK_EQUAL(d.workers(), 3u);

    d.addMember(Occupation::Merchant);
    BOOST_CHECK_EQUAL(d.population, 6u);
    BOOST_CHECK_EQUAL(d.categorySum(), 6u);

    BOOST_CHECK(d.removeMember(Occupation::Laborer));
    BOOST_CHECK(!d.removeMember(Occupation::Artisan));
    BOOST_CHECK_EQUAL(d.population, 5u);
    BOOST_CHECK_EQUAL(d.categorySum(), d.population);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DistrictRegistryTests)

BOOST_AUTO_TEST_CASE(TestAddRejectsBadDistricts) {
    DistrictRegistry registry;
    BOOST_CHECK(registry.add(District::create(2, "B", TileRect{10, 0, 10, 10})));
    BOOST_CHECK(registry.add(District::create(1, "A", TileRect{0, 0, 10, 10})));

    BOOST_CHECK(!registry.add(District::create(0, "Reserved", TileRect{50, 50, 5, 5})));
    BOOST_CHECK(!registry.add(District::create(2, "Duplicate", TileRect{80, 80, 5, 5})));
    BOOST_CHECK(!registry.add(District::create(3, "Overlap", TileRect{5, 5, 10, 10})));

    BOOST_REQUIRE_EQUAL(registry.size(), 2u);
    BOOST_CHECK_EQUAL(registry.districts()[0].id, 1u);
    BOOST_CHECK_EQUAL(registry.districts()[1].id, 2u);
    BOOST_REQUIRE(registry.find(2) != nullptr);
    BOOST_CHECK_EQUAL(registry.find(2)->name, "B");
    BOOST_CHECK(registry.find(3) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestAdjacencyFromSharedEdges) {
    DistrictRegistry registry;
    registry.add(District::create(1, "West", TileRect{0, 0, 10, 10}));
    registry.add(District::create(2, "East", TileRect{10, 0, 10, 10}));
    registry.add(District::create(3, "South", TileRect{0, 10, 10, 10}));
    registry.add(District::create(4, "Far", TileRect{100, 100, 10, 10}));
    registry.computeAdjacency();

    const District* west = registry.find(1);
    BOOST_REQUIRE_EQUAL(west->neighbours.size(), 2u);
    BOOST_CHECK_EQUAL(west->neighbours[0], 2u);
    BOOST_CHECK_EQUAL(west->neighbours[1], 3u);

    // Corner contact only
    BOOST_CHECK_EQUAL(registry.find(2)->neighbours.size(), 1u);
    BOOST_CHECK(registry.find(4)->neighbours.empty());
}

BOOST_AUTO_TEST_CASE(TestBindBuildingsBuildsPrefixTable) {
    TileStore tiles(64, 64);
    for (int32_t x = 0; x < 4; ++x) {
        tiles.setBuildingId(x, 0, 5);
        tiles.setDistrictId(x, 0, 1);
    }
    for (int32_t x = 10; x < 16; ++x) {
        tiles.setBuildingId(x, 0, 3);
        tiles.setDistrictId(x, 0, 1);
    }
    CityRegistry city;
    city.rebuildFromTiles(tiles);

    DistrictRegistry registry;
    registry.add(District::create(1, "A", TileRect{0, 0, 64, 64}));
    registry.bindBuildings(city);

    const District* d = registry.find(1);
    BOOST_REQUIRE_EQUAL(d->buildings.size(), 2u);
    BOOST_CHECK_EQUAL(d->buildings[0], 3u);
    BOOST_CHECK_EQUAL(d->buildings[1], 5u);
    BOOST_REQUIRE_EQUAL(d->footprintPrefix.size(), 2u);
    BOOST_CHECK_EQUAL(d->footprintPrefix[0], 6u);
    BOOST_CHECK_EQUAL(d->footprintPrefix[1], 10u);
}

BOOST_AUTO_TEST_CASE(TestTotalPopulation) {
    DistrictRegistry registry;
    District a = District::create(1, "A", TileRect{0, 0, 10, 10});
    a.seedPopulation(counts(100, 50));
    District b = District::create(2, "B", TileRect{10, 0, 10, 10});
    b.seedPopulation(counts(7, 0));
    registry.add(a);
    registry.add(b);
    BOOST_CHECK_EQUAL(registry.totalPopulation(), 157u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DistrictSerializerTests)

BOOST_AUTO_TEST_CASE(TestRoundTrip) {
    DistrictRegistry registry;
    District a = District::create(1, "Old Town", TileRect{0, 0, 100, 80});
    a.seedPopulation(counts(600, 400));
    a.averageNeeds = Needs{0.25f, 0.5f, 0.75f};
    a.birthRate = 1.0e-6;
    a.baseDeathRate = 2.0e-6;
    a.stockpile = 1234.5;
    a.productionPerWorker = 0.02;
    a.consumptionPerCapita = 0.01;
    registry.add(a);
    registry.add(District::create(2, "Docks", TileRect{100, 0, 50, 80}));

    DistrictRegistry loaded;
    BOOST_REQUIRE_EQUAL(loadFromBytes(saveToBytes(registry), loaded), LoadResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(loaded.size(), 2u);

    const District* d = loaded.find(1);
    BOOST_REQUIRE(d != nullptr);
    BOOST_CHECK_EQUAL(d->name, "Old Town");
    BOOST_CHECK_EQUAL(d->population, 1000u);
    BOOST_CHECK(d->categoryCounts == a.categoryCounts);
    BOOST_CHECK(d->averageNeeds == a.averageNeeds);
    BOOST_CHECK_EQUAL(d->birthRate, a.birthRate);
    BOOST_CHECK_EQUAL(d->baseDeathRate, a.baseDeathRate);
    BOOST_CHECK_EQUAL(d->deathRate, a.baseDeathRate);
    BOOST_CHECK_EQUAL(d->stockpile, a.stockpile);
    BOOST_CHECK(d->centroid == a.centroid);

    // Adjacency is derived, not stored
    BOOST_REQUIRE_EQUAL(d->neighbours.size(), 1u);
    BOOST_CHECK_EQUAL(d->neighbours[0], 2u);
}

BOOST_AUTO_TEST_CASE(TestOverlappingRecordsAreCorrupt) {
    DistrictRegistry first;
    first.add(District::create(1, "A", TileRect{0, 0, 10, 10}));
    DistrictRegistry second;
    second.add(District::create(2, "B", TileRect{5, 5, 10, 10}));

    // Splice the second record after the first and patch the count
    constexpr size_t HEADER_BYTES = 16;
    std::string bytes = saveToBytes(first);
    bytes += saveToBytes(second).substr(HEADER_BYTES);
    const uint32_t count = 2;
    std::memcpy(&bytes[12], &count, sizeof(count));

    DistrictRegistry loaded;
    loaded.add(District::create(9, "Existing", TileRect{0, 0, 1, 1}));
    BOOST_CHECK_EQUAL(loadFromBytes(bytes, loaded), LoadResult::CORRUPT_DATA);
    BOOST_REQUIRE_EQUAL(loaded.size(), 1u);
    BOOST_CHECK_EQUAL(loaded.districts()[0].id, 9u);
}

BOOST_AUTO_TEST_CASE(TestTruncatedAndTrailingAreCorrupt) {
    DistrictRegistry registry;
    registry.add(District::create(1, "A", TileRect{0, 0, 10, 10}));
    const std::string bytes = saveToBytes(registry);

    DistrictRegistry loaded;
    BOOST_CHECK_EQUAL(loadFromBytes(bytes.substr(0, bytes.size() - 3), loaded), LoadResult::CORRUPT_DATA);
    BOOST_CHECK_EQUAL(loadFromBytes(bytes + "x", loaded), LoadResult::CORRUPT_DATA);

    std::string badTag = bytes;
    badTag[2] = 'Q';
    BOOST_CHECK_EQUAL(loadFromBytes(badTag, loaded), LoadResult::CORRUPT_DATA);

    std::string badVersion = bytes;
    const uint32_t version = 7;
    std::memcpy(&badVersion[8], &version, sizeof(version));
    BOOST_CHECK_EQUAL(loadFromBytes(badVersion, loaded), LoadResult::UNSUPPORTED_VERSION);
    BOOST_CHECK_EQUAL(loaded.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(IndividualTableTests)

BOOST_AUTO_TEST_CASE(TestInsertFindRemove) {
    IndividualTable table;
    BOOST_CHECK(table.insert(makeRecord(1, TilePos{1, 1})));
    BOOST_CHECK(table.insert(makeRecord(2, TilePos{2, 2})));
    BOOST_CHECK(table.insert(makeRecord(3, TilePos{3, 3})));
    BOOST_CHECK(!table.insert(makeRecord(2, TilePos{9, 9})));
    BOOST_CHECK(!table.insert(makeRecord(INVALID_INDIVIDUAL, TilePos{0, 0})));
    BOOST_CHECK_EQUAL(table.size(), 3u);

    BOOST_CHECK(table.remove(1));
    BOOST_CHECK(!table.remove(1));
    BOOST_CHECK(!table.contains(1));

    // Swap-remove keeps every other record reachable by id
    BOOST_REQUIRE(table.find(3) != nullptr);
    BOOST_CHECK(table.find(3)->position == (TilePos{3, 3}));
    BOOST_REQUIRE(table.find(2) != nullptr);
    BOOST_CHECK(table.find(2)->position == (TilePos{2, 2}));
    BOOST_CHECK_EQUAL(table.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestZoneAndTransitionCounts) {
    IndividualTable table;
    Individual a = makeRecord(1, TilePos{0, 0});
    a.zone = Zone::Active;
    Individual b = makeRecord(2, TilePos{0, 0});
    b.zone = Zone::Statistical;
    b.transition = Transition::Buffering;
    Individual c = makeRecord(3, TilePos{0, 0});
    c.zone = Zone::Active;
    table.insert(a);
    table.insert(b);
    table.insert(c);

    BOOST_CHECK_EQUAL(table.countInZone(Zone::Active), 2u);
    BOOST_CHECK_EQUAL(table.countInZone(Zone::Nearby), 0u);
    BOOST_CHECK_EQUAL(table.countInTransition(Transition::Buffering), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
