/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsStoreTests
#include <boost/test/unit_test.hpp>
#include "config/SettingsStore.hpp"
#include "config/SimulationConfig.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace CityScale;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";
    SettingsStore settings;

    SettingsTestFixture() {
        std::filesystem::create_directories("tests/test_data");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsStoreTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypedValues) {
    BOOST_CHECK(settings.set("hydration", "batch_size", 250));
    BOOST_CHECK(settings.set("zones", "active_radius", 120.5f));
    BOOST_CHECK(settings.set("debug", "enabled", true));
    BOOST_CHECK(settings.set("world", "tile_file", "res/city.tiles"));

    BOOST_CHECK_EQUAL(settings.get<int>("hydration", "batch_size", 0), 250);
    BOOST_CHECK_CLOSE(settings.get<float>("zones", "active_radius", 0.0f), 120.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("debug", "enabled", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("world", "tile_file", ""), "res/city.tiles");

    // Missing keys and mismatched types fall back to the default
    BOOST_CHECK_EQUAL(settings.get<int>("hydration", "nonexistent", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<int>("debug", "enabled", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestIntegersWidenToFloat) {
    settings.set("zones", "nearby_radius", 500);
    BOOST_CHECK_EQUAL(settings.get<float>("zones", "nearby_radius", 0.0f), 500.0f);
}

BOOST_AUTO_TEST_CASE(TestRemoveAndEnumerate) {
    settings.set("zones", "active_radius", 150);
    settings.set("zones", "nearby_radius", 500);
    settings.set("tick", "rate_hz", 100);

    const auto categories = settings.getCategories();
    BOOST_REQUIRE_EQUAL(categories.size(), 2u);
    BOOST_CHECK_EQUAL(categories[0], "tick");
    BOOST_CHECK_EQUAL(categories[1], "zones");
    BOOST_CHECK_EQUAL(settings.getKeys("zones").size(), 2u);

    BOOST_CHECK(settings.remove("tick", "rate_hz"));
    BOOST_CHECK(!settings.remove("tick", "rate_hz"));
    BOOST_CHECK(!settings.has("tick", "rate_hz"));
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFileMerges) {
    createTestFile(R"({
        "zones": { "active_radius": 150, "nearby_radius": 500.5 },
        "hydration": { "batch_size": 64, "tags": [1, 2] },
        "ignored": 5
    })");

    settings.set("tick", "rate_hz", 30);
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("zones", "active_radius", 0), 150);
    BOOST_CHECK_CLOSE(settings.get<float>("zones", "nearby_radius", 0.0f), 500.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<int>("hydration", "batch_size", 0), 64);
    BOOST_CHECK(!settings.has("hydration", "tags"));
    BOOST_CHECK(!settings.has("ignored", "ignored"));
    BOOST_CHECK_EQUAL(settings.get<int>("tick", "rate_hz", 0), 30);
}

BOOST_AUTO_TEST_CASE(TestLoadFailures) {
    BOOST_CHECK(!settings.loadFromFile("tests/test_data/nonexistent.json"));

    createTestFile("{ \"zones\": { \"active_radius\": }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    settings.set("zones", "active_radius", 150);
    settings.set("hydration", "need_noise", 0.25f);
    settings.set("debug", "enabled", false);
    settings.set("rng", "seed", "1592639870");
    BOOST_REQUIRE(settings.saveToFile(testFile));

    SettingsStore reloaded;
    BOOST_REQUIRE(reloaded.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(reloaded.get<int>("zones", "active_radius", 0), 150);
    BOOST_CHECK_CLOSE(reloaded.get<float>("hydration", "need_noise", 0.0f), 0.25f, 0.001f);
    BOOST_CHECK_EQUAL(reloaded.get<bool>("debug", "enabled", true), false);
    BOOST_CHECK_EQUAL(reloaded.get<std::string>("rng", "seed", ""), "1592639870");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SimulationConfigTestSuite)

BOOST_AUTO_TEST_CASE(TestDefaultsSurviveEmptySettings) {
    SettingsStore settings;
    const SimulationConfig config = SimulationConfig::fromSettings(settings);
    const SimulationConfig defaults;
    BOOST_CHECK_EQUAL(config.zones.activeRadius, defaults.zones.activeRadius);
    BOOST_CHECK_EQUAL(config.hydration.batchSize, defaults.hydration.batchSize);
    BOOST_CHECK_EQUAL(config.aggregate.defaultBirthRate, defaults.aggregate.defaultBirthRate);
    BOOST_CHECK_EQUAL(config.seed, defaults.seed);
}

BOOST_AUTO_TEST_CASE(TestShippedSettingsFile) {
    SettingsStore settings;
    BOOST_REQUIRE(settings.loadFromFile("res/cityscale.json"));
    const SimulationConfig config = SimulationConfig::fromSettings(settings);

    BOOST_CHECK_EQUAL(config.zones.activeRadius, 150.0f);
    BOOST_CHECK_EQUAL(config.zones.nearbyRadius, 500.0f);
    BOOST_CHECK_EQUAL(config.hydration.bufferTicks, 200);
    BOOST_CHECK_EQUAL(config.hydration.maxIndividuals, 54000);
    BOOST_CHECK_CLOSE(config.aggregate.defaultBirthRate, 2.0e-7, 1e-9);
    BOOST_CHECK_CLOSE(config.aggregate.defaultDeathRate, 1.5e-7, 1e-9);
    BOOST_CHECK_CLOSE(config.aggregate.hungerDeathScale, 4.0, 1e-9);
    BOOST_CHECK_CLOSE(config.needs.hungerPerTick, 0.0001f, 0.001f);
    BOOST_CHECK_EQUAL(config.seed, 0x5EEDC17Eull);
}

BOOST_AUTO_TEST_CASE(TestConfigRoundTripsThroughSettings) {
    SimulationConfig config;
    config.zones.activeRadius = 80.0f;
    config.zones.nearbyRadius = 320.0f;
    config.aggregate.defaultBirthRate = 3.25e-8;
    config.hydration.batchSize = 17;
    config.pathfinding.entranceSplitLength = 9;
    config.seed = 18446744073709551557ull;

    SettingsStore settings;
    config.toSettings(settings);
    const SimulationConfig restored = SimulationConfig::fromSettings(settings);

    BOOST_CHECK_EQUAL(restored.zones.activeRadius, 80.0f);
    BOOST_CHECK_EQUAL(restored.zones.nearbyRadius, 320.0f);
    BOOST_CHECK_EQUAL(restored.aggregate.defaultBirthRate, 3.25e-8);
    BOOST_CHECK_EQUAL(restored.hydration.batchSize, 17);
    BOOST_CHECK_EQUAL(restored.pathfinding.entranceSplitLength, 9);
    BOOST_CHECK_EQUAL(restored.seed, 18446744073709551557ull);
}

BOOST_AUTO_TEST_CASE(TestValidationRejectsBadValues) {
    SimulationConfig config;
    BOOST_CHECK_NO_THROW(config.validate());

    SimulationConfig inverted;
    inverted.zones.activeRadius = 600.0f;
    BOOST_CHECK_THROW(inverted.validate(), std::invalid_argument);

    SimulationConfig noBatch;
    noBatch.hydration.batchSize = 0;
    BOOST_CHECK_THROW(noBatch.validate(), std::invalid_argument);

    SimulationConfig wildFlow;
    wildFlow.aggregate.flowCoefficient = 0.9;
    BOOST_CHECK_THROW(wildFlow.validate(), std::invalid_argument);

    SettingsStore settings;
    settings.set("zones", "nearby_radius", 10);
    BOOST_CHECK_THROW(SimulationConfig::fromSettings(settings), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
