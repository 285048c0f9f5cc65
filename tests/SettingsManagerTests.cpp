/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/SimulationConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace LatticeEngine;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile =
        (std::filesystem::temp_directory_path() / "lattice_test_settings.json").string();

    SettingsTestFixture() {
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypes) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("simulation", "chunk_width", 128));
    BOOST_CHECK(settings.set("simulation", "time_factor", 1.5f));
    BOOST_CHECK(settings.set("host", "vsync", false));
    BOOST_CHECK(settings.set("host", "title", "Lattice"));

    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "chunk_width", 0), 128);
    BOOST_CHECK_CLOSE(settings.get<float>("simulation", "time_factor", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("host", "vsync", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("host", "title", ""), "Lattice");

    // Missing keys and mismatched types fall back to the default
    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "nonexistent", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<bool>("simulation", "chunk_width", true), true);
}

BOOST_AUTO_TEST_CASE(TestIntegerReadsAsFloat) {
    auto& settings = SettingsManager::Instance();
    settings.set("simulation", "chunk_height", 64);
    BOOST_CHECK_CLOSE(settings.get<float>("simulation", "chunk_height", 0.0f), 64.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "simulation": { "chunk_width": 512, "time_factor": 0.5 },
        "host": { "vsync": true, "title": "Demo" }
    })");

    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "chunk_width", 0), 512);
    BOOST_CHECK_CLOSE(settings.get<float>("simulation", "time_factor", 0.0f), 0.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("host", "vsync", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("host", "title", ""), "Demo");
}

BOOST_AUTO_TEST_CASE(TestFailedLoadLeavesSettingsUnchanged) {
    auto& settings = SettingsManager::Instance();
    settings.set("simulation", "chunk_width", 300);

    BOOST_CHECK(!settings.loadFromFile(testFile + ".missing"));
    BOOST_CHECK(!settings.loadFromString(R"({ "simulation": { "chunk_width": 10, })"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "chunk_width", 0), 300);
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExisting) {
    auto& settings = SettingsManager::Instance();
    settings.set("host", "target_fps", 144);
    BOOST_REQUIRE(settings.loadFromString(R"({ "host": { "window_width": 800 } })"));
    BOOST_CHECK_EQUAL(settings.get<int>("host", "target_fps", 0), 144);
    BOOST_CHECK_EQUAL(settings.get<int>("host", "window_width", 0), 800);
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();
    settings.set("simulation", "chunk_width", 200);
    settings.set("simulation", "time_factor", 0.25f);
    settings.set("host", "title", "Saved");
    BOOST_REQUIRE(settings.saveToFile(testFile));

    settings.clearAll();
    BOOST_CHECK(!settings.has("simulation", "chunk_width"));

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("simulation", "chunk_width", 0), 200);
    BOOST_CHECK_CLOSE(settings.get<float>("simulation", "time_factor", 0.0f), 0.25f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("host", "title", ""), "Saved");
}

BOOST_AUTO_TEST_CASE(TestRemoveAndCategories) {
    auto& settings = SettingsManager::Instance();
    settings.set("a", "x", 1);
    settings.set("a", "y", 2);
    settings.set("b", "z", 3);

    BOOST_CHECK_EQUAL(settings.getCategories().size(), 2u);
    BOOST_CHECK_EQUAL(settings.getKeys("a").size(), 2u);
    BOOST_CHECK(settings.getKeys("missing").empty());

    BOOST_CHECK(settings.remove("a", "x"));
    BOOST_CHECK(!settings.remove("a", "x"));
    BOOST_CHECK(settings.clearCategory("b"));
    BOOST_CHECK(!settings.has("b", "z"));
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestChangeListeners) {
    auto& settings = SettingsManager::Instance();
    int simulationChanges = 0;
    int allChanges = 0;

    const size_t simId = settings.registerChangeListener(
        "simulation", [&](const std::string&, const std::string&,
                          const SettingsManager::SettingValue&) { ++simulationChanges; });
    const size_t allId = settings.registerChangeListener(
        "", [&](const std::string&, const std::string&,
                const SettingsManager::SettingValue&) { ++allChanges; });

    settings.set("simulation", "time_factor", 2.0f);
    settings.set("host", "vsync", true);
    BOOST_CHECK_EQUAL(simulationChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 2);

    settings.unregisterChangeListener(simId);
    settings.unregisterChangeListener(allId);
    settings.set("simulation", "time_factor", 3.0f);
    BOOST_CHECK_EQUAL(simulationChanges, 1);
    BOOST_CHECK_EQUAL(allChanges, 2);
}

BOOST_AUTO_TEST_CASE(TestLoadingNotifiesListeners) {
    auto& settings = SettingsManager::Instance();
    std::vector<std::string> changedKeys;
    const size_t id = settings.registerChangeListener(
        "simulation", [&](const std::string&, const std::string& key,
                          const SettingsManager::SettingValue&) { changedKeys.push_back(key); });

    BOOST_REQUIRE(settings.loadFromString(
        R"({"simulation": {"chunk_width": 64, "time_factor": 0.5}, "host": {"vsync": true}})"));
    settings.unregisterChangeListener(id);

    BOOST_REQUIRE_EQUAL(changedKeys.size(), 2u);
    BOOST_CHECK_EQUAL(changedKeys[0], "chunk_width");
    BOOST_CHECK_EQUAL(changedKeys[1], "time_factor");
}

BOOST_AUTO_TEST_CASE(TestSimulationConfigFromSettings) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromString(R"({
        "simulation": { "chunk_width": 128, "chunk_height": -4, "time_factor": 2 },
        "host": { "target_fps": 0, "window_width": 640 }
    })"));

    const SimulationConfig config = SimulationConfig::fromSettings();
    // Non-positive chunk sizes revert both dimensions
    BOOST_CHECK_EQUAL(config.chunkWidth, 256.0f);
    BOOST_CHECK_EQUAL(config.chunkHeight, 256.0f);
    BOOST_CHECK_CLOSE(config.timeFactor, 2.0, 0.001);
    BOOST_CHECK_EQUAL(config.targetFPS, 60);
    BOOST_CHECK_EQUAL(config.windowWidth, 640);
    BOOST_CHECK_EQUAL(config.windowHeight, 720);
}

BOOST_AUTO_TEST_SUITE_END()
