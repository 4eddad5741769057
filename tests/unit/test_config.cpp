// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "../test_fixtures.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;

namespace {

const json SAMPLE_CONFIG = {{"log_level", "debug"},
                            {"polling", {{"enabled", true}, {"interval_sec", 45}}},
                            {"cloud", {{"region", "GB"}, {"identifier", "user@example.com"}}},
                            {"devices",
                             {{{"serial", "AB1-EU-ABC1234A"},
                               {"credential", "secret"},
                               {"product_type", "438"},
                               {"host", "192.168.1.20"}}}}};

} // namespace

// ============================================================================
// get() without default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[core][config][get]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE(config.get<std::string>("/cloud/region") == "GB");
    REQUIRE(config.get<int>("/polling/interval_sec") == 45);
    REQUIRE(config.get<bool>("/polling/enabled"));
    REQUIRE(config.get<std::string>("/devices/0/serial") == "AB1-EU-ABC1234A");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with missing key throws exception",
                 "[core][config][get]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE_THROWS_AS(config.get<std::string>("/cloud/nonexistent_key"),
                      nlohmann::detail::type_error);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with type mismatch throws exception",
                 "[config][get]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE_THROWS_AS(config.get<int>("/cloud/region"), nlohmann::detail::type_error);
}

// ============================================================================
// get() with default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default returns existing value",
                 "[core][config][default]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE(config.get<int>("/polling/interval_sec", 30) == 45);
    REQUIRE(config.get<std::string>("/cloud/region", "US") == "GB");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default for missing path",
                 "[core][config][default]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE(config.get<int>("/connection/connect_timeout_ms", 10000) == 10000);
    REQUIRE(config.get<std::string>("/log_target", "auto") == "auto");
    REQUIRE_FALSE(config.get<bool>("/nonexistent/flag", false));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default for wrong type",
                 "[config][default]") {
    set_data(SAMPLE_CONFIG);

    REQUIRE(config.get<int>("/cloud/region", 7) == 7);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default on empty data",
                 "[config][default]") {
    set_data(json::object());

    REQUIRE(config.get<std::string>("/cloud/region", "US") == "US");
}

// ============================================================================
// set(), get_json() and erase()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate paths", "[config][set]") {
    set_data(json::object());

    config.set<std::string>("/cloud/session/access_token", "tok");
    config.set<int>("/polling/interval_sec", 60);

    REQUIRE(data()["cloud"]["session"]["access_token"] == "tok");
    REQUIRE(config.get<int>("/polling/interval_sec") == 60);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_json() returns a live reference",
                 "[config][set]") {
    set_data(SAMPLE_CONFIG);

    json& devices = config.get_json("/devices");
    REQUIRE(devices.is_array());
    devices.push_back({{"serial", "S2"}, {"credential", "pw"}});

    REQUIRE(config.get<std::string>("/devices/1/serial") == "S2");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: erase() removes a key", "[config][set]") {
    set_data(SAMPLE_CONFIG);
    config.set<std::string>("/cloud/session/access_token", "tok");

    config.erase("/cloud/session");
    REQUIRE_FALSE(data()["cloud"].contains("session"));
    REQUIRE(config.get<std::string>("/cloud/region") == "GB");

    SECTION("missing key is a no-op") {
        config.erase("/cloud/session");
        config.erase("/nonexistent/path");
        REQUIRE(data()["cloud"].contains("region"));
    }
}

// ============================================================================
// init() and save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file", "[config][init]") {
    std::string path = temp_path("fresh.json");
    std::remove(path.c_str());

    config.init(path);

    REQUIRE(std::filesystem::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<int>("/config_version") == CURRENT_CONFIG_VERSION);
    REQUIRE(config.get<std::string>("/cloud/region") == "US");
    REQUIRE(config.get<int>("/polling/interval_sec") == 30);
    REQUIRE(config.get<int>("/connection/backoff_max_ms") == 60000);
    REQUIRE(config.get_json("/devices").is_array());
    std::remove(path.c_str());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() fills missing sections and keeps values",
                 "[config][init]") {
    std::string path = temp_path("partial.json");
    {
        std::ofstream out(path);
        out << R"({"cloud": {"region": "CN"}, "polling": {"interval_sec": 90}})";
    }

    config.init(path);

    REQUIRE(config.get<std::string>("/cloud/region") == "CN");
    REQUIRE(config.get<bool>("/cloud/auto_discovery"));
    REQUIRE(config.get<int>("/polling/interval_sec") == 90);
    REQUIRE(config.get<bool>("/polling/enabled"));
    REQUIRE(config.get<int>("/connection/connect_timeout_ms") == 10000);
    std::remove(path.c_str());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() replaces a corrupt file", "[config][init]") {
    std::string path = temp_path("corrupt.json");
    std::string backup = path + ".corrupt";
    std::remove(backup.c_str());
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    config.init(path);

    REQUIRE(std::filesystem::exists(backup));
    REQUIRE(config.get<std::string>("/cloud/region") == "US");
    std::remove(path.c_str());
    std::remove(backup.c_str());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() persists changes", "[config][save]") {
    std::string path = temp_path("saved.json");
    std::remove(path.c_str());
    config.init(path);

    config.set<std::string>("/cloud/identifier", "someone@example.com");
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<std::string>("/cloud/identifier") == "someone@example.com");
    std::remove(path.c_str());
}
