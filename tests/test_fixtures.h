// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Reusable test fixtures for AeroLink unit tests
 *
 * Available Fixtures:
 * - ConfigTestFixture: Config with direct access to its JSON data, plus a
 *   per-process scratch directory for init()/save() tests
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(ConfigTestFixture, "Test name", "[tags]") {
 *     set_data({{"cloud", {{"region", "GB"}}}});
 *     HubSettings s = load_hub_settings(config);
 * }
 * @endcode
 */

#include "config.h"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace aerolink {

/**
 * @brief Config fixture (befriended by Config)
 */
class ConfigTestFixture {
  protected:
    Config config;

    void set_data(const json& j) {
        config.data = j;
    }

    json& data() {
        return config.data;
    }

    /// Path inside a scratch directory unique to this test process
    std::string temp_path(const std::string& name) {
        auto dir = std::filesystem::temp_directory_path() /
                   ("aerolink_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir);
        return (dir / name).string();
    }
};

} // namespace aerolink

using namespace aerolink;
