// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace aerolink {

using json = nlohmann::json;

/// Written to /config_version; raise when the file layout changes
constexpr int CURRENT_CONFIG_VERSION = 1;

/**
 * @brief JSON settings file of the hub (process-wide singleton)
 *
 * Values are addressed with RFC 6901 JSON pointers:
 *
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/aerolink/aerolink.json");
 * auto interval = cfg->get<int>("/polling/interval_sec", 30);
 * cfg->set<std::string>("/cloud/region", "GB");
 * cfg->save();
 * ```
 *
 * Sections: /polling, /connection, /cloud (including the persisted
 * /cloud/session), /devices (manual entries) and the log_* keys.
 *
 * Not thread-safe. Loaded once at startup; afterwards only the hub thread
 * writes (cloud session updates).
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    static Config* get_instance();

    /**
     * @brief Load config_path, creating it with defaults when absent
     *
     * Missing sections and keys are filled in and written back. An unreadable
     * file is renamed to "<path>.corrupt" and replaced by defaults.
     */
    void init(const std::string& config_path);

    /**
     * @throws nlohmann::json::exception when the value is missing or has another type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /// Value at json_ptr, or default_value when missing or mistyped
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception&) {
            spdlog::warn("[Config] {} has the wrong type, using default", json_ptr);
            return default_value;
        }
    };

    /// In-memory only until save(); intermediate objects are created
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /// Mutable sub-document (null when the path did not exist)
    json& get_json(const std::string& json_path);

    void erase(const std::string& json_path);

    /**
     * @return false if the file could not be written; the user is alerted
     */
    bool save();

    std::string get_path();
};

} // namespace aerolink
