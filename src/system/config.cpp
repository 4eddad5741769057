// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace aerolink {

Config* Config::instance{nullptr};

namespace {

json get_default_connection_config() {
    return {{"connect_timeout_ms", 10000}, {"liveness_window_ms", 90000},
            {"backoff_base_ms", 1000},     {"backoff_max_ms", 60000},
            {"backoff_jitter", 0.25},      {"tick_interval_ms", 250}};
}

json get_default_cloud_config() {
    return {{"auto_discovery", true},
            {"poll_interval_sec", 3600},
            {"region", "US"},
            {"identifier", ""}};
}

json get_default_polling_config() {
    return {{"enabled", true}, {"interval_sec", 30}};
}

/// Default root-level config
json get_default_config() {
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", "info"},
            {"log_target", "auto"},
            {"log_file", "/tmp/aerolink.log"},
            {"polling", get_default_polling_config()},
            {"cloud", get_default_cloud_config()},
            {"connection", get_default_connection_config()},
            {"devices", json::array()}};
}

/// Add keys missing from section (existing values win)
/// @return true if anything was added
bool fill_section_defaults(json& data, const std::string& section, const json& defaults) {
    if (!data.contains(section) || !data[section].is_object()) {
        data[section] = defaults;
        return true;
    }
    bool modified = false;
    auto& target = data[section];
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::ifstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);

            data = get_default_config();
            config_modified = true;
        }
        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object, resetting to defaults");
            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;

        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
    }

    config_modified |= fill_section_defaults(data, "polling", get_default_polling_config());
    config_modified |= fill_section_defaults(data, "cloud", get_default_cloud_config());
    config_modified |= fill_section_defaults(data, "connection", get_default_connection_config());

    if (!data.contains("devices") || !data["devices"].is_array()) {
        data["devices"] = json::array();
        config_modified = true;
    }

    int version = data.value("config_version", 0);
    if (version != CURRENT_CONFIG_VERSION) {
        data["config_version"] = CURRENT_CONFIG_VERSION;
        config_modified = true;
    }

    // log_level intentionally not forced: absence lets the command line decide
    if (config_modified) {
        std::ofstream o(config_path);
        o << std::setw(2) << data << std::endl;
        spdlog::debug("[Config] Saved updated config to {}", config_path);
    }

    spdlog::debug("[Config] initialized: {} manual devices, cloud region {}",
                  data["devices"].size(), get<std::string>("/cloud/region", "US"));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

void Config::erase(const std::string& json_path) {
    json::json_pointer ptr(json_path);
    if (!data.contains(ptr)) {
        return;
    }
    json& parent = data[ptr.parent_pointer()];
    if (parent.is_object()) {
        parent.erase(ptr.back());
    }
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            NOTIFY_ERROR("Could not save configuration file");
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            NOTIFY_ERROR("Error writing configuration file");
            LOG_ERROR_INTERNAL("Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;
    } catch (const std::exception& e) {
        NOTIFY_ERROR("Failed to save configuration: {}", e.what());
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace aerolink
