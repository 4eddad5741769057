// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hub_settings.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace aerolink {

namespace {

template <typename T>
T read_clamped(Config& config, const std::string& ptr, T def, T lo, T hi) {
    T value = config.get<T>(ptr, def);
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        spdlog::warn("[HubSettings] {} = {} out of range [{}, {}], using {}", ptr, value, lo, hi,
                     clamped);
    }
    return clamped;
}

} // namespace

std::optional<ManualDeviceConfig> parse_manual_device(const json& entry) {
    if (!entry.is_object()) {
        spdlog::warn("[HubSettings] Ignoring device entry that is not an object");
        return std::nullopt;
    }

    std::string serial = entry.value("serial", "");
    std::string credential = entry.value("credential", "");
    if (serial.empty() || credential.empty()) {
        spdlog::warn("[HubSettings] Ignoring device entry without serial or credential");
        return std::nullopt;
    }

    ManualDeviceConfig device;
    device.name = entry.value("name", serial);
    device.identity = std::make_shared<const DeviceIdentity>(
        serial, entry.value("product_type", ""), credential, entry.value("mqtt_root_topic", ""));

    std::string host = entry.value("host", "");
    if (!host.empty()) {
        auto address = parse_device_address(host);
        if (!address) {
            spdlog::warn("[HubSettings] Device {}: host '{}' is not usable", serial, host);
            return std::nullopt;
        }
        if (entry.contains("port")) {
            int port = entry.value("port", 0);
            if (port < 1 || port > 65535) {
                spdlog::warn("[HubSettings] Device {}: port {} is invalid", serial, port);
                return std::nullopt;
            }
            address->port = static_cast<uint16_t>(port);
        }
        device.static_address = address;
    }
    return device;
}

HubSettings load_hub_settings(Config& config) {
    HubSettings s;

    try {
        s.polling.enabled = config.get<bool>("/polling/enabled", true);
        s.polling.interval = std::chrono::seconds(
            read_clamped<int>(config, "/polling/interval_sec", 30,
                              static_cast<int>(MIN_POLLING_INTERVAL.count()), 86400));

        s.connection.connect_timeout = std::chrono::milliseconds(
            read_clamped<int>(config, "/connection/connect_timeout_ms", 10000, 1000, 120000));
        s.connection.liveness_window = std::chrono::milliseconds(
            read_clamped<int>(config, "/connection/liveness_window_ms", 90000, 5000, 3600000));
        s.connection.backoff.base = std::chrono::milliseconds(
            read_clamped<int>(config, "/connection/backoff_base_ms", 1000, 100, 600000));
        s.connection.backoff.cap = std::chrono::milliseconds(read_clamped<int>(
            config, "/connection/backoff_max_ms", 60000,
            static_cast<int>(s.connection.backoff.base.count()), 3600000));
        s.connection.backoff.jitter =
            read_clamped<double>(config, "/connection/backoff_jitter", 0.25, 0.0, 1.0);
        s.tick_interval = std::chrono::milliseconds(
            read_clamped<int>(config, "/connection/tick_interval_ms", 250, 50, 5000));

        s.cloud.auto_discovery = config.get<bool>("/cloud/auto_discovery", true);
        s.cloud.poll_interval = std::chrono::seconds(read_clamped<int>(
            config, "/cloud/poll_interval_sec", 3600,
            static_cast<int>(CloudDiscoverySettings::MIN_POLL_INTERVAL.count()),
            static_cast<int>(CloudDiscoverySettings::MAX_POLL_INTERVAL.count())));
        s.cloud_auth.region = config.get<std::string>("/cloud/region", "US");
        s.cloud_identifier = config.get<std::string>("/cloud/identifier", "");

        const json& session_json = config.get_json("/cloud");
        if (session_json.is_object() && session_json.contains("session")) {
            s.cloud_session = CloudSession::from_json(session_json["session"]);
            if (!s.cloud_session) {
                spdlog::warn("[HubSettings] Stored cloud session is unusable; sign in again");
            }
        }

        const json& devices = config.get_json("/devices");
        if (devices.is_array()) {
            for (const auto& entry : devices) {
                if (auto device = parse_manual_device(entry)) {
                    s.devices.push_back(std::move(*device));
                }
            }
        }
    } catch (const json::exception& e) {
        spdlog::error("[HubSettings] Configuration error: {}; using defaults for the rest",
                      e.what());
    }

    spdlog::debug("[HubSettings] polling={} ({}s), cloud region={} interval={}s, {} manual "
                  "devices",
                  s.polling.enabled, s.polling.interval.count(), s.cloud_auth.region,
                  s.cloud.poll_interval.count(), s.devices.size());
    return s;
}

bool save_cloud_session(Config& config, const std::optional<CloudSession>& session) {
    if (session) {
        config.get_json("/cloud/session") = session->to_json();
    } else {
        config.erase("/cloud/session");
    }
    return config.save();
}

} // namespace aerolink
