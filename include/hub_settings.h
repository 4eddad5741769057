// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cloud_auth.h"
#include "cloud_discovery.h"
#include "cloud_types.h"
#include "config.h"
#include "connection_supervisor.h"
#include "device_types.h"
#include "state_coordinator.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace aerolink {

/**
 * @brief One user-entered device from /devices
 */
struct ManualDeviceConfig {
    IdentityPtr identity;
    std::optional<DeviceAddress> static_address;
    std::string name;
};

/**
 * @brief Validated configuration surface of the hub
 */
struct HubSettings {
    StatePollingSettings polling;
    SupervisorSettings connection;
    std::chrono::milliseconds tick_interval{250};

    bool cloud_enabled = true;
    CloudDiscoverySettings cloud;
    CloudAuthSettings cloud_auth;
    std::string cloud_identifier;
    std::optional<CloudSession> cloud_session;

    std::vector<ManualDeviceConfig> devices;
};

/// Polling interval lower bound
constexpr std::chrono::seconds MIN_POLLING_INTERVAL{5};

/**
 * @brief Read and validate hub settings
 *
 * Out-of-range values are clamped with a warning; invalid device entries are
 * skipped with a warning. Never throws.
 */
HubSettings load_hub_settings(Config& config);

/**
 * @brief Parse one /devices entry
 *
 * @return nullopt (and a warning) when serial or credential is missing or the
 *         host is unusable
 */
std::optional<ManualDeviceConfig> parse_manual_device(const json& entry);

/**
 * @brief Persist the cloud session under /cloud/session (nullopt removes it)
 */
bool save_cloud_session(Config& config, const std::optional<CloudSession>& session);

} // namespace aerolink
