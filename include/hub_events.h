// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace aerolink {

enum class HubEventType {
    DeviceUnavailable,         ///< Device connection lost or never established
    DeviceAvailable,           ///< Device connected (again)
    DeviceAuthRejected,        ///< Local credential refused; user must re-enter it
    CloudReauthRequired,       ///< Cloud session expired; user must sign in again
    CloudDeviceWithoutAddress, ///< Cloud knows the device but no local address is known
    CloudRateLimited           ///< Cloud asked us to back off
};

struct HubEvent {
    HubEventType type;
    std::string serial;  ///< Device serial (empty for account-level events)
    std::string message; ///< Human-readable message
    bool is_error;       ///< true for errors that need user action
};

using HubEventCallback = std::function<void(const HubEvent&)>;

const char* hub_event_type_name(HubEventType type);

} // namespace aerolink
