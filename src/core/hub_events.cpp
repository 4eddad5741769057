// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hub_events.h"

namespace aerolink {

const char* hub_event_type_name(HubEventType type) {
    switch (type) {
    case HubEventType::DeviceUnavailable:
        return "DeviceUnavailable";
    case HubEventType::DeviceAvailable:
        return "DeviceAvailable";
    case HubEventType::DeviceAuthRejected:
        return "DeviceAuthRejected";
    case HubEventType::CloudReauthRequired:
        return "CloudReauthRequired";
    case HubEventType::CloudDeviceWithoutAddress:
        return "CloudDeviceWithoutAddress";
    case HubEventType::CloudRateLimited:
        return "CloudRateLimited";
    }
    return "Unknown";
}

} // namespace aerolink
