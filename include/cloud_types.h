// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "hv/json.hpp"

namespace aerolink {

using json = nlohmann::json;
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

/**
 * @brief Authenticated cloud account session
 *
 * Created by CloudAuthMachine on OTP verification, refreshed in place,
 * destroyed on logout or when reauthentication is required.
 */
struct CloudSession {
    std::string access_token;
    std::string refresh_token;
    WallTime expires_at{};
    std::string region = "US";
    std::string account; ///< Account id reported by the service

    bool valid() const {
        return !access_token.empty();
    }

    bool expired_at(WallTime now) const {
        return now >= expires_at;
    }

    json to_json() const;

    /**
     * @return nullopt if the object lacks an access token
     */
    static std::optional<CloudSession> from_json(const json& j);
};

/**
 * @brief One device entry from the cloud device directory
 */
struct DeviceCloudInfo {
    std::string serial;
    std::string name;
    std::string product_type;
    std::string variant;          ///< Regional variant letter, may be empty
    std::string credential;       ///< Local MQTT credential as delivered
    std::string mqtt_root_topic;  ///< Empty = product type
    std::optional<DeviceAddress> address_hint;
    std::string firmware_version;

    /**
     * @brief Observation for the discovery coordinator
     */
    DeviceObservation to_observation(TimePoint seen_at) const;
};

enum class IdentifierKind { Email, Mobile };

/**
 * @brief Pending OTP challenge issued for one identifier
 */
struct OtpChallenge {
    std::string identifier; ///< Normalised email or phone number
    IdentifierKind kind = IdentifierKind::Email;
    std::string region = "US";
    std::string challenge_id;

    bool requires_password() const {
        return kind == IdentifierKind::Email;
    }
};

/**
 * @brief Classify and normalise a user-entered identifier
 *
 * Region "CN" always uses the mobile flow and prefixes "+86" to bare numbers.
 * Elsewhere anything with '@' is an email, a leading '+' or all digits a phone
 * number.
 *
 * @return nullopt for empty or unrecognisable input
 */
std::optional<std::pair<IdentifierKind, std::string>>
normalize_identifier(const std::string& identifier, const std::string& region);

} // namespace aerolink
