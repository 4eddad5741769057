// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cloud_types.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace aerolink {

namespace {

constexpr const char* CHINA_REGION = "CN";
constexpr const char* CHINA_DIAL_PREFIX = "+86";

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

json CloudSession::to_json() const {
    auto expires =
        std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count();
    return json{{"access_token", access_token},
                {"refresh_token", refresh_token},
                {"expires_at", expires},
                {"region", region},
                {"account", account}};
}

std::optional<CloudSession> CloudSession::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    CloudSession s;
    s.access_token = j.value("access_token", "");
    if (s.access_token.empty()) {
        return std::nullopt;
    }
    s.refresh_token = j.value("refresh_token", "");
    s.expires_at = WallTime(std::chrono::seconds(j.value("expires_at", int64_t{0})));
    s.region = j.value("region", "US");
    s.account = j.value("account", "");
    return s;
}

DeviceObservation DeviceCloudInfo::to_observation(TimePoint seen_at) const {
    DeviceObservation obs;
    obs.serial = serial;
    obs.product_type = product_type;
    obs.credential = credential;
    obs.mqtt_root_topic = mqtt_root_topic;
    obs.address = address_hint;
    obs.source = EndpointSource::CloudDiscovery;
    obs.seen_at = seen_at;
    return obs;
}

std::optional<std::pair<IdentifierKind, std::string>>
normalize_identifier(const std::string& identifier, const std::string& region) {
    std::string id = trim(identifier);
    if (id.empty()) {
        return std::nullopt;
    }

    if (region == CHINA_REGION) {
        if (id.find('@') != std::string::npos) {
            spdlog::debug("[CloudAuth] Email identifiers are not accepted in region CN");
            return std::nullopt;
        }
        if (all_digits(id)) {
            id = CHINA_DIAL_PREFIX + id;
        }
        return std::make_pair(IdentifierKind::Mobile, id);
    }

    if (id.find('@') != std::string::npos) {
        return std::make_pair(IdentifierKind::Email, id);
    }
    if (id[0] == '+' && all_digits(id.substr(1))) {
        return std::make_pair(IdentifierKind::Mobile, id);
    }
    if (all_digits(id)) {
        return std::make_pair(IdentifierKind::Mobile, id);
    }
    return std::nullopt;
}

} // namespace aerolink
