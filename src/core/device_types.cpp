// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_types.h"

#include <cstdlib>

namespace aerolink {

DeviceIdentity::DeviceIdentity(std::string serial, std::string product_type,
                               std::string credential, std::string mqtt_root_topic)
    : serial_(std::move(serial)), product_type_(product_type),
      credential_(std::move(credential)),
      mqtt_root_topic_(mqtt_root_topic.empty() ? std::move(product_type)
                                               : std::move(mqtt_root_topic)) {}

std::string DeviceAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

std::optional<DeviceAddress> parse_device_address(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    DeviceAddress addr;
    auto colon = text.rfind(':');
    // Bracketed IPv6 or a bare IPv6 literal has more than one colon
    if (colon == std::string::npos || text.find(':') != colon) {
        addr.host = text;
        return addr;
    }

    addr.host = text.substr(0, colon);
    std::string port_str = text.substr(colon + 1);
    if (addr.host.empty() || port_str.empty()) {
        return std::nullopt;
    }

    char* endptr = nullptr;
    long port = strtol(port_str.c_str(), &endptr, 10);
    if (*endptr != '\0' || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    addr.port = static_cast<uint16_t>(port);
    return addr;
}

const char* endpoint_source_name(EndpointSource source) {
    switch (source) {
    case EndpointSource::Manual:
        return "manual";
    case EndpointSource::LocalDiscovery:
        return "local";
    case EndpointSource::CloudDiscovery:
        return "cloud";
    }
    return "unknown";
}

} // namespace aerolink
