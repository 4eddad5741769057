// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace aerolink {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Local MQTT broker port on the appliances
constexpr uint16_t DEFAULT_MQTT_PORT = 1883;

/**
 * @brief Immutable identity of one physical device
 *
 * A changed credential produces a new DeviceIdentity that replaces the old one;
 * instances are shared as shared_ptr<const DeviceIdentity>.
 */
class DeviceIdentity {
  public:
    DeviceIdentity(std::string serial, std::string product_type, std::string credential,
                   std::string mqtt_root_topic = "");

    const std::string& serial() const {
        return serial_;
    }
    const std::string& product_type() const {
        return product_type_;
    }
    const std::string& credential() const {
        return credential_;
    }

    /**
     * @brief First topic level used on the device broker
     *
     * Usually the product type; the cloud directory may report a regional
     * variant (e.g. "438K") that the firmware uses instead.
     */
    const std::string& mqtt_root_topic() const {
        return mqtt_root_topic_;
    }

    bool has_credential() const {
        return !credential_.empty();
    }

    bool operator==(const DeviceIdentity& other) const {
        return serial_ == other.serial_ && product_type_ == other.product_type_ &&
               credential_ == other.credential_ && mqtt_root_topic_ == other.mqtt_root_topic_;
    }
    bool operator!=(const DeviceIdentity& other) const {
        return !(*this == other);
    }

  private:
    const std::string serial_;
    const std::string product_type_;
    const std::string credential_;
    const std::string mqtt_root_topic_;
};

using IdentityPtr = std::shared_ptr<const DeviceIdentity>;

/**
 * @brief Network address of a device broker
 */
struct DeviceAddress {
    std::string host;
    uint16_t port = DEFAULT_MQTT_PORT;

    std::string to_string() const;

    bool operator==(const DeviceAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const DeviceAddress& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Parse "host" or "host:port"
 * @return nullopt for empty input or an invalid port
 */
std::optional<DeviceAddress> parse_device_address(const std::string& text);

enum class EndpointSource { Manual, LocalDiscovery, CloudDiscovery };

const char* endpoint_source_name(EndpointSource source);

/**
 * @brief Reachability record for one device (one per serial in the registry)
 */
struct DeviceEndpoint {
    IdentityPtr identity;
    std::optional<DeviceAddress> address; ///< nullopt = unknown, awaiting discovery
    EndpointSource source = EndpointSource::Manual;
    TimePoint last_seen_at{};

    /// Manual host override, tried first; discovery replaces it only while unreachable
    bool static_address = false;

    /// Broker address reported by the cloud directory, tried when nothing local is known
    std::optional<DeviceAddress> cloud_address_hint;

    /// Cloud knows the device but no local address has been resolved yet
    bool cloud_only_unresolved = false;

    const std::string& serial() const {
        return identity->serial();
    }
};

/**
 * @brief One "device observed" event from a discovery source
 *
 * Local advertisements carry an address; cloud entries carry identity data and
 * at most an address hint.
 */
struct DeviceObservation {
    std::string serial;
    std::string product_type;            ///< May be empty for local advertisements
    std::string credential;              ///< Empty unless the cloud supplied it
    std::string mqtt_root_topic;         ///< Empty = use product type
    std::optional<DeviceAddress> address;
    EndpointSource source = EndpointSource::LocalDiscovery;
    TimePoint seen_at{};
};

} // namespace aerolink
