// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_types.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace aerolink {

/**
 * @brief Abstract local-network advertisement listener
 *
 * Advisory only: an advertisement says "this serial is reachable here now".
 * There is no "device left" event; silence means nothing.
 *
 * Allows dependency injection of mock implementations for testing.
 */
class ILocalDiscovery {
  public:
    /// Called on the discovery thread for every complete advertisement
    using AdvertisementCallback = std::function<void(const DeviceObservation&)>;

    virtual ~ILocalDiscovery() = default;

    virtual void start(AdvertisementCallback on_advertisement) = 0;

    /**
     * @brief Stop listening; blocks until no further callback can fire
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;
};

/**
 * @brief Split an advertised instance name into product type and serial
 *
 * Accepts "<product_type>_<serial>", "<serial>" and either form followed by the
 * service suffix ("438_AB1-EU-ABC1234A._dyson_mqtt._tcp.local.").
 *
 * @return {product_type, serial}; product_type may be empty, nullopt if no serial
 */
std::optional<std::pair<std::string, std::string>>
parse_instance_name(const std::string& instance_name);

} // namespace aerolink
