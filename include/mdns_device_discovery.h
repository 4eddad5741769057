// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "local_discovery.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace aerolink {

/**
 * @brief mDNS/DNS-SD listener for appliance broker advertisements
 *
 * Queries the configured service types (e.g. `_dyson_mqtt._tcp.local`), joins
 * PTR -> SRV -> A records and emits one observation per complete record on
 * every query round, so lastSeenAt keeps advancing while a device is present.
 *
 * Threading model:
 * - Queries run on a background thread
 * - Callbacks fire on that thread; receivers marshal to their own loop
 * - stop() blocks until the background thread exits
 *
 * Usage:
 * @code
 * MdnsDeviceDiscovery discovery({FAN_SERVICE_TYPE, VACUUM_SERVICE_TYPE});
 * discovery.start([](const DeviceObservation& obs) {
 *     spdlog::info("{} at {}", obs.serial, obs.address->to_string());
 * });
 * @endcode
 */
class MdnsDeviceDiscovery : public ILocalDiscovery {
  public:
    explicit MdnsDeviceDiscovery(std::vector<std::string> service_types,
                                 std::chrono::milliseconds query_interval =
                                     std::chrono::milliseconds(3000));
    ~MdnsDeviceDiscovery() override;

    // Non-copyable (owns background thread)
    MdnsDeviceDiscovery(const MdnsDeviceDiscovery&) = delete;
    MdnsDeviceDiscovery& operator=(const MdnsDeviceDiscovery&) = delete;

    void start(AdvertisementCallback on_advertisement) override;
    void stop() override;
    bool is_running() const override;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aerolink
