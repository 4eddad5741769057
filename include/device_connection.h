// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "connection_state.h"
#include "device_family.h"
#include "device_snapshot.h"
#include "device_types.h"
#include "message_codec.h"

#include <functional>
#include <memory>
#include <string>

namespace aerolink {

/**
 * @brief Callbacks a device connection reports through
 *
 * Invoked on the connection's own thread; receivers must not block and must
 * not call back into the same connection's stop().
 */
struct ConnectionCallbacks {
    std::function<void(const std::string& serial, const DeviceSnapshot&)> on_snapshot;
    std::function<void(const std::string& serial, const ConnectionState&)> on_state;
    std::function<void(const std::string& serial, const AeroError&)> on_error;
};

/**
 * @brief One supervised device connection as seen by the coordinators
 *
 * Implemented by DeviceWorker (actor per device); tests substitute a fake.
 */
class IDeviceConnection {
  public:
    virtual ~IDeviceConnection() = default;

    virtual void start(const DeviceEndpoint& endpoint) = 0;

    /**
     * @brief Stop and wait until the connection is Disconnected
     */
    virtual void stop() = 0;

    /**
     * @return NotConnected or Rejected on failure
     */
    virtual AeroError send(const DeviceCommand& command) = 0;

    virtual void update_address(const DeviceAddress& address) = 0;
    virtual void fail(const AeroError& reason) = 0;

    virtual ConnectionState state() const = 0;
    virtual const std::string& serial() const = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<IDeviceConnection>(
    IdentityPtr identity, const FamilyDescriptor& family, ConnectionCallbacks callbacks)>;

} // namespace aerolink
