// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "device_types.h"

#include <functional>
#include <memory>
#include <string>

namespace aerolink {

/**
 * @brief Credentials presented to a device broker
 */
struct MqttCredentials {
    std::string client_id;
    std::string username; ///< Device serial
    std::string password; ///< Local credential
};

/**
 * @brief Abstract MQTT client connection to one device broker
 *
 * One instance is one connection handle. All callbacks are delivered on the
 * thread that drives the owning ConnectionSupervisor.
 *
 * Allows dependency injection of mock implementations for testing.
 */
class IMqttTransport {
  public:
    /// Connect outcome: no error on success, ConnectTimeout or AuthRejected otherwise
    using ConnectCallback = std::function<void(const AeroError&)>;
    using MessageCallback =
        std::function<void(const std::string& topic, const std::string& payload)>;
    /// Connection lost after a successful connect
    using CloseCallback = std::function<void()>;

    virtual ~IMqttTransport() = default;

    /**
     * @brief Start an asynchronous connect
     *
     * on_result is invoked exactly once unless disconnect() is called first.
     */
    virtual void connect(const DeviceAddress& address, const MqttCredentials& credentials,
                         uint32_t timeout_ms, ConnectCallback on_result) = 0;

    virtual AeroError subscribe(const std::string& topic) = 0;
    virtual AeroError publish(const std::string& topic, const std::string& payload) = 0;

    /**
     * @brief Abort a pending connect or close the connection
     *
     * No callback fires after this returns.
     */
    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    virtual void set_message_callback(MessageCallback cb) = 0;
    virtual void set_close_callback(CloseCallback cb) = 0;
};

using TransportFactory = std::function<std::unique_ptr<IMqttTransport>()>;

} // namespace aerolink
