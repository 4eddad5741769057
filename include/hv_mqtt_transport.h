// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "mqtt_transport.h"

#include <memory>

#include "hv/EventLoop.h"

namespace hv {
class MqttClient;
}

namespace aerolink {

/**
 * @brief IMqttTransport over libhv's MQTT client
 *
 * Runs on the event loop passed at construction; every callback fires on that
 * loop's thread. Must be destroyed on that thread (or after the loop stopped).
 */
class HvMqttTransport : public IMqttTransport {
  public:
    explicit HvMqttTransport(hv::EventLoopPtr loop);
    ~HvMqttTransport() override;

    HvMqttTransport(const HvMqttTransport&) = delete;
    HvMqttTransport& operator=(const HvMqttTransport&) = delete;

    void connect(const DeviceAddress& address, const MqttCredentials& credentials,
                 uint32_t timeout_ms, ConnectCallback on_result) override;
    AeroError subscribe(const std::string& topic) override;
    AeroError publish(const std::string& topic, const std::string& payload) override;
    void disconnect() override;
    bool is_connected() const override;

    void set_message_callback(MessageCallback cb) override;
    void set_close_callback(CloseCallback cb) override;

  private:
    void release_client();

    hv::EventLoopPtr loop_;
    std::unique_ptr<hv::MqttClient> client_;
    std::string host_;

    ConnectCallback connect_cb_;
    MessageCallback message_cb_;
    CloseCallback close_cb_;
    bool connected_ = false;

    // Incremented per connect; stale client callbacks compare against it
    uint64_t generation_ = 0;
};

} // namespace aerolink
