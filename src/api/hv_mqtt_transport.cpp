// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file hv_mqtt_transport.cpp
 * @brief libhv MQTT client adapter for device brokers
 *
 * @pattern Adapter; libhv callbacks are translated into IMqttTransport callbacks
 * @threading Everything runs on the owning event loop thread
 * @gotchas libhv reports a refused CONNACK as a close before onConnect; the
 *          refusal code is only available through lastError(). Clients are
 *          destroyed via queueInLoop so a callback in flight never touches a
 *          freed client.
 */

#include "hv_mqtt_transport.h"

#include <spdlog/spdlog.h>

#include "hv/mqtt_client.h"

namespace aerolink {

namespace {

// MQTT 3.1.1 CONNACK return codes that mean the credential was refused
constexpr int CONNACK_BAD_USERNAME_OR_PASSWORD = 4;
constexpr int CONNACK_NOT_AUTHORIZED = 5;

// Device brokers drop idle sessions; ping well inside their keepalive
constexpr int PING_INTERVAL_SEC = 30;

} // namespace

HvMqttTransport::HvMqttTransport(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

HvMqttTransport::~HvMqttTransport() {
    connect_cb_ = nullptr;
    message_cb_ = nullptr;
    close_cb_ = nullptr;
    release_client();
}

void HvMqttTransport::connect(const DeviceAddress& address, const MqttCredentials& credentials,
                              uint32_t timeout_ms, ConnectCallback on_result) {
    release_client();

    host_ = address.to_string();
    connect_cb_ = std::move(on_result);
    connected_ = false;
    uint64_t generation = ++generation_;

    client_ = std::make_unique<hv::MqttClient>(loop_->loop());
    client_->setID(credentials.client_id.c_str());
    client_->setAuth(credentials.username.c_str(), credentials.password.c_str());
    client_->setConnectTimeout(static_cast<int>(timeout_ms));
    client_->setPingInterval(PING_INTERVAL_SEC);

    client_->onConnect = [this, generation](hv::MqttClient*) {
        if (generation != generation_) {
            return;
        }
        connected_ = true;
        spdlog::debug("[HvMqttTransport] Connected to {}", host_);
        auto cb = std::move(connect_cb_);
        connect_cb_ = nullptr;
        if (cb) {
            cb(AeroError{});
        }
    };

    client_->onClose = [this, generation](hv::MqttClient* cli) {
        if (generation != generation_) {
            return;
        }
        if (!connected_) {
            // Never reached CONNACK success: this is the connect result
            int rc = cli->lastError();
            AeroError err;
            if (rc == CONNACK_BAD_USERNAME_OR_PASSWORD || rc == CONNACK_NOT_AUTHORIZED) {
                err = AeroError::make(AeroErrorType::AuthRejected,
                                      "Broker refused credentials (CONNACK " +
                                          std::to_string(rc) + ")",
                                      host_);
            } else {
                err = AeroError::make(AeroErrorType::ConnectTimeout,
                                      "Connection to " + host_ + " failed", host_);
            }
            err.code = rc;
            spdlog::debug("[HvMqttTransport] Connect to {} failed: {} (rc={})", host_,
                          err.message, rc);
            auto cb = std::move(connect_cb_);
            connect_cb_ = nullptr;
            if (cb) {
                cb(err);
            }
            return;
        }

        connected_ = false;
        spdlog::debug("[HvMqttTransport] Connection to {} closed", host_);
        if (close_cb_) {
            close_cb_();
        }
    };

    client_->onMessage = [this, generation](hv::MqttClient*, mqtt_message_t* msg) {
        if (generation != generation_ || !msg || !message_cb_) {
            return;
        }
        std::string topic(msg->topic, msg->topic_len);
        std::string payload(msg->payload, msg->payload_len);
        message_cb_(topic, payload);
    };

    int rc = client_->connect(address.host.c_str(), address.port);
    if (rc < 0) {
        spdlog::warn("[HvMqttTransport] connect() to {} returned {}", host_, rc);
        auto cb = std::move(connect_cb_);
        connect_cb_ = nullptr;
        release_client();
        if (cb) {
            AeroError err = AeroError::make(AeroErrorType::ConnectTimeout,
                                            "Could not start connection to " + host_, host_);
            err.code = rc;
            cb(err);
        }
    }
}

AeroError HvMqttTransport::subscribe(const std::string& topic) {
    if (!client_ || !connected_) {
        return AeroError::not_connected(host_);
    }
    int rc = client_->subscribe(topic.c_str());
    if (rc < 0) {
        AeroError err = AeroError::make(AeroErrorType::Rejected, "Subscribe failed: " + topic,
                                        host_);
        err.code = rc;
        return err;
    }
    return {};
}

AeroError HvMqttTransport::publish(const std::string& topic, const std::string& payload) {
    if (!client_ || !connected_) {
        return AeroError::not_connected(host_);
    }
    int rc = client_->publish(topic, payload);
    if (rc < 0) {
        AeroError err = AeroError::make(AeroErrorType::Rejected, "Publish failed: " + topic,
                                        host_);
        err.code = rc;
        return err;
    }
    return {};
}

void HvMqttTransport::disconnect() {
    connect_cb_ = nullptr;
    connected_ = false;
    release_client();
}

bool HvMqttTransport::is_connected() const {
    return connected_;
}

void HvMqttTransport::set_message_callback(MessageCallback cb) {
    message_cb_ = std::move(cb);
}

void HvMqttTransport::set_close_callback(CloseCallback cb) {
    close_cb_ = std::move(cb);
}

void HvMqttTransport::release_client() {
    ++generation_;
    if (!client_) {
        return;
    }

    client_->onConnect = nullptr;
    client_->onClose = nullptr;
    client_->onMessage = nullptr;
    client_->disconnect();

    std::shared_ptr<hv::MqttClient> dying(client_.release());
    if (loop_) {
        loop_->queueInLoop([dying]() { (void)dying; });
    }
}

} // namespace aerolink
