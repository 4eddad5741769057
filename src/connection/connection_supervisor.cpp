// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file connection_supervisor.cpp
 * @brief Per-device connect / reconnect / liveness state machine
 *
 * @pattern Explicit state machine driven by transport callbacks and tick(now)
 * @threading Single-threaded; see ConnectionSupervisor class docs
 * @gotchas Firmware sometimes keeps a dead TCP session open without sending a
 *          close. Only the liveness window catches that, so every inbound
 *          message re-arms it, even ones that fail to decode.
 */

#include "connection_supervisor.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace aerolink {

namespace {
constexpr const char* CLIENT_ID_PREFIX = "aerolink-";
} // namespace

ConnectionSupervisor::ConnectionSupervisor(IdentityPtr identity, const FamilyDescriptor& family,
                                           std::unique_ptr<IMqttTransport> transport,
                                           SupervisorSettings settings, NowFn now,
                                           uint32_t backoff_seed)
    : identity_(std::move(identity)), family_(family), transport_(std::move(transport)),
      settings_(settings), now_(std::move(now)), backoff_(settings.backoff, backoff_seed) {
    transport_->set_message_callback(
        [this](const std::string& topic, const std::string& payload) {
            handle_message(topic, payload);
        });
    transport_->set_close_callback([this]() {
        if (state_.is(ConnectionStateKind::Connected)) {
            handle_connection_lost(
                AeroError::make(AeroErrorType::NotConnected, "Connection closed by device",
                                serial()));
        }
    });
}

ConnectionSupervisor::~ConnectionSupervisor() {
    snapshot_cb_ = nullptr;
    state_cb_ = nullptr;
    error_cb_ = nullptr;
    if (transport_) {
        transport_->set_message_callback(nullptr);
        transport_->set_close_callback(nullptr);
        transport_->disconnect();
    }
}

AeroError ConnectionSupervisor::start(const DeviceEndpoint& endpoint) {
    if (!endpoint.address) {
        spdlog::warn("[ConnectionSupervisor] {}: start without address", serial());
        return AeroError::invalid_state("No address known for " + serial());
    }

    if (running_) {
        spdlog::debug("[ConnectionSupervisor] {}: restart requested", serial());
        ++generation_;
        transport_->disconnect();
    }

    if (endpoint.identity && endpoint.identity != identity_) {
        identity_ = endpoint.identity;
    }
    address_ = endpoint.address;
    running_ = true;
    backoff_.reset();
    begin_connect();
    return {};
}

void ConnectionSupervisor::stop() {
    ++generation_;
    bool was_running = running_;
    running_ = false;
    transport_->disconnect();
    connect_deadline_ = TimePoint{};

    if (!state_.is(ConnectionStateKind::Disconnected)) {
        set_state(ConnectionState::disconnected());
    }
    if (was_running) {
        spdlog::debug("[ConnectionSupervisor] {}: stopped", serial());
    }
}

AeroError ConnectionSupervisor::send(const DeviceCommand& command) {
    if (!state_.is(ConnectionStateKind::Connected)) {
        return AeroError::not_connected(serial());
    }

    AeroError err = transport_->publish(command_topic(*identity_),
                                        encode_command(command, std::chrono::system_clock::now()));
    if (err) {
        spdlog::warn("[ConnectionSupervisor] {}: publish of {} failed: {}", serial(), command.type,
                     err.message);
        AeroError rejected = AeroError::make(AeroErrorType::Rejected, err.message, serial());
        rejected.code = err.code;
        return rejected;
    }
    spdlog::trace("[ConnectionSupervisor] {}: sent {}", serial(), command.type);
    return {};
}

void ConnectionSupervisor::update_address(const DeviceAddress& address) {
    if (address_ && *address_ == address) {
        return;
    }

    spdlog::info("[ConnectionSupervisor] {}: address {} -> {}", serial(),
                 address_ ? address_->to_string() : "unknown", address.to_string());
    address_ = address;

    if (!running_) {
        return;
    }

    // Reconnect immediately to the new address with a fresh backoff sequence
    ++generation_;
    transport_->disconnect();
    backoff_.reset();
    begin_connect();
}

void ConnectionSupervisor::fail(const AeroError& reason) {
    spdlog::warn("[ConnectionSupervisor] {}: failed permanently: {}", serial(), reason.message);
    ++generation_;
    running_ = false;
    transport_->disconnect();
    connect_deadline_ = TimePoint{};
    set_state(ConnectionState::failed(reason));
}

void ConnectionSupervisor::tick(TimePoint now) {
    if (!running_) {
        return;
    }

    switch (state_.kind) {
    case ConnectionStateKind::Connecting:
        if (now >= connect_deadline_) {
            spdlog::debug("[ConnectionSupervisor] {}: connect deadline passed", serial());
            ++generation_;
            transport_->disconnect();
            AeroError err = AeroError::connect_timeout(
                serial(), static_cast<uint32_t>(settings_.connect_timeout.count()));
            schedule_retry(err);
        }
        break;

    case ConnectionStateKind::Reconnecting:
        if (now >= state_.next_retry_at) {
            begin_connect();
        }
        break;

    case ConnectionStateKind::Connected:
        if (now - last_message_at_ > settings_.liveness_window) {
            spdlog::warn("[ConnectionSupervisor] {}: no message for {}ms, forcing reconnect",
                         serial(), settings_.liveness_window.count());
            handle_connection_lost(AeroError::stale_connection(
                serial(), static_cast<uint32_t>(settings_.liveness_window.count())));
        }
        break;

    case ConnectionStateKind::Disconnected:
    case ConnectionStateKind::Failed:
        break;
    }
}

void ConnectionSupervisor::begin_connect() {
    uint64_t generation = ++generation_;
    connect_deadline_ = now_() + settings_.connect_timeout;
    set_state(ConnectionState::connecting());

    MqttCredentials creds;
    creds.client_id = CLIENT_ID_PREFIX + serial();
    creds.username = serial();
    creds.password = identity_->credential();

    spdlog::debug("[ConnectionSupervisor] {}: connecting to {}", serial(), address_->to_string());
    transport_->connect(*address_, creds,
                        static_cast<uint32_t>(settings_.connect_timeout.count()),
                        [this, generation](const AeroError& err) {
                            handle_connect_result(err, generation);
                        });
}

void ConnectionSupervisor::handle_connect_result(const AeroError& err, uint64_t generation) {
    if (generation != generation_ || !running_ ||
        !state_.is(ConnectionStateKind::Connecting)) {
        spdlog::trace("[ConnectionSupervisor] {}: dropping stale connect result", serial());
        return;
    }

    if (!err) {
        handle_connected();
        return;
    }

    transport_->disconnect();
    if (err.type == AeroErrorType::AuthRejected) {
        spdlog::error("[ConnectionSupervisor] {}: device rejected credential", serial());
        AeroError auth = err;
        auth.context = serial();
        report_error(auth);
        // Reporting may have led to fail() or stop()
        if (!running_) {
            return;
        }
    }
    schedule_retry(err);
}

void ConnectionSupervisor::handle_connected() {
    connect_deadline_ = TimePoint{};
    last_message_at_ = now_();

    for (const auto& topic : {status_topic(*identity_), faults_topic(*identity_)}) {
        if (auto err = transport_->subscribe(topic)) {
            spdlog::warn("[ConnectionSupervisor] {}: subscribe {} failed: {}", serial(), topic,
                         err.message);
            transport_->disconnect();
            schedule_retry(err);
            return;
        }
    }

    backoff_.reset();
    spdlog::info("[ConnectionSupervisor] {}: connected to {}", serial(), address_->to_string());
    set_state(ConnectionState::connected());
    if (state_.is(ConnectionStateKind::Connected)) {
        request_initial_state();
    }
}

void ConnectionSupervisor::request_initial_state() {
    if (auto err = send(DeviceCommand::request_current_state())) {
        spdlog::debug("[ConnectionSupervisor] {}: initial state request failed: {}", serial(),
                      err.message);
    }
    if (family_.polls_environment) {
        if (auto err = send(DeviceCommand::request_environment())) {
            spdlog::debug("[ConnectionSupervisor] {}: environment request failed: {}", serial(),
                          err.message);
        }
    }
}

void ConnectionSupervisor::handle_connection_lost(const AeroError& cause) {
    ++generation_;
    transport_->disconnect();
    schedule_retry(cause);
}

void ConnectionSupervisor::handle_message(const std::string& topic, const std::string& payload) {
    if (!running_ || !state_.is(ConnectionStateKind::Connected)) {
        return;
    }
    last_message_at_ = now_();

    DecodedMessage decoded;
    AeroError err = family_.decoder(payload, decoded);
    if (err) {
        err.context = serial();
        spdlog::warn("[ConnectionSupervisor] {}: skipping message on {}: {}", serial(), topic,
                     err.message);
        report_error(err);
        return;
    }

    if (decoded.kind == MessageKind::Ignored) {
        return;
    }
    apply_decoded(decoded);
}

void ConnectionSupervisor::apply_decoded(const DecodedMessage& msg) {
    switch (msg.kind) {
    case MessageKind::FullState:
        snapshot_.product_state = msg.fields;
        break;
    case MessageKind::Incremental:
        for (const auto& [key, value] : msg.fields) {
            snapshot_.product_state[key] = value;
        }
        break;
    case MessageKind::Environmental:
        snapshot_.environmental = msg.environmental;
        break;
    case MessageKind::Faults:
        for (auto it = snapshot_.product_state.begin(); it != snapshot_.product_state.end();) {
            if (it->first.rfind("fault.", 0) == 0) {
                it = snapshot_.product_state.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& [key, value] : msg.fields) {
            snapshot_.product_state[key] = value;
        }
        break;
    case MessageKind::Ignored:
        return;
    }

    snapshot_.captured_at = now_();
    snapshot_.stale = false;
    spdlog::trace("[ConnectionSupervisor] {}: applied {} ({} fields)", serial(),
                  message_kind_name(msg.kind), msg.fields.size() + msg.environmental.size());

    if (snapshot_cb_) {
        DeviceSnapshot copy = snapshot_;
        try {
            snapshot_cb_(copy);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[ConnectionSupervisor] {}: snapshot callback threw: {}", serial(),
                               e.what());
        }
    }
}

void ConnectionSupervisor::schedule_retry(const AeroError& cause) {
    connect_deadline_ = TimePoint{};
    auto delay = backoff_.next_delay();
    TimePoint at = now_() + delay;
    spdlog::info("[ConnectionSupervisor] {}: {} - retry {} in {}ms", serial(), cause.message,
                 backoff_.attempts(), delay.count());
    set_state(ConnectionState::reconnecting(backoff_.attempts(), at, cause));
}

void ConnectionSupervisor::set_state(ConnectionState next) {
    ConnectionStateKind old_kind = state_.kind;
    state_ = std::move(next);
    if (old_kind != state_.kind) {
        spdlog::debug("[ConnectionSupervisor] {}: {} -> {}", serial(),
                      connection_state_name(old_kind), state_.to_string());
    }

    if (state_cb_) {
        ConnectionState copy = state_;
        try {
            state_cb_(copy);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[ConnectionSupervisor] {}: state callback threw: {}", serial(),
                               e.what());
        }
    }
}

void ConnectionSupervisor::report_error(const AeroError& err) {
    if (!error_cb_) {
        return;
    }
    try {
        error_cb_(err);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[ConnectionSupervisor] {}: error callback threw: {}", serial(),
                           e.what());
    }
}

} // namespace aerolink
