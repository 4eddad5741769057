// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "connection_state.h"
#include "device_family.h"
#include "device_snapshot.h"
#include "device_types.h"
#include "message_codec.h"
#include "mqtt_transport.h"
#include "reconnect_backoff.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace aerolink {

/**
 * @brief Timeouts and backoff for one supervised connection
 */
struct SupervisorSettings {
    std::chrono::milliseconds connect_timeout{10000};

    /// Maximum silence on an open connection before it is declared stale
    std::chrono::milliseconds liveness_window{90000};

    BackoffPolicy backoff;
};

/**
 * @brief Connection lifecycle of one device
 *
 * Owns the transport handle, the ConnectionState and the device's live
 * snapshot. Connect failures and stale connections are retried forever with
 * exponential backoff; only fail() or stop() end the loop.
 *
 * State transitions:
 * @code
 * Disconnected --start--> Connecting --ok--> Connected
 *                              |                 |  (close / liveness expiry)
 *                              +--error--> Reconnecting <--+
 *                                              |
 *                                   (retry time) --> Connecting
 * any --fail(reason)--> Failed      any --stop()--> Disconnected
 * @endcode
 *
 * Threading: single-threaded. Every method and every transport callback must
 * run on the same thread (DeviceWorker's event loop in production, the test
 * thread in unit tests). Time comes from tick(now) and from the injected
 * clock for transport events, so tests drive it with synthetic time points.
 */
class ConnectionSupervisor {
  public:
    using SnapshotCallback = std::function<void(const DeviceSnapshot&)>;
    using StateCallback = std::function<void(const ConnectionState&)>;
    using ErrorCallback = std::function<void(const AeroError&)>;
    using NowFn = std::function<TimePoint()>;

    ConnectionSupervisor(IdentityPtr identity, const FamilyDescriptor& family,
                         std::unique_ptr<IMqttTransport> transport, SupervisorSettings settings,
                         NowFn now = Clock::now, uint32_t backoff_seed = std::random_device{}());
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Begin connecting to the endpoint's address
     *
     * @return InvalidState if the endpoint has no address; no error otherwise
     *         (a running supervisor is restarted)
     */
    AeroError start(const DeviceEndpoint& endpoint);

    /**
     * @brief Abort any pending connect, close the connection, cancel all
     * deadlines
     *
     * State is Disconnected when this returns. Safe to call repeatedly.
     */
    void stop();

    /**
     * @brief Publish a command to the device
     *
     * @return NotConnected unless Connected (the transport is not touched),
     *         Rejected if the transport refused the publish
     */
    AeroError send(const DeviceCommand& command);

    /**
     * @brief Point the supervisor at a new address
     *
     * No-op when the address is unchanged, so a Connected supervisor is
     * undisturbed by repeated advertisements.
     */
    void update_address(const DeviceAddress& address);

    /**
     * @brief Terminal failure on explicit request (e.g. credential refused)
     */
    void fail(const AeroError& reason);

    /**
     * @brief Enforce the connect deadline, the retry time and the liveness window
     */
    void tick(TimePoint now);

    void on_snapshot(SnapshotCallback cb) {
        snapshot_cb_ = std::move(cb);
    }
    void on_state_change(StateCallback cb) {
        state_cb_ = std::move(cb);
    }
    void on_error(ErrorCallback cb) {
        error_cb_ = std::move(cb);
    }

    const ConnectionState& state() const {
        return state_;
    }

    DeviceSnapshot snapshot() const {
        return snapshot_;
    }

    const std::string& serial() const {
        return identity_->serial();
    }

    const std::optional<DeviceAddress>& address() const {
        return address_;
    }

    /// True between start() and stop()/fail()
    bool is_running() const {
        return running_;
    }

  private:
    void begin_connect();
    void handle_connect_result(const AeroError& err, uint64_t generation);
    void handle_connected();
    void handle_connection_lost(const AeroError& cause);
    void handle_message(const std::string& topic, const std::string& payload);
    void schedule_retry(const AeroError& cause);
    void set_state(ConnectionState next);
    void report_error(const AeroError& err);
    void apply_decoded(const DecodedMessage& msg);
    void request_initial_state();

    IdentityPtr identity_;
    FamilyDescriptor family_;
    std::unique_ptr<IMqttTransport> transport_;
    SupervisorSettings settings_;
    NowFn now_;
    ReconnectBackoff backoff_;

    ConnectionState state_;
    DeviceSnapshot snapshot_;
    std::optional<DeviceAddress> address_;

    bool running_ = false;
    TimePoint connect_deadline_{};
    TimePoint last_message_at_{};

    // Incremented on every connect attempt and on stop(); stale transport
    // callbacks carry an older value and are dropped
    uint64_t generation_ = 0;

    SnapshotCallback snapshot_cb_;
    StateCallback state_cb_;
    ErrorCallback error_cb_;
};

} // namespace aerolink
