// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "connection_state.h"
#include "device_family.h"
#include "device_snapshot.h"
#include "hub_events.h"
#include "message_codec.h"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aerolink {

/**
 * @brief Classes of update failure reported to the feature layer
 */
enum class UpdateFailureKind {
    None,                  // Last cycle succeeded
    UpdateFailed,          // Transient: device unreachable, retried next interval
    ConfigEntryAuthFailed, // User must re-enter the credential or sign in again
    PermanentDataError     // Device sent something undecodable; cycle skipped
};

const char* update_failure_name(UpdateFailureKind kind);

/**
 * @brief Map an error to its failure class
 */
UpdateFailureKind classify_update_failure(const AeroError& error);

struct UpdateFailure {
    UpdateFailureKind kind = UpdateFailureKind::None;
    AeroError error;
};

struct StatePollingSettings {
    bool enabled = true;
    std::chrono::seconds interval{30};
};

/**
 * @brief Bridges pushed device snapshots to pull-based consumers
 *
 * Keeps the last snapshot and connection state per device, answers
 * current_snapshot() with a frozen copy whose stale flag is derived from the
 * family freshness threshold at read time, and polls devices whose firmware
 * does not push sensor data on its own.
 *
 * Thread-safe. Inputs (handle_*) may arrive from any thread, typically the
 * device worker that produced them; readers, send_command() and the
 * subscriptions likewise. Callbacks run on the thread that delivered the
 * input, after the internal lock is released.
 */
class StateCoordinator {
  public:
    using CommandSender =
        std::function<AeroError(const std::string& serial, const DeviceCommand& command)>;
    using SnapshotCallback =
        std::function<void(const std::string& serial, const DeviceSnapshot& snapshot)>;
    using StateCallback =
        std::function<void(const std::string& serial, const ConnectionState& state)>;

    StateCoordinator(CommandSender sender, StatePollingSettings settings);

    StateCoordinator(const StateCoordinator&) = delete;
    StateCoordinator& operator=(const StateCoordinator&) = delete;

    /**
     * @brief Start tracking a device with its family's polling and freshness rules
     */
    void track(const std::string& serial, const FamilyDescriptor& family);
    void untrack(const std::string& serial);

    void handle_snapshot(const std::string& serial, const DeviceSnapshot& snapshot);
    void handle_connection_state(const std::string& serial, const ConnectionState& state);
    void handle_error(const std::string& serial, const AeroError& error);

    /**
     * @brief Mark a device unavailable because the cloud session it depends on is gone
     */
    void set_degraded(const std::string& serial, bool degraded);

    /**
     * @brief Frozen copy of the last snapshot, stale flag evaluated at now
     */
    std::optional<DeviceSnapshot> current_snapshot(const std::string& serial,
                                                   TimePoint now = Clock::now()) const;

    ConnectionState connection_state(const std::string& serial) const;

    /// Connected and not degraded
    bool is_available(const std::string& serial) const;

    UpdateFailure last_failure(const std::string& serial) const;

    /**
     * @return NotConnected or Rejected on failure
     */
    AeroError send_command(const std::string& serial, const DeviceCommand& command);

    /**
     * @brief Issue due sensor polls
     */
    void tick(TimePoint now);

    void on_snapshot_changed(SnapshotCallback cb);
    void on_connection_state_changed(StateCallback cb);

    /// DeviceAvailable / DeviceUnavailable notifications
    void set_event_callback(HubEventCallback cb);

    std::vector<std::string> devices() const;

    const StatePollingSettings& settings() const {
        return settings_;
    }

  private:
    struct DeviceRecord {
        bool polls_environment = false;
        std::chrono::milliseconds freshness_threshold{std::chrono::seconds(120)};
        std::optional<DeviceSnapshot> snapshot;
        ConnectionState state;
        bool degraded = false;
        bool announced_available = false;
        UpdateFailure failure;
        std::optional<TimePoint> next_poll_at;
    };

    void record_failure(const std::string& serial, const AeroError& error);
    std::optional<HubEvent> availability_change(const std::string& serial, DeviceRecord& record);
    void emit_event(const std::optional<HubEvent>& event);

    CommandSender sender_;
    StatePollingSettings settings_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceRecord> devices_;

    std::mutex callback_mutex_;
    SnapshotCallback snapshot_cb_;
    StateCallback state_cb_;
    HubEventCallback event_cb_;
};

} // namespace aerolink
