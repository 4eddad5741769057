// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cloud_api.h"
#include "cloud_auth.h"
#include "cloud_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace aerolink {

struct CloudDiscoverySettings {
    /// Emit observations for directory entries (directory is refreshed either way)
    bool auto_discovery = true;

    /// Directory refresh interval, clamped to [MIN_POLL_INTERVAL, MAX_POLL_INTERVAL]
    std::chrono::seconds poll_interval{3600};

    /// Background thread wake-up period (auth tick granularity)
    std::chrono::seconds tick_period{30};

    static constexpr std::chrono::seconds MIN_POLL_INTERVAL{300};
    static constexpr std::chrono::seconds MAX_POLL_INTERVAL{86400};
};

/**
 * @brief Bound a configured directory refresh interval
 */
std::chrono::seconds clamp_poll_interval(std::chrono::seconds requested);

/**
 * @brief Cloud account device directory as a discovery source
 *
 * Owns the CloudAuthMachine. While a session is usable the directory is
 * listed every poll interval and each entry becomes a DeviceObservation
 * with source CloudDiscovery. When the session is rejected or cannot be
 * refreshed the machine moves to ReauthRequired; the directory keeps its last
 * contents so cloud metadata stays readable.
 *
 * Threading model:
 * - start() spawns a background thread calling poll_once() every tick period
 *   (woken early when a session becomes usable)
 * - Observation callbacks fire on that thread
 * - stop() blocks until the thread exits
 */
class CloudDiscoverySource {
  public:
    using ObservationCallback = std::function<void(const DeviceObservation&)>;
    using DirectoryCallback = std::function<void(const std::vector<DeviceCloudInfo>&)>;
    using ErrorCallback = std::function<void(const AeroError&)>;

    CloudDiscoverySource(std::shared_ptr<ICloudApi> api, CloudAuthSettings auth_settings,
                         CloudDiscoverySettings settings,
                         CloudAuthMachine::NowFn now = WallClock::now);
    ~CloudDiscoverySource();

    CloudDiscoverySource(const CloudDiscoverySource&) = delete;
    CloudDiscoverySource& operator=(const CloudDiscoverySource&) = delete;

    CloudAuthMachine& auth() {
        return auth_;
    }

    void start(ObservationCallback on_observation);
    void stop();
    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief One step: refresh the session if needed, list devices if due
     *
     * @return Error of the list call, if one was made and failed
     */
    AeroError poll_once(WallTime now);

    /**
     * @brief Make the next poll_once() list devices regardless of the interval
     */
    void request_refresh();

    std::optional<DeviceCloudInfo> cloud_info(const std::string& serial) const;
    std::vector<DeviceCloudInfo> devices() const;

    void set_observation_callback(ObservationCallback cb);

    /// Called after every successful listing (on the polling thread)
    void on_directory_updated(DirectoryCallback cb);

    /// Called when a listing fails (on the polling thread)
    void on_list_failed(ErrorCallback cb);

    /// Forwarded from the auth machine (on the thread that caused the change)
    void on_auth_state_changed(CloudAuthMachine::StateCallback cb);

    const CloudDiscoverySettings& settings() const {
        return settings_;
    }

  private:
    void poll_loop();
    void emit(const std::vector<DeviceCloudInfo>& devices);
    void handle_auth_state(AuthState old_state, AuthState new_state);
    void wake();

    std::shared_ptr<ICloudApi> api_;
    CloudDiscoverySettings settings_;
    CloudAuthMachine auth_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceCloudInfo> directory_;
    std::optional<WallTime> next_list_at_; // nullopt = list on next poll
    ObservationCallback observation_cb_;
    DirectoryCallback directory_cb_;
    ErrorCallback error_cb_;
    CloudAuthMachine::StateCallback auth_state_cb_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_requested_ = false;
};

} // namespace aerolink
