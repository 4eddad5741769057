// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cloud_api.h"
#include "cloud_discovery.h"
#include "config.h"
#include "device_connection.h"
#include "device_family.h"
#include "discovery_coordinator.h"
#include "hub_events.h"
#include "hub_settings.h"
#include "local_discovery.h"
#include "state_coordinator.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

#include "hv/EventLoopThread.h"

namespace aerolink {

/**
 * @brief Wires discovery, connections and state into one running hub
 *
 * Owns the hub event loop thread. Every registry mutation (observations,
 * manual devices, connection errors and states, cloud degradation) is
 * marshalled onto that loop, which makes the DiscoveryCoordinator's
 * single-writer rule hold. Snapshots and connection states also go straight
 * to the StateCoordinator from the worker thread.
 *
 * Shutdown order: local discovery, cloud polling, hub loop, then every device
 * connection.
 */
class DeviceHub {
  public:
    /**
     * @brief Collaborators; any left empty get the production implementation
     */
    struct Dependencies {
        ConnectionFactory connection_factory;
        std::unique_ptr<ILocalDiscovery> local_discovery;
        std::shared_ptr<ICloudApi> cloud_api;
    };

    DeviceHub(Config& config, HubSettings settings, Dependencies deps);
    ~DeviceHub();

    DeviceHub(const DeviceHub&) = delete;
    DeviceHub& operator=(const DeviceHub&) = delete;

    /**
     * @brief Start the loop, register manual devices, start discovery
     *
     * @return false if already running
     */
    bool start();
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /// Remove a device (connection stopped, state dropped)
    void remove_device(const std::string& serial);

    /// Re-entered credential for a device whose credential was rejected
    void replace_identity(IdentityPtr identity);

    /// Receives every HubEvent (from the hub loop or a worker thread)
    void set_event_callback(HubEventCallback cb);

    StateCoordinator& state() {
        return *state_;
    }
    const DiscoveryCoordinator& registry() const {
        return *discovery_;
    }

    /// nullptr when running without the cloud
    CloudDiscoverySource* cloud() {
        return cloud_.get();
    }

    const FamilyRegistry& families() const {
        return families_;
    }

    /**
     * @brief Run fn on the hub loop (dropped once the hub is stopped)
     */
    void post(std::function<void()> fn);

  private:
    void wire_cloud();
    void handle_auth_state(AuthState old_state, AuthState new_state);
    void emit(const HubEvent& event);

    Config& config_;
    HubSettings settings_;
    FamilyRegistry families_;

    std::shared_ptr<hv::EventLoopThread> loop_thread_;
    std::unique_ptr<StateCoordinator> state_;
    std::unique_ptr<DiscoveryCoordinator> discovery_;
    std::unique_ptr<ILocalDiscovery> local_;
    std::unique_ptr<CloudDiscoverySource> cloud_;

    std::mutex event_mutex_;
    HubEventCallback event_cb_;

    std::atomic<bool> running_{false};
};

} // namespace aerolink
