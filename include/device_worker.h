// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_supervisor.h"
#include "device_connection.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include "hv/EventLoopThread.h"

namespace aerolink {

/**
 * @brief Actor that runs one ConnectionSupervisor on its own event loop thread
 *
 * Devices never block each other: each worker owns a libhv EventLoopThread,
 * its MQTT client and a periodic tick timer. Public methods may be called from
 * any thread; they post to the worker loop. send() answers NotConnected
 * synchronously from an atomic mirror of the state, without touching the
 * network, and otherwise waits for the loop to publish.
 *
 * stop() blocks until the supervisor has reached Disconnected on the worker
 * thread. It must not be called from inside one of this worker's callbacks.
 */
class DeviceWorker : public IDeviceConnection {
  public:
    DeviceWorker(IdentityPtr identity, const FamilyDescriptor& family,
                 SupervisorSettings settings, ConnectionCallbacks callbacks,
                 std::chrono::milliseconds tick_interval);
    ~DeviceWorker() override;

    DeviceWorker(const DeviceWorker&) = delete;
    DeviceWorker& operator=(const DeviceWorker&) = delete;

    void start(const DeviceEndpoint& endpoint) override;
    void stop() override;
    AeroError send(const DeviceCommand& command) override;
    void update_address(const DeviceAddress& address) override;
    void fail(const AeroError& reason) override;

    ConnectionState state() const override;
    const std::string& serial() const override {
        return serial_;
    }

    /**
     * @brief Factory producing DeviceWorkers with shared settings
     */
    static ConnectionFactory factory(SupervisorSettings settings,
                                     std::chrono::milliseconds tick_interval);

  private:
    bool loop_running() const;
    void shutdown_loop();

    const std::string serial_;
    std::shared_ptr<hv::EventLoopThread> loop_thread_;
    std::unique_ptr<ConnectionSupervisor> supervisor_; // Touched only on loop thread
    ConnectionCallbacks callbacks_;

    std::atomic<bool> connected_{false};
    mutable std::mutex state_mutex_;
    ConnectionState state_mirror_;
};

} // namespace aerolink
