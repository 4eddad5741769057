// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file device_worker.cpp
 * @brief Actor-per-device wrapper around ConnectionSupervisor
 *
 * @pattern One hv::EventLoopThread per device; commands posted with runInLoop()
 * @threading Supervisor and MQTT client live on the worker loop only
 * @gotchas Blocking calls (stop, send) wait on a future with a timeout so a
 *          wedged loop cannot hang the caller forever.
 */

#include "device_worker.h"

#include "error_reporting.h"
#include "hv_mqtt_transport.h"

#include <spdlog/spdlog.h>

#include <future>

namespace aerolink {

namespace {
constexpr auto STOP_TIMEOUT = std::chrono::seconds(2);
constexpr auto SEND_TIMEOUT = std::chrono::seconds(2);
} // namespace

DeviceWorker::DeviceWorker(IdentityPtr identity, const FamilyDescriptor& family,
                           SupervisorSettings settings, ConnectionCallbacks callbacks,
                           std::chrono::milliseconds tick_interval)
    : serial_(identity->serial()), callbacks_(std::move(callbacks)) {
    loop_thread_ = std::make_shared<hv::EventLoopThread>();
    loop_thread_->start(true);

    auto transport = std::make_unique<HvMqttTransport>(loop_thread_->loop());
    supervisor_ = std::make_unique<ConnectionSupervisor>(std::move(identity), family,
                                                         std::move(transport), settings);

    supervisor_->on_snapshot([this](const DeviceSnapshot& snapshot) {
        if (callbacks_.on_snapshot) {
            callbacks_.on_snapshot(serial_, snapshot);
        }
    });
    supervisor_->on_state_change([this](const ConnectionState& state) {
        connected_.store(state.is(ConnectionStateKind::Connected));
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_mirror_ = state;
        }
        if (callbacks_.on_state) {
            callbacks_.on_state(serial_, state);
        }
    });
    supervisor_->on_error([this](const AeroError& err) {
        if (callbacks_.on_error) {
            callbacks_.on_error(serial_, err);
        }
    });

    auto interval_ms = static_cast<uint32_t>(tick_interval.count());
    loop_thread_->loop()->runInLoop([this, interval_ms]() {
        loop_thread_->loop()->setInterval(interval_ms, [this](hv::TimerID) {
            if (supervisor_) {
                supervisor_->tick(Clock::now());
            }
        });
    });

    spdlog::debug("[DeviceWorker] {}: worker started (tick {}ms)", serial_, interval_ms);
}

DeviceWorker::~DeviceWorker() {
    stop();
    shutdown_loop();
}

bool DeviceWorker::loop_running() const {
    return loop_thread_ && loop_thread_->loop() && loop_thread_->isRunning();
}

void DeviceWorker::start(const DeviceEndpoint& endpoint) {
    if (!loop_running()) {
        LOG_WARN_INTERNAL("[DeviceWorker] {}: start after shutdown ignored", serial_);
        return;
    }
    loop_thread_->loop()->runInLoop([this, endpoint]() {
        if (auto err = supervisor_->start(endpoint)) {
            spdlog::warn("[DeviceWorker] {}: {}", serial_, err.message);
        }
    });
}

void DeviceWorker::stop() {
    if (!loop_running()) {
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> stopped = done->get_future();
    loop_thread_->loop()->runInLoop([this, done]() {
        supervisor_->stop();
        done->set_value();
    });

    if (stopped.wait_for(STOP_TIMEOUT) == std::future_status::timeout) {
        spdlog::warn("[DeviceWorker] {}: stop timed out after {}s", serial_,
                     STOP_TIMEOUT.count());
    }
}

AeroError DeviceWorker::send(const DeviceCommand& command) {
    if (!connected_.load() || !loop_running()) {
        return AeroError::not_connected(serial_);
    }

    auto result = std::make_shared<std::promise<AeroError>>();
    std::future<AeroError> sent = result->get_future();
    loop_thread_->loop()->runInLoop(
        [this, command, result]() { result->set_value(supervisor_->send(command)); });

    if (sent.wait_for(SEND_TIMEOUT) == std::future_status::timeout) {
        return AeroError::make(AeroErrorType::Rejected, "Worker did not accept command in time",
                               serial_);
    }
    return sent.get();
}

void DeviceWorker::update_address(const DeviceAddress& address) {
    if (!loop_running()) {
        return;
    }
    loop_thread_->loop()->runInLoop(
        [this, address]() { supervisor_->update_address(address); });
}

void DeviceWorker::fail(const AeroError& reason) {
    if (!loop_running()) {
        return;
    }
    loop_thread_->loop()->runInLoop([this, reason]() { supervisor_->fail(reason); });
}

ConnectionState DeviceWorker::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_mirror_;
}

void DeviceWorker::shutdown_loop() {
    if (!loop_thread_) {
        return;
    }

    // Supervisor owns the MQTT client, which must be released on its loop
    if (loop_running()) {
        auto done = std::make_shared<std::promise<void>>();
        std::future<void> released = done->get_future();
        loop_thread_->loop()->runInLoop([this, done]() {
            supervisor_.reset();
            done->set_value();
        });
        if (released.wait_for(STOP_TIMEOUT) == std::future_status::timeout) {
            spdlog::warn("[DeviceWorker] {}: supervisor release timed out", serial_);
        }
    }

    loop_thread_->stop();
    loop_thread_->join();
    supervisor_.reset();
    loop_thread_.reset();
    spdlog::debug("[DeviceWorker] {}: worker stopped", serial_);
}

ConnectionFactory DeviceWorker::factory(SupervisorSettings settings,
                                        std::chrono::milliseconds tick_interval) {
    return [settings, tick_interval](IdentityPtr identity, const FamilyDescriptor& family,
                                     ConnectionCallbacks callbacks) {
        return std::unique_ptr<IDeviceConnection>(std::make_unique<DeviceWorker>(
            std::move(identity), family, settings, std::move(callbacks), tick_interval));
    };
}

} // namespace aerolink
