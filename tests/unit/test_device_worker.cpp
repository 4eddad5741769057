// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * DeviceWorker Tests
 *
 * Runs a real worker loop and libhv MQTT client against a TEST-NET address
 * (192.0.2.0/24) that never answers, so every connect attempt fails or times
 * out. Covers the synchronous NotConnected path and the stop() guarantee.
 */

#include "device_worker.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;
using namespace std::chrono;

class DeviceWorkerFixture {
  public:
    DeviceWorkerFixture() : families_(FamilyRegistry::with_builtin_families()) {
        identity_ = std::make_shared<const DeviceIdentity>("W1", "438", "pw");

        settings_.connect_timeout = milliseconds(200);
        settings_.backoff.base = milliseconds(50);
        settings_.backoff.cap = milliseconds(200);

        callbacks_.on_state = [this](const std::string&, const ConnectionState& state) {
            std::lock_guard<std::mutex> lock(mutex_);
            states_.push_back(state.kind);
        };
    }

  protected:
    std::unique_ptr<IDeviceConnection> make_worker() {
        return DeviceWorker::factory(settings_, milliseconds(20))(
            identity_, families_.resolve("438"), callbacks_);
    }

    DeviceEndpoint unreachable_endpoint() const {
        DeviceEndpoint ep;
        ep.identity = identity_;
        ep.address = DeviceAddress{"192.0.2.1", DEFAULT_MQTT_PORT};
        ep.static_address = true;
        return ep;
    }

    bool wait_until(const std::function<bool()>& condition, int timeout_ms = 3000) {
        auto deadline = steady_clock::now() + milliseconds(timeout_ms);
        while (steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(milliseconds(5));
        }
        return condition();
    }

    bool saw(ConnectionStateKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto k : states_) {
            if (k == kind) {
                return true;
            }
        }
        return false;
    }

    ConnectionStateKind last_reported() {
        std::lock_guard<std::mutex> lock(mutex_);
        return states_.empty() ? ConnectionStateKind::Disconnected : states_.back();
    }

    FamilyRegistry families_;
    IdentityPtr identity_;
    SupervisorSettings settings_;
    ConnectionCallbacks callbacks_;

    std::mutex mutex_;
    std::vector<ConnectionStateKind> states_;
};

TEST_CASE_METHOD(DeviceWorkerFixture, "DeviceWorker: send before connect is refused",
                 "[worker][connection]") {
    auto worker = make_worker();
    REQUIRE(worker->serial() == "W1");
    REQUIRE(worker->state().is(ConnectionStateKind::Disconnected));

    AeroError err = worker->send(DeviceCommand::request_current_state());
    REQUIRE(err.type == AeroErrorType::NotConnected);

    worker->start(unreachable_endpoint());
    REQUIRE(wait_until([this]() { return saw(ConnectionStateKind::Connecting); }));

    err = worker->send(DeviceCommand::request_current_state());
    REQUIRE(err.type == AeroErrorType::NotConnected);

    worker->stop();
}

TEST_CASE_METHOD(DeviceWorkerFixture, "DeviceWorker: unreachable broker is retried",
                 "[worker][connection]") {
    auto worker = make_worker();
    worker->start(unreachable_endpoint());

    REQUIRE(wait_until([this]() { return saw(ConnectionStateKind::Reconnecting); }));
    REQUIRE_FALSE(saw(ConnectionStateKind::Connected));

    worker->stop();
    REQUIRE(worker->state().is(ConnectionStateKind::Disconnected));
}

TEST_CASE_METHOD(DeviceWorkerFixture, "DeviceWorker: stop lands in Disconnected",
                 "[worker][connection]") {
    auto worker = make_worker();
    worker->start(unreachable_endpoint());
    REQUIRE(wait_until([this]() { return saw(ConnectionStateKind::Connecting); }));

    SECTION("while connecting") {
        worker->stop();
    }

    SECTION("after an address change") {
        worker->update_address(DeviceAddress{"192.0.2.2", DEFAULT_MQTT_PORT});
        worker->stop();
    }

    REQUIRE(worker->state().is(ConnectionStateKind::Disconnected));
    REQUIRE(last_reported() == ConnectionStateKind::Disconnected);
    REQUIRE(worker->send(DeviceCommand::request_current_state()).type ==
            AeroErrorType::NotConnected);

    // A second stop and the destructor are both harmless
    worker->stop();
    worker.reset();
}
