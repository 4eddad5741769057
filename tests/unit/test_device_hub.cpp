// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * DeviceHub Integration Tests
 *
 * Runs the real hub loop with mock discovery sources, a mock account service
 * and fake device connections. Assertions wait on the thread-safe readers
 * (registry and state) before touching the fakes.
 */

#include "device_hub.h"

#include "../mocks/fake_device_connection.h"
#include "../mocks/mock_cloud_api.h"
#include "../mocks/mock_local_discovery.h"
#include "../test_fixtures.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;
using namespace std::chrono;

class DeviceHubFixture : public ConfigTestFixture {
  public:
    DeviceHubFixture() {
        config.init(temp_path("hub_test.json"));
        api_ = std::make_shared<MockCloudApi>();

        CloudSession session;
        session.access_token = "token-a";
        session.refresh_token = "refresh-a";
        session.expires_at = WallClock::now() + hours(24);
        settings_.cloud_session = session;
    }

    ~DeviceHubFixture() {
        if (hub_) {
            hub_->stop();
        }
    }

  protected:
    void start_hub() {
        auto local = std::make_unique<MockLocalDiscovery>();
        local_ = local.get();

        DeviceHub::Dependencies deps;
        deps.connection_factory = pool_.factory();
        deps.local_discovery = std::move(local);
        deps.cloud_api = api_;

        hub_ = std::make_unique<DeviceHub>(config, settings_, std::move(deps));
        hub_->set_event_callback([this](const HubEvent& ev) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(ev);
        });
        REQUIRE(hub_->start());
    }

    /**
     * @brief Poll a condition until it holds or the timeout expires
     */
    bool wait_until(const std::function<bool()>& condition, int timeout_ms = 2000) {
        auto deadline = steady_clock::now() + milliseconds(timeout_ms);
        while (steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(milliseconds(5));
        }
        return condition();
    }

    bool connecting(const std::string& serial) {
        return hub_->state().connection_state(serial).is(ConnectionStateKind::Connecting);
    }

    size_t event_count(HubEventType type) {
        std::lock_guard<std::mutex> lock(events_mutex_);
        size_t n = 0;
        for (const auto& ev : events_) {
            if (ev.type == type) {
                ++n;
            }
        }
        return n;
    }

    HubSettings settings_;
    std::shared_ptr<MockCloudApi> api_;
    FakeConnectionPool pool_;
    MockLocalDiscovery* local_ = nullptr;
    std::unique_ptr<DeviceHub> hub_;

    std::mutex events_mutex_;
    std::vector<HubEvent> events_;
};

TEST_CASE_METHOD(DeviceHubFixture, "DeviceHub: manual device with static address connects",
                 "[hub]") {
    ManualDeviceConfig device;
    device.identity = std::make_shared<const DeviceIdentity>("M1", "438", "pw");
    device.static_address = DeviceAddress{"192.168.1.10", DEFAULT_MQTT_PORT};
    device.name = "Office";
    settings_.devices.push_back(device);
    settings_.cloud_enabled = false;

    start_hub();
    REQUIRE(hub_->cloud() == nullptr);
    REQUIRE(wait_until([this]() { return connecting("M1"); }));

    pool_.get("M1")->simulate_connected();
    REQUIRE(hub_->state().is_available("M1"));
    REQUIRE(wait_until([this]() { return event_count(HubEventType::DeviceAvailable) == 1; }));

    hub_->stop();
    REQUIRE(pool_.created_count("M1") == 1);
    REQUIRE(pool_.live_count() == 0);
}

TEST_CASE_METHOD(DeviceHubFixture, "DeviceHub: local and cloud sightings merge into one device",
                 "[hub][dedup]") {
    DeviceCloudInfo info;
    info.serial = "ABC-123";
    info.product_type = "438";
    info.credential = "cloudpass";
    api_->devices.push_back(info);

    start_hub();
    local_->simulate_advertisement("438", "ABC-123", "10.0.0.5");

    REQUIRE(wait_until([this]() { return connecting("ABC-123"); }));
    REQUIRE(wait_until([this]() { return api_->list_devices_calls.load() >= 1; }));

    // Let both sightings land in either order
    local_->simulate_advertisement("438", "ABC-123", "10.0.0.5");
    hub_->cloud()->request_refresh();
    REQUIRE(wait_until([this]() { return api_->list_devices_calls.load() >= 2; }));

    auto ep = hub_->registry().endpoint("ABC-123");
    REQUIRE(ep);
    REQUIRE(hub_->registry().size() == 1);
    REQUIRE(ep->address->host == "10.0.0.5");
    REQUIRE(ep->identity->credential() == "cloudpass");

    hub_->stop();
    REQUIRE(pool_.created_count("ABC-123") == 1);
}

TEST_CASE_METHOD(DeviceHubFixture, "DeviceHub: removed device is forgotten", "[hub]") {
    ManualDeviceConfig device;
    device.identity = std::make_shared<const DeviceIdentity>("M1", "438", "pw");
    device.static_address = DeviceAddress{"192.168.1.10", DEFAULT_MQTT_PORT};
    settings_.devices.push_back(device);
    settings_.cloud_enabled = false;

    start_hub();
    REQUIRE(wait_until([this]() { return connecting("M1"); }));

    hub_->remove_device("M1");
    REQUIRE(wait_until([this]() { return hub_->registry().size() == 0; }));
    REQUIRE(wait_until([this]() { return hub_->state().devices().empty(); }));
}

TEST_CASE_METHOD(DeviceHubFixture, "DeviceHub: start twice is refused", "[hub]") {
    settings_.cloud_enabled = false;
    start_hub();

    REQUIRE_FALSE(hub_->start());
    hub_->stop();
    REQUIRE_FALSE(hub_->is_running());
    REQUIRE(local_->stop_calls == 1);
}
