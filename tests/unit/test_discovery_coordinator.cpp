// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "discovery_coordinator.h"
#include "state_coordinator.h"

#include "../mocks/fake_device_connection.h"

#include <map>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;

/**
 * DiscoveryCoordinator Tests
 *
 * The coordinator runs on the test thread with FakeDeviceConnections, so every
 * start/stop/address change it requests is visible synchronously.
 */

namespace {

DeviceObservation local_ad(const std::string& serial, const std::string& host,
                           const std::string& product_type = "438") {
    DeviceObservation obs;
    obs.serial = serial;
    obs.product_type = product_type;
    obs.address = DeviceAddress{host, DEFAULT_MQTT_PORT};
    obs.source = EndpointSource::LocalDiscovery;
    obs.seen_at = Clock::now();
    return obs;
}

DeviceObservation cloud_entry(const std::string& serial, const std::string& credential,
                              std::optional<DeviceAddress> hint = std::nullopt,
                              const std::string& product_type = "438") {
    DeviceObservation obs;
    obs.serial = serial;
    obs.product_type = product_type;
    obs.credential = credential;
    obs.address = hint;
    obs.source = EndpointSource::CloudDiscovery;
    obs.seen_at = Clock::now();
    return obs;
}

IdentityPtr identity(const std::string& serial, const std::string& credential = "pw") {
    return std::make_shared<const DeviceIdentity>(serial, "438", credential);
}

} // namespace

class DiscoveryFixture {
  public:
    DiscoveryFixture()
        : families_(FamilyRegistry::with_builtin_families()),
          coordinator_(families_, pool_.factory(), ConnectionCallbacks{}) {
        coordinator_.set_event_callback([this](const HubEvent& ev) { events_.push_back(ev); });
        coordinator_.set_degraded_callback(
            [this](const std::string& serial, bool degraded) { degraded_[serial] = degraded; });
    }

  protected:
    size_t events_of(HubEventType type) const {
        size_t n = 0;
        for (const auto& ev : events_) {
            if (ev.type == type) {
                ++n;
            }
        }
        return n;
    }

    FamilyRegistry families_;
    FakeConnectionPool pool_;
    DiscoveryCoordinator coordinator_;
    std::vector<HubEvent> events_;
    std::map<std::string, bool> degraded_;
};

// ============================================================================
// Dedup
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: one endpoint per serial across sources",
                 "[discovery][dedup]") {
    coordinator_.observe(cloud_entry("S1", "pw"));
    coordinator_.observe(local_ad("S1", "10.0.0.7"));
    coordinator_.observe(local_ad("S1", "10.0.0.7"));
    coordinator_.observe(cloud_entry("S1", "pw"));
    REQUIRE_FALSE(coordinator_.add_manual(identity("S1"), std::nullopt));

    REQUIRE(coordinator_.size() == 1);
    REQUIRE(pool_.created_count("S1") == 1);
    REQUIRE(pool_.get("S1")->start_calls == 1);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: local advertisement then cloud entry without address",
                 "[discovery][dedup]") {
    coordinator_.observe(local_ad("ABC-123", "10.0.0.5"));

    // Credential unknown: held back, not registered
    REQUIRE(coordinator_.size() == 0);
    REQUIRE(coordinator_.pending_advertisements() == std::vector<std::string>{"ABC-123"});

    coordinator_.observe(cloud_entry("ABC-123", "cloudpass"));

    REQUIRE(coordinator_.size() == 1);
    REQUIRE(coordinator_.pending_advertisements().empty());
    auto ep = coordinator_.endpoint("ABC-123");
    REQUIRE(ep);
    REQUIRE(ep->address);
    REQUIRE(ep->address->host == "10.0.0.5");
    REQUIRE(ep->source == EndpointSource::LocalDiscovery);
    REQUIRE(ep->identity->credential() == "cloudpass");
    REQUIRE_FALSE(ep->cloud_only_unresolved);

    FakeDeviceConnection* conn = pool_.get("ABC-123");
    REQUIRE(conn != nullptr);
    REQUIRE(conn->address->host == "10.0.0.5");
    REQUIRE(events_of(HubEventType::CloudDeviceWithoutAddress) == 0);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: cloud entry without address keeps the local one",
                 "[discovery][dedup]") {
    coordinator_.observe(cloud_entry("ABC-123", "cloudpass"));
    coordinator_.observe(local_ad("ABC-123", "10.0.0.5"));
    coordinator_.observe(cloud_entry("ABC-123", "cloudpass"));

    REQUIRE(coordinator_.size() == 1);
    auto ep = coordinator_.endpoint("ABC-123");
    REQUIRE(ep->address->host == "10.0.0.5");
    REQUIRE(ep->source == EndpointSource::LocalDiscovery);
    REQUIRE(pool_.created_count("ABC-123") == 1);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: local advertisement uses the cloud directory credential",
                 "[discovery][dedup]") {
    coordinator_.set_cloud_lookup([](const std::string& serial) -> std::optional<DeviceCloudInfo> {
        if (serial != "S9") {
            return std::nullopt;
        }
        DeviceCloudInfo info;
        info.serial = serial;
        info.product_type = "527";
        info.credential = "fromcloud";
        info.mqtt_root_topic = "527K";
        return info;
    });

    DeviceObservation ad = local_ad("S9", "10.0.0.9", "");
    coordinator_.observe(ad);

    REQUIRE(coordinator_.size() == 1);
    auto ep = coordinator_.endpoint("S9");
    REQUIRE(ep->identity->credential() == "fromcloud");
    REQUIRE(ep->identity->product_type() == "527");
    REQUIRE(ep->identity->mqtt_root_topic() == "527K");
    REQUIRE(pool_.get("S9")->family.family == DeviceFamily::HotCoolFan);
}

// ============================================================================
// Address merge policy
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: new local address moves the connection",
                 "[discovery][address]") {
    coordinator_.observe(cloud_entry("S1", "pw"));
    coordinator_.observe(local_ad("S1", "10.0.0.5"));
    FakeDeviceConnection* conn = pool_.get("S1");
    conn->simulate_connected();

    SECTION("same address leaves the connection alone") {
        coordinator_.observe(local_ad("S1", "10.0.0.5"));
        REQUIRE(conn->update_address_calls == 0);
        REQUIRE(conn->state().is(ConnectionStateKind::Connected));
    }

    SECTION("different address is pushed to the connection") {
        coordinator_.observe(local_ad("S1", "10.0.0.6"));
        REQUIRE(conn->update_address_calls == 1);
        REQUIRE(conn->address->host == "10.0.0.6");
        REQUIRE(coordinator_.endpoint("S1")->address->host == "10.0.0.6");
    }

    REQUIRE(pool_.created_count("S1") == 1);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: silence never erases a known address",
                 "[discovery][address]") {
    coordinator_.observe(cloud_entry("S1", "pw"));
    coordinator_.observe(local_ad("S1", "10.0.0.5"));

    // Device stops advertising; the cloud keeps listing it without an address
    for (int i = 0; i < 3; ++i) {
        coordinator_.observe(cloud_entry("S1", "pw"));
    }

    auto ep = coordinator_.endpoint("S1");
    REQUIRE(ep->address->host == "10.0.0.5");
    REQUIRE(pool_.get("S1")->stop_calls == 0);
    REQUIRE(coordinator_.cloud_devices_without_address().empty());
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: static address is never replaced",
                 "[discovery][address]") {
    REQUIRE_FALSE(
        coordinator_.add_manual(identity("S1"), DeviceAddress{"192.168.1.10", DEFAULT_MQTT_PORT}));
    coordinator_.observe(local_ad("S1", "10.0.0.5"));
    coordinator_.observe(cloud_entry("S1", "otherpw", DeviceAddress{"10.0.0.8", 1883}));

    auto ep = coordinator_.endpoint("S1");
    REQUIRE(ep->static_address);
    REQUIRE(ep->address->host == "192.168.1.10");
    REQUIRE(ep->source == EndpointSource::Manual);
    REQUIRE(pool_.get("S1")->update_address_calls == 0);

    // Manual credentials are not overwritten by the cloud either
    REQUIRE(ep->identity->credential() == "pw");
    REQUIRE(ep->cloud_address_hint->host == "10.0.0.8");

    SECTION("a connected device keeps its static address") {
        coordinator_.handle_connection_state("S1", ConnectionState::connected());
        coordinator_.observe(local_ad("S1", "10.0.0.6"));
        REQUIRE(coordinator_.endpoint("S1")->address->host == "192.168.1.10");
        REQUIRE(pool_.get("S1")->update_address_calls == 0);
    }

    SECTION("early connect failures do not move it") {
        auto cause = AeroError::connect_timeout("S1", 10000);
        for (uint32_t attempt = 1; attempt < DiscoveryCoordinator::STATIC_FALLBACK_ATTEMPTS;
             ++attempt) {
            coordinator_.handle_connection_state(
                "S1", ConnectionState::reconnecting(attempt, Clock::now(), cause));
        }
        REQUIRE(coordinator_.endpoint("S1")->address->host == "192.168.1.10");
        REQUIRE(pool_.get("S1")->update_address_calls == 0);
    }
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: unreachable static host falls back to discovery",
                 "[discovery][address]") {
    REQUIRE_FALSE(
        coordinator_.add_manual(identity("S1"), DeviceAddress{"192.168.1.10", DEFAULT_MQTT_PORT}));
    auto cause = AeroError::connect_timeout("S1", 10000);
    auto give_up = [&]() {
        coordinator_.handle_connection_state(
            "S1", ConnectionState::reconnecting(DiscoveryCoordinator::STATIC_FALLBACK_ATTEMPTS,
                                                Clock::now(), cause));
    };

    SECTION("advertised address is tried first") {
        coordinator_.observe(cloud_entry("S1", "pw", DeviceAddress{"10.0.0.8", 1883}));
        coordinator_.observe(local_ad("S1", "10.0.0.5"));
        give_up();

        auto ep = coordinator_.endpoint("S1");
        REQUIRE(ep->address->host == "10.0.0.5");
        REQUIRE(ep->source == EndpointSource::LocalDiscovery);
        REQUIRE(ep->static_address);
        REQUIRE(pool_.get("S1")->address->host == "10.0.0.5");
        REQUIRE(pool_.get("S1")->update_address_calls == 1);

        // Then the cloud hint, then back to the static host
        give_up();
        REQUIRE(coordinator_.endpoint("S1")->address->host == "10.0.0.8");
        give_up();
        REQUIRE(coordinator_.endpoint("S1")->address->host == "192.168.1.10");
        REQUIRE(coordinator_.endpoint("S1")->source == EndpointSource::Manual);
    }

    SECTION("advertisement after giving up moves the connection") {
        give_up();
        REQUIRE(coordinator_.endpoint("S1")->address->host == "192.168.1.10");

        coordinator_.observe(local_ad("S1", "10.0.0.5"));
        REQUIRE(coordinator_.endpoint("S1")->address->host == "10.0.0.5");
        REQUIRE(pool_.get("S1")->update_address_calls == 1);

        // Reachable there: later advertisements are not chased
        coordinator_.handle_connection_state("S1", ConnectionState::connected());
        coordinator_.observe(local_ad("S1", "10.0.0.9"));
        REQUIRE(coordinator_.endpoint("S1")->address->host == "10.0.0.5");
        REQUIRE(pool_.get("S1")->update_address_calls == 1);
    }

    SECTION("cloud hint is used when nothing was advertised") {
        give_up();
        coordinator_.observe(cloud_entry("S1", "pw", DeviceAddress{"10.0.0.8", 1883}));
        auto ep = coordinator_.endpoint("S1");
        REQUIRE(ep->address->host == "10.0.0.8");
        REQUIRE(ep->source == EndpointSource::CloudDiscovery);
        REQUIRE(pool_.get("S1")->update_address_calls == 1);
    }

    REQUIRE(pool_.created_count("S1") == 1);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: cloud hint is used when nothing local is known",
                 "[discovery][address]") {
    coordinator_.observe(cloud_entry("V1", "vac", DeviceAddress{"192.168.1.40", 1883}, "N223"));

    auto ep = coordinator_.endpoint("V1");
    REQUIRE(ep->address->host == "192.168.1.40");
    REQUIRE(ep->source == EndpointSource::CloudDiscovery);
    REQUIRE(pool_.get("V1") != nullptr);

    // A local advertisement wins over the hint
    coordinator_.observe(local_ad("V1", "192.168.1.41", "N223"));
    ep = coordinator_.endpoint("V1");
    REQUIRE(ep->address->host == "192.168.1.41");
    REQUIRE(ep->source == EndpointSource::LocalDiscovery);

    // And a later hint does not take it back
    coordinator_.observe(cloud_entry("V1", "vac", DeviceAddress{"192.168.1.40", 1883}, "N223"));
    REQUIRE(coordinator_.endpoint("V1")->address->host == "192.168.1.41");
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: cloud-only device without address",
                 "[discovery][address]") {
    coordinator_.observe(cloud_entry("S2", "pw"));
    coordinator_.observe(cloud_entry("S2", "pw"));

    REQUIRE(coordinator_.size() == 1);
    REQUIRE(pool_.get("S2") == nullptr);
    REQUIRE(coordinator_.cloud_devices_without_address() == std::vector<std::string>{"S2"});
    REQUIRE(events_of(HubEventType::CloudDeviceWithoutAddress) == 1);

    coordinator_.observe(local_ad("S2", "10.0.0.2"));
    REQUIRE(coordinator_.cloud_devices_without_address().empty());
    REQUIRE(pool_.get("S2") != nullptr);
}

// ============================================================================
// Manual entries, removal, identity
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: manual device waits for discovery",
                 "[discovery][manual]") {
    REQUIRE_FALSE(coordinator_.add_manual(identity("M1"), std::nullopt));
    REQUIRE(coordinator_.size() == 1);
    REQUIRE(pool_.get("M1") == nullptr);

    coordinator_.observe(local_ad("M1", "10.0.0.11"));
    REQUIRE(pool_.get("M1") != nullptr);
    REQUIRE(pool_.get("M1")->last_endpoint.identity->credential() == "pw");
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: manual entry picks up a pending advertisement",
                 "[discovery][manual]") {
    coordinator_.observe(local_ad("M2", "10.0.0.12"));
    REQUIRE(coordinator_.size() == 0);

    REQUIRE_FALSE(coordinator_.add_manual(identity("M2"), std::nullopt));
    REQUIRE(coordinator_.endpoint("M2")->address->host == "10.0.0.12");
    REQUIRE(pool_.get("M2") != nullptr);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: manual entry without serial is refused",
                 "[discovery][manual]") {
    AeroError err = coordinator_.add_manual(identity(""), std::nullopt);
    REQUIRE(err.type == AeroErrorType::InvalidState);
    REQUIRE(coordinator_.size() == 0);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: remove stops the connection",
                 "[discovery][remove]") {
    coordinator_.observe(cloud_entry("S1", "pw", DeviceAddress{"10.0.0.5", 1883}));
    REQUIRE(pool_.live_count() == 1);

    REQUIRE(coordinator_.remove("S1"));
    REQUIRE(coordinator_.size() == 0);
    REQUIRE(pool_.live_count() == 0);
    REQUIRE_FALSE(coordinator_.remove("S1"));
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: changed cloud credential restarts the connection",
                 "[discovery][identity]") {
    coordinator_.observe(cloud_entry("S1", "old", DeviceAddress{"10.0.0.5", 1883}));
    REQUIRE(pool_.created_count("S1") == 1);

    coordinator_.observe(cloud_entry("S1", "new", DeviceAddress{"10.0.0.5", 1883}));
    REQUIRE(pool_.created_count("S1") == 2);
    REQUIRE(pool_.get("S1")->identity->credential() == "new");
    REQUIRE(pool_.live_count() == 1);
}

// ============================================================================
// Credential rejection
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: rejected credential stops retries until replaced",
                 "[discovery][auth]") {
    REQUIRE_FALSE(
        coordinator_.add_manual(identity("S1", "wrong"), DeviceAddress{"10.0.0.5", 1883}));
    FakeDeviceConnection* conn = pool_.get("S1");

    coordinator_.handle_connection_error("S1", AeroError::auth_rejected("S1"));
    coordinator_.handle_connection_error("S1", AeroError::auth_rejected("S1"));

    REQUIRE(conn->fail_calls == 1);
    REQUIRE(conn->state().is(ConnectionStateKind::Failed));
    REQUIRE(events_of(HubEventType::DeviceAuthRejected) == 1);
    REQUIRE(events_.back().is_error);

    // Rediscovery does not bring it back
    coordinator_.observe(local_ad("S1", "10.0.0.6"));
    REQUIRE(pool_.created_count("S1") == 1);

    REQUIRE_FALSE(coordinator_.replace_identity(identity("S1", "right")));
    REQUIRE(pool_.created_count("S1") == 2);
    REQUIRE(pool_.get("S1")->identity->credential() == "right");
    REQUIRE(pool_.get("S1")->start_calls == 1);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: transient connection errors are left to the supervisor",
                 "[discovery][auth]") {
    coordinator_.observe(cloud_entry("S1", "pw", DeviceAddress{"10.0.0.5", 1883}));
    coordinator_.handle_connection_error("S1", AeroError::connect_timeout("S1", 10000));
    coordinator_.handle_connection_error("S1", AeroError::malformed_payload("x", "S1"));

    REQUIRE(pool_.get("S1")->fail_calls == 0);
    REQUIRE(events_.empty());
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: replace_identity for an unknown device",
                 "[discovery][identity]") {
    AeroError err = coordinator_.replace_identity(identity("NOPE"));
    REQUIRE(err.type == AeroErrorType::InvalidState);
}

// ============================================================================
// Commands
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: send goes through the device connection",
                 "[discovery][send]") {
    REQUIRE(coordinator_.send("S1", DeviceCommand::request_current_state()).type ==
            AeroErrorType::NotConnected);

    coordinator_.observe(cloud_entry("S1", "pw", DeviceAddress{"10.0.0.5", 1883}));
    REQUIRE(coordinator_.send("S1", DeviceCommand::request_current_state()).type ==
            AeroErrorType::NotConnected);

    pool_.get("S1")->simulate_connected();
    REQUIRE_FALSE(coordinator_.send("S1", DeviceCommand::request_current_state()));
    REQUIRE(pool_.get("S1")->sent == std::vector<std::string>{"REQUEST-CURRENT-STATE"});
    REQUIRE(coordinator_.connection_state("S1").is(ConnectionStateKind::Connected));
}

// ============================================================================
// Cloud session loss
// ============================================================================

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: cloud session loss degrades only cloud-dependent devices",
                 "[discovery][degraded]") {
    coordinator_.observe(cloud_entry("CLOUD", "pw", DeviceAddress{"10.0.0.20", 1883}));
    coordinator_.observe(cloud_entry("LOCAL", "pw"));
    coordinator_.observe(local_ad("LOCAL", "10.0.0.21"));
    REQUIRE_FALSE(
        coordinator_.add_manual(identity("MANUAL"), DeviceAddress{"10.0.0.22", DEFAULT_MQTT_PORT}));

    auto changed = coordinator_.set_cloud_degraded(true);

    REQUIRE(changed == std::vector<std::string>{"CLOUD"});
    REQUIRE(coordinator_.is_degraded("CLOUD"));
    REQUIRE_FALSE(coordinator_.is_degraded("LOCAL"));
    REQUIRE_FALSE(coordinator_.is_degraded("MANUAL"));
    REQUIRE(degraded_["CLOUD"]);

    // Entries stay registered and keep their connections
    REQUIRE(coordinator_.size() == 3);
    REQUIRE(pool_.live_count() == 3);

    changed = coordinator_.set_cloud_degraded(false);
    REQUIRE(changed == std::vector<std::string>{"CLOUD"});
    REQUIRE_FALSE(degraded_["CLOUD"]);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: failed token refresh leaves local devices available",
                 "[discovery][degraded][state]") {
    StateCoordinator state(
        [this](const std::string& serial, const DeviceCommand& cmd) {
            return coordinator_.send(serial, cmd);
        },
        StatePollingSettings{});
    coordinator_.set_degraded_callback(
        [&state](const std::string& serial, bool degraded) { state.set_degraded(serial, degraded); });

    coordinator_.observe(cloud_entry("CLOUD", "pw", DeviceAddress{"10.0.0.20", 1883}));
    REQUIRE_FALSE(
        coordinator_.add_manual(identity("MANUAL"), DeviceAddress{"10.0.0.22", DEFAULT_MQTT_PORT}));
    for (const char* serial : {"CLOUD", "MANUAL"}) {
        state.track(serial, families_.resolve("438"));
        state.handle_connection_state(serial, ConnectionState::connected());
    }
    REQUIRE(state.is_available("CLOUD"));
    REQUIRE(state.is_available("MANUAL"));

    coordinator_.set_cloud_degraded(true);

    REQUIRE(coordinator_.size() == 2);
    REQUIRE_FALSE(state.is_available("CLOUD"));
    REQUIRE(state.last_failure("CLOUD").kind == UpdateFailureKind::ConfigEntryAuthFailed);
    REQUIRE(state.is_available("MANUAL"));
    REQUIRE(state.last_failure("MANUAL").kind == UpdateFailureKind::None);

    coordinator_.set_cloud_degraded(false);
    REQUIRE(state.is_available("CLOUD"));
    REQUIRE(state.last_failure("CLOUD").kind == UpdateFailureKind::None);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: devices registered while degraded start degraded",
                 "[discovery][degraded]") {
    coordinator_.set_cloud_degraded(true);
    coordinator_.observe(cloud_entry("LATE", "pw", DeviceAddress{"10.0.0.30", 1883}));

    REQUIRE(coordinator_.is_degraded("LATE"));
    REQUIRE(degraded_["LATE"]);
}

TEST_CASE_METHOD(DiscoveryFixture, "Discovery: stop_all stops every connection",
                 "[discovery][stop]") {
    coordinator_.observe(cloud_entry("A", "pw", DeviceAddress{"10.0.0.1", 1883}));
    coordinator_.observe(cloud_entry("B", "pw", DeviceAddress{"10.0.0.2", 1883}));
    REQUIRE(pool_.live_count() == 2);

    coordinator_.stop_all();
    REQUIRE(pool_.live_count() == 0);
    REQUIRE(coordinator_.size() == 2);
    REQUIRE(coordinator_.connection_state("A").is(ConnectionStateKind::Disconnected));
}
