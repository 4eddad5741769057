// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "local_discovery.h"

#include "../mocks/mock_local_discovery.h"

#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;

TEST_CASE("LocalDiscovery: instance name with product type", "[discovery][mdns]") {
    auto parsed = parse_instance_name("438_AB1-EU-ABC1234A._dyson_mqtt._tcp.local.");
    REQUIRE(parsed);
    REQUIRE(parsed->first == "438");
    REQUIRE(parsed->second == "AB1-EU-ABC1234A");
}

TEST_CASE("LocalDiscovery: instance name forms", "[discovery][mdns]") {
    SECTION("bare label") {
        auto parsed = parse_instance_name("527_NK6-EU-MHA0000A");
        REQUIRE(parsed);
        REQUIRE(parsed->first == "527");
        REQUIRE(parsed->second == "NK6-EU-MHA0000A");
    }

    SECTION("serial only") {
        auto parsed = parse_instance_name("JH1-US-HBB1111A._360eye_mqtt._tcp.local.");
        REQUIRE(parsed);
        REQUIRE(parsed->first.empty());
        REQUIRE(parsed->second == "JH1-US-HBB1111A");
    }

    SECTION("unusable names") {
        REQUIRE_FALSE(parse_instance_name(""));
        REQUIRE_FALSE(parse_instance_name("._dyson_mqtt._tcp.local."));
        REQUIRE_FALSE(parse_instance_name("438_._dyson_mqtt._tcp.local."));
    }
}

TEST_CASE("LocalDiscovery: mock delivers advertisements while running", "[discovery][mdns]") {
    MockLocalDiscovery discovery;
    std::vector<DeviceObservation> seen;

    discovery.start([&seen](const DeviceObservation& obs) { seen.push_back(obs); });
    REQUIRE(discovery.is_running());

    discovery.simulate_advertisement("438", "S1", "10.0.0.5", DEFAULT_MQTT_PORT);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].source == EndpointSource::LocalDiscovery);
    REQUIRE(seen[0].credential.empty());
    REQUIRE(seen[0].address->host == "10.0.0.5");

    discovery.stop();
    REQUIRE_FALSE(discovery.is_running());
    REQUIRE(discovery.stop_calls == 1);
}
