// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "message_codec.h"

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;

// ============================================================================
// Fan decoder
// ============================================================================

TEST_CASE("MessageCodec: fan CURRENT-STATE is a full state", "[codec][fan]") {
    DecodedMessage out;
    AeroError err = decode_fan_message(
        R"({"msg":"CURRENT-STATE","time":"2024-01-01T00:00:00Z",
            "product-state":{"fpwr":"ON","fnsp":"0005","oscs":"OFF"}})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::FullState);
    REQUIRE(out.msg_type == "CURRENT-STATE");
    REQUIRE(out.fields.size() == 3);
    REQUIRE(out.fields["fpwr"] == "ON");
    REQUIRE(out.fields["fnsp"] == "0005");
}

TEST_CASE("MessageCodec: fan STATE-CHANGE keeps the new value of each pair", "[codec][fan]") {
    DecodedMessage out;
    AeroError err = decode_fan_message(
        R"({"msg":"STATE-CHANGE","product-state":{"fnsp":["0005","0007"],"fpwr":["OFF","ON"]}})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::Incremental);
    REQUIRE(out.fields["fnsp"] == "0007");
    REQUIRE(out.fields["fpwr"] == "ON");
}

TEST_CASE("MessageCodec: environmental data lands in sensor readings", "[codec][fan]") {
    DecodedMessage out;
    AeroError err = decode_fan_message(
        R"({"msg":"ENVIRONMENTAL-CURRENT-SENSOR-DATA","data":{"tact":"2950","hact":"0045","pm25":12}})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::Environmental);
    REQUIRE(out.environmental["tact"] == "2950");
    REQUIRE(out.environmental["pm25"] == "12");
    REQUIRE(out.fields.empty());
}

TEST_CASE("MessageCodec: faults are prefixed", "[codec][fan]") {
    DecodedMessage out;
    AeroError err = decode_fan_message(
        R"({"msg":"CURRENT-FAULTS","product-errors":{"amf1":"OK"},"module-warnings":{"srnk":"FAIL"}})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::Faults);
    REQUIRE(out.fields["fault.amf1"] == "OK");
    REQUIRE(out.fields["fault.srnk"] == "FAIL");
}

TEST_CASE("MessageCodec: unknown message types are ignored", "[codec][fan]") {
    DecodedMessage out;
    REQUIRE_FALSE(decode_fan_message(R"({"msg":"HELLO"})", out));
    REQUIRE(out.kind == MessageKind::Ignored);
}

TEST_CASE("MessageCodec: malformed payloads are rejected", "[codec][fan]") {
    DecodedMessage out;

    SECTION("not JSON") {
        AeroError err = decode_fan_message("{not json", out);
        REQUIRE(err.type == AeroErrorType::MalformedPayload);
    }

    SECTION("not an object") {
        AeroError err = decode_fan_message("[1,2,3]", out);
        REQUIRE(err.type == AeroErrorType::MalformedPayload);
    }

    SECTION("missing msg") {
        AeroError err = decode_fan_message(R"({"product-state":{}})", out);
        REQUIRE(err.type == AeroErrorType::MalformedPayload);
    }

    SECTION("state message without product-state") {
        AeroError err = decode_fan_message(R"({"msg":"CURRENT-STATE"})", out);
        REQUIRE(err.type == AeroErrorType::MalformedPayload);
    }
}

// ============================================================================
// Vacuum decoder
// ============================================================================

TEST_CASE("MessageCodec: vacuum full state keeps arrays intact", "[codec][vacuum]") {
    DecodedMessage out;
    AeroError err = decode_vacuum_message(
        R"({"msg":"CURRENT-STATE","time":"x","state":"INACTIVE_CHARGED",
            "batteryChargeLevel":100,"globalPosition":[12,34]})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::FullState);
    REQUIRE(out.fields["state"] == "INACTIVE_CHARGED");
    REQUIRE(out.fields["batteryChargeLevel"] == "100");
    REQUIRE(out.fields["globalPosition"] == "[12,34]");
    REQUIRE(out.fields.count("time") == 0);
    REQUIRE(out.fields.count("msg") == 0);
}

TEST_CASE("MessageCodec: vacuum STATE-CHANGE reports newstate as state", "[codec][vacuum]") {
    DecodedMessage out;
    AeroError err = decode_vacuum_message(
        R"({"msg":"STATE-CHANGE","oldstate":"INACTIVE_CHARGED","newstate":"FULL_CLEAN_RUNNING"})",
        out);

    REQUIRE_FALSE(err);
    REQUIRE(out.kind == MessageKind::Incremental);
    REQUIRE(out.fields["state"] == "FULL_CLEAN_RUNNING");
    REQUIRE(out.fields.count("oldstate") == 0);
}

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("MessageCodec: commands carry time and mode reason", "[codec][encode]") {
    auto when = std::chrono::system_clock::from_time_t(1700000000);
    json doc = json::parse(encode_command(DeviceCommand::request_current_state(), when));

    REQUIRE(doc["msg"] == "REQUEST-CURRENT-STATE");
    REQUIRE(doc["time"] == "2023-11-14T22:13:20Z");
    REQUIRE(doc["mode-reason"] == "LAPP");
    REQUIRE_FALSE(doc.contains("data"));
}

TEST_CASE("MessageCodec: STATE-SET carries its data", "[codec][encode]") {
    auto cmd = DeviceCommand::set_state({{"fpwr", "ON"}, {"fnsp", "0004"}});
    json doc = json::parse(encode_command(cmd, std::chrono::system_clock::now()));

    REQUIRE(doc["msg"] == "STATE-SET");
    REQUIRE(doc["data"]["fpwr"] == "ON");
    REQUIRE(doc["data"]["fnsp"] == "0004");
}

TEST_CASE("MessageCodec: topics follow root/serial layout", "[codec][topics]") {
    DeviceIdentity identity("AB1-EU-ABC1234A", "438", "secret", "438K");

    REQUIRE(status_topic(identity) == "438K/AB1-EU-ABC1234A/status/current");
    REQUIRE(faults_topic(identity) == "438K/AB1-EU-ABC1234A/status/faults");
    REQUIRE(command_topic(identity) == "438K/AB1-EU-ABC1234A/command");
}
