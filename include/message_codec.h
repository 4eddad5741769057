// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "device_snapshot.h"
#include "device_types.h"

#include <chrono>
#include <string>

#include "hv/json.hpp"

namespace aerolink {

using json = nlohmann::json;

/**
 * @brief Classification of an inbound device message
 */
enum class MessageKind {
    FullState,     // CURRENT-STATE: replaces product state wholesale
    Incremental,   // STATE-CHANGE: merges the fields present
    Environmental, // ENVIRONMENTAL-CURRENT-SENSOR-DATA: replaces sensor readings
    Faults,        // CURRENT-FAULTS: merged under "fault." keys
    Ignored        // Recognised JSON but of no interest to the snapshot
};

const char* message_kind_name(MessageKind kind);

/**
 * @brief Result of decoding one inbound payload
 */
struct DecodedMessage {
    MessageKind kind = MessageKind::Ignored;
    std::string msg_type; ///< Raw "msg" field
    ProductState fields;  ///< FullState / Incremental / Faults
    EnvironmentalData environmental;
};

/**
 * @brief Outbound command to a device
 *
 * Serialised by encode_command() with the timestamp and mode reason the
 * firmware requires.
 */
struct DeviceCommand {
    std::string type;          ///< "msg" field, e.g. "STATE-SET"
    json data = json::object(); ///< Payload for STATE-SET, empty otherwise

    static DeviceCommand request_current_state();
    static DeviceCommand request_environment();
    static DeviceCommand set_state(const ProductState& values);
};

/// Firmware message types
namespace msg_types {
constexpr const char* CURRENT_STATE = "CURRENT-STATE";
constexpr const char* STATE_CHANGE = "STATE-CHANGE";
constexpr const char* ENVIRONMENTAL_DATA = "ENVIRONMENTAL-CURRENT-SENSOR-DATA";
constexpr const char* CURRENT_FAULTS = "CURRENT-FAULTS";
constexpr const char* REQUEST_CURRENT_STATE = "REQUEST-CURRENT-STATE";
constexpr const char* REQUEST_ENVIRONMENT = "REQUEST-PRODUCT-ENVIRONMENT-CURRENT-SENSOR-DATA";
constexpr const char* STATE_SET = "STATE-SET";
} // namespace msg_types

// Topic layout on the device broker: "{root}/{serial}/..."
std::string status_topic(const DeviceIdentity& identity);
std::string faults_topic(const DeviceIdentity& identity);
std::string command_topic(const DeviceIdentity& identity);

/**
 * @brief Serialise a command with "time" and "mode-reason"
 *
 * @param cmd Command to encode
 * @param now Wall clock time stamped into the payload (UTC ISO-8601)
 */
std::string encode_command(const DeviceCommand& cmd, std::chrono::system_clock::time_point now);

/**
 * @brief Format a wall clock time as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Decoder for environmental fans (state fields nested in "product-state")
 *
 * @return MalformedPayload for non-JSON, non-object or missing "msg"
 */
AeroError decode_fan_message(const std::string& payload, DecodedMessage& out);

/**
 * @brief Decoder for robot vacuums (state fields at the top level)
 *
 * STATE-CHANGE carries "oldstate"/"newstate"; "newstate" is reported as "state".
 */
AeroError decode_vacuum_message(const std::string& payload, DecodedMessage& out);

/**
 * @brief Render a JSON value as the snapshot string form
 *
 * Strings are kept verbatim, anything else is dumped as compact JSON.
 */
std::string json_value_to_string(const json& value);

} // namespace aerolink
