// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file message_codec.cpp
 * @brief JSON payload codec for the appliance MQTT protocol
 *
 * @gotchas STATE-CHANGE reports every changed field as an [old, new] pair, but
 *          vacuum full states also contain genuine two-element arrays
 *          (globalPosition). Pairs are only collapsed for incremental messages.
 */

#include "message_codec.h"

#include <spdlog/spdlog.h>

#include <ctime>

namespace aerolink {

namespace {

constexpr const char* MODE_REASON = "LAPP";
constexpr const char* FAULT_PREFIX = "fault.";

/// Parse payload and validate the common envelope
AeroError parse_envelope(const std::string& payload, json& doc, std::string& msg_type) {
    doc = json::parse(payload, nullptr, false);
    if (doc.is_discarded()) {
        return AeroError::malformed_payload("not JSON");
    }
    if (!doc.is_object()) {
        return AeroError::malformed_payload("not a JSON object");
    }
    auto it = doc.find("msg");
    if (it == doc.end() || !it->is_string()) {
        return AeroError::malformed_payload("missing msg field");
    }
    msg_type = it->get<std::string>();
    return {};
}

std::string collapse_pair(const json& value) {
    if (value.is_array() && value.size() == 2) {
        return json_value_to_string(value[1]);
    }
    return json_value_to_string(value);
}

void flatten_object(const json& obj, ProductState& out, bool collapse_pairs,
                    const std::string& prefix = "") {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        out[prefix + it.key()] =
            collapse_pairs ? collapse_pair(it.value()) : json_value_to_string(it.value());
    }
}

/// Faults arrive as {"product-errors": {...}, "product-warnings": {...}, ...}
void decode_faults(const json& doc, DecodedMessage& out) {
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() == "msg" || it.key() == "time" || !it.value().is_object()) {
            continue;
        }
        flatten_object(it.value(), out.fields, false, FAULT_PREFIX);
    }
}

/// Environmental data is carried in "data" by every family
AeroError decode_environmental(const json& doc, DecodedMessage& out) {
    auto data = doc.find("data");
    if (data == doc.end() || !data->is_object()) {
        return AeroError::malformed_payload("environmental message without data");
    }
    for (auto it = data->begin(); it != data->end(); ++it) {
        out.environmental[it.key()] = json_value_to_string(it.value());
    }
    out.kind = MessageKind::Environmental;
    return {};
}

bool is_envelope_key(const std::string& key) {
    return key == "msg" || key == "time" || key == "mode-reason" || key == "state-reason";
}

} // namespace

const char* message_kind_name(MessageKind kind) {
    switch (kind) {
    case MessageKind::FullState:
        return "FullState";
    case MessageKind::Incremental:
        return "Incremental";
    case MessageKind::Environmental:
        return "Environmental";
    case MessageKind::Faults:
        return "Faults";
    case MessageKind::Ignored:
        return "Ignored";
    }
    return "Unknown";
}

DeviceCommand DeviceCommand::request_current_state() {
    return DeviceCommand{msg_types::REQUEST_CURRENT_STATE, json::object()};
}

DeviceCommand DeviceCommand::request_environment() {
    return DeviceCommand{msg_types::REQUEST_ENVIRONMENT, json::object()};
}

DeviceCommand DeviceCommand::set_state(const ProductState& values) {
    DeviceCommand cmd{msg_types::STATE_SET, json::object()};
    for (const auto& [key, value] : values) {
        cmd.data[key] = value;
    }
    return cmd;
}

std::string status_topic(const DeviceIdentity& identity) {
    return identity.mqtt_root_topic() + "/" + identity.serial() + "/status/current";
}

std::string faults_topic(const DeviceIdentity& identity) {
    return identity.mqtt_root_topic() + "/" + identity.serial() + "/status/faults";
}

std::string command_topic(const DeviceIdentity& identity) {
    return identity.mqtt_root_topic() + "/" + identity.serial() + "/command";
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

std::string encode_command(const DeviceCommand& cmd, std::chrono::system_clock::time_point now) {
    json payload = {{"msg", cmd.type},
                    {"time", format_utc_timestamp(now)},
                    {"mode-reason", MODE_REASON}};
    if (cmd.type == msg_types::STATE_SET || !cmd.data.empty()) {
        payload["data"] = cmd.data;
    }
    return payload.dump();
}

std::string json_value_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

AeroError decode_fan_message(const std::string& payload, DecodedMessage& out) {
    json doc;
    out = DecodedMessage{};
    if (auto err = parse_envelope(payload, doc, out.msg_type)) {
        return err;
    }

    if (out.msg_type == msg_types::CURRENT_STATE || out.msg_type == msg_types::STATE_CHANGE) {
        auto state = doc.find("product-state");
        if (state == doc.end() || !state->is_object()) {
            return AeroError::malformed_payload(out.msg_type + " without product-state");
        }
        bool incremental = out.msg_type == msg_types::STATE_CHANGE;
        flatten_object(*state, out.fields, incremental);
        out.kind = incremental ? MessageKind::Incremental : MessageKind::FullState;
        return {};
    }
    if (out.msg_type == msg_types::ENVIRONMENTAL_DATA) {
        return decode_environmental(doc, out);
    }
    if (out.msg_type == msg_types::CURRENT_FAULTS) {
        decode_faults(doc, out);
        out.kind = MessageKind::Faults;
        return {};
    }

    spdlog::trace("[MessageCodec] Ignoring fan message type {}", out.msg_type);
    out.kind = MessageKind::Ignored;
    return {};
}

AeroError decode_vacuum_message(const std::string& payload, DecodedMessage& out) {
    json doc;
    out = DecodedMessage{};
    if (auto err = parse_envelope(payload, doc, out.msg_type)) {
        return err;
    }

    if (out.msg_type == msg_types::CURRENT_STATE) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!is_envelope_key(it.key())) {
                out.fields[it.key()] = json_value_to_string(it.value());
            }
        }
        out.kind = MessageKind::FullState;
        return {};
    }
    if (out.msg_type == msg_types::STATE_CHANGE) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string& key = it.key();
            if (is_envelope_key(key) || key == "oldstate") {
                continue;
            }
            if (key == "newstate") {
                out.fields["state"] = json_value_to_string(it.value());
            } else {
                out.fields[key] = json_value_to_string(it.value());
            }
        }
        out.kind = MessageKind::Incremental;
        return {};
    }
    if (out.msg_type == msg_types::CURRENT_FAULTS) {
        decode_faults(doc, out);
        out.kind = MessageKind::Faults;
        return {};
    }

    spdlog::trace("[MessageCodec] Ignoring vacuum message type {}", out.msg_type);
    out.kind = MessageKind::Ignored;
    return {};
}

} // namespace aerolink
