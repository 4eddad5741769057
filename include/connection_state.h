// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "device_types.h"

#include <cstdint>
#include <string>

namespace aerolink {

/**
 * @brief Connection lifecycle states of one device
 */
enum class ConnectionStateKind {
    Disconnected, // Not connected, nothing pending
    Connecting,   // Transport connect in progress
    Connected,    // Connected and subscribed
    Reconnecting, // Waiting for the next retry (attempt, next_retry_at)
    Failed        // Given up on explicit request (reason)
};

/**
 * @brief Tagged connection state value
 *
 * attempt and next_retry_at are meaningful for Reconnecting, reason for Failed
 * and for the cause of a Reconnecting transition.
 */
struct ConnectionState {
    ConnectionStateKind kind = ConnectionStateKind::Disconnected;
    uint32_t attempt = 0;
    TimePoint next_retry_at{};
    AeroError reason;

    static ConnectionState disconnected() {
        return ConnectionState{};
    }
    static ConnectionState connecting() {
        ConnectionState s;
        s.kind = ConnectionStateKind::Connecting;
        return s;
    }
    static ConnectionState connected() {
        ConnectionState s;
        s.kind = ConnectionStateKind::Connected;
        return s;
    }
    static ConnectionState reconnecting(uint32_t attempt, TimePoint next_retry_at,
                                        AeroError cause) {
        ConnectionState s;
        s.kind = ConnectionStateKind::Reconnecting;
        s.attempt = attempt;
        s.next_retry_at = next_retry_at;
        s.reason = std::move(cause);
        return s;
    }
    static ConnectionState failed(AeroError reason) {
        ConnectionState s;
        s.kind = ConnectionStateKind::Failed;
        s.reason = std::move(reason);
        return s;
    }

    bool is(ConnectionStateKind k) const {
        return kind == k;
    }

    std::string to_string() const;
};

const char* connection_state_name(ConnectionStateKind kind);

} // namespace aerolink
