// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_state.h"

namespace aerolink {

const char* connection_state_name(ConnectionStateKind kind) {
    switch (kind) {
    case ConnectionStateKind::Disconnected:
        return "Disconnected";
    case ConnectionStateKind::Connecting:
        return "Connecting";
    case ConnectionStateKind::Connected:
        return "Connected";
    case ConnectionStateKind::Reconnecting:
        return "Reconnecting";
    case ConnectionStateKind::Failed:
        return "Failed";
    }
    return "Unknown";
}

std::string ConnectionState::to_string() const {
    std::string out = connection_state_name(kind);
    if (kind == ConnectionStateKind::Reconnecting) {
        out += "(attempt " + std::to_string(attempt) + ")";
    } else if (kind == ConnectionStateKind::Failed) {
        out += "(" + reason.get_type_string() + ")";
    }
    return out;
}

} // namespace aerolink
