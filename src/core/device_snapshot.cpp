// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_snapshot.h"

namespace aerolink {

ReadingState environmental_reading_state(const std::string& value) {
    if (value == "OFF")
        return ReadingState::Off;
    if (value == "INIT")
        return ReadingState::Init;
    if (value == "FAIL")
        return ReadingState::Fail;
    return ReadingState::Value;
}

} // namespace aerolink
