// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_types.h"

#include <chrono>
#include <map>
#include <string>

namespace aerolink {

/// Sensor readings keyed by firmware field name (e.g. "tact", "hact", "pm25")
using EnvironmentalData = std::map<std::string, std::string>;

/// Mode/settings fields keyed by firmware field name (e.g. "fpwr", "fnsp")
using ProductState = std::map<std::string, std::string>;

/**
 * @brief Last-known decoded state of one device
 *
 * Passed by value between threads; nobody holds a reference into live state.
 */
struct DeviceSnapshot {
    EnvironmentalData environmental;
    ProductState product_state;
    TimePoint captured_at{};
    bool stale = false;

    bool empty() const {
        return environmental.empty() && product_state.empty();
    }

    /**
     * @brief Check age against a freshness threshold
     */
    bool is_stale_at(TimePoint now, std::chrono::milliseconds threshold) const {
        return now - captured_at > threshold;
    }
};

/**
 * @brief Meaning of an environmental reading
 *
 * Firmware reports sentinel strings while a sensor is off, warming up or broken.
 */
enum class ReadingState { Value, Off, Init, Fail };

ReadingState environmental_reading_state(const std::string& value);

} // namespace aerolink
