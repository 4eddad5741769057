// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <string>

/**
 * @file error_reporting.h
 * @brief Convenience macros for error reporting with user-visible alerts
 *
 * These macros combine spdlog logging with the hub's alert sink, which the
 * executable routes to the console and the feature layer can route anywhere.
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (logged but not shown to user)
 * LOG_ERROR_INTERNAL("Failed to decode payload from {}", serial);
 *
 * // User-facing error (logged + alert)
 * NOTIFY_ERROR("Could not save configuration");
 *
 * // User-facing warning (logged + alert)
 * NOTIFY_WARNING("Device {} is unavailable", serial);
 * ```
 */

namespace aerolink {

/// Receives user-facing alerts (is_error, message)
using AlertCallback = std::function<void(bool, const std::string&)>;

/**
 * @brief Install the alert sink (nullptr to remove)
 *
 * Thread-safe. Alerts raised with no sink installed are only logged.
 */
void set_alert_callback(AlertCallback cb);

/**
 * @brief Deliver an alert to the installed sink
 *
 * Exceptions thrown by the sink are logged and swallowed.
 */
void raise_alert(bool is_error, const std::string& message);

} // namespace aerolink

// ============================================================================
// Internal Errors (Log Only)
// ============================================================================

/**
 * @brief Log internal error (not shown to user)
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning (not shown to user)
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

// ============================================================================
// User-Facing Errors (Log + Alert)
// ============================================================================

#define NOTIFY_ERROR(msg, ...)                                                                     \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::error("[USER] {}", formatted_msg);                                                 \
        aerolink::raise_alert(true, formatted_msg);                                                \
    } while (0)

#define NOTIFY_WARNING(msg, ...)                                                                   \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::warn("[USER] {}", formatted_msg);                                                  \
        aerolink::raise_alert(false, formatted_msg);                                               \
    } while (0)
