// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "error_reporting.h"

#include <mutex>

namespace aerolink {

namespace {
std::mutex g_alert_mutex;
AlertCallback g_alert_cb;
} // namespace

void set_alert_callback(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(g_alert_mutex);
    g_alert_cb = std::move(cb);
}

void raise_alert(bool is_error, const std::string& message) {
    AlertCallback cb;
    {
        std::lock_guard<std::mutex> lock(g_alert_mutex);
        cb = g_alert_cb;
    }
    if (!cb) {
        return;
    }
    try {
        cb(is_error, message);
    } catch (const std::exception& e) {
        spdlog::error("[ErrorReporting] Alert sink threw: {}", e.what());
    }
}

} // namespace aerolink
