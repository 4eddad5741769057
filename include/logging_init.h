// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace aerolink {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    // Console on a terminal; otherwise journal if available, else syslog
    Journal, // systemd journal (needs AEROLINK_HAS_SYSTEMD)
    Syslog,  // syslog(3)
    File,    // Rotating file, 5 MB x 3
    Console  // Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< File target path; empty = "aerolink.log" in the working dir

    /// Also log to stdout (skipped for journal/syslog unless stdout is a terminal)
    bool enable_console = true;
};

/**
 * @brief Build the default logger from the configured sinks
 *
 * Falls back to the console when the target sink cannot be opened. Also
 * enables a 32-message backtrace ring, dumped by dump_backtrace() on fatal
 * startup errors.
 */
void init(const LogConfig& config);

/// "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse "trace", "debug", "info", "warn", "error", "critical", "off"
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/**
 * @brief Level for a -v count (0 = warn, 1 = info, 2 = debug, 3+ = trace)
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace aerolink
