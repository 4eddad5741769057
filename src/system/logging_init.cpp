// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#ifdef AEROLINK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace aerolink {
namespace logging {

namespace {

constexpr const char* IDENT = "aerolink";
constexpr size_t ROTATE_SIZE = 5 * 1024 * 1024;
constexpr size_t ROTATE_FILES = 3;
constexpr size_t BACKTRACE_MESSAGES = 32;

bool journal_available() {
#if defined(__linux__) && defined(AEROLINK_HAS_SYSTEMD)
    std::error_code ec;
    return std::filesystem::exists("/run/systemd/journal/socket", ec);
#else
    return false;
#endif
}

/// Auto: an interactive terminal gets the console only, a service gets the system log
LogTarget resolve_target(LogTarget requested) {
    if (requested != LogTarget::Auto) {
        return requested;
    }
    if (isatty(STDOUT_FILENO)) {
        return LogTarget::Console;
    }
#ifdef __linux__
    return journal_available() ? LogTarget::Journal : LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

std::string log_file_path(const std::string& configured) {
    std::string path = configured.empty() ? std::string(IDENT) + ".log" : configured;
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }
    return path;
}

/**
 * @brief Sink for a non-console target
 *
 * @return nullptr for Console; throws spdlog_ex if the sink cannot be opened
 */
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file_path(file_path),
                                                                      ROTATE_SIZE, ROTATE_FILES);
#ifdef __linux__
    case LogTarget::Journal:
#ifdef AEROLINK_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(IDENT);
#endif
        // Built without journal support: syslog reaches the journal anyway
        [[fallthrough]];
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_DAEMON,
                                                               false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    LogTarget target = resolve_target(config.target);
    std::vector<spdlog::sink_ptr> sinks;
    std::string sink_error;

    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(sink);
        }
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
        target = LogTarget::Console;
    }

    // A service logging to the journal would see every line twice
    bool console = config.enable_console &&
                   (target == LogTarget::Console || target == LogTarget::File ||
                    isatty(STDOUT_FILENO));
    if (console || sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::enable_backtrace(BACKTRACE_MESSAGES);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] {} output unavailable ({}), logging to console",
                     log_target_name(config.target), sink_error);
    }
    spdlog::debug("[Logging] target={} console={} level={}", log_target_name(target),
                  sinks.size() > 1 || target == LogTarget::Console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

} // namespace logging
} // namespace aerolink
