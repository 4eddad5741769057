// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "cloud_auth.h"
#include "config.h"
#include "device_hub.h"
#include "error_reporting.h"
#include "http_cloud_api.h"
#include "hub_settings.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>

#include "hv/hlog.h"

using namespace aerolink;

namespace {

std::atomic<bool> g_quit{false};

void handle_signal(int) {
    g_quit.store(true);
}

void init_logging(Config& config, const CliArgs& args) {
    logging::LogConfig log_config;

    // CLI verbosity takes precedence, then config file
    if (args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    } else {
        std::string level_str = config.get<std::string>("/log_level", "info");
        auto level = logging::parse_log_level(level_str);
        log_config.level = level ? *level : spdlog::level::info;
    }

    std::string target_str = args.log_target;
    if (target_str.empty()) {
        target_str = config.get<std::string>("/log_target", "auto");
    }
    log_config.target = logging::parse_log_target(target_str);

    log_config.file_path = args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = config.get<std::string>("/log_file", "");
    }

    logging::init(log_config);

    // libhv follows the config file only; its VERBOSE level is too noisy
    std::string hv_level_str = config.get<std::string>("/log_level", "warn");
    int hv_level = LOG_LEVEL_WARN;
    if (hv_level_str == "trace" || hv_level_str == "debug") {
        hv_level = LOG_LEVEL_DEBUG;
    } else if (hv_level_str == "info") {
        hv_level = LOG_LEVEL_INFO;
    }
    hlog_set_level(hv_level);
}

std::string prompt(const char* text) {
    printf("%s", text);
    fflush(stdout);
    std::string line;
    if (!std::getline(std::cin, line)) {
        return "";
    }
    return line;
}

/// Interactive OTP sign-in; persists the session on success
int run_login(Config& config, const HubSettings& settings, const std::string& identifier) {
    CloudApiSettings api_settings;
    api_settings.region = settings.cloud_auth.region;
    auto api = std::make_shared<HttpCloudApi>(api_settings);
    CloudAuthMachine auth(api, settings.cloud_auth);

    if (auto err = auth.begin()) {
        fprintf(stderr, "Error: %s\n", err.user_message().c_str());
        return 1;
    }
    if (auto err = auth.submit_identifier(identifier)) {
        if (err.type == AeroErrorType::RateLimited) {
            fprintf(stderr, "Error: too many attempts; wait %llds and try again\n",
                    static_cast<long long>(err.retry_after.count()));
        } else {
            fprintf(stderr, "Error: %s\n", err.user_message().c_str());
        }
        return 1;
    }

    constexpr int MAX_CODE_ATTEMPTS = 3;
    for (int attempt = 1; attempt <= MAX_CODE_ATTEMPTS; ++attempt) {
        std::string code = prompt("Enter the code you received: ");
        std::string password;
        if (auth.otp_requires_password()) {
            password = prompt("Account password: ");
        }
        if (code.empty()) {
            fprintf(stderr, "Error: no code entered\n");
            return 1;
        }

        AeroError err = auth.submit_otp(code, password);
        if (!err) {
            auto session = auth.session();
            config.set<std::string>("/cloud/identifier", identifier);
            config.set<std::string>("/cloud/region", settings.cloud_auth.region);
            if (!save_cloud_session(config, session)) {
                fprintf(stderr, "Error: signed in, but the session could not be saved\n");
                return 1;
            }
            printf("Signed in. Cloud discovery will use this session.\n");
            return 0;
        }
        if (err.type != AeroErrorType::InvalidOtp && err.type != AeroErrorType::InvalidAuth) {
            fprintf(stderr, "Error: %s\n", err.user_message().c_str());
            return 1;
        }
        fprintf(stderr, "%s\n", err.user_message().c_str());
    }
    fprintf(stderr, "Error: too many wrong codes\n");
    return 1;
}

void log_event(const HubEvent& event) {
    if (event.is_error) {
        NOTIFY_ERROR("{}", event.message);
    } else if (event.type == HubEventType::DeviceUnavailable ||
               event.type == HubEventType::CloudDeviceWithoutAddress) {
        NOTIFY_WARNING("{}", event.message);
    } else {
        spdlog::info("[Hub] {}", event.message);
    }
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_requested ? 0 : 1;
    }

    Config* config = Config::get_instance();
    config->init(args.config_path);
    init_logging(*config, args);

    spdlog::info("[Main] aerolink {} starting (config {})", AEROLINK_VERSION, config->get_path());

    set_alert_callback([](bool is_error, const std::string& message) {
        fprintf(stderr, "%s %s\n", is_error ? "[ALERT]" : "[NOTICE]", message.c_str());
    });

    HubSettings settings = load_hub_settings(*config);
    if (!args.region.empty()) {
        settings.cloud_auth.region = args.region;
    }
    settings.cloud_enabled = !args.no_cloud;

    if (!args.login_identifier.empty()) {
        return run_login(*config, settings, args.login_identifier);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    DeviceHub hub(*config, settings, DeviceHub::Dependencies{});
    hub.set_event_callback(log_event);
    hub.state().on_connection_state_changed(
        [](const std::string& serial, const ConnectionState& state) {
            spdlog::info("[Main] {}: {}", serial, state.to_string());
        });
    hub.state().on_snapshot_changed([](const std::string& serial, const DeviceSnapshot& snapshot) {
        spdlog::debug("[Main] {}: {} state fields, {} sensor readings", serial,
                      snapshot.product_state.size(), snapshot.environmental.size());
    });

    if (!hub.start()) {
        spdlog::critical("[Main] Hub failed to start");
        spdlog::dump_backtrace();
        return 1;
    }

    while (!g_quit.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Main] Shutdown requested");
    hub.stop();
    set_alert_callback(nullptr);
    return 0;
}
