// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file device_hub.cpp
 * @brief Composition root of the connectivity layer
 *
 * @threading Registry writes happen on the hub loop only; discovery sources
 *            and device workers post to it with runInLoop()
 * @gotchas Device workers are stopped after the hub loop has joined so no
 *          queued observation can start a new connection during teardown
 */

#include "device_hub.h"

#include "device_worker.h"
#include "error_reporting.h"
#include "http_cloud_api.h"
#include "mdns_device_discovery.h"

#include <spdlog/spdlog.h>

namespace aerolink {

namespace {
constexpr uint32_t STATE_TICK_MS = 1000;
} // namespace

DeviceHub::DeviceHub(Config& config, HubSettings settings, Dependencies deps)
    : config_(config), settings_(std::move(settings)),
      families_(FamilyRegistry::with_builtin_families()) {
    loop_thread_ = std::make_shared<hv::EventLoopThread>();

    state_ = std::make_unique<StateCoordinator>(
        [this](const std::string& serial, const DeviceCommand& command) {
            return discovery_->send(serial, command);
        },
        settings_.polling);
    state_->set_event_callback([this](const HubEvent& event) { emit(event); });

    ConnectionFactory inner = deps.connection_factory
                                  ? std::move(deps.connection_factory)
                                  : DeviceWorker::factory(settings_.connection,
                                                          settings_.tick_interval);
    ConnectionFactory tracked = [this, inner](IdentityPtr identity, const FamilyDescriptor& family,
                                              ConnectionCallbacks callbacks) {
        state_->track(identity->serial(), family);
        return inner(std::move(identity), family, std::move(callbacks));
    };

    ConnectionCallbacks callbacks;
    callbacks.on_snapshot = [this](const std::string& serial, const DeviceSnapshot& snapshot) {
        state_->handle_snapshot(serial, snapshot);
    };
    callbacks.on_state = [this](const std::string& serial, const ConnectionState& state) {
        state_->handle_connection_state(serial, state);
        post([this, serial, state]() { discovery_->handle_connection_state(serial, state); });
    };
    callbacks.on_error = [this](const std::string& serial, const AeroError& error) {
        state_->handle_error(serial, error);
        post([this, serial, error]() { discovery_->handle_connection_error(serial, error); });
    };

    discovery_ = std::make_unique<DiscoveryCoordinator>(families_, std::move(tracked),
                                                        std::move(callbacks));
    discovery_->set_event_callback([this](const HubEvent& event) { emit(event); });
    discovery_->set_degraded_callback(
        [this](const std::string& serial, bool degraded) { state_->set_degraded(serial, degraded); });

    if (deps.local_discovery) {
        local_ = std::move(deps.local_discovery);
    } else {
        local_ = std::make_unique<MdnsDeviceDiscovery>(families_.service_types());
    }

    if (settings_.cloud_enabled) {
        std::shared_ptr<ICloudApi> api = deps.cloud_api;
        if (!api) {
            CloudApiSettings api_settings;
            api_settings.region = settings_.cloud_auth.region;
            api = std::make_shared<HttpCloudApi>(api_settings);
        }
        cloud_ = std::make_unique<CloudDiscoverySource>(api, settings_.cloud_auth, settings_.cloud);
        wire_cloud();
    } else {
        spdlog::info("[DeviceHub] Cloud discovery disabled");
    }
}

DeviceHub::~DeviceHub() {
    stop();
}

void DeviceHub::wire_cloud() {
    discovery_->set_cloud_lookup(
        [this](const std::string& serial) { return cloud_->cloud_info(serial); });

    cloud_->on_auth_state_changed(
        [this](AuthState old_state, AuthState new_state) { handle_auth_state(old_state, new_state); });

    cloud_->auth().on_session_changed([this](const std::optional<CloudSession>& session) {
        post([this, session]() {
            if (!save_cloud_session(config_, session)) {
                LOG_WARN_INTERNAL("[DeviceHub] Cloud session not persisted");
            }
        });
    });

    cloud_->on_list_failed([this](const AeroError& error) {
        if (error.type != AeroErrorType::RateLimited) {
            return;
        }
        emit(HubEvent{HubEventType::CloudRateLimited, "",
                      fmt::format("Cloud service asked to wait {}s before the next request",
                                  error.retry_after.count()),
                      false});
    });
}

bool DeviceHub::start() {
    if (running_.load()) {
        return false;
    }

    loop_thread_->start(true);
    running_.store(true);
    spdlog::info("[DeviceHub] Starting ({} manual devices, polling {})", settings_.devices.size(),
                 settings_.polling.enabled ? "on" : "off");

    loop_thread_->loop()->runInLoop([this]() {
        loop_thread_->loop()->setInterval(STATE_TICK_MS,
                                          [this](hv::TimerID) { state_->tick(Clock::now()); });
    });

    post([this]() {
        for (const auto& device : settings_.devices) {
            if (auto err = discovery_->add_manual(device.identity, device.static_address)) {
                spdlog::warn("[DeviceHub] Manual device {} not added: {}", device.name,
                             err.message);
            }
        }
    });

    local_->start([this](const DeviceObservation& observation) {
        post([this, observation]() { discovery_->observe(observation); });
    });

    if (cloud_) {
        if (settings_.cloud_session) {
            if (auto err = cloud_->auth().restore_session(*settings_.cloud_session)) {
                spdlog::warn("[DeviceHub] Stored cloud session not restored: {}", err.message);
            }
        } else {
            spdlog::info("[DeviceHub] No cloud session; run with --login to use cloud discovery");
        }
        cloud_->start([this](const DeviceObservation& observation) {
            post([this, observation]() { discovery_->observe(observation); });
        });
    }
    return true;
}

void DeviceHub::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[DeviceHub] Stopping");

    local_->stop();
    if (cloud_) {
        cloud_->stop();
    }

    loop_thread_->stop();
    loop_thread_->join();

    // Hub loop is gone; this thread is now the only registry writer
    discovery_->stop_all();
    spdlog::info("[DeviceHub] Stopped");
}

void DeviceHub::post(std::function<void()> fn) {
    if (!running_.load() || !loop_thread_->loop()) {
        return;
    }
    loop_thread_->loop()->runInLoop([fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[DeviceHub] Hub task threw: {}", e.what());
        }
    });
}

void DeviceHub::remove_device(const std::string& serial) {
    post([this, serial]() {
        if (discovery_->remove(serial)) {
            state_->untrack(serial);
        }
    });
}

void DeviceHub::replace_identity(IdentityPtr identity) {
    post([this, identity]() {
        if (auto err = discovery_->replace_identity(identity)) {
            spdlog::warn("[DeviceHub] {}", err.message);
        }
    });
}

void DeviceHub::handle_auth_state(AuthState old_state, AuthState new_state) {
    spdlog::debug("[DeviceHub] Cloud auth {} -> {}", auth_state_name(old_state),
                  auth_state_name(new_state));

    switch (new_state) {
    case AuthState::ReauthRequired:
        post([this]() { discovery_->set_cloud_degraded(true); });
        emit(HubEvent{HubEventType::CloudReauthRequired, "",
                      "Cloud session expired; sign in again with --login", true});
        break;
    case AuthState::Anonymous:
        post([this]() { discovery_->set_cloud_degraded(true); });
        break;
    case AuthState::Authenticated:
        post([this]() { discovery_->set_cloud_degraded(false); });
        break;
    default:
        break;
    }
}

void DeviceHub::set_event_callback(HubEventCallback cb) {
    std::lock_guard<std::mutex> lock(event_mutex_);
    event_cb_ = std::move(cb);
}

void DeviceHub::emit(const HubEvent& event) {
    HubEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(event_mutex_);
        cb = event_cb_;
    }
    if (!cb) {
        spdlog::debug("[DeviceHub] {} {}: {}", hub_event_type_name(event.type), event.serial,
                      event.message);
        return;
    }
    try {
        cb(event);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[DeviceHub] Event callback threw: {}", e.what());
    }
}

} // namespace aerolink
