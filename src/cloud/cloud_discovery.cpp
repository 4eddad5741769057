// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file cloud_discovery.cpp
 * @brief Periodic cloud device directory listing
 *
 * @pattern Background thread with condition-variable sleep (as mDNS discovery)
 * @threading poll_once() runs on the polling thread; login calls on the auth
 *            machine may come from any thread and wake the poller
 */

#include "cloud_discovery.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace aerolink {

namespace {
// Retry delay after a failed listing (bounded by the poll interval)
constexpr auto FAILURE_RETRY = std::chrono::seconds(300);
} // namespace

std::chrono::seconds clamp_poll_interval(std::chrono::seconds requested) {
    return std::clamp(requested, CloudDiscoverySettings::MIN_POLL_INTERVAL,
                      CloudDiscoverySettings::MAX_POLL_INTERVAL);
}

CloudDiscoverySource::CloudDiscoverySource(std::shared_ptr<ICloudApi> api,
                                           CloudAuthSettings auth_settings,
                                           CloudDiscoverySettings settings,
                                           CloudAuthMachine::NowFn now)
    : api_(api), settings_(settings), auth_(api, std::move(auth_settings), std::move(now)) {
    auto clamped = clamp_poll_interval(settings_.poll_interval);
    if (clamped != settings_.poll_interval) {
        spdlog::warn("[CloudDiscovery] Poll interval {}s out of range, using {}s",
                     settings_.poll_interval.count(), clamped.count());
        settings_.poll_interval = clamped;
    }
    auth_.on_state_changed(
        [this](AuthState old_state, AuthState new_state) { handle_auth_state(old_state, new_state); });
}

CloudDiscoverySource::~CloudDiscoverySource() {
    stop();
    auth_.on_state_changed(nullptr);
}

void CloudDiscoverySource::start(ObservationCallback on_observation) {
    set_observation_callback(std::move(on_observation));
    if (running_.load()) {
        return;
    }
    running_.store(true);
    thread_ = std::thread(&CloudDiscoverySource::poll_loop, this);
    spdlog::info("[CloudDiscovery] Started (interval {}s, auto discovery {})",
                 settings_.poll_interval.count(), settings_.auto_discovery ? "on" : "off");
}

void CloudDiscoverySource::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wake();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("[CloudDiscovery] Stopped");
}

void CloudDiscoverySource::wake() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_requested_ = true;
    }
    wake_cv_.notify_all();
}

void CloudDiscoverySource::poll_loop() {
    spdlog::debug("[CloudDiscovery] Poll thread started");
    while (running_.load()) {
        AeroError err = poll_once(WallClock::now());
        if (err) {
            spdlog::debug("[CloudDiscovery] Poll failed: {}", err.message);
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, settings_.tick_period,
                          [this]() { return wake_requested_ || !running_.load(); });
        wake_requested_ = false;
    }
    spdlog::debug("[CloudDiscovery] Poll thread exiting");
}

void CloudDiscoverySource::handle_auth_state(AuthState old_state, AuthState new_state) {
    bool had_session = old_state == AuthState::Authenticated ||
                       old_state == AuthState::TokenExpiring ||
                       old_state == AuthState::Refreshing;
    if (new_state == AuthState::Authenticated && !had_session) {
        // Fresh login or restored session: list right away
        request_refresh();
    }

    CloudAuthMachine::StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = auth_state_cb_;
    }
    if (cb) {
        cb(old_state, new_state);
    }
}

void CloudDiscoverySource::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next_list_at_.reset();
    }
    wake();
}

AeroError CloudDiscoverySource::poll_once(WallTime now) {
    auth_.tick(now);

    if (!auth_.has_session()) {
        return {};
    }
    auto session = auth_.session();
    if (!session) {
        return {};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (next_list_at_ && now < *next_list_at_) {
            return {};
        }
    }

    std::vector<DeviceCloudInfo> devices;
    AeroError err = api_->list_devices(*session, devices);
    if (err) {
        WallTime retry_at;
        if (err.type == AeroErrorType::InvalidAuth || err.type == AeroErrorType::ReauthRequired) {
            auth_.invalidate_session(err);
            retry_at = now + settings_.poll_interval;
        } else if (err.type == AeroErrorType::RateLimited) {
            retry_at = now + std::max(err.retry_after, std::chrono::seconds(1));
        } else {
            retry_at = now + std::min<std::chrono::seconds>(settings_.poll_interval, FAILURE_RETRY);
        }
        spdlog::warn("[CloudDiscovery] Device listing failed: {} ({})", err.message,
                     err.get_type_string());
        ErrorCallback error_cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            next_list_at_ = retry_at;
            error_cb = error_cb_;
        }
        if (error_cb) {
            try {
                error_cb(err);
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[CloudDiscovery] Error observer threw: {}", e.what());
            }
        }
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        directory_.clear();
        for (const auto& d : devices) {
            directory_[d.serial] = d;
        }
        next_list_at_ = now + settings_.poll_interval;
    }
    spdlog::info("[CloudDiscovery] Directory lists {} devices", devices.size());

    emit(devices);
    return {};
}

void CloudDiscoverySource::emit(const std::vector<DeviceCloudInfo>& devices) {
    ObservationCallback observation_cb;
    DirectoryCallback directory_cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observation_cb = observation_cb_;
        directory_cb = directory_cb_;
    }

    try {
        if (directory_cb) {
            directory_cb(devices);
        }
        if (!settings_.auto_discovery || !observation_cb) {
            return;
        }
        TimePoint seen = Clock::now();
        for (const auto& d : devices) {
            observation_cb(d.to_observation(seen));
        }
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[CloudDiscovery] Observer threw: {}", e.what());
    }
}

std::optional<DeviceCloudInfo> CloudDiscoverySource::cloud_info(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = directory_.find(serial);
    if (it == directory_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeviceCloudInfo> CloudDiscoverySource::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceCloudInfo> out;
    out.reserve(directory_.size());
    for (const auto& [serial, info] : directory_) {
        (void)serial;
        out.push_back(info);
    }
    return out;
}

void CloudDiscoverySource::set_observation_callback(ObservationCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    observation_cb_ = std::move(cb);
}

void CloudDiscoverySource::on_directory_updated(DirectoryCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    directory_cb_ = std::move(cb);
}

void CloudDiscoverySource::on_list_failed(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_cb_ = std::move(cb);
}

void CloudDiscoverySource::on_auth_state_changed(CloudAuthMachine::StateCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_state_cb_ = std::move(cb);
}

} // namespace aerolink
