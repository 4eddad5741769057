// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_coordinator.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace aerolink {

const char* update_failure_name(UpdateFailureKind kind) {
    switch (kind) {
    case UpdateFailureKind::None:
        return "none";
    case UpdateFailureKind::UpdateFailed:
        return "update_failed";
    case UpdateFailureKind::ConfigEntryAuthFailed:
        return "config_entry_auth_failed";
    case UpdateFailureKind::PermanentDataError:
        return "permanent_data_error";
    }
    return "unknown";
}

UpdateFailureKind classify_update_failure(const AeroError& error) {
    switch (error.type) {
    case AeroErrorType::None:
        return UpdateFailureKind::None;
    case AeroErrorType::AuthRejected:
    case AeroErrorType::CloudAuthRequired:
    case AeroErrorType::ReauthRequired:
    case AeroErrorType::InvalidAuth:
        return UpdateFailureKind::ConfigEntryAuthFailed;
    case AeroErrorType::MalformedPayload:
        return UpdateFailureKind::PermanentDataError;
    default:
        return UpdateFailureKind::UpdateFailed;
    }
}

StateCoordinator::StateCoordinator(CommandSender sender, StatePollingSettings settings)
    : sender_(std::move(sender)), settings_(settings) {}

void StateCoordinator::track(const std::string& serial, const FamilyDescriptor& family) {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceRecord& record = devices_[serial];
    record.polls_environment = family.polls_environment;
    record.freshness_threshold = family.freshness_threshold;
    spdlog::debug("[StateCoordinator] Tracking {} ({}, polling {})", serial, family.display_name,
                  family.polls_environment ? "on" : "off");
}

void StateCoordinator::untrack(const std::string& serial) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.erase(serial);
}

void StateCoordinator::handle_snapshot(const std::string& serial, const DeviceSnapshot& snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceRecord& record = devices_[serial];
        record.snapshot = snapshot;
        record.snapshot->stale = false;
        if (!record.degraded && record.failure.kind != UpdateFailureKind::ConfigEntryAuthFailed) {
            record.failure = {};
        }
    }

    SnapshotCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = snapshot_cb_;
    }
    if (!cb) {
        return;
    }
    try {
        cb(serial, snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[StateCoordinator] Snapshot callback threw: {}", e.what());
    }
}

void StateCoordinator::handle_connection_state(const std::string& serial,
                                               const ConnectionState& state) {
    std::optional<HubEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceRecord& record = devices_[serial];
        record.state = state;
        switch (state.kind) {
        case ConnectionStateKind::Connected:
            // The supervisor requests everything on connect; next poll is one interval out
            record.next_poll_at.reset();
            if (record.failure.kind == UpdateFailureKind::UpdateFailed ||
                (record.failure.kind == UpdateFailureKind::ConfigEntryAuthFailed &&
                 !record.degraded)) {
                record.failure = {};
            }
            break;
        case ConnectionStateKind::Reconnecting:
            if (state.reason) {
                record.failure = {classify_update_failure(state.reason), state.reason};
            }
            break;
        case ConnectionStateKind::Failed:
            record.failure = {classify_update_failure(state.reason), state.reason};
            break;
        default:
            break;
        }
        event = availability_change(serial, record);
    }

    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = state_cb_;
    }
    if (cb) {
        try {
            cb(serial, state);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[StateCoordinator] State callback threw: {}", e.what());
        }
    }
    emit_event(event);
}

void StateCoordinator::handle_error(const std::string& serial, const AeroError& error) {
    if (!error) {
        return;
    }
    if (error.type == AeroErrorType::MalformedPayload) {
        spdlog::debug("[StateCoordinator] {}: skipping undecodable update", serial);
    }
    record_failure(serial, error);
}

void StateCoordinator::set_degraded(const std::string& serial, bool degraded) {
    std::optional<HubEvent> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeviceRecord& record = devices_[serial];
        if (record.degraded == degraded) {
            return;
        }
        record.degraded = degraded;
        if (degraded) {
            record.failure = {UpdateFailureKind::ConfigEntryAuthFailed,
                              AeroError::reauth_required(serial)};
        } else if (record.failure.kind == UpdateFailureKind::ConfigEntryAuthFailed &&
                   record.failure.error.type == AeroErrorType::ReauthRequired) {
            record.failure = {};
        }
        event = availability_change(serial, record);
    }
    spdlog::info("[StateCoordinator] {} {}", serial,
                 degraded ? "degraded until the cloud session is restored" : "no longer degraded");
    emit_event(event);
}

std::optional<DeviceSnapshot> StateCoordinator::current_snapshot(const std::string& serial,
                                                                 TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    if (it == devices_.end() || !it->second.snapshot) {
        return std::nullopt;
    }
    DeviceSnapshot copy = *it->second.snapshot;
    copy.stale = copy.is_stale_at(now, it->second.freshness_threshold);
    return copy;
}

ConnectionState StateCoordinator::connection_state(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    return it == devices_.end() ? ConnectionState::disconnected() : it->second.state;
}

bool StateCoordinator::is_available(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    return it != devices_.end() && it->second.state.is(ConnectionStateKind::Connected) &&
           !it->second.degraded;
}

UpdateFailure StateCoordinator::last_failure(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    return it == devices_.end() ? UpdateFailure{} : it->second.failure;
}

AeroError StateCoordinator::send_command(const std::string& serial, const DeviceCommand& command) {
    if (!sender_) {
        return AeroError::not_connected(serial);
    }
    AeroError err = sender_(serial, command);
    if (err) {
        spdlog::debug("[StateCoordinator] Command {} to {} failed: {}", command.type, serial,
                      err.message);
    }
    return err;
}

void StateCoordinator::tick(TimePoint now) {
    if (!settings_.enabled) {
        return;
    }

    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [serial, record] : devices_) {
            if (!record.polls_environment) {
                continue;
            }
            if (!record.next_poll_at) {
                record.next_poll_at = now + settings_.interval;
                continue;
            }
            if (now < *record.next_poll_at) {
                continue;
            }
            // Next attempt is one full interval out whatever this one returns
            record.next_poll_at = now + settings_.interval;
            due.push_back(serial);
        }
    }

    for (const auto& serial : due) {
        AeroError err = send_command(serial, DeviceCommand::request_current_state());
        if (!err) {
            err = send_command(serial, DeviceCommand::request_environment());
        }
        if (err) {
            if (err.type == AeroErrorType::NotConnected) {
                spdlog::debug("[StateCoordinator] Poll of {} skipped: not connected", serial);
            } else {
                spdlog::warn("[StateCoordinator] Poll of {} failed: {}", serial, err.message);
            }
            record_failure(serial, err);
        } else {
            spdlog::trace("[StateCoordinator] Polled {}", serial);
        }
    }
}

void StateCoordinator::record_failure(const std::string& serial, const AeroError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    if (it == devices_.end()) {
        return;
    }
    UpdateFailureKind kind = classify_update_failure(error);
    // An auth failure stays until the user acts; transient errors do not mask it
    if (it->second.failure.kind == UpdateFailureKind::ConfigEntryAuthFailed &&
        kind != UpdateFailureKind::ConfigEntryAuthFailed) {
        return;
    }
    it->second.failure = {kind, error};
}

std::optional<HubEvent> StateCoordinator::availability_change(const std::string& serial,
                                                              DeviceRecord& record) {
    bool available = record.state.is(ConnectionStateKind::Connected) && !record.degraded;
    if (available == record.announced_available) {
        return std::nullopt;
    }
    record.announced_available = available;
    if (available) {
        return HubEvent{HubEventType::DeviceAvailable, serial,
                        fmt::format("Device {} is available", serial), false};
    }
    std::string why = record.degraded ? "cloud session lost"
                      : record.state.reason ? record.state.reason.message
                                            : connection_state_name(record.state.kind);
    return HubEvent{HubEventType::DeviceUnavailable, serial,
                    fmt::format("Device {} is unavailable ({})", serial, why), false};
}

void StateCoordinator::emit_event(const std::optional<HubEvent>& event) {
    if (!event) {
        return;
    }
    HubEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = event_cb_;
    }
    if (!cb) {
        return;
    }
    try {
        cb(*event);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[StateCoordinator] Event callback threw: {}", e.what());
    }
}

void StateCoordinator::on_snapshot_changed(SnapshotCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    snapshot_cb_ = std::move(cb);
}

void StateCoordinator::on_connection_state_changed(StateCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_cb_ = std::move(cb);
}

void StateCoordinator::set_event_callback(HubEventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_cb_ = std::move(cb);
}

std::vector<std::string> StateCoordinator::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(devices_.size());
    for (const auto& [serial, record] : devices_) {
        (void)record;
        out.push_back(serial);
    }
    return out;
}

} // namespace aerolink
