// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file discovery_coordinator.cpp
 * @brief Device registry merging manual, local and cloud observations
 *
 * @pattern Single writer; mutations queue connection calls and notifications
 *          under the registry lock and flush() runs them after release
 * @threading Mutations on the hub thread only; readers from any thread
 * @gotchas Connection stop() blocks until the worker is idle, so it must never
 *          run with the registry locked
 */

#include "discovery_coordinator.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace aerolink {

DiscoveryCoordinator::DiscoveryCoordinator(const FamilyRegistry& families,
                                           ConnectionFactory factory,
                                           ConnectionCallbacks callbacks)
    : families_(families), factory_(std::move(factory)), callbacks_(std::move(callbacks)) {}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    stop_all();
}

// ============================================================================
// Mutations
// ============================================================================

AeroError DiscoveryCoordinator::add_manual(IdentityPtr identity,
                                           std::optional<DeviceAddress> static_address) {
    if (!identity || identity->serial().empty()) {
        return AeroError::invalid_state("Manual device needs a serial");
    }
    const std::string serial = identity->serial();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it != entries_.end()) {
            Entry& entry = it->second;
            entry.manual = true;
            if (static_address) {
                apply_address(entry, *static_address, EndpointSource::Manual);
                entry.endpoint.static_address = true;
                entry.static_host = static_address;
                entry.static_unreachable = false;
            }
            if (*entry.endpoint.identity != *identity) {
                restart_with_identity(entry, identity);
            }
            refresh_degraded(entry);
            ensure_connection(entry);
            spdlog::info("[DiscoveryCoordinator] Manual entry {} merged into existing device",
                         serial);
        } else {
            Entry entry;
            entry.manual = true;
            entry.endpoint.identity = identity;
            entry.endpoint.source = EndpointSource::Manual;
            entry.endpoint.last_seen_at = Clock::now();
            if (static_address) {
                entry.endpoint.address = static_address;
                entry.endpoint.static_address = true;
                entry.static_host = static_address;
                auto pending = pending_.find(serial);
                if (pending != pending_.end()) {
                    entry.local_address = pending->second.address;
                }
            } else {
                // A local advertisement may already have said where it is
                auto pending = pending_.find(serial);
                if (pending != pending_.end() && pending->second.address) {
                    entry.endpoint.address = pending->second.address;
                    entry.endpoint.source = EndpointSource::LocalDiscovery;
                    entry.endpoint.last_seen_at = pending->second.seen_at;
                }
            }
            pending_.erase(serial);

            Entry& stored = entries_.emplace(serial, std::move(entry)).first->second;
            spdlog::info("[DiscoveryCoordinator] Added manual device {} ({}) at {}", serial,
                         identity->product_type(),
                         stored.endpoint.address ? stored.endpoint.address->to_string()
                                                 : "<awaiting discovery>");
            ensure_connection(stored);
        }
    }
    flush();
    return {};
}

void DiscoveryCoordinator::observe(const DeviceObservation& observation) {
    if (observation.serial.empty()) {
        spdlog::debug("[DiscoveryCoordinator] Ignoring {} observation without serial",
                      endpoint_source_name(observation.source));
        return;
    }

    // Fill identity gaps from the cloud directory before taking the lock
    DeviceObservation merged = observation;
    if ((merged.credential.empty() || merged.product_type.empty()) && cloud_lookup_) {
        if (auto info = cloud_lookup_(merged.serial)) {
            if (merged.credential.empty()) {
                merged.credential = info->credential;
            }
            if (merged.product_type.empty()) {
                merged.product_type = info->product_type;
            }
            if (merged.mqtt_root_topic.empty()) {
                merged.mqtt_root_topic = info->mqtt_root_topic;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(merged.serial);
        if (it != entries_.end()) {
            update_entry(it->second, merged);
        } else if (merged.credential.empty() &&
                   merged.source == EndpointSource::LocalDiscovery) {
            bool first = pending_.find(merged.serial) == pending_.end();
            pending_[merged.serial] = merged;
            if (first) {
                spdlog::info("[DiscoveryCoordinator] Device {} advertised at {} without a known "
                             "credential; holding as pending",
                             merged.serial,
                             merged.address ? merged.address->to_string() : "<no address>");
            }
        } else {
            std::optional<DeviceAddress> cloud_hint;
            if (merged.source == EndpointSource::CloudDiscovery) {
                cloud_hint = merged.address;
            }
            auto pending = pending_.find(merged.serial);
            if (pending != pending_.end()) {
                // The advertised local address wins over a cloud hint
                if (pending->second.address) {
                    merged.address = pending->second.address;
                    merged.source = EndpointSource::LocalDiscovery;
                    merged.seen_at = std::max(merged.seen_at, pending->second.seen_at);
                }
                if (merged.product_type.empty()) {
                    merged.product_type = pending->second.product_type;
                }
                pending_.erase(pending);
            }
            create_entry(merged, cloud_hint);
        }
    }
    flush();
}

bool DiscoveryCoordinator::remove(const std::string& serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(serial);
        auto it = entries_.find(serial);
        if (it == entries_.end()) {
            return false;
        }
        if (it->second.connection) {
            deferred_.stops.push_back(it->second.connection);
        }
        entries_.erase(it);
    }
    flush();
    spdlog::info("[DiscoveryCoordinator] Removed device {}", serial);
    return true;
}

AeroError DiscoveryCoordinator::replace_identity(IdentityPtr identity) {
    if (!identity) {
        return AeroError::invalid_state("No identity given");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(identity->serial());
        if (it == entries_.end()) {
            return AeroError::invalid_state("Unknown device " + identity->serial());
        }
        restart_with_identity(it->second, identity);
    }
    flush();
    spdlog::info("[DiscoveryCoordinator] Identity of {} replaced", identity->serial());
    return {};
}

void DiscoveryCoordinator::handle_connection_error(const std::string& serial,
                                                   const AeroError& error) {
    if (error.type != AeroErrorType::AuthRejected) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it == entries_.end() || it->second.auth_rejected) {
            return;
        }
        Entry& entry = it->second;
        entry.auth_rejected = true;
        if (entry.connection) {
            deferred_.fails.emplace_back(entry.connection, error);
        }
        raise(HubEventType::DeviceAuthRejected, serial,
              fmt::format("Device {} rejected its credential; re-enter it to reconnect", serial),
              true);
    }
    flush();
    spdlog::warn("[DiscoveryCoordinator] {} stopped after credential rejection", serial);
}

void DiscoveryCoordinator::handle_connection_state(const std::string& serial,
                                                   const ConnectionState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it == entries_.end() || !it->second.static_host) {
            return;
        }
        Entry& entry = it->second;
        if (state.is(ConnectionStateKind::Connected)) {
            if (entry.static_unreachable) {
                spdlog::info("[DiscoveryCoordinator] {} reachable at {}", serial,
                             entry.endpoint.address->to_string());
            }
            entry.static_unreachable = false;
            return;
        }
        // The supervisor restarts its attempt count on every address change
        if (!state.is(ConnectionStateKind::Reconnecting) ||
            state.attempt != STATIC_FALLBACK_ATTEMPTS) {
            return;
        }
        entry.static_unreachable = true;
        try_next_address(entry);
    }
    flush();
}

std::vector<std::string> DiscoveryCoordinator::set_cloud_degraded(bool degraded) {
    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cloud_degraded_ != degraded) {
            spdlog::info("[DiscoveryCoordinator] Cloud session {}",
                         degraded ? "lost; cloud-sourced devices degraded" : "available");
        }
        cloud_degraded_ = degraded;
        for (auto& [serial, entry] : entries_) {
            bool was = entry.degraded;
            refresh_degraded(entry);
            if (entry.degraded != was) {
                changed.push_back(serial);
            }
        }
    }
    flush();
    return changed;
}

void DiscoveryCoordinator::stop_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [serial, entry] : entries_) {
            (void)serial;
            if (entry.connection) {
                deferred_.stops.push_back(std::move(entry.connection));
                entry.connection.reset();
            }
        }
    }
    flush();
}

AeroError DiscoveryCoordinator::send(const std::string& serial, const DeviceCommand& command) {
    std::shared_ptr<IDeviceConnection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it != entries_.end()) {
            conn = it->second.connection;
        }
    }
    if (!conn) {
        return AeroError::not_connected(serial);
    }
    return conn->send(command);
}

void DiscoveryCoordinator::set_cloud_lookup(CloudLookup lookup) {
    cloud_lookup_ = std::move(lookup);
}

void DiscoveryCoordinator::set_event_callback(HubEventCallback cb) {
    event_cb_ = std::move(cb);
}

void DiscoveryCoordinator::set_degraded_callback(DegradedCallback cb) {
    degraded_cb_ = std::move(cb);
}

// ============================================================================
// Registry helpers (called with mutex_ held)
// ============================================================================

void DiscoveryCoordinator::create_entry(const DeviceObservation& observation,
                                        std::optional<DeviceAddress> cloud_hint) {
    Entry entry;
    entry.endpoint.identity = std::make_shared<const DeviceIdentity>(
        observation.serial, observation.product_type, observation.credential,
        observation.mqtt_root_topic);
    entry.endpoint.address = observation.address;
    entry.endpoint.source = observation.source;
    entry.endpoint.last_seen_at = observation.seen_at;
    entry.endpoint.cloud_address_hint = cloud_hint;

    Entry& stored = entries_.emplace(observation.serial, std::move(entry)).first->second;
    spdlog::info("[DiscoveryCoordinator] Registered {} ({}, {}) at {}", observation.serial,
                 observation.product_type.empty() ? "unknown type" : observation.product_type,
                 endpoint_source_name(observation.source),
                 observation.address ? observation.address->to_string() : "<no address>");

    if (!families_.is_known(observation.product_type)) {
        spdlog::warn("[DiscoveryCoordinator] Product type '{}' of {} is not recognised; using "
                     "generic handling",
                     observation.product_type, observation.serial);
    }

    refresh_degraded(stored);
    if (!stored.endpoint.address) {
        report_unresolved(stored);
        return;
    }
    ensure_connection(stored);
}

void DiscoveryCoordinator::update_entry(Entry& entry, const DeviceObservation& observation) {
    entry.endpoint.last_seen_at = std::max(entry.endpoint.last_seen_at, observation.seen_at);

    // The cloud directory is authoritative for credentials of discovered devices
    if (!entry.manual && !observation.credential.empty()) {
        const DeviceIdentity& current = *entry.endpoint.identity;
        auto next = std::make_shared<const DeviceIdentity>(
            current.serial(),
            observation.product_type.empty() ? current.product_type() : observation.product_type,
            observation.credential,
            observation.mqtt_root_topic.empty() ? current.mqtt_root_topic()
                                                : observation.mqtt_root_topic);
        if (*next != current) {
            spdlog::info("[DiscoveryCoordinator] Identity of {} changed; reconnecting",
                         current.serial());
            restart_with_identity(entry, next);
        }
    }

    if (observation.source == EndpointSource::CloudDiscovery) {
        if (observation.address) {
            entry.endpoint.cloud_address_hint = observation.address;
        }
        bool address_from_cloud =
            !entry.endpoint.address || entry.endpoint.source == EndpointSource::CloudDiscovery;
        if (entry.endpoint.static_address) {
            // Only a static host that has been given up on falls back to the hint
            if (observation.address && entry.static_unreachable && !entry.local_address &&
                entry.endpoint.address == entry.static_host) {
                try_next_address(entry);
            }
        } else if (observation.address && address_from_cloud) {
            apply_address(entry, *observation.address, EndpointSource::CloudDiscovery);
        } else if (!entry.endpoint.address) {
            report_unresolved(entry);
        }
    } else if (observation.address) {
        if (entry.endpoint.static_address) {
            entry.local_address = observation.address;
            if (entry.static_unreachable) {
                spdlog::info("[DiscoveryCoordinator] Static host of {} unreachable; trying "
                             "advertised address {}",
                             entry.endpoint.serial(), observation.address->to_string());
                apply_address(entry, *observation.address, EndpointSource::LocalDiscovery);
            } else {
                spdlog::trace("[DiscoveryCoordinator] {} has a static address; holding {} at {}",
                              entry.endpoint.serial(), endpoint_source_name(observation.source),
                              observation.address->to_string());
            }
        } else {
            apply_address(entry, *observation.address, observation.source);
        }
    }

    refresh_degraded(entry);
    ensure_connection(entry);
}

void DiscoveryCoordinator::apply_address(Entry& entry, const DeviceAddress& address,
                                         EndpointSource source) {
    entry.endpoint.source = source;
    entry.endpoint.cloud_only_unresolved = false;
    entry.unresolved_reported = false;
    if (entry.endpoint.address == address) {
        return;
    }

    spdlog::info("[DiscoveryCoordinator] {} now at {} ({}; was {})", entry.endpoint.serial(),
                 address.to_string(), endpoint_source_name(source),
                 entry.endpoint.address ? entry.endpoint.address->to_string() : "unknown");
    entry.endpoint.address = address;
    if (entry.connection) {
        deferred_.moves.emplace_back(entry.connection, address);
    }
}

void DiscoveryCoordinator::ensure_connection(Entry& entry) {
    if (entry.connection || entry.auth_rejected || !entry.endpoint.address) {
        return;
    }
    const DeviceIdentity& identity = *entry.endpoint.identity;
    if (!identity.has_credential()) {
        spdlog::debug("[DiscoveryCoordinator] {} has no credential yet; not connecting",
                      identity.serial());
        return;
    }

    const FamilyDescriptor& family = families_.resolve(identity.product_type());
    std::unique_ptr<IDeviceConnection> conn =
        factory_(entry.endpoint.identity, family, callbacks_);
    if (!conn) {
        LOG_ERROR_INTERNAL("[DiscoveryCoordinator] Connection factory returned nothing for {}",
                           identity.serial());
        return;
    }
    entry.connection = std::move(conn);
    deferred_.starts.emplace_back(entry.connection, entry.endpoint);
    spdlog::debug("[DiscoveryCoordinator] Starting {} connection to {} at {}",
                  family.display_name, identity.serial(), entry.endpoint.address->to_string());
}

void DiscoveryCoordinator::try_next_address(Entry& entry) {
    const std::pair<std::optional<DeviceAddress>, EndpointSource> candidates[] = {
        {entry.static_host, EndpointSource::Manual},
        {entry.local_address, EndpointSource::LocalDiscovery},
        {entry.endpoint.cloud_address_hint, EndpointSource::CloudDiscovery},
    };
    constexpr size_t count = sizeof(candidates) / sizeof(candidates[0]);

    size_t current = count - 1;
    for (size_t i = 0; i < count; ++i) {
        if (candidates[i].first && candidates[i].first == entry.endpoint.address) {
            current = i;
            break;
        }
    }

    for (size_t step = 1; step < count; ++step) {
        const auto& [address, source] = candidates[(current + step) % count];
        if (address && address != entry.endpoint.address) {
            spdlog::warn("[DiscoveryCoordinator] {} unreachable at {}; trying {} address {}",
                         entry.endpoint.serial(),
                         entry.endpoint.address ? entry.endpoint.address->to_string()
                                                : "unknown",
                         endpoint_source_name(source), address->to_string());
            apply_address(entry, *address, source);
            return;
        }
    }
    spdlog::debug("[DiscoveryCoordinator] {} has no other address to try",
                  entry.endpoint.serial());
}

void DiscoveryCoordinator::restart_with_identity(Entry& entry, IdentityPtr identity) {
    if (entry.connection) {
        deferred_.stops.push_back(std::move(entry.connection));
        entry.connection.reset();
    }
    entry.endpoint.identity = std::move(identity);
    entry.auth_rejected = false;
    ensure_connection(entry);
}

void DiscoveryCoordinator::report_unresolved(Entry& entry) {
    entry.endpoint.cloud_only_unresolved = true;
    if (entry.unresolved_reported) {
        return;
    }
    entry.unresolved_reported = true;
    const std::string& serial = entry.endpoint.serial();
    spdlog::warn("[DiscoveryCoordinator] {} is in the cloud account but no local address is "
                 "known",
                 serial);
    raise(HubEventType::CloudDeviceWithoutAddress, serial,
          fmt::format("Device {} has no known local address; add it manually with its IP", serial),
          false);
}

void DiscoveryCoordinator::refresh_degraded(Entry& entry) {
    bool degraded = cloud_degraded_ && is_cloud_dependent(entry);
    if (degraded == entry.degraded) {
        return;
    }
    entry.degraded = degraded;
    deferred_.degraded.emplace_back(entry.endpoint.serial(), degraded);
}

bool DiscoveryCoordinator::is_cloud_dependent(const Entry& entry) {
    return !entry.manual && entry.endpoint.source == EndpointSource::CloudDiscovery;
}

void DiscoveryCoordinator::raise(HubEventType type, const std::string& serial,
                                 const std::string& message, bool is_error) {
    deferred_.events.push_back(HubEvent{type, serial, message, is_error});
}

void DiscoveryCoordinator::flush() {
    Deferred ops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(ops, deferred_);
    }

    for (auto& conn : ops.stops) {
        conn->stop();
    }
    for (auto& [conn, reason] : ops.fails) {
        conn->fail(reason);
    }
    for (auto& [conn, endpoint] : ops.starts) {
        conn->start(endpoint);
    }
    for (auto& [conn, address] : ops.moves) {
        conn->update_address(address);
    }

    try {
        if (degraded_cb_) {
            for (const auto& [serial, degraded] : ops.degraded) {
                degraded_cb_(serial, degraded);
            }
        }
        if (event_cb_) {
            for (const auto& ev : ops.events) {
                event_cb_(ev);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[DiscoveryCoordinator] Observer threw: {}", e.what());
    }
}

// ============================================================================
// Readers
// ============================================================================

std::vector<DeviceEndpoint> DiscoveryCoordinator::endpoints() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceEndpoint> out;
    out.reserve(entries_.size());
    for (const auto& [serial, entry] : entries_) {
        (void)serial;
        out.push_back(entry.endpoint);
    }
    return out;
}

std::optional<DeviceEndpoint> DiscoveryCoordinator::endpoint(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(serial);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.endpoint;
}

std::vector<std::string> DiscoveryCoordinator::cloud_devices_without_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [serial, entry] : entries_) {
        if (entry.endpoint.cloud_only_unresolved) {
            out.push_back(serial);
        }
    }
    return out;
}

std::vector<std::string> DiscoveryCoordinator::pending_advertisements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [serial, obs] : pending_) {
        (void)obs;
        out.push_back(serial);
    }
    return out;
}

bool DiscoveryCoordinator::is_degraded(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(serial);
    return it != entries_.end() && it->second.degraded;
}

ConnectionState DiscoveryCoordinator::connection_state(const std::string& serial) const {
    std::shared_ptr<IDeviceConnection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(serial);
        if (it != entries_.end()) {
            conn = it->second.connection;
        }
    }
    return conn ? conn->state() : ConnectionState::disconnected();
}

std::string DiscoveryCoordinator::product_type(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(serial);
    return it == entries_.end() ? std::string() : it->second.endpoint.identity->product_type();
}

size_t DiscoveryCoordinator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace aerolink
