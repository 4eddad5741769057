// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "aerolink_error.h"
#include "cloud_types.h"
#include "device_connection.h"
#include "device_family.h"
#include "device_types.h"
#include "hub_events.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aerolink {

/**
 * @brief Single source of truth for which devices exist and how to reach them
 *
 * Merges manual entries, local advertisements and cloud directory entries
 * into one registry keyed strictly by serial, and drives the lifecycle of one
 * IDeviceConnection per registered device.
 *
 * Merge policy:
 * - An observation with an address replaces a different address (and
 *   reconnects); the same address leaves a Connected connection alone.
 * - An observation without an address never erases a known address; the
 *   connection keeps retrying the last known address.
 * - Manual static addresses are tried first. Discovery replaces one only
 *   after STATIC_FALLBACK_ATTEMPTS failed connects in a row: the last local
 *   advertisement is tried next, then the cloud address hint, cycling back
 *   to the static host if those fail too. A Connected device keeps its
 *   address.
 * - Cloud entries without any address stay registered but unconnected and
 *   are reported once as CloudDeviceWithoutAddress.
 * - Local advertisements for unknown serials without a credential are held
 *   as pending until a manual entry or the cloud directory supplies one.
 *
 * Threading: every mutating method must be called from one thread (the hub
 * loop). Read accessors may be called from any thread and return copies.
 */
class DiscoveryCoordinator {
  public:
    using CloudLookup = std::function<std::optional<DeviceCloudInfo>(const std::string& serial)>;
    using DegradedCallback = std::function<void(const std::string& serial, bool degraded)>;

    /// Consecutive failed connects before a static address is given up on
    static constexpr uint32_t STATIC_FALLBACK_ATTEMPTS = 3;

    DiscoveryCoordinator(const FamilyRegistry& families, ConnectionFactory factory,
                         ConnectionCallbacks callbacks);
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    /**
     * @brief Register a user-entered device
     *
     * @param static_address Host override tried before any discovered address;
     *        nullopt to wait for discovery
     */
    AeroError add_manual(IdentityPtr identity, std::optional<DeviceAddress> static_address);

    /**
     * @brief Merge one discovery observation into the registry
     */
    void observe(const DeviceObservation& observation);

    /**
     * @brief Stop the device's connection and drop it from the registry
     *
     * @return false if the serial is not registered
     */
    bool remove(const std::string& serial);

    /**
     * @brief Swap in a new identity (e.g. re-entered credential) and reconnect
     */
    AeroError replace_identity(IdentityPtr identity);

    /**
     * @brief React to an error reported by a device connection
     *
     * AuthRejected fails the connection and raises DeviceAuthRejected; the
     * device is retried only after replace_identity().
     */
    void handle_connection_error(const std::string& serial, const AeroError& error);

    /**
     * @brief Track reachability of devices with a static address
     *
     * Moves an unreachable static device to its next known address.
     */
    void handle_connection_state(const std::string& serial, const ConnectionState& state);

    /**
     * @brief Mark cloud-dependent endpoints degraded (cloud session lost) or healthy
     *
     * @return Serials whose degraded flag changed
     */
    std::vector<std::string> set_cloud_degraded(bool degraded);

    /**
     * @brief Send a command through the device's connection
     *
     * Thread-safe. NotConnected for unknown serials and devices without a
     * connection.
     */
    AeroError send(const std::string& serial, const DeviceCommand& command);

    /**
     * @brief Stop every connection (registry entries stay)
     */
    void stop_all();

    void set_cloud_lookup(CloudLookup lookup);
    void set_event_callback(HubEventCallback cb);

    /// Fired on the owning thread whenever a device's degraded flag flips
    void set_degraded_callback(DegradedCallback cb);

    std::vector<DeviceEndpoint> endpoints() const;
    std::optional<DeviceEndpoint> endpoint(const std::string& serial) const;
    std::vector<std::string> cloud_devices_without_address() const;
    std::vector<std::string> pending_advertisements() const;

    /// Endpoint degraded because it depends on the (lost) cloud session
    bool is_degraded(const std::string& serial) const;

    /// Connection state, Disconnected for devices without a connection
    ConnectionState connection_state(const std::string& serial) const;

    /// Product type of a registered device (empty if unknown)
    std::string product_type(const std::string& serial) const;

    size_t size() const;

  private:
    struct Entry {
        DeviceEndpoint endpoint;
        std::shared_ptr<IDeviceConnection> connection;
        bool manual = false;
        bool auth_rejected = false;
        bool degraded = false;
        bool unresolved_reported = false;
        std::optional<DeviceAddress> static_host;
        std::optional<DeviceAddress> local_address;
        bool static_unreachable = false;
    };

    // Connection calls and notifications collected under the lock, run by flush()
    struct Deferred {
        std::vector<std::shared_ptr<IDeviceConnection>> stops;
        std::vector<std::pair<std::shared_ptr<IDeviceConnection>, AeroError>> fails;
        std::vector<std::pair<std::shared_ptr<IDeviceConnection>, DeviceEndpoint>> starts;
        std::vector<std::pair<std::shared_ptr<IDeviceConnection>, DeviceAddress>> moves;
        std::vector<std::pair<std::string, bool>> degraded;
        std::vector<HubEvent> events;
    };

    void create_entry(const DeviceObservation& observation,
                      std::optional<DeviceAddress> cloud_hint);
    void update_entry(Entry& entry, const DeviceObservation& observation);
    void apply_address(Entry& entry, const DeviceAddress& address, EndpointSource source);
    void ensure_connection(Entry& entry);
    void try_next_address(Entry& entry);
    void restart_with_identity(Entry& entry, IdentityPtr identity);
    void report_unresolved(Entry& entry);
    void refresh_degraded(Entry& entry);
    void raise(HubEventType type, const std::string& serial, const std::string& message,
               bool is_error);
    void flush();
    static bool is_cloud_dependent(const Entry& entry);

    const FamilyRegistry& families_;
    ConnectionFactory factory_;
    ConnectionCallbacks callbacks_;
    CloudLookup cloud_lookup_;
    HubEventCallback event_cb_;
    DegradedCallback degraded_cb_;

    // Written only by the owning thread; locked so readers can copy
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, DeviceObservation> pending_;
    bool cloud_degraded_ = false;
    Deferred deferred_;
};

} // namespace aerolink
