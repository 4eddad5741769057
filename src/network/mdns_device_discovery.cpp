// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file mdns_device_discovery.cpp
 * @brief mDNS discovery of appliance MQTT brokers on the local network
 *
 * @pattern PIMPL with background thread for network I/O
 * @threading Queries run on a background thread; callbacks fire on it
 * @gotchas Socket may fail on systems without network; handle gracefully.
 *          Instance names carry the serial, hostnames do not.
 */

#define MDNS_IMPLEMENTATION
#include "mdns_device_discovery.h"

#include "error_reporting.h"

#include "mdns/mdns.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>

namespace aerolink {

namespace {

// Buffer size for mDNS operations (must be 32-bit aligned)
constexpr size_t MDNS_BUFFER_SIZE = 2048;

// Timeout for socket receive operations (milliseconds)
constexpr int SOCKET_TIMEOUT_MS = 500;

// Window for collecting responses to one query
constexpr auto RECEIVE_WINDOW = std::chrono::milliseconds(500);

/**
 * @brief Convert IPv4 sockaddr to string
 */
std::string sockaddr_to_string(const struct sockaddr_in* addr) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
        return std::string(buf);
    }
    return "";
}

} // namespace

/**
 * @brief Partial service record assembled from PTR -> SRV -> A answers
 */
struct ServiceRecord {
    std::string instance_name; ///< Full instance name from PTR record
    std::string hostname;      ///< Target host from SRV record
    uint16_t port = 0;         ///< Port from SRV record
    std::string ip_address;    ///< IPv4 address from A record
    bool seen_this_round = false;

    bool is_complete() const {
        return !hostname.empty() && port > 0 && !ip_address.empty();
    }
};

class MdnsDeviceDiscovery::Impl {
  public:
    Impl(std::vector<std::string> service_types, std::chrono::milliseconds query_interval)
        : service_types_(std::move(service_types)), query_interval_(query_interval) {}

    ~Impl() {
        stop();
    }

    void start(AdvertisementCallback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback_ = std::move(callback);
            if (running_.load()) {
                return;
            }
        }

        // Previous thread may have exited on its own (socket failure)
        if (thread_.joinable()) {
            thread_.join();
        }

        running_.store(true);
        thread_ = std::thread(&Impl::discovery_loop, this);
        spdlog::info("[MdnsDeviceDiscovery] Started discovery for {} service types",
                     service_types_.size());
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback_ = nullptr;
            if (!running_.load() && !thread_.joinable()) {
                return;
            }
            running_.store(false);
        }

        // Wake up thread if it's sleeping
        stop_cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }

        spdlog::info("[MdnsDeviceDiscovery] Stopped discovery");
    }

    bool is_running() const {
        return running_.load();
    }

  private:
    void discovery_loop() {
        spdlog::debug("[MdnsDeviceDiscovery] Discovery thread started");

        int sock = mdns_socket_open_ipv4(nullptr);
        if (sock < 0) {
            spdlog::warn(
                "[MdnsDeviceDiscovery] Failed to open mDNS socket - network may be unavailable");
            running_.store(false);
            return;
        }

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = SOCKET_TIMEOUT_MS * 1000;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        alignas(4) uint8_t buffer[MDNS_BUFFER_SIZE];

        while (running_.load()) {
            for (const auto& service : service_types_) {
                if (!running_.load()) {
                    break;
                }
                query_service(sock, service, buffer, sizeof(buffer));
            }

            emit_complete_records();

            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, query_interval_, [this]() { return !running_.load(); });
        }

        mdns_socket_close(sock);
        spdlog::debug("[MdnsDeviceDiscovery] Discovery thread exiting");
    }

    void query_service(int sock, const std::string& service, uint8_t* buffer, size_t capacity) {
        int query_id = mdns_query_send(sock, MDNS_RECORDTYPE_PTR, service.c_str(), service.size(),
                                       buffer, capacity, 0);
        if (query_id < 0) {
            spdlog::debug("[MdnsDeviceDiscovery] Failed to send query for {}", service);
            return;
        }
        spdlog::trace("[MdnsDeviceDiscovery] Sent PTR query for {}", service);

        auto recv_deadline = std::chrono::steady_clock::now() + RECEIVE_WINDOW;
        while (std::chrono::steady_clock::now() < recv_deadline && running_.load()) {
            size_t records =
                mdns_query_recv(sock, buffer, capacity, record_callback, this, query_id);
            if (records == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }
    }

    static int record_callback(int sock, const struct sockaddr* from, size_t addrlen,
                               mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                               uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                               size_t name_offset, size_t name_length, size_t record_offset,
                               size_t record_length, void* user_data) {
        (void)sock;
        (void)from;
        (void)addrlen;
        (void)entry;
        (void)query_id;
        (void)rclass;
        (void)ttl;
        (void)name_length;

        auto* self = static_cast<Impl*>(user_data);
        if (!self || !self->running_.load()) {
            return 1;
        }

        char namebuf[256];
        char entrybuf[256];
        mdns_string_t name_str =
            mdns_string_extract(data, size, &name_offset, namebuf, sizeof(namebuf));
        std::string record_name(name_str.str, name_str.length);

        switch (rtype) {
        case MDNS_RECORDTYPE_PTR: {
            mdns_string_t ptr_str = mdns_record_parse_ptr(data, size, record_offset, record_length,
                                                          entrybuf, sizeof(entrybuf));
            if (ptr_str.length > 0) {
                std::string instance_name(ptr_str.str, ptr_str.length);
                spdlog::trace("[MdnsDeviceDiscovery] PTR: {} -> {}", record_name, instance_name);

                std::lock_guard<std::mutex> lock(self->records_mutex_);
                auto& record = self->pending_records_[instance_name];
                record.instance_name = instance_name;
                record.seen_this_round = true;
            }
            break;
        }

        case MDNS_RECORDTYPE_SRV: {
            mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
                                                          entrybuf, sizeof(entrybuf));
            if (srv.name.length > 0 && srv.port > 0) {
                std::string hostname(srv.name.str, srv.name.length);
                spdlog::trace("[MdnsDeviceDiscovery] SRV: {} -> {}:{}", record_name, hostname,
                              srv.port);

                std::lock_guard<std::mutex> lock(self->records_mutex_);
                auto& record = self->pending_records_[record_name];
                record.instance_name = record_name;
                record.hostname = hostname;
                record.port = srv.port;
                record.seen_this_round = true;
            }
            break;
        }

        case MDNS_RECORDTYPE_A: {
            struct sockaddr_in addr;
            mdns_record_parse_a(data, size, record_offset, record_length, &addr);
            std::string ip = sockaddr_to_string(&addr);
            if (!ip.empty()) {
                spdlog::trace("[MdnsDeviceDiscovery] A: {} -> {}", record_name, ip);
                std::lock_guard<std::mutex> lock(self->records_mutex_);
                self->address_cache_[record_name] = ip;
            }
            break;
        }

        default:
            break;
        }

        return 0;
    }

    void emit_complete_records() {
        std::vector<DeviceObservation> observations;
        auto now = Clock::now();

        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            for (auto& [name, record] : pending_records_) {
                if (!record.seen_this_round) {
                    continue;
                }
                record.seen_this_round = false;

                // A record may have arrived before or after the SRV record
                if (!record.hostname.empty()) {
                    auto it = address_cache_.find(record.hostname);
                    if (it != address_cache_.end()) {
                        record.ip_address = it->second;
                    }
                }
                if (!record.is_complete()) {
                    continue;
                }

                auto parsed = parse_instance_name(name);
                if (!parsed) {
                    spdlog::debug("[MdnsDeviceDiscovery] Ignoring unparseable instance {}", name);
                    continue;
                }

                DeviceObservation obs;
                obs.product_type = parsed->first;
                obs.serial = parsed->second;
                obs.address = DeviceAddress{record.ip_address, record.port};
                obs.source = EndpointSource::LocalDiscovery;
                obs.seen_at = now;
                observations.push_back(std::move(obs));
            }
        }

        if (observations.empty()) {
            return;
        }

        AdvertisementCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (!callback) {
            return;
        }

        for (const auto& obs : observations) {
            spdlog::debug("[MdnsDeviceDiscovery] {} ({}) at {}", obs.serial,
                          obs.product_type.empty() ? "?" : obs.product_type,
                          obs.address->to_string());
            try {
                callback(obs);
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[MdnsDeviceDiscovery] Advertisement callback threw: {}",
                                   e.what());
            }
        }
    }

    const std::vector<std::string> service_types_;
    const std::chrono::milliseconds query_interval_;

    // Thread management
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Synchronization for stop
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    // Protected by mutex_
    mutable std::mutex mutex_;
    AdvertisementCallback callback_;

    // Protected by records_mutex_ (separate lock for record collection)
    std::mutex records_mutex_;
    std::map<std::string, ServiceRecord> pending_records_;
    std::map<std::string, std::string> address_cache_; // hostname -> IP
};

MdnsDeviceDiscovery::MdnsDeviceDiscovery(std::vector<std::string> service_types,
                                         std::chrono::milliseconds query_interval)
    : impl_(std::make_unique<Impl>(std::move(service_types), query_interval)) {}

MdnsDeviceDiscovery::~MdnsDeviceDiscovery() = default;

void MdnsDeviceDiscovery::start(AdvertisementCallback on_advertisement) {
    impl_->start(std::move(on_advertisement));
}

void MdnsDeviceDiscovery::stop() {
    impl_->stop();
}

bool MdnsDeviceDiscovery::is_running() const {
    return impl_->is_running();
}

} // namespace aerolink
