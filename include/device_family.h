// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "message_codec.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace aerolink {

enum class DeviceFamily { PurifierFan, HotCoolFan, HumidifierFan, LinkFan, RobotVacuum, Unknown };

const char* device_family_name(DeviceFamily family);

/**
 * @brief Capability bits carried by a family descriptor
 */
enum Capability : uint32_t {
    CAP_NONE = 0,
    CAP_FAN = 1u << 0,
    CAP_HEATING = 1u << 1,
    CAP_HUMIDIFICATION = 1u << 2,
    CAP_ENVIRONMENTAL = 1u << 3,
    CAP_CLEANING = 1u << 4,
};

/// mDNS service types advertised by the appliances
constexpr const char* FAN_SERVICE_TYPE = "_dyson_mqtt._tcp.local";
constexpr const char* VACUUM_SERVICE_TYPE = "_360eye_mqtt._tcp.local";

using MessageDecoder = std::function<AeroError(const std::string&, DecodedMessage&)>;

/**
 * @brief Everything the connectivity layer needs to know about a device family
 *
 * Families are values registered in a FamilyRegistry; adding one never
 * requires subclassing.
 */
struct FamilyDescriptor {
    DeviceFamily family = DeviceFamily::Unknown;
    std::string display_name;
    uint32_t capabilities = CAP_NONE;

    /// Firmware does not push sensor data unsolicited; request it periodically
    bool polls_environment = false;

    /// Snapshot older than this is reported stale
    std::chrono::milliseconds freshness_threshold{std::chrono::seconds(120)};

    std::string service_type = FAN_SERVICE_TYPE;
    MessageDecoder decoder;

    bool has_capability(Capability cap) const {
        return (capabilities & cap) != 0;
    }
};

/**
 * @brief Product type code -> family descriptor table
 *
 * Regional variants ("438K", "527E", "358M") resolve to their base code.
 * Unregistered types resolve to a generic fan descriptor.
 *
 * Thread safety: registration is not synchronised; register everything
 * before the registry is shared.
 */
class FamilyRegistry {
  public:
    FamilyRegistry();

    /**
     * @brief Registry pre-populated with the known appliance families
     */
    static FamilyRegistry with_builtin_families();

    void register_family(const std::string& product_type, FamilyDescriptor descriptor);

    /**
     * @brief Look up a product type
     * @return Descriptor, or nullptr if neither the type nor its base is registered
     */
    const FamilyDescriptor* find(const std::string& product_type) const;

    /**
     * @brief Look up a product type, falling back to the generic descriptor
     */
    const FamilyDescriptor& resolve(const std::string& product_type) const;

    bool is_known(const std::string& product_type) const {
        return find(product_type) != nullptr;
    }

    /**
     * @brief Strip a regional variant suffix when the base code is registered
     */
    std::string base_product_type(const std::string& product_type) const;

    /**
     * @brief Distinct mDNS service types of all registered families
     */
    std::vector<std::string> service_types() const;

    /**
     * @brief Product types registered for a service type
     */
    std::vector<std::string> product_types_for_service(const std::string& service_type) const;

    size_t size() const {
        return families_.size();
    }

  private:
    std::map<std::string, FamilyDescriptor> families_;
    FamilyDescriptor generic_;
};

} // namespace aerolink
