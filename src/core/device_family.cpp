// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_family.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace aerolink {

namespace {

constexpr auto FAN_FRESHNESS = std::chrono::seconds(120);
constexpr auto VACUUM_FRESHNESS = std::chrono::seconds(600);

// Regional variant suffixes appended to the base product code
constexpr const char* VARIANT_SUFFIXES = "KEM";

FamilyDescriptor make_fan(DeviceFamily family, const char* name, uint32_t caps) {
    FamilyDescriptor d;
    d.family = family;
    d.display_name = name;
    d.capabilities = CAP_FAN | CAP_ENVIRONMENTAL | caps;
    d.polls_environment = true;
    d.freshness_threshold = FAN_FRESHNESS;
    d.service_type = FAN_SERVICE_TYPE;
    d.decoder = decode_fan_message;
    return d;
}

FamilyDescriptor make_vacuum() {
    FamilyDescriptor d;
    d.family = DeviceFamily::RobotVacuum;
    d.display_name = "Robot Vacuum";
    d.capabilities = CAP_CLEANING;
    d.polls_environment = false;
    d.freshness_threshold = VACUUM_FRESHNESS;
    d.service_type = VACUUM_SERVICE_TYPE;
    d.decoder = decode_vacuum_message;
    return d;
}

} // namespace

const char* device_family_name(DeviceFamily family) {
    switch (family) {
    case DeviceFamily::PurifierFan:
        return "PurifierFan";
    case DeviceFamily::HotCoolFan:
        return "HotCoolFan";
    case DeviceFamily::HumidifierFan:
        return "HumidifierFan";
    case DeviceFamily::LinkFan:
        return "LinkFan";
    case DeviceFamily::RobotVacuum:
        return "RobotVacuum";
    case DeviceFamily::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

FamilyRegistry::FamilyRegistry() {
    generic_ = make_fan(DeviceFamily::Unknown, "Unknown Device", CAP_NONE);
    generic_.capabilities = CAP_FAN;
    generic_.polls_environment = false;
}

FamilyRegistry FamilyRegistry::with_builtin_families() {
    FamilyRegistry registry;

    for (const char* code : {"438", "520", "664", "739"}) {
        registry.register_family(code, make_fan(DeviceFamily::PurifierFan, "Purifier Fan",
                                                CAP_NONE));
    }
    registry.register_family("527",
                             make_fan(DeviceFamily::HotCoolFan, "Purifier Hot+Cool", CAP_HEATING));
    registry.register_family(
        "358", make_fan(DeviceFamily::HumidifierFan, "Purifier Humidify+Cool", CAP_HUMIDIFICATION));

    registry.register_family("455",
                             make_fan(DeviceFamily::LinkFan, "Pure Hot+Cool Link", CAP_HEATING));
    for (const char* code : {"469", "475"}) {
        registry.register_family(code, make_fan(DeviceFamily::LinkFan, "Pure Cool Link", CAP_NONE));
    }

    for (const char* code : {"N223", "276", "277"}) {
        registry.register_family(code, make_vacuum());
    }

    spdlog::debug("[FamilyRegistry] Registered {} built-in product types", registry.size());
    return registry;
}

void FamilyRegistry::register_family(const std::string& product_type,
                                     FamilyDescriptor descriptor) {
    if (!descriptor.decoder) {
        descriptor.decoder = decode_fan_message;
    }
    spdlog::trace("[FamilyRegistry] {} -> {}", product_type, device_family_name(descriptor.family));
    families_[product_type] = std::move(descriptor);
}

std::string FamilyRegistry::base_product_type(const std::string& product_type) const {
    if (families_.count(product_type) > 0 || product_type.size() < 2) {
        return product_type;
    }
    char last = product_type.back();
    if (std::string(VARIANT_SUFFIXES).find(last) == std::string::npos) {
        return product_type;
    }
    std::string base = product_type.substr(0, product_type.size() - 1);
    if (families_.count(base) > 0) {
        return base;
    }
    return product_type;
}

const FamilyDescriptor* FamilyRegistry::find(const std::string& product_type) const {
    auto it = families_.find(base_product_type(product_type));
    if (it == families_.end()) {
        return nullptr;
    }
    return &it->second;
}

const FamilyDescriptor& FamilyRegistry::resolve(const std::string& product_type) const {
    const FamilyDescriptor* d = find(product_type);
    return d ? *d : generic_;
}

std::vector<std::string> FamilyRegistry::service_types() const {
    std::vector<std::string> out;
    for (const auto& [code, descriptor] : families_) {
        (void)code;
        if (std::find(out.begin(), out.end(), descriptor.service_type) == out.end()) {
            out.push_back(descriptor.service_type);
        }
    }
    return out;
}

std::vector<std::string>
FamilyRegistry::product_types_for_service(const std::string& service_type) const {
    std::vector<std::string> out;
    for (const auto& [code, descriptor] : families_) {
        if (descriptor.service_type == service_type) {
            out.push_back(code);
        }
    }
    return out;
}

} // namespace aerolink
