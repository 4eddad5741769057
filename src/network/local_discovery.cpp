// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "local_discovery.h"

namespace aerolink {

std::optional<std::pair<std::string, std::string>>
parse_instance_name(const std::string& instance_name) {
    // Instance label ends at the first dot ("438_SERIAL._dyson_mqtt._tcp.local.")
    std::string label = instance_name.substr(0, instance_name.find('.'));
    if (label.empty()) {
        return std::nullopt;
    }

    auto underscore = label.find('_');
    if (underscore == std::string::npos) {
        return std::make_pair(std::string(), label);
    }

    std::string product_type = label.substr(0, underscore);
    std::string serial = label.substr(underscore + 1);
    if (serial.empty()) {
        return std::nullopt;
    }
    return std::make_pair(product_type, serial);
}

} // namespace aerolink
