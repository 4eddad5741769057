// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace aerolink {

/// Version reported by --version
constexpr const char* AEROLINK_VERSION = "0.3.0";

/**
 * @brief Command line options of the aerolink daemon
 */
struct CliArgs {
    std::string config_path = "aerolink.json";

    // Logging
    int verbosity = 0;         // 0 = not set (config /log_level decides)
    std::string log_target;    // Empty = config /log_target
    std::string log_file;      // Empty = config /log_file

    // Cloud
    std::string login_identifier; // --login: run the interactive sign-in first
    std::string region;           // Empty = config /cloud/region
    bool no_cloud = false;

    /// --help or --version handled; exit successfully without running
    bool exit_requested = false;
};

/**
 * @brief Parse command line
 *
 * Prints an error (or the help/version text) to stdout.
 *
 * @return false if the program should exit; check args.exit_requested for the
 *         exit status
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace aerolink
