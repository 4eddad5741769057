// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace aerolink {

namespace {

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>   Configuration file (default: aerolink.json)\n");
    printf("  -v, --verbose         Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-target <dest>   Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>     Log file path (when --log-target=file)\n");
    printf("  --login <identifier>  Sign in to the cloud account (email or phone) and exit\n");
    printf("  --region <code>       Cloud account region, e.g. US, GB, CN\n");
    printf("  --no-cloud            Run with manual and local devices only\n");
    printf("  -h, --help            Show this help message\n");
    printf("  -V, --version         Show version information\n");
}

/// Value of "--opt value" or "--opt=value"; nullptr (and an error) if missing
const char* option_value(int argc, char** argv, int& i, const char* name) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", name);
    return nullptr;
}

bool matches(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

} // namespace

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value) {
                return false;
            }
            args.config_path = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging
        else if (matches(argv[i], "--log-target")) {
            const char* value = option_value(argc, argv, i, "--log-target");
            if (!value) {
                return false;
            }
            args.log_target = value;
            if (args.log_target != "auto" && args.log_target != "journal" &&
                args.log_target != "syslog" && args.log_target != "file" &&
                args.log_target != "console") {
                printf("Error: invalid --log-target value: %s\n", args.log_target.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                return false;
            }
            args.log_file = value;
        }
        // Cloud
        else if (matches(argv[i], "--login")) {
            const char* value = option_value(argc, argv, i, "--login");
            if (!value) {
                return false;
            }
            args.login_identifier = value;
        } else if (matches(argv[i], "--region")) {
            const char* value = option_value(argc, argv, i, "--region");
            if (!value) {
                return false;
            }
            args.region = value;
            if (args.region.size() != 2) {
                printf("Error: --region expects a two-letter country code: %s\n", value);
                return false;
            }
            for (auto& c : args.region) {
                if (c >= 'a' && c <= 'z') {
                    c = static_cast<char>(c - 'a' + 'A');
                }
            }
        } else if (strcmp(argv[i], "--no-cloud") == 0) {
            args.no_cloud = true;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.exit_requested = true;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("aerolink %s\n", AEROLINK_VERSION);
            args.exit_requested = true;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.no_cloud && !args.login_identifier.empty()) {
        printf("Error: --login cannot be combined with --no-cloud\n");
        return false;
    }

    return true;
}

} // namespace aerolink
