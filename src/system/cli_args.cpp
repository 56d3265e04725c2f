// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "magpie_version.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace magpie {

namespace {

// Helper to parse integer with validation
bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/// Value of "--flag value" or "--flag=value"; nullptr (after printing) if missing
const char* flag_value(int argc, char** argv, int& i, const char* flag) {
    size_t len = strlen(flag);
    if (strncmp(argv[i], flag, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", flag);
    return nullptr;
}

bool matches(const char* arg, const char* flag) {
    size_t len = strlen(flag);
    return strcmp(arg, flag) == 0 || (strncmp(arg, flag, len) == 0 && arg[len] == '=');
}

void print_help(const char* program_name) {
    printf("Usage: %s --out-dir <dir> [options]\n", program_name);
    printf("Download the images from your liked posts.\n");
    printf("\nOptions:\n");
    printf("  --out-dir <dir>        Output directory to store files in (required)\n");
    printf("  --sample               Only fetch the first page of likes\n");
    printf("  --port <n>             OAuth2 callback port (default: 49277)\n");
    printf("  --download-n <n>       Number of images to download in parallel (default: 8)\n");
    printf("  --username <name>      Download likes of this account instead of your own\n");
    printf("  --login-timeout <sec>  Give up waiting for the browser login (0 = never)\n");
    printf("  --no-browser           Print the login URL instead of opening a browser\n");
    printf("  --config <path>        Config file (default: $XDG_CONFIG_HOME/magpie/config.json)\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>      Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>      Log file path (when --log-dest=file)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nEnvironment:\n");
    printf("  TWITTER_OAUTH_CLIENT_ID, TWITTER_OAUTH_CLIENT_SECRET (also read from ./.env)\n");
}

} // namespace

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (matches(argv[i], "--out-dir")) {
            const char* value = flag_value(argc, argv, i, "--out-dir");
            if (!value)
                return false;
            args.out_dir = value;
        } else if (strcmp(argv[i], "--sample") == 0) {
            args.sample = true;
        } else if (matches(argv[i], "--port")) {
            const char* value = flag_value(argc, argv, i, "--port");
            int port = 0;
            if (!value || !parse_int(value, 1, 65535, port, "port"))
                return false;
            args.port = port;
        } else if (matches(argv[i], "--download-n")) {
            const char* value = flag_value(argc, argv, i, "--download-n");
            int n = 0;
            if (!value || !parse_int(value, 1, 256, n, "download-n"))
                return false;
            args.download_n = n;
        } else if (matches(argv[i], "--login-timeout")) {
            const char* value = flag_value(argc, argv, i, "--login-timeout");
            int sec = 0;
            if (!value || !parse_int(value, 0, 86400, sec, "login-timeout"))
                return false;
            args.login_timeout = sec;
        } else if (matches(argv[i], "--username")) {
            const char* value = flag_value(argc, argv, i, "--username");
            if (!value)
                return false;
            args.username = value;
            if (!args.username.empty() && args.username[0] == '@') {
                args.username.erase(0, 1);
            }
        } else if (strcmp(argv[i], "--no-browser") == 0) {
            args.no_browser = true;
        } else if (matches(argv[i], "--config")) {
            const char* value = flag_value(argc, argv, i, "--config");
            if (!value)
                return false;
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
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = flag_value(argc, argv, i, "--log-dest");
            if (!value)
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = flag_value(argc, argv, i, "--log-file");
            if (!value)
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.info_shown = true;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("magpie %s\n", magpie_version());
            args.info_shown = true;
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.out_dir.empty()) {
        printf("Error: --out-dir is required\n");
        printf("Use --help for usage information\n");
        return false;
    }

    return true;
}

} // namespace magpie
