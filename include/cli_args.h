// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for magpie
 *
 * Optional fields stay unset when the flag is absent so the config file
 * value applies.
 */

#include <optional>
#include <string>

namespace magpie {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Output
    std::string out_dir; // --out-dir (required)

    // Run shape
    bool sample = false;               // --sample: first page only
    std::optional<int> port;           // --port: OAuth2 callback port
    std::optional<int> download_n;     // --download-n: parallel downloads
    std::optional<int> login_timeout;  // --login-timeout: seconds, 0 = wait forever
    std::string username;              // --username: walk this account instead of "me"
    bool no_browser = false;           // --no-browser: print the URL only

    // Configuration
    std::string config_path; // --config

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest
    std::string log_file; // --log-file

    // Set when --help or --version was handled (exit 0 rather than 2)
    bool info_shown = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Prints help, version or the error to stdout itself.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help/version was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace magpie
