// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup: console sink plus one optional system sink
 */

#include <spdlog/spdlog.h>

#include <string>

namespace magpie {
namespace logging {

/**
 * @brief Where log lines go besides the console
 *
 * Auto resolves to Syslog on Linux and Console elsewhere.
 */
enum class LogTarget { Auto, Syslog, File, Console };

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Only used for LogTarget::File; empty = default location
    bool enable_console = true;
};

/**
 * @brief Install a console-only logger at warn
 *
 * Call first thing in main() so log calls made before the config is loaded
 * go somewhere sensible.
 */
void init_early();

/// Replace the default logger according to config
void init(const LogConfig& config);

/**
 * @brief Parse a level name
 *
 * Case-sensitive: trace, debug, info, warn, warning, error, critical, off.
 * @return default_level for anything else
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v count to level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity wins, then config, then warn
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/**
 * @brief Map an spdlog level to libhv's log level (libhv has no trace)
 */
int to_hv_level(spdlog::level::level_enum level);

/// Default file used for LogTarget::File ($XDG_DATA_HOME/magpie/magpie.log)
std::string default_log_file_path();

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace magpie
