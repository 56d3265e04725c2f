// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <map>
#include <string>

namespace magpie::env {

/**
 * @brief Parse dotenv text into key/value pairs
 *
 * Supports `KEY=value`, `export KEY=value`, `#` comment lines, and single or
 * double quoted values. Malformed lines are skipped with a warning.
 */
std::map<std::string, std::string> parse_dotenv(const std::string& text);

/**
 * @brief Load a .env file into the process environment
 *
 * Variables already set are never overridden.
 *
 * @return Number of variables set, 0 if the file doesn't exist
 */
int load_dotenv(const std::string& path = ".env");

/**
 * @brief Read a required environment variable
 * @throws MagpieException (CONFIG) naming the variable if unset or empty
 */
std::string require(const char* key);

} // namespace magpie::env
