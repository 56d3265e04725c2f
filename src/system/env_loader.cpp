// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "env_loader.h"

#include "magpie_error.h"
#include "spdlog/spdlog.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace magpie::env {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool valid_key(const std::string& key) {
    if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0]))) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace

std::map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        auto eq = line.find('=');
        std::string key = trim(line.substr(0, eq));
        if (eq == std::string::npos || !valid_key(key)) {
            spdlog::warn("[Env] Skipping malformed .env line {}", line_no);
            continue;
        }

        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        out[key] = value;
    }
    return out;
}

int load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::trace("[Env] No {} file", path);
        return 0;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    int set = 0;
    for (const auto& [key, value] : parse_dotenv(buffer.str())) {
        if (std::getenv(key.c_str()) != nullptr) {
            spdlog::trace("[Env] {} already set, keeping environment value", key);
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++set;
        }
    }
    spdlog::debug("[Env] Loaded {} variable(s) from {}", set, path);
    return set;
}

std::string require(const char* key) {
    const char* value = std::getenv(key);
    if (value == nullptr || value[0] == '\0') {
        throw MagpieException(MagpieError::config(
            "env::require", std::string("Missing required environment variable '") + key + "'"));
    }
    return value;
}

} // namespace magpie::env
