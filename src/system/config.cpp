// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "magpie_error.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace magpie {

Config* Config::instance{nullptr};

namespace {

/// Fill keys missing from `target` with values from `defaults` (recursive)
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing(target[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::defaults() {
    return {{"log_level", "warn"},
            {"log_dest", "auto"},
            {"log_path", ""},
            {"oauth",
             {{"port", 49277},
              {"login_timeout_sec", 0},
              {"authorize_url", "https://twitter.com/i/oauth2/authorize"},
              {"token_url", "https://api.twitter.com/2/oauth2/token"}}},
            {"api", {{"base_url", "https://api.twitter.com/2"}, {"timeout_sec", 30}, {"page_size", 100}}},
            {"download", {{"concurrency", 8}, {"timeout_sec", 60}}},
            {"enrich", {{"lookup_threads", 4}, {"include_link_previews", true}}}};
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return (fs::path(xdg) / "magpie" / "config.json").string();
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / ".config" / "magpie" / "config.json").string();
    }
    return "magpie-config.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::debug("[Config] Loading config from {}", config_path);
        std::ifstream in(config_path);
        data = json::parse(in, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            spdlog::error("[Config] Failed to parse {}", config_path);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = defaults();
            config_modified = true;
        } else if (merge_missing(data, defaults())) {
            spdlog::debug("[Config] Added missing keys from defaults");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = defaults();
        config_modified = true;
    }

    if (config_modified) {
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty()) {
            fs::create_directories(config_dir, ec);
        }
        if (ec) {
            spdlog::warn("[Config] Cannot create {}: {}", config_dir.string(), ec.message());
        } else if (!save()) {
            spdlog::warn("[Config] Continuing with in-memory configuration");
        }
    }
}

int Config::get_int_in_range(const std::string& json_ptr, int default_value, int min_value,
                             int max_value) {
    json::json_pointer ptr(json_ptr);
    if (!data.contains(ptr) || !data[ptr].is_number()) {
        return get<int>(json_ptr, default_value);
    }
    // Compare before narrowing so values past INT_MAX are reported, not wrapped
    const json& stored = data[ptr];
    double value = stored.get<double>();
    if (value < min_value || value > max_value) {
        throw MagpieException(MagpieError::config(
            "get_int_in_range", fmt::format("{} must be {}-{}, got {} (in {})", json_ptr,
                                            min_value, max_value, stored.dump(), path)));
    }
    return stored.get<int>();
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::ofstream o(path);
    if (!o.is_open()) {
        spdlog::error("[Config] Failed to open config file for writing: {}", path);
        return false;
    }

    o << std::setw(2) << data << std::endl;

    if (!o.good()) {
        spdlog::error("[Config] Error writing to config file: {}", path);
        return false;
    }

    o.close();
    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

std::string Config::get_path() {
    return path;
}

} // namespace magpie
