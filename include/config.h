// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace magpie {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup, then read
 * from the main thread; worker code receives plain settings structs.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 *
 * int port = cfg->get_int_in_range("/oauth/port", 49277, 1, 65535);
 * cfg->set<int>("/download/concurrency", 4);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file (and its directory) with defaults if it doesn't exist.
     * Missing keys are filled from defaults. A corrupt file is moved aside
     * to `<path>.corrupt` and replaced with defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] {} has wrong type ({}), using default", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    /**
     * @brief Integer value that must fall within [min_value, max_value]
     *
     * A missing key or a non-integer value yields default_value, as get()
     * does. A present integer outside the range is not clamped.
     *
     * @throws MagpieException (CONFIG) if the stored value is out of range
     */
    int get_int_in_range(const std::string& json_ptr, int default_value, int min_value,
                         int max_value);

    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Write the configuration to disk (pretty-printed)
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    /// Default configuration document
    static json defaults();

    /**
     * @brief $XDG_CONFIG_HOME/magpie/config.json, else ~/.config/magpie/config.json
     */
    static std::string default_path();

    static Config* get_instance();
};

} // namespace magpie
