// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "hv/json.hpp"

namespace magpie::json_util {

/// Safely extract a string from a JSON field that may be null.
/// nlohmann .value("key", "") throws type_error.302 when the field is JSON null.
inline std::string safe_string(const nlohmann::json& j, const char* key,
                               const std::string& def = "") {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return def;
}

/// Like safe_string, but distinguishes "absent/null" from "empty string".
inline std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

/// Safely extract an int from a JSON field that may be number, string, or null.
inline int safe_int(const nlohmann::json& j, const char* key, int def = 0) {
    if (!j.contains(key) || j[key].is_null()) {
        return def;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<int>();
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::logic_error&) {
            return def;
        }
    }
    return def;
}

} // namespace magpie::json_util
