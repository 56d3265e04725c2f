// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file api_internal.h
 * @brief Internal helpers shared across the HTTP-facing implementation files
 *
 * This header is NOT part of the public API. It provides response
 * classification and provider-error extraction used by twitter_api_client.cpp,
 * oauth2_client.cpp and http_fetcher.cpp.
 */

#include "hv/HttpMessage.h"
#include "magpie_error.h"
#include "spdlog/spdlog.h"

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include "hv/json.hpp"

namespace magpie::api_internal {

// ============================================================================
// PROVIDER ERROR BODIES
// ============================================================================
// The provider reports failures in three shapes depending on the endpoint:
//   v2 API problem:   {"title": "...", "detail": "...", "status": 401}
//   v2 API errors:    {"errors": [{"message": "..."}, ...]}
//   OAuth2 token:     {"error": "invalid_request", "error_description": "..."}

/**
 * @brief Extract a human-readable description from a provider error body
 *
 * @param body Raw response body (may be empty or non-JSON)
 * @return Description, or empty string if nothing recognisable was found
 */
inline std::string describe_provider_error(const std::string& body) {
    if (body.empty()) {
        return "";
    }

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return "";
    }

    if (j.contains("error") && j["error"].is_string()) {
        std::string out = j["error"].get<std::string>();
        if (j.contains("error_description") && j["error_description"].is_string()) {
            out += ": " + j["error_description"].get<std::string>();
        }
        return out;
    }

    if (j.contains("detail") && j["detail"].is_string()) {
        if (j.contains("title") && j["title"].is_string()) {
            return j["title"].get<std::string>() + ": " + j["detail"].get<std::string>();
        }
        return j["detail"].get<std::string>();
    }

    if (j.contains("errors") && j["errors"].is_array() && !j["errors"].empty()) {
        const auto& first = j["errors"][0];
        if (first.contains("detail") && first["detail"].is_string()) {
            return first["detail"].get<std::string>();
        }
        if (first.contains("message") && first["message"].is_string()) {
            return first["message"].get<std::string>();
        }
    }

    return "";
}

// ============================================================================
// HTTP RESPONSE HANDLING
// ============================================================================
// Consolidates the repeated HTTP response validation pattern:
// 1. Check for null response (connection failed)
// 2. Check status code against the expected set
// 3. Fill in a MagpieError describing the failure
//
// Usage:
//   MagpieError err;
//   if (!handle_http_response(resp, "get_user", err)) throw MagpieException(err);

/**
 * @brief Handle HTTP response with multiple acceptable status codes
 *
 * @param resp HTTP response (may be nullptr)
 * @param method Operation name for error context
 * @param err Output: populated when the response is rejected
 * @param expected_codes Acceptable HTTP status codes
 * @param type Error category for a non-matching status (null response is always TRANSPORT)
 * @return true if response is valid and has one of the expected codes
 */
inline bool handle_http_response(const std::shared_ptr<HttpResponse>& resp, std::string_view method,
                                 MagpieError& err, std::initializer_list<int> expected_codes,
                                 MagpieErrorType type = MagpieErrorType::TRANSPORT) {
    if (!resp) {
        err = MagpieError::transport(std::string(method), "No response received");
        return false;
    }

    for (int code : expected_codes) {
        if (resp->status_code == code) {
            return true;
        }
    }

    std::string message =
        "HTTP " + std::to_string(resp->status_code) + ": " + resp->status_message();
    std::string detail = describe_provider_error(resp->body);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    err = MagpieError::make(type, std::string(method), message, resp->status_code);
    return false;
}

/**
 * @brief Handle HTTP response with a single expected status code
 */
inline bool handle_http_response(const std::shared_ptr<HttpResponse>& resp, std::string_view method,
                                 MagpieError& err, int expected = 200,
                                 MagpieErrorType type = MagpieErrorType::TRANSPORT) {
    return handle_http_response(resp, method, err, {expected}, type);
}

// ============================================================================
// JSON PARSING
// ============================================================================

/**
 * @brief Parse a response body as a JSON object or fail with a TRANSPORT error
 */
inline nlohmann::json parse_json_body(const std::string& body, std::string_view method) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::error("[API] {}: response is not a JSON object ({} bytes)", method, body.size());
        throw MagpieException(
            MagpieError::transport(std::string(method), "Response body is not a JSON object"));
    }
    return j;
}

} // namespace magpie::api_internal
