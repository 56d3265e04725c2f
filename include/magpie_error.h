// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace magpie {

/**
 * @brief Error categories for magpie operations
 */
enum class MagpieErrorType {
    NONE,           // No error
    SETUP,          // Cannot bind callback port, cannot create output directory
    AUTH_INTEGRITY, // CSRF/state token mismatch on the OAuth2 redirect
    TOKEN_EXCHANGE, // Provider rejected code/verifier or token request failed
    API_INVARIANT,  // Response missing a field the request shape guarantees
    TRANSPORT,      // Network failure or unexpected HTTP status
    LOCAL_IO,       // Cannot write a file
    TIMEOUT,        // Login redirect never arrived in time
    CANCELLED,      // Caller aborted the operation
    CONFIG          // Missing credential or invalid configuration
};

/**
 * @brief Comprehensive error information for magpie operations
 *
 * `causes` holds the causal chain, outermost context first. The last entry
 * is always `message` once the error has been wrapped at least once.
 */
struct MagpieError {
    MagpieErrorType type = MagpieErrorType::NONE;
    int code = 0;        // HTTP status code if applicable
    std::string message; // Human-readable error message
    std::string method;  // Operation that produced the error
    std::vector<std::string> causes;

    bool has_error() const {
        return type != MagpieErrorType::NONE;
    }

    std::string get_type_string() const {
        switch (type) {
        case MagpieErrorType::NONE:
            return "NONE";
        case MagpieErrorType::SETUP:
            return "SETUP";
        case MagpieErrorType::AUTH_INTEGRITY:
            return "AUTH_INTEGRITY";
        case MagpieErrorType::TOKEN_EXCHANGE:
            return "TOKEN_EXCHANGE";
        case MagpieErrorType::API_INVARIANT:
            return "API_INVARIANT";
        case MagpieErrorType::TRANSPORT:
            return "TRANSPORT";
        case MagpieErrorType::LOCAL_IO:
            return "LOCAL_IO";
        case MagpieErrorType::TIMEOUT:
            return "TIMEOUT";
        case MagpieErrorType::CANCELLED:
            return "CANCELLED";
        case MagpieErrorType::CONFIG:
            return "CONFIG";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        if (type == MagpieErrorType::AUTH_INTEGRITY) {
            return "Login response did not match this login attempt.";
        } else if (type == MagpieErrorType::TIMEOUT) {
            return "Timed out waiting for the browser login to finish.";
        } else if (type == MagpieErrorType::CANCELLED) {
            return "Operation cancelled.";
        } else if (!message.empty()) {
            return message;
        } else {
            return "An unknown error occurred.";
        }
    }

    /**
     * @brief Full causal chain, outermost first
     */
    std::vector<std::string> chain() const {
        if (causes.empty()) {
            return {message};
        }
        return causes;
    }

    static MagpieError make(MagpieErrorType type, const std::string& method,
                            const std::string& message, int code = 0) {
        MagpieError err;
        err.type = type;
        err.method = method;
        err.message = message;
        err.code = code;
        return err;
    }

    static MagpieError setup(const std::string& method, const std::string& message) {
        return make(MagpieErrorType::SETUP, method, message);
    }

    static MagpieError auth_integrity(const std::string& method) {
        return make(MagpieErrorType::AUTH_INTEGRITY, method,
                    "CSRF state returned by the provider does not match the one sent");
    }

    static MagpieError token_exchange(const std::string& method, const std::string& message,
                                      int code = 0) {
        return make(MagpieErrorType::TOKEN_EXCHANGE, method, message, code);
    }

    static MagpieError api_invariant(const std::string& method, const std::string& message) {
        return make(MagpieErrorType::API_INVARIANT, method, message);
    }

    static MagpieError transport(const std::string& method, const std::string& message,
                                 int code = 0) {
        return make(MagpieErrorType::TRANSPORT, method, message, code);
    }

    static MagpieError local_io(const std::string& method, const std::string& message) {
        return make(MagpieErrorType::LOCAL_IO, method, message);
    }

    static MagpieError timeout(const std::string& method, int timeout_sec) {
        return make(MagpieErrorType::TIMEOUT, method,
                    "No callback received after " + std::to_string(timeout_sec) + "s");
    }

    static MagpieError cancelled(const std::string& method) {
        return make(MagpieErrorType::CANCELLED, method, "Operation cancelled");
    }

    static MagpieError config(const std::string& method, const std::string& message) {
        return make(MagpieErrorType::CONFIG, method, message);
    }
};

/**
 * @brief Exception carrier for fatal MagpieError values
 *
 * Thrown by operations whose failure aborts the run (login, pagination,
 * page enrichment, output directory setup). what() returns the outermost
 * link of the chain.
 */
class MagpieException : public std::runtime_error {
  public:
    explicit MagpieException(MagpieError error)
        : std::runtime_error(error.chain().front()), error_(std::move(error)) {}

    const MagpieError& error() const noexcept {
        return error_;
    }

    MagpieErrorType type() const noexcept {
        return error_.type;
    }

    /**
     * @brief Rethrow-able copy with an outer context line prepended to the chain
     */
    MagpieException with_context(const std::string& context) const {
        MagpieError wrapped = error_;
        if (wrapped.causes.empty()) {
            wrapped.causes.push_back(wrapped.message);
        }
        wrapped.causes.insert(wrapped.causes.begin(), context);
        return MagpieException(std::move(wrapped));
    }

  private:
    MagpieError error_;
};

} // namespace magpie
