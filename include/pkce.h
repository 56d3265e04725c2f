// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file pkce.h
 * @brief PKCE (RFC 7636) verifier/challenge generation and random tokens
 */

#pragma once

#include "redacted_string.h"

#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace magpie::pkce {

/// SHA-256 digest of an arbitrary byte string
std::array<unsigned char, 32> sha256(const std::string& input);

/// Lower-case hex form of sha256(), used by tests against published vectors
std::string sha256_hex(const std::string& input);

/// Base64url without padding (RFC 4648 section 5)
std::string base64url_encode(const unsigned char* data, size_t len);

/**
 * @brief Random URL-safe token
 *
 * Reads /dev/urandom, falling back to std::random_device when it is not
 * available.
 *
 * @param num_bytes Entropy in bytes before encoding
 */
std::string random_token(size_t num_bytes);

/// S256 code challenge for a verifier: base64url(sha256(verifier))
std::string challenge_for(const std::string& verifier);

/**
 * @brief Single-use PKCE verifier
 *
 * Move-only so a verifier cannot be handed to two token exchanges.
 */
class PkceVerifier {
  public:
    /// Fresh verifier from 32 random bytes (43 characters)
    static PkceVerifier generate();

    explicit PkceVerifier(std::string secret) : secret_(std::move(secret)) {}

    PkceVerifier(PkceVerifier&&) = default;
    PkceVerifier& operator=(PkceVerifier&&) = default;
    PkceVerifier(const PkceVerifier&) = delete;
    PkceVerifier& operator=(const PkceVerifier&) = delete;

    const RedactedString& secret() const {
        return secret_;
    }

    std::string challenge() const {
        return challenge_for(secret_.secret());
    }

  private:
    RedactedString secret_;
};

} // namespace magpie::pkce
