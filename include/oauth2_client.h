// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file oauth2_client.h
 * @brief OAuth2 Authorization Code flow with PKCE (confidential client)
 *
 * begin_login() is pure: it only consumes randomness and builds the URL the
 * user opens in a browser. complete_login() performs the one network round
 * trip that turns the redirected code into an access token.
 */

#pragma once

#include "oauth2_callback_server.h"
#include "pkce.h"
#include "redacted_string.h"

#include <string>
#include <vector>

namespace magpie {

/**
 * @brief Client registration and provider endpoints
 */
struct OAuth2Settings {
    std::string client_id;
    RedactedString client_secret;
    std::string redirect_uri; ///< Must match the registered callback exactly
    std::string authorize_url = "https://twitter.com/i/oauth2/authorize";
    std::string token_url = "https://api.twitter.com/2/oauth2/token";
    std::vector<std::string> scopes = {"tweet.read", "users.read", "like.read"};
    int timeout_sec = 30;
};

/// Redirect URI served by the local callback listener
std::string callback_redirect_uri(int port);

/**
 * @brief One login attempt
 *
 * Move-only; the verifier is moved into complete_login() and cannot be
 * replayed.
 */
struct AuthorizationState {
    std::string url;
    RedactedString csrf_token;
    pkce::PkceVerifier verifier;
};

/**
 * @brief Token endpoint response
 */
struct AccessToken {
    RedactedString token;
    std::string token_type;
    int expires_in = 0;
    std::string scope;
};

class OAuth2Client {
  public:
    explicit OAuth2Client(OAuth2Settings settings);
    virtual ~OAuth2Client() = default;

    /**
     * @brief Start a login attempt
     *
     * Generates a fresh verifier and CSRF token every call.
     */
    AuthorizationState begin_login() const;

    /**
     * @brief Exchange an authorization code for an access token
     *
     * @param code Code from the redirect
     * @param verifier Verifier from the same begin_login() call (consumed)
     * @throws MagpieException (TOKEN_EXCHANGE) on rejection or transport failure
     */
    virtual AccessToken complete_login(const std::string& code, pkce::PkceVerifier&& verifier);

    const OAuth2Settings& settings() const {
        return settings_;
    }

  private:
    OAuth2Settings settings_;
};

/**
 * @brief Turn the captured redirect into an access token
 *
 * Only a CallbackSuccess whose state matches the attempt's CSRF token reaches
 * the token endpoint; the verifier is consumed in that case only.
 *
 * @throws MagpieException AUTH_INTEGRITY on a state mismatch, TOKEN_EXCHANGE
 *         for a provider error, a malformed callback or a failed exchange
 */
AccessToken finish_login(OAuth2Client& client, AuthorizationState&& attempt,
                         const CallbackOutcome& outcome);

} // namespace magpie
