// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "oauth2_client.h"

#include "api/api_internal.h"
#include "hv/base64.h"
#include "hv/hurl.h"
#include "hv/requests.h"
#include "json_utils.h"
#include "magpie_version.h"
#include "spdlog/spdlog.h"

#include <type_traits>
#include <variant>

using namespace magpie::api_internal;

namespace magpie {

namespace {

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) {
            out += '&';
        }
        out += HUrl::escape(key, "-_.~");
        out += '=';
        out += HUrl::escape(value, "-_.~");
    }
    return out;
}

std::string join_scopes(const std::vector<std::string>& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) {
            out += ' ';
        }
        out += s;
    }
    return out;
}

} // namespace

std::string callback_redirect_uri(int port) {
    return "http://localhost:" + std::to_string(port) + "/oauth2/callback";
}

OAuth2Client::OAuth2Client(OAuth2Settings settings) : settings_(std::move(settings)) {}

AuthorizationState OAuth2Client::begin_login() const {
    auto verifier = pkce::PkceVerifier::generate();
    RedactedString csrf(pkce::random_token(16));

    std::string url = settings_.authorize_url;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += form_encode({
        {"response_type", "code"},
        {"client_id", settings_.client_id},
        {"redirect_uri", settings_.redirect_uri},
        {"scope", join_scopes(settings_.scopes)},
        {"state", csrf.secret()},
        {"code_challenge", verifier.challenge()},
        {"code_challenge_method", "S256"},
    });

    spdlog::debug("[OAuth2] Login started (state {}, verifier {})", csrf.redacted(),
                  verifier.secret().redacted());
    return AuthorizationState{std::move(url), std::move(csrf), std::move(verifier)};
}

AccessToken OAuth2Client::complete_login(const std::string& code, pkce::PkceVerifier&& verifier) {
    // Take ownership so the verifier dies with this call
    pkce::PkceVerifier used = std::move(verifier);
    const char* method = "complete_login";

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_POST;
    req->url = settings_.token_url;
    req->timeout = settings_.timeout_sec;
    req->headers["Content-Type"] = "application/x-www-form-urlencoded";
    req->headers["User-Agent"] = std::string("magpie/") + MAGPIE_VERSION;

    std::string basic = settings_.client_id + ":" + settings_.client_secret.secret();
    req->headers["Authorization"] =
        "Basic " + hv::Base64Encode(reinterpret_cast<const unsigned char*>(basic.data()),
                                    static_cast<unsigned int>(basic.size()));

    req->body = form_encode({
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", settings_.redirect_uri},
        {"code_verifier", used.secret().secret()},
        {"client_id", settings_.client_id},
    });

    spdlog::debug("[OAuth2] Exchanging code for token at {}", settings_.token_url);
    auto resp = requests::request(req);

    MagpieError err;
    if (!handle_http_response(resp, method, err, 200, MagpieErrorType::TOKEN_EXCHANGE)) {
        if (err.type == MagpieErrorType::TRANSPORT) {
            err.type = MagpieErrorType::TOKEN_EXCHANGE;
        }
        spdlog::error("[OAuth2] Token exchange failed: {}", err.message);
        throw MagpieException(err);
    }

    auto body = nlohmann::json::parse(resp->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw MagpieException(
            MagpieError::token_exchange(method, "Token response is not a JSON object", 200));
    }

    auto token = json_util::optional_string(body, "access_token");
    if (!token || token->empty()) {
        throw MagpieException(
            MagpieError::token_exchange(method, "Token response has no access_token", 200));
    }

    AccessToken out;
    out.token = RedactedString(*token);
    out.token_type = json_util::safe_string(body, "token_type", "bearer");
    out.expires_in = json_util::safe_int(body, "expires_in");
    out.scope = json_util::safe_string(body, "scope");

    spdlog::info("[OAuth2] Logged in (token {}, expires in {}s)", out.token.redacted(),
                 out.expires_in);
    return out;
}

AccessToken finish_login(OAuth2Client& client, AuthorizationState&& attempt,
                         const CallbackOutcome& outcome) {
    AuthorizationState used = std::move(attempt);

    return std::visit(
        [&](const auto& result) -> AccessToken {
            using T = std::decay_t<decltype(result)>;
            if constexpr (std::is_same_v<T, CallbackSuccess>) {
                if (result.state != used.csrf_token) {
                    spdlog::error("[OAuth2] CSRF state mismatch (got {}, sent {})",
                                  result.state.redacted(), used.csrf_token.redacted());
                    throw MagpieException(MagpieError::auth_integrity("finish_login"));
                }
                return client.complete_login(result.code, std::move(used.verifier));
            } else if constexpr (std::is_same_v<T, ProviderError>) {
                std::string message = "Provider refused authorization: " + result.error;
                if (result.description) {
                    message += " (" + *result.description + ")";
                }
                throw MagpieException(MagpieError::token_exchange("finish_login", message));
            } else {
                throw MagpieException(MagpieError::token_exchange(
                    "finish_login", "Malformed OAuth2 callback: " + result.reason));
            }
        },
        outcome);
}

} // namespace magpie
