// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "twitter_api_client.h"

#include "api_internal.h"
#include "hv/hurl.h"
#include "hv/requests.h"
#include "magpie_version.h"
#include "spdlog/spdlog.h"

#include <algorithm>

using namespace magpie::api_internal;

namespace magpie {

namespace {

// Fields requested for the liked-items feed. The enricher's invariants
// (author_id, created_at, includes.media, media url) depend on these.
constexpr const char* TWEET_FIELDS = "id,attachments,text,author_id,entities,created_at";
constexpr const char* TWEET_EXPANSIONS = "attachments.media_keys";
constexpr const char* MEDIA_FIELDS = "type,url";

constexpr int MIN_PAGE_SIZE = 5;
constexpr int MAX_PAGE_SIZE = 100;

} // namespace

TwitterApiClient::TwitterApiClient(RedactedString access_token, ApiSettings settings)
    : access_token_(std::move(access_token)), settings_(std::move(settings)) {
    while (!settings_.base_url.empty() && settings_.base_url.back() == '/') {
        settings_.base_url.pop_back();
    }
    settings_.page_size = std::clamp(settings_.page_size, MIN_PAGE_SIZE, MAX_PAGE_SIZE);
}

std::string TwitterApiClient::build_url(const std::string& path,
                                        const std::map<std::string, std::string>& params) const {
    std::string url = settings_.base_url + path;
    char sep = '?';
    for (const auto& [key, value] : params) {
        url += sep;
        url += key;
        url += '=';
        url += HUrl::escape(value, ",.-_");
        sep = '&';
    }
    return url;
}

nlohmann::json TwitterApiClient::get_json(const std::string& url, const char* method) {
    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = settings_.timeout_sec;
    req->headers["Authorization"] = "Bearer " + access_token_.secret();
    req->headers["User-Agent"] = std::string("magpie/") + MAGPIE_VERSION;

    spdlog::trace("[API] {}: GET {}", method, url);
    auto resp = requests::request(req);

    MagpieError err;
    if (!handle_http_response(resp, method, err)) {
        spdlog::warn("[API] {} failed: {}", method, err.message);
        throw MagpieException(err);
    }

    return parse_json_body(resp->body, method);
}

User TwitterApiClient::get_me() {
    auto body = get_json(build_url("/users/me", {{"user.fields", "username"}}), "get_me");
    return decode_user_response(body, "get_me");
}

User TwitterApiClient::get_user_by_username(const std::string& username) {
    std::string path = "/users/by/username/" + HUrl::escape(username, "_");
    auto body = get_json(build_url(path, {{"user.fields", "username"}}), "get_user_by_username");
    return decode_user_response(body, "get_user_by_username");
}

User TwitterApiClient::get_user(const UserId& id) {
    std::string path = "/users/" + HUrl::escape(id);
    auto body = get_json(build_url(path, {{"user.fields", "username"}}), "get_user");
    return decode_user_response(body, "get_user");
}

LikedPage TwitterApiClient::get_liked_tweets(const UserId& user_id,
                                             const std::optional<std::string>& cursor) {
    std::map<std::string, std::string> params = {
        {"tweet.fields", TWEET_FIELDS},
        {"expansions", TWEET_EXPANSIONS},
        {"media.fields", MEDIA_FIELDS},
        {"max_results", std::to_string(settings_.page_size)},
    };
    if (cursor) {
        params["pagination_token"] = *cursor;
    }

    std::string path = "/users/" + HUrl::escape(user_id) + "/liked_tweets";
    auto body = get_json(build_url(path, params), "get_liked_tweets");
    return decode_liked_page(body);
}

} // namespace magpie
