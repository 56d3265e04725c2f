// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file twitter_api_client.h
 * @brief FeedApi implementation over the provider's v2 REST API
 *
 * Thin request builder: each call is one synchronous libhv request with a
 * bearer token. Response bodies are decoded by feed_types.cpp.
 */

#pragma once

#include "feed_api.h"
#include "redacted_string.h"

#include <map>
#include <string>

namespace magpie {

/**
 * @brief Connection settings for TwitterApiClient
 */
struct ApiSettings {
    std::string base_url = "https://api.twitter.com/2"; ///< No trailing slash
    int timeout_sec = 30;
    int page_size = 100; ///< max_results for liked_tweets (5-100)
};

class TwitterApiClient : public FeedApi {
  public:
    TwitterApiClient(RedactedString access_token, ApiSettings settings = {});

    User get_me() override;
    User get_user_by_username(const std::string& username) override;
    User get_user(const UserId& id) override;
    LikedPage get_liked_tweets(const UserId& user_id,
                               const std::optional<std::string>& cursor) override;

    /**
     * @brief Build a request URL from a path and query parameters
     *
     * Parameter values are percent-escaped; ',' and '.' are left as-is since
     * the field lists rely on them.
     */
    std::string build_url(const std::string& path,
                          const std::map<std::string, std::string>& params = {}) const;

  private:
    nlohmann::json get_json(const std::string& url, const char* method);

    RedactedString access_token_;
    ApiSettings settings_;
};

} // namespace magpie
