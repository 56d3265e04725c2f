// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "feed_types.h"

#include <optional>
#include <string>

namespace magpie {

/**
 * @brief Upstream API capability consumed by the feed pipeline
 *
 * Every method performs one blocking network round trip. Failures are
 * reported by throwing MagpieException with type TRANSPORT.
 *
 * Thread safety: implementations must tolerate concurrent calls; the
 * enricher issues user lookups from several pool threads at once.
 *
 * Abstract so tests can substitute scripted responses.
 */
class FeedApi {
  public:
    virtual ~FeedApi() = default;

    /// GET /users/me - the account that authorised the token
    virtual User get_me() = 0;

    /// GET /users/by/username/{username}
    virtual User get_user_by_username(const std::string& username) = 0;

    /// GET /users/{id}
    virtual User get_user(const UserId& id) = 0;

    /**
     * @brief GET /users/{id}/liked_tweets
     *
     * @param user_id Account whose likes are listed
     * @param cursor Pagination token from the previous page, nullopt for the first page
     */
    virtual LikedPage get_liked_tweets(const UserId& user_id,
                                       const std::optional<std::string>& cursor) = 0;
};

} // namespace magpie
