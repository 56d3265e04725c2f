// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file feed_walker.h
 * @brief Lazy, strictly sequential walk over the liked-items feed
 *
 * Pull-based: each next() schedules exactly one page fetch on a private
 * single-thread pool and returns a future for it. Because the worker reads
 * the cursor left by the previous fetch, page N+1 is never requested before
 * page N has returned, even if the caller calls next() several times ahead.
 *
 * Termination:
 *   - a page with a cursor  -> more pages follow
 *   - a page without cursor -> last page (the walk ends after it)
 *   - no data and no cursor -> normal end of feed, yields nullopt
 *   - no data but a cursor  -> API_INVARIANT error
 *
 * Not restartable: construct a new walker for a new walk.
 */

#pragma once

#include "cancellation.h"
#include "feed_api.h"

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class HThreadPool;

namespace magpie {

class FeedWalker {
  public:
    /**
     * @param api Upstream API (must outlive the walker)
     * @param user_id Account whose liked items are walked
     * @param cancel Checked before each page request
     * @param max_pages Stop after this many pages (0 = no limit)
     */
    FeedWalker(FeedApi& api, UserId user_id, CancellationToken cancel = {}, int max_pages = 0);
    ~FeedWalker();

    FeedWalker(const FeedWalker&) = delete;
    FeedWalker& operator=(const FeedWalker&) = delete;

    /**
     * @brief Schedule the next page fetch
     *
     * The future yields the page, nullopt at the end of the feed, or
     * rethrows the MagpieException that aborted the walk (TRANSPORT,
     * API_INVARIANT, CANCELLED). Once a fetch fails every later next()
     * fails the same way.
     */
    std::future<std::optional<LikedPage>> next();

    /// True once the end of the feed (or an error) has been observed
    bool done() const;

    int pages_fetched() const;

  private:
    std::optional<LikedPage> fetch_next();

    FeedApi& api_;
    UserId user_id_;
    CancellationToken cancel_;
    int max_pages_;

    // Written only on the worker thread, read from anywhere under mutex_
    mutable std::mutex mutex_;
    std::optional<std::string> cursor_;
    std::optional<MagpieException> failure_;
    bool done_ = false;
    int pages_fetched_ = 0;

    std::unique_ptr<HThreadPool> pool_;
};

} // namespace magpie
