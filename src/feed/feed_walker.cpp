// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "feed_walker.h"

#include "hv/hthreadpool.h"
#include "magpie_error.h"
#include "spdlog/spdlog.h"

namespace magpie {

FeedWalker::FeedWalker(FeedApi& api, UserId user_id, CancellationToken cancel, int max_pages)
    : api_(api), user_id_(std::move(user_id)), cancel_(std::move(cancel)),
      max_pages_(max_pages), pool_(std::make_unique<HThreadPool>(1, 1)) {
    pool_->start(1);
}

FeedWalker::~FeedWalker() {
    if (pool_) {
        pool_->wait();
        pool_->stop();
    }
}

std::future<std::optional<LikedPage>> FeedWalker::next() {
    return pool_->commit([this]() { return fetch_next(); });
}

bool FeedWalker::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

int FeedWalker::pages_fetched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pages_fetched_;
}

std::optional<LikedPage> FeedWalker::fetch_next() {
    std::optional<std::string> cursor;
    int page_number = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            throw *failure_;
        }
        if (done_) {
            return std::nullopt;
        }
        cursor = cursor_;
        page_number = pages_fetched_ + 1;
    }

    auto fail = [this](MagpieException e) -> MagpieException {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = e;
        done_ = true;
        return e;
    };

    if (cancel_.requested()) {
        spdlog::info("[FeedWalker] Cancelled before page {}", page_number);
        throw fail(MagpieException(MagpieError::cancelled("FeedWalker::next")));
    }

    spdlog::debug("[FeedWalker] Requesting page {} (cursor: {})", page_number,
                  cursor ? *cursor : "<none>");

    LikedPage page;
    try {
        page = api_.get_liked_tweets(user_id_, cursor);
    } catch (const MagpieException& e) {
        throw fail(e.with_context("Fetching liked items page " + std::to_string(page_number)));
    }

    if (!page.data) {
        if (page.next_token) {
            spdlog::error("[FeedWalker] Page {} has no data but advertises a next cursor",
                          page_number);
            throw fail(MagpieException(MagpieError::api_invariant(
                "FeedWalker::next", "Liked items page " + std::to_string(page_number) +
                                        " has no data but a next_token")));
        }
        spdlog::debug("[FeedWalker] Page {} is empty and final, end of feed", page_number);
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        return std::nullopt;
    }

    if (page.next_token && cursor && *page.next_token == *cursor) {
        throw fail(MagpieException(MagpieError::api_invariant(
            "FeedWalker::next",
            "Liked items page " + std::to_string(page_number) + " repeats its own cursor")));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pages_fetched_ = page_number;
    cursor_ = page.next_token;
    if (!cursor_) {
        done_ = true;
    } else if (max_pages_ > 0 && pages_fetched_ >= max_pages_) {
        spdlog::debug("[FeedWalker] Page limit {} reached", max_pages_);
        done_ = true;
    }

    spdlog::info("[FeedWalker] Page {}: {} items{}", page_number, page.data->size(),
                 done_ ? " (last)" : "");
    return page;
}

} // namespace magpie
