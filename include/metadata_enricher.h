// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file metadata_enricher.h
 * @brief Turns one liked-items page into ImageReferences
 *
 * A page is processed all-or-nothing. Contract violations (a missing field
 * the request shape guarantees) fail the whole page with API_INVARIANT
 * before any author lookup is issued. Author lookups for one page run
 * concurrently on a small pool, one per distinct uncached author, and all
 * finish before references are returned.
 */

#pragma once

#include "feed_api.h"
#include "image_reference.h"
#include "username_cache.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

class HThreadPool;

namespace magpie {

struct EnricherSettings {
    int lookup_threads = 4;
    bool include_link_previews = true;
};

class MetadataEnricher {
  public:
    /**
     * @param api Upstream API used for author lookups (must be thread-safe)
     * @param cache Username cache shared for the duration of one walk
     */
    MetadataEnricher(FeedApi& api, UsernameCache& cache, EnricherSettings settings = {});
    ~MetadataEnricher();

    MetadataEnricher(const MetadataEnricher&) = delete;
    MetadataEnricher& operator=(const MetadataEnricher&) = delete;

    /**
     * @brief Extract image references from a page
     *
     * Items are visited in page order; within an item, attached photos come
     * first (in media-key order), then link-preview images. Media keys with
     * no side-table entry are skipped.
     *
     * @throws MagpieException API_INVARIANT on a contract violation,
     *         TRANSPORT if an author lookup fails
     */
    std::vector<ImageReference> process_page(const LikedPage& page);

    /// Author lookups issued over the network so far
    size_t lookups_issued() const {
        return lookups_issued_.load();
    }

  private:
    void resolve_authors(const std::vector<UserId>& author_ids);

    FeedApi& api_;
    UsernameCache& cache_;
    EnricherSettings settings_;
    std::unique_ptr<HThreadPool> pool_;
    std::atomic<size_t> lookups_issued_{0};
};

/**
 * @brief Last path segment of a URL
 * @return Empty string if the URL has no path or ends in '/'
 */
std::string last_path_segment(const std::string& url);

/**
 * @brief Value of a query parameter, or an empty string if absent
 */
std::string query_param(const std::string& url, const std::string& key);

} // namespace magpie
