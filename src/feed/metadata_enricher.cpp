// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "metadata_enricher.h"

#include "hv/hthreadpool.h"
#include "hv/hurl.h"
#include "magpie_error.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <future>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace magpie {

namespace {

constexpr const char* METHOD = "process_page";
constexpr const char* DEFAULT_PREVIEW_FORMAT = "jpg";

[[noreturn]] void invariant(const std::string& message) {
    spdlog::error("[Enricher] Contract violation: {}", message);
    throw MagpieException(MagpieError::api_invariant(METHOD, message));
}

/// Item fields resolved during validation
struct ValidItem {
    const Item* item;
    format::Timestamp created_at;
};

} // namespace

// ============================================================================
// URL helpers
// ============================================================================

std::string last_path_segment(const std::string& url) {
    HUrl parsed;
    if (!parsed.parse(url)) {
        return "";
    }
    const std::string& path = parsed.path;
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string query_param(const std::string& url, const std::string& key) {
    HUrl parsed;
    if (!parsed.parse(url)) {
        return "";
    }
    const std::string& query = parsed.query;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (HUrl::unescape(pair.substr(0, eq)) == key) {
            return eq == std::string::npos ? "" : HUrl::unescape(pair.substr(eq + 1));
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return "";
}

// ============================================================================
// MetadataEnricher
// ============================================================================

MetadataEnricher::MetadataEnricher(FeedApi& api, UsernameCache& cache, EnricherSettings settings)
    : api_(api), cache_(cache), settings_(settings) {
    int threads = std::max(1, settings_.lookup_threads);
    pool_ = std::make_unique<HThreadPool>(threads, threads);
    pool_->start(threads);
}

MetadataEnricher::~MetadataEnricher() {
    if (pool_) {
        pool_->wait();
        pool_->stop();
    }
}

void MetadataEnricher::resolve_authors(const std::vector<UserId>& author_ids) {
    std::vector<std::pair<UserId, std::future<User>>> pending;
    for (const auto& id : author_ids) {
        if (cache_.get(id)) {
            continue;
        }
        lookups_issued_.fetch_add(1);
        pending.emplace_back(id, pool_->commit([this, id]() { return api_.get_user(id); }));
    }

    if (!pending.empty()) {
        spdlog::debug("[Enricher] Looking up {} author(s)", pending.size());
    }

    // Every lookup finishes before the first failure is reported
    std::optional<MagpieException> first_failure;
    for (auto& [id, future] : pending) {
        try {
            User user = future.get();
            std::string stored = cache_.insert(id, user.username);
            spdlog::trace("[Enricher] Author {} -> {}", id, stored);
        } catch (const MagpieException& e) {
            if (!first_failure) {
                first_failure = e.with_context("Looking up author " + id);
            }
        }
    }
    if (first_failure) {
        throw *first_failure;
    }
}

std::vector<ImageReference> MetadataEnricher::process_page(const LikedPage& page) {
    std::vector<ImageReference> refs;
    if (!page.data) {
        return refs;
    }
    const auto& items = *page.data;

    // -- validate the whole page before any network call -----------------------
    std::vector<ValidItem> valid;
    valid.reserve(items.size());
    bool references_media = false;
    for (const auto& item : items) {
        if (!item.author_id || item.author_id->empty()) {
            invariant("item " + item.id + " has no author_id");
        }
        if (!item.created_at) {
            invariant("item " + item.id + " has no created_at");
        }
        auto created = format::parse_iso8601(*item.created_at);
        if (!created) {
            invariant("item " + item.id + " has unparseable created_at '" + *item.created_at +
                      "'");
        }
        if (item.has_attachments && !item.attachment_media_keys) {
            invariant("item " + item.id + " has attachments without media_keys");
        }
        if (item.attachment_media_keys && !item.attachment_media_keys->empty()) {
            references_media = true;
        }
        valid.push_back({&item, *created});
    }

    std::unordered_map<MediaKey, const Media*> media_by_key;
    if (references_media) {
        if (!page.includes || !page.includes->media) {
            invariant("page references media but has no includes.media table");
        }
        for (const auto& media : *page.includes->media) {
            media_by_key.emplace(media.media_key, &media);
        }
    }

    // -- collect references (author filled in after lookups) ------------------
    for (const auto& v : valid) {
        const Item& item = *v.item;
        auto add = [&](std::string internal_filename, std::string url) {
            refs.push_back(ImageReference{*item.author_id, item.id, v.created_at,
                                          std::move(internal_filename), std::move(url)});
        };

        if (item.attachment_media_keys) {
            for (const auto& key : *item.attachment_media_keys) {
                auto it = media_by_key.find(key);
                if (it == media_by_key.end()) {
                    spdlog::debug("[Enricher] Item {}: media key {} not in includes, skipping",
                                  item.id, key);
                    continue;
                }
                const Media& media = *it->second;
                if (media.kind != MediaKind::Photo) {
                    spdlog::trace("[Enricher] Item {}: skipping {} media {}", item.id,
                                  media_kind_name(media.kind), key);
                    continue;
                }
                if (!media.url || media.url->empty()) {
                    invariant("photo " + key + " on item " + item.id + " has no url");
                }
                std::string segment = last_path_segment(*media.url);
                if (segment.empty()) {
                    invariant("photo " + key + " url '" + *media.url + "' has no path segment");
                }
                add(segment, *media.url);
            }
        }

        if (settings_.include_link_previews) {
            int previews = 0;
            for (const auto& entity : item.urls) {
                if (entity.images.empty()) {
                    continue;
                }
                auto tallest = std::max_element(
                    entity.images.begin(), entity.images.end(),
                    [](const UrlImage& a, const UrlImage& b) { return a.height < b.height; });
                if (tallest->url.empty()) {
                    continue;
                }
                std::string fmt = query_param(tallest->url, "format");
                if (fmt.empty()) {
                    fmt = DEFAULT_PREVIEW_FORMAT;
                }
                ++previews;
                std::string name = previews == 1
                                       ? "url-link." + fmt
                                       : "url-link-" + std::to_string(previews) + "." + fmt;
                add(name, tallest->url);
            }
        }
    }

    // -- resolve every author on the page -------------------------------------
    std::vector<UserId> authors;
    std::unordered_set<UserId> seen;
    for (const auto& v : valid) {
        if (seen.insert(*v.item->author_id).second) {
            authors.push_back(*v.item->author_id);
        }
    }
    resolve_authors(authors);

    for (auto& ref : refs) {
        auto name = cache_.peek(ref.author);
        if (!name) {
            // resolve_authors either filled the cache or threw
            invariant("author " + ref.author + " missing from cache after lookup");
        }
        ref.author = *name;
    }

    spdlog::debug("[Enricher] Page: {} items, {} images, {} authors", items.size(), refs.size(),
                  authors.size());
    return refs;
}

} // namespace magpie
