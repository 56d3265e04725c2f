// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file feed_types.h
 * @brief Typed views of the provider's liked-items responses
 *
 * Fields the provider only returns for particular request shapes are kept
 * optional here. Decoding never fails on their absence; the enricher decides
 * which absences are contract violations for the shape it requested.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace magpie {

using UserId = std::string;
using MediaKey = std::string;

/**
 * @brief Account record returned by the user lookup endpoints
 */
struct User {
    UserId id;
    std::string username; ///< Handle, without '@'
    std::string name;     ///< Display name
};

enum class MediaKind { Photo, Video, AnimatedGif, Other };

/**
 * @brief Entry of the page's `includes.media` side table
 */
struct Media {
    MediaKey media_key;
    MediaKind kind = MediaKind::Other;
    std::optional<std::string> url; ///< Present for photos when media.fields=url
};

/**
 * @brief Preview image attached to a URL entity (link card)
 */
struct UrlImage {
    std::string url;
    int width = 0;
    int height = 0;
};

struct UrlEntity {
    std::string url;
    std::vector<UrlImage> images;
};

/**
 * @brief One liked item (tweet)
 */
struct Item {
    std::string id;
    std::optional<UserId> author_id;
    std::optional<std::string> created_at; ///< Raw ISO-8601 timestamp
    std::string text;

    bool has_attachments = false;
    std::optional<std::vector<MediaKey>> attachment_media_keys;

    std::vector<UrlEntity> urls;
};

struct Includes {
    std::optional<std::vector<Media>> media;
};

/**
 * @brief One page of the liked-items feed
 *
 * `next_token` absent is the terminal condition. `data` absent is how the
 * provider reports an empty final page.
 */
struct LikedPage {
    std::optional<std::vector<Item>> data;
    std::optional<Includes> includes;
    std::optional<std::string> next_token;
    int result_count = 0;
};

/// Map provider media "type" string to MediaKind
MediaKind parse_media_kind(const std::string& type);

/// Inverse of parse_media_kind (for logging)
const char* media_kind_name(MediaKind kind);

/**
 * @brief Decode a user lookup response body ({"data": {...}})
 *
 * @throws MagpieException (TRANSPORT) if `data` is missing or malformed
 */
User decode_user_response(const nlohmann::json& body, const char* method);

/**
 * @brief Decode a liked-items page body
 *
 * Structural type errors (a string where an array is expected) are TRANSPORT
 * errors. Missing optional members are left empty.
 */
LikedPage decode_liked_page(const nlohmann::json& body);

} // namespace magpie
