// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "feed_types.h"

#include "json_utils.h"
#include "magpie_error.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace magpie {

namespace {

[[noreturn]] void malformed(const char* method, const std::string& what) {
    spdlog::error("[API] {}: malformed response: {}", method, what);
    throw MagpieException(MagpieError::transport(method, "Malformed response: " + what));
}

std::vector<MediaKey> decode_media_keys(const json& attachments) {
    std::vector<MediaKey> keys;
    const auto& arr = attachments["media_keys"];
    if (!arr.is_array()) {
        malformed("get_liked_tweets", "attachments.media_keys is not an array");
    }
    keys.reserve(arr.size());
    for (const auto& k : arr) {
        if (k.is_string()) {
            keys.push_back(k.get<std::string>());
        }
    }
    return keys;
}

std::vector<UrlEntity> decode_url_entities(const json& entities) {
    std::vector<UrlEntity> out;
    if (!entities.is_object() || !entities.contains("urls") || !entities["urls"].is_array()) {
        return out;
    }

    for (const auto& u : entities["urls"]) {
        UrlEntity entity;
        entity.url = json_util::safe_string(u, "expanded_url", json_util::safe_string(u, "url"));
        if (u.contains("images") && u["images"].is_array()) {
            for (const auto& img : u["images"]) {
                UrlImage image;
                image.url = json_util::safe_string(img, "url");
                image.width = json_util::safe_int(img, "width");
                image.height = json_util::safe_int(img, "height");
                if (!image.url.empty()) {
                    entity.images.push_back(std::move(image));
                }
            }
        }
        out.push_back(std::move(entity));
    }
    return out;
}

Item decode_item(const json& t) {
    if (!t.is_object()) {
        malformed("get_liked_tweets", "data entry is not an object");
    }

    Item item;
    item.id = json_util::safe_string(t, "id");
    if (item.id.empty()) {
        malformed("get_liked_tweets", "data entry has no id");
    }
    item.author_id = json_util::optional_string(t, "author_id");
    item.created_at = json_util::optional_string(t, "created_at");
    item.text = json_util::safe_string(t, "text");

    if (t.contains("attachments") && t["attachments"].is_object()) {
        item.has_attachments = true;
        const auto& attachments = t["attachments"];
        if (attachments.contains("media_keys")) {
            item.attachment_media_keys = decode_media_keys(attachments);
        }
    }

    if (t.contains("entities")) {
        item.urls = decode_url_entities(t["entities"]);
    }

    return item;
}

} // namespace

MediaKind parse_media_kind(const std::string& type) {
    if (type == "photo")
        return MediaKind::Photo;
    if (type == "video")
        return MediaKind::Video;
    if (type == "animated_gif")
        return MediaKind::AnimatedGif;
    return MediaKind::Other;
}

const char* media_kind_name(MediaKind kind) {
    switch (kind) {
    case MediaKind::Photo:
        return "photo";
    case MediaKind::Video:
        return "video";
    case MediaKind::AnimatedGif:
        return "animated_gif";
    case MediaKind::Other:
        return "other";
    }
    return "other";
}

User decode_user_response(const json& body, const char* method) {
    if (!body.contains("data") || !body["data"].is_object()) {
        malformed(method, "user response has no data object");
    }
    const auto& d = body["data"];

    User user;
    user.id = json_util::safe_string(d, "id");
    user.username = json_util::safe_string(d, "username");
    user.name = json_util::safe_string(d, "name");
    if (user.id.empty() || user.username.empty()) {
        malformed(method, "user record missing id or username");
    }
    return user;
}

LikedPage decode_liked_page(const json& body) {
    LikedPage page;

    if (body.contains("data") && !body["data"].is_null()) {
        if (!body["data"].is_array()) {
            malformed("get_liked_tweets", "data is not an array");
        }
        std::vector<Item> items;
        items.reserve(body["data"].size());
        for (const auto& t : body["data"]) {
            items.push_back(decode_item(t));
        }
        page.data = std::move(items);
    }

    if (body.contains("includes") && body["includes"].is_object()) {
        Includes includes;
        const auto& inc = body["includes"];
        if (inc.contains("media") && inc["media"].is_array()) {
            std::vector<Media> media;
            for (const auto& m : inc["media"]) {
                Media entry;
                entry.media_key = json_util::safe_string(m, "media_key");
                entry.kind = parse_media_kind(json_util::safe_string(m, "type"));
                entry.url = json_util::optional_string(m, "url");
                if (!entry.media_key.empty()) {
                    media.push_back(std::move(entry));
                }
            }
            includes.media = std::move(media);
        }
        page.includes = std::move(includes);
    }

    if (body.contains("meta") && body["meta"].is_object()) {
        const auto& meta = body["meta"];
        page.next_token = json_util::optional_string(meta, "next_token");
        page.result_count = json_util::safe_int(meta, "result_count");
    }

    return page;
}

} // namespace magpie
