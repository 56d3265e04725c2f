// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../local_http_fixture.h"
#include "twitter_api_client.h"

#include <catch2/catch_test_macros.hpp>

using namespace magpie;

namespace {

ApiSettings settings_for(const LocalHttpServer& server) {
    ApiSettings settings;
    settings.base_url = server.url("/2/");
    settings.timeout_sec = 5;
    settings.page_size = 50;
    return settings;
}

} // namespace

TEST_CASE("TwitterApiClient::build_url", "[api]") {
    TwitterApiClient api(RedactedString("token"), ApiSettings{"https://api.example.com/2//", 30, 100});

    REQUIRE(api.build_url("/users/me") == "https://api.example.com/2/users/me");
    REQUIRE(api.build_url("/x", {{"b", "two words"}, {"a", "id,text"}}) ==
            "https://api.example.com/2/x?a=id,text&b=two%20words");
}

TEST_CASE("TwitterApiClient: user lookups", "[api]") {
    LocalHttpServer server;
    std::string seen_auth;
    std::string seen_agent;
    server.handle("/2/users/me", [&](HttpRequest* req, HttpResponse* resp) {
        seen_auth = req->GetHeader("Authorization");
        seen_agent = req->GetHeader("User-Agent");
        resp->content_type = APPLICATION_JSON;
        resp->body = R"({"data":{"id":"1","username":"me","name":"Me"}})";
        return 200;
    });
    server.serve("/2/users/by/username/someone",
                 R"({"data":{"id":"77","username":"someone","name":"Some One"}})");
    server.serve("/2/users/404", R"({"errors":[{"detail":"Could not find user with id: [404]."}]})",
                 APPLICATION_JSON, 404);
    server.serve("/2/users/bad", R"({"data":"nope"})");
    server.start();

    TwitterApiClient api(RedactedString("tok-123"), settings_for(server));

    User me = api.get_me();
    REQUIRE(me.id == "1");
    REQUIRE(me.username == "me");
    REQUIRE(seen_auth == "Bearer tok-123");
    REQUIRE(seen_agent.rfind("magpie/", 0) == 0);

    User other = api.get_user_by_username("someone");
    REQUIRE(other.id == "77");
    REQUIRE(other.name == "Some One");

    try {
        api.get_user("404");
        FAIL("expected MagpieException");
    } catch (const MagpieException& e) {
        REQUIRE(e.type() == MagpieErrorType::TRANSPORT);
        REQUIRE(e.error().code == 404);
        REQUIRE(e.error().message.find("Could not find user") != std::string::npos);
    }

    REQUIRE_THROWS_AS(api.get_user("bad"), MagpieException);
}

TEST_CASE("TwitterApiClient: liked items request shape", "[api]") {
    LocalHttpServer server;
    std::map<std::string, std::string> params;
    server.handle("/2/users/1/liked_tweets", [&](HttpRequest* req, HttpResponse* resp) {
        for (const char* key : {"tweet.fields", "expansions", "media.fields", "max_results",
                                "pagination_token"}) {
            params[key] = req->GetParam(key);
        }
        resp->content_type = APPLICATION_JSON;
        resp->body = R"({
            "data": [{
                "id": "10", "author_id": "5", "created_at": "2023-05-01T12:00:00.000Z",
                "text": "hello",
                "attachments": {"media_keys": ["3_1"]},
                "entities": {"urls": [{"expanded_url": "https://example.com",
                    "images": [{"url": "https://pbs.twimg.com/news_img/1?format=png", "width": 100, "height": 50}]}]}
            }],
            "includes": {"media": [{"media_key": "3_1", "type": "photo", "url": "https://pbs.twimg.com/media/A.jpg"}]},
            "meta": {"result_count": 1, "next_token": "next-1"}
        })";
        return 200;
    });
    server.start();

    TwitterApiClient api(RedactedString("tok"), settings_for(server));
    LikedPage page = api.get_liked_tweets("1", std::string("cur-0"));

    CHECK(params["tweet.fields"] == "id,attachments,text,author_id,entities,created_at");
    CHECK(params["expansions"] == "attachments.media_keys");
    CHECK(params["media.fields"] == "type,url");
    CHECK(params["max_results"] == "50");
    CHECK(params["pagination_token"] == "cur-0");

    REQUIRE(page.data.has_value());
    REQUIRE(page.data->size() == 1);
    const Item& item = page.data->front();
    CHECK(item.author_id == std::optional<std::string>("5"));
    CHECK(item.attachment_media_keys == std::optional<std::vector<MediaKey>>({"3_1"}));
    REQUIRE(item.urls.size() == 1);
    CHECK(item.urls[0].images[0].height == 50);
    REQUIRE(page.includes->media->size() == 1);
    CHECK(page.includes->media->front().kind == MediaKind::Photo);
    CHECK(page.next_token == std::optional<std::string>("next-1"));
    CHECK(page.result_count == 1);
}

TEST_CASE("TwitterApiClient: first page has no pagination token", "[api]") {
    LocalHttpServer server;
    bool had_token = true;
    server.handle("/2/users/1/liked_tweets", [&](HttpRequest* req, HttpResponse* resp) {
        had_token = req->query_params.count("pagination_token") > 0;
        resp->content_type = APPLICATION_JSON;
        resp->body = R"({"meta":{"result_count":0}})";
        return 200;
    });
    server.start();

    TwitterApiClient api(RedactedString("tok"), settings_for(server));
    LikedPage page = api.get_liked_tweets("1", std::nullopt);

    REQUIRE_FALSE(had_token);
    REQUIRE_FALSE(page.data.has_value());
    REQUIRE_FALSE(page.next_token.has_value());
}
