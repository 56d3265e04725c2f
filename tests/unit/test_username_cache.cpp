// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "username_cache.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace magpie;

TEST_CASE("UsernameCache: hit and miss counting", "[feed][cache]") {
    UsernameCache cache;

    REQUIRE_FALSE(cache.get("42").has_value());
    REQUIRE(cache.misses() == 1);

    cache.insert("42", "alice");
    REQUIRE(cache.get("42") == std::optional<std::string>("alice"));
    REQUIRE(cache.get("42") == std::optional<std::string>("alice"));
    REQUIRE(cache.hits() == 2);
    REQUIRE(cache.misses() == 1);

    // peek() leaves the counters alone
    REQUIRE(cache.peek("42") == std::optional<std::string>("alice"));
    REQUIRE_FALSE(cache.peek("7").has_value());
    REQUIRE(cache.hits() == 2);
    REQUIRE(cache.misses() == 1);
}

TEST_CASE("UsernameCache: first write wins", "[feed][cache]") {
    UsernameCache cache;

    REQUIRE(cache.insert("42", "alice") == "alice");
    REQUIRE(cache.insert("42", "renamed") == "alice");
    REQUIRE(cache.peek("42") == std::optional<std::string>("alice"));
    REQUIRE(cache.size() == 1);
}

TEST_CASE("UsernameCache: concurrent inserts and reads", "[feed][cache]") {
    UsernameCache cache;
    std::atomic<int> unexpected_misses{0};
    std::vector<std::thread> threads;

    // Catch2 assertions are not thread-safe; count on the workers, assert after
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &unexpected_misses, t]() {
            for (int i = 0; i < 500; ++i) {
                std::string id = std::to_string(i);
                cache.insert(id, "user" + id + "-" + std::to_string(t));
                if (!cache.get(id)) {
                    unexpected_misses++;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(unexpected_misses == 0);
    REQUIRE(cache.size() == 500);
    REQUIRE(cache.hits() == 8u * 500u);
    for (int i = 0; i < 500; ++i) {
        auto name = cache.peek(std::to_string(i));
        REQUIRE(name.has_value());
        REQUIRE(name->rfind("user" + std::to_string(i) + "-", 0) == 0);
    }
}
