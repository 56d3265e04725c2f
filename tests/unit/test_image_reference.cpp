// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "image_reference.h"

#include <catch2/catch_test_macros.hpp>

#include <random>
#include <set>
#include <tuple>

using namespace magpie;

namespace {

format::Timestamp at(const char* iso) {
    auto ts = format::parse_iso8601(iso);
    REQUIRE(ts.has_value());
    return *ts;
}

} // namespace

TEST_CASE("ImageReference::filename: composite layout", "[feed][filename]") {
    ImageReference ref{"alice", "1650000000000000000", at("2022-04-15T10:20:30.000Z"),
                       "FQabc.jpg", "https://pbs.twimg.com/media/FQabc.jpg"};

    REQUIRE(ref.filename() == "2022-04-15T10:20:30.000Z alice 1650000000000000000 FQabc.jpg");
}

TEST_CASE("ImageReference::filename: separators inside components are escaped",
          "[feed][filename]") {
    ImageReference ref{"a b", "1/2", at("2022-04-15T10:20:30Z"), "100%.png", ""};

    std::string name = ref.filename();
    REQUIRE(name == "2022-04-15T10:20:30.000Z a%20b 1%2F2 100%25.png");
    REQUIRE(name.find('/') == std::string::npos);
}

TEST_CASE("ImageReference::filename: sub-millisecond timestamps stay distinct",
          "[feed][filename]") {
    ImageReference first{"alice", "10", at("2023-01-01T00:00:00.0001Z"), "A.jpg", ""};
    ImageReference second{"alice", "10", at("2023-01-01T00:00:00.0002Z"), "A.jpg", ""};

    REQUIRE(first.filename() == "2023-01-01T00:00:00.000100Z alice 10 A.jpg");
    REQUIRE(second.filename() == "2023-01-01T00:00:00.000200Z alice 10 A.jpg");
}

TEST_CASE("ImageReference::filename: leap second cannot alias the next midnight",
          "[feed][filename]") {
    // The leap second never becomes a timestamp, so it cannot share a name
    // with 2017-01-01T00:00:00Z
    REQUIRE_FALSE(format::parse_iso8601("2016-12-31T23:59:60Z").has_value());

    ImageReference midnight{"alice", "10", at("2017-01-01T00:00:00Z"), "A.jpg", ""};
    REQUIRE(midnight.filename() == "2017-01-01T00:00:00.000Z alice 10 A.jpg");
}

TEST_CASE("escape_filename_component", "[feed][filename]") {
    CHECK(escape_filename_component("plain_name-1.jpg") == "plain_name-1.jpg");
    CHECK(escape_filename_component("%20") == "%2520");
    CHECK(escape_filename_component(std::string("a\0b", 3)) == "a%00b");
    CHECK(escape_filename_component("") == "");
}

TEST_CASE("ImageReference::filename: no collisions across distinct references",
          "[feed][filename]") {
    // Alphabet heavy on the characters that act as separators
    const std::string alphabet = "ab1 %/_.";
    std::mt19937 rng(20240501);
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::uniform_int_distribution<size_t> length(0, 4);
    std::uniform_int_distribution<int64_t> ticks(0, 50);
    // Offsets at nanosecond, microsecond and millisecond granularity
    const int64_t scales[] = {1, 1000, 1000000};
    std::uniform_int_distribution<size_t> scale(0, 2);

    auto random_text = [&]() {
        std::string s;
        size_t n = length(rng);
        for (size_t i = 0; i < n; ++i) {
            s += alphabet[pick(rng)];
        }
        return s;
    };

    std::set<std::tuple<int64_t, std::string, std::string, std::string>> distinct;
    std::set<std::string> names;
    const auto base = at("2023-01-01T00:00:00Z");

    while (distinct.size() < 10000) {
        ImageReference ref;
        ref.created_at = base + std::chrono::nanoseconds(ticks(rng) * scales[scale(rng)]);
        ref.author = random_text();
        ref.item_id = random_text();
        ref.internal_filename = random_text();

        auto key = std::make_tuple(ref.created_at.time_since_epoch().count(), ref.author,
                                   ref.item_id, ref.internal_filename);
        if (distinct.insert(key).second) {
            names.insert(ref.filename());
        }
    }

    REQUIRE(names.size() == distinct.size());
}
