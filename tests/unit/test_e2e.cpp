// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_e2e.cpp
 * @brief Full pipeline against a local provider stand-in
 *
 * Walker, enricher and downloader run over real HTTP (libhv client and
 * server). Only the OAuth2 step is skipped; the bearer token is canned.
 */

#include "../local_http_fixture.h"
#include "bounded_downloader.h"
#include "feed_walker.h"
#include "http_fetcher.h"
#include "metadata_enricher.h"
#include "twitter_api_client.h"
#include "username_cache.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace magpie;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class PipelineFixture {
  public:
    PipelineFixture()
        : out_dir(fs::temp_directory_path() / ("magpie_e2e_" + std::to_string(getpid()))) {
        fs::remove_all(out_dir);
    }

    ~PipelineFixture() {
        server.stop();
        std::error_code ec;
        fs::remove_all(out_dir, ec);
    }

  protected:
    LocalHttpServer server;
    fs::path out_dir;

    /// Register the provider routes. Page bodies reference media on the same server.
    void serve_provider() {
        server.serve("/2/users/me", R"({"data":{"id":"1","username":"me","name":"Me"}})");
        server.serve("/2/users/100", R"({"data":{"id":"100","username":"alice","name":"Alice"}})");
        server.serve("/2/users/200", R"({"data":{"id":"200","username":"bob","name":"Bob"}})");

        server.handle("/2/users/1/liked_tweets", [this](HttpRequest* req, HttpResponse* resp) {
            std::string token = req->GetParam("pagination_token");
            resp->content_type = APPLICATION_JSON;
            if (token.empty()) {
                resp->body = page_one();
            } else if (token == "p2") {
                resp->body = page_two();
            } else {
                resp->body = R"({"errors":[{"detail":"bad token"}]})";
                return 400;
            }
            return 200;
        });

        server.serve("/media/A.jpg", "jpeg-A", IMAGE_JPEG);
        server.serve("/media/B.jpg", "jpeg-B", IMAGE_JPEG);
        server.serve("/media/C.jpg", "jpeg-C", IMAGE_JPEG);
        server.start();
    }

    std::string media(const std::string& key, const std::string& name) const {
        return R"({"media_key":")" + key + R"(","type":"photo","url":")" +
               server.url("/media/" + name) + R"("})";
    }

    std::string page_one() const {
        return R"({"data":[)"
               R"({"id":"10","author_id":"100","created_at":"2023-05-01T12:00:00.000Z","text":"a",)"
               R"("attachments":{"media_keys":["3_A"]}},)"
               R"({"id":"11","author_id":"200","created_at":"2023-05-02T12:00:00.000Z","text":"b",)"
               R"("attachments":{"media_keys":["3_B"]}},)"
               R"({"id":"12","author_id":"100","created_at":"2023-05-03T12:00:00.000Z","text":"c"})"
               R"(],"includes":{"media":[)" +
               media("3_A", "A.jpg") + "," + media("3_B", "B.jpg") +
               R"(]},"meta":{"result_count":3,"next_token":"p2"}})";
    }

    std::string page_two() const {
        return R"({"data":[)"
               R"({"id":"13","author_id":"200","created_at":"2023-05-04T12:00:00.000Z","text":"d",)"
               R"("attachments":{"media_keys":["3_C"]}})"
               R"(],"includes":{"media":[)" +
               media("3_C", "C.jpg") + R"(]},"meta":{"result_count":1}})";
    }

    std::vector<ImageReference> collect(TwitterApiClient& api, UsernameCache& cache) {
        User me = api.get_me();
        FeedWalker walker(api, me.id);
        MetadataEnricher enricher(api, cache, EnricherSettings{2, true});

        std::vector<ImageReference> refs;
        while (auto page = walker.next().get()) {
            auto found = enricher.process_page(*page);
            refs.insert(refs.end(), found.begin(), found.end());
        }
        return refs;
    }
};

} // namespace

TEST_CASE_METHOD(PipelineFixture, "Pipeline: two pages of likes end to end", "[e2e]") {
    serve_provider();

    ApiSettings settings;
    settings.base_url = server.url("/2");
    settings.timeout_sec = 5;
    TwitterApiClient api(RedactedString("canned-token"), settings);
    UsernameCache cache;

    auto refs = collect(api, cache);

    REQUIRE(refs.size() == 3);
    CHECK(refs[0].author == "alice");
    CHECK(refs[1].author == "bob");
    CHECK(refs[2].author == "bob");
    CHECK(refs[2].item_id == "13");
    REQUIRE(server.hits("/2/users/1/liked_tweets") == 2);
    // bob is looked up once and served from the cache on page two
    CHECK(server.hits("/2/users/200") == 1);
    CHECK(cache.hits() >= 1);

    LibhvFetcher fetcher(5);
    BoundedDownloader downloader(fetcher);
    auto outcomes = downloader.download_all(refs, 2, out_dir.string());

    REQUIRE(outcomes.size() == 3);
    std::set<std::string> names;
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.ok());
        names.insert(outcome.reference.filename());
    }
    REQUIRE(names.size() == 3);

    CHECK(read_file(out_dir / "2023-05-01T12:00:00.000Z alice 10 A.jpg") == "jpeg-A");
    CHECK(read_file(out_dir / "2023-05-02T12:00:00.000Z bob 11 B.jpg") == "jpeg-B");
    CHECK(read_file(out_dir / "2023-05-04T12:00:00.000Z bob 13 C.jpg") == "jpeg-C");

    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(out_dir)) {
        (void)entry;
        ++files;
    }
    CHECK(files == 3);
}

TEST_CASE_METHOD(PipelineFixture, "Pipeline: missing media is a per-item failure", "[e2e]") {
    serve_provider();

    ApiSettings settings;
    settings.base_url = server.url("/2");
    TwitterApiClient api(RedactedString("canned-token"), settings);
    UsernameCache cache;
    auto refs = collect(api, cache);
    REQUIRE(refs.size() == 3);

    // Point one reference at a path the server does not know
    refs[1].url = server.url("/media/gone.jpg");

    LibhvFetcher fetcher(5);
    BoundedDownloader downloader(fetcher);
    auto outcomes = downloader.download_all(refs, 3, out_dir.string());

    REQUIRE(outcomes[0].ok());
    REQUIRE_FALSE(outcomes[1].ok());
    CHECK(outcomes[1].error->type == MagpieErrorType::TRANSPORT);
    CHECK(outcomes[1].error->code == 404);
    REQUIRE(outcomes[2].ok());
    CHECK_FALSE(fs::exists(out_dir / refs[1].filename()));
}

TEST_CASE_METHOD(PipelineFixture, "Pipeline: output path collision stops before downloading",
                 "[e2e]") {
    serve_provider();

    ApiSettings settings;
    settings.base_url = server.url("/2");
    TwitterApiClient api(RedactedString("canned-token"), settings);
    UsernameCache cache;
    auto refs = collect(api, cache);

    fs::create_directories(out_dir);
    fs::path blocker = out_dir / "file";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    LibhvFetcher fetcher(5);
    BoundedDownloader downloader(fetcher);
    REQUIRE_THROWS_AS(downloader.download_all(refs, 2, blocker.string()), MagpieException);
    CHECK(server.hits("/media/A.jpg") == 0);
    CHECK(server.hits("/media/B.jpg") == 0);
    CHECK(server.hits("/media/C.jpg") == 0);
}
