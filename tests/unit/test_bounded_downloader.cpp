// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../mocks/mock_http_fetcher.h"
#include "bounded_downloader.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class DownloaderFixture {
  public:
    DownloaderFixture()
        : dir(fs::temp_directory_path() / ("magpie_download_test_" + std::to_string(getpid()))) {
        fs::remove_all(dir);
    }

    ~DownloaderFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

  protected:
    fs::path dir;

    static std::vector<ImageReference> refs(int n) {
        std::vector<ImageReference> out;
        auto base = *format::parse_iso8601("2023-05-01T00:00:00Z");
        for (int i = 0; i < n; ++i) {
            std::string id = std::to_string(i);
            out.push_back(ImageReference{"alice", id, base + std::chrono::seconds(i),
                                         "img" + id + ".jpg",
                                         "https://pbs.twimg.com/media/img" + id + ".jpg"});
        }
        return out;
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    size_t count_files(const std::string& suffix = "") const {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            std::string name = entry.path().filename().string();
            if (suffix.empty() || (name.size() >= suffix.size() &&
                                   name.compare(name.size() - suffix.size(), suffix.size(),
                                                suffix) == 0)) {
                ++n;
            }
        }
        return n;
    }
};

} // namespace

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: writes every file", "[downloader]") {
    MockHttpFetcher fetcher;
    fetcher.serve("https://pbs.twimg.com/media/img1.jpg", "\x89PNG-one");
    BoundedDownloader downloader(fetcher);

    auto input = refs(5);
    auto outcomes = downloader.download_all(input, 2, dir.string());

    REQUIRE(outcomes.size() == 5);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        CAPTURE(i);
        REQUIRE(outcomes[i].ok());
        // Outcomes line up with the input order
        REQUIRE(outcomes[i].reference.item_id == input[i].item_id);
        REQUIRE(fs::exists(dir / input[i].filename()));
    }
    REQUIRE(read(dir / input[1].filename()) == "\x89PNG-one");
    REQUIRE(outcomes[1].bytes == 8);
    REQUIRE(count_files(".part") == 0);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: never exceeds the concurrency limit",
                 "[downloader]") {
    MockHttpFetcher fetcher(20ms);
    BoundedDownloader downloader(fetcher);

    int limit = GENERATE(1, 3, 8);
    CAPTURE(limit);
    auto outcomes = downloader.download_all(refs(24), limit, dir.string());

    REQUIRE(outcomes.size() == 24);
    REQUIRE(fetcher.max_concurrent() <= limit);
    REQUIRE(downloader.peak_in_flight() <= limit);
    REQUIRE(fetcher.calls() == 24);
    REQUIRE(downloader.in_flight() == 0);
    if (limit > 1) {
        // With 24 slow items the pool does overlap them
        REQUIRE(downloader.peak_in_flight() > 1);
    }
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: failures are per item", "[downloader]") {
    MockHttpFetcher fetcher;
    fetcher.fail("https://pbs.twimg.com/media/img2.jpg");
    BoundedDownloader downloader(fetcher);

    auto input = refs(4);
    auto outcomes = downloader.download_all(input, 4, dir.string());

    REQUIRE(outcomes.size() == 4);
    REQUIRE(outcomes[0].ok());
    REQUIRE(outcomes[1].ok());
    REQUIRE(outcomes[3].ok());

    REQUIRE_FALSE(outcomes[2].ok());
    REQUIRE(outcomes[2].error->type == MagpieErrorType::TRANSPORT);
    REQUIRE(outcomes[2].error->chain().front() ==
            "Fetching https://pbs.twimg.com/media/img2.jpg");
    REQUIRE_FALSE(fs::exists(dir / input[2].filename()));
    REQUIRE(count_files() == 3);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: unexpected fetcher errors stay per item",
                 "[downloader]") {
    MockHttpFetcher fetcher;
    fetcher.fail_unexpectedly("https://pbs.twimg.com/media/img1.jpg");
    BoundedDownloader downloader(fetcher);

    auto input = refs(3);
    std::vector<DownloadOutcome> outcomes;
    REQUIRE_NOTHROW(outcomes = downloader.download_all(input, 2, dir.string()));

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].ok());
    REQUIRE(outcomes[2].ok());

    REQUIRE_FALSE(outcomes[1].ok());
    REQUIRE(outcomes[1].error->type == MagpieErrorType::TRANSPORT);
    REQUIRE(outcomes[1].error->chain().front() ==
            "Fetching https://pbs.twimg.com/media/img1.jpg");
    REQUIRE_FALSE(fs::exists(dir / input[1].filename()));

    // The failed fetch released its slot
    REQUIRE(downloader.in_flight() == 0);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: unwritable target is LOCAL_IO",
                 "[downloader]") {
    MockHttpFetcher fetcher;
    BoundedDownloader downloader(fetcher);
    auto input = refs(2);

    // A directory squatting on the .part path makes the write fail
    fs::create_directories(dir / (input[0].filename() + ".part"));

    auto outcomes = downloader.download_all(input, 2, dir.string());

    REQUIRE_FALSE(outcomes[0].ok());
    REQUIRE(outcomes[0].error->type == MagpieErrorType::LOCAL_IO);
    REQUIRE(outcomes[1].ok());
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: setup failure before any fetch",
                 "[downloader][e2e]") {
    MockHttpFetcher fetcher;
    BoundedDownloader downloader(fetcher);

    // Output path collides with a regular file
    fs::create_directories(dir);
    fs::path blocker = dir / "not-a-dir";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    try {
        downloader.download_all(refs(3), 2, blocker.string());
        FAIL("expected MagpieException");
    } catch (const MagpieException& e) {
        REQUIRE(e.type() == MagpieErrorType::SETUP);
    }
    REQUIRE(fetcher.calls() == 0);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: creates nested output directories",
                 "[downloader]") {
    MockHttpFetcher fetcher;
    BoundedDownloader downloader(fetcher);
    fs::path nested = dir / "a" / "b";

    auto outcomes = downloader.download_all(refs(1), 1, nested.string());

    REQUIRE(outcomes.front().ok());
    REQUIRE(fs::is_directory(nested));
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: cancellation", "[downloader]") {
    MockHttpFetcher fetcher;
    CancellationToken cancel;
    BoundedDownloader downloader(fetcher, cancel);
    cancel.request();

    auto outcomes = downloader.download_all(refs(3), 2, dir.string());

    REQUIRE(outcomes.size() == 3);
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.error.has_value());
        REQUIRE(outcome.error->type == MagpieErrorType::CANCELLED);
    }
    REQUIRE(fetcher.calls() == 0);
    REQUIRE(count_files() == 0);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: progress callback sees every item",
                 "[downloader]") {
    MockHttpFetcher fetcher;
    BoundedDownloader downloader(fetcher);
    std::atomic<size_t> calls{0};
    std::atomic<size_t> last_total{0};

    downloader.download_all(refs(6), 3, dir.string(),
                            [&](const DownloadOutcome&, size_t, size_t total) {
                                calls++;
                                last_total = total;
                            });

    REQUIRE(calls == 6);
    REQUIRE(last_total == 6);
}

TEST_CASE_METHOD(DownloaderFixture, "BoundedDownloader: empty input", "[downloader]") {
    MockHttpFetcher fetcher;
    BoundedDownloader downloader(fetcher);

    REQUIRE(downloader.download_all({}, 4, dir.string()).empty());
    REQUIRE(fs::is_directory(dir));
}
