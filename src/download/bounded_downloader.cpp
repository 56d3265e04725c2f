// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bounded_downloader.h"

#include "hv/hthreadpool.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <system_error>

namespace fs = std::filesystem;

namespace magpie {

namespace {

constexpr const char* METHOD = "download_all";
constexpr const char* PART_SUFFIX = ".part";

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[Downloader] Could not remove partial file {}: {}", path.string(),
                     ec.message());
    }
}

} // namespace

void ensure_directory(const std::string& dest_dir) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec || !fs::is_directory(dest_dir)) {
        std::string reason = ec ? ec.message() : "path exists and is not a directory";
        spdlog::error("[Downloader] Cannot create output directory {}: {}", dest_dir, reason);
        throw MagpieException(MagpieError::setup(
            METHOD, "Failed to create output directory '" + dest_dir + "': " + reason));
    }
}

BoundedDownloader::BoundedDownloader(HttpFetcher& fetcher, CancellationToken cancel)
    : fetcher_(fetcher), cancel_(std::move(cancel)) {}

void BoundedDownloader::enter_flight() {
    int now = in_flight_.fetch_add(1) + 1;
    int peak = peak_in_flight_.load();
    while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {
    }
}

void BoundedDownloader::leave_flight() {
    in_flight_.fetch_sub(1);
}

DownloadOutcome BoundedDownloader::download_one(ImageReference ref, const std::string& dest_dir) {
    DownloadOutcome outcome{std::move(ref), std::nullopt, 0};
    const fs::path target = fs::path(dest_dir) / outcome.reference.filename();
    const fs::path part = fs::path(target.string() + PART_SUFFIX);

    if (cancel_.requested()) {
        outcome.error = MagpieError::cancelled(METHOD);
        return outcome;
    }

    // Counts this fetch in flight for the lifetime of the scope
    struct FlightGuard {
        BoundedDownloader& owner;
        explicit FlightGuard(BoundedDownloader& o) : owner(o) {
            owner.enter_flight();
        }
        ~FlightGuard() {
            owner.leave_flight();
        }
    };

    std::string body;
    try {
        FlightGuard guard(*this);
        body = fetcher_.fetch(outcome.reference.url);
    } catch (const MagpieException& e) {
        outcome.error = e.with_context("Fetching " + outcome.reference.url).error();
        return outcome;
    } catch (const std::exception& e) {
        spdlog::error("[Downloader] Unexpected error fetching {}: {}", outcome.reference.url,
                      e.what());
        outcome.error = MagpieException(MagpieError::transport("fetch", e.what()))
                            .with_context("Fetching " + outcome.reference.url)
                            .error();
        return outcome;
    }

    {
        std::ofstream file(part, std::ios::binary | std::ios::trunc);
        if (!file) {
            outcome.error = MagpieError::local_io(METHOD, "Cannot create " + part.string());
            return outcome;
        }
        file.write(body.data(), static_cast<std::streamsize>(body.size()));
        file.close();
        if (!file) {
            remove_quietly(part);
            outcome.error = MagpieError::local_io(METHOD, "Failed writing " + part.string());
            return outcome;
        }
    }

    if (cancel_.requested()) {
        remove_quietly(part);
        outcome.error = MagpieError::cancelled(METHOD);
        return outcome;
    }

    std::error_code ec;
    fs::rename(part, target, ec);
    if (ec) {
        remove_quietly(part);
        outcome.error = MagpieError::local_io(METHOD, "Cannot rename " + part.string() + " to " +
                                                          target.string() + ": " + ec.message());
        return outcome;
    }

    outcome.bytes = body.size();
    return outcome;
}

std::vector<DownloadOutcome> BoundedDownloader::download_all(std::vector<ImageReference> refs,
                                                             int limit,
                                                             const std::string& dest_dir,
                                                             ProgressCallback on_progress) {
    ensure_directory(dest_dir);

    limit = std::max(1, limit);
    in_flight_ = 0;
    peak_in_flight_ = 0;

    const size_t total = refs.size();
    std::vector<DownloadOutcome> outcomes;
    outcomes.reserve(total);
    if (total == 0) {
        return outcomes;
    }

    spdlog::info("[Downloader] Downloading {} images to {} ({} at a time)", total, dest_dir,
                 limit);

    std::atomic<size_t> finished{0};

    // The pool never grows past `limit` threads, which is the admission gate
    HThreadPool pool(limit, limit);
    pool.start(limit);

    std::vector<std::future<DownloadOutcome>> futures;
    futures.reserve(total);
    for (auto& ref : refs) {
        futures.push_back(pool.commit([this, &dest_dir, &finished, &on_progress, total,
                                       ref = std::move(ref)]() mutable {
            DownloadOutcome outcome = download_one(std::move(ref), dest_dir);
            if (outcome.ok()) {
                spdlog::debug("[Downloader] Saved {} ({} bytes)", outcome.reference.filename(),
                              outcome.bytes);
            } else {
                spdlog::warn("[Downloader] {} failed: {}", outcome.reference.url,
                             outcome.error->message);
            }
            size_t done = finished.fetch_add(1) + 1;
            if (on_progress) {
                on_progress(outcome, done, total);
            }
            return outcome;
        }));
    }

    for (auto& f : futures) {
        outcomes.push_back(f.get());
    }
    pool.stop();

    size_t failures = static_cast<size_t>(std::count_if(
        outcomes.begin(), outcomes.end(), [](const DownloadOutcome& o) { return !o.ok(); }));
    spdlog::info("[Downloader] Finished: {} ok, {} failed (peak {} in flight)", total - failures,
                 failures, peak_in_flight_.load());
    return outcomes;
}

} // namespace magpie
