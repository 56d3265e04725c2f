// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file bounded_downloader.h
 * @brief Fetch many images with a fixed concurrency ceiling
 *
 * Every reference is attempted; one failure never cancels its siblings.
 * Outcomes are returned index-aligned with the input. Deciding whether a
 * partial batch is a failed run is left to the caller.
 *
 * Each file is written to "<name>.part" and renamed into place only after
 * the full body has been written, so an interrupted or failed item never
 * leaves a file that looks complete.
 */

#pragma once

#include "cancellation.h"
#include "http_fetcher.h"
#include "image_reference.h"
#include "magpie_error.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace magpie {

struct DownloadOutcome {
    ImageReference reference;
    std::optional<MagpieError> error; ///< TRANSPORT, LOCAL_IO or CANCELLED
    uint64_t bytes = 0;

    bool ok() const {
        return !error.has_value();
    }
};

class BoundedDownloader {
  public:
    /// Called on a worker thread after each item finishes
    using ProgressCallback =
        std::function<void(const DownloadOutcome& outcome, size_t finished, size_t total)>;

    explicit BoundedDownloader(HttpFetcher& fetcher, CancellationToken cancel = {});

    /**
     * @brief Download every reference into dest_dir
     *
     * @param refs References to fetch (moved in)
     * @param limit Maximum concurrent fetches (values below 1 mean 1)
     * @param dest_dir Created with parents if missing
     * @param on_progress Optional per-item callback
     * @return One outcome per reference, in input order
     * @throws MagpieException (SETUP) if dest_dir cannot be created, before any fetch
     */
    std::vector<DownloadOutcome> download_all(std::vector<ImageReference> refs, int limit,
                                              const std::string& dest_dir,
                                              ProgressCallback on_progress = nullptr);

    /// Highest number of simultaneous fetches seen by the last download_all()
    int peak_in_flight() const {
        return peak_in_flight_.load();
    }

    /// Fetches currently running (0 once download_all() has returned)
    int in_flight() const {
        return in_flight_.load();
    }

  private:
    DownloadOutcome download_one(ImageReference ref, const std::string& dest_dir);
    void enter_flight();
    void leave_flight();

    HttpFetcher& fetcher_;
    CancellationToken cancel_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};
};

/**
 * @brief Create dest_dir (with parents) or throw SETUP
 */
void ensure_directory(const std::string& dest_dir);

} // namespace magpie
