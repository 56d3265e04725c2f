// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_HTTP_FETCHER_H
#define MOCK_HTTP_FETCHER_H

/**
 * @file mock_http_fetcher.h
 * @brief In-process HttpFetcher for downloader tests
 *
 * Serves canned bodies by URL, fails URLs marked with fail(), and tracks
 * how many fetches overlap so concurrency bounds can be asserted.
 */

#include "http_fetcher.h"
#include "magpie_error.h"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <new>
#include <set>
#include <string>
#include <thread>

using namespace magpie;

class MockHttpFetcher : public HttpFetcher {
  public:
    explicit MockHttpFetcher(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {}

    void serve(const std::string& url, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_[url] = std::move(body);
    }

    void fail(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(url);
    }

    /// Throw std::bad_alloc for url (an error outside the MagpieException family)
    void fail_unexpectedly(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        crashing_.insert(url);
    }

    int calls() const {
        return calls_.load();
    }

    int max_concurrent() const {
        return max_concurrent_.load();
    }

    std::string fetch(const std::string& url) override {
        ++calls_;
        int now = ++concurrent_;
        int peak = max_concurrent_.load();
        while (now > peak && !max_concurrent_.compare_exchange_weak(peak, now)) {
        }

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        std::unique_lock<std::mutex> lock(mutex_);
        bool failing = failing_.count(url) > 0;
        bool crashing = crashing_.count(url) > 0;
        auto it = bodies_.find(url);
        std::string body = it == bodies_.end() ? "bytes of " + url : it->second;
        lock.unlock();

        --concurrent_;
        if (crashing) {
            throw std::bad_alloc();
        }
        if (failing) {
            throw MagpieException(MagpieError::transport("fetch", "HTTP 404: Not Found", 404));
        }
        return body;
    }

  private:
    std::chrono::milliseconds delay_;
    std::mutex mutex_;
    std::map<std::string, std::string> bodies_;
    std::set<std::string> failing_;
    std::set<std::string> crashing_;
    std::atomic<int> calls_{0};
    std::atomic<int> concurrent_{0};
    std::atomic<int> max_concurrent_{0};
};

#endif // MOCK_HTTP_FETCHER_H
