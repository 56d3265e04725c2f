// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace magpie {

/**
 * @brief Fetches one remote file into memory
 *
 * Virtual to allow mocking in tests. Implementations must be safe to call
 * from several downloader threads at once.
 */
class HttpFetcher {
  public:
    virtual ~HttpFetcher() = default;

    /**
     * @brief GET a URL and return the response body
     * @throws MagpieException (TRANSPORT) on network failure or non-200 status
     */
    virtual std::string fetch(const std::string& url) = 0;
};

/**
 * @brief HttpFetcher over libhv's synchronous requests API
 */
class LibhvFetcher : public HttpFetcher {
  public:
    explicit LibhvFetcher(int timeout_sec = 60) : timeout_sec_(timeout_sec) {}

    std::string fetch(const std::string& url) override;

  private:
    int timeout_sec_;
};

} // namespace magpie
