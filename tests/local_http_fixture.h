// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file local_http_fixture.h
 * @brief Real libhv HttpServer on 127.0.0.1 for network-level tests
 *
 * Stands in for the provider: canned JSON for API paths, byte bodies for
 * media URLs, and custom handlers where the response depends on the query.
 * Routes must be registered before start().
 *
 * Usage:
 * @code
 * LocalHttpServer server;
 * server.serve("/2/users/me", R"({"data":{"id":"1","username":"me"}})");
 * server.start();
 * TwitterApiClient api(RedactedString("t"), {server.url("/2")});
 * @endcode
 */

#include "hv/HttpMessage.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hv {
class HttpServer;
class HttpService;
} // namespace hv

class LocalHttpServer {
  public:
    using Handler = std::function<int(HttpRequest* req, HttpResponse* resp)>;

    LocalHttpServer();
    ~LocalHttpServer();

    // Non-copyable, non-movable
    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    /// Fixed response for any method on path (token endpoints are POSTed to)
    void serve(const std::string& path, std::string body,
               http_content_type type = APPLICATION_JSON, int status = 200);

    /// Custom handler for any method on path
    void handle(const std::string& path, Handler handler);

    /// Bind the first free port from a per-process range; REQUIRE-fails if none
    void start();
    void stop();

    int port() const {
        return port_;
    }

    /// "http://127.0.0.1:<port><path>"
    std::string url(const std::string& path) const;

    /// Requests seen on path (after routing)
    int hits(const std::string& path) const;

    /// A port that was free a moment ago (for listeners the test does not own)
    static int pick_free_port();

  private:
    void count(const std::string& path);

    std::unique_ptr<hv::HttpService> router_;
    std::unique_ptr<hv::HttpServer> server_;
    int port_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, int> hits_;
};
