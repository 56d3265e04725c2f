// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "http_fetcher.h"

#include "api_internal.h"
#include "hv/requests.h"
#include "magpie_version.h"

using namespace magpie::api_internal;

namespace magpie {

std::string LibhvFetcher::fetch(const std::string& url) {
    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_GET;
    req->url = url;
    req->timeout = timeout_sec_;
    req->headers["User-Agent"] = std::string("magpie/") + MAGPIE_VERSION;

    auto resp = requests::request(req);

    MagpieError err;
    if (!handle_http_response(resp, "fetch", err)) {
        spdlog::debug("[Fetcher] GET {} failed: {}", url, err.message);
        throw MagpieException(err);
    }

    spdlog::trace("[Fetcher] GET {} -> {} bytes", url, resp->body.size());
    return std::move(resp->body);
}

} // namespace magpie
