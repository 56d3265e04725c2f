// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "oauth2_callback_server.h"

#include "hv/HttpServer.h"
#include "hv/hurl.h"
#include "magpie_error.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <map>

namespace magpie {

namespace {

constexpr auto WAIT_SLICE = std::chrono::milliseconds(100);

std::string form_unescape(std::string s) {
    for (char& c : s) {
        if (c == '+') {
            c = ' ';
        }
    }
    return HUrl::unescape(s);
}

std::string html_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string raw_query_of(const std::string& url) {
    auto q = url.find('?');
    if (q == std::string::npos) {
        return "";
    }
    auto end = url.find('#', q);
    return url.substr(q + 1, end == std::string::npos ? std::string::npos : end - q - 1);
}

std::optional<std::string> take(std::map<std::string, std::string>& fields, const char* key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

// ============================================================================
// Query decoding and acknowledgment page
// ============================================================================

CallbackOutcome parse_callback_query(const std::string& raw_query) {
    if (raw_query.empty()) {
        return MalformedCallback{"empty query"};
    }

    std::map<std::string, std::string> fields;
    size_t pos = 0;
    while (pos <= raw_query.size()) {
        size_t amp = raw_query.find('&', pos);
        std::string pair =
            raw_query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        pos = (amp == std::string::npos) ? raw_query.size() + 1 : amp + 1;
        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        std::string key = form_unescape(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : form_unescape(pair.substr(eq + 1));
        if (!fields.emplace(std::move(key), std::move(value)).second) {
            return MalformedCallback{"repeated query parameter"};
        }
    }

    auto code = take(fields, "code");
    auto state = take(fields, "state");
    if (code && state) {
        return CallbackSuccess{*code, RedactedString(*state)};
    }

    if (auto error = take(fields, "error")) {
        return ProviderError{*error, take(fields, "error_description"), take(fields, "error_uri"),
                             state};
    }

    return MalformedCallback{"neither code+state nor error present"};
}

AckHeadings ack_headings(const CallbackOutcome& outcome) {
    if (std::holds_alternative<CallbackSuccess>(outcome)) {
        return {"You are now logged in.", "Please close the window."};
    }
    if (const auto* err = std::get_if<ProviderError>(&outcome)) {
        std::string sub = err->error;
        if (err->description) {
            sub += ": " + *err->description;
        }
        if (err->uri) {
            sub += " (" + *err->uri + ")";
        }
        return {"Login failed.", sub};
    }
    return {"Login failed.", "Received invalid OAuth2 response."};
}

std::string render_ack_page(const CallbackOutcome& outcome) {
    auto headings = ack_headings(outcome);
    return "<html>\n"
           "    <body>\n"
           "        <div style=\"width: 100%; margin-top: 100px; text-align: center; "
           "font-family: sans-serif;\">\n"
           "            <h1>" +
           html_escape(headings.title) +
           "</h1>\n"
           "            <h2>" +
           html_escape(headings.subheader) +
           "</h2>\n"
           "        </div>\n"
           "    </body>\n"
           "</html>\n";
}

// ============================================================================
// CallbackRendezvous
// ============================================================================

bool CallbackRendezvous::claim() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_) {
        return false;
    }
    claimed_ = true;
    return true;
}

void CallbackRendezvous::publish(CallbackOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = std::move(outcome);
    }
    cv_.notify_all();
}

bool CallbackRendezvous::fulfil(CallbackOutcome outcome) {
    if (!claim()) {
        return false;
    }
    publish(std::move(outcome));
    return true;
}

bool CallbackRendezvous::fulfilled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_;
}

std::optional<CallbackOutcome>
CallbackRendezvous::wait(std::optional<std::chrono::milliseconds> timeout,
                         const CancellationToken* cancel) {
    auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                            : std::chrono::steady_clock::time_point::max();

    std::unique_lock<std::mutex> lock(mutex_);
    while (!outcome_) {
        if (cancel && cancel->requested()) {
            return std::nullopt;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(WAIT_SLICE, deadline - now);
        cv_.wait_for(lock, slice);
    }

    auto out = std::move(outcome_);
    outcome_.reset();
    return out;
}

// ============================================================================
// OAuth2CallbackServer
// ============================================================================

OAuth2CallbackServer::OAuth2CallbackServer(std::shared_ptr<CallbackRendezvous> rendezvous,
                                           std::string host)
    : rendezvous_(std::move(rendezvous)), host_(std::move(host)),
      router_(std::make_unique<hv::HttpService>()) {
    register_routes();
}

OAuth2CallbackServer::~OAuth2CallbackServer() {
    stop();
}

void OAuth2CallbackServer::register_routes() {
    router_->GET("/", [](HttpRequest*, HttpResponse* resp) {
        return resp->String("waiting for callback");
    });

    router_->GET("/health", [](HttpRequest*, HttpResponse* resp) { return resp->String("ok"); });

    auto rendezvous = rendezvous_;
    router_->GET("/oauth2/callback", [rendezvous](const HttpContextPtr& ctx) {
        if (!rendezvous->claim()) {
            spdlog::debug("[Callback] Ignoring callback after the first one");
            ctx->response->status_code = HTTP_STATUS_GONE;
            return ctx->send("login already completed", TEXT_PLAIN);
        }

        CallbackOutcome outcome = parse_callback_query(raw_query_of(ctx->request->url));
        if (const auto* bad = std::get_if<MalformedCallback>(&outcome)) {
            spdlog::warn("[Callback] Malformed callback: {}", bad->reason);
        } else if (const auto* err = std::get_if<ProviderError>(&outcome)) {
            spdlog::warn("[Callback] Provider returned error '{}'", err->error);
        } else {
            spdlog::debug("[Callback] Authorization code received");
        }

        // Answer the browser first; the waiter stops the listener once woken
        int rc = ctx->send(render_ack_page(outcome), TEXT_HTML);
        rendezvous->publish(std::move(outcome));
        return rc;
    });
}

void OAuth2CallbackServer::start(int port) {
    if (running_) {
        return;
    }

    server_ = std::make_unique<hv::HttpServer>(router_.get());
    server_->setHost(host_.c_str());
    server_->setPort(port);
    server_->setThreadNum(1);

    int rc = server_->start();
    if (rc != 0) {
        server_.reset();
        spdlog::error("[Callback] Cannot listen on {}:{} (rc={})", host_, port, rc);
        throw MagpieException(MagpieError::setup(
            "catch_callback", "Cannot listen on " + host_ + ":" + std::to_string(port) +
                                  " for the OAuth2 callback"));
    }

    running_ = true;
    spdlog::debug("[Callback] Listening for OAuth2 callback on {}:{}", host_, port);
}

void OAuth2CallbackServer::stop() {
    if (!server_) {
        return;
    }
    server_->stop();
    server_.reset();
    running_ = false;
    spdlog::debug("[Callback] Listener stopped");
}

CallbackOutcome catch_callback(int port, std::optional<std::chrono::seconds> timeout,
                               const CancellationToken* cancel) {
    auto rendezvous = std::make_shared<CallbackRendezvous>();
    OAuth2CallbackServer server(rendezvous);
    server.start(port);

    std::optional<std::chrono::milliseconds> wait_ms;
    if (timeout) {
        wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*timeout);
    }
    auto outcome = rendezvous->wait(wait_ms, cancel);
    server.stop();

    if (!outcome) {
        if (cancel && cancel->requested()) {
            throw MagpieException(MagpieError::cancelled("catch_callback"));
        }
        throw MagpieException(
            MagpieError::timeout("catch_callback", static_cast<int>(timeout->count())));
    }
    return std::move(*outcome);
}

} // namespace magpie
