// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file oauth2_callback_server.h
 * @brief One-shot local HTTP listener that captures the OAuth2 redirect
 *
 * Lifecycle per login attempt:
 *   Idle -> Listening (bound to 127.0.0.1:port) -> Fulfilled (first
 *   /oauth2/callback recorded) -> Terminated (listener stopped)
 *
 * The handler writes the acknowledgment page before it signals the waiting
 * caller, so the browser always gets its response. Requests arriving after
 * the first callback get 410 Gone until the listener is stopped.
 */

#pragma once

#include "cancellation.h"
#include "redacted_string.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace hv {
class HttpServer;
class HttpService;
} // namespace hv

namespace magpie {

// ============================================================================
// Callback payloads
// ============================================================================

/// Authorization granted: code to exchange plus the echoed state
struct CallbackSuccess {
    std::string code;
    RedactedString state;
};

/// Provider refused or failed the authorization (RFC 6749 section 4.1.2.1)
struct ProviderError {
    std::string error;
    std::optional<std::string> description;
    std::optional<std::string> uri;
    std::optional<std::string> state;
};

/// Query string matched neither shape (or was absent)
struct MalformedCallback {
    std::string reason;
};

using CallbackOutcome = std::variant<CallbackSuccess, ProviderError, MalformedCallback>;

/**
 * @brief Decode a raw callback query string
 *
 * Precedence matters when a query carries fields of both shapes: a query
 * with `code` and `state` is a success even if `error` is also present.
 *   1. code + state present       -> CallbackSuccess
 *   2. error present               -> ProviderError (description/uri optional)
 *   3. anything else, including an empty query or a repeated key -> MalformedCallback
 *
 * Never throws on untrusted input.
 */
CallbackOutcome parse_callback_query(const std::string& raw_query);

/// Title and subheader shown on the acknowledgment page
struct AckHeadings {
    std::string title;
    std::string subheader;
};

AckHeadings ack_headings(const CallbackOutcome& outcome);

/// Static HTML page returned to the browser (provider text is HTML-escaped)
std::string render_ack_page(const CallbackOutcome& outcome);

// ============================================================================
// CallbackRendezvous
// ============================================================================

/**
 * @brief Request-scoped hand-off cell between the listener and the caller
 *
 * One instance per login attempt, shared by the server handlers and the
 * waiting thread. Accepts exactly one outcome.
 */
class CallbackRendezvous {
  public:
    /**
     * @brief Record the outcome if none has been recorded yet
     * @return true if this call fulfilled the rendezvous
     */
    bool fulfil(CallbackOutcome outcome);

    /**
     * @brief Reserve the single slot without publishing yet
     *
     * Lets the handler answer the browser between claim() and publish() so
     * the waiting caller cannot stop the listener mid-response.
     * @return false if another request already claimed it
     */
    bool claim();

    /// Publish the outcome for a successful claim() and wake the waiter
    void publish(CallbackOutcome outcome);

    bool fulfilled() const;

    /**
     * @brief Block until fulfilled, the timeout passes, or cancellation
     *
     * @param timeout nullopt waits forever
     * @param cancel Optional token polled while waiting
     * @return The outcome (moved out), or nullopt on timeout/cancel
     */
    std::optional<CallbackOutcome> wait(std::optional<std::chrono::milliseconds> timeout,
                                        const CancellationToken* cancel = nullptr);

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<CallbackOutcome> outcome_;
    bool claimed_ = false;
};

// ============================================================================
// OAuth2CallbackServer
// ============================================================================

class OAuth2CallbackServer {
  public:
    explicit OAuth2CallbackServer(std::shared_ptr<CallbackRendezvous> rendezvous,
                                  std::string host = "127.0.0.1");
    ~OAuth2CallbackServer();

    OAuth2CallbackServer(const OAuth2CallbackServer&) = delete;
    OAuth2CallbackServer& operator=(const OAuth2CallbackServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @throws MagpieException (SETUP) if the port cannot be bound
     */
    void start(int port);

    /// Stop accepting and close the listener (idempotent)
    void stop();

    bool running() const {
        return running_;
    }

  private:
    void register_routes();

    std::shared_ptr<CallbackRendezvous> rendezvous_;
    std::string host_;
    std::unique_ptr<hv::HttpService> router_;
    std::unique_ptr<hv::HttpServer> server_;
    bool running_ = false;
};

/**
 * @brief Run one login redirect capture end to end
 *
 * Starts the listener, blocks until the first callback arrives, stops the
 * listener and returns the outcome.
 *
 * @param port Local port (must match the registered redirect URI)
 * @param timeout nullopt waits forever
 * @param cancel Optional cancellation token
 * @throws MagpieException SETUP (bind failure), TIMEOUT, or CANCELLED
 */
CallbackOutcome catch_callback(int port, std::optional<std::chrono::seconds> timeout,
                               const CancellationToken* cancel = nullptr);

} // namespace magpie
