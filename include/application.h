// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "bounded_downloader.h"
#include "cli_args.h"
#include "feed_api.h"
#include "image_reference.h"
#include "oauth2_client.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace magpie {

class Config;
class UsernameCache;

/**
 * @brief Counters reported at the end of a run
 */
struct RunStats {
    int pages = 0;
    size_t items = 0;
    size_t images = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t downloads_ok = 0;
    size_t downloads_failed = 0;
    uint64_t bytes = 0;
};

/**
 * @brief Main application orchestrator
 *
 * Application runs the pipeline in order:
 * 1. Parse CLI args, load config, configure logging
 * 2. Log in through the browser (PKCE + local callback listener)
 * 3. Walk the liked-items feed page by page, enriching each page
 * 4. Download every image reference with bounded concurrency
 * 5. Log a summary; exit 1 if anything failed
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @param argc Command line argument count
     * @param argv Command line argument array
     * @return Exit code (0 = success, 1 = runtime failure, 2 = usage error)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    bool init_config();
    bool init_logging();
    void install_signal_handlers();

    // Pipeline phases (throw MagpieException on fatal errors)
    OAuth2Settings load_oauth_settings();
    AccessToken login();
    User resolve_target_user(FeedApi& api);
    std::vector<ImageReference> collect_images(FeedApi& api, const User& user);
    bool download(std::vector<ImageReference> refs);

    void log_summary(std::chrono::steady_clock::duration elapsed) const;

    CliArgs m_args;
    Config* m_config = nullptr;
    RunStats m_stats;
    std::vector<DownloadOutcome> m_failures;
};

/**
 * @brief Log an error's causal chain, one line per link
 *
 * "Runtime error: <outermost>" followed by "--> <cause>" for each inner link.
 */
void log_error_chain(const MagpieError& error);

} // namespace magpie
