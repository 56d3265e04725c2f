// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file application.cpp
 * @brief Application lifecycle orchestration
 *
 * Startup order matters:
 * - Logging before config (config init logs)
 * - Config before logging reconfiguration (log level/dest come from config)
 * - Credentials before the callback listener (nothing to log in with otherwise)
 * - Signal handlers before the first blocking wait
 */

#include "application.h"

#include "browser_launcher.h"
#include "cancellation.h"
#include "config.h"
#include "env_loader.h"
#include "feed_walker.h"
#include "format_utils.h"
#include "http_fetcher.h"
#include "logging_init.h"
#include "magpie_error.h"
#include "magpie_version.h"
#include "metadata_enricher.h"
#include "oauth2_callback_server.h"
#include "twitter_api_client.h"
#include "username_cache.h"

#include "hv/hlog.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <iterator>
#include <optional>

namespace magpie {

namespace {

// Set from the signal handler; observed by the login wait, walker and downloader
CancellationToken g_cancel;

void signal_handler(int sig) {
    (void)sig;
    g_cancel.request();
}

} // namespace

void log_error_chain(const MagpieError& error) {
    auto chain = error.chain();
    spdlog::error("Runtime error: {}", chain.front());
    for (size_t i = 1; i < chain.size(); ++i) {
        spdlog::error("--> {}", chain[i]);
    }
}

Application::Application() = default;

Application::~Application() = default;

int Application::run(int argc, char** argv) {
    // Set libhv log level to WARN immediately - before ANY libhv usage
    hlog_set_level(LOG_LEVEL_WARN);

    // Phase 1: Parse command line args
    if (!parse_args(argc, argv)) {
        return m_args.info_shown ? 0 : 2;
    }

    // Phase 2: Initialize config system
    if (!init_config()) {
        return 1;
    }

    // Phase 3: Initialize logging
    if (!init_logging()) {
        return 1;
    }

    spdlog::info("[Application] magpie {} starting", magpie_version());
    spdlog::debug("[Application] Output directory: {}", m_args.out_dir);

    install_signal_handlers();

    auto started = std::chrono::steady_clock::now();
    bool all_ok = false;
    try {
        // Phase 4: Log in
        AccessToken token = login();

        ApiSettings api_settings;
        api_settings.base_url = m_config->get<std::string>("/api/base_url", api_settings.base_url);
        api_settings.timeout_sec = m_config->get<int>("/api/timeout_sec", api_settings.timeout_sec);
        api_settings.page_size = m_config->get<int>("/api/page_size", api_settings.page_size);
        TwitterApiClient api(token.token, api_settings);

        // Phase 5: Walk and enrich
        User user = resolve_target_user(api);
        std::vector<ImageReference> refs = collect_images(api, user);

        // Phase 6: Download
        all_ok = download(std::move(refs));
    } catch (const MagpieException& e) {
        log_error_chain(e.error());
        log_summary(std::chrono::steady_clock::now() - started);
        spdlog::shutdown();
        return 1;
    }

    log_summary(std::chrono::steady_clock::now() - started);
    printf("Downloaded %zu image(s) to %s", m_stats.downloads_ok, m_args.out_dir.c_str());
    if (m_stats.downloads_failed > 0) {
        printf(" (%zu failed)", m_stats.downloads_failed);
    }
    printf("\n");

    // Flush sinks before static destruction
    spdlog::shutdown();

    return all_ok ? 0 : 1;
}

bool Application::parse_args(int argc, char** argv) {
    return parse_cli_args(argc, argv, m_args);
}

bool Application::init_config() {
    m_config = Config::get_instance();

    std::string config_path = m_args.config_path.empty() ? Config::default_path()
                                                         : m_args.config_path;
    spdlog::info("[Application] Using config: {}", config_path);
    m_config->init(config_path);

    // CLI values override config values
    if (m_args.port) {
        m_config->set<int>("/oauth/port", *m_args.port);
    }
    if (m_args.download_n) {
        m_config->set<int>("/download/concurrency", *m_args.download_n);
    }
    if (m_args.login_timeout) {
        m_config->set<int>("/oauth/login_timeout_sec", *m_args.login_timeout);
    }

    return true;
}

bool Application::init_logging() {
    logging::LogConfig log_config;

    std::string config_level = m_config->get<std::string>("/log_level", "warn");
    log_config.level = logging::resolve_log_level(m_args.verbosity, config_level);

    std::string log_dest_str = m_args.log_dest;
    if (log_dest_str.empty()) {
        log_dest_str = m_config->get<std::string>("/log_dest", "auto");
    }
    log_config.target = logging::parse_log_target(log_dest_str);

    log_config.file_path = m_args.log_file;
    if (log_config.file_path.empty()) {
        log_config.file_path = m_config->get<std::string>("/log_path", "");
    }

    logging::init(log_config);

    // libhv follows the config file only; -v flags don't make it chatty
    hlog_set_level(logging::to_hv_level(logging::parse_level(config_level)));

    return true;
}

void Application::install_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

OAuth2Settings Application::load_oauth_settings() {
    int loaded = env::load_dotenv();
    if (loaded > 0) {
        spdlog::debug("[Application] Loaded {} variable(s) from .env", loaded);
    }

    OAuth2Settings settings;
    settings.client_id = env::require("TWITTER_OAUTH_CLIENT_ID");
    settings.client_secret = RedactedString(env::require("TWITTER_OAUTH_CLIENT_SECRET"));
    settings.redirect_uri =
        callback_redirect_uri(m_config->get_int_in_range("/oauth/port", 49277, 1, 65535));
    settings.authorize_url =
        m_config->get<std::string>("/oauth/authorize_url", settings.authorize_url);
    settings.token_url = m_config->get<std::string>("/oauth/token_url", settings.token_url);
    settings.timeout_sec = m_config->get<int>("/api/timeout_sec", settings.timeout_sec);

    spdlog::debug("[Application] OAuth2 client {} (secret {})", settings.client_id,
                  settings.client_secret.redacted());
    return settings;
}

AccessToken Application::login() {
    OAuth2Client client(load_oauth_settings());
    int port = m_config->get_int_in_range("/oauth/port", 49277, 1, 65535);
    int timeout_sec = m_config->get<int>("/oauth/login_timeout_sec", 0);

    AuthorizationState auth = client.begin_login();

    printf("Open this URL in your browser to log in:\n\n  %s\n\n", auth.url.c_str());
    fflush(stdout);
    if (!m_args.no_browser && !open_in_browser(auth.url)) {
        printf("Could not launch a browser; open the URL manually.\n");
    }

    std::optional<std::chrono::seconds> timeout;
    if (timeout_sec > 0) {
        timeout = std::chrono::seconds(timeout_sec);
    }
    CallbackOutcome outcome = catch_callback(port, timeout, &g_cancel);

    return finish_login(client, std::move(auth), outcome);
}

User Application::resolve_target_user(FeedApi& api) {
    try {
        if (m_args.username.empty()) {
            User me = api.get_me();
            spdlog::info("[Application] Logged in as @{}", me.username);
            return me;
        }
        User user = api.get_user_by_username(m_args.username);
        spdlog::info("[Application] Walking likes of @{} ({})", user.username, user.id);
        return user;
    } catch (const MagpieException& e) {
        throw e.with_context(m_args.username.empty()
                                 ? std::string("Looking up the logged-in account")
                                 : "Looking up @" + m_args.username);
    }
}

std::vector<ImageReference> Application::collect_images(FeedApi& api, const User& user) {
    UsernameCache cache;
    EnricherSettings enrich_settings;
    enrich_settings.lookup_threads =
        m_config->get<int>("/enrich/lookup_threads", enrich_settings.lookup_threads);
    enrich_settings.include_link_previews =
        m_config->get<bool>("/enrich/include_link_previews", enrich_settings.include_link_previews);
    MetadataEnricher enricher(api, cache, enrich_settings);

    FeedWalker walker(api, user.id, g_cancel, m_args.sample ? 1 : 0);

    std::vector<ImageReference> refs;
    try {
        while (true) {
            std::optional<LikedPage> page = walker.next().get();
            if (!page) {
                break;
            }
            size_t item_count = page->data ? page->data->size() : 0;
            m_stats.items += item_count;

            try {
                auto page_refs = enricher.process_page(*page);
                spdlog::debug("[Application] Page {}: {} item(s), {} image(s)",
                              walker.pages_fetched(), item_count, page_refs.size());
                refs.insert(refs.end(), std::make_move_iterator(page_refs.begin()),
                            std::make_move_iterator(page_refs.end()));
            } catch (const MagpieException& e) {
                throw e.with_context("Processing liked items page " +
                                     std::to_string(walker.pages_fetched()));
            }
        }
    } catch (const MagpieException&) {
        m_stats.pages = walker.pages_fetched();
        m_stats.cache_hits = cache.hits();
        m_stats.cache_misses = cache.misses();
        throw;
    }

    m_stats.pages = walker.pages_fetched();
    m_stats.images = refs.size();
    m_stats.cache_hits = cache.hits();
    m_stats.cache_misses = cache.misses();

    spdlog::info("[Application] Found {} image(s) in {} item(s) over {} page(s)", refs.size(),
                 m_stats.items, m_stats.pages);
    return refs;
}

bool Application::download(std::vector<ImageReference> refs) {
    LibhvFetcher fetcher(m_config->get<int>("/download/timeout_sec", 60));
    BoundedDownloader downloader(fetcher, g_cancel);
    int limit = m_config->get<int>("/download/concurrency", 8);

    auto outcomes = downloader.download_all(
        std::move(refs), limit, m_args.out_dir,
        [](const DownloadOutcome& outcome, size_t finished, size_t total) {
            if (outcome.ok()) {
                spdlog::info("[Application] [{}/{}] {}", finished, total,
                             outcome.reference.filename());
            } else {
                spdlog::warn("[Application] [{}/{}] {} failed: {}", finished, total,
                             outcome.reference.url, outcome.error->message);
            }
        });

    for (auto& outcome : outcomes) {
        if (outcome.ok()) {
            m_stats.downloads_ok++;
            m_stats.bytes += outcome.bytes;
        } else {
            m_stats.downloads_failed++;
            m_failures.push_back(std::move(outcome));
        }
    }
    return m_failures.empty();
}

void Application::log_summary(std::chrono::steady_clock::duration elapsed) const {
    int seconds =
        static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());

    spdlog::info("[Application] ========================");
    spdlog::info("[Application] Pages fetched:   {}", m_stats.pages);
    spdlog::info("[Application] Items seen:      {}", m_stats.items);
    spdlog::info("[Application] Images found:    {}", m_stats.images);
    spdlog::info("[Application] Username cache:  {} hit(s), {} miss(es)", m_stats.cache_hits,
                 m_stats.cache_misses);
    spdlog::info("[Application] Downloads:       {} ok ({}), {} failed", m_stats.downloads_ok,
                 format::byte_size(m_stats.bytes), m_stats.downloads_failed);
    spdlog::info("[Application] Elapsed:         {}", format::duration(seconds));

    if (!m_failures.empty()) {
        spdlog::error("[Application] {} download(s) failed:", m_failures.size());
        for (const auto& failure : m_failures) {
            spdlog::error("[Application]   {} ({}): [{}] {}", failure.reference.filename(),
                          failure.reference.url, failure.error->get_type_string(),
                          failure.error->message);
        }
    }
}

} // namespace magpie
