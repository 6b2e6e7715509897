// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "prefetch_app.h"

#include "config.h"
#include "event_loop.h"
#include "image_fetcher.h"
#include "load_dispatcher.h"
#include "logging_init.h"
#include "thumbnail_scheduler.h"
#include "tiered_cache.h"
#include "worker_executor.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>

#include "hv/hlog.h"

namespace thumbkit {

std::string image_id_from_url(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    size_t slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);

    // "https:" left over from a bare scheme
    if (segment.empty() || segment.back() == ':') {
        return "";
    }

    size_t dot = segment.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        segment.erase(dot);
    }
    return segment;
}

PrefetchApp::PrefetchApp() = default;

PrefetchApp::~PrefetchApp() {
    shutdown();
}

int PrefetchApp::run(int argc, char** argv) {
    // Keep libhv quiet until logging is configured
    hlog_set_level(LOG_LEVEL_WARN);

    if (!parse_args(argc, argv)) {
        return m_args.help_requested ? 0 : 1;
    }

    if (!init_config()) {
        return 1;
    }

    if (!init_logging()) {
        return 1;
    }

    if (!init_services()) {
        shutdown();
        return 1;
    }

    if (m_args.clear_cache) {
        m_cache->clear_all();
        printf("Cache cleared: %s\n", m_settings.cache_dir.c_str());
    }

    bool ok = prefetch();

    if (m_args.print_stats) {
        print_stats();
    }

    shutdown();
    return ok ? 0 : 1;
}

bool PrefetchApp::parse_args(int argc, char** argv) {
    if (!parse_cli_args(argc, argv, m_args)) {
        return false;
    }
    if (!m_args.has_work()) {
        printf("Nothing to do: pass URLs, --clear or --stats\n");
        printf("Use --help for usage information\n");
        return false;
    }
    return true;
}

bool PrefetchApp::init_config() {
    m_config = Config::get_instance();

    std::string config_path =
        m_args.config_path.empty() ? default_config_path() : m_args.config_path;
    m_config->init(config_path);

    m_settings = CacheSettings::from_config(*m_config);
    if (!m_args.save_dir.empty()) {
        m_settings.thumbnails_dir = m_args.save_dir;
    }
    return true;
}

bool PrefetchApp::init_logging() {
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(
        m_args.verbosity, m_config->get<std::string>("/log_level", "warn"));
    log_config.target = m_args.log_dest.empty() ? logging::LogTarget::Console
                                                : logging::parse_log_target(m_args.log_dest);
    log_config.file_path = m_args.log_file;

    try {
        logging::init(log_config);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        return false;
    }

    spdlog::info("[PrefetchApp] Config: {}", m_config->get_path());
    return true;
}

bool PrefetchApp::init_services() {
    m_loop = std::make_unique<EventLoop>();
    m_cache = std::make_unique<TieredCache>(m_settings.cache_options());
    m_fetcher = std::make_unique<HttpImageFetcher>(m_settings.timeout_sec, m_settings.user_agent);
    m_executor = std::make_unique<ThreadPoolExecutor>(1, m_settings.concurrent_downloads);
    m_dispatcher = std::make_unique<LoadDispatcher>(*m_loop, *m_cache, *m_fetcher, *m_executor,
                                                    m_settings.dispatcher_options());
    m_scheduler = std::make_unique<ThumbnailScheduler>(*m_loop, *m_cache, *m_dispatcher);

    m_scheduler->add_loaded_listener(
        [this](const std::string& url, const ImageSize& size, const ImagePtr& image) {
            if (m_remaining.erase(url) == 0) {
                return;
            }
            ++m_loaded;
            spdlog::info("[PrefetchApp] Loaded {} ({}x{} in {})", url, image->width,
                         image->height, size.to_string());
            if (!m_args.save_dir.empty()) {
                if (m_cache->put_thumbnail_by_id(image_id_from_url(url), *image)) {
                    ++m_saved;
                } else {
                    spdlog::warn("[PrefetchApp] Could not save thumbnail for {}", url);
                }
            }
        });
    m_scheduler->add_failed_listener(
        [this](const std::string& url, LoadError reason, const std::string& message) {
            if (m_remaining.erase(url) == 0) {
                return;
            }
            ++m_failed;
            fprintf(stderr, "Failed: %s (%s: %s)\n", url.c_str(), load_error_name(reason),
                    message.c_str());
        });

    m_cache->start_periodic_sweep(*m_loop);
    return true;
}

bool PrefetchApp::prefetch() {
    if (m_args.urls.empty()) {
        return true;
    }

    m_remaining.insert(m_args.urls.begin(), m_args.urls.end());
    const size_t total = m_remaining.size();
    std::vector<std::string> unique_urls(m_remaining.begin(), m_remaining.end());

    spdlog::info("[PrefetchApp] Prefetching {} urls at {}", total, m_args.size.to_string());

    if (m_dispatcher->base_max_concurrent() < 2) {
        // Preload ticks always keep one slot free; with a single slot load directly
        for (const auto& url : unique_urls) {
            m_scheduler->load_thumbnail(url, m_args.size, true);
        }
    } else {
        m_scheduler->preload_thumbnails(unique_urls, m_args.size);
    }

    const int64_t batches =
        static_cast<int64_t>(total) / m_dispatcher->base_max_concurrent() + 1;
    const auto timeout = std::chrono::seconds(m_settings.timeout_sec * (batches + 1));
    bool finished = m_loop->run_until([this]() { return m_remaining.empty(); }, timeout);

    if (!finished) {
        fprintf(stderr, "Timed out with %zu of %zu urls outstanding\n", m_remaining.size(),
                total);
        m_failed += m_remaining.size();
    }

    printf("Prefetched %zu/%zu (%zu failed", m_loaded, total, m_failed);
    if (!m_args.save_dir.empty()) {
        printf(", %zu saved to %s", m_saved, m_args.save_dir.c_str());
    }
    printf(")\n");

    return m_failed == 0;
}

void PrefetchApp::print_stats() {
    if (!m_scheduler) {
        return;
    }
    printf("%s\n", m_scheduler->cache_stats().to_json().dump(2).c_str());
}

void PrefetchApp::shutdown() {
    if (m_scheduler) {
        m_scheduler->cleanup();
    }
    if (m_cache) {
        m_cache->stop_periodic_sweep();
    }
    if (m_executor) {
        m_executor->shutdown();
    }
    m_scheduler.reset();
    m_dispatcher.reset();
    m_executor.reset();
    m_fetcher.reset();
    m_cache.reset();
    m_loop.reset();
}

} // namespace thumbkit
