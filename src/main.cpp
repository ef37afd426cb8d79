#include "cache/cache_services.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/timesync_api.hpp"
#include "server/timesync_server.hpp"
#include "sync/time_sync_tracker.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace wolfcache;

// Global instance for signal handling
std::shared_ptr<TimeSyncServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("wolfcache starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/wolfcache.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));

        AppConfig config;
        auto load_result = ConfigLoader::load_from_file(config_file);
        if (load_result.success) {
            config = std::move(load_result.config);
        } else {
            utils::log::warn(std::format("{}; using built-in defaults", load_result.error_message));
        }
        ConfigLoader::apply_env_overrides(config);

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // Cache layer: an unreachable store degrades to a disabled cache
        utils::log::info(std::format("[2/4] Connecting cache: {}", config.cache.url));
        auto services = CacheServices::connect(config);

        // Time sync registry
        utils::log::info("[3/4] Registering services");

        TimeSyncTracker::Config tracker_cfg;
        tracker_cfg.stale_threshold = config.timesync.stale_threshold;
        tracker_cfg.needs_sync_threshold = config.timesync.needs_sync_threshold;
        auto tracker = std::make_shared<TimeSyncTracker>(tracker_cfg);

        for (const auto& service : config.timesync.services) {
            tracker->register_service(service);
        }

        // HTTP
        utils::log::info("[4/4] Starting HTTP server");

        auto api = std::make_shared<TimeSyncApi>(tracker, services);
        g_server = std::make_shared<TimeSyncServer>(
            api, config.server.host, config.server.port, config.server.thread_pool_size);
        g_server->start();

        const auto stats = services.cache->get_stats();
        const auto rl_stats = services.rate_limiter->get_stats();
        utils::log::info(std::format(
            "Shutdown complete (cache hits={} misses={} errors={}, rate limit allowed={} denied={})",
            stats.hits, stats.misses, stats.errors, rl_stats.allowed, rl_stats.denied));
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
