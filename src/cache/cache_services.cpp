#include "cache/cache_services.hpp"
#include "core/utils.hpp"

#include <format>

namespace wolfcache {

CacheServices CacheServices::connect(const AppConfig& config) {
    RedisKeyValueStore::Options store_opts;
    store_opts.url = config.cache.url;
    store_opts.connect_timeout = config.cache.connect_timeout;
    store_opts.socket_timeout = config.cache.socket_timeout;
    store_opts.pool_size = config.cache.pool_size;

    KeyValueCache::Config cache_cfg;
    cache_cfg.default_ttl = config.cache.default_ttl;
    cache_cfg.max_key_length = config.cache.max_key_length;

    return over(KeyValueCache::connect(store_opts, cache_cfg), config);
}

CacheServices CacheServices::over(std::shared_ptr<KeyValueCache> cache,
                                  const AppConfig& config) {
    CacheServices services;
    services.cache = std::move(cache);

    SessionManager::Config session_cfg;
    session_cfg.ttl = config.sessions.ttl;
    services.sessions = std::make_shared<SessionManager>(services.cache, session_cfg);

    RateLimiter::Config rl_cfg;
    rl_cfg.fail_open = config.rate_limit.fail_open;
    rl_cfg.default_max_requests = config.rate_limit.max_requests;
    rl_cfg.default_window = config.rate_limit.window;
    services.rate_limiter = std::make_shared<RateLimiter>(services.cache, rl_cfg);

    MemoryCache::Config mc_cfg;
    mc_cfg.search_ttl = config.memory_cache.search_ttl;
    mc_cfg.memory_ttl = config.memory_cache.memory_ttl;
    mc_cfg.stats_ttl = config.memory_cache.stats_ttl;
    services.memory_cache = std::make_shared<MemoryCache>(services.cache, mc_cfg);

    utils::log::info(std::format("Cache components initialized (store {}, rate limiter fail-{})",
        services.cache->is_enabled() ? "connected" : "disconnected",
        rl_cfg.fail_open ? "open" : "closed"));
    return services;
}

} // namespace wolfcache
