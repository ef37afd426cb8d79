#pragma once

#include "cache/key_value_cache.hpp"
#include "cache/memory_cache.hpp"
#include "cache/rate_limiter.hpp"
#include "cache/session_manager.hpp"
#include "config/config_types.hpp"

#include <memory>

namespace wolfcache {

/**
 * @brief The cache layer as one unit: a shared KeyValueCache and the three
 *        policy caches built on it
 */
struct CacheServices {
    std::shared_ptr<KeyValueCache> cache;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<RateLimiter> rate_limiter;
    std::shared_ptr<MemoryCache> memory_cache;

    /// Connect to the configured Redis; never throws on an unreachable store
    [[nodiscard]] static CacheServices connect(const AppConfig& config);

    /// Build the policy caches over an existing (possibly disabled) cache
    [[nodiscard]] static CacheServices over(std::shared_ptr<KeyValueCache> cache,
                                            const AppConfig& config);
};

} // namespace wolfcache
