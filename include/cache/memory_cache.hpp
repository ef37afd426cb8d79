#pragma once

#include "cache/key_value_cache.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wolfcache {

/**
 * @brief Namespaced caches for memory-service reads
 *
 * Three independent regions on one KeyValueCache:
 * - search:<user>:<query>  search results, 1 hour
 * - memory:<memory_id>     single memory objects, 1 day
 * - stats:<stats_key>      aggregate statistics, 5 minutes
 *
 * Oversized search keys fall back to search:<md5> (see KeyValueCache::derive_key)
 * and are then only reachable by invalidate_searches("*").
 */
class MemoryCache {
public:
    static constexpr std::string_view kWildcard = "*";
    static constexpr std::string_view kDefaultUser = "default";

    struct Config {
        std::chrono::seconds search_ttl{3600};
        std::chrono::seconds memory_ttl{86400};
        std::chrono::seconds stats_ttl{300};
    };

    explicit MemoryCache(std::shared_ptr<KeyValueCache> cache);
    MemoryCache(std::shared_ptr<KeyValueCache> cache, Config config);

    // ---- search ----
    bool cache_search(const std::string& query, const nlohmann::json& results,
                      const std::string& user_id = std::string(kDefaultUser));
    [[nodiscard]] std::optional<nlohmann::json> get_cached_search(
        const std::string& query, const std::string& user_id = std::string(kDefaultUser));
    int64_t invalidate_searches(const std::string& user_id = std::string(kWildcard));

    // ---- memory objects ----
    bool cache_memory(const std::string& memory_id, const nlohmann::json& memory_data);
    [[nodiscard]] std::optional<nlohmann::json> get_cached_memory(const std::string& memory_id);
    bool invalidate_memory(const std::string& memory_id);

    // ---- stats ----
    bool cache_stats(const std::string& stats_key, const nlohmann::json& stats_data);
    [[nodiscard]] std::optional<nlohmann::json> get_cached_stats(const std::string& stats_key);
    int64_t invalidate_stats(const std::string& stats_key = std::string(kWildcard));

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::string search_key(const std::string& query, const std::string& user_id) const;

    std::shared_ptr<KeyValueCache> cache_;
    Config config_;
};

} // namespace wolfcache
