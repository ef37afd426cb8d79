#include "cache/memory_cache.hpp"

#include <format>

namespace wolfcache {

MemoryCache::MemoryCache(std::shared_ptr<KeyValueCache> cache)
    : MemoryCache(std::move(cache), Config{}) {}

MemoryCache::MemoryCache(std::shared_ptr<KeyValueCache> cache, Config config)
    : cache_(std::move(cache)), config_(config) {}

// ============================================================================
// Search results
// ============================================================================

std::string MemoryCache::search_key(const std::string& query,
                                    const std::string& user_id) const {
    return cache_->derive_key("search", {user_id, query});
}

bool MemoryCache::cache_search(const std::string& query, const nlohmann::json& results,
                               const std::string& user_id) {
    return cache_->set(search_key(query, user_id), results, config_.search_ttl);
}

std::optional<nlohmann::json> MemoryCache::get_cached_search(const std::string& query,
                                                             const std::string& user_id) {
    return cache_->get(search_key(query, user_id));
}

int64_t MemoryCache::invalidate_searches(const std::string& user_id) {
    const std::string pattern = (user_id == kWildcard)
        ? "search:*"
        : std::format("search:{}:*", user_id);
    return cache_->clear_pattern(pattern);
}

// ============================================================================
// Memory objects
// ============================================================================

bool MemoryCache::cache_memory(const std::string& memory_id,
                               const nlohmann::json& memory_data) {
    return cache_->set("memory:" + memory_id, memory_data, config_.memory_ttl);
}

std::optional<nlohmann::json> MemoryCache::get_cached_memory(const std::string& memory_id) {
    return cache_->get("memory:" + memory_id);
}

bool MemoryCache::invalidate_memory(const std::string& memory_id) {
    return cache_->remove("memory:" + memory_id);
}

// ============================================================================
// Statistics
// ============================================================================

bool MemoryCache::cache_stats(const std::string& stats_key,
                              const nlohmann::json& stats_data) {
    return cache_->set("stats:" + stats_key, stats_data, config_.stats_ttl);
}

std::optional<nlohmann::json> MemoryCache::get_cached_stats(const std::string& stats_key) {
    return cache_->get("stats:" + stats_key);
}

int64_t MemoryCache::invalidate_stats(const std::string& stats_key) {
    // A specific key is still passed through as a pattern, so "daily:*" works
    return cache_->clear_pattern("stats:" + stats_key);
}

} // namespace wolfcache
