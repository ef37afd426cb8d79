#include "cache/rate_limiter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace wolfcache {

RateLimiter::RateLimiter(std::shared_ptr<KeyValueCache> cache)
    : RateLimiter(std::move(cache), Config{}) {}

RateLimiter::RateLimiter(std::shared_ptr<KeyValueCache> cache, Config config)
    : cache_(std::move(cache)), config_(config) {}

bool RateLimiter::is_allowed(const std::string& identifier) {
    return is_allowed(identifier, config_.default_max_requests, config_.default_window);
}

bool RateLimiter::is_allowed(const std::string& identifier,
                             int64_t max_requests,
                             std::chrono::seconds window) {
    if (!cache_->is_enabled()) {
        bypassed_.fetch_add(1, std::memory_order_relaxed);
        return config_.fail_open;
    }

    const std::string key = counter_key(identifier);
    const auto current = current_count(key);

    if (!current) {
        cache_->set(key, 1, window);
        allowed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    if (*current >= max_requests) {
        denied_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Rate limit exceeded for {} ({}/{})",
                                      identifier, *current, max_requests));
        return false;
    }

    // A result of 1 means the window expired between the read and the
    // increment and the store recreated the counter without a TTL
    const auto next = cache_->increment(key);
    if (next && *next == 1) cache_->set(key, 1, window);
    allowed_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

int64_t RateLimiter::get_remaining(const std::string& identifier) {
    return get_remaining(identifier, config_.default_max_requests);
}

int64_t RateLimiter::get_remaining(const std::string& identifier, int64_t max_requests) {
    if (!cache_->is_enabled()) return max_requests;

    const auto current = current_count(counter_key(identifier));
    if (!current) return max_requests;

    return std::max<int64_t>(0, max_requests - *current);
}

RateLimiter::Stats RateLimiter::get_stats() const {
    return {
        allowed_.load(std::memory_order_relaxed),
        denied_.load(std::memory_order_relaxed),
        bypassed_.load(std::memory_order_relaxed)
    };
}

// Counter value, or nullopt when there is no (well-formed) counter
std::optional<int64_t> RateLimiter::current_count(const std::string& key) {
    const auto value = cache_->get(key);
    if (!value || !value->is_number_integer()) return std::nullopt;
    return value->get<int64_t>();
}

} // namespace wolfcache
