#pragma once

#include "cache/key_value_cache.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace wolfcache {

/**
 * @brief Fixed-window request counter under ratelimit:<identifier>
 *
 * First request in a window creates the counter at 1 with TTL = window; the
 * window resets when the key expires. A request is denied once the counter
 * has reached max_requests, and a denied request is not counted.
 *
 * The read and the increment are two separate store calls, so N concurrent
 * callers racing on the same counter can over-admit by up to N-1.
 *
 * With the store disabled the limiter follows Config::fail_open.
 */
class RateLimiter {
public:
    static constexpr std::string_view kPrefix = "ratelimit:";

    struct Config {
        bool fail_open = true;
        int64_t default_max_requests = 100;
        std::chrono::seconds default_window{60};
    };

    explicit RateLimiter(std::shared_ptr<KeyValueCache> cache);
    RateLimiter(std::shared_ptr<KeyValueCache> cache, Config config);

    [[nodiscard]] bool is_allowed(const std::string& identifier);

    [[nodiscard]] bool is_allowed(const std::string& identifier,
                                  int64_t max_requests,
                                  std::chrono::seconds window);

    [[nodiscard]] int64_t get_remaining(const std::string& identifier);

    [[nodiscard]] int64_t get_remaining(const std::string& identifier, int64_t max_requests);

    [[nodiscard]] static std::string counter_key(const std::string& identifier) {
        return std::string(kPrefix) + identifier;
    }

    struct Stats {
        uint64_t allowed;
        uint64_t denied;
        uint64_t bypassed;   // decided by fail_open/fail-closed policy
    };
    [[nodiscard]] Stats get_stats() const;

private:
    std::optional<int64_t> current_count(const std::string& key);

    std::shared_ptr<KeyValueCache> cache_;
    Config config_;

    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> denied_{0};
    std::atomic<uint64_t> bypassed_{0};
};

} // namespace wolfcache
