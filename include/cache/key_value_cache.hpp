#pragma once

#include "core/utils.hpp"
#include "store/ikv_store.hpp"
#include "store/redis_store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace wolfcache {

namespace detail {

// Render one memoize argument as a key segment
template<typename T>
std::string to_key_part(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string(std::string_view(value));
    } else if constexpr (std::is_arithmetic_v<T>) {
        return std::format("{}", value);
    } else {
        return nlohmann::json(value).dump();
    }
}

} // namespace detail

/**
 * @brief Fail-soft JSON cache over a key-value store
 *
 * Every value is stored as JSON text. The store is the source of truth; this
 * class holds only the handle and counters.
 *
 * Failure policy:
 * - No store, or the first ping fails -> the cache is disabled for its whole
 *   lifetime. Every operation returns its safe default (nullopt / false / 0 /
 *   empty) without touching the store.
 * - A single operation fails (timeout, broken connection, bad JSON) -> it is
 *   logged, counted in Stats::errors and the safe default is returned.
 * Nothing thrown by the store crosses this API.
 *
 * Thread-safety: all methods may be called concurrently. Compound sequences
 * built on top (memoize, rate limiting) are not atomic.
 */
class KeyValueCache {
public:
    struct Config {
        std::chrono::seconds default_ttl{3600};
        size_t max_key_length = 256;
    };

    using NamedArgs = std::map<std::string, std::string>;

    /**
     * @brief Wrap an existing store; pings it once to decide enabled/disabled
     * @param store Backend; nullptr yields a disabled cache
     */
    explicit KeyValueCache(std::shared_ptr<IKeyValueStore> store);
    KeyValueCache(std::shared_ptr<IKeyValueStore> store, Config config);

    /**
     * @brief Connect to Redis. Never throws: an unreachable server gives a
     *        disabled cache and a single warning in the log.
     */
    [[nodiscard]] static std::shared_ptr<KeyValueCache> connect(
        const RedisKeyValueStore::Options& options, Config config);

    [[nodiscard]] bool is_enabled() const { return store_ != nullptr; }

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Deterministic key: prefix:pos1:pos2:name1:val1:name2:val2
     *
     * Named arguments are emitted in sorted name order. A key longer than
     * max_key_length is replaced by prefix:<md5 of the full key>.
     */
    [[nodiscard]] std::string derive_key(
        std::string_view prefix,
        const std::vector<std::string>& positional = {},
        const NamedArgs& named = {}) const;

    /// Cached value, or nullopt on miss / JSON null / any failure
    [[nodiscard]] std::optional<nlohmann::json> get(const std::string& key);

    /// Store with the configured default TTL
    bool set(const std::string& key, const nlohmann::json& value);

    /// Store with an explicit TTL; nullopt or zero means no expiry
    bool set(const std::string& key, const nlohmann::json& value,
             std::optional<std::chrono::seconds> ttl);

    bool remove(const std::string& key);

    /// Delete every key matching a glob, returns the number deleted
    int64_t clear_pattern(const std::string& pattern);

    bool clear_all();

    [[nodiscard]] std::vector<std::string> scan_keys(const std::string& pattern);

    /// Atomic increment in the store; nullopt when disabled or on failure
    std::optional<int64_t> increment(const std::string& key);

    /**
     * @brief Wrap a computation with read-through caching
     *
     * The returned callable derives its key from prefix plus the call's
     * arguments, returns the cached value on a hit, otherwise runs fn, stores
     * the result and returns it. Concurrent misses on the same key each run
     * fn; there is no single-flight.
     *
     * R must be convertible to and from nlohmann::json. The cache must
     * outlive the returned callable.
     */
    template<typename R, typename... Args>
    [[nodiscard]] std::function<R(const Args&...)> memoize(
        std::string prefix,
        std::optional<std::chrono::seconds> ttl,
        std::type_identity_t<std::function<R(const Args&...)>> fn) {
        return [this, prefix = std::move(prefix), ttl, fn = std::move(fn)](const Args&... args) -> R {
            const std::string key = derive_key(prefix, {detail::to_key_part(args)...});

            if (auto cached = get(key)) {
                try {
                    R value = cached->template get<R>();
                    utils::log::debug(std::format("Cache hit: {}", key));
                    return value;
                } catch (const nlohmann::json::exception& e) {
                    errors_.fetch_add(1, std::memory_order_relaxed);
                    utils::log::error(std::format(
                        "Cached value for {} has unexpected shape: {}", key, e.what()));
                }
            }

            utils::log::debug(std::format("Cache miss: {}", key));
            R result = fn(args...);
            set(key, nlohmann::json(result), ttl);
            return result;
        };
    }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t writes;
        uint64_t errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;
    std::shared_ptr<IKeyValueStore> store_;  // nullptr when disabled

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace wolfcache
