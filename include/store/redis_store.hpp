#pragma once

#include "store/ikv_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}

namespace wolfcache {

/**
 * @brief Redis-backed store (redis++ over hiredis)
 *
 * Every call is a bounded round trip: connect_timeout caps connection setup,
 * socket_timeout caps each command. A timeout surfaces as StoreError like any
 * other transport failure.
 */
class RedisKeyValueStore : public IKeyValueStore {
public:
    struct Options {
        std::string url = "redis://localhost:6379";
        std::chrono::milliseconds connect_timeout{1500};
        std::chrono::milliseconds socket_timeout{1000};
        size_t pool_size = 4;
        size_t scan_batch = 500;
    };

    /**
     * @brief Build the connection pool (lazy; no round trip yet)
     * @throws StoreError if the URL cannot be parsed
     */
    explicit RedisKeyValueStore(const Options& options);
    ~RedisKeyValueStore() override;

    void ping() override;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;

    int64_t remove(const std::vector<std::string>& keys) override;

    /// SCAN-based so large keyspaces do not block the server the way KEYS does
    [[nodiscard]] std::vector<std::string> keys(const std::string& pattern) override;

    int64_t increment(const std::string& key) override;

    void flush() override;

private:
    Options options_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace wolfcache
