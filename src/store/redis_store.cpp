#include "store/redis_store.hpp"

#include <sw/redis++/redis++.h>

#include <algorithm>
#include <format>
#include <iterator>

namespace wolfcache {

namespace {

// Run one redis++ call, translating its exceptions into StoreError
template<typename Fn>
auto guarded(const char* op, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const sw::redis::Error& e) {
        throw StoreError(std::format("redis {} failed: {}", op, e.what()));
    }
}

} // anonymous namespace

RedisKeyValueStore::RedisKeyValueStore(const Options& options)
    : options_(options) {
    redis_ = guarded("connect", [&] {
        sw::redis::ConnectionOptions conn(options_.url);
        conn.connect_timeout = options_.connect_timeout;
        conn.socket_timeout = options_.socket_timeout;

        sw::redis::ConnectionPoolOptions pool;
        pool.size = options_.pool_size;
        pool.wait_timeout = options_.connect_timeout;

        return std::make_unique<sw::redis::Redis>(conn, pool);
    });
}

RedisKeyValueStore::~RedisKeyValueStore() = default;

void RedisKeyValueStore::ping() {
    guarded("PING", [&] { return redis_->ping(); });
}

std::optional<std::string> RedisKeyValueStore::get(const std::string& key) {
    return guarded("GET", [&]() -> std::optional<std::string> {
        auto value = redis_->get(key);
        if (!value) return std::nullopt;
        return std::string(*value);
    });
}

void RedisKeyValueStore::set(const std::string& key, const std::string& value,
                             std::optional<std::chrono::seconds> ttl) {
    guarded("SET", [&] {
        if (ttl) {
            redis_->setex(key, *ttl, value);
        } else {
            redis_->set(key, value);
        }
    });
}

int64_t RedisKeyValueStore::remove(const std::vector<std::string>& keys) {
    if (keys.empty()) return 0;
    return guarded("DEL", [&] {
        return static_cast<int64_t>(redis_->del(keys.begin(), keys.end()));
    });
}

std::vector<std::string> RedisKeyValueStore::keys(const std::string& pattern) {
    return guarded("SCAN", [&] {
        std::vector<std::string> result;
        long long cursor = 0;
        do {
            cursor = redis_->scan(cursor, pattern,
                                  static_cast<long long>(options_.scan_batch),
                                  std::back_inserter(result));
        } while (cursor != 0);
        // SCAN may yield a key more than once across iterations
        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return result;
    });
}

int64_t RedisKeyValueStore::increment(const std::string& key) {
    return guarded("INCR", [&] {
        return static_cast<int64_t>(redis_->incr(key));
    });
}

void RedisKeyValueStore::flush() {
    guarded("FLUSHDB", [&] { redis_->flushdb(); });
}

} // namespace wolfcache
