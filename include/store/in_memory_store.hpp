#pragma once

#include "core/clock.hpp"
#include "store/ikv_store.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace wolfcache {

/**
 * @brief In-process key-value store for single-node use and tests
 *
 * Mirrors the subset of Redis semantics the cache layer relies on: TTLs are
 * passive (an expired key reads as absent and is reclaimed on the next
 * write), INCR keeps the key's TTL, pattern matching is glob-style.
 */
class InMemoryKeyValueStore : public IKeyValueStore {
public:
    explicit InMemoryKeyValueStore(std::shared_ptr<IClock> clock = nullptr);

    void ping() override {}

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;

    int64_t remove(const std::vector<std::string>& keys) override;

    [[nodiscard]] std::vector<std::string> keys(const std::string& pattern) override;

    int64_t increment(const std::string& key) override;

    void flush() override;

    /// Remaining lifetime of a key; nullopt if the key is missing or persistent
    [[nodiscard]] std::optional<std::chrono::milliseconds> ttl(const std::string& key) const;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::string value;
        std::optional<std::chrono::system_clock::time_point> expires_at;
    };

    [[nodiscard]] bool expired(const Entry& entry,
                               std::chrono::system_clock::time_point now) const {
        return entry.expires_at && *entry.expires_at <= now;
    }

    void purge_expired(std::chrono::system_clock::time_point now);

    static constexpr size_t kPurgeInterval = 1024;

    std::shared_ptr<IClock> clock_;
    std::unordered_map<std::string, Entry> entries_;
    size_t writes_since_purge_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace wolfcache
