#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wolfcache {

/**
 * @brief Transport or data failure inside a key-value store backend
 *
 * Backends translate their native errors into this type. KeyValueCache
 * catches it on every call; it never reaches cache callers.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Abstract key-value store
 *
 * Values are opaque strings (JSON text in practice). Keys are plain strings;
 * patterns use Redis glob syntax (*, ?, [abc], \ escapes).
 *
 * Every method may throw StoreError.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /// Round-trip health check. Throws StoreError when the store is unreachable.
    virtual void ping() = 0;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;

    /// Write a value. nullopt ttl = persist until deleted.
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) = 0;

    /// Remove keys, returns how many existed
    virtual int64_t remove(const std::vector<std::string>& keys) = 0;

    [[nodiscard]] virtual std::vector<std::string> keys(const std::string& pattern) = 0;

    /// Atomic +1. A missing key counts as 0; an existing TTL is preserved.
    virtual int64_t increment(const std::string& key) = 0;

    /// Drop every key in the current database
    virtual void flush() = 0;
};

} // namespace wolfcache
