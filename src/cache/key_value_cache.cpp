#include "cache/key_value_cache.hpp"
#include "core/digest.hpp"

#include <format>

namespace wolfcache {

KeyValueCache::KeyValueCache(std::shared_ptr<IKeyValueStore> store)
    : KeyValueCache(std::move(store), Config{}) {}

KeyValueCache::KeyValueCache(std::shared_ptr<IKeyValueStore> store, Config config)
    : config_(std::move(config)) {
    if (!store) {
        utils::log::warn("No key-value store configured. Cache will be disabled.");
        return;
    }
    try {
        store->ping();
        store_ = std::move(store);
        utils::log::info("Key-value store connection successful");
    } catch (const StoreError& e) {
        utils::log::warn(std::format(
            "Key-value store connection failed: {}. Cache will be disabled.", e.what()));
    }
}

std::shared_ptr<KeyValueCache> KeyValueCache::connect(
    const RedisKeyValueStore::Options& options, Config config) {
    std::shared_ptr<IKeyValueStore> store;
    try {
        store = std::make_shared<RedisKeyValueStore>(options);
    } catch (const StoreError& e) {
        utils::log::warn(std::format("Invalid Redis URL '{}': {}", options.url, e.what()));
    }
    return std::make_shared<KeyValueCache>(std::move(store), std::move(config));
}

std::string KeyValueCache::derive_key(
    std::string_view prefix,
    const std::vector<std::string>& positional,
    const NamedArgs& named) const {
    std::string key(prefix);
    for (const auto& part : positional) {
        key += ':';
        key += part;
    }
    // std::map iterates in sorted key order
    for (const auto& [name, value] : named) {
        key += std::format(":{}:{}", name, value);
    }

    if (key.size() > config_.max_key_length) {
        return std::format("{}:{}", prefix, digest::md5_hex(key));
    }
    return key;
}

std::optional<nlohmann::json> KeyValueCache::get(const std::string& key) {
    if (!store_) return std::nullopt;
    try {
        const auto raw = store_->get(key);
        if (!raw || raw->empty()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        auto value = nlohmann::json::parse(*raw);
        if (value.is_null()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return value;
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error getting cache key {}: {}", key, e.what()));
    } catch (const nlohmann::json::exception& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error decoding cache key {}: {}", key, e.what()));
    }
    return std::nullopt;
}

bool KeyValueCache::set(const std::string& key, const nlohmann::json& value) {
    return set(key, value, config_.default_ttl);
}

bool KeyValueCache::set(const std::string& key, const nlohmann::json& value,
                        std::optional<std::chrono::seconds> ttl) {
    if (!store_) return false;
    if (ttl && ttl->count() <= 0) {
        ttl.reset();
    }
    try {
        store_->set(key, value.dump(), ttl);
        writes_.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error setting cache key {}: {}", key, e.what()));
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error encoding cache key {}: {}", key, e.what()));
    }
    return false;
}

bool KeyValueCache::remove(const std::string& key) {
    if (!store_) return false;
    try {
        store_->remove({key});
        return true;
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error deleting cache key {}: {}", key, e.what()));
        return false;
    }
}

int64_t KeyValueCache::clear_pattern(const std::string& pattern) {
    if (!store_) return 0;
    try {
        const auto keys = store_->keys(pattern);
        if (keys.empty()) return 0;
        return store_->remove(keys);
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error clearing pattern {}: {}", pattern, e.what()));
        return 0;
    }
}

bool KeyValueCache::clear_all() {
    if (!store_) return false;
    try {
        store_->flush();
        return true;
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error clearing cache: {}", e.what()));
        return false;
    }
}

std::vector<std::string> KeyValueCache::scan_keys(const std::string& pattern) {
    if (!store_) return {};
    try {
        return store_->keys(pattern);
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error listing keys for {}: {}", pattern, e.what()));
        return {};
    }
}

std::optional<int64_t> KeyValueCache::increment(const std::string& key) {
    if (!store_) return std::nullopt;
    try {
        return store_->increment(key);
    } catch (const StoreError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error incrementing cache key {}: {}", key, e.what()));
        return std::nullopt;
    }
}

KeyValueCache::Stats KeyValueCache::get_stats() const {
    return {
        hits_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed),
        writes_.load(std::memory_order_relaxed),
        errors_.load(std::memory_order_relaxed)
    };
}

} // namespace wolfcache
