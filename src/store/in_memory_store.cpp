#include "store/in_memory_store.hpp"
#include "core/utils.hpp"

#include <fnmatch.h>

#include <format>
#include <mutex>

namespace wolfcache {

InMemoryKeyValueStore::InMemoryKeyValueStore(std::shared_ptr<IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

std::optional<std::string> InMemoryKeyValueStore::get(const std::string& key) {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || expired(it->second, now)) {
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryKeyValueStore::set(const std::string& key, const std::string& value,
                                std::optional<std::chrono::seconds> ttl) {
    if (ttl && ttl->count() <= 0) {
        throw StoreError(std::format("invalid expire time {}s for key '{}'", ttl->count(), key));
    }

    const auto now = clock_->now();
    std::unique_lock lock(mutex_);
    purge_expired(now);

    Entry entry;
    entry.value = value;
    if (ttl) {
        entry.expires_at = now + *ttl;
    }
    entries_.insert_or_assign(key, std::move(entry));
}

int64_t InMemoryKeyValueStore::remove(const std::vector<std::string>& keys) {
    const auto now = clock_->now();
    std::unique_lock lock(mutex_);
    purge_expired(now);

    int64_t removed = 0;
    for (const auto& key : keys) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) continue;
        if (!expired(it->second, now)) ++removed;
        entries_.erase(it);
    }
    return removed;
}

std::vector<std::string> InMemoryKeyValueStore::keys(const std::string& pattern) {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);

    std::vector<std::string> result;
    for (const auto& [key, entry] : entries_) {
        if (expired(entry, now)) continue;
        if (::fnmatch(pattern.c_str(), key.c_str(), 0) == 0) {
            result.push_back(key);
        }
    }
    return result;
}

int64_t InMemoryKeyValueStore::increment(const std::string& key) {
    const auto now = clock_->now();
    std::unique_lock lock(mutex_);
    purge_expired(now);

    auto it = entries_.find(key);
    if (it != entries_.end() && expired(it->second, now)) {
        entries_.erase(it);
        it = entries_.end();
    }
    if (it == entries_.end()) {
        it = entries_.emplace(key, Entry{"0", std::nullopt}).first;
    }
    const auto current = utils::try_parse_int<int64_t>(it->second.value);
    if (!current) {
        throw StoreError(std::format("value at '{}' is not an integer", key));
    }

    const int64_t next = *current + 1;
    it->second.value = std::to_string(next);
    return next;
}

void InMemoryKeyValueStore::flush() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

std::optional<std::chrono::milliseconds> InMemoryKeyValueStore::ttl(const std::string& key) const {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || expired(it->second, now) || !it->second.expires_at) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*it->second.expires_at - now);
}

size_t InMemoryKeyValueStore::size() const {
    const auto now = clock_->now();
    std::shared_lock lock(mutex_);
    size_t live = 0;
    for (const auto& [key, entry] : entries_) {
        if (!expired(entry, now)) ++live;
    }
    return live;
}

// Caller holds the unique lock. Expired keys are otherwise only reclaimed when
// touched, so sweep the whole map every kPurgeInterval writes.
void InMemoryKeyValueStore::purge_expired(std::chrono::system_clock::time_point now) {
    if (++writes_since_purge_ < kPurgeInterval) return;
    writes_since_purge_ = 0;
    std::erase_if(entries_, [&](const auto& kv) { return expired(kv.second, now); });
}

} // namespace wolfcache
