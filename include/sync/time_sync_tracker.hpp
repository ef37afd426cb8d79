#pragma once

#include "core/clock.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wolfcache {

using utils::Timestamp;

enum class ServiceStatus {
    ACTIVE,
    STALE,
    DISCONNECTED    // only set by an explicit mark_disconnected()
};

[[nodiscard]] constexpr std::string_view service_status_to_string(ServiceStatus s) {
    switch (s) {
        case ServiceStatus::ACTIVE:       return "active";
        case ServiceStatus::STALE:        return "stale";
        case ServiceStatus::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

struct SyncRecord {
    std::string service;
    Timestamp last_sync;
    Timestamp last_memory_update;   // only moves on memory-update syncs
    ServiceStatus status = ServiceStatus::ACTIVE;
};

struct CompareResult {
    std::string service;
    Timestamp client_timestamp;
    Timestamp server_timestamp;     // epoch when the service is unknown
    bool is_client_newer = false;
    int64_t diff_ms = 0;            // client - server
    double diff_seconds = 0.0;
    bool needs_sync = false;
};

struct LatestUpdate {
    std::string service;
    Timestamp timestamp;
};

/**
 * @brief Registry of services reporting sync heartbeats
 *
 * One SyncRecord per service name. Staleness is evaluated lazily: check_stale()
 * flips ACTIVE -> STALE when last_sync is older than the threshold, and any
 * update_sync() puts the record back to ACTIVE. Nothing runs in the background.
 *
 * get_all_statuses() returns records in registration order. Re-registering a
 * name resets its timestamps but keeps its position.
 *
 * Thread-safety: one shared_mutex over the registry. check_stale() takes the
 * exclusive lock since it may write.
 */
class TimeSyncTracker {
public:
    struct Config {
        std::chrono::milliseconds stale_threshold{60000};
        std::chrono::milliseconds needs_sync_threshold{1000};
    };

    TimeSyncTracker();
    explicit TimeSyncTracker(Config config, std::shared_ptr<IClock> clock = nullptr);

    /// Upsert with last_sync = last_memory_update = now, status ACTIVE
    void register_service(const std::string& service);

    /**
     * @brief Record a heartbeat; registers unknown services first
     * @param is_memory_update Also move last_memory_update
     * @return The timestamp recorded as last_sync
     */
    Timestamp update_sync(const std::string& service, bool is_memory_update = false);

    /// True if unknown or last_sync is older than the stale threshold
    bool check_stale(const std::string& service);

    /// Explicit disconnect signal. Timestamps are untouched. False if unknown.
    bool mark_disconnected(const std::string& service);

    [[nodiscard]] std::optional<SyncRecord> get_status(const std::string& service) const;

    [[nodiscard]] std::vector<SyncRecord> get_all_statuses() const;

    [[nodiscard]] CompareResult compare_timestamps(const std::string& service,
                                                   Timestamp client_timestamp) const;

    /// Record with the newest last_memory_update; earliest-registered wins ties
    [[nodiscard]] std::optional<LatestUpdate> get_latest_timestamp() const;

    [[nodiscard]] size_t service_count() const;

    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] Timestamp now() const { return utils::to_timestamp(clock_->now()); }

private:
    // Caller holds the unique lock
    void register_locked(const std::string& service, Timestamp now);

    Config config_;
    std::shared_ptr<IClock> clock_;

    std::vector<SyncRecord> records_;                   // registration order
    std::unordered_map<std::string, size_t> index_;     // service -> records_ slot
    mutable std::shared_mutex mutex_;
};

} // namespace wolfcache
