#include "sync/time_sync_tracker.hpp"

#include <cstdlib>
#include <format>
#include <mutex>

namespace wolfcache {

TimeSyncTracker::TimeSyncTracker()
    : TimeSyncTracker(Config{}) {}

TimeSyncTracker::TimeSyncTracker(Config config, std::shared_ptr<IClock> clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

void TimeSyncTracker::register_service(const std::string& service) {
    {
        // Read under the lock so last_sync only moves forward
        std::unique_lock lock(mutex_);
        register_locked(service, now());
    }
    utils::log::info(std::format("[TIME-SYNC] Registered service: {}", service));
}

void TimeSyncTracker::register_locked(const std::string& service, Timestamp now) {
    SyncRecord record{service, now, now, ServiceStatus::ACTIVE};
    const auto it = index_.find(service);
    if (it != index_.end()) {
        records_[it->second] = std::move(record);
        return;
    }
    index_.emplace(service, records_.size());
    records_.push_back(std::move(record));
}

Timestamp TimeSyncTracker::update_sync(const std::string& service, bool is_memory_update) {
    Timestamp ts;
    bool registered = false;
    {
        std::unique_lock lock(mutex_);
        ts = now();
        const auto it = index_.find(service);
        if (it == index_.end()) {
            register_locked(service, ts);
            registered = true;
        } else {
            auto& record = records_[it->second];
            record.last_sync = ts;
            if (is_memory_update) {
                record.last_memory_update = ts;
            }
            record.status = ServiceStatus::ACTIVE;
        }
    }

    if (registered) {
        utils::log::info(std::format("[TIME-SYNC] Registered service: {}", service));
    }
    utils::log::info(std::format("[TIME-SYNC] {}: sync={}, memoryUpdate={}",
        service, utils::format_timestamp(ts), utils::booltostr(is_memory_update)));
    return ts;
}

bool TimeSyncTracker::check_stale(const std::string& service) {
    bool flipped = false;
    bool is_stale = false;
    {
        std::unique_lock lock(mutex_);
        const auto it = index_.find(service);
        if (it == index_.end()) {
            return true;
        }

        auto& record = records_[it->second];
        const auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(
            now() - record.last_sync);
        is_stale = diff > config_.stale_threshold;

        if (is_stale && record.status == ServiceStatus::ACTIVE) {
            record.status = ServiceStatus::STALE;
            flipped = true;
        }
    }

    if (flipped) {
        utils::log::warn(std::format("[TIME-SYNC] Service {} is STALE", service));
    }
    return is_stale;
}

bool TimeSyncTracker::mark_disconnected(const std::string& service) {
    {
        std::unique_lock lock(mutex_);
        const auto it = index_.find(service);
        if (it == index_.end()) {
            return false;
        }
        records_[it->second].status = ServiceStatus::DISCONNECTED;
    }
    utils::log::warn(std::format("[TIME-SYNC] Service {} disconnected", service));
    return true;
}

std::optional<SyncRecord> TimeSyncTracker::get_status(const std::string& service) const {
    std::shared_lock lock(mutex_);
    const auto it = index_.find(service);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

std::vector<SyncRecord> TimeSyncTracker::get_all_statuses() const {
    std::shared_lock lock(mutex_);
    return records_;
}

CompareResult TimeSyncTracker::compare_timestamps(const std::string& service,
                                                  Timestamp client_timestamp) const {
    CompareResult result;
    result.service = service;
    result.client_timestamp = client_timestamp;
    result.server_timestamp = Timestamp{};
    {
        std::shared_lock lock(mutex_);
        const auto it = index_.find(service);
        if (it != index_.end()) {
            result.server_timestamp = records_[it->second].last_memory_update;
        }
    }

    result.diff_ms = (client_timestamp - result.server_timestamp).count();
    result.is_client_newer = result.diff_ms > 0;
    result.diff_seconds = static_cast<double>(result.diff_ms) / 1000.0;
    result.needs_sync = std::llabs(result.diff_ms) > config_.needs_sync_threshold.count();
    return result;
}

std::optional<LatestUpdate> TimeSyncTracker::get_latest_timestamp() const {
    std::shared_lock lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }

    const SyncRecord* latest = &records_.front();
    for (const auto& record : records_) {
        if (record.last_memory_update > latest->last_memory_update) {
            latest = &record;
        }
    }
    return LatestUpdate{latest->service, latest->last_memory_update};
}

size_t TimeSyncTracker::service_count() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace wolfcache
