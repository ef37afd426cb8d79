#pragma once

#include "cache/cache_services.hpp"
#include "sync/time_sync_tracker.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wolfcache {

/**
 * @brief JSON request/response layer over TimeSyncTracker
 *
 * Transport-free so it can be driven directly from tests; TimeSyncServer
 * binds each method to an HTTP route. All timestamps in and out are
 * ISO-8601 strings with a timezone offset.
 */
class TimeSyncApi {
public:
    struct Response {
        int status = 200;
        nlohmann::json body;
    };

    static constexpr std::string_view kRateLimitPrefix = "timesync:";
    static constexpr std::string_view kStatsKey = "system";

    /**
     * @param tracker Registry to expose
     * @param services Optional cache layer: health reporting, /stats caching
     *                 and per-client rate limiting. Null members disable each.
     */
    explicit TimeSyncApi(std::shared_ptr<TimeSyncTracker> tracker,
                         CacheServices services = {});

    [[nodiscard]] Response health() const;

    /// GET /stats, served from the stats cache while fresh
    [[nodiscard]] Response stats();

    /**
     * @brief Per-client admission for mutating routes
     * @return A 429 response if the client is over its window, nullopt to proceed
     */
    [[nodiscard]] std::optional<Response> admit(const std::string& client);

    /// POST /sync  {"service": "...", "is_memory_update": false}
    [[nodiscard]] Response sync(const std::string& body);

    /// GET /sync/status/{service}
    [[nodiscard]] Response status(const std::string& service);

    /// GET /sync/status
    [[nodiscard]] Response all_statuses();

    /// POST /sync/compare  {"service": "...", "timestamp": "<iso-8601>"}
    [[nodiscard]] Response compare(const std::string& body) const;

    /// GET /sync/latest
    [[nodiscard]] Response latest() const;

    /// POST /sync/register/{service}
    [[nodiscard]] Response register_service(const std::string& service);

    /// POST /sync/disconnect/{service}
    [[nodiscard]] Response disconnect(const std::string& service);

    [[nodiscard]] static nlohmann::json record_to_json(const SyncRecord& record);

private:
    static Response bad_request(const std::string& message);

    std::shared_ptr<TimeSyncTracker> tracker_;
    CacheServices services_;
};

} // namespace wolfcache
