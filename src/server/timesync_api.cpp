#include "server/timesync_api.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <format>

namespace wolfcache {

using nlohmann::json;

namespace {

// Parse a JSON object body; nullopt (with reason) if it is not one
std::optional<json> parse_object(const std::string& body, std::string& error) {
    try {
        auto parsed = json::parse(body);
        if (!parsed.is_object()) {
            error = "request body must be a JSON object";
            return std::nullopt;
        }
        return parsed;
    } catch (const json::parse_error& e) {
        // e.what() may quote the offending bytes, which need not be UTF-8
        error = std::format("invalid JSON at byte {}", e.byte);
        return std::nullopt;
    }
}

// Service names end up in every status response, so they must serialize
bool valid_service_name(const std::string& name, std::string& error) {
    if (name.empty()) {
        error = "service name must not be empty";
        return false;
    }
    if (!utils::is_valid_utf8(name)) {
        error = "service name must be valid UTF-8";
        return false;
    }
    return true;
}

// Non-empty "service" string field
std::optional<std::string> service_field(const json& obj, std::string& error) {
    const auto it = obj.find("service");
    if (it == obj.end() || !it->is_string()) {
        error = "'service' must be a non-empty string";
        return std::nullopt;
    }
    auto name = it->get<std::string>();
    if (!valid_service_name(name, error)) return std::nullopt;
    return name;
}

} // anonymous namespace

TimeSyncApi::TimeSyncApi(std::shared_ptr<TimeSyncTracker> tracker,
                         CacheServices services)
    : tracker_(std::move(tracker)), services_(std::move(services)) {}

TimeSyncApi::Response TimeSyncApi::bad_request(const std::string& message) {
    return {http::kBadRequest, json{{"error", message}}};
}

json TimeSyncApi::record_to_json(const SyncRecord& record) {
    return {
        {"service", record.service},
        {"last_sync", utils::format_timestamp(record.last_sync)},
        {"last_memory_update", utils::format_timestamp(record.last_memory_update)},
        {"status", service_status_to_string(record.status)}
    };
}

TimeSyncApi::Response TimeSyncApi::health() const {
    json body = {
        {"status", "ok"},
        {"service", http::kServiceName},
        {"registered_services", tracker_->service_count()}
    };
    if (services_.cache) {
        body["cache"] = services_.cache->is_enabled() ? "connected" : "disconnected";
    }
    return {http::kOk, std::move(body)};
}

TimeSyncApi::Response TimeSyncApi::stats() {
    const std::string stats_key(kStatsKey);
    if (services_.memory_cache) {
        if (auto cached = services_.memory_cache->get_cached_stats(stats_key)) {
            return {http::kOk, std::move(*cached)};
        }
    }

    json body = {
        {"timestamp", utils::format_timestamp(tracker_->now())},
        {"service", http::kServiceName},
        {"cache_enabled", services_.cache && services_.cache->is_enabled()},
        {"registered_services", tracker_->service_count()}
    };
    if (services_.cache) {
        const auto cs = services_.cache->get_stats();
        body["cache"] = {
            {"hits", cs.hits},
            {"misses", cs.misses},
            {"writes", cs.writes},
            {"errors", cs.errors}
        };
    }
    if (services_.rate_limiter) {
        const auto rs = services_.rate_limiter->get_stats();
        body["rate_limit"] = {
            {"allowed", rs.allowed},
            {"denied", rs.denied},
            {"bypassed", rs.bypassed}
        };
    }

    if (services_.memory_cache) {
        services_.memory_cache->cache_stats(stats_key, body);
    }
    return {http::kOk, std::move(body)};
}

std::optional<TimeSyncApi::Response> TimeSyncApi::admit(const std::string& client) {
    if (!services_.rate_limiter) return std::nullopt;

    const std::string id = std::string(kRateLimitPrefix) + client;
    if (services_.rate_limiter->is_allowed(id)) return std::nullopt;

    utils::log::warn(std::format("Rate limit exceeded for client {}", client));
    return Response{http::kTooManyRequests, json{
        {"error", "rate limit exceeded"},
        {"remaining", services_.rate_limiter->get_remaining(id)}
    }};
}

TimeSyncApi::Response TimeSyncApi::sync(const std::string& body) {
    std::string error;
    const auto req = parse_object(body, error);
    if (!req) return bad_request(error);

    const auto service = service_field(*req, error);
    if (!service) return bad_request(error);

    bool is_memory_update = false;
    if (const auto it = req->find("is_memory_update"); it != req->end() && !it->is_null()) {
        if (!it->is_boolean()) return bad_request("'is_memory_update' must be a boolean");
        is_memory_update = it->get<bool>();
    }

    const Timestamp ts = tracker_->update_sync(*service, is_memory_update);
    return {http::kOk, json{
        {"service", *service},
        {"timestamp", utils::format_timestamp(ts)},
        {"is_memory_update", is_memory_update},
        {"success", true}
    }};
}

TimeSyncApi::Response TimeSyncApi::status(const std::string& service) {
    std::string error;
    if (!valid_service_name(service, error)) return bad_request(error);

    const bool is_stale = tracker_->check_stale(service);
    const auto record = tracker_->get_status(service);

    return {http::kOk, json{
        {"service", service},
        {"is_stale", is_stale},
        {"status", record ? record_to_json(*record) : json(nullptr)}
    }};
}

TimeSyncApi::Response TimeSyncApi::all_statuses() {
    json services = json::array();
    for (const auto& snapshot : tracker_->get_all_statuses()) {
        const bool is_stale = tracker_->check_stale(snapshot.service);
        // Re-read so the reported status reflects a flip made just now
        const auto record = tracker_->get_status(snapshot.service).value_or(snapshot);
        json entry = record_to_json(record);
        entry["is_stale"] = is_stale;
        services.push_back(std::move(entry));
    }

    const size_t total = services.size();
    return {http::kOk, json{
        {"services", std::move(services)},
        {"total_services", total},
        {"timestamp", utils::format_timestamp(tracker_->now())}
    }};
}

TimeSyncApi::Response TimeSyncApi::compare(const std::string& body) const {
    std::string error;
    const auto req = parse_object(body, error);
    if (!req) return bad_request(error);

    const auto service = service_field(*req, error);
    if (!service) return bad_request(error);

    const auto ts_it = req->find("timestamp");
    if (ts_it == req->end() || !ts_it->is_string()) {
        return bad_request("'timestamp' must be an ISO-8601 string");
    }
    const auto client_ts = utils::parse_timestamp(ts_it->get<std::string>());
    if (!client_ts) {
        return bad_request(std::format("unparseable timestamp '{}'", ts_it->get<std::string>()));
    }

    const auto result = tracker_->compare_timestamps(*service, *client_ts);
    return {http::kOk, json{
        {"service", result.service},
        {"client_timestamp", utils::format_timestamp(result.client_timestamp)},
        {"server_timestamp", utils::format_timestamp(result.server_timestamp)},
        {"is_client_newer", result.is_client_newer},
        {"diff_ms", result.diff_ms},
        {"diff_seconds", result.diff_seconds},
        {"needs_sync", result.needs_sync}
    }};
}

TimeSyncApi::Response TimeSyncApi::latest() const {
    const auto latest = tracker_->get_latest_timestamp();

    json latest_json = nullptr;
    if (latest) {
        latest_json = {
            {"service", latest->service},
            {"timestamp", utils::format_timestamp(latest->timestamp)}
        };
    }
    return {http::kOk, json{
        {"latest", std::move(latest_json)},
        {"current_time", utils::format_timestamp(tracker_->now())}
    }};
}

TimeSyncApi::Response TimeSyncApi::register_service(const std::string& service) {
    std::string error;
    if (!valid_service_name(service, error)) return bad_request(error);

    tracker_->register_service(service);
    return {http::kOk, json{
        {"service", service},
        {"registered", true},
        {"timestamp", utils::format_timestamp(tracker_->now())}
    }};
}

TimeSyncApi::Response TimeSyncApi::disconnect(const std::string& service) {
    std::string error;
    if (!valid_service_name(service, error)) return bad_request(error);

    const bool disconnected = tracker_->mark_disconnected(service);
    return {disconnected ? http::kOk : http::kNotFound, json{
        {"service", service},
        {"disconnected", disconnected}
    }};
}

} // namespace wolfcache
