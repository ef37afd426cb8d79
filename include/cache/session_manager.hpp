#pragma once

#include "cache/key_value_cache.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wolfcache {

/**
 * @brief Per-user session records under session:<user_id>
 *
 * The payload is opaque JSON owned by the caller. Updates replace the whole
 * record and restart its TTL; there is no partial merge.
 */
class SessionManager {
public:
    static constexpr std::string_view kPrefix = "session:";

    struct Config {
        std::chrono::seconds ttl{86400 * 7};
    };

    explicit SessionManager(std::shared_ptr<KeyValueCache> cache);
    SessionManager(std::shared_ptr<KeyValueCache> cache, Config config);

    /// Store a session, returns its key (even if the write was dropped)
    std::string create_session(const std::string& user_id, const nlohmann::json& data);

    [[nodiscard]] std::optional<nlohmann::json> get_session(const std::string& user_id);

    /// Full overwrite; false if the write did not reach the store
    bool update_session(const std::string& user_id, const nlohmann::json& data);

    bool delete_session(const std::string& user_id);

    /// User ids with a live session
    [[nodiscard]] std::vector<std::string> get_active_sessions();

    [[nodiscard]] static std::string session_key(const std::string& user_id) {
        return std::string(kPrefix) + user_id;
    }

private:
    bool write(const std::string& user_id, const nlohmann::json& data);

    std::shared_ptr<KeyValueCache> cache_;
    Config config_;
};

} // namespace wolfcache
