#include "cache/session_manager.hpp"

namespace wolfcache {

SessionManager::SessionManager(std::shared_ptr<KeyValueCache> cache)
    : SessionManager(std::move(cache), Config{}) {}

SessionManager::SessionManager(std::shared_ptr<KeyValueCache> cache, Config config)
    : cache_(std::move(cache)), config_(config) {}

std::string SessionManager::create_session(const std::string& user_id,
                                           const nlohmann::json& data) {
    write(user_id, data);
    return session_key(user_id);
}

std::optional<nlohmann::json> SessionManager::get_session(const std::string& user_id) {
    return cache_->get(session_key(user_id));
}

bool SessionManager::update_session(const std::string& user_id,
                                    const nlohmann::json& data) {
    return write(user_id, data);
}

bool SessionManager::delete_session(const std::string& user_id) {
    return cache_->remove(session_key(user_id));
}

std::vector<std::string> SessionManager::get_active_sessions() {
    std::vector<std::string> users;
    for (const auto& key : cache_->scan_keys(std::string(kPrefix) + "*")) {
        users.push_back(key.substr(kPrefix.size()));
    }
    return users;
}

bool SessionManager::write(const std::string& user_id, const nlohmann::json& data) {
    return cache_->set(session_key(user_id), data, config_.ttl);
}

} // namespace wolfcache
