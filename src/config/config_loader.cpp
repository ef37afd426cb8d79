#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace wolfcache {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    const int64_t port = s["port"].value_or(int64_t{8900});
    if (!utils::in_range<1, 65535>(port)) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);
    const int64_t threads = s["threads"].value_or(int64_t{4});
    if (!utils::in_range<1, 1024>(threads)) {
        throw std::runtime_error(std::format("server.threads must be 1-1024, got {}", threads));
    }
    cfg.thread_pool_size = static_cast<size_t>(threads);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

StoreConfig extract_cache(const toml::table& root) {
    StoreConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.url = c["url"].value_or(cfg.url);
    cfg.connect_timeout = std::chrono::milliseconds(c["connect_timeout_ms"].value_or(int64_t{1500}));
    cfg.socket_timeout = std::chrono::milliseconds(c["socket_timeout_ms"].value_or(int64_t{1000}));
    const int64_t pool_size = c["pool_size"].value_or(int64_t{4});
    if (!utils::in_range<1, 1024>(pool_size)) {
        throw std::runtime_error(std::format("cache.pool_size must be 1-1024, got {}", pool_size));
    }
    cfg.pool_size = static_cast<size_t>(pool_size);
    cfg.default_ttl = std::chrono::seconds(c["default_ttl_seconds"].value_or(int64_t{3600}));
    const int64_t max_key_length = c["max_key_length"].value_or(int64_t{256});
    if (max_key_length < 0) {
        throw std::runtime_error(std::format("cache.max_key_length must not be negative, got {}",
                                             max_key_length));
    }
    cfg.max_key_length = static_cast<size_t>(max_key_length);
    return cfg;
}

SessionConfig extract_sessions(const toml::table& root) {
    SessionConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;

    cfg.ttl = std::chrono::seconds((*sessions)["ttl_seconds"].value_or(int64_t{86400 * 7}));
    return cfg;
}

RateLimitConfig extract_rate_limit(const toml::table& root) {
    RateLimitConfig cfg;
    const auto* rl = root["rate_limit"].as_table();
    if (!rl) return cfg;
    const auto& r = *rl;

    cfg.fail_open = r["fail_open"].value_or(true);
    cfg.max_requests = r["max_requests"].value_or(int64_t{100});
    cfg.window = std::chrono::seconds(r["window_seconds"].value_or(int64_t{60}));
    return cfg;
}

MemoryCacheConfig extract_memory_cache(const toml::table& root) {
    MemoryCacheConfig cfg;
    const auto* mc = root["memory_cache"].as_table();
    if (!mc) return cfg;
    const auto& m = *mc;

    cfg.search_ttl = std::chrono::seconds(m["search_ttl_seconds"].value_or(int64_t{3600}));
    cfg.memory_ttl = std::chrono::seconds(m["memory_ttl_seconds"].value_or(int64_t{86400}));
    cfg.stats_ttl = std::chrono::seconds(m["stats_ttl_seconds"].value_or(int64_t{300}));
    return cfg;
}

TimeSyncConfig extract_timesync(const toml::table& root) {
    TimeSyncConfig cfg;
    const auto* ts = root["timesync"].as_table();
    if (!ts) return cfg;
    const auto& t = *ts;

    cfg.stale_threshold = std::chrono::milliseconds(t["stale_threshold_ms"].value_or(int64_t{60000}));
    cfg.needs_sync_threshold = std::chrono::milliseconds(t["needs_sync_threshold_ms"].value_or(int64_t{1000}));

    // An explicit list (even empty) replaces the built-in defaults
    if (const auto* services = t["services"].as_array()) {
        cfg.services.clear();
        for (const auto& elem : *services) {
            if (auto v = elem.value<std::string>()) {
                cfg.services.push_back(*v);
            }
        }
    }
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.cache = extract_cache(tbl);
    config.sessions = extract_sessions(tbl);
    config.rate_limit = extract_rate_limit(tbl);
    config.memory_cache = extract_memory_cache(tbl);
    config.timesync = extract_timesync(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        return LoadResult::error(std::format("Config file not found: {}", config_path));
    }
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_env_overrides(AppConfig& config) {
    if (const char* url = std::getenv("REDIS_URL"); url && *url) {
        config.cache.url = url;
    }
    if (const char* port = std::getenv("TIMESYNC_PORT"); port && *port) {
        const auto parsed = utils::try_parse_int<int>(port);
        if (parsed && utils::in_range<1, 65535>(*parsed)) {
            config.server.port = static_cast<uint16_t>(*parsed);
        } else {
            utils::log::warn(std::format("Ignoring invalid TIMESYNC_PORT '{}'", port));
        }
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be at least 1");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.cache.url.empty()) {
        errors.push_back("cache.url must not be empty");
    }
    if (config.cache.connect_timeout.count() <= 0) {
        errors.push_back("cache.connect_timeout_ms must be positive");
    }
    if (config.cache.socket_timeout.count() <= 0) {
        errors.push_back("cache.socket_timeout_ms must be positive");
    }
    if (config.cache.pool_size == 0) {
        errors.push_back("cache.pool_size must be at least 1");
    }
    if (config.cache.default_ttl.count() < 0) {
        errors.push_back("cache.default_ttl_seconds must not be negative");
    }
    // prefix + ':' + 32 hex chars must still fit after hashing
    if (config.cache.max_key_length < 64) {
        errors.push_back(std::format("cache.max_key_length must be at least 64, got {}",
                                     config.cache.max_key_length));
    }

    if (config.sessions.ttl.count() <= 0) {
        errors.push_back("sessions.ttl_seconds must be positive");
    }

    if (config.rate_limit.max_requests <= 0) {
        errors.push_back("rate_limit.max_requests must be positive");
    }
    if (config.rate_limit.window.count() <= 0) {
        errors.push_back("rate_limit.window_seconds must be positive");
    }

    if (config.memory_cache.search_ttl.count() <= 0 ||
        config.memory_cache.memory_ttl.count() <= 0 ||
        config.memory_cache.stats_ttl.count() <= 0) {
        errors.push_back("memory_cache TTLs must be positive");
    }

    if (config.timesync.stale_threshold.count() <= 0) {
        errors.push_back("timesync.stale_threshold_ms must be positive");
    }
    if (config.timesync.needs_sync_threshold.count() < 0) {
        errors.push_back("timesync.needs_sync_threshold_ms must not be negative");
    }
    for (size_t i = 0; i < config.timesync.services.size(); ++i) {
        if (config.timesync.services[i].empty()) {
            errors.push_back(std::format("timesync.services[{}] must not be empty", i));
        }
    }

    return errors;
}

} // namespace wolfcache
