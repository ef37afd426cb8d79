#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace wolfcache {

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;

    ServerConfig()
        : host("0.0.0.0"),
          port(8900),
          thread_pool_size(4) {}
};

struct LoggingConfig {
    std::string level = "info";
};

// Connection to the backing key-value store
struct StoreConfig {
    std::string url = "redis://localhost:6379";
    std::chrono::milliseconds connect_timeout{1500};
    std::chrono::milliseconds socket_timeout{1000};
    size_t pool_size = 4;
    std::chrono::seconds default_ttl{3600};
    size_t max_key_length = 256;
};

struct SessionConfig {
    std::chrono::seconds ttl{86400 * 7};
};

struct RateLimitConfig {
    bool fail_open = true;
    int64_t max_requests = 100;
    std::chrono::seconds window{60};
};

struct MemoryCacheConfig {
    std::chrono::seconds search_ttl{3600};
    std::chrono::seconds memory_ttl{86400};
    std::chrono::seconds stats_ttl{300};
};

struct TimeSyncConfig {
    std::chrono::milliseconds stale_threshold{60000};
    std::chrono::milliseconds needs_sync_threshold{1000};
    // Pre-registered at startup
    std::vector<std::string> services = {
        "flask-ui", "fastapi-rest", "fastapi-mcp", "sse-server", "pgvector", "neo4j"
    };
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    StoreConfig cache;
    SessionConfig sessions;
    RateLimitConfig rate_limit;
    MemoryCacheConfig memory_cache;
    TimeSyncConfig timesync;
};

} // namespace wolfcache
