#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace wolfcache;
using namespace std::chrono_literals;

TEST_CASE("ConfigLoader: empty document gives defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& c = result.config;

    CHECK(c.server.host == "0.0.0.0");
    CHECK(c.server.port == 8900);
    CHECK(c.server.thread_pool_size == 4);
    CHECK(c.logging.level == "info");
    CHECK(c.cache.url == "redis://localhost:6379");
    CHECK(c.cache.connect_timeout == 1500ms);
    CHECK(c.cache.socket_timeout == 1000ms);
    CHECK(c.cache.default_ttl == 3600s);
    CHECK(c.cache.max_key_length == 256);
    CHECK(c.sessions.ttl == std::chrono::seconds(86400 * 7));
    CHECK(c.rate_limit.fail_open);
    CHECK(c.rate_limit.max_requests == 100);
    CHECK(c.rate_limit.window == 60s);
    CHECK(c.memory_cache.search_ttl == 3600s);
    CHECK(c.memory_cache.memory_ttl == 86400s);
    CHECK(c.memory_cache.stats_ttl == 300s);
    CHECK(c.timesync.stale_threshold == 60000ms);
    CHECK(c.timesync.needs_sync_threshold == 1000ms);
    CHECK(c.timesync.services.size() == 6);
}

TEST_CASE("ConfigLoader: every section", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9000
threads = 8

[logging]
level = "debug"

[cache]
url = "redis://cache:6379/1"
connect_timeout_ms = 500
socket_timeout_ms = 250
pool_size = 16
default_ttl_seconds = 120
max_key_length = 128

[sessions]
ttl_seconds = 3600

[rate_limit]
fail_open = false
max_requests = 20
window_seconds = 10

[memory_cache]
search_ttl_seconds = 60
memory_ttl_seconds = 600
stats_ttl_seconds = 30

[timesync]
stale_threshold_ms = 30000
needs_sync_threshold_ms = 250
services = ["neo4j"]
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& c = result.config;

    CHECK(c.server.host == "127.0.0.1");
    CHECK(c.server.port == 9000);
    CHECK(c.server.thread_pool_size == 8);
    CHECK(c.logging.level == "debug");
    CHECK(c.cache.url == "redis://cache:6379/1");
    CHECK(c.cache.connect_timeout == 500ms);
    CHECK(c.cache.socket_timeout == 250ms);
    CHECK(c.cache.pool_size == 16);
    CHECK(c.cache.default_ttl == 120s);
    CHECK(c.cache.max_key_length == 128);
    CHECK(c.sessions.ttl == 3600s);
    CHECK_FALSE(c.rate_limit.fail_open);
    CHECK(c.rate_limit.max_requests == 20);
    CHECK(c.rate_limit.window == 10s);
    CHECK(c.memory_cache.search_ttl == 60s);
    CHECK(c.memory_cache.memory_ttl == 600s);
    CHECK(c.memory_cache.stats_ttl == 30s);
    CHECK(c.timesync.stale_threshold == 30000ms);
    CHECK(c.timesync.needs_sync_threshold == 250ms);
    CHECK(c.timesync.services == std::vector<std::string>{"neo4j"});
}

TEST_CASE("ConfigLoader: empty services list disables pre-registration", "[config]") {
    auto result = ConfigLoader::load_from_string("[timesync]\nservices = []\n");
    REQUIRE(result.success);
    CHECK(result.config.timesync.services.empty());
}

TEST_CASE("ConfigValidation: invalid port fails", "[config][validation]") {
    auto zero = ConfigLoader::load_from_string("[server]\nport = 0\n");
    CHECK_FALSE(zero.success);
    CHECK(zero.error_message.find("server.port") != std::string::npos);

    auto big = ConfigLoader::load_from_string("[server]\nport = 70000\n");
    CHECK_FALSE(big.success);
}

TEST_CASE("ConfigValidation: negative sizes fail instead of wrapping", "[config][validation]") {
    auto threads = ConfigLoader::load_from_string("[server]\nthreads = -1\n");
    CHECK_FALSE(threads.success);
    CHECK(threads.error_message.find("server.threads") != std::string::npos);

    auto pool = ConfigLoader::load_from_string("[cache]\npool_size = -4\n");
    CHECK_FALSE(pool.success);
    CHECK(pool.error_message.find("cache.pool_size") != std::string::npos);

    auto key_length = ConfigLoader::load_from_string("[cache]\nmax_key_length = -1\n");
    CHECK_FALSE(key_length.success);
    CHECK(key_length.error_message.find("cache.max_key_length") != std::string::npos);

    auto huge = ConfigLoader::load_from_string("[server]\nthreads = 5000\n");
    CHECK_FALSE(huge.success);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: max_key_length too small fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[cache]\nmax_key_length = 10\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("max_key_length") != std::string::npos);
}

TEST_CASE("ConfigValidation: non-positive rate limit fails", "[config][validation]") {
    const std::string toml = R"(
[rate_limit]
max_requests = 0
window_seconds = -1
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("rate_limit.max_requests") != std::string::npos);
    CHECK(result.error_message.find("rate_limit.window_seconds") != std::string::npos);
}

TEST_CASE("ConfigValidation: errors are collected, not just the first", "[config][validation]") {
    const std::string toml = R"(
[sessions]
ttl_seconds = 0

[memory_cache]
stats_ttl_seconds = 0

[timesync]
stale_threshold_ms = 0
services = ["ok", ""]
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("sessions.ttl_seconds") != std::string::npos);
    CHECK(result.error_message.find("memory_cache TTLs") != std::string::npos);
    CHECK(result.error_message.find("timesync.stale_threshold_ms") != std::string::npos);
    CHECK(result.error_message.find("timesync.services[1]") != std::string::npos);

    const auto errors = ConfigLoader::validate_config(result.config);
    CHECK(errors.empty());  // failed loads carry a default config
}

TEST_CASE("ConfigValidation: validate_config on a built config", "[config][validation]") {
    AppConfig config;
    CHECK(ConfigLoader::validate_config(config).empty());

    config.cache.url.clear();
    config.cache.pool_size = 0;
    const auto errors = ConfigLoader::validate_config(config);
    CHECK(errors.size() == 2);
}

TEST_CASE("ConfigLoader: malformed TOML fails", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/wolfcache.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("not found") != std::string::npos);
    }

    SECTION("Existing file") {
        const auto path = std::filesystem::temp_directory_path() / "wolfcache_test_config.toml";
        {
            std::ofstream out(path);
            out << "[server]\nport = 9123\n";
        }
        auto result = ConfigLoader::load_from_file(path.string());
        std::filesystem::remove(path);

        REQUIRE(result.success);
        CHECK(result.config.server.port == 9123);
    }
}
