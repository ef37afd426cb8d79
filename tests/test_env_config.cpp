#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace wolfcache;

TEST_CASE("EnvConfig: expand env var in cache url", "[config][env]") {
    ::setenv("TEST_REDIS_PASSWORD", "s3cret", 1);

    const std::string toml = R"(
[cache]
url = "redis://:${TEST_REDIS_PASSWORD}@cache.internal:6379/2"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.cache.url == "redis://:s3cret@cache.internal:6379/2");

    ::unsetenv("TEST_REDIS_PASSWORD");
}

TEST_CASE("EnvConfig: missing env var expands to empty", "[config][env]") {
    ::unsetenv("NONEXISTENT_VAR_XYZ_12345");

    const std::string toml = R"(
[server]
host = "${NONEXISTENT_VAR_XYZ_12345}127.0.0.1"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.server.host == "127.0.0.1");
}

TEST_CASE("EnvConfig: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[cache]
url = "redis://${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("EnvConfig: env vars inside arrays", "[config][env]") {
    ::setenv("TEST_EXTRA_SERVICE", "vector-indexer", 1);

    const std::string toml = R"(
[timesync]
services = ["flask-ui", "${TEST_EXTRA_SERVICE}"]
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.timesync.services ==
          std::vector<std::string>{"flask-ui", "vector-indexer"});

    ::unsetenv("TEST_EXTRA_SERVICE");
}

TEST_CASE("EnvConfig: loading does not read override variables", "[config][env]") {
    ::setenv("REDIS_URL", "redis://override:6379", 1);

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.cache.url == "redis://localhost:6379");

    ::unsetenv("REDIS_URL");
}

TEST_CASE("EnvConfig: REDIS_URL and TIMESYNC_PORT overrides", "[config][env]") {
    AppConfig config;

    SECTION("Both set") {
        ::setenv("REDIS_URL", "redis://override:6380", 1);
        ::setenv("TIMESYNC_PORT", "9100", 1);
        ConfigLoader::apply_env_overrides(config);
        CHECK(config.cache.url == "redis://override:6380");
        CHECK(config.server.port == 9100);
    }

    SECTION("Invalid port is ignored") {
        ::setenv("TIMESYNC_PORT", "99999", 1);
        ConfigLoader::apply_env_overrides(config);
        CHECK(config.server.port == 8900);

        ::setenv("TIMESYNC_PORT", "eighty", 1);
        ConfigLoader::apply_env_overrides(config);
        CHECK(config.server.port == 8900);
    }

    SECTION("Unset leaves config alone") {
        ::unsetenv("REDIS_URL");
        ::unsetenv("TIMESYNC_PORT");
        ConfigLoader::apply_env_overrides(config);
        CHECK(config.cache.url == "redis://localhost:6379");
        CHECK(config.server.port == 8900);
    }

    ::unsetenv("REDIS_URL");
    ::unsetenv("TIMESYNC_PORT");
}
