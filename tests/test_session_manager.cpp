#include <catch2/catch_test_macros.hpp>
#include "cache/session_manager.hpp"
#include "store/in_memory_store.hpp"
#include "mocks/mock_clock.hpp"

#include <algorithm>

using namespace wolfcache;
using namespace wolfcache::testing;
using namespace std::chrono_literals;
using nlohmann::json;

TEST_CASE("SessionManager lifecycle", "[sessions]") {
    auto clock = std::make_shared<ManualClock>(fixed_start());
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    auto cache = std::make_shared<KeyValueCache>(store);
    SessionManager sessions(cache);

    const json data = {{"theme", "dark"}, {"last_query", "wolves"}};

    SECTION("Create returns the session key") {
        CHECK(sessions.create_session("alice", data) == "session:alice");
        CHECK(SessionManager::session_key("alice") == "session:alice");
    }

    SECTION("Create then get") {
        sessions.create_session("alice", data);
        const auto got = sessions.get_session("alice");
        REQUIRE(got.has_value());
        CHECK(*got == data);
    }

    SECTION("Unknown user has no session") {
        CHECK_FALSE(sessions.get_session("nobody").has_value());
    }

    SECTION("Update replaces the whole record") {
        sessions.create_session("alice", data);
        REQUIRE(sessions.update_session("alice", json{{"theme", "light"}}));
        const auto got = sessions.get_session("alice");
        REQUIRE(got.has_value());
        CHECK(*got == json{{"theme", "light"}});
        CHECK_FALSE(got->contains("last_query"));
    }

    SECTION("Delete") {
        sessions.create_session("alice", data);
        CHECK(sessions.delete_session("alice"));
        CHECK_FALSE(sessions.get_session("alice").has_value());
    }

    SECTION("Sessions expire after a week") {
        sessions.create_session("alice", data);
        CHECK(store->ttl("session:alice") == std::chrono::seconds(86400 * 7));
        clock->advance(std::chrono::hours(24 * 7) - 1s);
        CHECK(sessions.get_session("alice").has_value());
        clock->advance(2s);
        CHECK_FALSE(sessions.get_session("alice").has_value());
    }

    SECTION("Update restarts the TTL") {
        sessions.create_session("alice", data);
        clock->advance(std::chrono::hours(24 * 6));
        REQUIRE(sessions.update_session("alice", data));
        clock->advance(std::chrono::hours(24 * 2));
        CHECK(sessions.get_session("alice").has_value());
    }

    SECTION("Active sessions are listed by user id") {
        sessions.create_session("alice", data);
        sessions.create_session("bob", data);
        cache->set("memory:1", 1);

        auto users = sessions.get_active_sessions();
        std::sort(users.begin(), users.end());
        CHECK(users == std::vector<std::string>{"alice", "bob"});
    }
}

TEST_CASE("SessionManager custom TTL", "[sessions]") {
    auto clock = std::make_shared<ManualClock>(fixed_start());
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    SessionManager sessions(std::make_shared<KeyValueCache>(store),
                            SessionManager::Config{60s});

    sessions.create_session("alice", json::object());
    clock->advance(61s);
    CHECK_FALSE(sessions.get_session("alice").has_value());
    CHECK(sessions.get_active_sessions().empty());
}

TEST_CASE("SessionManager with the cache disabled", "[sessions][fail-soft]") {
    SessionManager sessions(std::make_shared<KeyValueCache>(nullptr));

    CHECK(sessions.create_session("alice", json{{"a", 1}}) == "session:alice");
    CHECK_FALSE(sessions.get_session("alice").has_value());
    CHECK_FALSE(sessions.update_session("alice", json{{"a", 2}}));
    CHECK_FALSE(sessions.delete_session("alice"));
    CHECK(sessions.get_active_sessions().empty());
}
