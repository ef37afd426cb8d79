#include <catch2/catch_test_macros.hpp>
#include "cache/memory_cache.hpp"
#include "store/in_memory_store.hpp"
#include "mocks/mock_clock.hpp"

using namespace wolfcache;
using namespace wolfcache::testing;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct MemoryCacheFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(fixed_start());
    std::shared_ptr<InMemoryKeyValueStore> store = std::make_shared<InMemoryKeyValueStore>(clock);
    std::shared_ptr<KeyValueCache> cache = std::make_shared<KeyValueCache>(store);
    MemoryCache memories{cache};
};

} // namespace

TEST_CASE("MemoryCache search results", "[memory_cache]") {
    MemoryCacheFixture f;
    auto& mc = f.memories;
    const json results = json::array({{{"id", 1}, {"score", 0.93}}, {{"id", 7}, {"score", 0.71}}});

    SECTION("Default user") {
        REQUIRE(mc.cache_search("grey wolves", results));
        CHECK(f.store->get("search:default:grey wolves").has_value());
        const auto got = mc.get_cached_search("grey wolves");
        REQUIRE(got.has_value());
        CHECK(*got == results);
    }

    SECTION("Users are isolated") {
        REQUIRE(mc.cache_search("q", results, "alice"));
        CHECK(mc.get_cached_search("q", "alice").has_value());
        CHECK_FALSE(mc.get_cached_search("q", "bob").has_value());
        CHECK_FALSE(mc.get_cached_search("q").has_value());
    }

    SECTION("Search results live for an hour") {
        REQUIRE(mc.cache_search("q", results));
        CHECK(f.store->ttl("search:default:q") == 3600s);
        f.clock->advance(3601s);
        CHECK_FALSE(mc.get_cached_search("q").has_value());
    }

    SECTION("Invalidate one user's searches") {
        mc.cache_search("a", results, "alice");
        mc.cache_search("b", results, "alice");
        mc.cache_search("a", results, "bob");

        CHECK(mc.invalidate_searches("alice") == 2);
        CHECK_FALSE(mc.get_cached_search("a", "alice").has_value());
        CHECK(mc.get_cached_search("a", "bob").has_value());
    }

    SECTION("Invalidate all searches") {
        mc.cache_search("a", results, "alice");
        mc.cache_search("a", results, "bob");
        mc.cache_memory("m1", json{{"text", "keep me"}});

        CHECK(mc.invalidate_searches() == 2);
        CHECK(mc.get_cached_memory("m1").has_value());
    }

    SECTION("Oversized queries still round-trip") {
        const std::string query(400, 'q');
        REQUIRE(mc.cache_search(query, results, "alice"));
        const auto got = mc.get_cached_search(query, "alice");
        REQUIRE(got.has_value());
        CHECK(*got == results);
        // Hashed keys drop the user segment, so only the global sweep reaches them
        CHECK(mc.invalidate_searches("alice") == 0);
        CHECK(mc.invalidate_searches() == 1);
    }
}

TEST_CASE("MemoryCache memory objects", "[memory_cache]") {
    MemoryCacheFixture f;
    auto& mc = f.memories;
    const json memory = {{"id", "m42"}, {"text", "pack moved north"}, {"tags", {"wolf"}}};

    REQUIRE(mc.cache_memory("m42", memory));
    CHECK(f.store->get("memory:m42").has_value());

    const auto got = mc.get_cached_memory("m42");
    REQUIRE(got.has_value());
    CHECK(*got == memory);

    SECTION("Lives for a day") {
        CHECK(f.store->ttl("memory:m42") == 86400s);
        f.clock->advance(86401s);
        CHECK_FALSE(mc.get_cached_memory("m42").has_value());
    }

    SECTION("Invalidate") {
        CHECK(mc.invalidate_memory("m42"));
        CHECK_FALSE(mc.get_cached_memory("m42").has_value());
    }
}

TEST_CASE("MemoryCache statistics", "[memory_cache]") {
    MemoryCacheFixture f;
    auto& mc = f.memories;

    REQUIRE(mc.cache_stats("daily:2026-10-19", json{{"count", 12}}));
    REQUIRE(mc.cache_stats("daily:2026-10-18", json{{"count", 9}}));
    REQUIRE(mc.cache_stats("totals", json{{"count", 340}}));

    SECTION("Five minute TTL") {
        CHECK(f.store->ttl("stats:totals") == 300s);
        f.clock->advance(301s);
        CHECK_FALSE(mc.get_cached_stats("totals").has_value());
    }

    SECTION("Invalidate by pattern") {
        CHECK(mc.invalidate_stats("daily:*") == 2);
        CHECK(mc.get_cached_stats("totals").has_value());
    }

    SECTION("Invalidate a single key") {
        CHECK(mc.invalidate_stats("totals") == 1);
        CHECK_FALSE(mc.get_cached_stats("totals").has_value());
    }

    SECTION("Invalidate all") {
        CHECK(mc.invalidate_stats() == 3);
    }
}

TEST_CASE("MemoryCache custom TTLs", "[memory_cache]") {
    auto clock = std::make_shared<ManualClock>(fixed_start());
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    MemoryCache mc(std::make_shared<KeyValueCache>(store), MemoryCache::Config{10s, 20s, 30s});

    mc.cache_search("q", json::array());
    mc.cache_memory("m", json::object());
    mc.cache_stats("s", json::object());

    CHECK(store->ttl("search:default:q") == 10s);
    CHECK(store->ttl("memory:m") == 20s);
    CHECK(store->ttl("stats:s") == 30s);
}

TEST_CASE("MemoryCache with the cache disabled", "[memory_cache][fail-soft]") {
    MemoryCache mc(std::make_shared<KeyValueCache>(nullptr));

    CHECK_FALSE(mc.cache_search("q", json::array()));
    CHECK_FALSE(mc.get_cached_search("q").has_value());
    CHECK(mc.invalidate_searches() == 0);
    CHECK_FALSE(mc.cache_memory("m", json::object()));
    CHECK_FALSE(mc.invalidate_memory("m"));
    CHECK(mc.invalidate_stats() == 0);
}
