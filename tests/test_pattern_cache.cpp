#include <catch2/catch_test_macros.hpp>
#include "pattern/PatternCache.hpp"
#include "pattern/PatternErrors.hpp"

#include <thread>
#include <vector>

using pattern::PatternCache;

TEST_CASE("PatternCache - lookups", "[pattern][cache]")
{
    PatternCache cache;

    auto first = cache.get("app/greeting#en|*|*", "Hello {0}");
    auto second = cache.get("app/greeting#en|*|*", "Hello {0}");
    REQUIRE(first == second);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.misses() == 1);
    REQUIRE(cache.hits() == 1);

    SECTION("Same text under another owner is a separate entry")
    {
        auto other = cache.get("", "Hello {0}");
        REQUIRE(other != first);
        REQUIRE(cache.size() == 2);
    }

    SECTION("Edited text under the same owner never returns the old form")
    {
        auto edited = cache.get("app/greeting#en|*|*", "Hi {0}");
        REQUIRE(edited->source == "Hi {0}");
    }
}

TEST_CASE("PatternCache - invalidation", "[pattern][cache]")
{
    PatternCache cache;
    (void)cache.get("a", "one");
    (void)cache.get("a", "two");
    (void)cache.get("b", "three");

    REQUIRE(cache.invalidate("a") == 2);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.invalidate("a") == 0);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("PatternCache - malformed patterns are not cached", "[pattern][cache]")
{
    PatternCache cache;
    REQUIRE_THROWS_AS(cache.get("x", "broken {0"), pattern::PatternParseError);
    REQUIRE(cache.size() == 0);
    REQUIRE_THROWS_AS(cache.get("x", "broken {0"), pattern::PatternParseError);
}

TEST_CASE("PatternCache - capacity evicts the least recently used entry", "[pattern][cache]")
{
    PatternCache cache(2);
    auto a = cache.get("", "a");
    (void)cache.get("", "b");
    REQUIRE(cache.get("", "a") == a);
    (void)cache.get("", "c");

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.capacity() == 2);

    const auto misses = cache.misses();
    REQUIRE(cache.get("", "a") == a);
    REQUIRE(cache.misses() == misses);
    (void)cache.get("", "b");
    REQUIRE(cache.misses() == misses + 1);

    SECTION("Shrinking keeps the most recent entries")
    {
        cache.setCapacity(1);
        REQUIRE(cache.size() == 1);
        const auto before = cache.misses();
        (void)cache.get("", "b");
        REQUIRE(cache.misses() == before);
    }
}

TEST_CASE("PatternCache - concurrent first use shares one compiled pattern", "[pattern][cache]")
{
    PatternCache cache;
    std::vector<std::shared_ptr<const pattern::CompiledPattern>> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([&cache, &results, i] { results[i] = cache.get("", "{0} of {1}"); });
    }
    for (auto& t : threads)
        t.join();

    REQUIRE(cache.size() == 1);
    auto shared = cache.get("", "{0} of {1}");
    for (const auto& r : results)
    {
        REQUIRE(r->source == shared->source);
    }
}
