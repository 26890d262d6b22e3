#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "talentmatch/MatchCache.hpp"

using namespace talentmatch;

static std::vector<MatchResult> one_result(const std::string& id, double score) {
    MatchResult r;
    r.counterpart_id = id;
    r.tie_break_key = id;
    r.score = score;
    return {r};
}

TEST(MatchCacheTest, HitReturnsStoredList) {
    MatchCache cache;
    const CacheKey k{"acme", "q", 1};

    EXPECT_FALSE(cache.get(k).has_value());
    cache.put(k, one_result("j1", 0.5));

    const auto hit = cache.get(k);
    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(hit->size(), 1u);
    EXPECT_EQ((*hit)[0].counterpart_id, "j1");

    const CacheStats s = cache.stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.size, 1u);
}

TEST(MatchCacheTest, KeyIncludesTenantAndVersion) {
    MatchCache cache;
    cache.put(CacheKey{"acme", "q", 1}, one_result("j1", 0.5));

    EXPECT_FALSE(cache.get(CacheKey{"globex", "q", 1}).has_value());
    EXPECT_FALSE(cache.get(CacheKey{"acme", "q", 2}).has_value());
    EXPECT_FALSE(cache.get(CacheKey{"acme", "q2", 1}).has_value());
    EXPECT_TRUE(cache.get(CacheKey{"acme", "q", 1}).has_value());
}

TEST(MatchCacheTest, EvictsLeastRecentlyUsed) {
    MatchCacheConfig cfg;
    cfg.capacity = 2;
    MatchCache cache(cfg);

    const CacheKey a{"t", "a", 1};
    const CacheKey b{"t", "b", 1};
    const CacheKey c{"t", "c", 1};

    cache.put(a, one_result("a", 0.1));
    cache.put(b, one_result("b", 0.2));
    ASSERT_TRUE(cache.get(a).has_value());  // a is now most recent
    cache.put(c, one_result("c", 0.3));

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get(a).has_value());
    EXPECT_FALSE(cache.get(b).has_value());
    EXPECT_TRUE(cache.get(c).has_value());
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(MatchCacheTest, PutOnExistingKeyReplacesValue) {
    MatchCacheConfig cfg;
    cfg.capacity = 1;
    MatchCache cache(cfg);
    const CacheKey k{"t", "q", 1};

    cache.put(k, one_result("old", 0.1));
    cache.put(k, one_result("new", 0.2));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ((*cache.get(k))[0].counterpart_id, "new");
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST(MatchCacheTest, ZeroCapacityDisablesCaching) {
    MatchCacheConfig cfg;
    cfg.capacity = 0;
    MatchCache cache(cfg);
    const CacheKey k{"t", "q", 1};

    cache.put(k, one_result("j1", 0.5));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get(k).has_value());
}

TEST(MatchCacheTest, ExpiredEntryIsAMiss) {
    MatchCacheConfig cfg;
    cfg.ttl = std::chrono::milliseconds(5);
    MatchCache cache(cfg);
    const CacheKey k{"t", "q", 1};

    cache.put(k, one_result("j1", 0.5));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_FALSE(cache.get(k).has_value());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().expirations, 1u);
}

TEST(MatchCacheTest, ClearEmptiesEverything) {
    MatchCache cache;
    cache.put(CacheKey{"t", "a", 1}, one_result("a", 0.1));
    cache.put(CacheKey{"t", "b", 1}, one_result("b", 0.1));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get(CacheKey{"t", "a", 1}).has_value());
}

TEST(MatchCacheTest, ConcurrentAccessKeepsSizeBounded) {
    MatchCacheConfig cfg;
    cfg.capacity = 16;
    MatchCache cache(cfg);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                const CacheKey k{"t", std::to_string((i * 7 + t) % 40), 1};
                if (!cache.get(k)) cache.put(k, one_result(k.query, 0.5));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(cache.size(), 16u);
    const CacheStats s = cache.stats();
    EXPECT_EQ(s.hits + s.misses, 800u);
}
