// tests/test_ttl_map.cpp
#include <chrono>
#include <string>

#include "gtest/gtest.h"

#include "ManualClock.hpp"
#include "../src/cache/TtlMap.hpp"

using namespace std::chrono_literals;

using Map = TtlMap<std::string, int, ManualClock>;

class TtlMapTest : public ::testing::Test {
protected:
    void SetUp() override {
        ManualClock::reset();
    }
};

TEST_F(TtlMapTest, BasicGetSet) {
    Map cache(5);
    EXPECT_FALSE(cache.set("a", 1, 1h));
    EXPECT_FALSE(cache.set("b", 2, 1h));

    ASSERT_NE(cache.get("a"), nullptr);
    EXPECT_EQ(*cache.get("a"), 1);
    ASSERT_NE(cache.get("b"), nullptr);
    EXPECT_EQ(*cache.get("b"), 2);
    EXPECT_EQ(cache.get("c"), nullptr);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.empty());
}

TEST_F(TtlMapTest, OverwritingKey) {
    Map cache(5);
    cache.set("a", 1, 1h);
    EXPECT_TRUE(cache.set("a", 2, 1h));
    EXPECT_EQ(*cache.get("a"), 2);

    // even if the duration is shorter
    EXPECT_TRUE(cache.set("a", 3, 10s));
    EXPECT_EQ(*cache.get("a"), 3);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.pendingExpiries(), 1u);
}

TEST_F(TtlMapTest, ShorterOverwriteGovernsExpiryByDefault) {
    Map cache;
    cache.set("a", 1, 1h);
    cache.set("a", 2, 10s);

    ManualClock::advance(11s);
    EXPECT_TRUE(cache.hasExpiredItems());
    EXPECT_TRUE(cache.removeExpiredItems());
    EXPECT_EQ(cache.get("a"), nullptr);
}

TEST_F(TtlMapTest, KeepLongestPolicyKeepsEarlierLongerExpiry) {
    CacheOptions options;
    options.overwrite_policy = OverwritePolicy::KeepLongest;
    Map cache(options);

    cache.set("a", 1, 1h);
    cache.set("a", 2, 10s);
    EXPECT_EQ(*cache.get("a"), 2);

    ManualClock::advance(11s);
    EXPECT_FALSE(cache.hasExpiredItems());
    EXPECT_EQ(*cache.get("a"), 2);

    // A longer TTL still extends it.
    cache.set("a", 3, 2h);
    ManualClock::advance(1h);
    EXPECT_FALSE(cache.hasExpiredItems());
    EXPECT_EQ(*cache.get("a"), 3);
}

TEST_F(TtlMapTest, HasExpiredItems) {
    Map cache(5);
    EXPECT_FALSE(cache.hasExpiredItems());

    cache.set("a", 1, 1h);
    EXPECT_FALSE(cache.hasExpiredItems());

    cache.set("b", 2, -100ms);
    EXPECT_TRUE(cache.hasExpiredItems());
    cache.remove("b");
    EXPECT_FALSE(cache.hasExpiredItems());

    cache.set("c", 2, -1h);
    EXPECT_TRUE(cache.hasExpiredItems());
}

TEST_F(TtlMapTest, ExpiresExactlyAtExpiryInstant) {
    Map cache;
    cache.set("a", 1, 100ms);

    ManualClock::advance(99ms);
    EXPECT_FALSE(cache.hasExpiredItems());

    ManualClock::advance(1ms);
    EXPECT_TRUE(cache.hasExpiredItems());
}

TEST_F(TtlMapTest, ExpiryRoundedDownToGranularity) {
    Map cache;
    ManualClock::advance(3ms);
    cache.set("a", 1, 100ms);

    const Map::Entry* entry = cache.getWithExpiry("a");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->value, 1);
    // start + 3ms + 100ms, rounded down to 10ms
    EXPECT_EQ(entry->expiry, ManualClock::time_point(std::chrono::nanoseconds(ManualClock::kStartNanos)) + 100ms);
}

TEST_F(TtlMapTest, RoundingGroupsNearbyExpiries) {
    Map cache;
    cache.set("a", 1, 100ms);
    ManualClock::advance(4ms);
    cache.set("b", 2, 100ms);

    EXPECT_EQ(cache.getWithExpiry("a")->expiry, cache.getWithExpiry("b")->expiry);
}

TEST_F(TtlMapTest, ZeroGranularityKeepsExactInstants) {
    CacheOptions options;
    options.expiry_granularity = 0ms;
    Map cache(options);

    ManualClock::advance(3ms);
    cache.set("a", 1, 100ms);
    EXPECT_EQ(cache.getWithExpiry("a")->expiry, ManualClock::now() + 100ms);
}

TEST_F(TtlMapTest, GetDoesNotPurge) {
    Map cache;
    cache.set("a", 1, -1h);

    // The engine alone is not expiry-safe; the caller has to purge first.
    ASSERT_NE(cache.get("a"), nullptr);
    EXPECT_TRUE(cache.hasExpiredItems());
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TtlMapTest, RemoveExpiredItems) {
    Map cache(5);
    cache.set("a", 1, -1h);
    cache.set("b", 2, 1h);
    cache.set("c", 3, -1ms);
    cache.set("d", 4, 24h);

    EXPECT_TRUE(cache.removeExpiredItems());
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a"), nullptr);
    EXPECT_EQ(*cache.get("b"), 2);
    EXPECT_EQ(cache.get("c"), nullptr);
    EXPECT_EQ(*cache.get("d"), 4);
}

TEST_F(TtlMapTest, PurgeIsIdempotent) {
    Map cache;
    cache.set("a", 1, -1h);
    cache.set("b", 2, 1h);

    EXPECT_TRUE(cache.removeExpiredItems());
    EXPECT_FALSE(cache.removeExpiredItems());
    EXPECT_EQ(cache.purgeExpired(), 0u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TtlMapTest, MultipleKeysSameExpiry) {
    Map cache(3);
    cache.set("a", 1, -1h);
    cache.set("b", 2, -1h);
    cache.set("c", 3, 1h);

    EXPECT_TRUE(cache.removeExpiredItems());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("a"), nullptr);
    EXPECT_EQ(cache.get("b"), nullptr);
    EXPECT_EQ(*cache.get("c"), 3);
}

TEST_F(TtlMapTest, Eviction) {
    Map cache(3);
    cache.set("a", 1, 1h);
    cache.set("b", 2, 1min);
    cache.set("c", 3, 1s);
    cache.set("d", 4, 24h);

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.get("c"), nullptr);
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(*cache.get("b"), 2);
    EXPECT_EQ(*cache.get("d"), 4);
    EXPECT_EQ(cache.evictionCount(), 1u);
}

TEST_F(TtlMapTest, TiedEvictionRemovesOneAtATime) {
    Map cache(2);
    cache.set("a", 1, 1min);
    cache.set("b", 2, 1min);

    cache.set("c", 3, 1h);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a"), nullptr);
    EXPECT_EQ(*cache.get("b"), 2);

    cache.set("d", 4, 1h);
    EXPECT_EQ(cache.get("b"), nullptr);
    EXPECT_EQ(*cache.get("c"), 3);
    EXPECT_EQ(*cache.get("d"), 4);
}

TEST_F(TtlMapTest, OverwriteAtCapacityNeverEvicts) {
    Map cache(3);
    cache.set("a", 1, 1h);
    cache.set("b", 2, 1min);
    cache.set("c", 3, 1s);

    EXPECT_TRUE(cache.set("c", 30, 2h));
    EXPECT_TRUE(cache.set("a", 10, 1ms));
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.evictionCount(), 0u);
    EXPECT_EQ(*cache.get("a"), 10);
    EXPECT_EQ(*cache.get("b"), 2);
    EXPECT_EQ(*cache.get("c"), 30);
}

TEST_F(TtlMapTest, EvictionFollowsOverwrittenExpiry) {
    Map cache(2);
    cache.set("a", 1, 1s);
    cache.set("b", 2, 1min);
    // "a" now outlives "b", so "b" is the one to go.
    cache.set("a", 1, 1h);

    cache.set("c", 3, 24h);
    EXPECT_EQ(cache.get("b"), nullptr);
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(*cache.get("c"), 3);
}

TEST_F(TtlMapTest, ZeroCapacityOnEmptyIndexStillInserts) {
    Map cache(0);
    EXPECT_FALSE(cache.set("a", 1, 1h));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(cache.evictionCount(), 0u);

    // From then on each new key pushes out the previous one.
    cache.set("b", 2, 1h);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("a"), nullptr);
    EXPECT_EQ(*cache.get("b"), 2);
}

TEST_F(TtlMapTest, UnboundedByDefault) {
    Map cache;
    EXPECT_FALSE(cache.capacity().has_value());
    for (int i = 0; i < 1000; ++i) {
        cache.set("key" + std::to_string(i), i, std::chrono::seconds(i + 1));
    }
    EXPECT_EQ(cache.size(), 1000u);
    EXPECT_EQ(cache.evictionCount(), 0u);
}

TEST_F(TtlMapTest, ExplicitEvict) {
    Map cache;
    EXPECT_FALSE(cache.evict().has_value());

    cache.set("late", 1, 1h);
    cache.set("soon", 2, 1s);
    EXPECT_EQ(cache.evict(), "soon");
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(TtlMapTest, RemoveKeepsIndexInStep) {
    Map cache;
    cache.set("a", 1, 1h);
    cache.set("b", 2, 1h);

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.pendingExpiries(), 1u);
}

TEST_F(TtlMapTest, Clear) {
    Map cache(3);
    cache.set("a", 1, -1h);
    cache.set("b", 2, 1h);

    cache.clear();
    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(cache.pendingExpiries(), 0u);
    EXPECT_FALSE(cache.hasExpiredItems());
    EXPECT_EQ(cache.capacity(), 3u);
}

TEST_F(TtlMapTest, MaxTtlNeverExpires) {
    Map cache;
    cache.set("forever", 1, std::chrono::milliseconds::max());
    EXPECT_FALSE(cache.hasExpiredItems());

    ManualClock::advance(std::chrono::hours(24 * 365 * 100));
    EXPECT_FALSE(cache.hasExpiredItems());
    EXPECT_FALSE(cache.removeExpiredItems());
    ASSERT_NE(cache.getWithExpiry("forever"), nullptr);
    EXPECT_EQ(cache.getWithExpiry("forever")->expiry, Map::TimePoint::max());
}

TEST_F(TtlMapTest, CenturiesLongTtlStaysVisible) {
    Map cache;
    cache.set("a", 1, std::chrono::hours(24 * 365 * 300));
    cache.set("b", 2, 1h);
    EXPECT_FALSE(cache.hasExpiredItems());
    EXPECT_EQ(*cache.get("a"), 1);

    ManualClock::advance(2h);
    EXPECT_EQ(cache.purgeExpired(), 1u);
    EXPECT_EQ(*cache.get("a"), 1);
    EXPECT_EQ(cache.get("b"), nullptr);
}

TEST_F(TtlMapTest, MinTtlIsDueImmediately) {
    Map cache;
    cache.set("a", 1, std::chrono::milliseconds::min());
    EXPECT_TRUE(cache.hasExpiredItems());
    EXPECT_EQ(cache.purgeExpired(), 1u);
    EXPECT_TRUE(cache.empty());
}

TEST_F(TtlMapTest, MaxTtlIsEvictedLast) {
    Map cache(2);
    cache.set("forever", 1, std::chrono::milliseconds::max());
    cache.set("soon", 2, 1s);
    cache.set("later", 3, 1h);

    EXPECT_EQ(cache.get("soon"), nullptr);
    EXPECT_EQ(*cache.get("forever"), 1);
}
