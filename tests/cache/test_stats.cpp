#include <gtest/gtest.h>

#include <string>

#include <spdlog/spdlog.h>

#include "stash/cache/stats.hpp"
#include "stash/cache/store.hpp"

namespace {

using namespace stash::cache;

TEST(CacheStatsTest, RatesAreZeroWithoutLookups) {
    CacheStats stats;
    EXPECT_EQ(stats.lookups(), 0u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.0);
    EXPECT_DOUBLE_EQ(stats.miss_rate(), 0.0);
}

TEST(CacheStatsTest, DerivedValues) {
    CacheStats stats{.hits = 3,
                     .misses = 1,
                     .insertions = 4,
                     .evictions = 5,
                     .expirations = 2};
    EXPECT_EQ(stats.lookups(), 4u);
    EXPECT_DOUBLE_EQ(stats.hit_rate(), 0.75);
    EXPECT_DOUBLE_EQ(stats.miss_rate(), 0.25);
    EXPECT_EQ(stats.capacity_evictions(), 3u);
}

TEST(CacheStatsTest, SumAndReset) {
    CacheStats first{.hits = 1, .misses = 2};
    CacheStats second{.hits = 3, .insertions = 4, .evictions = 1};
    auto total = first + second;
    EXPECT_EQ(total.hits, 4u);
    EXPECT_EQ(total.misses, 2u);
    EXPECT_EQ(total.insertions, 4u);
    EXPECT_EQ(total.evictions, 1u);

    first += second;
    EXPECT_EQ(first, total);

    total.reset();
    EXPECT_EQ(total, CacheStats{});
}

class StoreStatsTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto options(bool enableStats) -> StoreOptions {
        StoreOptions opts;
        opts.max_capacity = 2;
        opts.enable_stats = enableStats;
        return opts;
    }
};

TEST_F(StoreStatsTest, HitsMissesInsertions) {
    Store<std::string, int> store(options(true));
    ASSERT_TRUE(store.insert("a", 1).has_value());
    store.get("a");
    store.get("a");
    store.get("b");

    auto stats = store.stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.insertions, 1u);
    EXPECT_EQ(stats.evictions, 0u);
}

TEST_F(StoreStatsTest, CountersMatchOperations) {
    Store<int, int> store(options(true));
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(store.insert(i, i).has_value());
    }
    ASSERT_TRUE(store.insert(9, 90).has_value());
    for (int i = 0; i < 10; ++i) {
        store.get(i);
    }
    store.get_mut(9);

    auto stats = store.stats();
    EXPECT_EQ(stats.insertions, 11u);
    EXPECT_EQ(stats.evictions, 8u);
    EXPECT_EQ(stats.hits + stats.misses, 11u);
    EXPECT_EQ(stats.hits, 3u);
}

TEST_F(StoreStatsTest, RemoveAndContainsAreNotLookups) {
    Store<int, int> store(options(true));
    ASSERT_TRUE(store.insert(1, 1).has_value());
    EXPECT_TRUE(store.contains_key(1));
    EXPECT_EQ(store.remove(1), 1);
    EXPECT_EQ(store.remove(1), std::nullopt);
    EXPECT_EQ(store.stats().lookups(), 0u);
    EXPECT_EQ(store.stats().evictions, 0u);
}

TEST_F(StoreStatsTest, DisabledStatsStayZero) {
    Store<int, int> store(options(false));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.insert(i, i).has_value());
        store.get(i);
        store.get(i + 100);
    }
    EXPECT_EQ(store.stats(), CacheStats{});
}

TEST_F(StoreStatsTest, ClearKeepsStatsResetZeroes) {
    Store<int, int> store(options(true));
    ASSERT_TRUE(store.insert(1, 1).has_value());
    store.get(1);
    store.clear();
    EXPECT_EQ(store.stats().hits, 1u);
    EXPECT_EQ(store.stats().insertions, 1u);

    store.reset_stats();
    EXPECT_EQ(store.stats(), CacheStats{});
}

}  // namespace
