#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "stash/cache/eviction.hpp"
#include "stash/cache/store.hpp"

namespace {

using namespace stash::cache;

class EvictionTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static auto make_store(PolicyKind kind, std::size_t capacity)
        -> Store<int, std::string> {
        StoreOptions options;
        options.max_capacity = capacity;
        options.policy.kind = kind;
        return Store<int, std::string>(options);
    }

    static auto sorted_keys(const Store<int, std::string>& store)
        -> std::vector<int> {
        return store.keys();
    }
};

TEST_F(EvictionTest, PolicyNamesRoundTrip) {
    for (auto kind : {PolicyKind::None, PolicyKind::Fifo, PolicyKind::Lru,
                      PolicyKind::Lfu, PolicyKind::TtlLru, PolicyKind::TtlLfu,
                      PolicyKind::SizeBased, PolicyKind::Adaptive,
                      PolicyKind::Random}) {
        auto parsed = policy_from_string(to_string(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(policy_from_string("mru").has_value());
}

TEST_F(EvictionTest, FactoryBuildsRequestedPolicy) {
    PolicyOptions options;
    options.byte_budget = 64;
    for (auto kind : {PolicyKind::None, PolicyKind::Fifo, PolicyKind::Lru,
                      PolicyKind::Lfu, PolicyKind::TtlLru, PolicyKind::TtlLfu,
                      PolicyKind::SizeBased, PolicyKind::Adaptive,
                      PolicyKind::Random}) {
        options.kind = kind;
        auto policy = EvictionPolicy<int>::make(options);
        EXPECT_EQ(policy.kind(), kind);
    }
}

TEST_F(EvictionTest, OnlyRecencyAndFrequencyPoliciesTrackAccess) {
    PolicyOptions options;
    options.byte_budget = 64;
    options.kind = PolicyKind::Lru;
    EXPECT_TRUE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::TtlLfu;
    EXPECT_TRUE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::Adaptive;
    EXPECT_TRUE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::Fifo;
    EXPECT_FALSE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::SizeBased;
    EXPECT_FALSE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::Random;
    EXPECT_FALSE(EvictionPolicy<int>::make(options).tracks_access());
    options.kind = PolicyKind::None;
    EXPECT_FALSE(EvictionPolicy<int>::make(options).tracks_access());
}

TEST_F(EvictionTest, EmptyPolicyHasNoVictim) {
    PolicyOptions options;
    options.kind = PolicyKind::Lru;
    auto policy = EvictionPolicy<int>::make(options);
    EXPECT_FALSE(policy.select_victim(Timestamp{}).has_value());
}

TEST_F(EvictionTest, LruEvictsLeastRecentlyUsed) {
    auto store = make_store(PolicyKind::Lru, 3);
    ASSERT_TRUE(store.insert(1, "one").has_value());
    ASSERT_TRUE(store.insert(2, "two").has_value());
    ASSERT_TRUE(store.insert(3, "three").has_value());
    ASSERT_NE(store.get(1), nullptr);
    ASSERT_TRUE(store.insert(4, "four").has_value());

    EXPECT_EQ(sorted_keys(store), (std::vector<int>{1, 3, 4}));
    EXPECT_EQ(store.stats().evictions, 1u);
}

TEST_F(EvictionTest, LruReplacingWriteRefreshesRecency) {
    auto store = make_store(PolicyKind::Lru, 3);
    ASSERT_TRUE(store.insert(1, "one").has_value());
    ASSERT_TRUE(store.insert(2, "two").has_value());
    ASSERT_TRUE(store.insert(3, "three").has_value());
    auto previous = store.insert(1, "uno");
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, std::optional<std::string>("one"));
    ASSERT_TRUE(store.insert(4, "four").has_value());

    EXPECT_EQ(sorted_keys(store), (std::vector<int>{1, 3, 4}));
}

TEST_F(EvictionTest, LfuEvictsLeastFrequentlyUsed) {
    auto store = make_store(PolicyKind::Lfu, 3);
    ASSERT_TRUE(store.insert(1, "a").has_value());
    ASSERT_TRUE(store.insert(2, "b").has_value());
    ASSERT_TRUE(store.insert(3, "c").has_value());
    store.get(1);
    store.get(1);
    store.get(2);
    ASSERT_TRUE(store.insert(4, "d").has_value());

    EXPECT_EQ(sorted_keys(store), (std::vector<int>{1, 2, 4}));
}

TEST_F(EvictionTest, LfuBreaksTiesByRecency) {
    auto store = make_store(PolicyKind::Lfu, 3);
    ASSERT_TRUE(store.insert(1, "a").has_value());
    ASSERT_TRUE(store.insert(2, "b").has_value());
    ASSERT_TRUE(store.insert(3, "c").has_value());
    store.get(1);
    store.get(2);
    store.get(3);
    // All have frequency 2; key 1 was used longest ago.
    ASSERT_TRUE(store.insert(4, "d").has_value());

    EXPECT_EQ(sorted_keys(store), (std::vector<int>{2, 3, 4}));
}

TEST_F(EvictionTest, FifoIgnoresReadsAndKeepsPositionOnReplace) {
    auto store = make_store(PolicyKind::Fifo, 3);
    ASSERT_TRUE(store.insert(1, "a").has_value());
    ASSERT_TRUE(store.insert(2, "b").has_value());
    ASSERT_TRUE(store.insert(3, "c").has_value());
    store.get(1);
    ASSERT_TRUE(store.insert(1, "aa").has_value());
    ASSERT_TRUE(store.insert(4, "d").has_value());

    EXPECT_EQ(sorted_keys(store), (std::vector<int>{2, 3, 4}));
}

TEST_F(EvictionTest, NoEvictionRejectsBeyondCapacity) {
    auto store = make_store(PolicyKind::None, 2);
    ASSERT_TRUE(store.insert(1, "a").has_value());
    ASSERT_TRUE(store.insert(2, "b").has_value());

    auto rejected = store.insert(3, "c");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), CacheError::CapacityExceeded);
    EXPECT_EQ(sorted_keys(store), (std::vector<int>{1, 2}));
    EXPECT_EQ(store.stats().insertions, 2u);
    EXPECT_EQ(store.stats().evictions, 0u);

    // Replacing an existing key needs no room.
    ASSERT_TRUE(store.insert(2, "bb").has_value());
    EXPECT_EQ(*store.get(2), "bb");
}

TEST_F(EvictionTest, SizeBasedEvictsLargestUntilFits) {
    StoreOptions options;
    options.policy.kind = PolicyKind::SizeBased;
    options.policy.byte_budget = 10;
    Store<std::string, std::string> store(
        options, [](const std::string& value) { return value.size(); });

    ASSERT_TRUE(store.insert("a", "xxxx").has_value());
    ASSERT_TRUE(store.insert("b", "yyy").has_value());
    ASSERT_TRUE(store.insert("c", "zz").has_value());
    ASSERT_TRUE(store.insert("d", "www").has_value());

    EXPECT_FALSE(store.contains_key("a"));
    EXPECT_EQ(store.len(), 3u);

    // Growing "b" to 6 bytes needs 1 more byte: "d" is the largest other.
    ASSERT_TRUE(store.insert("b", "yyyyyy").has_value());
    EXPECT_FALSE(store.contains_key("d"));
    EXPECT_TRUE(store.contains_key("c"));
    EXPECT_EQ(*store.get("b"), "yyyyyy");

    const auto* policy =
        store.policy().get_if<SizeBasedPolicy<std::string>>();
    ASSERT_NE(policy, nullptr);
    EXPECT_EQ(policy->total_bytes(), 8u);
    EXPECT_EQ(store.stats().evictions, 2u);
}

TEST_F(EvictionTest, SizeBasedEvictsSeveralForOneInsert) {
    StoreOptions options;
    options.policy.kind = PolicyKind::SizeBased;
    options.policy.byte_budget = 6;
    Store<int, std::string> store(
        options, [](const std::string& value) { return value.size(); });
    ASSERT_TRUE(store.insert(1, "aa").has_value());
    ASSERT_TRUE(store.insert(2, "bb").has_value());
    ASSERT_TRUE(store.insert(3, "cc").has_value());

    ASSERT_TRUE(store.insert(4, "ddddd").has_value());
    EXPECT_EQ(store.keys(), std::vector<int>{4});
    EXPECT_EQ(store.stats().evictions, 3u);
}

TEST_F(EvictionTest, SizeBasedRejectsOversizedEntryWithoutEvicting) {
    StoreOptions options;
    options.policy.kind = PolicyKind::SizeBased;
    options.policy.byte_budget = 4;
    Store<int, std::string> store(
        options, [](const std::string& value) { return value.size(); });
    ASSERT_TRUE(store.insert(1, "ab").has_value());

    auto rejected = store.insert(2, "abcde");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), CacheError::CapacityExceeded);
    EXPECT_TRUE(store.contains_key(1));
    EXPECT_EQ(store.stats().evictions, 0u);
}

TEST_F(EvictionTest, RandomIsReproducibleWithSeed) {
    auto run = [](std::uint64_t seed) {
        StoreOptions options;
        options.max_capacity = 4;
        options.policy.kind = PolicyKind::Random;
        options.policy.random_seed = seed;
        Store<int, int> store(options);
        for (int i = 0; i < 32; ++i) {
            EXPECT_TRUE(store.insert(i, i).has_value());
            EXPECT_LE(store.len(), 4u);
        }
        return store.keys();
    };
    auto first = run(7);
    EXPECT_EQ(first.size(), 4u);
    EXPECT_EQ(first, run(7));
}

TEST_F(EvictionTest, AdaptiveSwitchesToLfuAfterLruMistakes) {
    StoreOptions options;
    options.max_capacity = 2;
    options.policy.kind = PolicyKind::Adaptive;
    options.policy.adaptive_window = 2;
    Store<int, int> store(options);

    const auto* adaptive = store.policy().get_if<AdaptivePolicy<int>>();
    ASSERT_NE(adaptive, nullptr);
    EXPECT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lru);

    ASSERT_TRUE(store.insert(1, 1).has_value());
    ASSERT_TRUE(store.insert(2, 2).has_value());
    store.get(1);
    ASSERT_TRUE(store.insert(3, 3).has_value());  // LRU evicts 2
    EXPECT_FALSE(store.contains_key(2));
    EXPECT_EQ(store.get(2), nullptr);  // a miss caused by LRU

    EXPECT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lfu);
}

TEST_F(EvictionTest, AdaptiveSwitchesBackToLruAfterLfuMistakes) {
    StoreOptions options;
    options.max_capacity = 2;
    options.policy.kind = PolicyKind::Adaptive;
    options.policy.adaptive_window = 2;
    Store<int, int> store(options);
    const auto* adaptive = store.policy().get_if<AdaptivePolicy<int>>();
    ASSERT_NE(adaptive, nullptr);

    ASSERT_TRUE(store.insert(1, 1).has_value());
    ASSERT_TRUE(store.insert(2, 2).has_value());
    store.get(1);
    ASSERT_TRUE(store.insert(3, 3).has_value());  // LRU evicts 2
    EXPECT_EQ(store.get(2), nullptr);
    ASSERT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lfu);

    ASSERT_TRUE(store.insert(4, 4).has_value());  // LFU evicts 3
    EXPECT_FALSE(store.contains_key(3));
    EXPECT_EQ(store.get(3), nullptr);
    // One miss charged to each mode: the tie keeps LFU.
    EXPECT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lfu);

    ASSERT_TRUE(store.insert(5, 5).has_value());  // LFU evicts 4
    EXPECT_FALSE(store.contains_key(4));
    EXPECT_EQ(store.get(4), nullptr);
    EXPECT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lru);
    EXPECT_TRUE(store.contains_key(1));
}

TEST_F(EvictionTest, AdaptiveKeepsModeOnColdMisses) {
    StoreOptions options;
    options.max_capacity = 2;
    options.policy.kind = PolicyKind::Adaptive;
    options.policy.adaptive_window = 3;
    Store<int, int> store(options);

    for (int i = 100; i < 110; ++i) {
        store.get(i);
    }
    const auto* adaptive = store.policy().get_if<AdaptivePolicy<int>>();
    ASSERT_NE(adaptive, nullptr);
    EXPECT_EQ(adaptive->mode(), AdaptivePolicy<int>::Mode::Lru);
}

TEST_F(EvictionTest, CapacityNeverExceededUnderAnyPolicy) {
    for (auto kind : {PolicyKind::Fifo, PolicyKind::Lru, PolicyKind::Lfu,
                      PolicyKind::TtlLru, PolicyKind::TtlLfu,
                      PolicyKind::Adaptive, PolicyKind::Random}) {
        auto store = make_store(kind, 5);
        for (int i = 0; i < 200; ++i) {
            ASSERT_TRUE(store.insert(i % 37, std::to_string(i)).has_value());
            store.get((i * 7) % 37);
            ASSERT_LE(store.len(), 5u) << to_string(kind);
        }
        auto keys = store.keys();
        std::set<int> unique(keys.begin(), keys.end());
        EXPECT_EQ(unique.size(), store.len()) << to_string(kind);
    }
}

}  // namespace
