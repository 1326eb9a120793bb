#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "stash/cache/builder.hpp"
#include "stash/cache/snapshot.hpp"
#include "stash/error/exception.hpp"

namespace {

using namespace stash::cache;
using namespace std::chrono_literals;

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        clock = std::make_shared<ManualTimeSource>();
        path = std::filesystem::temp_directory_path() /
               "stash_snapshot_test.json";
    }

    void TearDown() override { std::filesystem::remove(path); }

    auto make_cache() -> ShardedCache<std::string, int> {
        return CacheBuilder<std::string, int>()
            .max_capacity(16)
            .shards(2)
            .with_time_source(clock)
            .build()
            .value();
    }

    std::shared_ptr<ManualTimeSource> clock;
    std::filesystem::path path;
};

TEST_F(SnapshotTest, JsonContainsEntriesAndRemainingTtl) {
    auto cache = make_cache();
    ASSERT_TRUE(cache.insert("a", 1).has_value());
    ASSERT_TRUE(cache.insert_with_ttl("b", 2, 100ms).has_value());
    clock->advance(40ms);

    auto snapshot = to_json_snapshot(cache);
    EXPECT_EQ(snapshot["version"], kSnapshotVersion);
    ASSERT_EQ(snapshot["entries"].size(), 2u);
    EXPECT_EQ(snapshot["entries"][0]["key"], "a");
    EXPECT_TRUE(snapshot["entries"][0]["ttl_ms"].is_null());
    EXPECT_EQ(snapshot["entries"][1]["key"], "b");
    EXPECT_EQ(snapshot["entries"][1]["ttl_ms"], 60);
}

TEST_F(SnapshotTest, RestoreReplacesContents) {
    auto source = make_cache();
    ASSERT_TRUE(source.insert("a", 1).has_value());
    ASSERT_TRUE(source.insert_with_ttl("b", 2, 100ms).has_value());
    auto snapshot = to_json_snapshot(source);

    auto target = make_cache();
    ASSERT_TRUE(target.insert("stale", 0).has_value());
    EXPECT_EQ(restore_json_snapshot(target, snapshot), 2u);
    EXPECT_FALSE(target.contains_key("stale"));
    EXPECT_EQ(target.get("a"), 1);
    EXPECT_EQ(target.ttl_remaining("b"), 100ms);
}

TEST_F(SnapshotTest, WorksOnStoreAndSharedCache) {
    auto store = CacheBuilder<std::string, int>()
                     .with_time_source(clock)
                     .build_store()
                     .value();
    ASSERT_TRUE(store.insert("x", 7).has_value());

    auto shared = CacheBuilder<std::string, int>()
                      .with_time_source(clock)
                      .build_shared()
                      .value();
    EXPECT_EQ(restore_json_snapshot(shared, to_json_snapshot(store)), 1u);
    EXPECT_EQ(shared.get("x"), 7);
}

TEST_F(SnapshotTest, FileRoundTrip) {
    auto source = make_cache();
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(source.insert("k" + std::to_string(i), i).has_value());
    }
    save_snapshot(source, path);

    auto target = make_cache();
    EXPECT_EQ(load_snapshot(target, path), 10u);
    EXPECT_EQ(target.keys(), source.keys());
    EXPECT_EQ(target.values(), source.values());
}

TEST_F(SnapshotTest, MissingFileThrows) {
    auto cache = make_cache();
    EXPECT_THROW(load_snapshot(cache, path), stash::error::SnapshotError);
}

TEST_F(SnapshotTest, MalformedDocumentsThrow) {
    auto cache = make_cache();
    EXPECT_THROW(restore_json_snapshot(cache, json::array()),
                 stash::error::SnapshotError);

    json wrongVersion{{"version", 42}, {"entries", json::array()}};
    EXPECT_THROW(restore_json_snapshot(cache, wrongVersion),
                 stash::error::SnapshotError);

    json textVersion{{"version", "1"}, {"entries", json::array()}};
    EXPECT_THROW(restore_json_snapshot(cache, textVersion),
                 stash::error::SnapshotError);

    json wrongValue{{"entries", json::array({json{{"key", "a"},
                                                   {"value", "not a number"}}})}};
    EXPECT_THROW(restore_json_snapshot(cache, wrongValue),
                 stash::error::SnapshotError);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_snapshot(cache, path), stash::error::SnapshotError);
}

}  // namespace
