#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "stash/cache/builder.hpp"
#include "stash/cache/snapshot.hpp"

using namespace stash::cache;
using namespace std::chrono_literals;

// Print cache statistics helper function
template <typename Cache>
void print_stats(const Cache& cache) {
    auto stats = cache.stats();
    std::cout << "Entries: " << cache.len() << ", hits: " << stats.hits
              << ", misses: " << stats.misses
              << ", evictions: " << stats.evictions
              << " (expired: " << stats.expirations << ")"
              << ", hit rate: " << stats.hit_rate() * 100 << "%" << std::endl;
}

// Insert and report rejected writes
template <typename Cache, typename K, typename V>
void put(Cache& cache, K key, V value) {
    if (auto result = cache.insert(std::move(key), std::move(value)); !result) {
        spdlog::warn("Insert rejected: {}", to_string(result.error()));
    }
}

int main() {
    spdlog::set_level(spdlog::level::info);

    try {
        std::cout << "=== LRU cache ===" << std::endl;
        auto lru = CacheBuilder<int, std::string>()
                       .max_capacity(3)
                       .with_lru()
                       .build();
        if (!lru) {
            std::cerr << "Failed to build cache: " << to_string(lru.error())
                      << std::endl;
            return 1;
        }
        put(*lru, 1, std::string("one"));
        put(*lru, 2, std::string("two"));
        put(*lru, 3, std::string("three"));
        lru->get(1);
        put(*lru, 4, std::string("four"));  // evicts 2, the least recently used
        for (int key : lru->keys()) {
            std::cout << "  " << key << " -> " << *lru->get(key) << std::endl;
        }
        print_stats(*lru);

        std::cout << "\n=== Expiring entries ===" << std::endl;
        auto clock = std::make_shared<ManualTimeSource>();
        auto sessions = CacheBuilder<std::string, int>()
                            .with_ttl_lru()
                            .with_ttl(500ms)
                            .with_time_source(clock)
                            .build()
                            .value();
        put(sessions, std::string("alice"), 1);
        if (!sessions.insert_with_ttl("bob", 2, 2s)) {
            spdlog::warn("Insert rejected for bob");
        }
        clock->advance(1s);
        std::cout << "alice present: " << sessions.contains_key("alice")
                  << ", bob present: " << sessions.contains_key("bob")
                  << std::endl;
        std::cout << "Swept " << sessions.sweep() << " expired entries"
                  << std::endl;
        print_stats(sessions);

        std::cout << "\n=== Shared cache across threads ===" << std::endl;
        auto shared = CacheBuilder<int, int>()
                          .max_capacity(1000)
                          .shards(8)
                          .with_lfu()
                          .build_shared()
                          .value();
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([handle = shared, t]() mutable {
                for (int i = 0; i < 500; ++i) {
                    put(handle, t * 500 + i, i);
                    handle.get(i);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        std::cout << "Shards: " << shared.shard_count()
                  << ", handles alive: " << shared.use_count() << std::endl;
        print_stats(shared);

        std::cout << "\n=== Batch ===" << std::endl;
        auto report = shared.apply_batch({insert_op(-1, 42), get_op<int, int>(-1),
                                          remove_op<int, int>(-2)});
        for (const auto& outcome : report) {
            std::cout << "  " << to_string(outcome.kind) << " " << outcome.key
                      << ": " << to_string(outcome.status) << std::endl;
        }

        std::cout << "\n=== Snapshot ===" << std::endl;
        auto snapshot = to_json_snapshot(*lru);
        std::cout << snapshot.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
