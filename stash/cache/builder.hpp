#ifndef STASH_CACHE_BUILDER_HPP
#define STASH_CACHE_BUILDER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "stash/cache/config.hpp"
#include "stash/cache/error.hpp"
#include "stash/cache/shared_cache.hpp"
#include "stash/cache/sharded_cache.hpp"
#include "stash/cache/store.hpp"

namespace stash::cache {

/**
 * @brief Fluent, non-throwing way to configure and construct caches.
 *
 * Every setter only records a value; the combination is checked once by
 * build(), build_shared() or build_store(), which report a bad configuration
 * as a ConfigError instead of throwing.
 *
 * @code
 * auto cache = CacheBuilder<std::string, int>()
 *                  .max_capacity(1000)
 *                  .with_lru()
 *                  .shards(8)
 *                  .build();
 * @endcode
 */
template <typename K, typename V, typename Hash = std::hash<K>,
          typename Compare = std::less<K>>
class CacheBuilder {
public:
    using cache_type = ShardedCache<K, V, Hash, Compare>;
    using shared_type = SharedCache<K, V, Hash, Compare>;
    using store_type = Store<K, V, Compare>;

    CacheBuilder() = default;

    auto max_capacity(std::size_t capacity) -> CacheBuilder& {
        config_.max_capacity = capacity;
        return *this;
    }

    auto with_no_eviction() -> CacheBuilder& {
        return with_policy(PolicyKind::None);
    }
    auto with_fifo() -> CacheBuilder& { return with_policy(PolicyKind::Fifo); }
    auto with_lru() -> CacheBuilder& { return with_policy(PolicyKind::Lru); }
    auto with_lfu() -> CacheBuilder& { return with_policy(PolicyKind::Lfu); }
    auto with_ttl_lru() -> CacheBuilder& {
        return with_policy(PolicyKind::TtlLru);
    }
    auto with_ttl_lfu() -> CacheBuilder& {
        return with_policy(PolicyKind::TtlLfu);
    }

    /**
     * @param byte_budget Total bytes across all shards.
     */
    auto with_size_based(std::size_t byte_budget) -> CacheBuilder& {
        config_.byte_budget = byte_budget;
        return with_policy(PolicyKind::SizeBased);
    }

    auto with_adaptive(std::size_t window = 32) -> CacheBuilder& {
        config_.adaptive_window = window;
        return with_policy(PolicyKind::Adaptive);
    }

    auto with_random(std::optional<std::uint64_t> seed = std::nullopt)
        -> CacheBuilder& {
        config_.random_seed = seed;
        return with_policy(PolicyKind::Random);
    }

    /**
     * @brief Default time to live applied by insert().
     */
    auto with_ttl(Duration ttl) -> CacheBuilder& {
        config_.default_ttl = ttl;
        return *this;
    }

    auto shards(std::size_t count) -> CacheBuilder& {
        config_.shards = count;
        return *this;
    }

    auto with_stats(bool enabled = true) -> CacheBuilder& {
        config_.enable_stats = enabled;
        return *this;
    }

    auto with_time_source(std::shared_ptr<TimeSource> source)
        -> CacheBuilder& {
        config_.time_source = std::move(source);
        return *this;
    }

    /**
     * @brief Byte estimate of a value, used by size-based eviction.
     */
    auto with_sizer(Sizer<V> sizer) -> CacheBuilder& {
        sizer_ = std::move(sizer);
        return *this;
    }

    auto with_hash(Hash hash) -> CacheBuilder& {
        hash_ = std::move(hash);
        return *this;
    }

    /**
     * @brief Replaces every recorded setting with `config`.
     */
    auto from_config(CacheConfig config) -> CacheBuilder& {
        config_ = std::move(config);
        return *this;
    }

    [[nodiscard]] auto config() const noexcept -> const CacheConfig& {
        return config_;
    }

    [[nodiscard]] auto build() const -> ConfigResult<cache_type> {
        if (auto valid = validated(); !valid) {
            return type::make_unexpected(valid.error());
        }
        return cache_type(config_, sizer_, hash_);
    }

    [[nodiscard]] auto build_shared() const -> ConfigResult<shared_type> {
        return build().map(
            [](cache_type&& cache) { return shared_type(std::move(cache)); });
    }

    /**
     * @brief Builds a single unsynchronised store. The shard count is
     * ignored.
     */
    [[nodiscard]] auto build_store() const -> ConfigResult<store_type> {
        auto single = config_;
        single.shards = 1;
        if (auto valid = validated(single); !valid) {
            return type::make_unexpected(valid.error());
        }
        return store_type(single.store_options(0), sizer_);
    }

private:
    auto with_policy(PolicyKind kind) -> CacheBuilder& {
        config_.policy = kind;
        return *this;
    }

    [[nodiscard]] auto validated() const -> ConfigResult<void> {
        return validated(config_);
    }

    [[nodiscard]] static auto validated(const CacheConfig& config)
        -> ConfigResult<void> {
        auto valid = config.validate();
        if (!valid) {
            spdlog::error("Rejected cache configuration: {}",
                          to_string(valid.error()));
        }
        return valid;
    }

    CacheConfig config_;
    Sizer<V> sizer_;
    Hash hash_{};
};

}  // namespace stash::cache

#endif  // STASH_CACHE_BUILDER_HPP
