#ifndef STASH_CACHE_SHARED_CACHE_HPP
#define STASH_CACHE_SHARED_CACHE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "stash/cache/sharded_cache.hpp"

namespace stash::cache {

/**
 * @brief Cheap, copyable handle to one ShardedCache.
 *
 * Copies share the same shards; the storage is destroyed together with the
 * last handle. Every operation forwards to the shared cache and takes its
 * shard locks only for the duration of the call.
 */
template <typename K, typename V, typename Hash = std::hash<K>,
          typename Compare = std::less<K>>
class SharedCache {
public:
    using cache_type = ShardedCache<K, V, Hash, Compare>;
    using entry_type = typename cache_type::entry_type;
    using insert_result = typename cache_type::insert_result;
    using op_type = typename cache_type::op_type;
    using batch_result = typename cache_type::batch_result;

    explicit SharedCache(cache_type cache)
        : cache_(std::make_shared<cache_type>(std::move(cache))) {}

    explicit SharedCache(std::shared_ptr<cache_type> cache)
        : cache_(std::move(cache)) {}

    auto insert(K key, V value) -> insert_result {
        return cache_->insert(std::move(key), std::move(value));
    }

    auto insert_with_ttl(K key, V value, Duration ttl) -> insert_result {
        return cache_->insert_with_ttl(std::move(key), std::move(value), ttl);
    }

    auto get(const K& key) -> std::optional<V> { return cache_->get(key); }

    template <typename Func>
    auto get_mut(const K& key, Func&& func) -> bool {
        return cache_->get_mut(key, std::forward<Func>(func));
    }

    auto remove(const K& key) -> std::optional<V> {
        return cache_->remove(key);
    }

    [[nodiscard]] auto contains_key(const K& key) const -> bool {
        return cache_->contains_key(key);
    }

    [[nodiscard]] auto ttl_remaining(const K& key) const
        -> std::optional<Duration> {
        return cache_->ttl_remaining(key);
    }

    auto update_ttl(const K& key, Duration ttl) -> bool {
        return cache_->update_ttl(key, ttl);
    }

    [[nodiscard]] auto len() const -> std::size_t { return cache_->len(); }
    [[nodiscard]] auto is_empty() const -> bool { return cache_->is_empty(); }
    void clear() { cache_->clear(); }

    [[nodiscard]] auto stats() const -> CacheStats { return cache_->stats(); }
    void reset_stats() { cache_->reset_stats(); }

    [[nodiscard]] auto keys() const -> std::vector<K> {
        return cache_->keys();
    }
    [[nodiscard]] auto values() const -> std::vector<V> {
        return cache_->values();
    }
    [[nodiscard]] auto entries() const -> std::vector<entry_type> {
        return cache_->entries();
    }

    auto sweep() -> std::size_t { return cache_->sweep(); }

    auto load(std::vector<entry_type> entries) -> std::size_t {
        return cache_->load(std::move(entries));
    }

    auto merge(std::vector<entry_type> entries) -> std::size_t {
        return cache_->merge(std::move(entries));
    }

    auto apply_batch(std::vector<op_type> ops) -> batch_result {
        return cache_->apply_batch(std::move(ops));
    }

    [[nodiscard]] auto shard_for(const K& key) const -> std::size_t {
        return cache_->shard_for(key);
    }
    [[nodiscard]] auto shard_count() const noexcept -> std::size_t {
        return cache_->shard_count();
    }
    [[nodiscard]] auto shard_len(std::size_t index) const -> std::size_t {
        return cache_->shard_len(index);
    }
    [[nodiscard]] auto shard_stats(std::size_t index) const -> CacheStats {
        return cache_->shard_stats(index);
    }

    [[nodiscard]] auto time_source() const noexcept
        -> const std::shared_ptr<TimeSource>& {
        return cache_->time_source();
    }

    /**
     * @brief Number of handles sharing this cache.
     */
    [[nodiscard]] auto use_count() const noexcept -> long {
        return cache_.use_count();
    }

    [[nodiscard]] auto shares_storage_with(const SharedCache& other) const
        noexcept -> bool {
        return cache_ == other.cache_;
    }

    [[nodiscard]] auto cache() const noexcept -> cache_type& {
        return *cache_;
    }

private:
    std::shared_ptr<cache_type> cache_;
};

}  // namespace stash::cache

#endif  // STASH_CACHE_SHARED_CACHE_HPP
