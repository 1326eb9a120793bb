#ifndef STASH_CACHE_SHARD_HPP
#define STASH_CACHE_SHARD_HPP

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

#ifdef STASH_USE_BOOST_THREAD
#include <boost/thread/lock_types.hpp>
#include <boost/thread/mutex.hpp>
#else
#include <mutex>
#endif

#include "stash/cache/store.hpp"

namespace stash::cache {

// Define aliases based on whether we're using Boost or STL
#if defined(STASH_USE_BOOST_THREAD)
using Mutex = boost::mutex;

template <typename T>
using UniqueLock = boost::unique_lock<T>;
#else
using Mutex = std::mutex;

template <typename T>
using UniqueLock = std::unique_lock<T>;
#endif

/**
 * @brief One lock stripe: a mutex and the store it guards.
 *
 * The store is only reachable through with_lock(), so every access holds the
 * lock and no reference into the store can escape the call.
 */
template <typename K, typename V, typename Compare = std::less<K>>
class Shard {
public:
    using store_type = Store<K, V, Compare>;

    Shard(std::size_t index, StoreOptions options, Sizer<V> sizer = {})
        : index_(index), store_(std::move(options), std::move(sizer)) {}

    Shard(const Shard&) = delete;
    auto operator=(const Shard&) -> Shard& = delete;

    /**
     * @brief Runs `func` on the store while holding this shard's lock.
     *
     * `func` must not touch another shard of the same cache.
     */
    template <typename Func>
    auto with_lock(Func&& func) -> std::invoke_result_t<Func, store_type&> {
        UniqueLock<Mutex> lock(mutex_);
        return std::invoke(std::forward<Func>(func), store_);
    }

    template <typename Func>
    auto with_lock(Func&& func) const
        -> std::invoke_result_t<Func, const store_type&> {
        UniqueLock<Mutex> lock(mutex_);
        return std::invoke(std::forward<Func>(func), store_);
    }

    [[nodiscard]] auto index() const noexcept -> std::size_t { return index_; }

private:
    std::size_t index_;
    mutable Mutex mutex_;
    store_type store_;
};

}  // namespace stash::cache

#endif  // STASH_CACHE_SHARD_HPP
