#ifndef STASH_CACHE_BATCH_HPP
#define STASH_CACHE_BATCH_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "stash/cache/eviction.hpp"
#include "stash/cache/ttl.hpp"

namespace stash::cache {

enum class OpKind { Insert, Remove, Get };

/**
 * @brief Result of one batch operation. NotFound is a success: removing or
 * reading an absent key is a valid outcome.
 */
enum class OpStatus { Ok, NotFound, CapacityExceeded };

[[nodiscard]] constexpr auto to_string(OpKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case OpKind::Insert:
            return "insert";
        case OpKind::Remove:
            return "remove";
        case OpKind::Get:
            return "get";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto to_string(OpStatus status) noexcept
    -> std::string_view {
    switch (status) {
        case OpStatus::Ok:
            return "ok";
        case OpStatus::NotFound:
            return "not found";
        case OpStatus::CapacityExceeded:
            return "capacity exceeded";
    }
    return "unknown";
}

template <typename K, typename V>
struct InsertOp {
    K key;
    V value;
    std::optional<Duration> ttl;
};

template <typename K>
struct RemoveOp {
    K key;
};

template <typename K>
struct GetOp {
    K key;
};

/**
 * @brief One operation of a batch.
 */
template <typename K, typename V>
class Op {
public:
    using variant_type = std::variant<InsertOp<K, V>, RemoveOp<K>, GetOp<K>>;

    static auto insert(K key, V value,
                       std::optional<Duration> ttl = std::nullopt) -> Op {
        return Op(InsertOp<K, V>{std::move(key), std::move(value), ttl});
    }

    static auto remove(K key) -> Op { return Op(RemoveOp<K>{std::move(key)}); }

    static auto get(K key) -> Op { return Op(GetOp<K>{std::move(key)}); }

    [[nodiscard]] auto kind() const noexcept -> OpKind {
        return static_cast<OpKind>(op_.index());
    }

    [[nodiscard]] auto key() const -> const K& {
        return std::visit([](const auto& op) -> const K& { return op.key; },
                          op_);
    }

    [[nodiscard]] auto variant() const noexcept -> const variant_type& {
        return op_;
    }

    [[nodiscard]] auto variant() noexcept -> variant_type& { return op_; }

private:
    explicit Op(variant_type op) : op_(std::move(op)) {}

    variant_type op_;
};

template <typename K, typename V>
[[nodiscard]] auto insert_op(K key, V value,
                             std::optional<Duration> ttl = std::nullopt)
    -> Op<K, V> {
    return Op<K, V>::insert(std::move(key), std::move(value), ttl);
}

template <typename K, typename V>
[[nodiscard]] auto remove_op(K key) -> Op<K, V> {
    return Op<K, V>::remove(std::move(key));
}

template <typename K, typename V>
[[nodiscard]] auto get_op(K key) -> Op<K, V> {
    return Op<K, V>::get(std::move(key));
}

/**
 * @brief What happened to one operation.
 *
 * value holds the value read by a Get, the value taken out by a Remove, or
 * the value replaced by an Insert.
 */
template <typename K, typename V>
struct OpOutcome {
    K key;
    OpKind kind;
    OpStatus status;
    std::optional<V> value;

    [[nodiscard]] auto ok() const noexcept -> bool {
        return status != OpStatus::CapacityExceeded;
    }
};

/**
 * @brief Per-operation report of a batch, in submission order.
 */
template <typename K, typename V, typename Compare = std::less<K>>
class BatchResult {
public:
    using outcome_type = OpOutcome<K, V>;
    using const_iterator = typename std::vector<outcome_type>::const_iterator;

    BatchResult() = default;
    explicit BatchResult(std::vector<outcome_type> outcomes)
        : outcomes_(std::move(outcomes)) {}

    void push_back(outcome_type outcome) {
        outcomes_.push_back(std::move(outcome));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return outcomes_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return outcomes_.empty();
    }

    [[nodiscard]] auto operator[](std::size_t index) const
        -> const outcome_type& {
        return outcomes_[index];
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator {
        return outcomes_.begin();
    }

    [[nodiscard]] auto end() const noexcept -> const_iterator {
        return outcomes_.end();
    }

    [[nodiscard]] auto succeeded(std::size_t index) const -> bool {
        return index < outcomes_.size() && outcomes_[index].ok();
    }

    [[nodiscard]] auto failed_keys() const -> std::vector<K> {
        std::vector<K> keys;
        for (const auto& outcome : outcomes_) {
            if (!outcome.ok()) {
                keys.push_back(outcome.key);
            }
        }
        return keys;
    }

    [[nodiscard]] auto success_count() const noexcept -> std::size_t {
        std::size_t count = 0;
        for (const auto& outcome : outcomes_) {
            if (outcome.ok()) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] auto failure_count() const noexcept -> std::size_t {
        return outcomes_.size() - success_count();
    }

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failure_count() == 0;
    }

    /**
     * @brief The first outcome recorded for a key equivalent to `key`
     * under Compare, nullptr if the batch did not touch it.
     */
    [[nodiscard]] auto find(const K& key) const -> const outcome_type* {
        for (const auto& outcome : outcomes_) {
            if (detail::keys_equal<K, Compare>(outcome.key, key)) {
                return &outcome;
            }
        }
        return nullptr;
    }

private:
    std::vector<outcome_type> outcomes_;
};

}  // namespace stash::cache

#endif  // STASH_CACHE_BATCH_HPP
