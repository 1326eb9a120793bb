#ifndef STASH_TYPE_EXPECTED_HPP
#define STASH_TYPE_EXPECTED_HPP

#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace stash::type {

/**
 * @brief Wraps an error value so it can initialise an expected in the error
 * state.
 *
 * @tparam E The type of the error value
 */
template <typename E>
class unexpected {
public:
    template <typename U = E>
        requires std::constructible_from<E, U>
    constexpr explicit unexpected(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }
    [[nodiscard]] constexpr E&& error() && noexcept {
        return std::move(error_);
    }

    constexpr bool operator==(const unexpected& other) const = default;

private:
    E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/**
 * @brief Holds either a value of type T or an error of type E.
 *
 * The subset of C++23 std::expected the library needs, with the monadic
 * helpers used by the builder.
 *
 * @tparam T The type of the expected value
 * @tparam E The type of the error
 */
template <typename T, typename E>
class expected {
public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::decay_t<U>, expected>) &&
                 (!std::same_as<std::decay_t<U>, unexpected<E>>) &&
                 (!std::same_as<std::decay_t<U>, std::in_place_t>)
    constexpr expected(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template <typename... Args>
    constexpr explicit expected(std::in_place_t, Args&&... args)
        : storage_(std::in_place_index<0>, std::forward<Args>(args)...) {}

    constexpr expected(const unexpected<E>& unex)
        : storage_(std::in_place_index<1>, unex) {}

    constexpr expected(unexpected<E>&& unex)
        : storage_(std::in_place_index<1>, std::move(unex)) {}

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return storage_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @throws std::logic_error if the expected holds an error
     */
    [[nodiscard]] constexpr T& value() & {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr const T& value() const& {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr T&& value() && {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::move(std::get<0>(storage_));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        return has_value() ? std::get<0>(storage_)
                           : static_cast<T>(std::forward<U>(default_value));
    }

    [[nodiscard]] constexpr T& operator*() & noexcept {
        return std::get<0>(storage_);
    }
    [[nodiscard]] constexpr const T& operator*() const& noexcept {
        return std::get<0>(storage_);
    }
    [[nodiscard]] constexpr T* operator->() noexcept {
        return &std::get<0>(storage_);
    }
    [[nodiscard]] constexpr const T* operator->() const noexcept {
        return &std::get<0>(storage_);
    }

    /**
     * @throws std::logic_error if the expected holds a value
     */
    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(storage_).error();
    }

    /**
     * @brief Chains a computation returning another expected.
     */
    template <typename Func>
    constexpr auto and_then(Func&& func) && -> decltype(func(
        std::declval<T&&>())) {
        if (has_value()) {
            return func(std::move(std::get<0>(storage_)));
        }
        return std::get<1>(std::move(storage_));
    }

    /**
     * @brief Transforms the value, keeping the error untouched.
     */
    template <typename Func>
    constexpr auto map(Func&& func) && -> expected<
        std::invoke_result_t<Func, T&&>, E> {
        using ReturnType = std::invoke_result_t<Func, T&&>;
        if (has_value()) {
            return expected<ReturnType, E>(
                func(std::move(std::get<0>(storage_))));
        }
        return expected<ReturnType, E>(std::get<1>(std::move(storage_)));
    }

private:
    std::variant<T, unexpected<E>> storage_;
};

/**
 * @brief Specialisation for operations that only report success or failure.
 */
template <typename E>
class expected<void, E> {
public:
    using value_type = void;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept : storage_(std::monostate{}) {}

    constexpr expected(const unexpected<E>& unex)
        : storage_(std::in_place_index<1>, unex) {}

    constexpr expected(unexpected<E>&& unex)
        : storage_(std::in_place_index<1>, std::move(unex)) {}

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return storage_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(storage_).error();
    }

    template <typename Func>
    constexpr auto and_then(Func&& func) const& -> decltype(func()) {
        if (has_value()) {
            return func();
        }
        return std::get<1>(storage_);
    }

private:
    std::variant<std::monostate, unexpected<E>> storage_;
};

template <typename E>
constexpr auto make_unexpected(E&& error) -> unexpected<std::decay_t<E>> {
    return unexpected<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace stash::type

#endif  // STASH_TYPE_EXPECTED_HPP
