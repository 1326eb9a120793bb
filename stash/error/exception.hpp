/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Exception types carrying their throw site

**************************************************/

#ifndef STASH_ERROR_EXCEPTION_HPP
#define STASH_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "stash/macro.hpp"

namespace stash::error {

/**
 * @brief Base exception of the stash library.
 *
 * Records the file, line, function and thread that raised it. The message is
 * formatted with fmt from the trailing arguments.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(std::string file, int line, std::string func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(std::move(file)),
          line_(line),
          func_(std::move(func)),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    /**
     * @brief Full description including the throw site.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    mutable std::string full_message_;
};

/**
 * @brief A cache was constructed directly from an invalid configuration.
 */
class InvalidConfiguration : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Reading or writing a cache snapshot failed.
 */
class SnapshotError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace stash::error

#define THROW_INVALID_CONFIGURATION(...)                           \
    throw stash::error::InvalidConfiguration(                      \
        STASH_FILE_NAME, STASH_FILE_LINE, STASH_FUNC_NAME, __VA_ARGS__)

#define THROW_SNAPSHOT_ERROR(...)                                  \
    throw stash::error::SnapshotError(STASH_FILE_NAME, STASH_FILE_LINE, \
                                      STASH_FUNC_NAME, __VA_ARGS__)

#endif  // STASH_ERROR_EXCEPTION_HPP
