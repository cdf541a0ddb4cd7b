/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Exception types carrying their throw site

**************************************************/

#ifndef CONFORM_ERROR_EXCEPTION_HPP
#define CONFORM_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "conform/macro.hpp"

namespace conform::error {

/**
 * @brief Base exception recording where it was thrown.
 *
 * The message is formatted with fmt when arguments follow it; a lone message
 * is taken verbatim, so it may safely contain braces.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception.
     * @param file Source file of the throw site.
     * @param line Line of the throw site.
     * @param func Function containing the throw site.
     * @param format Message, or fmt format string when args are given.
     * @param args Format arguments.
     */
    template <typename... Args>
    Exception(std::string file, int line, std::string func,
              std::string_view format, Args&&... args)
        : file_(std::move(file)),
          line_(line),
          func_(std::move(func)),
          thread_id_(std::this_thread::get_id()) {
        if constexpr (sizeof...(Args) == 0) {
            message_ = std::string(format);
        } else {
            message_ = fmt::vformat(format, fmt::make_format_args(args...));
        }
    }

    /**
     * @brief Full report including the throw site.
     */
    auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;

    /**
     * @brief The bare message, without location details.
     */
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

/**
 * @brief A caller-supplied argument is unusable (option documents, non-numeric
 * input to numeric helpers...).
 */
class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                 \
    throw conform::error::InvalidArgument(                          \
        CONFORM_FILE_NAME, CONFORM_FILE_LINE, CONFORM_FUNC_NAME, __VA_ARGS__)

}  // namespace conform::error

#endif  // CONFORM_ERROR_EXCEPTION_HPP
