/*
 * exception.hpp
 *
 * Copyright (C) 2026 The ordinal authors
 */

/*************************************************

Date: 2026-10-18

Description: Exception base with source location capture

**************************************************/

#ifndef ORDINAL_ERROR_EXCEPTION_HPP
#define ORDINAL_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "ordinal/macro.hpp"

namespace ordinal::error {

/**
 * @brief Base class of every exception thrown by the library.
 *
 * Records where it was thrown (file, line, function), the throwing thread and
 * a message formatted with fmt. Use the THROW_* macros so the location is
 * captured automatically.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception with a formatted message.
     *
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function of the throw site.
     * @param format fmt format string.
     * @param args Arguments for the format string.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              fmt::format_string<Args...> format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(fmt::format(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()) {}

    /**
     * @brief Full multi-line report including location and thread.
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
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

}  // namespace ordinal::error

#define THROW_EXCEPTION(...)                                          \
    throw ordinal::error::Exception(ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, \
                                    ORDINAL_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                 \
    throw ordinal::error::InvalidArgument(                          \
        ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, ORDINAL_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_RANGE(...)                                     \
    throw ordinal::error::OutOfRange(ORDINAL_FILE_NAME, ORDINAL_FILE_LINE, \
                                     ORDINAL_FUNC_NAME, __VA_ARGS__)

#endif  // ORDINAL_ERROR_EXCEPTION_HPP
