/**
 * @file exceptions.h
 * @brief Exception types for failures inside user callbacks.
 *
 * Setup code may throw to abandon construction; the exception is contained
 * at the setup boundary and the engine is told not to start. Render code
 * must never throw (see application.h).
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace belart {

/**
 * @brief Base class for exceptions raised by belart.
 *
 * Derives from std::runtime_error for compatibility with
 * standard exception handling.
 */
class BelartException : public std::runtime_error {
public:
    explicit BelartException(const std::string& msg)
        : std::runtime_error(msg)
    {}

    template<typename... Args>
    static std::string format_message(std::format_string<Args...> fmt, Args&&... args) {
        return std::format(fmt, std::forward<Args>(args)...);
    }
};

/**
 * @brief Unrecoverable failure inside a contained callback.
 *
 * Thrown by BELART_ASSERT. Caught only at callback boundaries
 * (setup, cleanup, auxiliary tasks).
 */
class FatalException : public BelartException {
public:
    explicit FatalException(const std::string& msg)
        : BelartException("Fatal error: " + msg)
        , file_("")
        , line_(0)
    {}

    FatalException(const std::string& msg, const char* file, int line)
        : BelartException(format_message(
            "Fatal error at {}:{}: {}", file, line, msg))
        , file_(file)
        , line_(line)
    {}

    [[nodiscard]] const char* file() const noexcept { return file_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    const char* file_;
    int line_;
};

} // namespace belart

/**
 * @brief Assert that throws FatalException instead of aborting.
 *
 * Only valid outside the render path; an exception escaping render()
 * terminates the process.
 */
#define BELART_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            throw ::belart::FatalException( \
                std::string("Assertion failed: ") + (msg), __FILE__, __LINE__); \
        } \
    } while (0)
