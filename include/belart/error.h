/**
 * @file error.h
 * @brief Error handling infrastructure using C++23 std::expected.
 *
 * Provides:
 * - ErrorCode taxonomy for the engine lifecycle, auxiliary tasks and ports
 * - Error class with code, static message, and source location
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helper functions
 *
 * Error is trivially copyable and never allocates: messages are string
 * literals. This keeps a failing schedule_auxiliary_task() legal on the
 * real-time render thread.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>

namespace belart {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 *
 * Zero indicates success (not used in Error objects).
 */
enum class ErrorCode : int {
    Ok = 0,

    // Engine lifecycle (1-99)
    InitFailed = 1,
    StartFailed = 2,

    // Auxiliary tasks (100-199)
    TaskCreateFailed = 100,
    TaskScheduleFailed = 101,

    // Peripherals (200-299)
    PortOpenFailed = 200,

    // Configuration (300-399)
    InvalidArgument = 300,

    // API boundary (500-599)
    Exception = 500,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InitFailed: return "InitFailed";
        case ErrorCode::StartFailed: return "StartFailed";
        case ErrorCode::TaskCreateFailed: return "TaskCreateFailed";
        case ErrorCode::TaskScheduleFailed: return "TaskScheduleFailed";
        case ErrorCode::PortOpenFailed: return "PortOpenFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Exception: return "Exception";
    }
    return "Unknown";
}

/**
 * @brief Human-readable description naming the failing engine operation.
 */
[[nodiscard]] inline constexpr const char* error_code_description(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "no error";
        case ErrorCode::InitFailed: return "engine initialize() failed";
        case ErrorCode::StartFailed: return "engine start() failed";
        case ErrorCode::TaskCreateFailed: return "engine create_auxiliary_task() failed";
        case ErrorCode::TaskScheduleFailed: return "engine schedule_auxiliary_task() failed";
        case ErrorCode::PortOpenFailed: return "engine midi_open() failed";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::Exception: return "exception contained at callback boundary";
    }
    return "unknown error";
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Used as the error type in Result<T> (std::expected<T, Error>).
 *
 * Example:
 * @code
 *   Error err(ErrorCode::StartFailed, "engine refused to start");
 *   BELART_LOG_ERROR("RUN", "%s", err.format().c_str());
 *   // StartFailed at runtime.h:120 (run): engine refused to start
 * @endcode
 */
class Error {
public:
    /**
     * @brief Construct an error with code and message.
     * @param code Error category
     * @param message String literal or other static-lifetime text
     * @param location Source location (auto-captured by default)
     */
    constexpr Error(ErrorCode code,
                    const char* message,
                    std::source_location location = std::source_location::current()) noexcept
        : code_(code)
        , message_(message ? message : "")
        , location_(location)
    {}

    /**
     * @brief Create error whose message is the code's description.
     */
    [[nodiscard]] static Error from_code(
        ErrorCode code,
        std::source_location loc = std::source_location::current()
    ) noexcept {
        return Error{code, error_code_description(code), loc};
    }

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const char* message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    [[nodiscard]] const char* file() const noexcept {
        return location_.file_name();
    }

    [[nodiscard]] uint_least32_t line() const noexcept {
        return location_.line();
    }

    [[nodiscard]] const char* function() const noexcept {
        return location_.function_name();
    }

    /**
     * @brief Format error for display/logging. Allocates.
     * @return Formatted string: "CODE at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        return std::format(
            "{} at {}:{} ({}): {}",
            error_code_name(code_),
            location_.file_name(),
            location_.line(),
            location_.function_name(),
            message_
        );
    }

    /**
     * @brief Check if this is a specific error code.
     */
    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    const char* message_;
    std::source_location location_;
};

static_assert(std::is_trivially_copyable_v<Error>,
              "Error must stay allocation-free for the render thread");

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * Represents either a success value of type T, or an Error.
 *
 * @tparam T The success value type
 */
template<typename T>
using Result = std::expected<T, Error>;

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() noexcept {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) noexcept {
    return std::unexpected(error);
}

[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    const char* msg,
    std::source_location loc = std::source_location::current()
) noexcept {
    return std::unexpected(Error{code, msg, loc});
}

} // namespace belart

// ─────────────────────────────────────────────────────────────────────────────
// FAIL-Level Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return an error Result if the condition does not hold.
 *
 * @code
 *   Result<void> set_pru(int n) {
 *       BELART_CHECK(n == 0 || n == 1, InvalidArgument, "pru_number must be 0 or 1");
 *       return Ok();
 *   }
 * @endcode
 */
#define BELART_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::belart::make_error(::belart::ErrorCode::code, msg); \
        } \
    } while (0)

/**
 * @brief Return an error Result unconditionally.
 */
#define BELART_FAIL(code, msg) \
    return ::belart::make_error(::belart::ErrorCode::code, msg)
