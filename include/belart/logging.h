/**
 * @file logging.h
 * @brief Callback-based logging for belart.
 *
 * - All output goes through a host callback, or stderr when none is set
 * - Level filtering is a relaxed atomic load, so disabled levels cost nothing
 * - Never log from render(): formatting and the callback may block
 *
 * Usage:
 *   // Host sets callback
 *   belart_set_log_callback(my_logger, userdata);
 *
 *   BELART_LOG_INFO("RUN", "engine started, %u audio frames", frames);
 *   BELART_LOG_FMT(Error, "TASK", "create failed for {}", name);
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef BELART_LOGGING_H
#define BELART_LOGGING_H

#include <cstdint>
#include <cstddef>

#ifdef __cplusplus
#include <format>
#include <string>
#include <string_view>
#include <utility>
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C ABI Types (FFI-safe)
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log severity levels, most to least severe.
 */
typedef enum belart_log_level {
    BELART_LOG_ERROR = 0,   /**< Errors that affect operation */
    BELART_LOG_WARN  = 1,   /**< Warnings about potential issues */
    BELART_LOG_INFO  = 2,   /**< Informational messages */
    BELART_LOG_DEBUG = 3,   /**< Debug information */
    BELART_LOG_TRACE = 4    /**< Detailed trace for debugging */
} belart_log_level;

/**
 * @brief Log callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier (e.g., "SETUP", "TASK", "RUN")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 */
typedef void (*belart_log_callback)(
    belart_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Set the process-wide log callback (NULL restores stderr output).
 */
void belart_set_log_callback(belart_log_callback callback, void* userdata);

/**
 * @brief Set minimum log level (default: BELART_LOG_INFO).
 */
void belart_set_log_level(belart_log_level level);

belart_log_level belart_get_log_level(void);

const char* belart_log_level_name(belart_log_level level);

#ifdef __cplusplus
} /* extern "C" */
#endif

// ═══════════════════════════════════════════════════════════════════════════════
// C++ API
// ═══════════════════════════════════════════════════════════════════════════════

#ifdef __cplusplus

namespace belart {

enum class LogLevel : int {
    Error = BELART_LOG_ERROR,
    Warn  = BELART_LOG_WARN,
    Info  = BELART_LOG_INFO,
    Debug = BELART_LOG_DEBUG,
    Trace = BELART_LOG_TRACE
};

[[nodiscard]] inline const char* log_level_name(LogLevel level) noexcept {
    return belart_log_level_name(static_cast<belart_log_level>(level));
}

using LogCallback = belart_log_callback;

/**
 * @brief Log a pre-formatted message (fast path).
 *
 * No formatting is performed; message is passed directly to the callback.
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting. Output is truncated at 1 KiB.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/**
 * @brief Check if a log level is enabled.
 *
 * Use this to guard expensive log argument computation.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(belart_get_log_level());
}

/**
 * @brief Log with std::format formatting.
 */
template<typename... Args>
void log_fmt(LogLevel level, const char* subsystem,
             std::format_string<Args...> fmt, Args&&... args) {
    if (!log_level_enabled(level)) {
        return;
    }
    std::string msg = std::format(fmt, std::forward<Args>(args)...);
    log_raw(level, subsystem, msg);
}

namespace detail {

/**
 * @brief Handler used when no callback is set: "[LEVEL] subsystem: message".
 */
void default_log_handler(
    belart_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
) noexcept;

} // namespace detail

} // namespace belart

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

#define BELART_LOG_LEVEL_ENABLED(level) \
    ::belart::log_level_enabled(::belart::LogLevel::level)

#define BELART_LOG_ERROR(subsys, ...) \
    ::belart::log_printf(::belart::LogLevel::Error, subsys, __VA_ARGS__)

#define BELART_LOG_WARN(subsys, ...) \
    ::belart::log_printf(::belart::LogLevel::Warn, subsys, __VA_ARGS__)

#define BELART_LOG_INFO(subsys, ...) \
    ::belart::log_printf(::belart::LogLevel::Info, subsys, __VA_ARGS__)

#define BELART_LOG_DEBUG(subsys, ...) \
    ::belart::log_printf(::belart::LogLevel::Debug, subsys, __VA_ARGS__)

#define BELART_LOG_TRACE(subsys, ...) \
    ::belart::log_printf(::belart::LogLevel::Trace, subsys, __VA_ARGS__)

#define BELART_LOG_FMT(level, subsys, fmt, ...) \
    ::belart::log_fmt(::belart::LogLevel::level, subsys, fmt, ##__VA_ARGS__)

#define BELART_LOG_RAW(level, subsys, msg) \
    ::belart::log_raw(::belart::LogLevel::level, subsys, msg)

#endif /* __cplusplus */

#endif /* BELART_LOGGING_H */
