/**
 * @file logging.cpp
 * @brief Implementation of callback-based logging.
 *
 * The sink (callback + userdata) is swapped under a mutex and copied out
 * before dispatch, so a handler may itself call belart_set_log_callback().
 * The level check is a relaxed atomic load.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/logging.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace {

struct LogSink {
    belart_log_callback callback = nullptr;
    void* userdata = nullptr;
};

std::mutex g_sink_mutex;
LogSink g_sink;

std::atomic<belart_log_level> g_level{BELART_LOG_INFO};

/// Longest message handed to a callback, including the terminator.
constexpr size_t kMessageCapacity = 1024;

constexpr std::array<const char*, 5> kLevelNames{"ERROR", "WARN", "INFO", "DEBUG", "TRACE"};

LogSink current_sink() {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    return g_sink;
}

} // anonymous namespace

extern "C" {

void belart_set_log_callback(belart_log_callback callback, void* userdata) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = LogSink{callback, userdata};
}

void belart_set_log_level(belart_log_level level) {
    g_level.store(level, std::memory_order_relaxed);
}

belart_log_level belart_get_log_level(void) {
    return g_level.load(std::memory_order_relaxed);
}

const char* belart_log_level_name(belart_log_level level) {
    const auto index = static_cast<size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "UNKNOWN";
}

} // extern "C"

namespace belart {

namespace detail {

void default_log_handler(
    belart_log_level level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", belart_log_level_name(level), subsystem, message);
}

} // namespace detail

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    // string_view is not NUL-terminated; messages past capacity are cut
    char text[kMessageCapacity];
    const size_t length = std::min(message.size(), kMessageCapacity - 1);
    std::memcpy(text, message.data(), length);
    text[length] = '\0';

    const LogSink sink = current_sink();
    const auto c_level = static_cast<belart_log_level>(level);
    const char* tag = subsystem != nullptr ? subsystem : "";

    if (sink.callback != nullptr) {
        sink.callback(c_level, tag, text, sink.userdata);
    } else {
        detail::default_log_handler(c_level, tag, text, nullptr);
    }
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    char text[kMessageCapacity];
    va_list args;
    va_start(args, fmt);
    const int written = std::vsnprintf(text, sizeof(text), fmt, args);
    va_end(args);

    if (written < 0) {
        text[0] = '\0';
    } else if (static_cast<size_t>(written) >= sizeof(text)) {
        std::memcpy(text + sizeof(text) - 4, "...", 4);
    }

    log_raw(level, subsystem, text);
}

} // namespace belart
