/**
 * @file check_cxx23.cpp
 * @brief C++23 feature probe run by CMake's try_compile.
 *
 * Required features:
 * - std::expected<T, E> from <expected>
 * - std::format from <format>
 * - std::span<T> from <span>
 * - std::source_location from <source_location>
 * - std::atomic<T>::wait / notify_one
 *
 * @copyright GPL-2.0-or-later
 */

#include <atomic>
#include <concepts>
#include <expected>
#include <format>
#include <source_location>
#include <span>
#include <string>

std::expected<unsigned, std::string> checked_period(unsigned frames) {
    if (frames == 0) {
        return std::unexpected("period_size must be at least 1");
    }
    return frames;
}

template<typename F>
    requires std::invocable<F&>
int call(F& f) {
    return f();
}

float sum(std::span<const float> samples) {
    float total = 0.0f;
    for (float s : samples) {
        total += s;
    }
    return total;
}

int main() {
    if (!checked_period(16)) return 1;
    if (checked_period(0)) return 2;

    if (std::format("[{}] {}", "RUN", 16).empty()) return 3;

    const float block[] = {0.25f, 0.25f, 0.5f};
    if (sum(block) != 1.0f) return 4;

    if (std::source_location::current().file_name() == nullptr) return 5;

    std::atomic<unsigned> pending{1};
    pending.wait(0);
    pending.notify_one();

    auto seven = [] { return 7; };
    return call(seven) == 7 ? 0 : 6;
}
