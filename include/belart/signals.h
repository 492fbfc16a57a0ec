/**
 * @file signals.h
 * @brief SIGINT/SIGTERM handling that asks the running engine to stop.
 *
 * The handler does nothing but load an atomic engine pointer and call
 * rtio::Engine::request_stop(), which is async-signal-safe.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "rtio/engine.h"

namespace belart {

/**
 * @brief Installs the stop handlers for its lifetime.
 *
 * The previous handlers are restored on destruction. Only one guard may be
 * active at a time; a second guard is inert.
 */
class ScopedStopSignals {
public:
    explicit ScopedStopSignals(rtio::Engine& engine) noexcept;
    ~ScopedStopSignals();

    ScopedStopSignals(const ScopedStopSignals&) = delete;
    ScopedStopSignals& operator=(const ScopedStopSignals&) = delete;

    /// False when another guard already owned the handlers.
    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    using Handler = void (*)(int);

    bool active_ = false;
    Handler previous_int_ = nullptr;
    Handler previous_term_ = nullptr;
};

} // namespace belart
