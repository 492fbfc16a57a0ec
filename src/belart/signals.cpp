/**
 * @file signals.cpp
 * @brief Stop-signal handler installation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/signals.h"
#include "belart/logging.h"

#include <atomic>
#include <csignal>

namespace belart {

namespace {

std::atomic<rtio::Engine*> g_signal_engine{nullptr};

static_assert(std::atomic<rtio::Engine*>::is_always_lock_free,
              "signal handler requires a lock-free engine pointer");

void handle_stop_signal(int /*signum*/) {
    if (rtio::Engine* engine = g_signal_engine.load()) {
        engine->request_stop();
    }
}

} // anonymous namespace

ScopedStopSignals::ScopedStopSignals(rtio::Engine& engine) noexcept {
    rtio::Engine* expected = nullptr;
    if (!g_signal_engine.compare_exchange_strong(expected, &engine)) {
        BELART_LOG_WARN("RUN", "stop signal handlers already installed");
        return;
    }

    previous_int_ = std::signal(SIGINT, handle_stop_signal);
    previous_term_ = std::signal(SIGTERM, handle_stop_signal);
    if (previous_int_ == SIG_ERR || previous_term_ == SIG_ERR) {
        BELART_LOG_WARN("RUN", "could not install stop signal handlers");
    }
    active_ = true;
}

ScopedStopSignals::~ScopedStopSignals() {
    if (!active_) {
        return;
    }
    if (previous_int_ != SIG_ERR) {
        std::signal(SIGINT, previous_int_);
    }
    if (previous_term_ != SIG_ERR) {
        std::signal(SIGTERM, previous_term_);
    }
    g_signal_engine.store(nullptr);
}

} // namespace belart
