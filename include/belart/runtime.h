/**
 * @file runtime.h
 * @brief Runs an application on an engine from start to finish.
 *
 * Example:
 * @code
 *   rtio::HeadlessEngine engine;
 *   auto settings = belart::SettingsBuilder().with_analog(false).build();
 *
 *   auto result = belart::Runtime(make_synth, engine)
 *       .with_settings(*settings)
 *       .run();
 * @endcode
 *
 * run() blocks until the engine stops (SIGINT, SIGTERM or the engine's own
 * stop request) and has finished cleanup.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/application.h"
#include "belart/error.h"
#include "belart/lifecycle.h"
#include "belart/logging.h"
#include "belart/settings.h"
#include "belart/signals.h"
#include "rtio/engine.h"

#include <chrono>
#include <thread>
#include <utility>

namespace belart {

/// Interval at which run() checks whether the engine wants to stop.
inline constexpr std::chrono::microseconds kStopPollInterval{10};

template<ApplicationConstructor F>
class Runtime {
public:
    Runtime(F constructor, rtio::Engine& engine)
        : constructor_(std::move(constructor))
        , engine_(&engine)
    {}

    Runtime& with_settings(InitSettings settings) & {
        settings_ = std::move(settings);
        return *this;
    }

    Runtime&& with_settings(InitSettings settings) && {
        settings_ = std::move(settings);
        return std::move(*this);
    }

    [[nodiscard]] const InitSettings& settings() const noexcept { return settings_; }

    /**
     * @brief Initialize, start, wait for a stop request, stop, clean up.
     *
     * A constructor that declines (returns std::nullopt or throws) is not an
     * error: the engine is never started and run() returns success.
     *
     * After a start failure the engine is cleaned up (the application is
     * destroyed) before run() returns, so the engine holds no reference to
     * this run's state.
     *
     * @return InitFailed or StartFailed when the engine refuses
     */
    [[nodiscard]] Result<void> run() && {
        CallbackState<F> state(*engine_, std::move(constructor_));

        rtio_init_settings raw = settings_.to_rtio();
        Lifecycle<F>::install(raw);

        ScopedStopSignals signals(*engine_);

        const rtio_status_t init = engine_->initialize(raw, &state);
        if (init != RTIO_OK) {
            if (state.user_data.is_none()) {
                BELART_LOG_INFO("RUN", "setup produced no application, not starting");
                return Ok();
            }
            BELART_LOG_ERROR("RUN", "initialize failed: %s", rtio_status_name(init));
            BELART_FAIL(InitFailed, "engine initialize() failed");
        }

        const rtio_status_t start = engine_->start();
        if (start != RTIO_OK) {
            BELART_LOG_ERROR("RUN", "start failed: %s", rtio_status_name(start));
            // Initialized but never started: no stop(), but cleanup() must run
            // while the callback state is still alive
            engine_->cleanup();
            BELART_FAIL(StartFailed, "engine start() failed");
        }
        BELART_LOG_DEBUG("RUN", "engine started");

        while (!engine_->stop_requested()) {
            std::this_thread::sleep_for(kStopPollInterval);
        }

        engine_->stop();
        engine_->cleanup();
        BELART_LOG_DEBUG("RUN", "engine stopped");
        return Ok();
    }

private:
    F constructor_;
    rtio::Engine* engine_;
    InitSettings settings_;
};

} // namespace belart
