/**
 * @file lifecycle.h
 * @brief Engine callback entry points for a given application constructor.
 *
 * Lifecycle<F> provides the three static functions installed into
 * rtio_init_settings. The engine's user_data pointer is a CallbackState<F>
 * that owns the UserData and knows which engine is calling:
 *
 *   engine ──setup(ctx, state)──▶ Lifecycle<F>::setup ──▶ UserData::setup
 *          ──render(ctx, state)─▶ Lifecycle<F>::render ─▶ App::render
 *          ──cleanup(ctx, state)▶ Lifecycle<F>::cleanup ▶ UserData::cleanup
 *
 * Containment: setup and cleanup never let an exception reach the engine.
 * Render is not wrapped (App::render is noexcept by concept).
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/application.h"
#include "belart/context.h"
#include "rtio/engine.h"
#include "rtio/rtio_abi.h"

#include <utility>

namespace belart {

/**
 * @brief Everything the engine's user_data pointer refers to.
 */
template<ApplicationConstructor F>
struct CallbackState {
    rtio::Engine* engine;
    UserData<F> user_data;

    CallbackState(rtio::Engine& e, F constructor)
        : engine(&e)
        , user_data(std::move(constructor))
    {}
};

template<ApplicationConstructor F>
struct Lifecycle {
    using State = CallbackState<F>;

    static bool setup(rtio_context* raw, void* user_data) noexcept {
        auto* state = static_cast<State*>(user_data);
        SetupContext ctx(*raw, *state->engine);
        return state->user_data.setup(ctx);
    }

    static void render(rtio_context* raw, void* user_data) noexcept {
        auto* state = static_cast<State*>(user_data);
        RenderContext ctx(*raw, *state->engine);
        state->user_data.render(ctx);
    }

    static void cleanup(rtio_context* /*raw*/, void* user_data) noexcept {
        auto* state = static_cast<State*>(user_data);
        state->user_data.cleanup();
    }

    /// Point the settings' callbacks at this lifecycle.
    static void install(rtio_init_settings& settings) noexcept {
        settings.setup = &Lifecycle::setup;
        settings.render = &Lifecycle::render;
        settings.cleanup = &Lifecycle::cleanup;
    }
};

} // namespace belart
