/**
 * @file application.h
 * @brief Application concept and the UserData lifecycle state.
 *
 * A program is described by a constructor callable:
 *
 *   auto ctor = [](belart::SetupContext& ctx) -> std::optional<Synth> {
 *       if (ctx.audio_out_channels() < 2) return std::nullopt;
 *       return Synth{ctx.audio_sample_rate()};
 *   };
 *
 * The engine runs the constructor once during setup. Returning a value
 * produces the application; returning std::nullopt (or throwing) declines
 * to run. The application's render() is then called once per period and
 * its destructor runs during cleanup.
 *
 * render() MUST be noexcept. An exception on the render thread cannot be
 * recovered from and terminates the process.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/context.h"
#include "belart/logging.h"
#include "belart/safe_call.h"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace belart {

// ═══════════════════════════════════════════════════════════════════════════════
// Concepts
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief A type whose render() can be driven from the real-time thread.
 */
template<typename A>
concept Application =
    std::is_object_v<A> &&
    std::is_destructible_v<A> &&
    requires(A& app, RenderContext& ctx) {
        { app.render(ctx) } noexcept;
    };

namespace detail {

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

/**
 * @brief A callable producing std::optional<A> for some Application A.
 */
template<typename F>
concept ApplicationConstructor =
    std::move_constructible<F> &&
    std::invocable<F, SetupContext&> &&
    detail::is_optional<std::invoke_result_t<F, SetupContext&>>::value &&
    Application<typename std::invoke_result_t<F, SetupContext&>::value_type>;

template<ApplicationConstructor F>
using application_t = typename std::invoke_result_t<F, SetupContext&>::value_type;

// ═══════════════════════════════════════════════════════════════════════════════
// UserData
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Constructor, then Application, then nothing.
 *
 * Legal transitions:
 * - Constructor -> Application or None, exactly once, in setup()
 * - Application -> None, exactly once, in cleanup()
 *
 * Owned by the Runtime for the whole run and reached by the engine only
 * through the opaque user_data pointer.
 */
template<ApplicationConstructor F>
class UserData {
public:
    using App = application_t<F>;

    explicit UserData(F constructor)
        : state_(std::in_place_index<kConstructor>, std::move(constructor))
    {}

    UserData(const UserData&) = delete;
    UserData& operator=(const UserData&) = delete;

    [[nodiscard]] bool holds_constructor() const noexcept { return state_.index() == kConstructor; }
    [[nodiscard]] bool holds_application() const noexcept { return state_.index() == kApplication; }
    [[nodiscard]] bool is_none() const noexcept { return state_.index() == kNone; }

    /// The live application, or nullptr outside the Application state.
    [[nodiscard]] App* application() noexcept {
        auto* app = std::get_if<kApplication>(&state_);
        return app ? app->get() : nullptr;
    }

    /**
     * @brief Consume the constructor and store what it produced.
     *
     * Exceptions from the constructor are contained and logged; the state
     * then ends in None.
     *
     * @return true iff an application now exists
     */
    bool setup(SetupContext& ctx) noexcept {
        if (!holds_constructor()) {
            BELART_LOG_ERROR("SETUP", "setup called outside the Constructor state");
            return false;
        }

        auto outcome = safe_call("SETUP", [this, &ctx] {
            F constructor = std::get<kConstructor>(std::move(state_));
            state_.template emplace<kNone>();
            std::optional<App> produced = std::invoke(std::move(constructor), ctx);
            if (produced.has_value()) {
                state_.template emplace<kApplication>(
                    std::make_unique<App>(std::move(*produced)));
            }
        });

        if (!holds_application()) {
            state_.template emplace<kNone>();
            if (outcome) {
                BELART_LOG_INFO("SETUP", "constructor declined to create an application");
            }
        }
        return holds_application();
    }

    /// Call the application's render(); no-op outside the Application state.
    void render(RenderContext& ctx) noexcept {
        if (auto* app = std::get_if<kApplication>(&state_)) {
            (*app)->render(ctx);
        }
    }

    /**
     * @brief Destroy the application.
     *
     * An exception from its destructor is contained and logged.
     */
    void cleanup() noexcept {
        auto* slot = std::get_if<kApplication>(&state_);
        if (slot == nullptr) {
            return;
        }
        App* app = slot->release();
        state_.template emplace<kNone>();
        // Plain delete so that a throwing destructor reaches safe_call
        static_cast<void>(safe_call("CLEANUP", [app] { delete app; }));
    }

private:
    static constexpr size_t kConstructor = 0;
    static constexpr size_t kApplication = 1;
    static constexpr size_t kNone = 2;

    std::variant<F, std::unique_ptr<App>, std::monostate> state_;
};

} // namespace belart
