/**
 * @file safe_call.h
 * @brief Exception containment at the engine callback boundary.
 *
 * The engine calls into user code through plain C function pointers, so
 * no exception may cross back into it. Every contained callback (setup,
 * cleanup, auxiliary tasks) runs its user code through safe_call:
 *
 * - Exceptions are caught, logged under the boundary's subsystem name and
 *   reported as ErrorCode::Exception
 * - Nothing is rethrown
 *
 * Render is the one boundary that is NOT wrapped (see application.h).
 *
 * Usage:
 *   auto app = belart::safe_call("SETUP", [&] { return ctor(ctx); });
 *   if (!app) { ... treat as "no application" ... }
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/error.h"
#include "belart/exceptions.h"
#include "belart/logging.h"

#include <concepts>
#include <exception>
#include <type_traits>
#include <utility>

namespace belart {

namespace detail {

inline std::unexpected<Error> contained(
    std::source_location loc = std::source_location::current()) noexcept {
    return make_error(ErrorCode::Exception,
                      error_code_description(ErrorCode::Exception), loc);
}

} // namespace detail

/**
 * @brief Execute a callable and contain every exception it throws.
 *
 * @param boundary Subsystem name used for the log line (e.g. "SETUP")
 * @param func     Callable taking no arguments
 * @return The callable's result, or ErrorCode::Exception if it threw
 */
template<typename F>
    requires std::invocable<F>
auto safe_call(const char* boundary, F&& func) noexcept
    -> Result<std::invoke_result_t<F>> {

    using ValueType = std::invoke_result_t<F>;

    try {
        if constexpr (std::is_void_v<ValueType>) {
            std::forward<F>(func)();
            return Ok();
        } else {
            return Result<ValueType>{std::in_place, std::forward<F>(func)()};
        }
    } catch (const FatalException& e) {
        BELART_LOG_ERROR(boundary, "Fatal exception at boundary: %s", e.what());
    } catch (const std::exception& e) {
        BELART_LOG_ERROR(boundary, "Exception at boundary: %s", e.what());
    } catch (...) {
        BELART_LOG_ERROR(boundary, "Unknown exception at boundary");
    }
    return detail::contained();
}

} // namespace belart
