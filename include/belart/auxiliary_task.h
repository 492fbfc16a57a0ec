/**
 * @file auxiliary_task.h
 * @brief Handle for work offloaded from the render thread.
 *
 * An auxiliary task is a callable that the engine runs on a dedicated
 * lower-priority thread whenever the render thread schedules it:
 *
 *   // setup
 *   auto task = ctx.create_auxiliary_task([&log] { log.flush(); }, 10, "log-flush");
 *
 *   // render
 *   ctx.schedule_auxiliary_task(*task);
 *
 * Ownership: create_auxiliary_task() moves the callable to the heap and
 * hands it to the engine, which keeps it for the rest of the process.
 * There is no unregister call, so the allocation is never reclaimed.
 * The AuxiliaryTask object is only an opaque, move-only reference to it.
 *
 * Task names identify threads system-wide and must be unique across every
 * process sharing the engine. This cannot be checked locally.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/safe_call.h"
#include "rtio/rtio_abi.h"

#include <concepts>
#include <utility>

namespace belart {

template<typename Phase>
class Context;

struct SetupTag;
struct RenderTag;

/**
 * @brief Requirements on a callable passed to create_auxiliary_task().
 */
template<typename F>
concept AuxiliaryCallable = std::invocable<F&> && std::move_constructible<F>;

namespace detail {

/**
 * @brief Engine entry point for a task of callable type F.
 *
 * One instantiation per callable type. Exceptions thrown by the callable
 * are contained and logged; the worker thread keeps running.
 */
template<AuxiliaryCallable F>
void auxiliary_task_trampoline(void* arg) noexcept {
    auto* task = static_cast<F*>(arg);
    // Failures are logged by safe_call; the task is simply run again next time
    static_cast<void>(safe_call("TASK", [task] { (*task)(); }));
}

} // namespace detail

/**
 * @brief Opaque reference to a callable retained by the engine.
 *
 * Created only through Context<SetupTag>; scheduled only through
 * Context<RenderTag>. Destroying the handle does not destroy the task.
 */
class AuxiliaryTask {
public:
    AuxiliaryTask(const AuxiliaryTask&) = delete;
    AuxiliaryTask& operator=(const AuxiliaryTask&) = delete;

    AuxiliaryTask(AuxiliaryTask&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr))
    {}

    AuxiliaryTask& operator=(AuxiliaryTask&& other) noexcept {
        handle_ = std::exchange(other.handle_, nullptr);
        return *this;
    }

    ~AuxiliaryTask() = default;

    /// False for a moved-from handle.
    [[nodiscard]] bool valid() const noexcept { return handle_ != nullptr; }

private:
    friend class Context<SetupTag>;
    friend class Context<RenderTag>;

    explicit AuxiliaryTask(rtio_aux_task handle) noexcept : handle_(handle) {}

    rtio_aux_task handle_;
};

} // namespace belart
