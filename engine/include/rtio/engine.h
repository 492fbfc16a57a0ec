/**
 * @file engine.h
 * @brief C++ interface to the real-time I/O engine.
 *
 * The engine lifecycle is four sequential calls:
 *
 *   initialize(settings, user_data)   // calls settings.setup
 *   start()                           // render called periodically
 *   stop()                            // render thread joined
 *   cleanup()                         // calls settings.cleanup
 *
 * Every method that returns rtio_status_t reports RTIO_OK on success and a
 * negative code on failure. The engine never throws.
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef RTIO_ENGINE_H
#define RTIO_ENGINE_H

#include "rtio/rtio_abi.h"

#include <cstddef>
#include <cstdint>

namespace rtio {

/**
 * @brief Abstract engine driving the setup/render/cleanup callbacks.
 *
 * ## Thread Safety
 * - initialize/start/stop/cleanup: main thread only, in order
 * - request_stop: any thread, async-signal-safe
 * - schedule_auxiliary_task: render thread, must not block or allocate
 * - create_auxiliary_task: from within setup only
 */
class Engine {
public:
    virtual ~Engine() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Allocate buffers and invoke the setup callback.
     *
     * @param settings  Configuration and callbacks (copied)
     * @param user_data Opaque pointer passed to every callback
     * @return RTIO_OK, or RTIO_ERR_SETUP_DECLINED when setup returned false
     */
    virtual rtio_status_t initialize(const rtio_init_settings& settings,
                                     void* user_data) noexcept = 0;

    /// Start calling render once per period.
    virtual rtio_status_t start() noexcept = 0;

    /// Stop the render thread. Safe to call when not started.
    virtual void stop() noexcept = 0;

    /// Invoke the cleanup callback and release engine resources.
    virtual void cleanup() noexcept = 0;

    /**
     * @brief Ask the engine to stop.
     *
     * Only performs an atomic store; callable from a signal handler.
     */
    virtual void request_stop() noexcept = 0;

    /// True once a stop has been requested (by the host or the engine).
    [[nodiscard]] virtual bool stop_requested() const noexcept = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Auxiliary Tasks
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Register a task to run on a lower-priority thread.
     *
     * The engine keeps @p arg for the rest of the process lifetime; there is
     * no unregister call.
     *
     * @return Task handle, or nullptr on failure
     */
    virtual rtio_aux_task create_auxiliary_task(rtio_aux_callback callback,
                                                int priority,
                                                const char* name,
                                                void* arg) noexcept = 0;

    /// Wake the task's thread. Non-blocking, allocation-free.
    virtual rtio_status_t schedule_auxiliary_task(rtio_aux_task task) noexcept = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // MIDI
    // ─────────────────────────────────────────────────────────────────────────

    /// Open a MIDI port by name (e.g. "hw:0,0,0"). nullptr on failure.
    virtual rtio_midi midi_open(const char* port) noexcept = 0;

    /// Number of complete messages waiting on the port.
    [[nodiscard]] virtual int midi_available(rtio_midi port) noexcept = 0;

    /**
     * @brief Copy the next message (1 to 3 bytes) into @p buffer.
     * @return Number of bytes written, 0 if none available
     */
    virtual int midi_get_message(rtio_midi port, uint8_t* buffer) noexcept = 0;

    virtual void midi_close(rtio_midi port) noexcept = 0;
};

} // namespace rtio

#endif /* RTIO_ENGINE_H */
