/**
 * @file context.h
 * @brief Phase-restricted view of the engine's per-callback buffer descriptor.
 *
 * Every callback receives a Context whose phase tag decides what user code
 * may do with it:
 *
 * | Capability                      | SetupContext | RenderContext |
 * |---------------------------------|--------------|---------------|
 * | dimensions, rates, flags        | yes          | yes           |
 * | buffer views, digital I/O       | no           | yes           |
 * | create_auxiliary_task           | yes          | no            |
 * | schedule_auxiliary_task         | no           | yes           |
 *
 * Missing capabilities are absent members, so calling one from the wrong
 * phase does not compile.
 *
 * A Context is a non-owning handle bound to one callback invocation. It is
 * neither copyable nor movable and must not be stored.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/auxiliary_task.h"
#include "belart/digital.h"
#include "belart/error.h"
#include "belart/gsl.hpp"
#include "rtio/engine.h"
#include "rtio/rtio_abi.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <utility>

namespace belart {

/// Phase marker for the one-time setup callback.
struct SetupTag {};

/// Phase marker for the periodic render callback.
struct RenderTag {};

namespace detail {

template<typename T>
[[nodiscard]] std::span<T> region(T* data, uint32_t frames, uint32_t channels) noexcept {
    if (data == nullptr) {
        return {};
    }
    return {data, static_cast<size_t>(frames) * channels};
}

} // namespace detail

// ═══════════════════════════════════════════════════════════════════════════════
// ContextBase
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Introspection available in every phase.
 */
class ContextBase {
public:
    ContextBase(const ContextBase&) = delete;
    ContextBase& operator=(const ContextBase&) = delete;
    ContextBase(ContextBase&&) = delete;
    ContextBase& operator=(ContextBase&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Audio
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] uint32_t audio_frames() const noexcept { return raw_->audio_frames; }
    [[nodiscard]] uint32_t audio_in_channels() const noexcept { return raw_->audio_in_channels; }
    [[nodiscard]] uint32_t audio_out_channels() const noexcept { return raw_->audio_out_channels; }
    [[nodiscard]] float audio_sample_rate() const noexcept { return raw_->audio_sample_rate; }

    // ─────────────────────────────────────────────────────────────────────────
    // Analog
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] uint32_t analog_frames() const noexcept { return raw_->analog_frames; }
    [[nodiscard]] uint32_t analog_in_channels() const noexcept { return raw_->analog_in_channels; }
    [[nodiscard]] uint32_t analog_out_channels() const noexcept { return raw_->analog_out_channels; }
    [[nodiscard]] float analog_sample_rate() const noexcept { return raw_->analog_sample_rate; }

    // ─────────────────────────────────────────────────────────────────────────
    // Digital
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] uint32_t digital_frames() const noexcept { return raw_->digital_frames; }
    [[nodiscard]] uint32_t digital_channels() const noexcept { return raw_->digital_channels; }
    [[nodiscard]] float digital_sample_rate() const noexcept { return raw_->digital_sample_rate; }

    // ─────────────────────────────────────────────────────────────────────────
    // Miscellaneous
    // ─────────────────────────────────────────────────────────────────────────

    /// Audio frames rendered before the current period.
    [[nodiscard]] uint64_t audio_frames_elapsed() const noexcept { return raw_->audio_frames_elapsed; }

    [[nodiscard]] uint32_t multiplexer_channels() const noexcept { return raw_->multiplexer_channels; }

    /// First multiplexer channel present in this period's analog input.
    [[nodiscard]] uint32_t multiplexer_starting_channel() const noexcept {
        return raw_->multiplexer_starting_channel;
    }

    /// Bitmask of analog channels routed through the audio expander.
    [[nodiscard]] uint32_t audio_expander_enabled() const noexcept { return raw_->audio_expander_enabled; }

    /// Raw RTIO_FLAG_* bits.
    [[nodiscard]] uint32_t flags() const noexcept { return raw_->flags; }

    [[nodiscard]] bool is_interleaved() const noexcept {
        return (raw_->flags & RTIO_FLAG_INTERLEAVED) != 0;
    }

    [[nodiscard]] bool analog_outputs_persist() const noexcept {
        return (raw_->flags & RTIO_FLAG_ANALOG_OUTPUTS_PERSIST) != 0;
    }

    [[nodiscard]] std::string_view project_name() const noexcept {
        const void* end = std::memchr(raw_->project_name, '\0', RTIO_PROJECT_NAME_LEN);
        const size_t len = end == nullptr
            ? size_t{RTIO_PROJECT_NAME_LEN}
            : static_cast<size_t>(static_cast<const char*>(end) - raw_->project_name);
        return {raw_->project_name, len};
    }

protected:
    ContextBase(rtio_context& raw, rtio::Engine& engine) noexcept
        : raw_(std::addressof(raw))
        , engine_(std::addressof(engine))
    {}

    ~ContextBase() = default;

    rtio_context* raw_;
    rtio::Engine* engine_;
};

template<typename Phase>
class Context;

// ═══════════════════════════════════════════════════════════════════════════════
// Setup Phase
// ═══════════════════════════════════════════════════════════════════════════════

template<>
class Context<SetupTag> : public ContextBase {
public:
    /// Built by the setup trampoline around the engine's descriptor.
    Context(rtio_context& raw, rtio::Engine& engine) noexcept
        : ContextBase(raw, engine)
    {}

    /**
     * @brief Hand @p task to the engine as a schedulable auxiliary task.
     *
     * @param task     Callable run on the task's own thread
     * @param priority Thread priority (engine-defined range, higher runs first)
     * @param name     Globally unique task name
     * @return Handle for schedule_auxiliary_task(), or TaskCreateFailed
     *
     * On success the moved-in callable lives until process exit. On failure
     * it is destroyed before returning.
     */
    template<AuxiliaryCallable F>
    [[nodiscard]] Result<AuxiliaryTask> create_auxiliary_task(F task, int priority, const char* name) {
        auto boxed = std::make_unique<F>(std::move(task));
        rtio_aux_task handle = engine_->create_auxiliary_task(
            &detail::auxiliary_task_trampoline<F>, priority, name, boxed.get());
        if (handle == nullptr) {
            BELART_FAIL(TaskCreateFailed, "engine create_auxiliary_task() failed");
        }
        // Retained by the engine from here on
        static_cast<void>(boxed.release());
        return AuxiliaryTask{handle};
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Render Phase
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Context for the periodic render callback.
 *
 * Buffer views are re-derived from the engine descriptor on every call.
 * Interleaved layout: sample (frame, channel) is at frame * channels + channel.
 */
template<>
class Context<RenderTag> : public ContextBase {
public:
    Context(rtio_context& raw, rtio::Engine& engine) noexcept
        : ContextBase(raw, engine)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Buffer Views
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::span<const float> audio_in() const noexcept {
        return detail::region(raw_->audio_in, raw_->audio_frames, raw_->audio_in_channels);
    }

    [[nodiscard]] std::span<float> audio_out() noexcept {
        return detail::region(raw_->audio_out, raw_->audio_frames, raw_->audio_out_channels);
    }

    [[nodiscard]] std::span<const float> analog_in() const noexcept {
        return detail::region(raw_->analog_in, raw_->analog_frames, raw_->analog_in_channels);
    }

    [[nodiscard]] std::span<float> analog_out() noexcept {
        return detail::region(raw_->analog_out, raw_->analog_frames, raw_->analog_out_channels);
    }

    /// One packed word per digital frame (see digital.h).
    [[nodiscard]] std::span<uint32_t> digital() noexcept {
        return detail::region(raw_->digital, raw_->digital_frames, 1);
    }

    [[nodiscard]] std::span<const uint32_t> digital() const noexcept {
        return detail::region<const uint32_t>(raw_->digital, raw_->digital_frames, 1);
    }

    /// Latest value of every multiplexed input, analog_in_channels per mux channel.
    [[nodiscard]] std::span<const float> multiplexer_analog_in() const noexcept {
        return detail::region(raw_->multiplexer_analog_in,
                              raw_->multiplexer_channels, raw_->analog_in_channels);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Digital I/O
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool digital_read(size_t frame, uint32_t channel) const {
        return belart::digital_read(digital(), frame, channel);
    }

    void digital_write(size_t frame, uint32_t channel, bool value) {
        belart::digital_write(digital(), frame, channel, value);
    }

    void digital_write_once(size_t frame, uint32_t channel, bool value) {
        belart::digital_write_once(digital(), frame, channel, value);
    }

    void pin_mode(size_t frame, uint32_t channel, DigitalDirection mode) {
        belart::pin_mode(digital(), frame, channel, mode);
    }

    void pin_mode_once(size_t frame, uint32_t channel, DigitalDirection mode) {
        belart::pin_mode_once(digital(), frame, channel, mode);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Auxiliary Tasks
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Wake @p task's thread. Never blocks or allocates.
     * @return TaskScheduleFailed if the engine rejected the request
     */
    Result<void> schedule_auxiliary_task(const AuxiliaryTask& task) noexcept {
        if (engine_->schedule_auxiliary_task(task.handle_) != RTIO_OK) {
            BELART_FAIL(TaskScheduleFailed, "engine schedule_auxiliary_task() failed");
        }
        return Ok();
    }
};

using SetupContext = Context<SetupTag>;
using RenderContext = Context<RenderTag>;

} // namespace belart
