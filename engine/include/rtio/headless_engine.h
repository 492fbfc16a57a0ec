/**
 * @file headless_engine.h
 * @brief Software engine implementing the rtio callback contract.
 *
 * HeadlessEngine runs the setup/render/cleanup protocol without any
 * hardware. It is used for:
 * - Unit and integration testing of the callback core
 * - Running example applications on a development host
 * - Deterministic replay of render output
 *
 * ## Buffer Dimensions
 * Audio runs at 44100 Hz. With analog enabled the analog rate is
 * 22050 Hz for 8 channels, 44100 Hz for 4 and 88200 Hz for 2, and
 * period_size counts analog frames; audio frames are scaled to match.
 * Digital frames equal audio frames.
 *
 * ## Driving Modes
 * - start(): a render thread calls render once per period (real-time
 *   pacing can be disabled for tests)
 * - run_periods(n): n render calls on the calling thread (not started)
 *
 * ## Shutdown Order
 * cleanup() joins the render thread, then every auxiliary task worker
 * (letting a task in progress finish), and only then calls the cleanup
 * callback.
 *
 * ## Output Capture
 * Capture buffers and the history ring are sized by initialize() and
 * set_history_limit(); render only copies into them. The render thread
 * does take capture_mutex_ for the copy, so a reader calling
 * last_audio_out() or audio_out_history() can delay a period.
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef RTIO_HEADLESS_ENGINE_H
#define RTIO_HEADLESS_ENGINE_H

#include "rtio/engine.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace rtio {

/**
 * @brief Writable views of the input regions, handed to an InputGenerator.
 *
 * digital arrives pre-filled with every channel configured as an input at
 * level low; generators may set value bits to emulate pin levels.
 */
struct InputBuffers {
    std::span<float> audio_in;
    std::span<float> analog_in;
    std::span<uint32_t> digital;
    std::span<float> multiplexer_in;
};

/**
 * @brief Fills input buffers before each render call.
 *
 * @param inputs Input regions for the coming period
 * @param period Zero-based index of the period about to be rendered
 */
using InputGenerator = std::function<void(const InputBuffers& inputs, uint64_t period)>;

class HeadlessEngine final : public Engine {
public:
    static constexpr float kAudioSampleRate = 44100.0f;
    static constexpr uint32_t kAudioChannels = 2;

    HeadlessEngine();
    ~HeadlessEngine() override;

    HeadlessEngine(const HeadlessEngine&) = delete;
    HeadlessEngine& operator=(const HeadlessEngine&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Engine Implementation
    // ─────────────────────────────────────────────────────────────────────────

    rtio_status_t initialize(const rtio_init_settings& settings,
                             void* user_data) noexcept override;
    rtio_status_t start() noexcept override;
    void stop() noexcept override;
    void cleanup() noexcept override;
    void request_stop() noexcept override;
    [[nodiscard]] bool stop_requested() const noexcept override;

    rtio_aux_task create_auxiliary_task(rtio_aux_callback callback,
                                        int priority,
                                        const char* name,
                                        void* arg) noexcept override;
    rtio_status_t schedule_auxiliary_task(rtio_aux_task task) noexcept override;

    rtio_midi midi_open(const char* port) noexcept override;
    [[nodiscard]] int midi_available(rtio_midi port) noexcept override;
    int midi_get_message(rtio_midi port, uint8_t* buffer) noexcept override;
    void midi_close(rtio_midi port) noexcept override;

    // ─────────────────────────────────────────────────────────────────────────
    // Headless-Specific API
    // ─────────────────────────────────────────────────────────────────────────

    /// Replace the input generator (default leaves inputs at zero).
    void set_input_generator(InputGenerator generator);

    /// Sleep between periods in start() mode (default true).
    void set_realtime_pacing(bool enabled) noexcept { realtime_pacing_ = enabled; }

    /**
     * @brief Request a stop by the engine itself after @p periods renders.
     *
     * Zero disables the limit. Used to emulate an engine-reported stop.
     */
    void set_period_limit(uint64_t periods) noexcept { period_limit_ = periods; }

    /**
     * @brief Keep copies of the last @p limit audio output buffers.
     *
     * Zero (the default) disables capture. Discards history captured so
     * far; call before initialize() or between runs, not while started.
     */
    void set_history_limit(size_t limit);

    /// Set the name reported in rtio_context::project_name.
    void set_project_name(std::string name);

    /**
     * @brief Render @p count periods on the calling thread.
     * @return RTIO_ERR_NOT_INITIALIZED or RTIO_ERR_ALREADY_RUNNING on misuse
     */
    rtio_status_t run_periods(uint64_t count) noexcept;

    /// Register a MIDI port name so that midi_open() succeeds for it.
    void add_midi_port(std::string name);

    /// Queue a 1 to 3 byte message on a registered port.
    bool inject_midi(const std::string& port, std::span<const uint8_t> message);

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t render_count() const noexcept { return render_count_.load(); }
    [[nodiscard]] uint64_t cleanup_count() const noexcept { return cleanup_count_; }
    [[nodiscard]] size_t auxiliary_task_count() const;

    /// Descriptor as configured by initialize (dimensions and rates).
    [[nodiscard]] const rtio_context& context() const noexcept { return context_; }

    [[nodiscard]] std::vector<float> last_audio_out() const;
    [[nodiscard]] std::vector<uint32_t> last_digital() const;
    [[nodiscard]] std::vector<std::vector<float>> audio_out_history() const;

private:
    bool configure(const rtio_init_settings& settings);
    void render_period();
    void render_loop();
    void stop_auxiliary_tasks() noexcept;
    void release_buffers() noexcept;
    void reserve_history();

    rtio_init_settings settings_{};
    void* user_data_ = nullptr;
    rtio_context context_{};
    bool initialized_ = false;

    std::vector<float> audio_in_;
    std::vector<float> audio_out_;
    std::vector<float> analog_in_;
    std::vector<float> analog_out_;
    std::vector<uint32_t> digital_;
    std::vector<float> multiplexer_in_;
    uint32_t digital_reset_word_ = 0;
    std::string project_name_ = "headless";

    InputGenerator input_generator_;
    bool realtime_pacing_ = true;
    uint64_t period_limit_ = 0;

    std::thread render_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> render_count_{0};
    uint64_t cleanup_count_ = 0;

    mutable std::mutex tasks_mutex_;
    std::vector<std::unique_ptr<rtio_aux_task_impl>> tasks_;

    mutable std::mutex midi_mutex_;
    std::vector<std::unique_ptr<rtio_midi_impl>> midi_ports_;

    mutable std::mutex capture_mutex_;
    size_t history_limit_ = 0;
    std::vector<std::vector<float>> history_;
    size_t history_next_ = 0;
    size_t history_count_ = 0;
    std::vector<float> last_audio_out_;
    std::vector<uint32_t> last_digital_;
};

} // namespace rtio

#endif /* RTIO_HEADLESS_ENGINE_H */
