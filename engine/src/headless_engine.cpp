/**
 * @file headless_engine.cpp
 * @brief Software implementation of the rtio engine contract.
 *
 * Thread model mirrors the hardware engine:
 * - one render thread (start mode) or the caller's thread (run_periods)
 * - one worker thread per auxiliary task, woken through an atomic counter
 *
 * Scheduling never takes a lock: the render thread only increments the
 * task's pending counter and notifies the waiting worker.
 *
 * @copyright GPL-2.0-or-later
 */

#include "rtio/headless_engine.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstring>
#include <new>
#include <system_error>

// ═══════════════════════════════════════════════════════════════════════════════
// Opaque Handle Definitions
// ═══════════════════════════════════════════════════════════════════════════════

struct rtio_aux_task_impl {
    rtio_aux_callback callback = nullptr;
    void* arg = nullptr;
    int priority = 0;
    std::string name;
    std::atomic<uint32_t> pending{0};
    std::atomic<bool> stopping{false};
    std::thread worker;
};

struct rtio_midi_impl {
    struct Message {
        std::array<uint8_t, 3> bytes{};
        uint8_t length = 0;
    };

    std::string name;
    bool open = false;
    std::mutex mutex;
    std::deque<Message> messages;
};

namespace rtio {

namespace {

constexpr uint32_t kMaxAnalogChannels = 8;

void auxiliary_worker(rtio_aux_task_impl* task) noexcept {
    for (;;) {
        task->pending.wait(0, std::memory_order_acquire);
        if (task->stopping.load(std::memory_order_acquire)) {
            return;
        }
        // Several schedules before the worker wakes collapse into one run
        task->pending.exchange(0, std::memory_order_acq_rel);
        task->callback(task->arg);
    }
}

float analog_rate_for(uint32_t channels) noexcept {
    if (channels <= 2) return HeadlessEngine::kAudioSampleRate * 2.0f;
    if (channels <= 4) return HeadlessEngine::kAudioSampleRate;
    return HeadlessEngine::kAudioSampleRate / 2.0f;
}

bool valid_mux_channels(int32_t n) noexcept {
    return n == 0 || n == 2 || n == 4 || n == 8;
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

HeadlessEngine::HeadlessEngine() {
    rtio_default_settings(&settings_);
}

HeadlessEngine::~HeadlessEngine() {
    stop();
    stop_auxiliary_tasks();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

bool HeadlessEngine::configure(const rtio_init_settings& settings) {
    if (settings.period_size <= 0) return false;
    if (settings.num_digital_channels < 0 ||
        settings.num_digital_channels > RTIO_MAX_DIGITAL_CHANNELS) return false;
    if (settings.num_analog_in_channels < 0 ||
        settings.num_analog_in_channels > static_cast<int32_t>(kMaxAnalogChannels)) return false;
    if (settings.num_analog_out_channels < 0 ||
        settings.num_analog_out_channels > static_cast<int32_t>(kMaxAnalogChannels)) return false;
    if (!valid_mux_channels(settings.num_mux_channels)) return false;

    const auto period = static_cast<uint32_t>(settings.period_size);
    const auto analog_in = static_cast<uint32_t>(settings.num_analog_in_channels);
    const auto analog_out = static_cast<uint32_t>(settings.num_analog_out_channels);
    const bool use_analog = settings.use_analog != 0 && (analog_in > 0 || analog_out > 0);

    if (settings.num_mux_channels > 0 && !use_analog) return false;

    rtio_context ctx{};
    ctx.audio_in_channels = kAudioChannels;
    ctx.audio_out_channels = kAudioChannels;
    ctx.audio_sample_rate = kAudioSampleRate;

    if (use_analog) {
        ctx.analog_sample_rate = analog_rate_for(std::max(analog_in, analog_out));
        ctx.analog_frames = period;
        ctx.analog_in_channels = analog_in;
        ctx.analog_out_channels = analog_out;
        ctx.audio_frames = static_cast<uint32_t>(
            std::lround(period * kAudioSampleRate / ctx.analog_sample_rate));
    } else {
        ctx.audio_frames = period;
    }
    if (ctx.audio_frames == 0) return false;

    if (settings.use_digital != 0) {
        ctx.digital_frames = ctx.audio_frames;
        ctx.digital_channels = static_cast<uint32_t>(settings.num_digital_channels);
        ctx.digital_sample_rate = kAudioSampleRate;
    }

    ctx.multiplexer_channels = static_cast<uint32_t>(settings.num_mux_channels);
    ctx.multiplexer_starting_channel = 0;
    ctx.audio_expander_enabled =
        settings.audio_expander_inputs | settings.audio_expander_outputs;

    if (settings.interleave) ctx.flags |= RTIO_FLAG_INTERLEAVED;
    if (settings.analog_outputs_persist) ctx.flags |= RTIO_FLAG_ANALOG_OUTPUTS_PERSIST;
    if (settings.detect_underruns) ctx.flags |= RTIO_FLAG_DETECT_UNDERRUNS;
    ctx.flags |= RTIO_FLAG_OFFLINE;

    audio_in_.assign(static_cast<size_t>(ctx.audio_frames) * ctx.audio_in_channels, 0.0f);
    audio_out_.assign(static_cast<size_t>(ctx.audio_frames) * ctx.audio_out_channels, 0.0f);
    analog_in_.assign(static_cast<size_t>(ctx.analog_frames) * ctx.analog_in_channels, 0.0f);
    analog_out_.assign(static_cast<size_t>(ctx.analog_frames) * ctx.analog_out_channels, 0.0f);
    digital_.assign(ctx.digital_frames, 0u);
    multiplexer_in_.assign(
        static_cast<size_t>(ctx.analog_in_channels) * ctx.multiplexer_channels, 0.0f);

    // Every configured pin starts as an input (direction bit set), level low
    digital_reset_word_ = ctx.digital_channels == 0 ? 0u : ((1u << ctx.digital_channels) - 1u);
    std::fill(digital_.begin(), digital_.end(), digital_reset_word_);

    ctx.audio_in = audio_in_.empty() ? nullptr : audio_in_.data();
    ctx.audio_out = audio_out_.empty() ? nullptr : audio_out_.data();
    ctx.analog_in = analog_in_.empty() ? nullptr : analog_in_.data();
    ctx.analog_out = analog_out_.empty() ? nullptr : analog_out_.data();
    ctx.digital = digital_.empty() ? nullptr : digital_.data();
    ctx.multiplexer_analog_in = multiplexer_in_.empty() ? nullptr : multiplexer_in_.data();

    const size_t name_len = std::min(project_name_.size(), size_t{RTIO_PROJECT_NAME_LEN - 1});
    std::memcpy(ctx.project_name, project_name_.data(), name_len);
    ctx.project_name[name_len] = '\0';

    context_ = ctx;
    settings_ = settings;

    std::lock_guard<std::mutex> lock(capture_mutex_);
    last_audio_out_.assign(audio_out_.size(), 0.0f);
    last_digital_.assign(digital_.size(), digital_reset_word_);
    reserve_history();
    return true;
}

rtio_status_t HeadlessEngine::initialize(const rtio_init_settings& settings,
                                         void* user_data) noexcept {
    if (initialized_) {
        return RTIO_ERR_ALREADY_INITIALIZED;
    }
    if (settings.render == nullptr) {
        return RTIO_ERR_INVALID_SETTINGS;
    }

    try {
        if (!configure(settings)) {
            release_buffers();
            return RTIO_ERR_INVALID_SETTINGS;
        }
    } catch (const std::bad_alloc&) {
        release_buffers();
        return RTIO_ERR_OUT_OF_MEMORY;
    }

    user_data_ = user_data;
    stop_requested_.store(false);
    render_count_.store(0);
    cleanup_count_ = 0;

    if (settings_.setup != nullptr && !settings_.setup(&context_, user_data_)) {
        stop_auxiliary_tasks();
        release_buffers();
        user_data_ = nullptr;
        return RTIO_ERR_SETUP_DECLINED;
    }

    initialized_ = true;
    return RTIO_OK;
}

rtio_status_t HeadlessEngine::start() noexcept {
    if (!initialized_) {
        return RTIO_ERR_NOT_INITIALIZED;
    }
    if (running_.load()) {
        return RTIO_ERR_ALREADY_RUNNING;
    }

    running_.store(true);
    try {
        render_thread_ = std::thread(&HeadlessEngine::render_loop, this);
    } catch (const std::system_error&) {
        running_.store(false);
        return RTIO_ERR_INTERNAL;
    }
    return RTIO_OK;
}

void HeadlessEngine::stop() noexcept {
    if (render_thread_.joinable()) {
        stop_requested_.store(true);
        render_thread_.join();
    }
    running_.store(false);
}

void HeadlessEngine::cleanup() noexcept {
    if (!initialized_) {
        return;
    }
    stop();
    // Workers may still be inside a task that touches the application
    stop_auxiliary_tasks();

    if (settings_.cleanup != nullptr) {
        settings_.cleanup(&context_, user_data_);
    }
    ++cleanup_count_;

    {
        std::lock_guard<std::mutex> lock(midi_mutex_);
        for (auto& port : midi_ports_) {
            std::lock_guard<std::mutex> port_lock(port->mutex);
            port->open = false;
            port->messages.clear();
        }
    }
    release_buffers();
    user_data_ = nullptr;
    initialized_ = false;
}

void HeadlessEngine::request_stop() noexcept {
    stop_requested_.store(true, std::memory_order_relaxed);
}

bool HeadlessEngine::stop_requested() const noexcept {
    return stop_requested_.load(std::memory_order_relaxed);
}

// ─────────────────────────────────────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────────────────────────────────────

void HeadlessEngine::render_period() {
    std::fill(audio_out_.begin(), audio_out_.end(), 0.0f);
    if ((context_.flags & RTIO_FLAG_ANALOG_OUTPUTS_PERSIST) == 0) {
        std::fill(analog_out_.begin(), analog_out_.end(), 0.0f);
    }
    std::fill(digital_.begin(), digital_.end(), digital_reset_word_);

    const uint64_t period = render_count_.load();
    if (input_generator_) {
        input_generator_(InputBuffers{audio_in_, analog_in_, digital_, multiplexer_in_}, period);
    }

    settings_.render(&context_, user_data_);
    context_.audio_frames_elapsed += context_.audio_frames;

    {
        // Buffers were sized by configure(); copying never allocates
        std::lock_guard<std::mutex> lock(capture_mutex_);
        std::copy(audio_out_.begin(), audio_out_.end(), last_audio_out_.begin());
        std::copy(digital_.begin(), digital_.end(), last_digital_.begin());
        if (!history_.empty()) {
            std::copy(audio_out_.begin(), audio_out_.end(), history_[history_next_].begin());
            history_next_ = (history_next_ + 1) % history_.size();
            history_count_ = std::min(history_count_ + 1, history_.size());
        }
    }

    const uint64_t rendered = render_count_.fetch_add(1) + 1;
    if (period_limit_ != 0 && rendered >= period_limit_) {
        request_stop();
    }
}

void HeadlessEngine::render_loop() {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(context_.audio_frames / context_.audio_sample_rate));

    auto next = clock::now();
    while (!stop_requested_.load(std::memory_order_relaxed)) {
        render_period();
        if (realtime_pacing_) {
            next += period;
            std::this_thread::sleep_until(next);
        }
    }
}

rtio_status_t HeadlessEngine::run_periods(uint64_t count) noexcept {
    if (!initialized_) {
        return RTIO_ERR_NOT_INITIALIZED;
    }
    if (running_.load()) {
        return RTIO_ERR_ALREADY_RUNNING;
    }
    try {
        for (uint64_t i = 0; i < count && !stop_requested(); ++i) {
            render_period();
        }
    } catch (const std::exception&) {
        return RTIO_ERR_INTERNAL;
    }
    return RTIO_OK;
}

// ─────────────────────────────────────────────────────────────────────────────
// Auxiliary Tasks
// ─────────────────────────────────────────────────────────────────────────────

rtio_aux_task HeadlessEngine::create_auxiliary_task(rtio_aux_callback callback,
                                                    int priority,
                                                    const char* name,
                                                    void* arg) noexcept {
    if (callback == nullptr || name == nullptr || name[0] == '\0') {
        return nullptr;
    }

    try {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        // Task names are global identifiers on the target system
        const bool duplicate = std::any_of(tasks_.begin(), tasks_.end(),
            [name](const auto& t) { return t->name == name; });
        if (duplicate) {
            return nullptr;
        }

        auto task = std::make_unique<rtio_aux_task_impl>();
        task->callback = callback;
        task->arg = arg;
        task->priority = priority;
        task->name = name;
        task->worker = std::thread(auxiliary_worker, task.get());

        rtio_aux_task handle = task.get();
        tasks_.push_back(std::move(task));
        return handle;
    } catch (const std::exception&) {
        return nullptr;
    }
}

rtio_status_t HeadlessEngine::schedule_auxiliary_task(rtio_aux_task task) noexcept {
    if (task == nullptr) {
        return RTIO_ERR_NULL_TASK;
    }
    if (task->stopping.load(std::memory_order_acquire)) {
        return RTIO_ERR_TASK_STOPPED;
    }
    task->pending.fetch_add(1, std::memory_order_release);
    task->pending.notify_one();
    return RTIO_OK;
}

void HeadlessEngine::stop_auxiliary_tasks() noexcept {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    for (auto& task : tasks_) {
        task->stopping.store(true, std::memory_order_release);
        task->pending.fetch_add(1, std::memory_order_release);
        task->pending.notify_one();
        if (task->worker.joinable()) {
            task->worker.join();
        }
    }
    tasks_.clear();
}

size_t HeadlessEngine::auxiliary_task_count() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return tasks_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// MIDI
// ─────────────────────────────────────────────────────────────────────────────

void HeadlessEngine::add_midi_port(std::string name) {
    std::lock_guard<std::mutex> lock(midi_mutex_);
    for (const auto& port : midi_ports_) {
        if (port->name == name) {
            return;
        }
    }
    auto port = std::make_unique<rtio_midi_impl>();
    port->name = std::move(name);
    midi_ports_.push_back(std::move(port));
}

bool HeadlessEngine::inject_midi(const std::string& port_name,
                                 std::span<const uint8_t> message) {
    if (message.empty() || message.size() > 3) {
        return false;
    }
    std::lock_guard<std::mutex> lock(midi_mutex_);
    for (auto& port : midi_ports_) {
        if (port->name == port_name) {
            rtio_midi_impl::Message msg;
            std::copy(message.begin(), message.end(), msg.bytes.begin());
            msg.length = static_cast<uint8_t>(message.size());
            std::lock_guard<std::mutex> port_lock(port->mutex);
            port->messages.push_back(msg);
            return true;
        }
    }
    return false;
}

rtio_midi HeadlessEngine::midi_open(const char* port_name) noexcept {
    if (port_name == nullptr) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(midi_mutex_);
    for (auto& port : midi_ports_) {
        if (port->name == port_name && !port->open) {
            port->open = true;
            return port.get();
        }
    }
    return nullptr;
}

int HeadlessEngine::midi_available(rtio_midi port) noexcept {
    if (port == nullptr) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(port->mutex);
    return static_cast<int>(port->messages.size());
}

int HeadlessEngine::midi_get_message(rtio_midi port, uint8_t* buffer) noexcept {
    if (port == nullptr || buffer == nullptr) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(port->mutex);
    if (port->messages.empty()) {
        return 0;
    }
    const auto msg = port->messages.front();
    port->messages.pop_front();
    std::memcpy(buffer, msg.bytes.data(), msg.length);
    return msg.length;
}

void HeadlessEngine::midi_close(rtio_midi port) noexcept {
    if (port == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(port->mutex);
    port->open = false;
    port->messages.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Capture & Configuration
// ─────────────────────────────────────────────────────────────────────────────

void HeadlessEngine::set_input_generator(InputGenerator generator) {
    input_generator_ = std::move(generator);
}

void HeadlessEngine::set_history_limit(size_t limit) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    history_limit_ = limit;
    reserve_history();
}

void HeadlessEngine::reserve_history() {
    history_.assign(history_limit_, std::vector<float>(audio_out_.size(), 0.0f));
    history_next_ = 0;
    history_count_ = 0;
}

void HeadlessEngine::set_project_name(std::string name) {
    project_name_ = std::move(name);
}

std::vector<float> HeadlessEngine::last_audio_out() const {
    if (render_count_.load() == 0) {
        return {};
    }
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return last_audio_out_;
}

std::vector<uint32_t> HeadlessEngine::last_digital() const {
    if (render_count_.load() == 0) {
        return {};
    }
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return last_digital_;
}

std::vector<std::vector<float>> HeadlessEngine::audio_out_history() const {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    std::vector<std::vector<float>> ordered;
    ordered.reserve(history_count_);
    const size_t oldest = (history_next_ + history_.size() - history_count_) % std::max<size_t>(history_.size(), 1);
    for (size_t i = 0; i < history_count_; ++i) {
        ordered.push_back(history_[(oldest + i) % history_.size()]);
    }
    return ordered;
}

void HeadlessEngine::release_buffers() noexcept {
    audio_in_.clear();
    audio_out_.clear();
    analog_in_.clear();
    analog_out_.clear();
    digital_.clear();
    multiplexer_in_.clear();
    context_ = rtio_context{};
}

} // namespace rtio
