/**
 * @file test_headless_engine.cpp
 * @brief Unit tests for the headless rtio engine.
 *
 * Drives the engine through raw C callbacks, independent of the C++ core.
 */

#include <gtest/gtest.h>
#include "rtio/headless_engine.h"

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

using namespace rtio;

namespace {

struct Probe {
    int setups = 0;
    int cleanups = 0;
    bool accept = true;
    std::vector<uint64_t> elapsed_seen;
    std::vector<float> first_input_seen;
    rtio_aux_task task = nullptr;
    Engine* engine = nullptr;
    std::atomic<int> task_runs{0};
    float fill = 0.5f;
};

bool probe_setup(rtio_context*, void* user_data) {
    auto* p = static_cast<Probe*>(user_data);
    ++p->setups;
    return p->accept;
}

void probe_render(rtio_context* ctx, void* user_data) {
    auto* p = static_cast<Probe*>(user_data);
    p->elapsed_seen.push_back(ctx->audio_frames_elapsed);
    p->first_input_seen.push_back(ctx->audio_in[0]);
    const size_t n = static_cast<size_t>(ctx->audio_frames) * ctx->audio_out_channels;
    for (size_t i = 0; i < n; ++i) {
        ctx->audio_out[i] += p->fill;
    }
    if (p->task != nullptr) {
        p->engine->schedule_auxiliary_task(p->task);
    }
}

void probe_cleanup(rtio_context*, void* user_data) {
    ++static_cast<Probe*>(user_data)->cleanups;
}

void count_task_run(void* arg) {
    static_cast<Probe*>(arg)->task_runs.fetch_add(1);
}

/// A task that is still running when cleanup begins.
struct ShutdownOrder {
    Engine* engine = nullptr;
    rtio_aux_task task = nullptr;
    std::atomic<bool> task_started{false};
    std::atomic<bool> task_finished{false};
    bool finished_before_cleanup = false;
    int cleanups = 0;
};

bool order_setup(rtio_context*, void*) {
    return true;
}

void order_render(rtio_context*, void* user_data) {
    auto* o = static_cast<ShutdownOrder*>(user_data);
    o->engine->schedule_auxiliary_task(o->task);
}

void order_cleanup(rtio_context*, void* user_data) {
    auto* o = static_cast<ShutdownOrder*>(user_data);
    o->finished_before_cleanup = o->task_finished.load();
    ++o->cleanups;
}

void slow_task(void* arg) {
    auto* o = static_cast<ShutdownOrder*>(arg);
    o->task_started.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    o->task_finished.store(true);
}

/// Fills every output sample with the period's starting frame count.
void elapsed_render(rtio_context* ctx, void*) {
    const size_t n = static_cast<size_t>(ctx->audio_frames) * ctx->audio_out_channels;
    for (size_t i = 0; i < n; ++i) {
        ctx->audio_out[i] = static_cast<float>(ctx->audio_frames_elapsed);
    }
}

template<typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
    return true;
}

} // anonymous namespace

class HeadlessEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        rtio_default_settings(&settings);
        settings.setup = probe_setup;
        settings.render = probe_render;
        settings.cleanup = probe_cleanup;
        probe.engine = &engine;
        engine.set_realtime_pacing(false);
    }

    rtio_init_settings settings{};
    Probe probe;
    HeadlessEngine engine;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(HeadlessEngineTest, DefaultSettingsGiveEightAnalogChannelsAtHalfRate) {
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    const rtio_context& ctx = engine.context();

    EXPECT_EQ(ctx.analog_frames, 16u);
    EXPECT_FLOAT_EQ(ctx.analog_sample_rate, 22050.0f);
    EXPECT_EQ(ctx.audio_frames, 32u);
    EXPECT_EQ(ctx.audio_in_channels, 2u);
    EXPECT_EQ(ctx.audio_out_channels, 2u);
    EXPECT_EQ(ctx.digital_frames, 32u);
    EXPECT_EQ(ctx.digital_channels, 16u);
    EXPECT_NE(ctx.flags & RTIO_FLAG_INTERLEAVED, 0u);
    EXPECT_NE(ctx.flags & RTIO_FLAG_ANALOG_OUTPUTS_PERSIST, 0u);
    EXPECT_STREQ(ctx.project_name, "headless");
    EXPECT_EQ(probe.setups, 1);
}

TEST_F(HeadlessEngineTest, FewerAnalogChannelsRaiseAnalogRate) {
    settings.num_analog_in_channels = 4;
    settings.num_analog_out_channels = 4;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    EXPECT_FLOAT_EQ(engine.context().analog_sample_rate, 44100.0f);
    EXPECT_EQ(engine.context().audio_frames, 16u);
}

TEST_F(HeadlessEngineTest, TwoAnalogChannelsRunAtDoubleRate) {
    settings.num_analog_in_channels = 2;
    settings.num_analog_out_channels = 2;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    EXPECT_FLOAT_EQ(engine.context().analog_sample_rate, 88200.0f);
    EXPECT_EQ(engine.context().audio_frames, 8u);
}

TEST_F(HeadlessEngineTest, WithoutAnalogPeriodCountsAudioFrames) {
    settings.use_analog = 0;
    settings.period_size = 4;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    EXPECT_EQ(engine.context().audio_frames, 4u);
    EXPECT_EQ(engine.context().analog_frames, 0u);
    EXPECT_EQ(engine.context().analog_in, nullptr);
}

TEST_F(HeadlessEngineTest, DigitalWordsStartAsLowInputs) {
    settings.use_analog = 0;
    settings.num_digital_channels = 4;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(1), RTIO_OK);

    const auto words = engine.last_digital();
    ASSERT_FALSE(words.empty());
    for (uint32_t w : words) {
        EXPECT_EQ(w, 0xFu);
    }
}

TEST_F(HeadlessEngineTest, ProjectNameIsConfigurable) {
    engine.set_project_name("ramp-test");
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    EXPECT_STREQ(engine.context().project_name, "ramp-test");
}

TEST_F(HeadlessEngineTest, RejectsInvalidSettings) {
    rtio_init_settings bad = settings;
    bad.render = nullptr;
    EXPECT_EQ(engine.initialize(bad, &probe), RTIO_ERR_INVALID_SETTINGS);

    bad = settings;
    bad.period_size = 0;
    EXPECT_EQ(engine.initialize(bad, &probe), RTIO_ERR_INVALID_SETTINGS);

    bad = settings;
    bad.num_mux_channels = 3;
    EXPECT_EQ(engine.initialize(bad, &probe), RTIO_ERR_INVALID_SETTINGS);

    bad = settings;
    bad.num_digital_channels = 17;
    EXPECT_EQ(engine.initialize(bad, &probe), RTIO_ERR_INVALID_SETTINGS);

    EXPECT_EQ(probe.setups, 0);
    EXPECT_FALSE(engine.is_initialized());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(HeadlessEngineTest, DecliningSetupLeavesEngineUninitialized) {
    probe.accept = false;
    EXPECT_EQ(engine.initialize(settings, &probe), RTIO_ERR_SETUP_DECLINED);
    EXPECT_FALSE(engine.is_initialized());
    EXPECT_EQ(engine.start(), RTIO_ERR_NOT_INITIALIZED);

    engine.cleanup();
    EXPECT_EQ(probe.cleanups, 0);
}

TEST_F(HeadlessEngineTest, InitializeTwiceFails) {
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    EXPECT_EQ(engine.initialize(settings, &probe), RTIO_ERR_ALREADY_INITIALIZED);
    EXPECT_EQ(probe.setups, 1);
}

TEST_F(HeadlessEngineTest, CleanupRunsCallbackOnce) {
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    engine.cleanup();
    engine.cleanup();
    EXPECT_EQ(probe.cleanups, 1);
    EXPECT_EQ(engine.cleanup_count(), 1u);
    EXPECT_FALSE(engine.is_initialized());
}

TEST_F(HeadlessEngineTest, RunPeriodsRequiresInitialization) {
    EXPECT_EQ(engine.run_periods(1), RTIO_ERR_NOT_INITIALIZED);
}

TEST_F(HeadlessEngineTest, RenderThreadStopsAtPeriodLimit) {
    engine.set_period_limit(5);
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.start(), RTIO_OK);
    EXPECT_EQ(engine.start(), RTIO_ERR_ALREADY_RUNNING);

    ASSERT_TRUE(wait_for([&] { return engine.stop_requested(); }));
    engine.stop();
    EXPECT_FALSE(engine.is_running());
    EXPECT_EQ(engine.render_count(), 5u);

    engine.cleanup();
    EXPECT_EQ(probe.cleanups, 1);
}

TEST_F(HeadlessEngineTest, RequestStopEndsRenderThread) {
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.start(), RTIO_OK);
    ASSERT_TRUE(wait_for([&] { return engine.render_count() > 0; }));

    engine.request_stop();
    EXPECT_TRUE(engine.stop_requested());
    engine.stop();
    EXPECT_FALSE(engine.is_running());
    engine.cleanup();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rendering
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(HeadlessEngineTest, ElapsedFramesAdvancePerPeriod) {
    settings.use_analog = 0;
    settings.period_size = 8;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(3), RTIO_OK);

    EXPECT_EQ(probe.elapsed_seen, (std::vector<uint64_t>{0, 8, 16}));
    EXPECT_EQ(engine.render_count(), 3u);
}

TEST_F(HeadlessEngineTest, AudioOutputIsClearedBeforeEachPeriod) {
    settings.use_analog = 0;
    settings.period_size = 4;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(3), RTIO_OK);

    for (float s : engine.last_audio_out()) {
        EXPECT_FLOAT_EQ(s, 0.5f);
    }
}

TEST_F(HeadlessEngineTest, InputGeneratorSeesPeriodIndex) {
    settings.use_analog = 0;
    settings.period_size = 4;
    engine.set_input_generator([](const InputBuffers& in, uint64_t period) {
        for (float& s : in.audio_in) {
            s = static_cast<float>(period);
        }
    });
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(3), RTIO_OK);

    EXPECT_EQ(probe.first_input_seen, (std::vector<float>{0.0f, 1.0f, 2.0f}));
}

TEST_F(HeadlessEngineTest, HistoryKeepsMostRecentPeriods) {
    settings.use_analog = 0;
    settings.period_size = 2;
    engine.set_history_limit(2);
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(5), RTIO_OK);

    const auto history = engine.audio_out_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].size(), 4u);
}

TEST_F(HeadlessEngineTest, HistoryRingKeepsOrderAfterWrapping) {
    settings.use_analog = 0;
    settings.period_size = 2;
    settings.render = elapsed_render;
    engine.set_history_limit(3);
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    ASSERT_EQ(engine.run_periods(5), RTIO_OK);

    const auto history = engine.audio_out_history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0], std::vector<float>(4, 4.0f));
    EXPECT_EQ(history[1], std::vector<float>(4, 6.0f));
    EXPECT_EQ(history[2], std::vector<float>(4, 8.0f));
    EXPECT_EQ(engine.last_audio_out(), std::vector<float>(4, 8.0f));
}

TEST_F(HeadlessEngineTest, NothingCapturedBeforeFirstPeriod) {
    settings.use_analog = 0;
    engine.set_history_limit(2);
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);

    EXPECT_TRUE(engine.last_audio_out().empty());
    EXPECT_TRUE(engine.last_digital().empty());
    EXPECT_TRUE(engine.audio_out_history().empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Auxiliary Tasks
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(HeadlessEngineTest, ScheduledTaskRunsOnWorker) {
    settings.use_analog = 0;
    ASSERT_EQ(engine.initialize(settings, &probe), RTIO_OK);
    probe.task = engine.create_auxiliary_task(count_task_run, 10, "probe-task", &probe);
    ASSERT_NE(probe.task, nullptr);
    EXPECT_EQ(engine.auxiliary_task_count(), 1u);

    ASSERT_EQ(engine.run_periods(1), RTIO_OK);
    EXPECT_TRUE(wait_for([&] { return probe.task_runs.load() >= 1; }));

    engine.cleanup();
    EXPECT_EQ(engine.auxiliary_task_count(), 0u);
}

TEST_F(HeadlessEngineTest, CleanupWaitsForRunningTaskBeforeCallback) {
    ShutdownOrder order;
    order.engine = &engine;
    settings.use_analog = 0;
    settings.setup = order_setup;
    settings.render = order_render;
    settings.cleanup = order_cleanup;
    ASSERT_EQ(engine.initialize(settings, &order), RTIO_OK);
    order.task = engine.create_auxiliary_task(slow_task, 10, "slow-task", &order);
    ASSERT_NE(order.task, nullptr);

    ASSERT_EQ(engine.run_periods(1), RTIO_OK);
    ASSERT_TRUE(wait_for([&] { return order.task_started.load(); }));

    engine.cleanup();

    EXPECT_EQ(order.cleanups, 1);
    EXPECT_TRUE(order.finished_before_cleanup);
    EXPECT_EQ(engine.auxiliary_task_count(), 0u);
}

TEST_F(HeadlessEngineTest, CleanupAfterStartedRunJoinsTasksFirst) {
    ShutdownOrder order;
    order.engine = &engine;
    settings.use_analog = 0;
    settings.setup = order_setup;
    settings.render = order_render;
    settings.cleanup = order_cleanup;
    ASSERT_EQ(engine.initialize(settings, &order), RTIO_OK);
    order.task = engine.create_auxiliary_task(slow_task, 10, "slow-task", &order);
    ASSERT_NE(order.task, nullptr);

    ASSERT_EQ(engine.start(), RTIO_OK);
    ASSERT_TRUE(wait_for([&] { return order.task_started.load(); }));
    engine.request_stop();
    engine.stop();
    engine.cleanup();

    EXPECT_EQ(order.cleanups, 1);
    EXPECT_TRUE(order.finished_before_cleanup);
}

TEST_F(HeadlessEngineTest, TaskCreationRejectsBadArguments) {
    EXPECT_EQ(engine.create_auxiliary_task(nullptr, 0, "x", nullptr), nullptr);
    EXPECT_EQ(engine.create_auxiliary_task(count_task_run, 0, nullptr, &probe), nullptr);
    EXPECT_EQ(engine.create_auxiliary_task(count_task_run, 0, "", &probe), nullptr);

    ASSERT_NE(engine.create_auxiliary_task(count_task_run, 0, "unique", &probe), nullptr);
    EXPECT_EQ(engine.create_auxiliary_task(count_task_run, 0, "unique", &probe), nullptr);
}

TEST_F(HeadlessEngineTest, SchedulingNullTaskFails) {
    EXPECT_EQ(engine.schedule_auxiliary_task(nullptr), RTIO_ERR_NULL_TASK);
}

// ═══════════════════════════════════════════════════════════════════════════════
// MIDI
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(HeadlessEngineTest, MidiPortDeliversInjectedMessages) {
    engine.add_midi_port("hw:0,0,0");
    rtio_midi port = engine.midi_open("hw:0,0,0");
    ASSERT_NE(port, nullptr);
    EXPECT_EQ(engine.midi_open("hw:0,0,0"), nullptr);

    const uint8_t note_on[] = {0x90, 64, 127};
    ASSERT_TRUE(engine.inject_midi("hw:0,0,0", note_on));
    EXPECT_EQ(engine.midi_available(port), 1);

    uint8_t buf[3] = {};
    EXPECT_EQ(engine.midi_get_message(port, buf), 3);
    EXPECT_EQ(buf[0], 0x90);
    EXPECT_EQ(engine.midi_get_message(port, buf), 0);

    engine.midi_close(port);
    EXPECT_NE(engine.midi_open("hw:0,0,0"), nullptr);
}

TEST_F(HeadlessEngineTest, MidiRejectsUnknownPortsAndBadMessages) {
    EXPECT_EQ(engine.midi_open("hw:5,0,0"), nullptr);

    engine.add_midi_port("hw:0,0,0");
    const uint8_t too_long[] = {1, 2, 3, 4};
    EXPECT_FALSE(engine.inject_midi("hw:0,0,0", too_long));
    EXPECT_FALSE(engine.inject_midi("hw:0,0,0", std::span<const uint8_t>{}));
    const uint8_t clock[] = {0xF8};
    EXPECT_FALSE(engine.inject_midi("hw:1,0,0", clock));
}

TEST(RtioAbiTest, StatusNames) {
    EXPECT_STREQ(rtio_status_name(RTIO_OK), "OK");
    EXPECT_STREQ(rtio_status_name(RTIO_ERR_SETUP_DECLINED), "ERR_SETUP_DECLINED");
    EXPECT_STREQ(rtio_status_name(-1000), "ERR_UNKNOWN");
}
