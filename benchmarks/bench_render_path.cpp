// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 belart Contributors
//
// Render Path Benchmarks

#include <benchmark/benchmark.h>
#include "belart/belart.h"
#include "rtio/headless_engine.h"
#include <memory>
#include <optional>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════
// Benchmark Fixtures
// ═══════════════════════════════════════════════════════════════════════════

namespace {

struct Passthrough {
    void render(belart::RenderContext& ctx) noexcept {
        auto in = ctx.audio_in();
        auto out = ctx.audio_out();
        for (size_t i = 0; i < out.size() && i < in.size(); ++i) {
            out[i] = in[i];
        }
    }
};

bool no_setup(rtio_context*, void*) { return true; }
void no_render(rtio_context*, void*) {}

} // anonymous namespace

class RenderBenchmark : public benchmark::Fixture {
public:
    void SetUp(const benchmark::State&) override {
        rtio_init_settings settings;
        rtio_default_settings(&settings);
        settings.use_analog = 0;
        settings.period_size = 16;
        settings.setup = no_setup;
        settings.render = no_render;
        engine = std::make_unique<rtio::HeadlessEngine>();
        initialized = engine->initialize(settings, nullptr) == RTIO_OK;
        raw = engine->context();
    }

    void TearDown(const benchmark::State&) override {
        engine->cleanup();
        engine.reset();
    }

    std::unique_ptr<rtio::HeadlessEngine> engine;
    rtio_context raw{};
    bool initialized = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// Digital Codec Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

static void BM_DigitalWriteFromFrame(benchmark::State& state) {
    std::vector<uint32_t> words(static_cast<size_t>(state.range(0)), 0u);

    for (auto _ : state) {
        belart::digital_write(words, 0, 3, true);
        belart::digital_write(words, words.size() / 2, 3, false);
        benchmark::DoNotOptimize(words.data());
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DigitalWriteFromFrame)->Arg(16)->Arg(128)->Arg(1024);

static void BM_DigitalReadAllChannels(benchmark::State& state) {
    std::vector<uint32_t> words(64, 0xA5A5A5A5u);

    for (auto _ : state) {
        unsigned high = 0;
        for (size_t f = 0; f < words.size(); ++f) {
            for (uint32_t c = 0; c < belart::kMaxDigitalChannels; ++c) {
                high += belart::digital_read(words, f, c) ? 1u : 0u;
            }
        }
        benchmark::DoNotOptimize(high);
    }
}
BENCHMARK(BM_DigitalReadAllChannels);

// ═══════════════════════════════════════════════════════════════════════════
// Context & Scheduling Benchmarks
// ═══════════════════════════════════════════════════════════════════════════

BENCHMARK_F(RenderBenchmark, BM_RenderContextPassthrough)(benchmark::State& state) {
    if (!initialized) {
        state.SkipWithError("engine initialization failed");
        return;
    }
    Passthrough app;

    for (auto _ : state) {
        belart::RenderContext ctx(raw, *engine);
        app.render(ctx);
        benchmark::DoNotOptimize(raw.audio_out);
    }

    state.SetItemsProcessed(state.iterations() * raw.audio_frames * raw.audio_out_channels);
}

BENCHMARK_F(RenderBenchmark, BM_ScheduleAuxiliaryTask)(benchmark::State& state) {
    if (!initialized) {
        state.SkipWithError("engine initialization failed");
        return;
    }
    belart::SetupContext setup(raw, *engine);
    auto task = setup.create_auxiliary_task([] {}, 0, "bench-task");
    if (!task) {
        state.SkipWithError("task creation failed");
        return;
    }

    belart::RenderContext ctx(raw, *engine);
    for (auto _ : state) {
        benchmark::DoNotOptimize(ctx.schedule_auxiliary_task(*task));
    }
}

BENCHMARK_F(RenderBenchmark, BM_HeadlessPeriod)(benchmark::State& state) {
    if (!initialized) {
        state.SkipWithError("engine initialization failed");
        return;
    }
    for (auto _ : state) {
        if (engine->run_periods(1) != RTIO_OK) {
            state.SkipWithError("render failed");
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * raw.audio_frames);
}

BENCHMARK_MAIN();
