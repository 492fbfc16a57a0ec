/**
 * @file test_lifecycle.cpp
 * @brief Unit tests for UserData transitions and the callback trampolines.
 */

#include <gtest/gtest.h>
#include "belart/lifecycle.h"
#include "log_capture.h"
#include "mock_engine.h"

#include <optional>
#include <stdexcept>

using namespace belart;
using belart::test::LogCapture;
using belart::test::MockEngine;

namespace {

struct Counters {
    int constructed = 0;
    int renders = 0;
    int destroyed = 0;
};

struct CountingApp {
    Counters* counters;

    explicit CountingApp(Counters* c) : counters(c) { ++counters->constructed; }
    CountingApp(CountingApp&& other) noexcept : counters(std::exchange(other.counters, nullptr)) {}
    ~CountingApp() {
        if (counters) {
            ++counters->destroyed;
        }
    }

    void render(RenderContext& ctx) noexcept {
        ++counters->renders;
        for (float& s : ctx.audio_out()) {
            s = 1.0f;
        }
    }
};

struct ThrowingRender {
    void render(RenderContext&) { throw std::runtime_error("not allowed"); }
};

struct NoRender {};

} // anonymous namespace

static_assert(Application<CountingApp>);
static_assert(!Application<ThrowingRender>);
static_assert(!Application<NoRender>);

static_assert(ApplicationConstructor<decltype([](SetupContext&) -> std::optional<CountingApp> {
    return std::nullopt;
})>);
static_assert(!ApplicationConstructor<decltype([](SetupContext&) { return 1; })>);
static_assert(!ApplicationConstructor<decltype([](SetupContext&) -> std::optional<ThrowingRender> {
    return std::nullopt;
})>);

class LifecycleTest : public ::testing::Test {
protected:
    MockEngine engine;
    LogCapture logs;
    Counters counters;

    auto producing_constructor() {
        return [c = &counters](SetupContext&) -> std::optional<CountingApp> {
            return CountingApp{c};
        };
    }

    template<typename F>
    rtio_init_settings settings_for() {
        rtio_init_settings raw;
        rtio_default_settings(&raw);
        Lifecycle<F>::install(raw);
        return raw;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// UserData State Machine
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LifecycleTest, StartsInConstructorState) {
    UserData data(producing_constructor());
    EXPECT_TRUE(data.holds_constructor());
    EXPECT_FALSE(data.holds_application());
    EXPECT_FALSE(data.is_none());
    EXPECT_EQ(data.application(), nullptr);
}

TEST_F(LifecycleTest, ProducedValueBecomesApplication) {
    UserData data(producing_constructor());
    SetupContext ctx(engine.context(), engine);

    EXPECT_TRUE(data.setup(ctx));
    EXPECT_TRUE(data.holds_application());
    ASSERT_NE(data.application(), nullptr);
    EXPECT_EQ(counters.constructed, 1);
}

TEST_F(LifecycleTest, DecliningConstructorEndsInNone) {
    bool invoked = false;
    UserData data([&invoked](SetupContext&) -> std::optional<CountingApp> {
        invoked = true;
        return std::nullopt;
    });
    SetupContext ctx(engine.context(), engine);

    EXPECT_FALSE(data.setup(ctx));
    EXPECT_TRUE(invoked);
    EXPECT_TRUE(data.is_none());
    EXPECT_FALSE(data.holds_constructor());
}

TEST_F(LifecycleTest, ThrowingConstructorIsContained) {
    UserData data([](SetupContext&) -> std::optional<CountingApp> {
        throw std::runtime_error("no codec");
    });
    SetupContext ctx(engine.context(), engine);

    EXPECT_FALSE(data.setup(ctx));
    EXPECT_TRUE(data.is_none());
    EXPECT_EQ(logs.count(BELART_LOG_ERROR, "SETUP"), 1u);
}

TEST_F(LifecycleTest, FatalAssertInConstructorIsContained) {
    UserData data([](SetupContext& ctx) -> std::optional<CountingApp> {
        BELART_ASSERT(ctx.audio_out_channels() > 8, "need more than 8 outputs");
        return std::nullopt;
    });
    SetupContext ctx(engine.context(), engine);

    EXPECT_FALSE(data.setup(ctx));
    EXPECT_TRUE(data.is_none());
    EXPECT_EQ(logs.count(BELART_LOG_ERROR, "SETUP"), 1u);
}

TEST_F(LifecycleTest, ConstructorRunsOnlyOnce) {
    int calls = 0;
    UserData data([&calls, c = &counters](SetupContext&) -> std::optional<CountingApp> {
        ++calls;
        return CountingApp{c};
    });
    SetupContext ctx(engine.context(), engine);

    EXPECT_TRUE(data.setup(ctx));
    EXPECT_FALSE(data.setup(ctx));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(data.holds_application());
}

TEST_F(LifecycleTest, CleanupDestroysApplicationOnce) {
    UserData data(producing_constructor());
    SetupContext ctx(engine.context(), engine);
    ASSERT_TRUE(data.setup(ctx));

    data.cleanup();
    EXPECT_TRUE(data.is_none());
    EXPECT_EQ(counters.destroyed, 1);

    data.cleanup();
    EXPECT_EQ(counters.destroyed, 1);
}

TEST_F(LifecycleTest, RenderWithoutApplicationIsNoOp) {
    UserData data([](SetupContext&) -> std::optional<CountingApp> { return std::nullopt; });
    SetupContext setup(engine.context(), engine);
    data.setup(setup);

    RenderContext render(engine.context(), engine);
    data.render(render);
    EXPECT_EQ(engine.audio_out()[0], 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Trampolines
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(LifecycleTest, TrampolinesDriveApplication) {
    using Ctor = decltype(producing_constructor());
    CallbackState<Ctor> state(engine, producing_constructor());
    auto raw = settings_for<Ctor>();

    ASSERT_EQ(engine.initialize(raw, &state), RTIO_OK);
    EXPECT_TRUE(state.user_data.holds_application());

    engine.render_once();
    engine.render_once();
    EXPECT_EQ(counters.renders, 2);
    EXPECT_EQ(engine.audio_out()[0], 1.0f);

    engine.cleanup();
    EXPECT_TRUE(state.user_data.is_none());
    EXPECT_EQ(counters.destroyed, 1);
}

TEST_F(LifecycleTest, SetupTrampolineReportsDecline) {
    auto ctor = [](SetupContext&) -> std::optional<CountingApp> { return std::nullopt; };
    CallbackState<decltype(ctor)> state(engine, ctor);
    auto raw = settings_for<decltype(ctor)>();

    EXPECT_EQ(engine.initialize(raw, &state), RTIO_ERR_SETUP_DECLINED);
    EXPECT_TRUE(state.user_data.is_none());
}

TEST_F(LifecycleTest, SetupTrampolineGivesAccessToTaskCreation) {
    auto ctor = [c = &counters](SetupContext& ctx) -> std::optional<CountingApp> {
        auto task = ctx.create_auxiliary_task([] {}, 1, "from-setup");
        if (!task) {
            return std::nullopt;
        }
        return CountingApp{c};
    };
    CallbackState<decltype(ctor)> state(engine, ctor);
    auto raw = settings_for<decltype(ctor)>();

    EXPECT_EQ(engine.initialize(raw, &state), RTIO_OK);
    EXPECT_EQ(engine.tasks.size(), 1u);
}
