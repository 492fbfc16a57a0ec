/**
 * @file test_context.cpp
 * @brief Unit tests for phase-restricted contexts and buffer views.
 */

#include <gtest/gtest.h>
#include "belart/context.h"
#include "mock_engine.h"

#include <concepts>
#include <cstring>
#include <type_traits>

using namespace belart;
using belart::test::MockEngine;

// ═══════════════════════════════════════════════════════════════════════════════
// Compile-Time Capabilities
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

template<typename C>
concept HasBufferViews = requires(C& c) {
    c.audio_in();
    c.audio_out();
    c.analog_in();
    c.analog_out();
    c.digital();
    c.multiplexer_analog_in();
};

template<typename C>
concept HasDigitalIo = requires(C& c) {
    c.digital_read(size_t{0}, 0u);
    c.digital_write(size_t{0}, 0u, true);
    c.digital_write_once(size_t{0}, 0u, true);
    c.pin_mode(size_t{0}, 0u, DigitalDirection::Input);
    c.pin_mode_once(size_t{0}, 0u, DigitalDirection::Input);
};

template<typename C>
concept CanSchedule = requires(C& c, const AuxiliaryTask& t) {
    c.schedule_auxiliary_task(t);
};

template<typename C>
concept CanCreateTasks = requires(C& c) {
    c.create_auxiliary_task([] {}, 0, "name");
};

template<typename C>
concept HasIntrospection = requires(const C& c) {
    c.audio_frames();
    c.audio_in_channels();
    c.audio_out_channels();
    c.audio_sample_rate();
    c.analog_frames();
    c.digital_channels();
    c.audio_frames_elapsed();
    c.multiplexer_channels();
    c.project_name();
};

} // anonymous namespace

static_assert(!HasBufferViews<SetupContext>);
static_assert(!HasDigitalIo<SetupContext>);
static_assert(!CanSchedule<SetupContext>);
static_assert(CanCreateTasks<SetupContext>);
static_assert(HasIntrospection<SetupContext>);

static_assert(HasBufferViews<RenderContext>);
static_assert(HasDigitalIo<RenderContext>);
static_assert(CanSchedule<RenderContext>);
static_assert(!CanCreateTasks<RenderContext>);
static_assert(HasIntrospection<RenderContext>);

static_assert(!std::is_copy_constructible_v<RenderContext>);
static_assert(!std::is_move_constructible_v<RenderContext>);
static_assert(!std::is_copy_constructible_v<SetupContext>);
static_assert(!std::is_move_constructible_v<SetupContext>);

static_assert(std::is_same_v<decltype(std::declval<RenderContext&>().audio_in()),
                             std::span<const float>>);
static_assert(std::is_same_v<decltype(std::declval<RenderContext&>().audio_out()),
                             std::span<float>>);

// ═══════════════════════════════════════════════════════════════════════════════
// Runtime Behaviour
// ═══════════════════════════════════════════════════════════════════════════════

class ContextTest : public ::testing::Test {
protected:
    MockEngine engine;
};

TEST_F(ContextTest, IntrospectionReadsDescriptor) {
    engine.configure(16, 2, 8);
    engine.context().audio_frames_elapsed = 320;
    engine.context().multiplexer_channels = 4;
    engine.context().flags = RTIO_FLAG_INTERLEAVED | RTIO_FLAG_ANALOG_OUTPUTS_PERSIST;

    SetupContext ctx(engine.context(), engine);
    EXPECT_EQ(ctx.audio_frames(), 16u);
    EXPECT_EQ(ctx.audio_in_channels(), 2u);
    EXPECT_EQ(ctx.audio_out_channels(), 2u);
    EXPECT_FLOAT_EQ(ctx.audio_sample_rate(), 44100.0f);
    EXPECT_EQ(ctx.digital_frames(), 16u);
    EXPECT_EQ(ctx.digital_channels(), 8u);
    EXPECT_EQ(ctx.audio_frames_elapsed(), 320u);
    EXPECT_EQ(ctx.multiplexer_channels(), 4u);
    EXPECT_TRUE(ctx.is_interleaved());
    EXPECT_TRUE(ctx.analog_outputs_persist());
    EXPECT_EQ(ctx.project_name(), "mock");
}

TEST_F(ContextTest, AudioInUsesInputChannelCount) {
    engine.configure(4, 2);
    engine.context().audio_in_channels = 1;

    RenderContext ctx(engine.context(), engine);
    EXPECT_EQ(ctx.audio_in().size(), 4u);
    EXPECT_EQ(ctx.audio_out().size(), 8u);
}

TEST_F(ContextTest, NullRegionYieldsEmptyView) {
    RenderContext ctx(engine.context(), engine);
    EXPECT_TRUE(ctx.analog_in().empty());
    EXPECT_TRUE(ctx.analog_out().empty());
    EXPECT_TRUE(ctx.multiplexer_analog_in().empty());
    EXPECT_EQ(ctx.digital().size(), 4u);
}

TEST_F(ContextTest, ViewsAliasEngineMemory) {
    RenderContext ctx(engine.context(), engine);
    auto out = ctx.audio_out();
    out[3] = 0.25f;
    EXPECT_FLOAT_EQ(engine.audio_out()[3], 0.25f);

    engine.audio_in()[1] = -0.5f;
    EXPECT_FLOAT_EQ(ctx.audio_in()[1], -0.5f);
}

TEST_F(ContextTest, ViewsFollowDescriptorChanges) {
    RenderContext ctx(engine.context(), engine);
    EXPECT_EQ(ctx.audio_out().size(), 8u);

    engine.context().audio_frames = 2;
    EXPECT_EQ(ctx.audio_out().size(), 4u);
}

TEST_F(ContextTest, DigitalMembersForwardToCodec) {
    RenderContext ctx(engine.context(), engine);
    ctx.pin_mode(0, 0, DigitalDirection::Output);
    ctx.digital_write(2, 0, true);
    ctx.digital_write_once(2, 0, false);
    ctx.pin_mode_once(1, 1, DigitalDirection::Input);

    EXPECT_FALSE(ctx.digital_read(2, 0));
    EXPECT_TRUE(ctx.digital_read(3, 0));
    EXPECT_EQ(pin_direction(ctx.digital(), 1, 1), DigitalDirection::Input);
    EXPECT_EQ(pin_direction(ctx.digital(), 2, 1), DigitalDirection::Output);
}

TEST_F(ContextTest, ProjectNameStopsAtTerminator) {
    std::memset(engine.context().project_name, 0, RTIO_PROJECT_NAME_LEN);
    std::memcpy(engine.context().project_name, "ab\0cd", 5);

    SetupContext ctx(engine.context(), engine);
    EXPECT_EQ(ctx.project_name(), "ab");
}
