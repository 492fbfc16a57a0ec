/**
 * @file hello.cpp
 * @brief 110 Hz sawtooth on every output channel until Ctrl-C.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/belart.h"
#include "rtio/headless_engine.h"

#include <cstdio>
#include <optional>

namespace {

class Sawtooth {
public:
    void render(belart::RenderContext& ctx) noexcept {
        constexpr float gain = 0.5f;
        const float period = ctx.audio_sample_rate() / 110.0f;
        for (float& sample : ctx.audio_out()) {
            sample = gain * (2.0f * (static_cast<float>(phase_) / period) - 1.0f);
            if (static_cast<float>(++phase_) > period) {
                phase_ = 0;
            }
        }
    }

private:
    size_t phase_ = 0;
};

} // anonymous namespace

int main() {
    auto settings = belart::SettingsBuilder()
        .verbose(true)
        .with_dac_level(-6.0f)
        .high_performance_mode(true)
        .build();
    if (!settings) {
        std::fprintf(stderr, "%s\n", settings.error().format().c_str());
        return 1;
    }

    rtio::HeadlessEngine engine;
    auto result = belart::Runtime(
            [](belart::SetupContext&) { return std::optional<Sawtooth>(Sawtooth{}); },
            engine)
        .with_settings(*settings)
        .run();
    if (!result) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        return 1;
    }
    return 0;
}
