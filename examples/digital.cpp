/**
 * @file digital.cpp
 * @brief Blinks digital pin 0: high for 10 ms out of every 100 ms.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/belart.h"
#include "rtio/headless_engine.h"

#include <cstdio>
#include <optional>

namespace {

class Blink {
public:
    void render(belart::RenderContext& ctx) noexcept {
        ctx.pin_mode(0, 0, belart::DigitalDirection::Output);
        const auto on_frames = static_cast<size_t>(ctx.digital_sample_rate() / 100.0f);
        const auto cycle_frames = static_cast<size_t>(ctx.digital_sample_rate() / 10.0f);
        for (size_t f = 0; f < ctx.digital_frames(); ++f) {
            ctx.digital_write_once(f, 0, counter_ < on_frames);
            if (++counter_ > cycle_frames) {
                counter_ = 0;
            }
        }
    }

private:
    size_t counter_ = 0;
};

} // anonymous namespace

int main() {
    rtio::HeadlessEngine engine;
    auto result = belart::Runtime(
            [](belart::SetupContext&) { return std::optional<Blink>(Blink{}); },
            engine)
        .run();
    if (!result) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        return 1;
    }
    return 0;
}
