/**
 * @file midi.cpp
 * @brief Holds a DC click for four periods on every MIDI note-on from hw:0,0,0.
 *
 * The headless engine has no hardware ports, so this registers one and
 * feeds it a few note-ons before running.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/belart.h"
#include "rtio/headless_engine.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <optional>

namespace {

constexpr const char* kPort = "hw:0,0,0";

class NoteClick {
public:
    explicit NoteClick(belart::MidiPort port)
        : port_(std::move(port))
    {}

    void render(belart::RenderContext& ctx) noexcept {
        belart::MidiPort::Buffer buffer{};
        while (auto message = port_.get_message(buffer)) {
            if (((*message)[0] & 0xF0) == 0x90 && message->size() == 3 && (*message)[2] > 0) {
                remaining_ = 4;
                level_ = static_cast<float>((*message)[2]) / 127.0f;
            }
        }

        const float value = remaining_ > 0 ? level_ : 0.0f;
        for (float& sample : ctx.audio_out()) {
            sample = value;
        }
        remaining_ = remaining_ > 0 ? remaining_ - 1 : 0;
    }

private:
    belart::MidiPort port_;
    int remaining_ = 0;
    float level_ = 0.0f;
};

} // anonymous namespace

int main() {
    rtio::HeadlessEngine engine;
    engine.add_midi_port(kPort);
    const std::array<uint8_t, 3> notes{60, 64, 67};
    for (uint8_t note : notes) {
        const uint8_t note_on[] = {0x90, note, 100};
        if (!engine.inject_midi(kPort, note_on)) {
            std::fprintf(stderr, "could not queue note %u\n", static_cast<unsigned>(note));
        }
    }

    auto constructor = [&engine](belart::SetupContext&) -> std::optional<NoteClick> {
        auto port = belart::MidiPort::open(engine, kPort);
        if (!port) {
            return std::nullopt;
        }
        return NoteClick(std::move(*port));
    };

    auto result = belart::Runtime(constructor, engine).run();
    if (!result) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        return 1;
    }
    return 0;
}
