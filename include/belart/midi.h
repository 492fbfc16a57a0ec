/**
 * @file midi.h
 * @brief Sequential reader for an engine MIDI input port.
 *
 * Open the port while setting up and poll it from render:
 *
 *   auto port = belart::MidiPort::open(engine, "hw:0,0,0");
 *   ...
 *   std::array<uint8_t, 3> buf;
 *   while (auto msg = port.get_message(buf)) {
 *       if (((*msg)[0] & 0xF0) == 0x90) { ... note on ... }
 *   }
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/error.h"
#include "rtio/engine.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace belart {

class MidiPort {
public:
    /// Largest message delivered by get_message().
    static constexpr size_t kMaxMessageSize = 3;

    using Buffer = std::array<uint8_t, kMaxMessageSize>;

    /**
     * @brief Open @p port on @p engine.
     * @return The open port, or PortOpenFailed
     */
    [[nodiscard]] static Result<MidiPort> open(rtio::Engine& engine, const char* port) noexcept;

    MidiPort(const MidiPort&) = delete;
    MidiPort& operator=(const MidiPort&) = delete;
    MidiPort(MidiPort&& other) noexcept;
    MidiPort& operator=(MidiPort&& other) noexcept;
    ~MidiPort();

    /// Messages waiting to be read.
    [[nodiscard]] int available() const noexcept;

    /**
     * @brief Read the next message into @p buffer.
     * @return View of the 1 to 3 bytes written, or nullopt if none waiting
     */
    [[nodiscard]] std::optional<std::span<const uint8_t>> get_message(Buffer& buffer) noexcept;

private:
    MidiPort(rtio::Engine& engine, rtio_midi handle) noexcept
        : engine_(&engine)
        , handle_(handle)
    {}

    void close() noexcept;

    rtio::Engine* engine_;
    rtio_midi handle_;
};

} // namespace belart
