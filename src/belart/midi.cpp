/**
 * @file midi.cpp
 * @brief MidiPort implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/midi.h"
#include "belart/logging.h"

#include <utility>

namespace belart {

Result<MidiPort> MidiPort::open(rtio::Engine& engine, const char* port) noexcept {
    rtio_midi handle = engine.midi_open(port);
    if (handle == nullptr) {
        BELART_LOG_WARN("MIDI", "could not open port %s", port ? port : "(null)");
        BELART_FAIL(PortOpenFailed, "engine midi_open() failed");
    }
    return MidiPort{engine, handle};
}

MidiPort::MidiPort(MidiPort&& other) noexcept
    : engine_(other.engine_)
    , handle_(std::exchange(other.handle_, nullptr))
{}

MidiPort& MidiPort::operator=(MidiPort&& other) noexcept {
    if (this != &other) {
        close();
        engine_ = other.engine_;
        handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
}

MidiPort::~MidiPort() {
    close();
}

void MidiPort::close() noexcept {
    if (handle_ != nullptr) {
        engine_->midi_close(handle_);
        handle_ = nullptr;
    }
}

int MidiPort::available() const noexcept {
    if (handle_ == nullptr) {
        return 0;
    }
    return engine_->midi_available(handle_);
}

std::optional<std::span<const uint8_t>> MidiPort::get_message(Buffer& buffer) noexcept {
    if (available() <= 0) {
        return std::nullopt;
    }
    const int len = engine_->midi_get_message(handle_, buffer.data());
    if (len <= 0 || len > static_cast<int>(kMaxMessageSize)) {
        return std::nullopt;
    }
    return std::span<const uint8_t>(buffer.data(), static_cast<size_t>(len));
}

} // namespace belart
