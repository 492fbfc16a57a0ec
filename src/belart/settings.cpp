/**
 * @file settings.cpp
 * @brief InitSettings conversion and SettingsBuilder validation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/settings.h"
#include "belart/gsl.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace belart {

namespace {

constexpr uint32_t kMaxPeriodSize = 2048;
constexpr uint32_t kMaxAnalogChannels = 8;
constexpr uint8_t kMaxPin = 127;

int32_t pin_to_rtio(const std::optional<uint8_t>& pin) noexcept {
    return pin.has_value() ? static_cast<int32_t>(*pin) : -1;
}

std::optional<uint8_t> pin_from_rtio(int32_t pin) noexcept {
    if (pin < 0 || pin > kMaxPin) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(pin);
}

bool valid_mux_channels(uint32_t n) noexcept {
    return n == 0 || n == 2 || n == 4 || n == 8;
}

bool fits_int32(uint32_t value) noexcept {
    return value <= static_cast<uint32_t>(std::numeric_limits<int32_t>::max());
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// InitSettings
// ─────────────────────────────────────────────────────────────────────────────

rtio_init_settings InitSettings::to_rtio() const noexcept {
    rtio_init_settings raw;
    rtio_default_settings(&raw);

    raw.period_size = gsl::narrow_cast<int32_t>(period_size);
    raw.use_analog = use_analog ? 1 : 0;
    raw.use_digital = use_digital ? 1 : 0;
    raw.num_analog_in_channels = gsl::narrow_cast<int32_t>(num_analog_in_channels);
    raw.num_analog_out_channels = gsl::narrow_cast<int32_t>(num_analog_out_channels);
    raw.num_digital_channels = gsl::narrow_cast<int32_t>(num_digital_channels);
    raw.begin_muted = begin_muted ? 1 : 0;
    raw.dac_level = dac_level;
    raw.adc_level = adc_level;
    raw.pga_gain[0] = pga_gain[0];
    raw.pga_gain[1] = pga_gain[1];
    raw.headphone_level = headphone_level;
    raw.num_mux_channels = gsl::narrow_cast<int32_t>(num_mux_channels);
    raw.audio_expander_inputs = audio_expander_inputs;
    raw.audio_expander_outputs = audio_expander_outputs;
    raw.pru_number = pru_number;

    const size_t name_len = std::min(pru_filename.size(), size_t{RTIO_PRU_FILENAME_LEN - 1});
    std::memcpy(raw.pru_filename, pru_filename.data(), name_len);
    raw.pru_filename[name_len] = '\0';

    raw.detect_underruns = detect_underruns ? 1 : 0;
    raw.verbose = verbose ? 1 : 0;
    raw.enable_led = enable_led ? 1 : 0;
    raw.stop_button_pin = pin_to_rtio(stop_button_pin);
    raw.high_performance_mode = high_performance_mode ? 1 : 0;
    raw.interleave = interleave ? 1 : 0;
    raw.analog_outputs_persist = analog_outputs_persist ? 1 : 0;
    raw.uniform_sample_rate = uniform_sample_rate ? 1 : 0;
    raw.audio_thread_stack_size = gsl::narrow_cast<int32_t>(audio_thread_stack_size);
    raw.auxiliary_task_stack_size = gsl::narrow_cast<int32_t>(auxiliary_task_stack_size);
    raw.amp_mute_pin = pin_to_rtio(amp_mute_pin);
    raw.board = static_cast<int32_t>(board);
    return raw;
}

InitSettings InitSettings::from_rtio(const rtio_init_settings& raw) {
    InitSettings s;
    s.period_size = static_cast<uint32_t>(std::max(raw.period_size, 0));
    s.use_analog = raw.use_analog != 0;
    s.use_digital = raw.use_digital != 0;
    s.num_analog_in_channels = static_cast<uint32_t>(std::max(raw.num_analog_in_channels, 0));
    s.num_analog_out_channels = static_cast<uint32_t>(std::max(raw.num_analog_out_channels, 0));
    s.num_digital_channels = static_cast<uint32_t>(std::max(raw.num_digital_channels, 0));
    s.begin_muted = raw.begin_muted != 0;
    s.dac_level = raw.dac_level;
    s.adc_level = raw.adc_level;
    s.pga_gain = {raw.pga_gain[0], raw.pga_gain[1]};
    s.headphone_level = raw.headphone_level;
    s.num_mux_channels = static_cast<uint32_t>(std::max(raw.num_mux_channels, 0));
    s.audio_expander_inputs = raw.audio_expander_inputs;
    s.audio_expander_outputs = raw.audio_expander_outputs;
    s.pru_number = raw.pru_number;
    s.pru_filename.assign(raw.pru_filename,
                          ::strnlen(raw.pru_filename, RTIO_PRU_FILENAME_LEN));
    s.detect_underruns = raw.detect_underruns != 0;
    s.verbose = raw.verbose != 0;
    s.enable_led = raw.enable_led != 0;
    s.stop_button_pin = pin_from_rtio(raw.stop_button_pin);
    s.high_performance_mode = raw.high_performance_mode != 0;
    s.interleave = raw.interleave != 0;
    s.analog_outputs_persist = raw.analog_outputs_persist != 0;
    s.uniform_sample_rate = raw.uniform_sample_rate != 0;
    s.audio_thread_stack_size = static_cast<uint32_t>(std::max(raw.audio_thread_stack_size, 0));
    s.auxiliary_task_stack_size = static_cast<uint32_t>(std::max(raw.auxiliary_task_stack_size, 0));
    s.amp_mute_pin = pin_from_rtio(raw.amp_mute_pin);
    s.board = static_cast<BoardModel>(raw.board);
    return s;
}

// ─────────────────────────────────────────────────────────────────────────────
// SettingsBuilder
// ─────────────────────────────────────────────────────────────────────────────

Result<InitSettings> SettingsBuilder::build() {
    errors_.clear();
    const InitSettings& s = settings_;

    auto require = [this](bool ok, const char* message) {
        if (!ok) {
            errors_.push_back(message);
        }
    };

    require(s.period_size > 0, "period_size must be at least 1");
    require(s.period_size <= kMaxPeriodSize, "period_size cannot exceed 2048");
    require(s.num_analog_in_channels <= kMaxAnalogChannels,
            "num_analog_in_channels cannot exceed 8");
    require(s.num_analog_out_channels <= kMaxAnalogChannels,
            "num_analog_out_channels cannot exceed 8");
    require(s.num_digital_channels <= RTIO_MAX_DIGITAL_CHANNELS,
            "num_digital_channels cannot exceed 16");
    require(valid_mux_channels(s.num_mux_channels),
            "num_mux_channels must be 0, 2, 4 or 8");
    require(s.num_mux_channels == 0 || s.use_analog,
            "multiplexer channels require analog I/O");

    require(std::isfinite(s.dac_level), "dac_level must be finite");
    require(std::isfinite(s.adc_level), "adc_level must be finite");
    require(std::isfinite(s.pga_gain[0]) && std::isfinite(s.pga_gain[1]),
            "pga_gain must be finite");
    require(std::isfinite(s.headphone_level), "headphone_level must be finite");

    require(s.pru_number == 0 || s.pru_number == 1, "pru_number must be 0 or 1");
    require(s.pru_filename.size() < RTIO_PRU_FILENAME_LEN,
            "pru_filename cannot exceed 255 characters");

    require(!s.stop_button_pin || *s.stop_button_pin <= kMaxPin,
            "stop_button_pin must be between 0 and 127");
    require(!s.amp_mute_pin || *s.amp_mute_pin <= kMaxPin,
            "amp_mute_pin must be between 0 and 127");

    require(s.audio_thread_stack_size > 0 && fits_int32(s.audio_thread_stack_size),
            "audio_thread_stack_size out of range");
    require(s.auxiliary_task_stack_size > 0 && fits_int32(s.auxiliary_task_stack_size),
            "auxiliary_task_stack_size out of range");

    require(is_valid(s.board), "Invalid board model");

    if (!errors_.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, errors_.front()));
    }
    return Ok(settings_);
}

} // namespace belart
