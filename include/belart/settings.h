/**
 * @file settings.h
 * @brief Engine configuration and its fluent, validating builder.
 *
 * Example:
 * @code
 *   auto settings = SettingsBuilder()
 *       .with_period_size(32)
 *       .with_analog(false)
 *       .with_stop_button_pin(std::nullopt)
 *       .build();
 *
 *   if (!settings) {
 *       BELART_LOG_ERROR("CONFIG", "%s", settings.error().message());
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/error.h"
#include "rtio/rtio_abi.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace belart {

// ─────────────────────────────────────────────────────────────────────────────
// Hardware Models
// ─────────────────────────────────────────────────────────────────────────────

enum class BoardModel : int32_t {
    None = RTIO_BOARD_NONE,
    Bela = RTIO_BOARD_BELA,
    BelaMini = RTIO_BOARD_BELA_MINI,
    Salt = RTIO_BOARD_SALT,
    CtagFace = RTIO_BOARD_CTAG_FACE,
    CtagBeast = RTIO_BOARD_CTAG_BEAST,
    CtagFaceBela = RTIO_BOARD_CTAG_FACE_BELA,
    CtagBeastBela = RTIO_BOARD_CTAG_BEAST_BELA,
};

[[nodiscard]] constexpr const char* board_model_name(BoardModel model) noexcept {
    switch (model) {
        case BoardModel::None: return "None";
        case BoardModel::Bela: return "Bela";
        case BoardModel::BelaMini: return "BelaMini";
        case BoardModel::Salt: return "Salt";
        case BoardModel::CtagFace: return "CtagFace";
        case BoardModel::CtagBeast: return "CtagBeast";
        case BoardModel::CtagFaceBela: return "CtagFaceBela";
        case BoardModel::CtagBeastBela: return "CtagBeastBela";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_valid(BoardModel model) noexcept {
    return static_cast<int32_t>(model) >= RTIO_BOARD_NONE &&
           static_cast<int32_t>(model) <= RTIO_BOARD_CTAG_BEAST_BELA;
}

// ─────────────────────────────────────────────────────────────────────────────
// InitSettings
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Requested engine configuration.
 *
 * Default-constructed values match rtio_default_settings(). Callbacks are
 * not part of this type; the Runtime installs them.
 */
struct InitSettings {
    uint32_t period_size = 16;                 ///< Analog frames per period
    bool use_analog = true;
    bool use_digital = true;
    uint32_t num_analog_in_channels = 8;
    uint32_t num_analog_out_channels = 8;
    uint32_t num_digital_channels = 16;
    bool begin_muted = false;
    float dac_level = 0.0f;                    ///< dB
    float adc_level = -6.0f;                   ///< dB
    std::array<float, 2> pga_gain{16.0f, 16.0f};
    float headphone_level = -6.0f;             ///< dB
    uint32_t num_mux_channels = 0;
    uint32_t audio_expander_inputs = 0;        ///< Channel bitmask
    uint32_t audio_expander_outputs = 0;       ///< Channel bitmask
    int32_t pru_number = 1;
    std::string pru_filename;                  ///< Empty uses the built-in PRU code
    bool detect_underruns = true;
    bool verbose = false;
    bool enable_led = true;
    std::optional<uint8_t> stop_button_pin;    ///< 0-127, nullopt disables
    bool high_performance_mode = false;
    bool interleave = true;
    bool analog_outputs_persist = true;
    bool uniform_sample_rate = false;
    uint32_t audio_thread_stack_size = 1u << 20;
    uint32_t auxiliary_task_stack_size = 1u << 20;
    std::optional<uint8_t> amp_mute_pin;       ///< 0-127, nullopt disables
    BoardModel board = BoardModel::None;

    /// Engine representation (callbacks left null).
    [[nodiscard]] rtio_init_settings to_rtio() const noexcept;

    /// Read back an engine representation.
    [[nodiscard]] static InitSettings from_rtio(const rtio_init_settings& raw);
};

// ─────────────────────────────────────────────────────────────────────────────
// SettingsBuilder
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fluent builder for InitSettings.
 *
 * Values are checked on build(); the first failure is returned as an
 * InvalidArgument error and every failure is listed in errors().
 */
class SettingsBuilder {
public:
    SettingsBuilder() = default;

    // Period & channels

    SettingsBuilder& with_period_size(uint32_t frames) noexcept {
        settings_.period_size = frames;
        return *this;
    }

    SettingsBuilder& with_analog(bool enabled = true) noexcept {
        settings_.use_analog = enabled;
        return *this;
    }

    SettingsBuilder& with_digital(bool enabled = true) noexcept {
        settings_.use_digital = enabled;
        return *this;
    }

    SettingsBuilder& with_analog_in_channels(uint32_t count) noexcept {
        settings_.num_analog_in_channels = count;
        return *this;
    }

    SettingsBuilder& with_analog_out_channels(uint32_t count) noexcept {
        settings_.num_analog_out_channels = count;
        return *this;
    }

    SettingsBuilder& with_digital_channels(uint32_t count) noexcept {
        settings_.num_digital_channels = count;
        return *this;
    }

    /// Multiplexer capelet channels: 0, 2, 4 or 8.
    SettingsBuilder& with_mux_channels(uint32_t count) noexcept {
        settings_.num_mux_channels = count;
        return *this;
    }

    SettingsBuilder& with_audio_expander_inputs(uint32_t mask) noexcept {
        settings_.audio_expander_inputs = mask;
        return *this;
    }

    SettingsBuilder& with_audio_expander_outputs(uint32_t mask) noexcept {
        settings_.audio_expander_outputs = mask;
        return *this;
    }

    // Levels (dB, must be finite)

    SettingsBuilder& begin_muted(bool muted = true) noexcept {
        settings_.begin_muted = muted;
        return *this;
    }

    SettingsBuilder& with_dac_level(float db) noexcept {
        settings_.dac_level = db;
        return *this;
    }

    SettingsBuilder& with_adc_level(float db) noexcept {
        settings_.adc_level = db;
        return *this;
    }

    SettingsBuilder& with_pga_gain(float left_db, float right_db) noexcept {
        settings_.pga_gain = {left_db, right_db};
        return *this;
    }

    SettingsBuilder& with_headphone_level(float db) noexcept {
        settings_.headphone_level = db;
        return *this;
    }

    // PRU

    /// PRU core (0 or 1) running the I/O loop.
    SettingsBuilder& with_pru_number(int32_t pru) noexcept {
        settings_.pru_number = pru;
        return *this;
    }

    /**
     * @brief External PRU binary to load instead of the built-in code.
     *
     * The binary runs with full hardware access; it is not inspected.
     */
    SettingsBuilder& with_pru_filename(std::string path) {
        settings_.pru_filename = std::move(path);
        return *this;
    }

    // Runtime behaviour

    SettingsBuilder& detect_underruns(bool enabled = true) noexcept {
        settings_.detect_underruns = enabled;
        return *this;
    }

    SettingsBuilder& verbose(bool enabled = true) noexcept {
        settings_.verbose = enabled;
        return *this;
    }

    SettingsBuilder& enable_led(bool enabled = true) noexcept {
        settings_.enable_led = enabled;
        return *this;
    }

    SettingsBuilder& with_stop_button_pin(std::optional<uint8_t> pin) noexcept {
        settings_.stop_button_pin = pin;
        return *this;
    }

    /// May degrade responsiveness of the rest of the system.
    SettingsBuilder& high_performance_mode(bool enabled = true) noexcept {
        settings_.high_performance_mode = enabled;
        return *this;
    }

    SettingsBuilder& interleave(bool enabled = true) noexcept {
        settings_.interleave = enabled;
        return *this;
    }

    SettingsBuilder& analog_outputs_persist(bool enabled = true) noexcept {
        settings_.analog_outputs_persist = enabled;
        return *this;
    }

    SettingsBuilder& uniform_sample_rate(bool enabled = true) noexcept {
        settings_.uniform_sample_rate = enabled;
        return *this;
    }

    SettingsBuilder& with_audio_thread_stack_size(uint32_t bytes) noexcept {
        settings_.audio_thread_stack_size = bytes;
        return *this;
    }

    SettingsBuilder& with_auxiliary_task_stack_size(uint32_t bytes) noexcept {
        settings_.auxiliary_task_stack_size = bytes;
        return *this;
    }

    SettingsBuilder& with_amp_mute_pin(std::optional<uint8_t> pin) noexcept {
        settings_.amp_mute_pin = pin;
        return *this;
    }

    SettingsBuilder& with_board(BoardModel board) noexcept {
        settings_.board = board;
        return *this;
    }

    // Build

    /**
     * @brief Validate and build the settings.
     * @return Settings, or InvalidArgument naming the first problem
     */
    [[nodiscard]] Result<InitSettings> build();

    /// Messages from the last build() call, in check order.
    [[nodiscard]] const std::vector<const char*>& errors() const noexcept {
        return errors_;
    }

    [[nodiscard]] const InitSettings& current() const noexcept { return settings_; }

private:
    InitSettings settings_;
    std::vector<const char*> errors_;
};

} // namespace belart
