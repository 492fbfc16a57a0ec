/**
 * @file digital.h
 * @brief Codec for the packed per-frame digital pin word.
 *
 * Each frame of the digital region is one 32-bit word:
 *
 * | Bits              | Meaning                          |
 * |-------------------|----------------------------------|
 * | [0, channels)     | direction, set = input           |
 * | [16, 16+channels) | value, set = high                |
 *
 * At most 16 channels exist. The "once" variants touch a single frame;
 * the others apply from the given frame to the end of the buffer so that
 * a pin keeps its new state for the rest of the period.
 *
 * All functions are allocation-free and safe on the render thread.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/gsl.hpp"
#include "rtio/rtio_abi.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace belart {

inline constexpr uint32_t kMaxDigitalChannels = RTIO_MAX_DIGITAL_CHANNELS;
inline constexpr uint32_t kDigitalValueShift = RTIO_DIGITAL_VALUE_SHIFT;

/**
 * @brief Pin direction stored in the low half of the digital word.
 */
enum class DigitalDirection : uint8_t {
    Output = 0,
    Input = 1,
};

namespace detail {

[[nodiscard]] constexpr uint32_t direction_mask(uint32_t channel) noexcept {
    return 1u << channel;
}

[[nodiscard]] constexpr uint32_t value_mask(uint32_t channel) noexcept {
    return 1u << (channel + kDigitalValueShift);
}

constexpr void assign_bit(uint32_t& word, uint32_t mask, bool set) noexcept {
    word = set ? (word | mask) : (word & ~mask);
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Value Bits
// ─────────────────────────────────────────────────────────────────────────────

/// Level of @p channel at @p frame.
[[nodiscard]] inline bool digital_read(std::span<const uint32_t> words,
                                       size_t frame, uint32_t channel) {
    gsl_Expects(channel < kMaxDigitalChannels);
    gsl_Expects(frame < words.size());
    return (words[frame] & detail::value_mask(channel)) != 0;
}

/// Drive @p channel to @p value from @p frame to the end of the buffer.
inline void digital_write(std::span<uint32_t> words,
                          size_t frame, uint32_t channel, bool value) {
    gsl_Expects(channel < kMaxDigitalChannels);
    const uint32_t mask = detail::value_mask(channel);
    for (size_t f = frame; f < words.size(); ++f) {
        detail::assign_bit(words[f], mask, value);
    }
}

/// Drive @p channel to @p value at @p frame only.
inline void digital_write_once(std::span<uint32_t> words,
                               size_t frame, uint32_t channel, bool value) {
    gsl_Expects(channel < kMaxDigitalChannels);
    gsl_Expects(frame < words.size());
    detail::assign_bit(words[frame], detail::value_mask(channel), value);
}

// ─────────────────────────────────────────────────────────────────────────────
// Direction Bits
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline DigitalDirection pin_direction(std::span<const uint32_t> words,
                                                    size_t frame, uint32_t channel) {
    gsl_Expects(channel < kMaxDigitalChannels);
    gsl_Expects(frame < words.size());
    return (words[frame] & detail::direction_mask(channel)) != 0
        ? DigitalDirection::Input
        : DigitalDirection::Output;
}

/// Set the direction of @p channel from @p frame to the end of the buffer.
inline void pin_mode(std::span<uint32_t> words,
                     size_t frame, uint32_t channel, DigitalDirection mode) {
    gsl_Expects(channel < kMaxDigitalChannels);
    const uint32_t mask = detail::direction_mask(channel);
    const bool input = mode == DigitalDirection::Input;
    for (size_t f = frame; f < words.size(); ++f) {
        detail::assign_bit(words[f], mask, input);
    }
}

inline void pin_mode_once(std::span<uint32_t> words,
                          size_t frame, uint32_t channel, DigitalDirection mode) {
    gsl_Expects(channel < kMaxDigitalChannels);
    gsl_Expects(frame < words.size());
    detail::assign_bit(words[frame], detail::direction_mask(channel),
                       mode == DigitalDirection::Input);
}

} // namespace belart
