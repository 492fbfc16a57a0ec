/**
 * @file rtio_abi.h
 * @brief C ABI of the real-time I/O engine callback contract.
 *
 * The engine owns every buffer and drives three user callbacks from its
 * high-priority audio thread:
 *
 * | Callback | When                         | Returns              |
 * |----------|------------------------------|----------------------|
 * | setup    | once, inside initialize      | true = ready to start|
 * | render   | once per buffer period       | nothing              |
 * | cleanup  | once, inside cleanup         | nothing              |
 *
 * A single opaque user_data pointer threads through all three.
 *
 * DESIGN DECISIONS:
 * - Pure C (C11 and C++23 compatible)
 * - Single engine per process
 * - Status codes: 0 on success, negative on failure
 * - rtio_context memory is valid only during the callback that received it
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef RTIO_RTIO_ABI_H
#define RTIO_RTIO_ABI_H

#include <stdint.h>
#include <stddef.h>

#ifndef __cplusplus
#include <stdbool.h>
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* =========================================================================
 * VERSION
 * ========================================================================= */

#define RTIO_ABI_VERSION_MAJOR 1
#define RTIO_ABI_VERSION_MINOR 0

/* =========================================================================
 * STATUS CODES
 * ========================================================================= */

typedef int32_t rtio_status_t;

#define RTIO_OK                       0
#define RTIO_ERR_INVALID_SETTINGS    -1
#define RTIO_ERR_SETUP_DECLINED      -2
#define RTIO_ERR_ALREADY_INITIALIZED -3
#define RTIO_ERR_NOT_INITIALIZED     -4
#define RTIO_ERR_ALREADY_RUNNING     -5
#define RTIO_ERR_NULL_TASK           -6
#define RTIO_ERR_TASK_STOPPED        -7
#define RTIO_ERR_OUT_OF_MEMORY       -8
#define RTIO_ERR_INTERNAL            -9

/* =========================================================================
 * LIMITS
 * ========================================================================= */

/** Digital words carry direction in bits 0-15 and value in bits 16-31. */
#define RTIO_MAX_DIGITAL_CHANNELS 16
#define RTIO_DIGITAL_VALUE_SHIFT  16

#define RTIO_PROJECT_NAME_LEN     64
#define RTIO_PRU_FILENAME_LEN     256

/* =========================================================================
 * CONTEXT FLAGS
 * ========================================================================= */

#define RTIO_FLAG_INTERLEAVED            (1u << 0)
#define RTIO_FLAG_ANALOG_OUTPUTS_PERSIST (1u << 1)
#define RTIO_FLAG_DETECT_UNDERRUNS       (1u << 2)
#define RTIO_FLAG_OFFLINE                (1u << 3)

/* =========================================================================
 * HARDWARE MODELS
 * ========================================================================= */

typedef enum rtio_board {
    RTIO_BOARD_NONE = 0,
    RTIO_BOARD_BELA = 1,
    RTIO_BOARD_BELA_MINI = 2,
    RTIO_BOARD_SALT = 3,
    RTIO_BOARD_CTAG_FACE = 4,
    RTIO_BOARD_CTAG_BEAST = 5,
    RTIO_BOARD_CTAG_FACE_BELA = 6,
    RTIO_BOARD_CTAG_BEAST_BELA = 7
} rtio_board;

/* =========================================================================
 * PER-INVOCATION BUFFER DESCRIPTOR
 * ========================================================================= */

/**
 * @brief Buffers and dimensions handed to every callback.
 *
 * All pointers reference engine-owned memory. Region sizes are
 * frames * channels elements; digital holds one word per frame.
 */
typedef struct rtio_context {
    const float* audio_in;
    float*       audio_out;
    const float* analog_in;
    float*       analog_out;
    uint32_t*    digital;

    uint32_t audio_frames;
    uint32_t audio_in_channels;
    uint32_t audio_out_channels;
    float    audio_sample_rate;

    uint32_t analog_frames;
    uint32_t analog_in_channels;
    uint32_t analog_out_channels;
    float    analog_sample_rate;

    uint32_t digital_frames;
    uint32_t digital_channels;
    float    digital_sample_rate;

    uint64_t audio_frames_elapsed;
    uint32_t flags;                         /**< RTIO_FLAG_* bits */

    uint32_t     multiplexer_channels;
    uint32_t     multiplexer_starting_channel;
    const float* multiplexer_analog_in;     /**< analog_in_channels * multiplexer_channels */
    uint32_t     audio_expander_enabled;    /**< bitmask of expander channels */

    char project_name[RTIO_PROJECT_NAME_LEN];
} rtio_context;

/* =========================================================================
 * CALLBACK TYPES
 * ========================================================================= */

typedef bool (*rtio_setup_callback)(rtio_context* context, void* user_data);
typedef void (*rtio_render_callback)(rtio_context* context, void* user_data);
typedef void (*rtio_cleanup_callback)(rtio_context* context, void* user_data);

/** Entry point of an auxiliary task; arg is the pointer given at creation. */
typedef void (*rtio_aux_callback)(void* arg);

/** Opaque auxiliary task handle. NULL means creation failed. */
typedef struct rtio_aux_task_impl* rtio_aux_task;

/** Opaque MIDI port handle. NULL means the port could not be opened. */
typedef struct rtio_midi_impl* rtio_midi;

/* =========================================================================
 * INITIALIZATION SETTINGS
 * ========================================================================= */

typedef struct rtio_init_settings {
    int32_t period_size;                /**< Analog frames per period */
    int32_t use_analog;
    int32_t use_digital;
    int32_t num_analog_in_channels;
    int32_t num_analog_out_channels;
    int32_t num_digital_channels;
    int32_t begin_muted;
    float   dac_level;
    float   adc_level;
    float   pga_gain[2];
    float   headphone_level;
    int32_t num_mux_channels;
    uint32_t audio_expander_inputs;
    uint32_t audio_expander_outputs;
    int32_t pru_number;
    char    pru_filename[RTIO_PRU_FILENAME_LEN];
    int32_t detect_underruns;
    int32_t verbose;
    int32_t enable_led;
    int32_t stop_button_pin;            /**< -1 disables */
    int32_t high_performance_mode;
    int32_t interleave;
    int32_t analog_outputs_persist;
    int32_t uniform_sample_rate;
    int32_t audio_thread_stack_size;
    int32_t auxiliary_task_stack_size;
    int32_t amp_mute_pin;               /**< -1 disables */
    int32_t board;                      /**< rtio_board */

    rtio_setup_callback   setup;
    rtio_render_callback  render;
    rtio_cleanup_callback cleanup;
} rtio_init_settings;

/**
 * @brief Fill settings with engine defaults (callbacks set to NULL).
 */
void rtio_default_settings(rtio_init_settings* settings);

/**
 * @brief Name of a status code for diagnostics.
 */
const char* rtio_status_name(rtio_status_t status);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* RTIO_RTIO_ABI_H */
