/**
 * @file rtio_abi.cpp
 * @brief Default settings and status names for the rtio C ABI.
 *
 * @copyright GPL-2.0-or-later
 */

#include "rtio/rtio_abi.h"

#include <cstring>

extern "C" {

void rtio_default_settings(rtio_init_settings* settings) {
    if (!settings) {
        return;
    }
    std::memset(settings, 0, sizeof(*settings));

    settings->period_size = 16;
    settings->use_analog = 1;
    settings->use_digital = 1;
    settings->num_analog_in_channels = 8;
    settings->num_analog_out_channels = 8;
    settings->num_digital_channels = RTIO_MAX_DIGITAL_CHANNELS;
    settings->begin_muted = 0;
    settings->dac_level = 0.0f;
    settings->adc_level = -6.0f;
    settings->pga_gain[0] = 16.0f;
    settings->pga_gain[1] = 16.0f;
    settings->headphone_level = -6.0f;
    settings->num_mux_channels = 0;
    settings->audio_expander_inputs = 0;
    settings->audio_expander_outputs = 0;
    settings->pru_number = 1;
    settings->detect_underruns = 1;
    settings->verbose = 0;
    settings->enable_led = 1;
    settings->stop_button_pin = -1;
    settings->high_performance_mode = 0;
    settings->interleave = 1;
    settings->analog_outputs_persist = 1;
    settings->uniform_sample_rate = 0;
    settings->audio_thread_stack_size = 1 << 20;
    settings->auxiliary_task_stack_size = 1 << 20;
    settings->amp_mute_pin = -1;
    settings->board = RTIO_BOARD_NONE;

    settings->setup = nullptr;
    settings->render = nullptr;
    settings->cleanup = nullptr;
}

const char* rtio_status_name(rtio_status_t status) {
    switch (status) {
        case RTIO_OK:                      return "OK";
        case RTIO_ERR_INVALID_SETTINGS:    return "ERR_INVALID_SETTINGS";
        case RTIO_ERR_SETUP_DECLINED:      return "ERR_SETUP_DECLINED";
        case RTIO_ERR_ALREADY_INITIALIZED: return "ERR_ALREADY_INITIALIZED";
        case RTIO_ERR_NOT_INITIALIZED:     return "ERR_NOT_INITIALIZED";
        case RTIO_ERR_ALREADY_RUNNING:     return "ERR_ALREADY_RUNNING";
        case RTIO_ERR_NULL_TASK:           return "ERR_NULL_TASK";
        case RTIO_ERR_TASK_STOPPED:        return "ERR_TASK_STOPPED";
        case RTIO_ERR_OUT_OF_MEMORY:       return "ERR_OUT_OF_MEMORY";
        case RTIO_ERR_INTERNAL:            return "ERR_INTERNAL";
        default:                           return "ERR_UNKNOWN";
    }
}

} // extern "C"
