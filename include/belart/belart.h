/**
 * @file belart.h
 * @brief Umbrella header for applications.
 *
 * @code
 *   #include <belart/belart.h>
 *
 *   struct Sawtooth {
 *       float phase = 0.0f;
 *       void render(belart::RenderContext& ctx) noexcept { ... }
 *   };
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "belart/application.h"
#include "belart/auxiliary_task.h"
#include "belart/context.h"
#include "belart/digital.h"
#include "belart/error.h"
#include "belart/exceptions.h"
#include "belart/lifecycle.h"
#include "belart/logging.h"
#include "belart/midi.h"
#include "belart/runtime.h"
#include "belart/safe_call.h"
#include "belart/settings.h"
#include "belart/signals.h"
