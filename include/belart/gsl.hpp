/**
 * @file gsl.hpp
 * @brief Bridge header for gsl-lite v1.
 *
 * gsl-lite is a PRIVATE dependency of belart: include this header from
 * sources and from headers that only use the contract macros
 * (gsl_Expects / gsl_Ensures). Never expose gsl-lite types through
 * rtio_abi.h.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace belart {

/**
 * @brief Scoped alias for gsl-lite v1 namespace.
 *
 * Usage stays explicit and greppable (belart::gsl::narrow_cast).
 */
namespace gsl = ::gsl_lite;

} // namespace belart
