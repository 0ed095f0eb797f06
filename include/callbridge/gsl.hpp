/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * Do NOT expose gsl-lite types in native_api.h (C ABI).
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * The build defines gsl_CONFIG_CONTRACT_VIOLATION_THROWS=1 so that
 * gsl_Expects on a caller thread surfaces as gsl_lite::fail_fast.
 * Never use these checks inside a dispatch adapter.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace callbridge {

namespace gsl = ::gsl_lite;

} // namespace callbridge
