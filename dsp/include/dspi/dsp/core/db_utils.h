// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Power Ratio to Decibels
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <cmath>

namespace Dspi {
namespace DSP {

/// Convert a squared magnitude (power ratio) to decibels.
///
/// @formula   dB = 10 * log10(power)
///
/// The response engine accumulates |H|^2 across a cascade and converts once
/// at the end with this form. The firmware does the same, so the result is
/// not rewritten as 20 * log10(sqrt(power)).
[[nodiscard]] inline float powerToDb(float power) noexcept {
    return 10.0f * std::log10(power);
}

} // namespace DSP
} // namespace Dspi
