// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for the response and coefficient math.
//
// Constants are inline constexpr to ensure a single definition across
// all translation units.
// ==============================================================================

#pragma once

namespace Dspi {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant, full float precision: 3.14159265358979323846
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

// =============================================================================
// Device Constants
// =============================================================================

/// Sample rate the device firmware designs its biquads for.
/// Every response evaluated on the host must use this rate to match hardware.
inline constexpr float kDeviceSampleRate = 48000.0f;

} // namespace DSP
} // namespace Dspi
