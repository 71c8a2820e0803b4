// ==============================================================================
// Layer 1: DSP Primitive - Biquad Coefficients
// ==============================================================================
// Second-order section coefficients for the device's filter types.
//
// The device firmware derives its coefficients from the same formulas in
// single precision, without clamping frequency or Q. Nothing here clamps
// either, so a curve drawn on the host matches what the hardware applies.
//
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <dspi/dsp/core/filter_params.h>
#include <dspi/dsp/core/math_constants.h>

#include <cmath>

namespace Dspi {
namespace DSP {

// =============================================================================
// Biquad Coefficients
// =============================================================================

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
///
/// A default-constructed value is the identity section (b0 = 1, rest 0).
struct BiquadCoefficients {
    float b0 = 1.0f;  ///< Feedforward coefficient 0
    float b1 = 0.0f;  ///< Feedforward coefficient 1
    float b2 = 0.0f;  ///< Feedforward coefficient 2
    float a1 = 0.0f;  ///< Feedback coefficient 1 (a0 = 1 implied)
    float a2 = 0.0f;  ///< Feedback coefficient 2

    /// Calculate coefficients for one band
    /// @param params Band parameters (type, frequency, Q, gain)
    /// @param sampleRate Sample rate in Hz
    /// @return Identity coefficients for Off bands and for non-positive
    ///         sample rate, frequency or Q
    [[nodiscard]] static BiquadCoefficients calculate(
        const FilterParams& params,
        float sampleRate = kDeviceSampleRate
    ) noexcept;
};

// =============================================================================
// Coefficient Calculation Implementation
// =============================================================================

inline BiquadCoefficients BiquadCoefficients::calculate(
    const FilterParams& params,
    float sampleRate
) noexcept {
    if (params.type == FilterType::Off) {
        return BiquadCoefficients{};
    }
    if (sampleRate <= 0.0f || params.frequency <= 0.0f || params.Q <= 0.0f) {
        return BiquadCoefficients{};
    }

    // Common intermediate values
    const float omega = kTwoPi * params.frequency / sampleRate;
    const float sn = std::sin(omega);
    const float cs = std::cos(omega);
    const float alpha = sn / (2.0f * params.Q);
    const float A = std::pow(10.0f, params.gainDb / 40.0f);

    float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
    float a0 = 1.0f, a1 = 0.0f, a2 = 0.0f;

    switch (params.type) {
        case FilterType::LowPass: {
            b0 = (1.0f - cs) / 2.0f;
            b1 = 1.0f - cs;
            b2 = (1.0f - cs) / 2.0f;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cs;
            a2 = 1.0f - alpha;
            break;
        }
        case FilterType::HighPass: {
            b0 = (1.0f + cs) / 2.0f;
            b1 = -(1.0f + cs);
            b2 = (1.0f + cs) / 2.0f;
            a0 = 1.0f + alpha;
            a1 = -2.0f * cs;
            a2 = 1.0f - alpha;
            break;
        }
        case FilterType::Peaking: {
            b0 = 1.0f + alpha * A;
            b1 = -2.0f * cs;
            b2 = 1.0f - alpha * A;
            a0 = 1.0f + alpha / A;
            a1 = -2.0f * cs;
            a2 = 1.0f - alpha / A;
            break;
        }
        case FilterType::LowShelf: {
            const float twoSqrtAAlpha = 2.0f * std::sqrt(A) * alpha;

            b0 = A * ((A + 1.0f) - (A - 1.0f) * cs + twoSqrtAAlpha);
            b1 = 2.0f * A * ((A - 1.0f) - (A + 1.0f) * cs);
            b2 = A * ((A + 1.0f) - (A - 1.0f) * cs - twoSqrtAAlpha);
            a0 = (A + 1.0f) + (A - 1.0f) * cs + twoSqrtAAlpha;
            a1 = -2.0f * ((A - 1.0f) + (A + 1.0f) * cs);
            a2 = (A + 1.0f) + (A - 1.0f) * cs - twoSqrtAAlpha;
            break;
        }
        case FilterType::HighShelf: {
            const float twoSqrtAAlpha = 2.0f * std::sqrt(A) * alpha;

            b0 = A * ((A + 1.0f) + (A - 1.0f) * cs + twoSqrtAAlpha);
            b1 = -2.0f * A * ((A - 1.0f) + (A + 1.0f) * cs);
            b2 = A * ((A + 1.0f) + (A - 1.0f) * cs - twoSqrtAAlpha);
            a0 = (A + 1.0f) - (A - 1.0f) * cs + twoSqrtAAlpha;
            a1 = 2.0f * ((A - 1.0f) - (A + 1.0f) * cs);
            a2 = (A + 1.0f) - (A - 1.0f) * cs - twoSqrtAAlpha;
            break;
        }
        case FilterType::Off:
            break;
    }

    // Normalize by a0. The firmware divides each term rather than
    // multiplying by a reciprocal, so this does too.
    BiquadCoefficients coeffs;
    coeffs.b0 = b0 / a0;
    coeffs.b1 = b1 / a0;
    coeffs.b2 = b2 / a0;
    coeffs.a1 = a1 / a0;
    coeffs.a2 = a2 / a0;
    return coeffs;
}

} // namespace DSP
} // namespace Dspi
