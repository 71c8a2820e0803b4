// ==============================================================================
// Layer 3: System - Cascade Frequency Response
// ==============================================================================
// Evaluates the magnitude response of a chain of biquad sections at arbitrary
// frequencies, the way the device firmware does it:
//
//   H(z) = (b0 + b1*z^-1 + b2*z^-2) / (1 + a1*z^-1 + a2*z^-2),  z = e^jw
//
// The numerator and denominator are expanded with cos(w), cos(2w), sin(w)
// and sin(2w) rather than complex exponentials. Squared magnitudes of every
// active band are multiplied together and converted once with 10*log10.
// A band whose |denominator|^2 falls below kDegenerateDenominator is skipped.
//
// Master bypass is NOT handled here. It is a device-wide switch applied by
// the caller for the input channels only.
// ==============================================================================

#pragma once

#include <dspi/dsp/core/db_utils.h>
#include <dspi/dsp/core/filter_params.h>
#include <dspi/dsp/core/math_constants.h>
#include <dspi/dsp/primitives/biquad.h>

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Dspi {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// |denominator|^2 at or below this is treated as numerically degenerate
inline constexpr float kDegenerateDenominator = 1e-9f;

/// Lowest frequency of a response sweep (Hz)
inline constexpr float kResponseMinFrequency = 20.0f;

/// Highest frequency of a response sweep (Hz)
inline constexpr float kResponseMaxFrequency = 20000.0f;

/// Default number of points in a response sweep
inline constexpr size_t kDefaultResponsePoints = 201;

// =============================================================================
// Single Section
// =============================================================================

/// @brief Squared magnitude terms of one section at one frequency.
struct SectionMagnitude {
    float numeratorSq = 1.0f;
    float denominatorSq = 1.0f;

    /// True when the denominator is large enough to divide by
    [[nodiscard]] bool isUsable() const noexcept {
        return denominatorSq > kDegenerateDenominator;
    }
};

/// Evaluate |N(e^jw)|^2 and |D(e^jw)|^2 for one section
/// @param coeffs Normalized coefficients (a0 = 1)
/// @param frequency Evaluation frequency in Hz
/// @param sampleRate Sample rate in Hz
[[nodiscard]] inline SectionMagnitude evaluateSection(
    const BiquadCoefficients& coeffs,
    float frequency,
    float sampleRate = kDeviceSampleRate
) noexcept {
    const float w = 2.0f * kPi * frequency / sampleRate;

    const float cosW = std::cos(w);
    const float cos2W = std::cos(2.0f * w);
    const float sinW = std::sin(w);
    const float sin2W = std::sin(2.0f * w);

    // Numerator (real and imaginary parts)
    const float numR = coeffs.b0 + coeffs.b1 * cosW + coeffs.b2 * cos2W;
    const float numI = -(coeffs.b1 * sinW + coeffs.b2 * sin2W);

    // Denominator (a0 normalized to 1)
    const float denR = 1.0f + coeffs.a1 * cosW + coeffs.a2 * cos2W;
    const float denI = -(coeffs.a1 * sinW + coeffs.a2 * sin2W);

    SectionMagnitude result;
    result.numeratorSq = numR * numR + numI * numI;
    result.denominatorSq = denR * denR + denI * denI;
    return result;
}

// =============================================================================
// Cascade Response
// =============================================================================

/// @brief Precomputed coefficients for a channel's filter chain.
///
/// prepare() derives coefficients once per band so that a sweep of many
/// frequencies does not recompute them. The evaluation order and arithmetic
/// are identical to evaluating each band from scratch.
class CascadeResponse {
public:
    CascadeResponse() = default;

    /// Build from a band list. Off bands are dropped.
    explicit CascadeResponse(std::span<const FilterParams> filters,
                             float sampleRate = kDeviceSampleRate) {
        prepare(filters, sampleRate);
    }

    /// Replace the chain
    void prepare(std::span<const FilterParams> filters,
                 float sampleRate = kDeviceSampleRate) {
        sampleRate_ = sampleRate;
        sections_.clear();
        sections_.reserve(filters.size());
        for (const auto& f : filters) {
            if (f.isActive()) {
                sections_.push_back(BiquadCoefficients::calculate(f, sampleRate));
            }
        }
    }

    /// Product of |H|^2 over all active sections (1.0 for an empty chain)
    [[nodiscard]] float powerAt(float frequency) const noexcept {
        float magSquaredTotal = 1.0f;
        for (const auto& coeffs : sections_) {
            const auto m = evaluateSection(coeffs, frequency, sampleRate_);
            if (m.isUsable()) {
                magSquaredTotal *= (m.numeratorSq / m.denominatorSq);
            }
        }
        return magSquaredTotal;
    }

    /// Magnitude in dB at one frequency
    [[nodiscard]] float magnitudeDbAt(float frequency) const noexcept {
        return powerToDb(powerAt(frequency));
    }

    /// Number of active sections
    [[nodiscard]] size_t numSections() const noexcept { return sections_.size(); }

    [[nodiscard]] float sampleRate() const noexcept { return sampleRate_; }

private:
    std::vector<BiquadCoefficients> sections_;
    float sampleRate_ = kDeviceSampleRate;
};

/// Magnitude in dB of a filter chain at one frequency
/// @param filters Band list (Off bands contribute 0 dB)
/// @param frequency Evaluation frequency in Hz
/// @param sampleRate Sample rate in Hz
[[nodiscard]] inline float responseDbAt(
    std::span<const FilterParams> filters,
    float frequency,
    float sampleRate = kDeviceSampleRate
) {
    float magSquaredTotal = 1.0f;
    for (const auto& f : filters) {
        if (!f.isActive()) continue;
        const auto m = evaluateSection(BiquadCoefficients::calculate(f, sampleRate),
                                       frequency, sampleRate);
        if (m.isUsable()) {
            magSquaredTotal *= (m.numeratorSq / m.denominatorSq);
        }
    }
    return powerToDb(magSquaredTotal);
}

// =============================================================================
// Log-Spaced Sweep
// =============================================================================

/// Frequency of point @p index in a log-spaced sweep of @p numPoints points
/// from kResponseMinFrequency to kResponseMaxFrequency (both inclusive)
[[nodiscard]] inline float sweepFrequency(size_t index, size_t numPoints) noexcept {
    if (numPoints < 2) return kResponseMinFrequency;
    const float pct = static_cast<float>(index) / static_cast<float>(numPoints - 1);
    const float logMin = std::log10(kResponseMinFrequency);
    const float logMax = std::log10(kResponseMaxFrequency);
    return std::pow(10.0f, logMin + pct * (logMax - logMin));
}

/// Evaluate a chain over a log-spaced sweep
/// @return One dB value per point, index i at sweepFrequency(i, numPoints)
[[nodiscard]] inline std::vector<float> responseCurve(
    std::span<const FilterParams> filters,
    size_t numPoints = kDefaultResponsePoints,
    float sampleRate = kDeviceSampleRate
) {
    const CascadeResponse cascade(filters, sampleRate);
    std::vector<float> result;
    result.reserve(numPoints);
    for (size_t i = 0; i < numPoints; ++i) {
        result.push_back(cascade.magnitudeDbAt(sweepFrequency(i, numPoints)));
    }
    return result;
}

/// A flat (0 dB) curve, used for bypassed input channels
[[nodiscard]] inline std::vector<float> flatCurve(size_t numPoints = kDefaultResponsePoints) {
    return std::vector<float>(numPoints, 0.0f);
}

} // namespace DSP
} // namespace Dspi
