// ==============================================================================
// Layer 0: Core Utility - Filter Parameters
// ==============================================================================
// The per-band filter record shared by the device protocol, the parameter
// store and the response math. Field meaning and the numeric type codes
// match the device firmware.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string_view>

namespace Dspi {
namespace DSP {

// =============================================================================
// Filter Type Enumeration
// =============================================================================

/// @brief Filter types understood by the device.
/// The numeric values are the on-wire type codes and must not be reordered.
enum class FilterType : uint8_t {
    Off = 0,        ///< Band disabled, contributes 0 dB
    Peaking = 1,    ///< Parametric bell (uses gain and Q)
    LowShelf = 2,   ///< Boost/cut below frequency (uses gain)
    HighShelf = 3,  ///< Boost/cut above frequency (uses gain)
    LowPass = 4,    ///< 12 dB/oct lowpass
    HighPass = 5    ///< 12 dB/oct highpass
};

/// Number of defined filter types
inline constexpr uint32_t kNumFilterTypes = 6;

/// Default band frequency in Hz
inline constexpr float kDefaultFilterFrequency = 1000.0f;

/// Default band Q
inline constexpr float kDefaultFilterQ = 0.707f;

/// Default band gain in dB
inline constexpr float kDefaultFilterGainDb = 0.0f;

/// Decode a raw type code read from the device. Unknown codes map to Off.
[[nodiscard]] constexpr FilterType filterTypeFromRaw(uint32_t raw) noexcept {
    return raw < kNumFilterTypes ? static_cast<FilterType>(raw) : FilterType::Off;
}

/// Display name ("Off", "Peaking", "Low Shelf", ...)
[[nodiscard]] constexpr std::string_view filterTypeName(FilterType type) noexcept {
    switch (type) {
        case FilterType::Off:       return "Off";
        case FilterType::Peaking:   return "Peaking";
        case FilterType::LowShelf:  return "Low Shelf";
        case FilterType::HighShelf: return "High Shelf";
        case FilterType::LowPass:   return "Low Pass";
        case FilterType::HighPass:  return "High Pass";
    }
    return "Off";
}

/// Short code as used in REW-style filter listings (PK, LS, HS, LP, HP)
[[nodiscard]] constexpr std::string_view filterTypeCode(FilterType type) noexcept {
    switch (type) {
        case FilterType::Off:       return "OFF";
        case FilterType::Peaking:   return "PK";
        case FilterType::LowShelf:  return "LS";
        case FilterType::HighShelf: return "HS";
        case FilterType::LowPass:   return "LP";
        case FilterType::HighPass:  return "HP";
    }
    return "OFF";
}

/// True for types whose response depends on the gain field
[[nodiscard]] constexpr bool usesGain(FilterType type) noexcept {
    return type == FilterType::Peaking ||
           type == FilterType::LowShelf ||
           type == FilterType::HighShelf;
}

// =============================================================================
// FilterParams
// =============================================================================

/// @brief One band of a channel's filter chain.
///
/// A default-constructed record is the "off" band every channel starts with.
/// When type is Off the record contributes unity magnitude whatever the
/// other fields hold.
struct FilterParams {
    FilterType type = FilterType::Off;
    float frequency = kDefaultFilterFrequency;  ///< Hz, > 0
    float Q = kDefaultFilterQ;                  ///< > 0
    float gainDb = kDefaultFilterGainDb;        ///< dB

    [[nodiscard]] bool isActive() const noexcept { return type != FilterType::Off; }

    bool operator==(const FilterParams&) const = default;
};

} // namespace DSP
} // namespace Dspi
