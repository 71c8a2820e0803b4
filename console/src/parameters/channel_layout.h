#pragma once

// ==============================================================================
// Channel Layout
// ==============================================================================
// The five fixed audio paths of the device. Everything about a channel
// (band count, role, names) is derived from its index.
//
//   Index  Channel       Role    Bands  Delay/Gain/Mute  Physical
//   0      Master L      input   10     -                USB
//   1      Master R      input   10     -                USB
//   2      Out L         output  2      yes              SPDIF
//   3      Out R         output  2      yes              SPDIF
//   4      Sub           output  2      yes              PDM (Pin 10)
// ==============================================================================

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Dspi::Console {

enum class Channel : uint8_t {
    MasterLeft = 0,
    MasterRight = 1,
    OutLeft = 2,
    OutRight = 3,
    Sub = 4
};

inline constexpr size_t kNumChannels = 5;
inline constexpr size_t kMaxBands = 10;
inline constexpr size_t kInputBandCount = 10;
inline constexpr size_t kOutputBandCount = 2;

inline constexpr std::array<Channel, kNumChannels> kAllChannels = {
    Channel::MasterLeft, Channel::MasterRight, Channel::OutLeft, Channel::OutRight, Channel::Sub
};

inline constexpr std::array<Channel, 2> kInputChannels = {Channel::MasterLeft, Channel::MasterRight};

// ==============================================================================
// Value Ranges
// ==============================================================================

inline constexpr float kMinDelayMs = 0.0f;
inline constexpr float kMaxDelayMs = 170.0f;
inline constexpr float kMinPreampDb = -60.0f;
inline constexpr float kMaxPreampDb = 10.0f;

// ==============================================================================
// Derived Properties
// ==============================================================================

[[nodiscard]] constexpr size_t channelIndex(Channel ch) noexcept {
    return static_cast<size_t>(ch);
}

[[nodiscard]] constexpr bool isOutput(Channel ch) noexcept {
    return channelIndex(ch) >= 2;
}

[[nodiscard]] constexpr bool isInput(Channel ch) noexcept {
    return !isOutput(ch);
}

[[nodiscard]] constexpr size_t bandCount(Channel ch) noexcept {
    return isOutput(ch) ? kOutputBandCount : kInputBandCount;
}

[[nodiscard]] constexpr const char* channelName(Channel ch) noexcept {
    switch (ch) {
        case Channel::MasterLeft:  return "Master L";
        case Channel::MasterRight: return "Master R";
        case Channel::OutLeft:     return "Out L";
        case Channel::OutRight:    return "Out R";
        case Channel::Sub:         return "Sub";
    }
    return "?";
}

[[nodiscard]] constexpr const char* channelShortName(Channel ch) noexcept {
    switch (ch) {
        case Channel::MasterLeft:  return "ML";
        case Channel::MasterRight: return "MR";
        case Channel::OutLeft:     return "OL";
        case Channel::OutRight:    return "OR";
        case Channel::Sub:         return "SUB";
    }
    return "?";
}

/// Physical output or source the channel is bound to
[[nodiscard]] constexpr const char* channelDescriptor(Channel ch) noexcept {
    switch (ch) {
        case Channel::MasterLeft:
        case Channel::MasterRight: return "USB";
        case Channel::OutLeft:
        case Channel::OutRight:    return "SPDIF";
        case Channel::Sub:         return "PDM (Pin 10)";
    }
    return "?";
}

[[nodiscard]] constexpr std::optional<Channel> channelFromIndex(size_t index) noexcept {
    if (index >= kNumChannels) return std::nullopt;
    return static_cast<Channel>(index);
}

/// Accepts an index ("2") or a short name ("OL", case-insensitive)
[[nodiscard]] inline std::optional<Channel> parseChannel(std::string_view text) {
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return channelFromIndex(index);
    }

    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (Channel ch : kAllChannels) {
        if (upper == channelShortName(ch)) return ch;
    }
    return std::nullopt;
}

} // namespace Dspi::Console
