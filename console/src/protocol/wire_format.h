#pragma once

// ==============================================================================
// Wire Format - Control Transfer Payload Codec
// ==============================================================================
// All multi-byte values are little-endian on the wire, independent of the
// host byte order. Floats are IEEE-754 single precision.
//
// Filter upload record (kSetFilter, 16 bytes):
//   [0] channel  [1] band  [2] type  [3] reserved (0)
//   [4..7] frequency f32  [8..11] Q f32  [12..15] gain f32
//
// Filter read-back (kGetFilterField) is one field per request. Type comes
// back as u32, the other fields as f32.
//
// Combined status (kGetStatus, wValue 9, 12 bytes):
//   [0..9] five u16 peak levels (0-65535 -> 0.0-1.0)
//   [10] core 0 load %  [11] core 1 load %
// ==============================================================================

#include "console_ids.h"

#include <dspi/dsp/core/filter_params.h>

#include <array>
#include <bit>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Dspi::Console {

// ==============================================================================
// Byte Writer / Reader
// ==============================================================================

class ByteWriter {
public:
    std::vector<uint8_t> data;

    void writeU8(uint8_t val) {
        data.push_back(val);
    }

    void writeU16(uint16_t val) {
        data.push_back(static_cast<uint8_t>(val & 0xFF));
        data.push_back(static_cast<uint8_t>(val >> 8));
    }

    void writeU32(uint32_t val) {
        for (int shift = 0; shift < 32; shift += 8) {
            data.push_back(static_cast<uint8_t>((val >> shift) & 0xFF));
        }
    }

    void writeFloat(float val) {
        writeU32(std::bit_cast<uint32_t>(val));
    }
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> bytes) noexcept
        : bytes_(bytes) {}

    [[nodiscard]] size_t remaining() const noexcept { return bytes_.size() - pos_; }

    bool readU8(uint8_t& out) noexcept {
        if (remaining() < 1) return false;
        out = bytes_[pos_++];
        return true;
    }

    bool readU16(uint16_t& out) noexcept {
        if (remaining() < 2) return false;
        out = static_cast<uint16_t>(bytes_[pos_] | (bytes_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool readU32(uint32_t& out) noexcept {
        if (remaining() < 4) return false;
        out = 0;
        for (int i = 3; i >= 0; --i) {
            out = (out << 8) | bytes_[pos_ + static_cast<size_t>(i)];
        }
        pos_ += 4;
        return true;
    }

    bool readFloat(float& out) noexcept {
        uint32_t bits = 0;
        if (!readU32(bits)) return false;
        out = std::bit_cast<float>(bits);
        return true;
    }

private:
    std::span<const uint8_t> bytes_;
    size_t pos_ = 0;
};

// ==============================================================================
// Filter Records
// ==============================================================================

/// wValue of a kGetFilterField request
[[nodiscard]] constexpr uint16_t filterFieldAddress(uint8_t channel, uint8_t band, FilterField field) noexcept {
    return static_cast<uint16_t>((channel << 8) | ((band & 0x0F) << 4) | (field & 0x0F));
}

[[nodiscard]] inline std::vector<uint8_t> encodeFilterRecord(
    uint8_t channel, uint8_t band, const DSP::FilterParams& params) {
    ByteWriter w;
    w.data.reserve(kFilterRecordSize);
    w.writeU8(channel);
    w.writeU8(band);
    w.writeU8(static_cast<uint8_t>(params.type));
    w.writeU8(0);
    w.writeFloat(params.frequency);
    w.writeFloat(params.Q);
    w.writeFloat(params.gainDb);
    return std::move(w.data);
}

// ==============================================================================
// Scalars
// ==============================================================================

[[nodiscard]] inline std::vector<uint8_t> encodeFloat(float value) {
    ByteWriter w;
    w.writeFloat(value);
    return std::move(w.data);
}

[[nodiscard]] inline std::vector<uint8_t> encodeFlag(bool value) {
    return {static_cast<uint8_t>(value ? 1 : 0)};
}

[[nodiscard]] inline std::optional<float> decodeFloat(std::span<const uint8_t> bytes) noexcept {
    ByteReader r(bytes);
    float value = 0.0f;
    if (!r.readFloat(value)) return std::nullopt;
    return value;
}

[[nodiscard]] inline std::optional<uint32_t> decodeU32(std::span<const uint8_t> bytes) noexcept {
    ByteReader r(bytes);
    uint32_t value = 0;
    if (!r.readU32(value)) return std::nullopt;
    return value;
}

/// Any non-zero byte reads as true
[[nodiscard]] inline std::optional<bool> decodeFlag(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) return std::nullopt;
    return bytes[0] != 0;
}

// ==============================================================================
// Combined Status
// ==============================================================================

/// Live meters and core load. Replaced wholesale on every poll.
struct SystemStatus {
    std::array<float, kNumPeakMeters> peaks{};     // 0.0 - 1.0
    std::array<uint8_t, kNumCores> cpuLoad{};      // percent

    bool operator==(const SystemStatus&) const = default;
};

[[nodiscard]] inline std::optional<SystemStatus> decodeStatus(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() < kStatusRecordSize) return std::nullopt;

    ByteReader r(bytes);
    SystemStatus status;
    for (auto& peak : status.peaks) {
        uint16_t raw = 0;
        if (!r.readU16(raw)) return std::nullopt;
        peak = static_cast<float>(raw) / 65535.0f;
    }
    for (auto& load : status.cpuLoad) {
        if (!r.readU8(load)) return std::nullopt;
    }
    return status;
}

} // namespace Dspi::Console
