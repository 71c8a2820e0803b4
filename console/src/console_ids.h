#pragma once

// ==============================================================================
// Device Identifiers and Vendor Request Table
// ==============================================================================
// USB identity of the DSPi board and the opcodes of its vendor-class control
// requests. These values are fixed by the device firmware.
//
// IMPORTANT: Never renumber an opcode. Released firmware answers exactly
// these values.
// ==============================================================================

#include <cstddef>
#include <cstdint>

namespace Dspi::Console {

// ==============================================================================
// USB Identity
// ==============================================================================

inline constexpr uint16_t kDefaultVendorId = 0x2e8a;
inline constexpr uint16_t kDefaultProductId = 0xfeaa;

/// All requests address interface 0 (wIndex)
inline constexpr uint16_t kControlInterface = 0;

/// bmRequestType: vendor, recipient interface
inline constexpr uint8_t kRequestTypeOut = 0x41;   // host -> device
inline constexpr uint8_t kRequestTypeIn = 0xC1;    // device -> host

// ==============================================================================
// Opcodes (bRequest)
// ==============================================================================
// Set/get pairs are adjacent. Flash commands (0x51-0x53) are issued as
// device->host requests so the one-byte result rides on the response.
// ==============================================================================

enum Opcode : uint8_t {
    kSetFilter        = 0x42,   // wValue 0, 16-byte filter record
    kGetFilterField   = 0x43,   // wValue ch<<8 | band<<4 | field, 4 bytes
    kSetPreamp        = 0x44,   // f32 dB
    kGetPreamp        = 0x45,
    kSetBypass        = 0x46,   // u8
    kGetBypass        = 0x47,
    kSetDelay         = 0x48,   // wValue channel, f32 ms
    kGetDelay         = 0x49,
    kGetStatus        = 0x50,   // wValue = StatusSelector
    kSaveParams       = 0x51,
    kLoadParams       = 0x52,
    kFactoryReset     = 0x53,
    kSetChannelGain   = 0x54,   // wValue channel, f32 dB
    kGetChannelGain   = 0x55,
    kSetChannelMute   = 0x56,   // wValue channel, u8
    kGetChannelMute   = 0x57,
};

/// wValue of a kGetStatus request
enum StatusSelector : uint16_t {
    kStatusPdmRingOverruns  = 3,
    kStatusPdmRingUnderruns = 4,
    kStatusPdmDmaOverruns   = 5,
    kStatusPdmDmaUnderruns  = 6,
    kStatusSpdifOverruns    = 7,
    kStatusSpdifUnderruns   = 8,
    kStatusCombined         = 9,   // 5 peaks + 2 core loads
};

/// Field index packed into the low nibble of a kGetFilterField wValue
enum FilterField : uint8_t {
    kFilterFieldType      = 0,   // u32
    kFilterFieldFrequency = 1,   // f32
    kFilterFieldQ         = 2,   // f32
    kFilterFieldGain      = 3,   // f32
};

// ==============================================================================
// Payload Sizes
// ==============================================================================

inline constexpr size_t kFilterRecordSize = 16;
inline constexpr size_t kScalarSize = 4;
inline constexpr size_t kFlagSize = 1;
inline constexpr size_t kStatusRecordSize = 12;
inline constexpr size_t kCounterSize = 4;
inline constexpr size_t kFlashResultSize = 1;

/// Peak meters reported by kStatusCombined, one per physical channel
inline constexpr size_t kNumPeakMeters = 5;

/// Core-load bytes reported by kStatusCombined
inline constexpr size_t kNumCores = 2;

} // namespace Dspi::Console
