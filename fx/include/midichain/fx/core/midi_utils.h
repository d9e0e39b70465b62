// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI value ranges and status byte helpers
// ==============================================================================
// No allocation, no I/O. constexpr throughout.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Midichain {
namespace Fx {

// ==============================================================================
// Constants
// ==============================================================================

/// Minimum valid MIDI note number
inline constexpr int kMinMidiNote = 0;

/// Maximum valid MIDI note number
inline constexpr int kMaxMidiNote = 127;

/// Minimum valid MIDI velocity
inline constexpr int kMinMidiVelocity = 0;

/// Maximum valid MIDI velocity
inline constexpr int kMaxMidiVelocity = 127;

/// Largest controller number / control value
inline constexpr int kMaxControllerNumber = 127;
inline constexpr int kMaxControlValue = 127;

/// Number of MIDI channels (0-15)
inline constexpr int kNumMidiChannels = 16;

/// Control values at or above this read as "on" for switches
inline constexpr int kSwitchOnThreshold = 64;

/// Status nibbles (upper four bits of a channel status byte)
inline constexpr uint8_t kStatusNoteOff = 0x80;
inline constexpr uint8_t kStatusNoteOn = 0x90;
inline constexpr uint8_t kStatusPolyPressure = 0xA0;
inline constexpr uint8_t kStatusControlChange = 0xB0;
inline constexpr uint8_t kStatusProgramChange = 0xC0;
inline constexpr uint8_t kStatusChannelPressure = 0xD0;
inline constexpr uint8_t kStatusPitchBend = 0xE0;
inline constexpr uint8_t kStatusSystem = 0xF0;

// ==============================================================================
// Functions
// ==============================================================================

[[nodiscard]] constexpr bool isValidNote(int note) noexcept {
    return note >= kMinMidiNote && note <= kMaxMidiNote;
}

[[nodiscard]] constexpr bool isValidVelocity(int velocity) noexcept {
    return velocity >= kMinMidiVelocity && velocity <= kMaxMidiVelocity;
}

[[nodiscard]] constexpr bool isValidController(int controller) noexcept {
    return controller >= 0 && controller <= kMaxControllerNumber;
}

[[nodiscard]] constexpr bool isValidControlValue(int value) noexcept {
    return value >= 0 && value <= kMaxControlValue;
}

[[nodiscard]] constexpr bool isValidChannel(int channel) noexcept {
    return channel >= 0 && channel < kNumMidiChannels;
}

/// True for bytes 0x80-0xFF.
[[nodiscard]] constexpr bool isStatusByte(uint8_t byte) noexcept {
    return (byte & 0x80) != 0;
}

/// Upper nibble of a status byte, e.g. 0x93 -> 0x90.
[[nodiscard]] constexpr uint8_t statusType(uint8_t status) noexcept {
    return static_cast<uint8_t>(status & 0xF0);
}

/// Lower nibble of a channel status byte, e.g. 0x93 -> 3.
[[nodiscard]] constexpr uint8_t statusChannel(uint8_t status) noexcept {
    return static_cast<uint8_t>(status & 0x0F);
}

[[nodiscard]] constexpr uint8_t makeStatus(uint8_t type, uint8_t channel) noexcept {
    return static_cast<uint8_t>((type & 0xF0) | (channel & 0x0F));
}

/// Number of data bytes following a channel status byte (0 for system status).
[[nodiscard]] constexpr int dataBytesForStatus(uint8_t status) noexcept {
    switch (statusType(status)) {
        case kStatusProgramChange:
        case kStatusChannelPressure:
            return 1;
        case kStatusSystem:
            return 0;
        default:
            return 2;
    }
}

}  // namespace Fx
}  // namespace Midichain
