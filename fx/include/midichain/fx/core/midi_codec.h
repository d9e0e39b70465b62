// ==============================================================================
// Layer 0: Core Utility - MIDI byte codec
// ==============================================================================
// MidiDecoder turns raw MIDI bytes into pipeline events (note signals and
// control messages). encodeEvent() renders events back into timestamped
// MIDI messages for an output port.
//
// Only channel voice messages that the pipeline understands are decoded.
// Everything else is skipped and counted.
// ==============================================================================

#pragma once

#include "events.h"
#include "log.h"
#include "midi_utils.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Midichain {
namespace Fx {

// =============================================================================
// MidiDecoder
// =============================================================================

/// @brief Stateful MIDI byte parser.
///
/// Handles running status for channel messages. Note-on with velocity 0 is
/// decoded as a note end, per MIDI convention. Decoding never assembles
/// notes; that is the job of the Modules downstream.
///
/// @code
/// MidiDecoder decoder;
/// std::vector<Event> events;
/// const uint8_t bytes[] = {0x90, 60, 100, 0x80, 60, 0};
/// decoder.decode(now, bytes, events);  // NoteBegin, NoteEnd
/// @endcode
class MidiDecoder {
public:
    /// Decode @p bytes received at @p timestamp, appending events to @p out.
    /// @return Number of events appended
    size_t decode(double timestamp, std::span<const uint8_t> bytes, std::vector<Event>& out) {
        size_t appended = 0;
        size_t i = 0;

        while (i < bytes.size()) {
            uint8_t status = bytes[i];

            if (isStatusByte(status)) {
                ++i;
                if (statusType(status) == kStatusSystem) {
                    MIDICHAIN_LOG_DEBUG("Skipping system message 0x%02X", status);
                    ++skipped_;
                    // Real-time bytes (0xF8-0xFF) may appear anywhere and carry no data
                    if (status < 0xF8) {
                        runningStatus_ = 0;
                        while (i < bytes.size() && !isStatusByte(bytes[i])) {
                            ++i;
                        }
                        // End of exclusive belongs to the message it closes
                        if (status == 0xF0 && i < bytes.size() && bytes[i] == 0xF7) {
                            ++i;
                        }
                    }
                    continue;
                }
                runningStatus_ = status;
            } else if (runningStatus_ != 0) {
                status = runningStatus_;
            } else {
                MIDICHAIN_LOG_WARN("Unparsed data byte %u without status", bytes[i]);
                ++skipped_;
                ++i;
                continue;
            }

            const int needed = dataBytesForStatus(status);
            if (i + static_cast<size_t>(needed) > bytes.size()) {
                MIDICHAIN_LOG_WARN("Truncated MIDI message with status 0x%02X", status);
                ++skipped_;
                break;
            }

            std::array<uint8_t, 2> data{};
            bool malformed = false;
            for (int d = 0; d < needed; ++d) {
                data[static_cast<size_t>(d)] = bytes[i + static_cast<size_t>(d)];
                malformed = malformed || isStatusByte(data[static_cast<size_t>(d)]);
            }
            if (malformed) {
                MIDICHAIN_LOG_WARN("Status byte inside data of message 0x%02X", status);
                ++skipped_;
                while (i < bytes.size() && !isStatusByte(bytes[i])) {
                    ++i;
                }
                continue;
            }
            i += static_cast<size_t>(needed);

            if (decodeChannelMessage(timestamp, status, data, out)) {
                ++appended;
            }
        }
        return appended;
    }

    /// Clear running status (e.g. after a port reconnect).
    void reset() noexcept { runningStatus_ = 0; }

    /// Messages skipped since construction (unsupported, truncated or malformed).
    [[nodiscard]] size_t skippedCount() const noexcept { return skipped_; }

private:
    bool decodeChannelMessage(double timestamp, uint8_t status,
                              const std::array<uint8_t, 2>& data, std::vector<Event>& out) {
        const uint8_t channel = statusChannel(status);
        switch (statusType(status)) {
            case kStatusNoteOn:
                if (data[1] == 0) {
                    out.push_back(Event::noteEnd(data[0], 0, channel, timestamp));
                } else {
                    out.push_back(Event::noteBegin(data[0], data[1], channel, timestamp));
                }
                return true;
            case kStatusNoteOff:
                out.push_back(Event::noteEnd(data[0], data[1], channel, timestamp));
                return true;
            case kStatusControlChange:
                out.push_back(Event::fromControl(ControlMessage{data[0], channel, data[1], timestamp}));
                return true;
            default:
                MIDICHAIN_LOG_WARN("Unparsed bytes with status 0x%02X and data (%u, %u)",
                                   status, data[0], data[1]);
                ++skipped_;
                return false;
        }
    }

    uint8_t runningStatus_ = 0;
    size_t skipped_ = 0;
};

// =============================================================================
// Encoding
// =============================================================================

/// @brief One outgoing MIDI message scheduled at an absolute time.
struct TimedMidiMessage {
    double time = 0.0;
    std::array<uint8_t, 3> bytes{};
    uint8_t size = 0;

    bool operator==(const TimedMidiMessage&) const = default;
};

/// Render @p event as MIDI messages appended to @p out.
///
/// A closed Note yields note-on at its onset and note-off at onset + duration.
/// An open Note or NoteBegin yields only the note-on. EndOfStream yields
/// nothing. @p overrideChannel, when set, replaces every channel nibble.
///
/// @return Number of messages appended
inline size_t encodeEvent(const Event& event, std::vector<TimedMidiMessage>& out,
                          std::optional<uint8_t> overrideChannel = std::nullopt) {
    auto channelFor = [&](uint8_t channel) -> uint8_t {
        return overrideChannel.has_value() ? static_cast<uint8_t>(*overrideChannel & 0x0F) : channel;
    };
    auto push = [&](double time, uint8_t type, uint8_t channel, uint8_t a, uint8_t b) {
        out.push_back(TimedMidiMessage{time, {makeStatus(type, channelFor(channel)), a, b}, 3});
    };

    switch (event.type) {
        case Event::Type::Control:
            push(event.control.timestamp, kStatusControlChange, event.control.channel,
                 event.control.controller, event.control.value);
            return 1;
        case Event::Type::NoteBegin:
            push(event.note.onset, kStatusNoteOn, event.note.channel, event.note.pitch,
                 event.note.velocity);
            return 1;
        case Event::Type::NoteEnd:
            push(event.note.onset, kStatusNoteOff, event.note.channel, event.note.pitch,
                 event.note.velocity);
            return 1;
        case Event::Type::Note:
            push(event.note.onset, kStatusNoteOn, event.note.channel, event.note.pitch,
                 event.note.velocity);
            if (!event.note.isClosed()) {
                return 1;
            }
            push(event.note.onset + *event.note.duration, kStatusNoteOff, event.note.channel,
                 event.note.pitch, event.note.velocity);
            return 2;
        case Event::Type::EndOfStream:
            return 0;
    }
    return 0;
}

} // namespace Fx
} // namespace Midichain
