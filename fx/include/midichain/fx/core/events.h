// ==============================================================================
// Layer 0: Core Utility - Pipeline Events
// ==============================================================================
// Value types flowing through a Chain: control messages, note signals,
// assembled notes and the end-of-stream marker.
//
// Times are seconds on the clock of the Chain that carries the event.
// ==============================================================================

#pragma once

#include "midi_utils.h"
#include "status.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace Midichain {
namespace Fx {

// =============================================================================
// ControlMessage
// =============================================================================

/// @brief MIDI control change. Immutable once constructed.
struct ControlMessage {
    uint8_t controller = 0;   ///< Controller number (0-127)
    uint8_t channel = 0;      ///< MIDI channel (0-15)
    uint8_t value = 0;        ///< Control value (0-127)
    double timestamp = 0.0;   ///< Arrival time in seconds

    bool operator==(const ControlMessage&) const = default;
};

/// Control messages are ordered by timestamp only.
[[nodiscard]] inline bool earlierThan(const ControlMessage& a, const ControlMessage& b) noexcept {
    return a.timestamp < b.timestamp;
}

// =============================================================================
// Note
// =============================================================================

/// @brief A note assembled from a begin and an end signal.
///
/// duration is empty while the note is still sounding ("open") and filled in
/// once its end signal arrives ("closed"). Only closed notes travel
/// downstream as Event::Type::Note.
struct Note {
    uint8_t pitch = 0;                ///< MIDI note number (0-127)
    uint8_t velocity = 0;             ///< MIDI velocity (0-127)
    uint8_t channel = 0;              ///< MIDI channel (0-15)
    double onset = 0.0;               ///< Begin time in seconds
    std::optional<double> duration;   ///< Seconds from onset to end, if closed

    [[nodiscard]] bool isClosed() const noexcept { return duration.has_value(); }

    bool operator==(const Note&) const = default;
};

// =============================================================================
// Event
// =============================================================================

/// @brief Tagged union of everything a Module can receive or emit.
///
/// NoteBegin and NoteEnd carry pitch, velocity and channel in `note`, with
/// note.onset holding the signal time and no duration. EndOfStream uses
/// `timestamp`. Use the static constructors to build events.
struct Event {
    enum class Type : uint8_t {
        Control = 0,   ///< control change, payload in `control`
        NoteBegin,     ///< raw note-on signal
        NoteEnd,       ///< raw note-off signal
        Note,          ///< assembled note, payload in `note`
        EndOfStream    ///< source exhausted
    };

    Type type = Type::EndOfStream;
    ControlMessage control{};
    Midichain::Fx::Note note{};
    double timestamp = 0.0;

    [[nodiscard]] static Event fromControl(const ControlMessage& message) noexcept {
        Event event;
        event.type = Type::Control;
        event.control = message;
        return event;
    }

    [[nodiscard]] static Event fromNote(const Midichain::Fx::Note& assembled) {
        Event event;
        event.type = Type::Note;
        event.note = assembled;
        return event;
    }

    [[nodiscard]] static Event noteBegin(uint8_t pitch, uint8_t velocity, uint8_t channel,
                                         double time) noexcept {
        Event event;
        event.type = Type::NoteBegin;
        event.note = Midichain::Fx::Note{pitch, velocity, channel, time, std::nullopt};
        return event;
    }

    [[nodiscard]] static Event noteEnd(uint8_t pitch, uint8_t velocity, uint8_t channel,
                                       double time) noexcept {
        Event event;
        event.type = Type::NoteEnd;
        event.note = Midichain::Fx::Note{pitch, velocity, channel, time, std::nullopt};
        return event;
    }

    [[nodiscard]] static Event endOfStream(double time) noexcept {
        Event event;
        event.type = Type::EndOfStream;
        event.timestamp = time;
        return event;
    }

    /// Ordering time: control timestamp, note onset, signal time or end time.
    [[nodiscard]] double time() const noexcept {
        switch (type) {
            case Type::Control:
                return control.timestamp;
            case Type::NoteBegin:
            case Type::NoteEnd:
            case Type::Note:
                return note.onset;
            case Type::EndOfStream:
                return timestamp;
        }
        return timestamp;
    }

    /// Move the event @p offset seconds later (onset for notes).
    void shift(double offset) noexcept {
        switch (type) {
            case Type::Control:
                control.timestamp += offset;
                break;
            case Type::NoteBegin:
            case Type::NoteEnd:
            case Type::Note:
                note.onset += offset;
                break;
            case Type::EndOfStream:
                timestamp += offset;
                break;
        }
    }

    [[nodiscard]] bool isControl() const noexcept { return type == Type::Control; }
    [[nodiscard]] bool isClosedNote() const noexcept {
        return type == Type::Note && note.isClosed();
    }
    [[nodiscard]] bool isEndOfStream() const noexcept { return type == Type::EndOfStream; }

    bool operator==(const Event&) const = default;
};

[[nodiscard]] constexpr const char* eventTypeName(Event::Type type) noexcept {
    switch (type) {
        case Event::Type::Control:     return "Control";
        case Event::Type::NoteBegin:   return "NoteBegin";
        case Event::Type::NoteEnd:     return "NoteEnd";
        case Event::Type::Note:        return "Note";
        case Event::Type::EndOfStream: return "EndOfStream";
    }
    return "?";
}

/// One-line description for log output.
[[nodiscard]] inline std::string describe(const Event& event) {
    char buf[160];
    switch (event.type) {
        case Event::Type::Control:
            std::snprintf(buf, sizeof(buf), "Control(t=%.3f, cc=%u, value=%u, channel=%u)",
                          event.control.timestamp, event.control.controller,
                          event.control.value, event.control.channel);
            break;
        case Event::Type::NoteBegin:
        case Event::Type::NoteEnd:
            std::snprintf(buf, sizeof(buf), "%s(t=%.3f, pitch=%u, velocity=%u, channel=%u)",
                          eventTypeName(event.type), event.note.onset, event.note.pitch,
                          event.note.velocity, event.note.channel);
            break;
        case Event::Type::Note:
            if (event.note.isClosed()) {
                std::snprintf(buf, sizeof(buf),
                              "Note(t=%.3f, pitch=%u, velocity=%u, duration=%.3f, channel=%u)",
                              event.note.onset, event.note.pitch, event.note.velocity,
                              *event.note.duration, event.note.channel);
            } else {
                std::snprintf(buf, sizeof(buf),
                              "Note(t=%.3f, pitch=%u, velocity=%u, open, channel=%u)",
                              event.note.onset, event.note.pitch, event.note.velocity,
                              event.note.channel);
            }
            break;
        case Event::Type::EndOfStream:
            std::snprintf(buf, sizeof(buf), "EndOfStream(t=%.3f)", event.timestamp);
            break;
    }
    return buf;
}

// =============================================================================
// Validation
// =============================================================================

namespace detail {

[[nodiscard]] inline Status invalid(const char* what, int got) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s out of range: %d", what, got);
    return Status::error(ErrorCode::Validation, buf);
}

[[nodiscard]] inline Status checkTime(double time) {
    if (!std::isfinite(time)) {
        return Status::error(ErrorCode::Validation, "timestamp is not finite");
    }
    return Status::success();
}

} // namespace detail

[[nodiscard]] inline Status validate(const ControlMessage& message) {
    if (!isValidController(message.controller)) {
        return detail::invalid("controller", message.controller);
    }
    if (!isValidChannel(message.channel)) {
        return detail::invalid("channel", message.channel);
    }
    if (!isValidControlValue(message.value)) {
        return detail::invalid("control value", message.value);
    }
    return detail::checkTime(message.timestamp);
}

[[nodiscard]] inline Status validate(const Note& note) {
    if (!isValidNote(note.pitch)) {
        return detail::invalid("pitch", note.pitch);
    }
    if (!isValidVelocity(note.velocity)) {
        return detail::invalid("velocity", note.velocity);
    }
    if (!isValidChannel(note.channel)) {
        return detail::invalid("channel", note.channel);
    }
    if (note.duration.has_value() && !(*note.duration >= 0.0 && std::isfinite(*note.duration))) {
        return Status::error(ErrorCode::Validation, "note duration must be finite and >= 0");
    }
    return detail::checkTime(note.onset);
}

[[nodiscard]] inline Status validate(const Event& event) {
    switch (event.type) {
        case Event::Type::Control:
            return validate(event.control);
        case Event::Type::NoteBegin:
        case Event::Type::NoteEnd:
            if (event.note.duration.has_value()) {
                return Status::error(ErrorCode::Validation, "note signal carries a duration");
            }
            return validate(event.note);
        case Event::Type::Note:
            return validate(event.note);
        case Event::Type::EndOfStream:
            return detail::checkTime(event.timestamp);
    }
    return Status::error(ErrorCode::Validation, "unknown event type");
}

// =============================================================================
// Checked construction
// =============================================================================
// Each factory range-checks its arguments and leaves @p out untouched on
// failure.

[[nodiscard]] inline Status makeControlMessage(int controller, int channel, int value,
                                               double timestamp, ControlMessage& out) {
    if (!isValidController(controller)) return detail::invalid("controller", controller);
    if (!isValidChannel(channel)) return detail::invalid("channel", channel);
    if (!isValidControlValue(value)) return detail::invalid("control value", value);
    if (Status status = detail::checkTime(timestamp); !status.ok()) return status;

    out = ControlMessage{static_cast<uint8_t>(controller), static_cast<uint8_t>(channel),
                         static_cast<uint8_t>(value), timestamp};
    return Status::success();
}

namespace detail {

[[nodiscard]] inline Status checkNoteFields(int pitch, int velocity, int channel, double time) {
    if (!isValidNote(pitch)) return invalid("pitch", pitch);
    if (!isValidVelocity(velocity)) return invalid("velocity", velocity);
    if (!isValidChannel(channel)) return invalid("channel", channel);
    return checkTime(time);
}

} // namespace detail

[[nodiscard]] inline Status makeNoteBegin(int pitch, int velocity, int channel, double time,
                                          Event& out) {
    if (Status status = detail::checkNoteFields(pitch, velocity, channel, time); !status.ok()) {
        return status;
    }
    out = Event::noteBegin(static_cast<uint8_t>(pitch), static_cast<uint8_t>(velocity),
                           static_cast<uint8_t>(channel), time);
    return Status::success();
}

[[nodiscard]] inline Status makeNoteEnd(int pitch, int velocity, int channel, double time,
                                        Event& out) {
    if (Status status = detail::checkNoteFields(pitch, velocity, channel, time); !status.ok()) {
        return status;
    }
    out = Event::noteEnd(static_cast<uint8_t>(pitch), static_cast<uint8_t>(velocity),
                         static_cast<uint8_t>(channel), time);
    return Status::success();
}

[[nodiscard]] inline Status makeNote(int pitch, int velocity, int channel, double onset,
                                     std::optional<double> duration, Note& out) {
    if (Status status = detail::checkNoteFields(pitch, velocity, channel, onset); !status.ok()) {
        return status;
    }
    Note note{static_cast<uint8_t>(pitch), static_cast<uint8_t>(velocity),
              static_cast<uint8_t>(channel), onset, duration};
    if (Status status = validate(note); !status.ok()) {
        return status;
    }
    out = note;
    return Status::success();
}

} // namespace Fx
} // namespace Midichain
