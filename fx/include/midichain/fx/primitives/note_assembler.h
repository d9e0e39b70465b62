// ==============================================================================
// Layer 1: Primitives
// note_assembler.h - Per-key assembly of notes from begin/end signals
// ==============================================================================
// Tracks one open note per (pitch, channel) key and closes it when its end
// signal arrives. Each key also remembers who owns it: a key opened while the
// owning Module was switched on is assembled here, a key opened while it was
// off is "bypassed" so that its signals keep flowing through untouched until
// the key closes again.
//
// No allocation: state lives in fixed arrays indexed by channel * 128 + pitch.
// ==============================================================================

#pragma once

#include <midichain/fx/core/events.h>
#include <midichain/fx/core/midi_utils.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace Midichain::Fx {

/// @brief Per-(pitch, channel) note assembly state machine.
///
/// Transitions (owned = module switched on when the key opened):
///
/// | input | key state | result                                         |
/// |-------|-----------|------------------------------------------------|
/// | begin | none      | owned ? open, Suppressed : bypassed, PassThrough |
/// | begin | open      | re-trigger: replace open note, Suppressed        |
/// | begin | bypassed  | PassThrough                                      |
/// | end   | open      | Closed with duration = end - onset, key -> none  |
/// | end   | bypassed  | PassThrough, key -> none                         |
/// | end   | none      | owned ? Dropped : PassThrough                    |
class NoteAssembler {
public:
    static constexpr size_t kNumKeys =
        static_cast<size_t>(kNumMidiChannels) * static_cast<size_t>(kMaxMidiNote + 1);

    enum class Outcome : uint8_t {
        Suppressed = 0,   ///< signal absorbed, nothing to emit yet
        PassThrough,      ///< forward the signal unchanged
        Closed,           ///< `note` holds the newly closed note
        Dropped           ///< stray end signal, emit nothing
    };

    struct Result {
        Outcome outcome = Outcome::Suppressed;
        Note note{};              ///< valid when outcome == Closed
        bool retriggered = false; ///< a begin replaced an open note
    };

    /// Handle a begin signal (pitch, velocity, channel, onset).
    /// @param owned true when the owning Module is switched on
    Result begin(const Note& signal, bool owned) noexcept {
        const size_t key = keyOf(signal.pitch, signal.channel);
        Result result;

        switch (states_[key]) {
            case KeyState::None:
                if (!owned) {
                    states_[key] = KeyState::Bypassed;
                    ++bypassedCount_;
                    result.outcome = Outcome::PassThrough;
                    return result;
                }
                states_[key] = KeyState::Open;
                ++openCount_;
                break;
            case KeyState::Open:
                result.retriggered = true;
                break;
            case KeyState::Bypassed:
                result.outcome = Outcome::PassThrough;
                return result;
        }

        open_[key] = Note{signal.pitch, signal.velocity, signal.channel, signal.onset, std::nullopt};
        result.outcome = Outcome::Suppressed;
        return result;
    }

    /// Handle an end signal. The closed note's duration is end.onset - open onset.
    /// @param owned true when the owning Module is switched on
    Result end(const Note& signal, bool owned) noexcept {
        const size_t key = keyOf(signal.pitch, signal.channel);
        Result result;

        switch (states_[key]) {
            case KeyState::Open:
                result.outcome = Outcome::Closed;
                result.note = open_[key];
                result.note.duration = signal.onset - open_[key].onset;
                states_[key] = KeyState::None;
                --openCount_;
                return result;
            case KeyState::Bypassed:
                states_[key] = KeyState::None;
                --bypassedCount_;
                result.outcome = Outcome::PassThrough;
                return result;
            case KeyState::None:
                result.outcome = owned ? Outcome::Dropped : Outcome::PassThrough;
                return result;
        }
        return result;
    }

    /// Forget every open and bypassed key.
    /// @return Number of open (owned) notes discarded
    size_t discardAll() noexcept {
        const size_t discarded = openCount_;
        states_.fill(KeyState::None);
        openCount_ = 0;
        bypassedCount_ = 0;
        return discarded;
    }

    [[nodiscard]] bool isOpen(uint8_t pitch, uint8_t channel) const noexcept {
        return states_[keyOf(pitch, channel)] == KeyState::Open;
    }

    [[nodiscard]] bool isBypassed(uint8_t pitch, uint8_t channel) const noexcept {
        return states_[keyOf(pitch, channel)] == KeyState::Bypassed;
    }

    [[nodiscard]] size_t openCount() const noexcept { return openCount_; }
    [[nodiscard]] size_t bypassedCount() const noexcept { return bypassedCount_; }

private:
    enum class KeyState : uint8_t { None = 0, Open, Bypassed };

    [[nodiscard]] static constexpr size_t keyOf(uint8_t pitch, uint8_t channel) noexcept {
        return static_cast<size_t>(channel & 0x0F) * static_cast<size_t>(kMaxMidiNote + 1) +
               static_cast<size_t>(pitch & 0x7F);
    }

    std::array<KeyState, kNumKeys> states_{};
    std::array<Note, kNumKeys> open_{};
    size_t openCount_ = 0;
    size_t bypassedCount_ = 0;
};

} // namespace Midichain::Fx
