// ==============================================================================
// Layer 2: Processor - Module
// ==============================================================================
// Abstract pipeline stage. The base class supplies everything common to all
// effects:
// - interception of control messages addressed to the module's Controllables
// - note assembly from begin/end signals (one open note per pitch/channel)
// - the on/off gate (bypass while off, Controllables still serviced)
// - end-of-stream and stop-time flushing
//
// An effect overrides transform() for per-event behavior, and schedule() /
// drain() when it emits events at a later tick than they arrived.
// ==============================================================================

#pragma once

#include <midichain/fx/core/events.h>
#include <midichain/fx/core/status.h>
#include <midichain/fx/primitives/controllable.h>
#include <midichain/fx/primitives/note_assembler.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Midichain::Fx {

// =============================================================================
// Topology descriptors
// =============================================================================

enum class ModuleRole : uint8_t {
    Source = 0,   ///< produces events, must be first in a Chain
    Processor,    ///< transforms events
    Sink          ///< consumes events, must be last in a Chain
};

/// Bit set of event kinds, used to check that adjacent Modules fit together.
using EventMask = uint8_t;

inline constexpr EventMask kControlEvents = 1u << 0;
inline constexpr EventMask kNoteSignalEvents = 1u << 1;
inline constexpr EventMask kNoteEvents = 1u << 2;
inline constexpr EventMask kEndOfStreamEvents = 1u << 3;
inline constexpr EventMask kAllEvents =
    kControlEvents | kNoteSignalEvents | kNoteEvents | kEndOfStreamEvents;

[[nodiscard]] constexpr EventMask eventMaskOf(Event::Type type) noexcept {
    switch (type) {
        case Event::Type::Control:     return kControlEvents;
        case Event::Type::NoteBegin:
        case Event::Type::NoteEnd:     return kNoteSignalEvents;
        case Event::Type::Note:        return kNoteEvents;
        case Event::Type::EndOfStream: return kEndOfStreamEvents;
    }
    return 0;
}

[[nodiscard]] constexpr const char* moduleRoleName(ModuleRole role) noexcept {
    switch (role) {
        case ModuleRole::Source:    return "source";
        case ModuleRole::Processor: return "processor";
        case ModuleRole::Sink:      return "sink";
    }
    return "?";
}

// =============================================================================
// Module
// =============================================================================

/// @brief Base class of every pipeline stage.
///
/// process() takes zero or one event per tick and returns zero or one event.
/// A Module may hold an event back (an open note waiting for its end) or emit
/// one that did not arrive this tick (a deferred release).
///
/// Per tick, in order:
/// 1. A control message is offered to every declared Controllable. If any of
///    them consumed it, it goes no further.
/// 2. Note signals go through the note assembler; a closed note replaces the
///    end signal.
/// 3. While switched on, the remaining event goes through transform().
///    While off it is passed through unchanged.
/// 4. schedule() sees the result (or nothing) every tick, on or off.
///
/// @par Thread Safety
/// Single writer, single reader: Controllable updates and process() for one
/// Module must never run concurrently. The Chain guarantees this by running
/// every Module on one thread; any multi-threaded driver must serialize
/// calls per Module.
class Module {
public:
    explicit Module(std::string name, Switch on = Switch(true));
    virtual ~Module() = default;

    // Declared Controllables point into the Module: neither copyable nor movable
    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;
    Module(Module&&) = delete;
    Module& operator=(Module&&) = delete;

    /// Run one tick.
    /// @param input The event arriving this tick, if any
    /// @param now   Current time on the Chain's clock (seconds)
    virtual std::optional<Event> process(std::optional<Event> input, double now);

    /// Stop-time flush: discard open notes, then append any events the module
    /// still holds, in the order they would have been emitted.
    void flush(std::vector<Event>& out, double now);

    [[nodiscard]] virtual ModuleRole role() const noexcept { return ModuleRole::Processor; }
    [[nodiscard]] virtual EventMask accepts() const noexcept { return kAllEvents; }
    [[nodiscard]] virtual EventMask produces() const noexcept { return kAllEvents; }

    /// True when the module asks its Chain to stop at the next tick boundary.
    [[nodiscard]] virtual bool requestsStop() const noexcept { return false; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] bool isOn() const noexcept { return on_.value(); }
    [[nodiscard]] Switch& on() noexcept { return on_; }

    /// Controllables in declaration order; the on switch is always first.
    [[nodiscard]] const std::vector<Controllable*>& controllables() const noexcept {
        return controllables_;
    }

    /// Offer @p message to every declared Controllable.
    /// @return true when at least one of them consumed it
    bool offerControl(const ControlMessage& message);

    [[nodiscard]] const NoteAssembler& assembler() const noexcept { return assembler_; }

    /// True once the module reported an unrecoverable error.
    [[nodiscard]] bool failed() const noexcept { return !status_.ok(); }
    [[nodiscard]] const Status& status() const noexcept { return status_; }

protected:
    /// Register a Controllable owned by the derived class (call from its constructor).
    void declare(Controllable& controllable);

    /// Effect-specific transform, called only while switched on. Receives
    /// closed notes, unconsumed control messages, end-of-stream and any open
    /// note delivered as Event::Type::Note.
    virtual std::optional<Event> transform(Event event, double /*now*/) { return event; }

    /// Output stage, called every tick with what this tick produced.
    virtual std::optional<Event> schedule(std::optional<Event> ready, double /*now*/) {
        return ready;
    }

    /// Append held events during flush().
    virtual void drain(std::vector<Event>& /*out*/, double /*now*/) {}

    /// Report an unrecoverable error; the Chain stops after the current tick.
    void fail(Status status);

private:
    std::optional<Event> route(Event event, double now);

    std::string name_;
    Switch on_;
    NoteAssembler assembler_;
    std::vector<Controllable*> controllables_;
    Status status_;
};

} // namespace Midichain::Fx
