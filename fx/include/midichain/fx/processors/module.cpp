// ==============================================================================
// Module Implementation
// ==============================================================================

#include "module.h"

#include <midichain/fx/core/log.h>

#include <utility>

namespace Midichain::Fx {

Module::Module(std::string name, Switch on)
    : name_(std::move(name)), on_(std::move(on)) {
    declare(on_);
}

void Module::declare(Controllable& controllable) {
    controllables_.push_back(&controllable);
}

bool Module::offerControl(const ControlMessage& message) {
    bool consumed = false;
    for (Controllable* controllable : controllables_) {
        // Every Controllable sees the message, even after one consumed it
        consumed = controllable->onControl(message) || consumed;
    }
    return consumed;
}

void Module::fail(Status status) {
    MIDICHAIN_LOG_ERROR("%s failed: %s (%s)", name_.c_str(), status.message.c_str(),
                        errorCodeName(status.code));
    status_ = std::move(status);
}

std::optional<Event> Module::process(std::optional<Event> input, double now) {
    std::optional<Event> routed;
    if (input.has_value()) {
        if (logLevel() <= LogLevel::Debug) {
            MIDICHAIN_LOG_DEBUG("Incoming message on %s: %s", name_.c_str(),
                                describe(*input).c_str());
        }
        routed = route(std::move(*input), now);
    }
    return schedule(std::move(routed), now);
}

std::optional<Event> Module::route(Event event, double now) {
    switch (event.type) {
        case Event::Type::Control: {
            // Controllables are serviced whether or not the module is on
            if (offerControl(event.control)) {
                return std::nullopt;
            }
            return isOn() ? transform(std::move(event), now) : std::optional<Event>(event);
        }

        case Event::Type::NoteBegin: {
            const auto result = assembler_.begin(event.note, isOn());
            if (result.retriggered) {
                MIDICHAIN_LOG_DEBUG("%s: re-trigger of pitch %u on channel %u discards open note",
                                    name_.c_str(), event.note.pitch, event.note.channel);
            }
            if (result.outcome == NoteAssembler::Outcome::PassThrough) {
                return event;
            }
            return std::nullopt;
        }

        case Event::Type::NoteEnd: {
            const auto result = assembler_.end(event.note, isOn());
            switch (result.outcome) {
                case NoteAssembler::Outcome::Closed: {
                    if (*result.note.duration < 0.0) {
                        MIDICHAIN_LOG_WARN(
                            "%s: note end for pitch %u on channel %u precedes its begin",
                            name_.c_str(), event.note.pitch, event.note.channel);
                        return std::nullopt;
                    }
                    Event closed = Event::fromNote(result.note);
                    return isOn() ? transform(std::move(closed), now) : std::optional<Event>(closed);
                }
                case NoteAssembler::Outcome::PassThrough:
                    return event;
                case NoteAssembler::Outcome::Dropped:
                    MIDICHAIN_LOG_WARN("%s: note end for pitch %u on channel %u that isn't on",
                                       name_.c_str(), event.note.pitch, event.note.channel);
                    return std::nullopt;
                case NoteAssembler::Outcome::Suppressed:
                    return std::nullopt;
            }
            return std::nullopt;
        }

        case Event::Type::Note:
            return isOn() ? transform(std::move(event), now) : std::optional<Event>(event);

        case Event::Type::EndOfStream: {
            const size_t discarded = assembler_.discardAll();
            if (discarded > 0) {
                MIDICHAIN_LOG_INFO("%s: end of stream discards %zu open note(s)",
                                   name_.c_str(), discarded);
            }
            return isOn() ? transform(std::move(event), now) : std::optional<Event>(event);
        }
    }
    return std::nullopt;
}

void Module::flush(std::vector<Event>& out, double now) {
    const size_t discarded = assembler_.discardAll();
    if (discarded > 0) {
        MIDICHAIN_LOG_INFO("%s: stop discards %zu open note(s)", name_.c_str(), discarded);
    }
    drain(out, now);
}

} // namespace Midichain::Fx
