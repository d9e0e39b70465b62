// ==============================================================================
// Layer 4: Effect - BufferDelay
// ==============================================================================
// Records closed notes and control messages until a trigger control message
// arrives, then replays the recording: the first recorded event starts `gap`
// seconds after the trigger and the rest keep their relative timing.
//
// The trigger itself passes through immediately. A recording that is never
// triggered is discarded when the chain stops.
// ==============================================================================

#pragma once

#include <midichain/fx/core/log.h>
#include <midichain/fx/primitives/controllable.h>
#include <midichain/fx/processors/deferred_module.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace Midichain::Fx {

/// @brief Control message (address and exact value) that starts a replay.
struct ReplayTrigger {
    uint8_t controller = 4;   ///< 4 is the usual foot pedal controller
    uint8_t channel = 0;
    uint8_t value = 127;

    [[nodiscard]] bool matches(const ControlMessage& message) const noexcept {
        return message.controller == controller && message.channel == channel &&
               message.value == value;
    }
};

class BufferDelay : public DeferredModule {
public:
    explicit BufferDelay(ReplayTrigger trigger = {}, Parameter gap = Parameter(0.0f),
                         Switch on = Switch(true))
        : DeferredModule("Buffer delay", std::move(on)), trigger_(trigger), gap_(std::move(gap)) {
        declare(gap_);
    }

    [[nodiscard]] Parameter& gap() noexcept { return gap_; }
    [[nodiscard]] const ReplayTrigger& trigger() const noexcept { return trigger_; }

    /// Events recorded since the last replay.
    [[nodiscard]] size_t recordedCount() const noexcept { return recording_.size(); }

protected:
    std::optional<Event> transform(Event event, double now) override {
        if (event.isControl() && trigger_.matches(event.control)) {
            replay(now);
            return event;
        }
        if (event.isClosedNote() || event.isControl()) {
            if (!recording_.empty() && event.time() < recording_.back().time()) {
                MIDICHAIN_LOG_WARN("%s: recorded event with non-monotonic time %.3f",
                                   name().c_str(), event.time());
            }
            recording_.push_back(std::move(event));
            return std::nullopt;
        }
        return event;
    }

    void drain(std::vector<Event>& out, double now) override {
        if (!recording_.empty()) {
            MIDICHAIN_LOG_INFO("%s: discarding %zu recorded event(s) that were never replayed",
                               name().c_str(), recording_.size());
            recording_.clear();
        }
        DeferredModule::drain(out, now);
    }

private:
    void replay(double triggerTime) {
        if (recording_.empty()) {
            return;
        }
        MIDICHAIN_LOG_DEBUG("%s: replaying %zu event(s)", name().c_str(), recording_.size());

        const double gap = std::max(0.0, static_cast<double>(gap_.value()));
        const double offset = triggerTime - recording_.front().time() + gap;
        for (Event& event : recording_) {
            event.shift(offset);
            const double releaseTime = event.time();
            defer(releaseTime, std::move(event));
        }
        recording_.clear();
    }

    ReplayTrigger trigger_;
    Parameter gap_;
    std::vector<Event> recording_;
};

} // namespace Midichain::Fx
