// ==============================================================================
// Layer 2: Processor - DeferredModule
// ==============================================================================
// Base for modules that emit events at a later tick than they arrived.
//
// Keeps three things apart:
// - a ReleaseBuffer of events scheduled for a future time
// - a FIFO of events to pass through as soon as the output is free
// - a held end-of-stream, released only after every scheduled event left
//
// One event leaves per tick. When both a due release and a pass-through are
// waiting, the earlier one goes first (a release due at the same time as a
// pass-through arrived wins, since it was scheduled before). Releases keep
// draining while the module is switched off so nothing scheduled is lost.
// ==============================================================================

#pragma once

#include "module.h"

#include <midichain/fx/core/log.h>
#include <midichain/fx/primitives/release_buffer.h>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Midichain::Fx {

class DeferredModule : public Module {
public:
    /// @param capacity Bound on scheduled events; unbounded by default
    DeferredModule(std::string name, Switch on,
                   size_t capacity = ReleaseBuffer::kUnboundedCapacity)
        : Module(std::move(name), std::move(on)), releases_(capacity) {}

    /// Events scheduled for a future release.
    [[nodiscard]] size_t pendingCount() const noexcept { return releases_.size(); }

    /// Events waiting to pass through.
    [[nodiscard]] size_t queuedCount() const noexcept { return passQueue_.size(); }

    [[nodiscard]] bool holdingEndOfStream() const noexcept { return heldEnd_.has_value(); }

    /// Events rejected because the release buffer was full.
    [[nodiscard]] size_t rejectedCount() const noexcept { return releases_.rejectedCount(); }

    [[nodiscard]] double nextReleaseTime() const noexcept { return releases_.nextReleaseTime(); }

protected:
    /// Schedule @p event for @p releaseTime.
    /// @return false when the buffer is full; the event is dropped and logged
    bool defer(double releaseTime, Event event) {
        if (logLevel() <= LogLevel::Debug) {
            MIDICHAIN_LOG_DEBUG("Queuing message from %s for %.3f: %s", name().c_str(),
                                releaseTime, describe(event).c_str());
        }
        if (!releases_.push(releaseTime, std::move(event))) {
            MIDICHAIN_LOG_WARN("%s: release buffer full (%zu events), dropping event",
                               name().c_str(), releases_.capacity());
            return false;
        }
        return true;
    }

    std::optional<Event> schedule(std::optional<Event> ready, double now) override {
        if (ready.has_value()) {
            if (ready->isEndOfStream()) {
                if (!heldEnd_.has_value()) {
                    heldEnd_ = std::move(*ready);
                }
            } else {
                passQueue_.push_back(Queued{now, std::move(*ready)});
            }
        }

        if (releases_.isDue(now) &&
            (passQueue_.empty() || releases_.nextReleaseTime() <= passQueue_.front().arrival)) {
            Event released;
            releases_.popDue(now, released);
            return released;
        }

        if (!passQueue_.empty()) {
            Event passed = std::move(passQueue_.front().event);
            passQueue_.pop_front();
            return passed;
        }

        if (heldEnd_.has_value() && releases_.empty()) {
            std::optional<Event> end = std::move(heldEnd_);
            heldEnd_.reset();
            return end;
        }
        return std::nullopt;
    }

    /// Stop-time flush: everything held, in emission order, regardless of
    /// release times.
    void drain(std::vector<Event>& out, double /*now*/) override {
        if (!releases_.empty()) {
            MIDICHAIN_LOG_DEBUG("%s: emptying buffer of length %zu", name().c_str(),
                                releases_.size());
        }

        while (!releases_.empty() || !passQueue_.empty()) {
            const bool takeRelease =
                !releases_.empty() &&
                (passQueue_.empty() || releases_.nextReleaseTime() <= passQueue_.front().arrival);
            if (takeRelease) {
                Event released;
                releases_.popNext(released);
                out.push_back(std::move(released));
            } else {
                out.push_back(std::move(passQueue_.front().event));
                passQueue_.pop_front();
            }
        }

        if (heldEnd_.has_value()) {
            out.push_back(std::move(*heldEnd_));
            heldEnd_.reset();
        }
    }

private:
    struct Queued {
        double arrival = 0.0;
        Event event;
    };

    ReleaseBuffer releases_;
    std::deque<Queued> passQueue_;
    std::optional<Event> heldEnd_;
};

} // namespace Midichain::Fx
