// ==============================================================================
// Layer 3: System - Endpoints
// ==============================================================================
// Boundary contracts for whatever produces and consumes events (device
// ports, file readers/writers), the Modules that plug them into a Chain, and
// three in-memory collaborators:
// - SequenceSource replays a prepared list of events against the clock
// - PulseSource generates a steady train of identical notes
// - EventRecorder keeps everything it is given, with emission times
// ==============================================================================

#pragma once

#include <midichain/fx/core/events.h>
#include <midichain/fx/core/log.h>
#include <midichain/fx/core/midi_utils.h>
#include <midichain/fx/core/status.h>
#include <midichain/fx/processors/module.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Midichain::Fx {

// =============================================================================
// Collaborator interfaces
// =============================================================================

/// @brief Producer of events. next() must not block.
///
/// Returns the next event available at @p now, or nothing when none is
/// ready yet. Timestamps must not go backwards. End of input is reported by
/// returning an EndOfStream event once.
class EventSource {
public:
    virtual ~EventSource() = default;
    virtual std::optional<Event> next(double now) = 0;
};

/// @brief Consumer of events.
class EventSink {
public:
    virtual ~EventSink() = default;

    /// @return false when the event could not be delivered
    virtual bool emit(const Event& event, double now) = 0;

    /// Called once when the Chain shuts down, after the last emit().
    virtual void close() {}

    /// True once the sink wants the Chain to stop.
    [[nodiscard]] virtual bool wantsStop() const { return false; }
};

// =============================================================================
// SourceModule
// =============================================================================

/// @brief Adapts an EventSource as the first Module of a Chain.
///
/// Pulls at most one event per tick. After the source reported end of
/// stream it is not polled again. While switched off the source is not
/// polled at all; control messages pushed in are still offered to the
/// declared Controllables.
class SourceModule final : public Module {
public:
    explicit SourceModule(EventSource& source, std::string name = "Source",
                          Switch on = Switch(true))
        : Module(std::move(name), std::move(on)), source_(&source) {}

    std::optional<Event> process(std::optional<Event> input, double now) override {
        if (input.has_value()) {
            const bool consumed = input->isControl() && offerControl(input->control);
            if (!consumed) {
                MIDICHAIN_LOG_WARN("%s: ignoring event pushed into a source", name().c_str());
            }
        }
        if (exhausted_ || !isOn()) {
            return std::nullopt;
        }
        std::optional<Event> event = source_->next(now);
        if (event.has_value() && event->isEndOfStream()) {
            MIDICHAIN_LOG_DEBUG("%s: end of stream", name().c_str());
            exhausted_ = true;
        }
        return event;
    }

    [[nodiscard]] ModuleRole role() const noexcept override { return ModuleRole::Source; }
    [[nodiscard]] EventMask accepts() const noexcept override { return 0; }

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

private:
    EventSource* source_;
    bool exhausted_ = false;
};

// =============================================================================
// SinkModule
// =============================================================================

struct SinkOptions {
    bool failureIsFatal = false;   ///< a failed emit stops the Chain
};

/// @brief Adapts an EventSink as the last Module of a Chain.
///
/// Returns the event it delivered so the Chain can observe end of stream.
/// Emission failures are logged and counted; with failureIsFatal they also
/// report ErrorCode::Sink. While switched off nothing reaches the sink and
/// events are returned undelivered. Control messages consumed by a declared
/// Controllable are absorbed.
class SinkModule final : public Module {
public:
    explicit SinkModule(EventSink& sink, SinkOptions options = {}, std::string name = "Sink",
                        Switch on = Switch(true))
        : Module(std::move(name), std::move(on)), sink_(&sink), options_(options) {}

    std::optional<Event> process(std::optional<Event> input, double now) override {
        if (!input.has_value()) {
            return std::nullopt;
        }
        if (input->isControl() && offerControl(input->control)) {
            return std::nullopt;
        }
        if (!isOn()) {
            return input;
        }
        if (sink_->emit(*input, now)) {
            ++emitted_;
            return input;
        }

        ++failures_;
        MIDICHAIN_LOG_WARN("%s: failed to emit %s", name().c_str(), describe(*input).c_str());
        if (options_.failureIsFatal) {
            fail(Status::error(ErrorCode::Sink, "sink rejected " + describe(*input)));
        }
        if (input->isEndOfStream()) {
            return input;
        }
        return std::nullopt;
    }

    [[nodiscard]] ModuleRole role() const noexcept override { return ModuleRole::Sink; }

    [[nodiscard]] bool requestsStop() const noexcept override { return sink_->wantsStop(); }

    [[nodiscard]] size_t emittedCount() const noexcept { return emitted_; }
    [[nodiscard]] size_t failureCount() const noexcept { return failures_; }

protected:
    void drain(std::vector<Event>& /*out*/, double /*now*/) override {
        if (!closed_) {
            closed_ = true;
            sink_->close();
        }
    }

private:
    EventSink* sink_;
    SinkOptions options_;
    size_t emitted_ = 0;
    size_t failures_ = 0;
    bool closed_ = false;
};

// =============================================================================
// SequenceSource
// =============================================================================

/// @brief Replays prepared events once the clock reaches their time.
///
/// Events are sorted by time (stable, so equal times keep their order) and
/// released one per call. After the last one, a single EndOfStream stamped
/// with the current time follows unless disabled.
class SequenceSource final : public EventSource {
public:
    explicit SequenceSource(std::vector<Event> events, bool endWithEndOfStream = true)
        : events_(std::move(events)), endWithEndOfStream_(endWithEndOfStream) {
        std::stable_sort(events_.begin(), events_.end(),
                         [](const Event& a, const Event& b) { return a.time() < b.time(); });
    }

    std::optional<Event> next(double now) override {
        if (index_ < events_.size()) {
            if (events_[index_].time() <= now) {
                return events_[index_++];
            }
            return std::nullopt;
        }
        if (endWithEndOfStream_ && !endSent_) {
            endSent_ = true;
            return Event::endOfStream(now);
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t remaining() const noexcept { return events_.size() - index_; }

private:
    std::vector<Event> events_;
    size_t index_ = 0;
    bool endWithEndOfStream_;
    bool endSent_ = false;
};

// =============================================================================
// PulseSource
// =============================================================================

struct PulseOptions {
    double interval = 0.25;   ///< seconds between onsets
    uint8_t pitch = 69;
    uint8_t velocity = 64;
    uint8_t channel = 0;
    double duration = 0.1;    ///< seconds
    double start = 0.0;       ///< onset of the first pulse
    size_t count = 0;         ///< 0 = endless
};

/// @brief Emits a closed note every `interval` seconds.
///
/// Each pulse is stamped with its scheduled onset and released on the first
/// call at or after that time, one per call, so a coarse clock catches up
/// without losing pulses. With a count, a single EndOfStream follows the
/// last pulse.
class PulseSource final : public EventSource {
public:
    static constexpr double kMinInterval = 0.001;

    explicit PulseSource(PulseOptions options = {}) : options_(options) {
        if (!(options_.interval >= kMinInterval)) {
            MIDICHAIN_LOG_WARN("Pulse interval %.4f s is too short, using %.3f s",
                               options_.interval, kMinInterval);
            options_.interval = kMinInterval;
        }
        options_.pitch = static_cast<uint8_t>(std::min<int>(options_.pitch, kMaxMidiNote));
        options_.velocity =
            static_cast<uint8_t>(std::min<int>(options_.velocity, kMaxMidiVelocity));
        options_.channel = static_cast<uint8_t>(options_.channel & 0x0F);
        options_.duration = std::max(0.0, options_.duration);
        nextOnset_ = options_.start;
    }

    std::optional<Event> next(double now) override {
        if (options_.count > 0 && emitted_ >= options_.count) {
            if (!endSent_) {
                endSent_ = true;
                return Event::endOfStream(now);
            }
            return std::nullopt;
        }
        if (now < nextOnset_) {
            return std::nullopt;
        }
        const Note pulse{options_.pitch, options_.velocity, options_.channel, nextOnset_,
                         options_.duration};
        ++emitted_;
        nextOnset_ = options_.start + static_cast<double>(emitted_) * options_.interval;
        return Event::fromNote(pulse);
    }

    [[nodiscard]] const PulseOptions& options() const noexcept { return options_; }
    [[nodiscard]] size_t emittedCount() const noexcept { return emitted_; }
    [[nodiscard]] double nextOnset() const noexcept { return nextOnset_; }

private:
    PulseOptions options_;
    double nextOnset_ = 0.0;
    size_t emitted_ = 0;
    bool endSent_ = false;
};

// =============================================================================
// EventRecorder
// =============================================================================

struct RecordedEvent {
    Event event;
    double emittedAt = 0.0;
};

/// @brief Sink that keeps every event. With maxEvents > 0 it asks the Chain
/// to stop once that many non-end-of-stream events were recorded.
class EventRecorder final : public EventSink {
public:
    explicit EventRecorder(size_t maxEvents = 0) noexcept : maxEvents_(maxEvents) {}

    bool emit(const Event& event, double now) override {
        records_.push_back(RecordedEvent{event, now});
        if (!event.isEndOfStream()) {
            ++count_;
        }
        return true;
    }

    void close() override { closed_ = true; }

    [[nodiscard]] bool wantsStop() const override {
        return maxEvents_ > 0 && count_ >= maxEvents_;
    }

    [[nodiscard]] const std::vector<RecordedEvent>& records() const noexcept { return records_; }

    /// Recorded closed notes, in emission order.
    [[nodiscard]] std::vector<RecordedEvent> notes() const {
        std::vector<RecordedEvent> result;
        for (const auto& record : records_) {
            if (record.event.isClosedNote()) {
                result.push_back(record);
            }
        }
        return result;
    }

    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    std::vector<RecordedEvent> records_;
    size_t maxEvents_;
    size_t count_ = 0;
    bool closed_ = false;
};

} // namespace Midichain::Fx
