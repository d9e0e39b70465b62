// ==============================================================================
// Layer 3: System - Chain
// ==============================================================================
// Ordered sequence of Modules driven by one cooperative loop, one tick per
// iteration, with "now" read from an injected Clock.
//
// Tick:
//   source (if any) -> input validation -> modules[0..n) -> output
//
// Shutdown (explicit stop, end of stream, tick limit):
//   each Module is flushed in order and the flushed events travel through the
//   Modules after it, so the sink (flushed last) sees everything and is then
//   closed.
// ==============================================================================

#pragma once

#include <midichain/fx/core/clock.h>
#include <midichain/fx/core/events.h>
#include <midichain/fx/core/status.h>
#include <midichain/fx/processors/module.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Midichain::Fx {

enum class StopReason : uint8_t {
    None = 0,        ///< still running (or never ran)
    StopRequested,   ///< stop() was called, or a Module asked to stop
    EndOfStream,     ///< end of stream left the last Module
    ModuleError,     ///< a Module reported an unrecoverable error
    TickLimit        ///< ChainConfig::maxTicks reached
};

[[nodiscard]] constexpr const char* stopReasonName(StopReason reason) noexcept {
    switch (reason) {
        case StopReason::None:          return "none";
        case StopReason::StopRequested: return "stop requested";
        case StopReason::EndOfStream:   return "end of stream";
        case StopReason::ModuleError:   return "module error";
        case StopReason::TickLimit:     return "tick limit";
    }
    return "?";
}

struct ChainConfig {
    std::string name = "Chain";
    uint64_t maxTicks = 0;                 ///< 0 = run until stopped
    bool rejectNonMonotonicInput = true;   ///< input timestamps must not go backwards
};

/// @brief Owns and drives a sequence of Modules.
///
/// @code
/// ManualClock clock(0.5);
/// SequenceSource source(events);
/// EventRecorder recorder;
///
/// std::vector<std::unique_ptr<Module>> modules;
/// modules.push_back(std::make_unique<SourceModule>(source));
/// modules.push_back(std::make_unique<Delay>(1.0f));
/// modules.push_back(std::make_unique<SinkModule>(recorder));
///
/// Chain chain(clock);
/// if (Status status = chain.build(std::move(modules)); !status.ok()) { ... }
/// Status result = chain.run();
/// @endcode
///
/// @par Thread Safety
/// build(), tick() and run() belong to one thread. stop() may be called from
/// any thread; it is observed at the next tick boundary.
class Chain {
public:
    explicit Chain(Clock& clock, ChainConfig config = {});

    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    /// Validate the topology and take ownership of @p modules.
    /// @return ErrorCode::Configuration on an invalid topology or when two
    ///         Controllables listen on the same (controller, channel)
    [[nodiscard]] Status build(std::vector<std::unique_ptr<Module>> modules);

    /// Run a single tick at @p now.
    /// @param input Event to feed into the first Module; ignored by a source
    /// @return The event leaving the last Module this tick, if any
    std::optional<Event> tick(double now, std::optional<Event> input = std::nullopt);

    /// Drive tick() from the clock until stopped, then shut down.
    /// @return The Module error that ended the run, or success
    [[nodiscard]] Status run();

    /// Request a graceful stop. Safe to call from any thread.
    void stop() noexcept { stopRequested_.store(true, std::memory_order_release); }

    [[nodiscard]] bool stopRequested() const noexcept {
        return stopRequested_.load(std::memory_order_acquire);
    }

    /// Flush every Module in order (see file header). Runs at most once;
    /// run() calls it on its own.
    /// @return Events that left the last Module during the flush
    std::vector<Event> finish(double now);

    [[nodiscard]] StopReason stopReason() const noexcept { return stopReason_; }
    [[nodiscard]] uint64_t tickCount() const noexcept { return tickCount_; }

    /// Input events dropped by validation.
    [[nodiscard]] size_t rejectedCount() const noexcept { return rejected_; }

    /// Most recent error (validation or Module), success if none.
    [[nodiscard]] const Status& lastError() const noexcept { return lastError_; }

    [[nodiscard]] bool isBuilt() const noexcept { return built_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_; }
    [[nodiscard]] bool isFinished() const noexcept { return finished_; }

    [[nodiscard]] size_t size() const noexcept { return modules_.size(); }
    [[nodiscard]] Module& module(size_t index) { return *modules_[index]; }
    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

private:
    [[nodiscard]] Status validateTopology(const std::vector<std::unique_ptr<Module>>& modules) const;
    [[nodiscard]] Status validateInput(const Event& event);

    /// Pass @p event through modules [first, size()) at @p now.
    std::optional<Event> forward(std::optional<Event> event, size_t first, double now);

    Clock& clock_;
    ChainConfig config_;
    std::vector<std::unique_ptr<Module>> modules_;
    bool hasSource_ = false;

    std::atomic<bool> stopRequested_{false};
    StopReason stopReason_ = StopReason::None;
    Status lastError_;
    double lastInputTime_ = -std::numeric_limits<double>::infinity();
    uint64_t tickCount_ = 0;
    size_t rejected_ = 0;
    bool built_ = false;
    bool running_ = false;
    bool endReached_ = false;
    bool finished_ = false;
};

} // namespace Midichain::Fx
