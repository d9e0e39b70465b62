// ==============================================================================
// Layer 0: Core Utility - Clock
// ==============================================================================
// Injected time source. Each Chain reads "now" from its own Clock once per
// tick and asks it to wait before the next tick, so tests can drive virtual
// time deterministically instead of depending on wall-clock latency.
// ==============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

namespace Midichain::Fx {

/// @brief Time source for one Chain.
class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in seconds.
    [[nodiscard]] virtual double now() const = 0;

    /// Block (or advance virtual time) until the next tick is due.
    virtual void waitForNextTick() = 0;
};

// =============================================================================
// ManualClock
// =============================================================================

/// @brief Virtual clock that advances by a fixed step per tick.
///
/// Time is computed as start + ticks * step + manual offset, so repeated
/// ticks do not accumulate rounding error.
///
/// @code
/// ManualClock clock(0.5);      // 0.0, 0.5, 1.0, ...
/// chain.tick(clock.now());
/// clock.waitForNextTick();
/// @endcode
class ManualClock : public Clock {
public:
    explicit ManualClock(double stepSeconds = 0.001, double startSeconds = 0.0) noexcept
        : step_(stepSeconds), start_(startSeconds) {}

    [[nodiscard]] double now() const override {
        return start_ + static_cast<double>(ticks_) * step_ + offset_;
    }

    void waitForNextTick() override { ++ticks_; }

    /// Move time forward without counting a tick.
    void advance(double seconds) noexcept { offset_ += seconds; }

    [[nodiscard]] double step() const noexcept { return step_; }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_; }

private:
    double step_;
    double start_;
    double offset_ = 0.0;
    uint64_t ticks_ = 0;
};

// =============================================================================
// SteadyClock
// =============================================================================

/// @brief Wall clock (seconds since construction) that sleeps @p resolution
/// between ticks.
class SteadyClock : public Clock {
public:
    explicit SteadyClock(double resolutionSeconds = 0.001) noexcept
        : resolution_(resolutionSeconds), origin_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] double now() const override {
        const auto elapsed = std::chrono::steady_clock::now() - origin_;
        return std::chrono::duration<double>(elapsed).count();
    }

    void waitForNextTick() override {
        std::this_thread::sleep_for(std::chrono::duration<double>(resolution_));
    }

    [[nodiscard]] double resolution() const noexcept { return resolution_; }

private:
    double resolution_;
    std::chrono::steady_clock::time_point origin_;
};

} // namespace Midichain::Fx
