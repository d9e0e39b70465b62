// ==============================================================================
// Layer 1: Primitives
// controllable.h - Control-message addressable parameters and switches
// ==============================================================================
// Parameter (continuous value) and Switch (boolean flag) cells that a Module
// owns and that control messages update while the pipeline runs. Optional
// drift strategies replace the literal control value with a pseudo-random
// step drawn from the process-wide drift generator.
//
// Layer 1: depends only on Layer 0 (events, random, log).
// ==============================================================================

#pragma once

#include <midichain/fx/core/events.h>
#include <midichain/fx/core/log.h>
#include <midichain/fx/core/midi_utils.h>
#include <midichain/fx/core/random.h>
#include <midichain/fx/core/status.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace Midichain::Fx {

// =============================================================================
// ControlBinding
// =============================================================================

/// @brief The (controller, channel) address a Controllable listens on.
struct ControlBinding {
    uint8_t controller = 0;
    uint8_t channel = 0;

    [[nodiscard]] bool matches(const ControlMessage& message) const noexcept {
        return message.controller == controller && message.channel == channel;
    }

    bool operator==(const ControlBinding&) const = default;
};

// =============================================================================
// Drift strategies
// =============================================================================

/// @brief Randomized update rule for a Parameter.
class ValueDrift {
public:
    virtual ~ValueDrift() = default;

    /// Next value given the current one and the parameter range.
    [[nodiscard]] virtual float next(float current, float minimum, float maximum,
                                     Xorshift32& rng) const = 0;
};

/// @brief Jumps to a uniformly distributed value within range.
class UniformDrift final : public ValueDrift {
public:
    [[nodiscard]] float next(float /*current*/, float minimum, float maximum,
                             Xorshift32& rng) const override {
        return minimum + rng.nextUnipolar() * (maximum - minimum);
    }
};

/// @brief Exponentially distributed value with the given median, clamped to range.
class ExponentialDrift final : public ValueDrift {
public:
    explicit ExponentialDrift(float median = 1.0f) noexcept
        : median_(median > 0.0f ? median : 1.0f) {}

    [[nodiscard]] float next(float /*current*/, float minimum, float maximum,
                             Xorshift32& rng) const override {
        // Inverse CDF; rate = ln(2) / median so that half the draws fall below median
        constexpr float kLn2 = 0.69314718f;
        const float u = std::min(rng.nextUnipolar(), 0.99999994f);
        const float value = -std::log(1.0f - u) * median_ / kLn2;
        return std::clamp(value, minimum, maximum);
    }

    [[nodiscard]] float median() const noexcept { return median_; }

private:
    float median_;
};

/// @brief Random walk: steps up to stepFraction * range away from the current value.
class RandomWalkDrift final : public ValueDrift {
public:
    explicit RandomWalkDrift(float stepFraction = 0.1f) noexcept
        : stepFraction_(std::clamp(stepFraction, 0.0f, 1.0f)) {}

    [[nodiscard]] float next(float current, float minimum, float maximum,
                             Xorshift32& rng) const override {
        const float step = rng.nextFloat() * stepFraction_ * (maximum - minimum);
        return std::clamp(current + step, minimum, maximum);
    }

private:
    float stepFraction_;
};

/// @brief Randomized update rule for a Switch.
class SwitchDrift {
public:
    virtual ~SwitchDrift() = default;
    [[nodiscard]] virtual bool next(bool current, Xorshift32& rng) const = 0;
};

/// @brief On with the given probability, independent of the current state.
class ProbabilityDrift final : public SwitchDrift {
public:
    explicit ProbabilityDrift(float probability = 0.5f) noexcept
        : probability_(std::clamp(probability, 0.0f, 1.0f)) {}

    [[nodiscard]] bool next(bool /*current*/, Xorshift32& rng) const override {
        return probability_ >= 1.0f || rng.nextUnipolar() < probability_;
    }

private:
    float probability_;
};

// =============================================================================
// Controllable
// =============================================================================

/// @brief Base of every control-message addressable cell.
///
/// A Controllable listens on at most one address. Unbound instances ignore
/// every message, which is how a plain constant is represented.
///
/// @par Thread Safety
/// Owned by exactly one Module; onControl() must never run concurrently with
/// that Module's process().
class Controllable {
public:
    virtual ~Controllable() = default;

    /// Listen on (controller, channel). Replaces any previous binding.
    [[nodiscard]] Status bind(int controller, int channel) {
        if (!isValidController(controller)) {
            return Status::error(ErrorCode::Configuration,
                                 "controller number must be in 0..127 for '" + name_ + "'");
        }
        if (!isValidChannel(channel)) {
            return Status::error(ErrorCode::Configuration,
                                 "channel must be in 0..15 for '" + name_ + "'");
        }
        binding_ = ControlBinding{static_cast<uint8_t>(controller), static_cast<uint8_t>(channel)};
        bound_ = true;
        return Status::success();
    }

    void unbind() noexcept { bound_ = false; }

    [[nodiscard]] bool isBound() const noexcept { return bound_; }
    [[nodiscard]] const ControlBinding& binding() const noexcept { return binding_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Apply @p message if it is addressed to this cell.
    /// @return true when consumed; false means the caller must forward it
    bool onControl(const ControlMessage& message) {
        if (!bound_ || !binding_.matches(message)) {
            return false;
        }
        apply(message.value);
        return true;
    }

protected:
    explicit Controllable(std::string name) : name_(std::move(name)) {}

    Controllable(const Controllable&) = default;
    Controllable& operator=(const Controllable&) = default;
    Controllable(Controllable&&) noexcept = default;
    Controllable& operator=(Controllable&&) noexcept = default;

    virtual void apply(uint8_t value) = 0;

private:
    std::string name_;
    ControlBinding binding_{};
    bool bound_ = false;
};

// =============================================================================
// Parameter
// =============================================================================

/// @brief Continuous controllable value.
///
/// A bound Parameter maps control values 0..127 linearly onto
/// [minimum, maximum]: 0 gives exactly minimum and 127 exactly maximum.
/// With a drift strategy, each trigger (any non-zero value) draws a new
/// value instead; value 0 is the trigger release and leaves it unchanged.
///
/// @code
/// Parameter amount(1.0f, 0.0f, 4.0f, "delay");
/// (void)amount.bind(7, 0);
/// Delay delay(std::move(amount));
/// @endcode
class Parameter final : public Controllable {
public:
    /// Fixed value: unbound, range collapsed to the value.
    Parameter(float value = 0.0f)  // NOLINT(google-explicit-constructor) literals convert
        : Controllable("parameter"), value_(value), minimum_(value), maximum_(value) {}

    Parameter(float initial, float minimum, float maximum, std::string name = "parameter")
        : Controllable(std::move(name)),
          minimum_(std::min(minimum, maximum)),
          maximum_(std::max(minimum, maximum)) {
        value_ = std::clamp(initial, minimum_, maximum_);
    }

    [[nodiscard]] float value() const noexcept { return value_; }
    [[nodiscard]] float minimum() const noexcept { return minimum_; }
    [[nodiscard]] float maximum() const noexcept { return maximum_; }

    /// Set directly (clamped to range). Does not log.
    void setValue(float value) noexcept { value_ = std::clamp(value, minimum_, maximum_); }

    void setDrift(std::shared_ptr<const ValueDrift> drift) noexcept { drift_ = std::move(drift); }
    [[nodiscard]] bool hasDrift() const noexcept { return drift_ != nullptr; }

    /// Linear mapping of a control value onto [minimum, maximum].
    [[nodiscard]] float mapControlValue(uint8_t value) const noexcept {
        if (value >= kMaxControlValue) {
            return maximum_;
        }
        const float fraction = static_cast<float>(value) / static_cast<float>(kMaxControlValue);
        return minimum_ + fraction * (maximum_ - minimum_);
    }

protected:
    void apply(uint8_t value) override {
        float newValue = 0.0f;
        if (drift_) {
            if (value == 0) {
                return;
            }
            newValue = std::clamp(drift_->next(value_, minimum_, maximum_, driftRandom()),
                                  minimum_, maximum_);
        } else {
            newValue = mapControlValue(value);
        }
        MIDICHAIN_LOG_INFO("Updating parameter '%s' from %.3g to %.3g",
                           name().c_str(), static_cast<double>(value_),
                           static_cast<double>(newValue));
        value_ = newValue;
    }

private:
    float value_ = 0.0f;
    float minimum_ = 0.0f;
    float maximum_ = 0.0f;
    std::shared_ptr<const ValueDrift> drift_;
};

// =============================================================================
// Switch
// =============================================================================

/// @brief Boolean controllable flag: on when the control value is >= 64.
///
/// With a drift strategy, each trigger (non-zero value) draws the new state
/// from the strategy instead.
class Switch final : public Controllable {
public:
    Switch(bool value = false)  // NOLINT(google-explicit-constructor) literals convert
        : Controllable("switch"), value_(value) {}

    Switch(bool initial, std::string name)
        : Controllable(std::move(name)), value_(initial) {}

    [[nodiscard]] bool value() const noexcept { return value_; }
    void setValue(bool value) noexcept { value_ = value; }

    void setDrift(std::shared_ptr<const SwitchDrift> drift) noexcept { drift_ = std::move(drift); }
    [[nodiscard]] bool hasDrift() const noexcept { return drift_ != nullptr; }

protected:
    void apply(uint8_t value) override {
        if (drift_) {
            if (value == 0) {
                return;
            }
            value_ = drift_->next(value_, driftRandom());
        } else {
            value_ = value >= kSwitchOnThreshold;
        }
        MIDICHAIN_LOG_INFO("Updating switch '%s' to %s", name().c_str(), value_ ? "ON" : "OFF");
    }

private:
    bool value_ = false;
    std::shared_ptr<const SwitchDrift> drift_;
};

} // namespace Midichain::Fx
