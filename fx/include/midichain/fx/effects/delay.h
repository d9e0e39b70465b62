// ==============================================================================
// Layer 4: Effect - Delay
// ==============================================================================
// Re-emits every closed note `amount` seconds later, with its onset shifted by
// the same amount. Control messages, note signals and open notes pass
// straight through.
//
// The amount is read when a note is scheduled. Changing it (for example by a
// control message) never moves notes that are already waiting.
// ==============================================================================

#pragma once

#include <midichain/fx/primitives/controllable.h>
#include <midichain/fx/primitives/release_buffer.h>
#include <midichain/fx/processors/deferred_module.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>

namespace Midichain::Fx {

/// @brief Time-deferred note delay.
///
/// @code
/// Parameter amount(1.0f, 0.0f, 4.0f, "delay");
/// (void)amount.bind(7, 0);               // CC 7 on channel 0 sets 0..4 s
/// auto delay = std::make_unique<Delay>(std::move(amount));
/// @endcode
class Delay : public DeferredModule {
public:
    explicit Delay(Parameter amount = Parameter(2.0f), Switch on = Switch(true),
                   size_t capacity = ReleaseBuffer::kUnboundedCapacity)
        : DeferredModule("Delay", std::move(on), capacity), amount_(std::move(amount)) {
        declare(amount_);
    }

    /// Delay time in seconds.
    [[nodiscard]] Parameter& amount() noexcept { return amount_; }
    [[nodiscard]] const Parameter& amount() const noexcept { return amount_; }

protected:
    std::optional<Event> transform(Event event, double now) override {
        if (!event.isClosedNote()) {
            return event;
        }
        const double offset = std::max(0.0, static_cast<double>(amount_.value()));
        event.shift(offset);
        defer(now + offset, std::move(event));
        return std::nullopt;
    }

private:
    Parameter amount_;
};

} // namespace Midichain::Fx
