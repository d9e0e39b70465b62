// ==============================================================================
// Layer 1: Primitives
// release_buffer.h - Events ordered by release time
// ==============================================================================
// Holds (release time, event) pairs for time-deferred effects. Entries leave
// in ascending release time; entries with equal release times leave in the
// order they were pushed.
//
// Capacity: unbounded by default. There is no backpressure toward the
// producer, so a sustained input rate above the drain rate grows the buffer
// without limit. Pass a capacity to bound it; pushes beyond it are rejected
// (reject-new) and counted.
// ==============================================================================

#pragma once

#include <midichain/fx/core/events.h>

#include <cstddef>
#include <limits>
#include <map>
#include <utility>

namespace Midichain::Fx {

class ReleaseBuffer {
public:
    static constexpr size_t kUnboundedCapacity = std::numeric_limits<size_t>::max();

    explicit ReleaseBuffer(size_t capacity = kUnboundedCapacity) noexcept
        : capacity_(capacity) {}

    /// Schedule @p event for @p releaseTime.
    /// @return false when the buffer is full and the event was rejected
    bool push(double releaseTime, Event event) {
        if (entries_.size() >= capacity_) {
            ++rejected_;
            return false;
        }
        // multimap inserts equal keys after existing ones: FIFO for ties
        entries_.emplace(releaseTime, std::move(event));
        return true;
    }

    /// True when the earliest entry is due at @p now.
    [[nodiscard]] bool isDue(double now) const noexcept {
        return !entries_.empty() && entries_.begin()->first <= now;
    }

    /// Release time of the earliest entry. Only meaningful when !empty().
    [[nodiscard]] double nextReleaseTime() const noexcept {
        return entries_.empty() ? std::numeric_limits<double>::infinity()
                                : entries_.begin()->first;
    }

    /// Remove and return the earliest entry if it is due at @p now.
    bool popDue(double now, Event& out) {
        if (!isDue(now)) {
            return false;
        }
        auto it = entries_.begin();
        out = std::move(it->second);
        entries_.erase(it);
        return true;
    }

    /// Remove and return the earliest entry whether or not it is due.
    bool popNext(Event& out) {
        if (entries_.empty()) {
            return false;
        }
        auto it = entries_.begin();
        out = std::move(it->second);
        entries_.erase(it);
        return true;
    }

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t rejectedCount() const noexcept { return rejected_; }

private:
    std::multimap<double, Event> entries_;
    size_t capacity_;
    size_t rejected_ = 0;
};

} // namespace Midichain::Fx
