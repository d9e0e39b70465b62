// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// No allocation, no locks, no I/O.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Midichain {
namespace Fx {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5. Period 2^32-1.
///
/// @note NOT cryptographically secure
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     float u = rng.nextUnipolar();  // Returns [0.0, 1.0]
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next float in bipolar range.
    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// Generate next float in unipolar range.
    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging/serialization).
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

// ==============================================================================
// Process-wide drift source
// ==============================================================================

/// The single generator every parameter drift strategy draws from.
/// Reseed it with seedDriftRandom() to reproduce a drift sequence.
///
/// @note Shares the single-thread contract of the pipeline: only the thread
///       running the Chain may draw from it.
[[nodiscard]] inline Xorshift32& driftRandom() noexcept {
    static Xorshift32 generator;
    return generator;
}

inline void seedDriftRandom(uint32_t seedValue) noexcept {
    driftRandom().seed(seedValue);
}

} // namespace Fx
} // namespace Midichain
