// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Minimal leveled logger. Messages are formatted with vsnprintf into a fixed
// stack buffer and written to stderr as "HH:MM:SS.mmm - message", or handed
// to a user-installed sink.
//
// Thread Safety: setLogLevel()/setLogSink() must not race with logging calls.
// ==============================================================================

#pragma once

#include <cstdint>
#include <functional>

#if defined(__GNUC__) || defined(__clang__)
#define MIDICHAIN_PRINTF_FORMAT(fmtIndex, argsIndex) \
    __attribute__((format(printf, fmtIndex, argsIndex)))
#else
#define MIDICHAIN_PRINTF_FORMAT(fmtIndex, argsIndex)
#endif

namespace Midichain::Fx {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

/// Receives every message at or above the current level (already formatted).
using LogSink = std::function<void(LogLevel, const char*)>;

/// Maximum formatted message length; longer messages are truncated.
inline constexpr int kMaxLogMessageLength = 512;

void setLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel logLevel() noexcept;

/// Install a sink. Passing an empty function restores the stderr writer.
void setLogSink(LogSink sink);

/// Debug when @p debug is set, Info otherwise.
void configureLogging(bool debug = false) noexcept;

[[nodiscard]] const char* logLevelName(LogLevel level) noexcept;

void logMessage(LogLevel level, const char* fmt, ...) MIDICHAIN_PRINTF_FORMAT(2, 3);

} // namespace Midichain::Fx

#define MIDICHAIN_LOG_DEBUG(...) ::Midichain::Fx::logMessage(::Midichain::Fx::LogLevel::Debug, __VA_ARGS__)
#define MIDICHAIN_LOG_INFO(...) ::Midichain::Fx::logMessage(::Midichain::Fx::LogLevel::Info, __VA_ARGS__)
#define MIDICHAIN_LOG_WARN(...) ::Midichain::Fx::logMessage(::Midichain::Fx::LogLevel::Warning, __VA_ARGS__)
#define MIDICHAIN_LOG_ERROR(...) ::Midichain::Fx::logMessage(::Midichain::Fx::LogLevel::Error, __VA_ARGS__)
