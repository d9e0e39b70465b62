// ==============================================================================
// Logging Implementation
// ==============================================================================

#include "log.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <utility>

namespace Midichain::Fx {

namespace {

LogLevel& currentLevel() noexcept {
    static LogLevel level = LogLevel::Info;
    return level;
}

LogSink& currentSink() {
    static LogSink sink;
    return sink;
}

void writeToStderr(const char* message) {
    using namespace std::chrono;
    const auto nowPoint = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(nowPoint);
    const auto millis = duration_cast<milliseconds>(nowPoint.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::fprintf(stderr, "%02d:%02d:%02d.%03d - %s\n",
                 local.tm_hour, local.tm_min, local.tm_sec,
                 static_cast<int>(millis), message);
}

} // namespace

void setLogLevel(LogLevel level) noexcept {
    currentLevel() = level;
}

LogLevel logLevel() noexcept {
    return currentLevel();
}

void setLogSink(LogSink sink) {
    currentSink() = std::move(sink);
}

void configureLogging(bool debug) noexcept {
    setLogLevel(debug ? LogLevel::Debug : LogLevel::Info);
}

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Off:     return "OFF";
    }
    return "?";
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::Off || level < currentLevel()) {
        return;
    }

    char buf[kMaxLogMessageLength];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    const LogSink& sink = currentSink();
    if (sink) {
        sink(level, buf);
    } else {
        writeToStderr(buf);
    }
}

} // namespace Midichain::Fx
