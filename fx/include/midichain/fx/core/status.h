// ==============================================================================
// Layer 0: Core Utility - Status
// ==============================================================================
// Error reporting for pipeline operations. Library code never throws; anything
// that can fail returns a Status describing what went wrong.
//
// Layer 0: no dependencies on higher layers.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Midichain {
namespace Fx {

// =============================================================================
// ErrorCode
// =============================================================================

/// @brief Classification of pipeline failures.
enum class ErrorCode : uint8_t {
    None = 0,        ///< Success
    Validation,      ///< Malformed event fields (event is dropped)
    Configuration,   ///< Invalid chain topology or duplicate control bindings
    Sink,            ///< Downstream emission failed
    Module           ///< Unrecoverable failure inside a module
};

/// @brief Human readable name of an error code (for logs and test output).
[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:          return "None";
        case ErrorCode::Validation:    return "ValidationError";
        case ErrorCode::Configuration: return "ConfigurationError";
        case ErrorCode::Sink:          return "SinkError";
        case ErrorCode::Module:        return "ModuleError";
    }
    return "Unknown";
}

// =============================================================================
// Status
// =============================================================================

/// @brief Result of an operation that can fail.
///
/// @code
/// Status status = parameter.bind(7, 0);
/// if (!status.ok()) {
///     MIDICHAIN_LOG_ERROR("bind failed: %s", status.message.c_str());
/// }
/// @endcode
struct Status {
    ErrorCode code = ErrorCode::None;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::None; }

    [[nodiscard]] static Status success() { return {}; }

    [[nodiscard]] static Status error(ErrorCode errorCode, std::string what) {
        return Status{errorCode, std::move(what)};
    }
};

} // namespace Fx
} // namespace Midichain
