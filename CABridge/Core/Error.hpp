// Error.hpp - std::expected based error handling
//
// Every nonzero host status is converted into an Error at the call site that
// received it. Errors carry the classified kind, the raw status, a severity,
// a static message and the capture site.
//
// Usage:
//   Result<void> Start() {
//       const Host::Status status = host_.OutputStart(unit_);
//       if (status != Host::kNoErr) {
//           return CAB_ERROR_STATUS(status, "AudioOutputUnitStart failed");
//       }
//       return {};
//   }
//
//   auto result = unit->Start();
//   if (!result) {
//       result.error().Log();
//       if (result.error().AsUnitError() == AudioUnitError::kFormatNotSupported) { ... }
//   }

#pragma once

#include <expected>
#include <optional>
#include <string_view>

#include "../Host/HostTypes.hpp"
#include "../Logging/Logging.hpp"
#include "StatusCodes.hpp"

namespace CAB {

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Recoverable error - state unchanged, caller may retry or continue
    Recoverable,

    /// Fatal error - misuse or unrecoverable host failure
    Fatal,

    /// Warning - logged, operation continues
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    ErrorKind kind;                ///< Which status table matched (or Other/Component)
    Host::Status status;           ///< Raw host status, or the ComponentError value
    SourceLocation location;       ///< Capture site (file, line, function)
    ErrorSeverity severity;        ///< Error severity level
    const char* message;           ///< Static context message

    [[nodiscard]] static constexpr Error Make(
        ErrorKind kind,
        Host::Status status,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{kind, status, loc, sev, msg};
    }

    /// Classify a nonzero host status through the status tables
    [[nodiscard]] static Error FromStatus(
        Host::Status status,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{Classify(status), status, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    [[nodiscard]] constexpr bool IsWarning() const noexcept {
        return severity == ErrorSeverity::Warning;
    }

    [[nodiscard]] std::optional<AudioError> AsAudioError() const noexcept {
        if (kind != ErrorKind::kAudio) return std::nullopt;
        return AudioErrorFromStatus(status);
    }

    [[nodiscard]] std::optional<AudioCodecError> AsCodecError() const noexcept {
        if (kind != ErrorKind::kCodec) return std::nullopt;
        return AudioCodecErrorFromStatus(status);
    }

    [[nodiscard]] std::optional<AudioFormatError> AsFormatError() const noexcept {
        if (kind != ErrorKind::kFormat) return std::nullopt;
        return AudioFormatErrorFromStatus(status);
    }

    [[nodiscard]] std::optional<AudioUnitError> AsUnitError() const noexcept {
        if (kind != ErrorKind::kUnit) return std::nullopt;
        return AudioUnitErrorFromStatus(status);
    }

    [[nodiscard]] std::optional<ComponentError> AsComponentError() const noexcept {
        if (kind != ErrorKind::kComponent) return std::nullopt;
        return static_cast<ComponentError>(status);
    }

    /// Table text for classified statuses, the context message otherwise
    [[nodiscard]] const char* Describe() const noexcept {
        switch (kind) {
            case ErrorKind::kAudio:
            case ErrorKind::kCodec:
            case ErrorKind::kFormat:
            case ErrorKind::kUnit:
                return DescribeStatus(status);
            case ErrorKind::kComponent:
                return CAB::Describe(static_cast<ComponentError>(status));
            case ErrorKind::kUnknownStatus:
            case ErrorKind::kOther:
                break;
        }
        return message;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const noexcept {
        CAB_LOG_ERROR(Host,
                      "[%{public}s] %{public}s:%d in %{public}s() - %{public}s status=%d (%{public}s): %{public}s",
                      ToString(severity),
                      location.FileName().data(),
                      location.line,
                      location.function,
                      ToString(kind),
                      status,
                      Describe(),
                      message);
    }

    void LogAsWarning() const noexcept {
        CAB_LOG(Host,
                "[%{public}s] %{public}s:%d in %{public}s() - %{public}s status=%d (%{public}s)",
                ToString(severity),
                location.FileName().data(),
                location.line,
                location.function,
                ToString(kind),
                status,
                message);
    }
};

static_assert(sizeof(Error) <= 64, "Error must be cache-line friendly (<=64 bytes)");

// ============================================================================
// Result Type
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

/// Classified host status, recoverable
#define CAB_ERROR_STATUS(status, msg) \
    std::unexpected(::CAB::Error::FromStatus((status), ::CAB::ErrorSeverity::Recoverable, (msg)))

/// Classified host status, fatal
#define CAB_ERROR_STATUS_FATAL(status, msg) \
    std::unexpected(::CAB::Error::FromStatus((status), ::CAB::ErrorSeverity::Fatal, (msg)))

/// Typed table error raised locally (e.g. AudioUnitError::kCannotDoInCurrentContext)
#define CAB_ERROR_CODE(code, msg) \
    CAB_ERROR_STATUS(static_cast<::CAB::Host::Status>(code), (msg))

/// Non-status failure, recoverable
#define CAB_ERROR_OTHER(msg) \
    std::unexpected(::CAB::Error::Make(::CAB::ErrorKind::kOther, 0, ::CAB::ErrorSeverity::Recoverable, (msg)))

/// Non-status failure caused by API misuse
#define CAB_ERROR_FATAL(msg) \
    std::unexpected(::CAB::Error::Make(::CAB::ErrorKind::kOther, 0, ::CAB::ErrorSeverity::Fatal, (msg)))

/// Component discovery failure
#define CAB_ERROR_COMPONENT(code, msg)                                              \
    std::unexpected(::CAB::Error::Make(::CAB::ErrorKind::kComponent,                \
                                       static_cast<::CAB::Host::Status>(code),      \
                                       ::CAB::ErrorSeverity::Recoverable, (msg)))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value
#define CAB_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Propagate error with logging
#define CAB_TRY_LOG(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            _result.error().Log(); \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Convert a host status to Result<void>
[[nodiscard]] inline Result<void> ToResult(Host::Status status, const char* msg,
                                           SourceLocation loc = SourceLocation()) noexcept {
    if (status == Host::kNoErr) {
        return {};
    }
    return std::unexpected(Error::FromStatus(status, ErrorSeverity::Recoverable, msg, loc));
}

/// Convert Result<T> back to a host status (for host-facing callback returns)
template<typename T>
[[nodiscard]] Host::Status ToStatus(const Result<T>& result) noexcept {
    if (result) {
        return Host::kNoErr;
    }
    if (result.error().kind == ErrorKind::kOther || result.error().kind == ErrorKind::kComponent) {
        return static_cast<Host::Status>(AudioError::kParam);
    }
    return result.error().status;
}

} // namespace CAB
