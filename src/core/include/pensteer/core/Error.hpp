/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by sources, devices and the controller,
 * and a lightweight Error value carrying the code, a human-readable message
 * and the source location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_ERROR_HPP
    #define PENSTEER_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace pensteer::core {

/**
 * @brief Error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kOutOfRange,
    kIoError,
    kNotSupported,
    kPermissionDenied,

    kNetworkBindFailed,
    kNetworkReceiveFailed,
    kProtocolViolation,

    kDeviceNotFound,
    kDeviceOpenFailed,
    kDeviceReadFailed,
    kDeviceWriteFailed,
};

/**
 * @brief Short stable name of an error code, used in log lines.
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                 return "none";
        case ErrorCode::kInvalidArgument:      return "invalid argument";
        case ErrorCode::kInvalidState:         return "invalid state";
        case ErrorCode::kNotFound:             return "not found";
        case ErrorCode::kOutOfRange:           return "out of range";
        case ErrorCode::kIoError:              return "I/O error";
        case ErrorCode::kNotSupported:         return "not supported";
        case ErrorCode::kPermissionDenied:     return "permission denied";
        case ErrorCode::kNetworkBindFailed:    return "bind failed";
        case ErrorCode::kNetworkReceiveFailed: return "receive failed";
        case ErrorCode::kProtocolViolation:    return "protocol violation";
        case ErrorCode::kDeviceNotFound:       return "device not found";
        case ErrorCode::kDeviceOpenFailed:     return "device open failed";
        case ErrorCode::kDeviceReadFailed:     return "device read failed";
        case ErrorCode::kDeviceWriteFailed:    return "device write failed";
    }
    return "unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Stored inside Expected<T> and, once surfaced by the controller, in the
 * shared state's last-error slot.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /** @brief Prefix the message with the context it failed in. */
    [[nodiscard]] Error withContext(std::string_view context) const
    {
        return Error{_code, std::string(context) + ": " + _message, _location};
    }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace pensteer::core

#endif // PENSTEER_CORE_ERROR_HPP
