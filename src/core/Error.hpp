// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Error codes for categorizing failures across the MCP subsystem.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ConfigurationError,
    ProcessSpawnFailed,
    ConnectionFailed,
    InitializationFailed,
    ProtocolError,
    ServerNotRunning,
    ServerNotFound,
    ServerAlreadyExists,
    ToolNotFound,
    Timeout,
    IoError,
    SerializationError,
    DatabaseError,
    CircuitOpen,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::ProcessSpawnFailed: return "ProcessSpawnFailed";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::InitializationFailed: return "InitializationFailed";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ServerNotRunning: return "ServerNotRunning";
        case ErrorCode::ServerNotFound: return "ServerNotFound";
        case ErrorCode::ServerAlreadyExists: return "ServerAlreadyExists";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::SerializationError: return "SerializationError";
        case ErrorCode::DatabaseError: return "DatabaseError";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// The optional detail fields are populated by the matching helper constructors:
/// @c field for ConfigurationError, @c rpcCode for ProtocolError and
/// @c timeoutMs for Timeout.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::string field {};
    int rpcCode = 0;
    uint64_t timeoutMs = 0;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Creates a ConfigurationError naming the offending field.
/// @param subject The server or component whose configuration is invalid.
/// @param field The configuration field (e.g. "args", "args[0]", "env.API_KEY").
/// @param reason Why the value was rejected.
[[nodiscard]] inline auto makeConfigError(std::string_view subject, std::string field, std::string_view reason)
    -> std::unexpected<Error>
{
    auto error = Error {
        .code = ErrorCode::ConfigurationError,
        .message = std::format("Invalid MCP configuration for '{}': {}", subject, reason),
        .field = std::move(field),
    };
    return std::unexpected<Error>(std::move(error));
}

/// @brief Creates a ProtocolError carrying the JSON-RPC error code returned by a server.
[[nodiscard]] inline auto makeRpcError(int rpcCode, std::string_view message) -> std::unexpected<Error>
{
    auto error = Error {
        .code = ErrorCode::ProtocolError,
        .message = std::format("MCP protocol error (code {}): {}", rpcCode, message),
        .rpcCode = rpcCode,
    };
    return std::unexpected<Error>(std::move(error));
}

/// @brief Creates a Timeout error for an operation that exceeded its deadline.
[[nodiscard]] inline auto makeTimeoutError(std::string_view operation, uint64_t timeoutMs)
    -> std::unexpected<Error>
{
    auto error = Error {
        .code = ErrorCode::Timeout,
        .message = std::format("Operation '{}' timed out after {}ms", operation, timeoutMs),
        .timeoutMs = timeoutMs,
    };
    return std::unexpected<Error>(std::move(error));
}

/// @brief Returns true for failures that indicate an unhealthy remote (as opposed to a rejected call).
///
/// These are the failures counted by the per-server circuit breaker.
[[nodiscard]] constexpr auto isTransportFailure(const Error& error) -> bool
{
    return error.code == ErrorCode::Timeout || error.code == ErrorCode::ConnectionFailed
           || error.code == ErrorCode::IoError;
}

} // namespace mcphub

template <>
struct std::formatter<mcphub::Error>: std::formatter<std::string>
{
    auto format(const mcphub::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcphub::errorCodeName(error.code), error.message), ctx);
    }
};
