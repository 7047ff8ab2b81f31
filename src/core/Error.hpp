// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    StorageError,
    NotFound,
    LaunchError,
    HandshakeError,
    TransportError,
    ProtocolError,
    RemoteError,
    TimeoutError,
    CancelledError,
    ToolCallError,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::LaunchError: return "LaunchError";
        case ErrorCode::HandshakeError: return "HandshakeError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::RemoteError: return "RemoteError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::CancelledError: return "CancelledError";
        case ErrorCode::ToolCallError: return "ToolCallError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// JSON-RPC error code reported by the provider (only meaningful for ErrorCode::RemoteError).
    int remoteCode = 0;
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

/// @brief Creates an unexpected RemoteError carrying the provider's JSON-RPC error code.
[[nodiscard]] inline auto makeRemoteError(int remoteCode, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { ErrorCode::RemoteError, std::move(message), remoteCode });
}

} // namespace mcphub

template <>
struct std::formatter<mcphub::Error>: std::formatter<std::string>
{
    auto format(const mcphub::Error& error, auto& ctx) const
    {
        if (error.code == mcphub::ErrorCode::RemoteError)
            return std::formatter<std::string>::format(
                std::format("[RemoteError {}] {}", error.remoteCode, error.message), ctx);

        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcphub::errorCodeName(error.code), error.message), ctx);
    }
};
