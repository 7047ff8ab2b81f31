// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcphub::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes plus the MCP cancellation code.
namespace ErrorCodes
{
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
    inline constexpr int RequestCancelled = -32800;
} // namespace ErrorCodes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A reply to a request the client sent. Only integer ids are ours.
struct Response
{
    int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief A message with a method and no id.
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief A request issued by the provider. The id is echoed back verbatim.
struct ServerRequest
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A message that fits none of the other shapes.
struct Invalid
{
    std::string reason;
};

/// @brief The classified shape of an inbound message.
using Message = std::variant<Response, Notification, ServerRequest, Invalid>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a success response to a server-initiated request.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response to a server-initiated request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Classifies a decoded message as response, notification, server request or invalid.
///
/// A message carrying a method is a notification when its id is absent or null and a
/// server request otherwise. A message without a method must carry an integer id and
/// either `result` or `error` to be a response.
[[nodiscard]] auto classify(const nlohmann::json& message) -> Message;

/// @brief Serializes a message as one line of newline-delimited JSON.
[[nodiscard]] auto encodeLine(const nlohmann::json& message) -> std::string;

/// @brief Parses one line of newline-delimited JSON into an object.
/// @return The message, or a ProtocolError for malformed JSON or a non-object value.
[[nodiscard]] auto decodeLine(std::string_view line) -> Result<nlohmann::json>;

/// @brief Returns the capability-type segment of a list-changed notification.
///
/// Accepts both `notifications/<kind>/listChanged` and `notifications/<kind>/list_changed`.
/// @return "tools", "resources", "prompts" or "roots", or std::nullopt if the method is
///         not a list-changed notification.
[[nodiscard]] auto listChangedKind(std::string_view method) -> std::optional<std::string>;

} // namespace mcphub::jsonrpc
