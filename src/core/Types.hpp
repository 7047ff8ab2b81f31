// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Owner id reserved for tools implemented in-process.
inline constexpr auto BuiltinOwnerId = std::string_view { "builtin" };

/// @brief One block of content returned by a tool, prompt or sampling call.
///
/// `type` is "text", "image", "audio", "resource" or "artifact". Only the fields
/// matching the type are populated.
struct ContentItem
{
    std::string type = "text";
    std::string text;
    std::string data;
    std::string mimeType;
    std::string uri;
};

/// @brief The outcome of a tool invocation.
///
/// A failed call is still a ToolCallResult: `isError` is set, `content` holds one
/// text item describing the failure, and `failure` names the local error category.
/// A provider-reported tool error (`isError: true` in its reply) has no `failure`.
struct ToolCallResult
{
    std::vector<ContentItem> content;
    bool isError = false;
    std::optional<ErrorCode> failure;

    /// @brief Joins all text items with newlines.
    [[nodiscard]] auto text() const -> std::string
    {
        auto joined = std::string {};
        for (const auto& item: content)
        {
            if (item.text.empty())
                continue;
            if (!joined.empty())
                joined += '\n';
            joined += item.text;
        }
        return joined;
    }
};

/// @brief Creates an error result carrying a single text message.
[[nodiscard]] inline auto makeToolFailure(ErrorCode code, std::string message) -> ToolCallResult
{
    return ToolCallResult {
        .content = { ContentItem { .type = "text", .text = std::move(message) } },
        .isError = true,
        .failure = code,
    };
}

/// @brief A tool exposed by a provider (or by the builtin bridge).
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
    std::string ownerConnectionId;
    std::string ownerDisplayName;
};

/// @brief A resource exposed by a provider.
struct ResourceDescriptor
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
    std::string ownerConnectionId;
    std::string ownerDisplayName;
};

/// @brief A single argument accepted by a prompt template.
struct PromptArgument
{
    std::string name;
    std::string description;
    bool required = false;
};

/// @brief A prompt template exposed by a provider.
struct PromptDescriptor
{
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
    std::string ownerConnectionId;
    std::string ownerDisplayName;
};

/// @brief One content entry returned by resources/read.
struct ResourceContent
{
    std::string uri;
    std::string mimeType;
    std::optional<std::string> text;
    std::optional<std::vector<uint8_t>> blob;
};

/// @brief One message of an expanded prompt.
struct PromptMessage
{
    std::string role;
    ContentItem content;
};

/// @brief The result of prompts/get.
struct PromptResult
{
    std::string description;
    std::vector<PromptMessage> messages;
};

/// @brief Progress reported for a long-running request.
struct Progress
{
    std::string token;
    double progress = 0.0;
    std::optional<double> total;
    std::optional<std::string> message;

    [[nodiscard]] auto isComplete() const -> bool { return total && progress >= *total; }
};

/// @brief A structured log event forwarded by a provider via notifications/message.
struct LogMessage
{
    std::string level;
    std::string logger;
    nlohmann::json data;
};

/// @brief A sampling/createMessage request issued by a provider.
struct SamplingRequest
{
    nlohmann::json messages = nlohmann::json::array();
    std::string systemPrompt;
    int maxTokens = 0;
    nlohmann::json params;
};

/// @brief A workspace root answered to roots/list.
struct Root
{
    std::string uri;
    std::string name;
};

/// @brief Capability flags a provider reported in its initialize reply.
struct ServerCapabilities
{
    bool supportsTools = false;
    bool supportsToolsListChanged = false;
    bool supportsResources = false;
    bool supportsResourceSubscribe = false;
    bool supportsResourcesListChanged = false;
    bool supportsPrompts = false;
    bool supportsPromptsListChanged = false;
    bool supportsLogging = false;
    bool supportsSampling = false;
    bool supportsRoots = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

} // namespace mcphub
