// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief One hit returned by a WebSearchService.
struct SearchResult
{
    std::string title;
    std::string url;
    std::string snippet;
    std::string source;
};

/// @brief Searches the web on behalf of the web_search tool.
class WebSearchService
{
  public:
    virtual ~WebSearchService() = default;

    [[nodiscard]] virtual auto search(const std::string& query, int maxResults)
        -> Result<std::vector<SearchResult>> = 0;
};

/// @brief A sandboxed execution request issued by the execute_code tool.
struct CodeExecutionRequest
{
    std::string language;
    std::string code;
    double timeoutSeconds = 30.0;
    std::vector<std::string> capabilities;
};

/// @brief The outcome of a sandboxed execution.
struct CodeExecutionResult
{
    int exitCode = 0;
    double durationSeconds = 0.0;
    std::string standardOutput;
    std::string standardError;
};

/// @brief Runs code in a sandbox on behalf of the execute_code tool.
class CodeExecutionService
{
  public:
    virtual ~CodeExecutionService() = default;

    [[nodiscard]] virtual auto execute(const CodeExecutionRequest& request) -> Result<CodeExecutionResult> = 0;
};

/// @brief Drives a browser on behalf of the browser_action tool.
class BrowserAutomationService
{
  public:
    virtual ~BrowserAutomationService() = default;

    /// @brief Performs @p action with the tool's full argument object.
    /// @return A textual report of what happened.
    [[nodiscard]] virtual auto perform(const std::string& action, const nlohmann::json& arguments)
        -> Result<std::string> = 0;
};

/// @brief Local services backing the builtin tools. Any of them may be null.
struct BuiltinServices
{
    WebSearchService* webSearch = nullptr;
    CodeExecutionService* codeExecution = nullptr;
    BrowserAutomationService* browser = nullptr;
};

/// @brief Routes the reserved builtin tool names to local implementations.
///
/// The reserved names are checked before any remote dispatch, so a provider can never
/// shadow them. Each builtin can be enabled or disabled independently; a disabled one
/// answers with an error result instead of falling through to a provider.
class BuiltinToolBridge
{
  public:
    /// @param services Backing services; must outlive the bridge.
    /// @param enabled Initial enabled flags by tool name. Unlisted tools are enabled.
    explicit BuiltinToolBridge(BuiltinServices services = {}, const std::map<std::string, bool>& enabled = {});

    /// @brief Returns true if @p name is one of the reserved builtin tool names.
    [[nodiscard]] static auto isReserved(std::string_view name) -> bool;

    [[nodiscard]] static auto reservedNames() -> std::vector<std::string>;

    [[nodiscard]] auto isEnabled(std::string_view name) const -> bool;

    /// @brief Enables or disables a builtin.
    /// @return False if @p name is not a builtin.
    auto setEnabled(std::string_view name, bool enabled) -> bool;

    /// @brief Returns the enabled builtins as descriptors owned by BuiltinOwnerId.
    [[nodiscard]] auto definitions() const -> std::vector<ToolDescriptor>;

    /// @brief Invokes a builtin. Never fails: errors become an error result.
    [[nodiscard]] auto call(std::string_view name, const nlohmann::json& arguments) -> ToolCallResult;

  private:
    [[nodiscard]] auto webSearch(const nlohmann::json& arguments) -> ToolCallResult;
    [[nodiscard]] auto executeCode(const nlohmann::json& arguments) -> ToolCallResult;
    [[nodiscard]] auto createArtifact(const nlohmann::json& arguments) -> ToolCallResult;
    [[nodiscard]] auto browserAction(const nlohmann::json& arguments) -> ToolCallResult;

    BuiltinServices _services;
    mutable std::mutex _mutex;
    std::map<std::string, bool, std::less<>> _enabled;
};

/// @brief Cleans model-generated artifact source.
///
/// Extracts the body of a markdown code fence, removes import and export statements
/// and setup instructions, collapses runs of blank lines and trims.
[[nodiscard]] auto sanitizeArtifactContent(std::string_view content) -> std::string;

} // namespace mcphub
