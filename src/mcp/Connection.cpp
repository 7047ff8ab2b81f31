// SPDX-License-Identifier: Apache-2.0
#include "Connection.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/RequestCorrelator.hpp>

#include <atomic>
#include <format>
#include <future>
#include <mutex>
#include <set>
#include <thread>

namespace mcphub
{

namespace
{
    auto clientCapabilities() -> nlohmann::json
    {
        return nlohmann::json {
            { "tools", nlohmann::json::object() },
            { "resources", { { "subscribe", true }, { "listChanged", true } } },
            { "prompts", { { "listChanged", true } } },
            { "logging", nlohmann::json::object() },
            { "sampling", nlohmann::json::object() },
            { "roots", { { "listChanged", true } } },
        };
    }

    auto hasListChanged(const nlohmann::json& capability) -> bool
    {
        return json::getBoolOr(capability, "listChanged", false) || json::getBoolOr(capability, "list_changed", false);
    }

    auto parseCapabilities(const nlohmann::json& result) -> Result<ServerCapabilities>
    {
        if (!result.is_object() || !result.contains("capabilities") || !result["capabilities"].is_object())
            return makeError(ErrorCode::HandshakeError, "initialize reply carries no capabilities object");

        auto const& caps = result["capabilities"];
        auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
        auto const section = [&](const char* key) { return caps.value(key, nlohmann::json::object()); };

        return ServerCapabilities {
            .supportsTools = caps.contains("tools"),
            .supportsToolsListChanged = hasListChanged(section("tools")),
            .supportsResources = caps.contains("resources"),
            .supportsResourceSubscribe = json::getBoolOr(section("resources"), "subscribe", false),
            .supportsResourcesListChanged = hasListChanged(section("resources")),
            .supportsPrompts = caps.contains("prompts"),
            .supportsPromptsListChanged = hasListChanged(section("prompts")),
            .supportsLogging = caps.contains("logging"),
            .supportsSampling = caps.contains("sampling"),
            .supportsRoots = caps.contains("roots"),
            .serverName = json::getStringOr(serverInfo, "name", "unknown"),
            .serverVersion = json::getStringOr(serverInfo, "version", "unknown"),
            .protocolVersion = json::getStringOr(result, "protocolVersion", ""),
        };
    }

    auto parseContentItem(const nlohmann::json& item) -> ContentItem
    {
        auto content = ContentItem {
            .type = json::getStringOr(item, "type", "text"),
            .text = json::getStringOr(item, "text", ""),
            .data = json::getStringOr(item, "data", ""),
            .mimeType = json::getStringOr(item, "mimeType", ""),
            .uri = json::getStringOr(item, "uri", ""),
        };

        if (content.type == "resource" && item.contains("resource") && item["resource"].is_object())
        {
            auto const& resource = item["resource"];
            content.uri = json::getStringOr(resource, "uri", content.uri);
            content.text = json::getStringOr(resource, "text", content.text);
            content.mimeType = json::getStringOr(resource, "mimeType", content.mimeType);
            content.data = json::getStringOr(resource, "blob", content.data);
        }

        return content;
    }

    /// Returns the reason a tool declaration is unusable, or std::nullopt if it is well-formed.
    auto toolDeclarationProblem(const nlohmann::json& item) -> std::optional<std::string>
    {
        if (!item.is_object())
            return "not an object";
        if (!item.contains("name") || !item["name"].is_string() || item["name"].get<std::string>().empty())
            return "missing or non-string name";
        if (item.contains("description") && !item["description"].is_string() && !item["description"].is_null())
            return "non-string description";
        if (item.contains("inputSchema") && !item["inputSchema"].is_object())
            return "inputSchema is not an object";
        return std::nullopt;
    }
} // namespace

struct Connection::Impl
{
    std::string id;
    std::string displayName;
    uint64_t session = 0;
    ConnectionOptions options;
    EventChannel* events = nullptr;
    ServerRequestHandlers handlers;

    std::unique_ptr<Transport> transport;
    RequestCorrelator correlator;
    ProgressTracker progress;
    std::unique_ptr<NotificationRouter> router;

    std::mutex writeMutex;
    std::mutex lifecycleMutex;

    mutable std::mutex stateMutex;
    ConnectionState state = ConnectionState::NotStarted;
    ServerCapabilities capabilities;
    bool stopped = false;
    std::atomic<bool> stopping = false;

    mutable std::mutex subscriptionMutex;
    std::set<std::string> subscriptions;

    std::jthread stdoutReader;
    std::jthread stderrReader;

    void setState(ConnectionState next)
    {
        auto const lock = std::lock_guard(stateMutex);
        if (state != next)
            log::debug("[{}] {} -> {}", id, connectionStateName(state), connectionStateName(next));
        state = next;
    }

    [[nodiscard]] auto getState() const -> ConnectionState
    {
        auto const lock = std::lock_guard(stateMutex);
        return state;
    }

    [[nodiscard]] auto write(const nlohmann::json& message) -> VoidResult
    {
        auto const lock = std::lock_guard(writeMutex);
        return transport->send(message);
    }

    [[nodiscard]] auto isSubscribed(const std::string& uri) const -> bool
    {
        auto const lock = std::lock_guard(subscriptionMutex);
        return subscriptions.contains(uri);
    }

    [[nodiscard]] auto isReaderThread() const -> bool
    {
        auto const self = std::this_thread::get_id();
        return stdoutReader.get_id() == self || stderrReader.get_id() == self;
    }

    void readMessages()
    {
        while (true)
        {
            auto message = transport->receive();
            if (!message)
            {
                if (message.error().code == ErrorCode::ProtocolError)
                {
                    log::warning("[{}] Skipping malformed message: {}", id, message.error().message);
                    continue;
                }
                log::debug("[{}] Output stream ended: {}", id, message.error().message);
                break;
            }

            log::trace("[{}] <- {}", id, message->dump());
            router->dispatch(*message);
        }

        onStreamClosed();
    }

    void readDiagnostics()
    {
        while (auto line = transport->receiveDiagnostic())
        {
            if (!line->empty())
                log::debug("[{}] {}", id, *line);
        }
    }

    void onStreamClosed()
    {
        if (stopping)
            return;

        {
            auto const lock = std::lock_guard(stateMutex);
            if (state == ConnectionState::Stopping || state == ConnectionState::Stopped
                || state == ConnectionState::Disconnected)
                return;
            log::debug("[{}] {} -> {}", id, connectionStateName(state), connectionStateName(ConnectionState::Disconnected));
            state = ConnectionState::Disconnected;
        }

        log::warning("MCP server '{}' disconnected unexpectedly", displayName);
        correlator.failAll(Error { ErrorCode::TransportError, "Server disconnected unexpectedly" });

        if (events)
        {
            events->push(ConnectionEvent {
                .serverId = id,
                .session = session,
                .payload = Disconnected { .unexpected = true, .reason = "Server disconnected unexpectedly" },
            });
        }
    }

    /// Runs a list request and collects every page's @p key array.
    [[nodiscard]] auto listAll(std::string_view method, std::string_view key) -> Result<std::vector<nlohmann::json>>
    {
        auto items = std::vector<nlohmann::json> {};
        auto cursor = std::string {};

        for (auto page = 0; page < options.maxDiscoveryPages; ++page)
        {
            auto params = nlohmann::json::object();
            if (!cursor.empty())
                params["cursor"] = cursor;

            auto result = sendRequest(method, std::move(params), options.discoveryTimeout);
            if (!result)
                return std::unexpected(result.error());

            auto const keyStr = std::string(key);
            if (!result->is_object() || !result->contains(keyStr) || !(*result)[keyStr].is_array())
                return makeError(ErrorCode::ProtocolError, std::format("{} reply has no '{}' array", method, key));

            for (auto& item: (*result)[keyStr])
                items.push_back(std::move(item));

            cursor = json::getStringOr(*result, "nextCursor", "");
            if (cursor.empty())
                return items;
        }

        log::warning("[{}] {} returned more than {} pages, truncating", id, method, options.maxDiscoveryPages);
        return items;
    }

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>
    {
        auto const current = getState();
        if (current != ConnectionState::Starting && current != ConnectionState::Initializing
            && current != ConnectionState::Ready)
            return makeError(ErrorCode::TransportError,
                             std::format("Connection '{}' is {}", id, connectionStateName(current)));

        auto promise = std::make_shared<std::promise<Result<nlohmann::json>>>();
        auto future = promise->get_future();
        auto const requestId =
            correlator.add([promise](Result<nlohmann::json> result) { promise->set_value(std::move(result)); });

        // The correlator may have been drained between the state check and add().
        if (stopping || getState() == ConnectionState::Disconnected)
        {
            correlator.resolve(requestId, makeError(ErrorCode::TransportError, "Connection closed"));
            return future.get();
        }

        log::trace("[{}] -> {} #{}", id, method, requestId);
        if (auto sent = write(jsonrpc::makeRequest(requestId, method, std::move(params))); !sent)
            correlator.resolve(requestId, std::unexpected(sent.error()));

        if (future.wait_for(timeout) == std::future_status::timeout)
        {
            auto const timedOut = correlator.resolve(
                requestId,
                makeError(ErrorCode::TimeoutError,
                          std::format("Request '{}' timed out after {}ms", method, timeout.count())));
            if (timedOut)
            {
                auto notice = jsonrpc::makeNotification(
                    "notifications/cancelled", { { "requestId", requestId }, { "reason", "Request timed out" } });
                if (auto sent = write(notice); !sent)
                    log::debug("[{}] Could not announce timeout of #{}: {}", id, requestId, sent.error().message);
            }
        }

        return future.get();
    }
};

Connection::Connection(std::string id,
                       std::string displayName,
                       std::unique_ptr<Transport> transport,
                       ConnectionOptions options,
                       EventChannel* events,
                       uint64_t session,
                       ServerRequestHandlers handlers):
    _impl(std::make_unique<Impl>())
{
    _impl->id = std::move(id);
    _impl->displayName = std::move(displayName);
    _impl->transport = std::move(transport);
    _impl->options = std::move(options);
    _impl->events = events;
    _impl->session = session;
    _impl->handlers = std::move(handlers);
}

Connection::~Connection()
{
    stop();
}

auto Connection::start() -> VoidResult
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->getState() != ConnectionState::NotStarted)
        return makeError(ErrorCode::InvalidArgument, std::format("Connection '{}' was already started", _impl->id));

    _impl->setState(ConnectionState::Starting);

    if (auto opened = _impl->transport->open(); !opened)
    {
        _impl->transport->close();
        _impl->setState(ConnectionState::Stopped);
        _impl->stopped = true;
        return opened;
    }

    auto* impl = _impl.get();
    _impl->router = std::make_unique<NotificationRouter>(
        _impl->correlator,
        _impl->progress,
        NotificationRouter::Hooks {
            .serverId = _impl->id,
            .session = _impl->session,
            .send = [impl](const nlohmann::json& message) { return impl->write(message); },
            .isSubscribed = [impl](const std::string& uri) { return impl->isSubscribed(uri); },
            .events = _impl->events,
        },
        _impl->handlers);

    _impl->stdoutReader = std::jthread([impl] { impl->readMessages(); });
    _impl->stderrReader = std::jthread([impl] { impl->readDiagnostics(); });

    return {};
}

auto Connection::initialize() -> Result<ServerCapabilities>
{
    _impl->setState(ConnectionState::Initializing);

    auto params = nlohmann::json {
        { "protocolVersion", _impl->options.protocolVersion },
        { "capabilities", clientCapabilities() },
        { "clientInfo",
          nlohmann::json {
              { "name", _impl->options.clientName },
              { "version", _impl->options.clientVersion },
          } },
    };

    return _impl->sendRequest("initialize", std::move(params), _impl->options.handshakeTimeout)
        .transform_error([this](Error error) {
            return Error {
                ErrorCode::HandshakeError,
                std::format("Handshake with '{}' failed: {}", _impl->displayName, error.message),
            };
        })
        .and_then(parseCapabilities)
        .and_then([this](ServerCapabilities caps) -> Result<ServerCapabilities> {
            if (auto sent = sendNotification("notifications/initialized"); !sent)
                return makeError(ErrorCode::HandshakeError,
                                 std::format("Failed to send initialized notification: {}", sent.error().message));

            {
                auto const lock = std::lock_guard(_impl->stateMutex);
                _impl->capabilities = caps;
            }
            _impl->setState(ConnectionState::Ready);

            log::info("MCP server initialized: {} v{}", caps.serverName, caps.serverVersion);
            return caps;
        });
}

auto Connection::listTools() -> Result<std::vector<ToolDescriptor>>
{
    return _impl->listAll("tools/list", "tools")
        .transform([this](std::vector<nlohmann::json> items) {
            auto tools = std::vector<ToolDescriptor> {};
            for (auto const& item: items)
            {
                if (auto problem = toolDeclarationProblem(item))
                {
                    log::warning("Dropping tool from '{}' ({}): {}", _impl->displayName, *problem, item.dump());
                    continue;
                }

                tools.push_back(ToolDescriptor {
                    .name = item["name"].get<std::string>(),
                    .description = json::getStringOr(item, "description", ""),
                    .inputSchema = item.value("inputSchema", nlohmann::json::object()),
                    .ownerConnectionId = _impl->id,
                    .ownerDisplayName = _impl->displayName,
                });
            }

            log::debug("[{}] Discovered {} tool(s)", _impl->id, tools.size());
            return tools;
        });
}

auto Connection::listResources() -> std::vector<ResourceDescriptor>
{
    auto items = _impl->listAll("resources/list", "resources");
    if (!items)
    {
        log::debug("[{}] No resources: {}", _impl->id, items.error().message);
        return {};
    }

    auto resources = std::vector<ResourceDescriptor> {};
    for (auto const& item: *items)
    {
        auto uri = json::getStringOr(item, "uri", "");
        if (uri.empty())
        {
            log::debug("[{}] Skipping resource without uri", _impl->id);
            continue;
        }

        resources.push_back(ResourceDescriptor {
            .uri = uri,
            .name = json::getStringOr(item, "name", uri),
            .description = json::getStringOr(item, "description", ""),
            .mimeType = json::getStringOr(item, "mimeType", ""),
            .ownerConnectionId = _impl->id,
            .ownerDisplayName = _impl->displayName,
        });
    }
    return resources;
}

auto Connection::listPrompts() -> std::vector<PromptDescriptor>
{
    auto items = _impl->listAll("prompts/list", "prompts");
    if (!items)
    {
        log::debug("[{}] No prompts: {}", _impl->id, items.error().message);
        return {};
    }

    auto prompts = std::vector<PromptDescriptor> {};
    for (auto const& item: *items)
    {
        auto name = json::getStringOr(item, "name", "");
        if (name.empty())
        {
            log::debug("[{}] Skipping prompt without name", _impl->id);
            continue;
        }

        auto prompt = PromptDescriptor {
            .name = std::move(name),
            .description = json::getStringOr(item, "description", ""),
            .ownerConnectionId = _impl->id,
            .ownerDisplayName = _impl->displayName,
        };

        if (item.contains("arguments") && item["arguments"].is_array())
        {
            for (auto const& arg: item["arguments"])
            {
                prompt.arguments.push_back(PromptArgument {
                    .name = json::getStringOr(arg, "name", ""),
                    .description = json::getStringOr(arg, "description", ""),
                    .required = json::getBoolOr(arg, "required", false),
                });
            }
        }

        prompts.push_back(std::move(prompt));
    }
    return prompts;
}

auto Connection::callTool(std::string_view name,
                          const nlohmann::json& arguments,
                          std::optional<std::chrono::milliseconds> timeout) -> ToolCallResult
{
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto result = _impl->sendRequest("tools/call", std::move(params), timeout.value_or(_impl->options.toolCallTimeout));
    if (!result)
    {
        log::warning("Tool '{}' on '{}' failed: {}", name, _impl->displayName, result.error());
        return makeToolFailure(result.error().code, std::format("Tool '{}' failed: {}", name, result.error().message));
    }

    auto const* content = json::member(*result, "content");
    if (!content || !content->is_array())
    {
        log::warning("Tool '{}' on '{}' replied without a content array", name, _impl->displayName);
        return makeToolFailure(ErrorCode::ProtocolError,
                               std::format("Tool '{}' failed: Invalid tool response format", name));
    }

    auto toolResult = ToolCallResult {};
    toolResult.isError = json::getBoolOr(*result, "isError", false);
    for (auto const& item: *content)
        toolResult.content.push_back(parseContentItem(item));

    log::debug("Tool '{}' returned {} item(s) (isError: {})", name, toolResult.content.size(), toolResult.isError);
    return toolResult;
}

auto Connection::readResource(std::string_view uri) -> Result<std::vector<ResourceContent>>
{
    return _impl->sendRequest("resources/read", { { "uri", uri } }, _impl->options.requestTimeout)
        .and_then([](const nlohmann::json& result) -> Result<std::vector<ResourceContent>> {
            if (!result.contains("contents") || !result["contents"].is_array())
                return makeError(ErrorCode::ProtocolError, "resources/read reply has no 'contents' array");

            auto contents = std::vector<ResourceContent> {};
            for (auto const& item: result["contents"])
            {
                auto content = ResourceContent {
                    .uri = json::getStringOr(item, "uri", ""),
                    .mimeType = json::getStringOr(item, "mimeType", ""),
                };

                if (item.contains("text") && item["text"].is_string())
                    content.text = item["text"].get<std::string>();

                if (item.contains("blob") && item["blob"].is_string())
                {
                    auto bytes = base64::decode(item["blob"].get<std::string>());
                    if (!bytes)
                        return std::unexpected(bytes.error());
                    content.blob = std::move(*bytes);
                }

                contents.push_back(std::move(content));
            }
            return contents;
        });
}

auto Connection::getPrompt(std::string_view name, const nlohmann::json& arguments) -> Result<PromptResult>
{
    auto params = nlohmann::json { { "name", name } };
    if (arguments.is_object() && !arguments.empty())
        params["arguments"] = arguments;

    return _impl->sendRequest("prompts/get", std::move(params), _impl->options.requestTimeout)
        .and_then([](const nlohmann::json& result) -> Result<PromptResult> {
            if (!result.contains("messages") || !result["messages"].is_array())
                return makeError(ErrorCode::ProtocolError, "prompts/get reply has no 'messages' array");

            auto prompt = PromptResult { .description = json::getStringOr(result, "description", "") };
            for (auto const& message: result["messages"])
            {
                prompt.messages.push_back(PromptMessage {
                    .role = json::getStringOr(message, "role", "user"),
                    .content = parseContentItem(message.value("content", nlohmann::json::object())),
                });
            }
            return prompt;
        });
}

auto Connection::subscribeToResource(const std::string& uri) -> VoidResult
{
    return _impl->sendRequest("resources/subscribe", { { "uri", uri } }, _impl->options.requestTimeout)
        .transform([this, &uri](const nlohmann::json&) {
            auto const lock = std::lock_guard(_impl->subscriptionMutex);
            _impl->subscriptions.insert(uri);
        });
}

auto Connection::unsubscribeFromResource(const std::string& uri) -> VoidResult
{
    return _impl->sendRequest("resources/unsubscribe", { { "uri", uri } }, _impl->options.requestTimeout)
        .transform([this, &uri](const nlohmann::json&) {
            auto const lock = std::lock_guard(_impl->subscriptionMutex);
            _impl->subscriptions.erase(uri);
        });
}

auto Connection::isSubscribed(const std::string& uri) const -> bool
{
    return _impl->isSubscribed(uri);
}

auto Connection::subscriptions() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_impl->subscriptionMutex);
    return { _impl->subscriptions.begin(), _impl->subscriptions.end() };
}

auto Connection::ping() -> VoidResult
{
    return _impl->sendRequest("ping", nlohmann::json::object(), _impl->options.requestTimeout)
        .transform([](const nlohmann::json&) {});
}

auto Connection::notifyRootsChanged() -> VoidResult
{
    return sendNotification("notifications/roots/list_changed");
}

auto Connection::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    return _impl->sendRequest(method, std::move(params), timeout);
}

auto Connection::sendNotification(std::string_view method, nlohmann::json params) -> VoidResult
{
    log::trace("[{}] -> {}", _impl->id, method);
    return _impl->write(jsonrpc::makeNotification(method, std::move(params)));
}

auto Connection::cancelRequest(int64_t id) -> bool
{
    auto const cancelled =
        _impl->correlator.resolve(id, makeError(ErrorCode::CancelledError, "Request cancelled by user"));
    if (!cancelled)
        return false;

    log::debug("[{}] Cancelled request #{}", _impl->id, id);
    if (auto sent = sendNotification("notifications/cancelled", { { "requestId", id }, { "reason", "Cancelled by user" } });
        !sent)
        log::debug("[{}] Could not announce cancellation of #{}: {}", _impl->id, id, sent.error().message);

    return true;
}

auto Connection::cancelAllRequests() -> size_t
{
    size_t count = 0;
    for (auto const id: _impl->correlator.pendingIds())
    {
        if (cancelRequest(id))
            ++count;
    }
    return count;
}

auto Connection::pendingRequestIds() const -> std::vector<int64_t>
{
    return _impl->correlator.pendingIds();
}

void Connection::stop()
{
    if (_impl->isReaderThread())
    {
        log::error("[{}] stop() called from a reader thread; ignoring", _impl->id);
        return;
    }

    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->stopped)
        return;
    _impl->stopped = true;
    _impl->stopping = true;

    auto const previous = _impl->getState();
    if (previous != ConnectionState::Disconnected)
        _impl->setState(ConnectionState::Stopping);

    _impl->transport->shutdown();

    if (_impl->stdoutReader.joinable())
        _impl->stdoutReader.join();
    if (_impl->stderrReader.joinable())
        _impl->stderrReader.join();

    if (_impl->router)
        _impl->router->shutdown();

    _impl->transport->close();

    auto const failed = _impl->correlator.failAll(Error { ErrorCode::TransportError, "Connection closed" });
    if (failed > 0)
        log::debug("[{}] Failed {} pending request(s) on stop", _impl->id, failed);

    {
        auto const subscriptionLock = std::lock_guard(_impl->subscriptionMutex);
        _impl->subscriptions.clear();
    }
    _impl->progress.clear();

    if (previous != ConnectionState::Disconnected)
        _impl->setState(ConnectionState::Stopped);

    log::info("MCP server '{}' stopped", _impl->displayName);
}

auto Connection::id() const -> const std::string&
{
    return _impl->id;
}

auto Connection::displayName() const -> const std::string&
{
    return _impl->displayName;
}

auto Connection::session() const -> uint64_t
{
    return _impl->session;
}

auto Connection::state() const -> ConnectionState
{
    return _impl->getState();
}

auto Connection::capabilities() const -> ServerCapabilities
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return _impl->capabilities;
}

auto Connection::progress() -> ProgressTracker&
{
    return _impl->progress;
}

} // namespace mcphub
