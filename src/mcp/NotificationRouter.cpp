// SPDX-License-Identifier: Apache-2.0
#include "NotificationRouter.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcphub
{

namespace
{
    auto progressTokenToString(const nlohmann::json& token) -> std::string
    {
        if (token.is_string())
            return token.get<std::string>();
        return token.dump();
    }

    auto rootToJson(const Root& root) -> nlohmann::json
    {
        return nlohmann::json {
            { "uri", root.uri },
            { "name", root.name },
        };
    }
} // namespace

NotificationRouter::NotificationRouter(RequestCorrelator& correlator,
                                       ProgressTracker& progress,
                                       Hooks hooks,
                                       ServerRequestHandlers handlers):
    _correlator(correlator), _progress(progress), _hooks(std::move(hooks)), _handlers(std::move(handlers))
{
    _worker = std::jthread([this](const std::stop_token& token) { runWorker(token); });
}

NotificationRouter::~NotificationRouter()
{
    shutdown();
}

void NotificationRouter::dispatch(const nlohmann::json& message)
{
    std::visit(
        [this](auto&& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, jsonrpc::Response>)
                handleResponse(msg);
            else if constexpr (std::is_same_v<T, jsonrpc::Notification>)
                handleNotification(msg);
            else if constexpr (std::is_same_v<T, jsonrpc::ServerRequest>)
                handleServerRequest(std::move(msg));
            else
                log::warning("[{}] Ignoring invalid message: {}", _hooks.serverId, msg.reason);
        },
        jsonrpc::classify(message));
}

void NotificationRouter::shutdown()
{
    {
        auto const lock = std::lock_guard(_mutex);
        _queue.clear();
    }

    if (_worker.joinable())
    {
        _worker.request_stop();
        _cv.notify_all();
        _worker.join();
    }
}

auto NotificationRouter::inFlightCount() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _inFlight.size();
}

void NotificationRouter::handleResponse(const jsonrpc::Response& response)
{
    auto result = Result<nlohmann::json> {};
    if (response.error)
        result = makeRemoteError(response.error->code, response.error->message);
    else
        result = response.result.value_or(nlohmann::json::object());

    if (!_correlator.resolve(response.id, std::move(result)))
        log::debug("[{}] Discarding response for unknown request id {}", _hooks.serverId, response.id);
}

void NotificationRouter::handleNotification(const jsonrpc::Notification& notification)
{
    auto const& method = notification.method;
    auto const& params = notification.params;

    if (auto const kind = jsonrpc::listChangedKind(method))
    {
        if (*kind == "tools")
            emit(ListChanged { CapabilityKind::Tools });
        else if (*kind == "resources")
            emit(ListChanged { CapabilityKind::Resources });
        else if (*kind == "prompts")
            emit(ListChanged { CapabilityKind::Prompts });
        else
            log::debug("[{}] Ignoring {} from server", _hooks.serverId, method);
        return;
    }

    if (method == "notifications/resources/updated")
    {
        auto uri = json::getStringOr(params, "uri", "");
        if (!uri.empty() && _hooks.isSubscribed && _hooks.isSubscribed(uri))
            emit(ResourceUpdated { std::move(uri) });
        else
            log::debug("[{}] Ignoring update for unsubscribed resource '{}'", _hooks.serverId, uri);
        return;
    }

    if (method == "notifications/progress")
        return handleProgress(params);

    if (method == "notifications/message")
        return handleLogMessage(params);

    if (method == "notifications/cancelled")
        return handleCancelled(params);

    log::debug("[{}] Unhandled notification: {}", _hooks.serverId, method);
}

void NotificationRouter::handleProgress(const nlohmann::json& params)
{
    if (!params.is_object() || !params.contains("progressToken"))
    {
        log::debug("[{}] Progress notification without token", _hooks.serverId);
        return;
    }

    auto progress = Progress {
        .token = progressTokenToString(params["progressToken"]),
        .progress = json::getDoubleOr(params, "progress", 0.0),
    };
    if (params.contains("total") && params["total"].is_number())
        progress.total = params["total"].get<double>();
    if (params.contains("message") && params["message"].is_string())
        progress.message = params["message"].get<std::string>();

    emit(ProgressUpdated { _progress.update(std::move(progress)) });
}

void NotificationRouter::handleLogMessage(const nlohmann::json& params)
{
    auto message = LogMessage {
        .level = json::getStringOr(params, "level", "info"),
        .logger = json::getStringOr(params, "logger", _hooks.serverId),
        .data = params.value("data", nlohmann::json {}),
    };

    auto const text = message.data.is_string() ? message.data.get<std::string>() : message.data.dump();
    log::write(log::levelFromString(message.level).value_or(log::Level::Info),
               std::format("MCP[{}]: {}", message.logger, text));

    emit(LogReceived { std::move(message) });
}

void NotificationRouter::handleCancelled(const nlohmann::json& params)
{
    if (!params.is_object() || !params.contains("requestId"))
        return;

    auto const& requestId = params["requestId"];
    auto const reason = json::getStringOr(params, "reason", "no reason given");

    {
        auto const lock = std::lock_guard(_mutex);
        if (auto const it = _inFlight.find(requestId.dump()); it != _inFlight.end())
            it->second = true;
    }

    if (requestId.is_number_integer())
    {
        auto const id = requestId.get<int64_t>();
        if (_correlator.resolve(
                id, makeError(ErrorCode::CancelledError, std::format("Request cancelled by server: {}", reason))))
            log::debug("[{}] Server cancelled request {}", _hooks.serverId, id);
    }
}

void NotificationRouter::handleServerRequest(jsonrpc::ServerRequest request)
{
    auto const key = request.id.dump();
    {
        auto lock = std::unique_lock(_mutex);
        if (!_inFlight.contains(key))
        {
            _inFlight.emplace(key, false);
            _queue.push_back(std::move(request));
            lock.unlock();
            _cv.notify_one();
            return;
        }
    }

    log::warning("[{}] Server reused in-flight request id {}", _hooks.serverId, key);
    if (auto sent = _hooks.send(jsonrpc::makeErrorResponse(
            request.id, jsonrpc::ErrorCodes::InvalidRequest, std::format("Duplicate request id: {}", key)));
        !sent)
        log::warning("[{}] Failed to answer duplicate request: {}", _hooks.serverId, sent.error().message);
}

void NotificationRouter::runWorker(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto request = jsonrpc::ServerRequest {};
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, stopToken, [this] { return !_queue.empty(); });
            if (stopToken.stop_requested() || _queue.empty())
                return;

            request = std::move(_queue.front());
            _queue.pop_front();
        }

        auto reply = answer(request);

        auto cancelled = false;
        {
            auto const lock = std::lock_guard(_mutex);
            auto const it = _inFlight.find(request.id.dump());
            if (it != _inFlight.end())
            {
                cancelled = it->second;
                _inFlight.erase(it);
            }
        }

        if (cancelled)
        {
            log::debug("[{}] Dropping reply to cancelled request {}", _hooks.serverId, request.method);
            continue;
        }

        if (auto sent = _hooks.send(reply); !sent)
            log::warning("[{}] Failed to answer {}: {}", _hooks.serverId, request.method, sent.error().message);
    }
}

auto NotificationRouter::answer(const jsonrpc::ServerRequest& request) -> nlohmann::json
{
    log::debug("[{}] Server request: {}", _hooks.serverId, request.method);

    if (request.method == "ping")
        return jsonrpc::makeResult(request.id, nlohmann::json::object());

    if (request.method == "sampling/createMessage")
        return answerSampling(request);

    if (request.method == "roots/list")
        return answerRoots(request);

    return jsonrpc::makeErrorResponse(
        request.id, jsonrpc::ErrorCodes::MethodNotFound, std::format("Method not found: {}", request.method));
}

auto NotificationRouter::answerSampling(const jsonrpc::ServerRequest& request) -> nlohmann::json
{
    auto const& params = request.params;
    if (!params.is_object() || !params.contains("messages") || !params["messages"].is_array())
        return jsonrpc::makeErrorResponse(
            request.id, jsonrpc::ErrorCodes::InvalidParams, "Invalid params: 'messages' array is required");

    if (!_handlers.sampling)
        return jsonrpc::makeErrorResponse(
            request.id, jsonrpc::ErrorCodes::InternalError, "Sampling is not supported by this client");

    auto const samplingRequest = SamplingRequest {
        .messages = params["messages"],
        .systemPrompt = json::getStringOr(params, "systemPrompt", ""),
        .maxTokens = json::getIntOr(params, "maxTokens", 0),
        .params = params,
    };

    auto result = _handlers.sampling(samplingRequest);
    if (!result)
        return jsonrpc::makeErrorResponse(request.id, jsonrpc::ErrorCodes::InternalError, result.error().message);

    return jsonrpc::makeResult(request.id, std::move(*result));
}

auto NotificationRouter::answerRoots(const jsonrpc::ServerRequest& request) -> nlohmann::json
{
    auto roots = nlohmann::json::array();
    if (_handlers.roots)
    {
        for (auto const& root: _handlers.roots())
            roots.push_back(rootToJson(root));
    }

    return jsonrpc::makeResult(request.id, nlohmann::json { { "roots", std::move(roots) } });
}

void NotificationRouter::emit(ConnectionEventPayload payload)
{
    if (!_hooks.events)
        return;

    _hooks.events->push(ConnectionEvent {
        .serverId = _hooks.serverId,
        .session = _hooks.session,
        .payload = std::move(payload),
    });
}

} // namespace mcphub
