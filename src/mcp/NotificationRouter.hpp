// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionEvent.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ProgressTracker.hpp>
#include <mcp/RequestCorrelator.hpp>

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcphub
{

/// @brief Client-side implementations of the requests a provider may issue.
///
/// Both handlers are optional. Without a sampling handler, sampling requests are
/// answered with an internal error; without a roots handler, roots/list returns an
/// empty list.
struct ServerRequestHandlers
{
    std::function<Result<nlohmann::json>(const SamplingRequest&)> sampling;
    std::function<std::vector<Root>()> roots;
};

/// @brief Classifies inbound messages of one connection and dispatches them.
///
/// Responses resolve the correlator, notifications become ConnectionEvents, and
/// server-initiated requests are answered on a dedicated worker thread so the
/// reader that calls dispatch() never blocks on a handler. Server requests are
/// tracked in their own in-flight table, separate from the correlator's ids.
class NotificationRouter
{
  public:
    /// @brief Connection-side collaborators of the router.
    struct Hooks
    {
        std::string serverId;
        uint64_t session = 0;

        /// Writes one message to the provider. Must serialize concurrent writers.
        std::function<VoidResult(const nlohmann::json&)> send;

        /// Returns true if the client is subscribed to the given resource uri.
        std::function<bool(const std::string&)> isSubscribed;

        /// Receives the connection's events; may be null.
        EventChannel* events = nullptr;
    };

    NotificationRouter(RequestCorrelator& correlator,
                       ProgressTracker& progress,
                       Hooks hooks,
                       ServerRequestHandlers handlers);
    ~NotificationRouter();

    NotificationRouter(const NotificationRouter&) = delete;
    NotificationRouter& operator=(const NotificationRouter&) = delete;

    /// @brief Routes one decoded inbound message.
    void dispatch(const nlohmann::json& message);

    /// @brief Stops the request worker. Queued server requests are dropped unanswered.
    void shutdown();

    /// @brief Returns the number of server requests received but not yet answered.
    [[nodiscard]] auto inFlightCount() const -> size_t;

  private:
    void handleResponse(const jsonrpc::Response& response);
    void handleNotification(const jsonrpc::Notification& notification);
    void handleServerRequest(jsonrpc::ServerRequest request);

    void handleProgress(const nlohmann::json& params);
    void handleLogMessage(const nlohmann::json& params);
    void handleCancelled(const nlohmann::json& params);

    [[nodiscard]] auto answer(const jsonrpc::ServerRequest& request) -> nlohmann::json;
    [[nodiscard]] auto answerSampling(const jsonrpc::ServerRequest& request) -> nlohmann::json;
    [[nodiscard]] auto answerRoots(const jsonrpc::ServerRequest& request) -> nlohmann::json;

    void runWorker(const std::stop_token& stopToken);
    void emit(ConnectionEventPayload payload);

    RequestCorrelator& _correlator;
    ProgressTracker& _progress;
    Hooks _hooks;
    ServerRequestHandlers _handlers;

    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<jsonrpc::ServerRequest> _queue;
    std::map<std::string, bool> _inFlight; // serialized id -> cancelled
    std::jthread _worker;
};

} // namespace mcphub
