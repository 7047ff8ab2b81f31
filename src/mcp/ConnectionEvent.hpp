// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace mcphub
{

/// @brief The three kinds of capability a provider can list.
enum class CapabilityKind
{
    Tools,
    Resources,
    Prompts,
};

[[nodiscard]] constexpr auto capabilityKindName(CapabilityKind kind) -> std::string_view
{
    switch (kind)
    {
        case CapabilityKind::Tools: return "tools";
        case CapabilityKind::Resources: return "resources";
        case CapabilityKind::Prompts: return "prompts";
    }
    return "unknown";
}

/// @brief The provider changed its list of tools, resources or prompts.
struct ListChanged
{
    CapabilityKind kind = CapabilityKind::Tools;
};

/// @brief A subscribed resource changed.
struct ResourceUpdated
{
    std::string uri;
};

/// @brief A progress notification was recorded.
struct ProgressUpdated
{
    Progress progress;
};

/// @brief The provider emitted a log message.
struct LogReceived
{
    LogMessage message;
};

/// @brief The connection's process went away.
struct Disconnected
{
    bool unexpected = false;
    std::string reason;
};

using ConnectionEventPayload = std::variant<ListChanged, ResourceUpdated, ProgressUpdated, LogReceived, Disconnected>;

/// @brief An event raised by a connection for its supervisor.
///
/// `session` distinguishes successive connections to the same server so that late
/// events from a stopped session can be told apart from the live one.
struct ConnectionEvent
{
    std::string serverId;
    uint64_t session = 0;
    ConnectionEventPayload payload;
};

/// @brief Unbounded multi-producer queue of connection events.
///
/// Every connection of a supervisor pushes into the same channel. The supervisor
/// consumes it from a single thread.
class EventChannel
{
  public:
    void push(ConnectionEvent event)
    {
        {
            auto const lock = std::lock_guard(_mutex);
            _queue.push_back(std::move(event));
        }
        _cv.notify_one();
    }

    /// @brief Blocks until an event is available or a stop is requested.
    [[nodiscard]] auto waitPop(std::stop_token stopToken) -> std::optional<ConnectionEvent>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, stopToken, [this] { return !_queue.empty(); });
        if (_queue.empty())
            return std::nullopt;

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

    /// @brief Waits up to @p timeout for an event.
    [[nodiscard]] auto popFor(std::chrono::milliseconds timeout) -> std::optional<ConnectionEvent>
    {
        auto lock = std::unique_lock(_mutex);
        if (!_cv.wait_for(lock, timeout, [this] { return !_queue.empty(); }))
            return std::nullopt;

        auto event = std::move(_queue.front());
        _queue.pop_front();
        return event;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return _queue.size();
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<ConnectionEvent> _queue;
};

} // namespace mcphub
