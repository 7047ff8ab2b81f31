// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace mcphub
{

/// @brief Maps outgoing request ids to the callers waiting for them.
///
/// Ids are allocated from 1 upwards and never reused within one correlator.
/// Whoever removes an entry owns its continuation and must resume it exactly once,
/// which makes "response, timeout, cancellation: first one wins" a matter of
/// calling remove() and ignoring an empty result.
class RequestCorrelator
{
  public:
    using Continuation = std::function<void(Result<nlohmann::json>)>;

    RequestCorrelator() = default;

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// @brief Stores a continuation under a freshly allocated id.
    [[nodiscard]] auto add(Continuation continuation) -> int64_t;

    /// @brief Pops the continuation for @p id.
    /// @return The continuation, or std::nullopt if it was already resolved.
    [[nodiscard]] auto remove(int64_t id) -> std::optional<Continuation>;

    /// @brief Pops every pending continuation.
    [[nodiscard]] auto removeAll() -> std::map<int64_t, Continuation>;

    /// @brief Resolves the entry for @p id with @p result if it is still pending.
    /// @return True if a continuation was resumed.
    auto resolve(int64_t id, Result<nlohmann::json> result) -> bool;

    /// @brief Resolves every pending entry with @p error.
    /// @return The number of continuations resumed.
    auto failAll(const Error& error) -> size_t;

    [[nodiscard]] auto contains(int64_t id) const -> bool;
    [[nodiscard]] auto size() const -> size_t;

    /// @brief Returns the ids still waiting for a reply, oldest first.
    [[nodiscard]] auto pendingIds() const -> std::vector<int64_t>;

  private:
    struct Entry
    {
        Continuation continuation;
        std::chrono::steady_clock::time_point createdAt;
    };

    mutable std::mutex _mutex;
    int64_t _nextId = 1;
    std::map<int64_t, Entry> _pending;
};

} // namespace mcphub
