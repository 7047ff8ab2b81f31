// SPDX-License-Identifier: Apache-2.0
#include "RequestCorrelator.hpp"

#include <core/Log.hpp>

namespace mcphub
{

auto RequestCorrelator::add(Continuation continuation) -> int64_t
{
    auto const lock = std::lock_guard(_mutex);
    auto const id = _nextId++;
    _pending.emplace(id,
                     Entry {
                         .continuation = std::move(continuation),
                         .createdAt = std::chrono::steady_clock::now(),
                     });
    return id;
}

auto RequestCorrelator::remove(int64_t id) -> std::optional<Continuation>
{
    auto const lock = std::lock_guard(_mutex);
    auto node = _pending.extract(id);
    if (node.empty())
        return std::nullopt;
    return std::move(node.mapped().continuation);
}

auto RequestCorrelator::removeAll() -> std::map<int64_t, Continuation>
{
    auto drained = std::map<int64_t, Entry> {};
    {
        auto const lock = std::lock_guard(_mutex);
        drained.swap(_pending);
    }

    auto result = std::map<int64_t, Continuation> {};
    for (auto& [id, entry]: drained)
        result.emplace(id, std::move(entry.continuation));
    return result;
}

auto RequestCorrelator::resolve(int64_t id, Result<nlohmann::json> result) -> bool
{
    // Resume outside the lock so a continuation may issue new requests.
    auto continuation = remove(id);
    if (!continuation)
        return false;

    (*continuation)(std::move(result));
    return true;
}

auto RequestCorrelator::failAll(const Error& error) -> size_t
{
    auto drained = removeAll();
    for (auto& [id, continuation]: drained)
    {
        log::trace("Failing pending request {}: {}", id, error.message);
        continuation(std::unexpected(error));
    }
    return drained.size();
}

auto RequestCorrelator::contains(int64_t id) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _pending.contains(id);
}

auto RequestCorrelator::size() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _pending.size();
}

auto RequestCorrelator::pendingIds() const -> std::vector<int64_t>
{
    auto const lock = std::lock_guard(_mutex);
    auto ids = std::vector<int64_t> {};
    ids.reserve(_pending.size());
    for (auto const& [id, entry]: _pending)
        ids.push_back(id);
    return ids;
}

} // namespace mcphub
