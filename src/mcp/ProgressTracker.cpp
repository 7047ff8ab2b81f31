// SPDX-License-Identifier: Apache-2.0
#include "ProgressTracker.hpp"

namespace mcphub
{

ProgressTracker::ProgressTracker(std::chrono::milliseconds retention): _retention(retention)
{
}

auto ProgressTracker::update(Progress progress) -> Progress
{
    auto const lock = std::lock_guard(_mutex);
    auto const now = Clock::now();
    purgeLocked(now);

    auto& entry = _entries[progress.token];
    entry.progress = std::move(progress);
    if (entry.progress.isComplete())
    {
        if (!entry.completedAt)
            entry.completedAt = now;
    }
    else
    {
        entry.completedAt.reset();
    }
    return entry.progress;
}

auto ProgressTracker::get(const std::string& token) -> std::optional<Progress>
{
    auto const lock = std::lock_guard(_mutex);
    purgeLocked(Clock::now());

    auto const it = _entries.find(token);
    if (it == _entries.end())
        return std::nullopt;
    return it->second.progress;
}

auto ProgressTracker::all() -> std::vector<Progress>
{
    auto const lock = std::lock_guard(_mutex);
    purgeLocked(Clock::now());

    auto result = std::vector<Progress> {};
    result.reserve(_entries.size());
    for (auto const& [token, entry]: _entries)
        result.push_back(entry.progress);
    return result;
}

void ProgressTracker::clear()
{
    auto const lock = std::lock_guard(_mutex);
    _entries.clear();
}

void ProgressTracker::purgeExpired(Clock::time_point now)
{
    auto const lock = std::lock_guard(_mutex);
    purgeLocked(now);
}

void ProgressTracker::purgeLocked(Clock::time_point now)
{
    std::erase_if(_entries, [&](auto const& item) {
        auto const& completedAt = item.second.completedAt;
        return completedAt && now - *completedAt >= _retention;
    });
}

} // namespace mcphub
