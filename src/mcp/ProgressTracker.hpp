// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Tracks progress notifications keyed by progress token.
///
/// An entry is created by the first notification for its token and updated in place
/// afterwards. Once `progress >= total` it expires after the retention period; expired
/// entries are purged whenever the tracker is accessed.
class ProgressTracker
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::chrono::milliseconds retention = std::chrono::seconds(2));

    /// @brief Records a progress notification and returns the stored state.
    auto update(Progress progress) -> Progress;

    [[nodiscard]] auto get(const std::string& token) -> std::optional<Progress>;
    [[nodiscard]] auto all() -> std::vector<Progress>;

    void clear();

    /// @brief Drops completed entries whose retention has elapsed at @p now.
    void purgeExpired(Clock::time_point now);

  private:
    struct Entry
    {
        Progress progress;
        std::optional<Clock::time_point> completedAt;
    };

    std::chrono::milliseconds _retention;
    std::mutex _mutex;
    std::map<std::string, Entry> _entries;

    void purgeLocked(Clock::time_point now);
};

} // namespace mcphub
