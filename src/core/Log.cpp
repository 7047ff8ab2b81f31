// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace mcphub::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };

    // Guards the sink; several connections log at once.
    auto sinkMutex = std::mutex {};
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN";
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?";
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error" || lower == "critical" || lower == "alert" || lower == "emergency")
        return Level::Error;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "info" || lower == "notice")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    auto const lock = std::lock_guard(sinkMutex);
    if (globalCallback)
        globalCallback(level, message);
    else
        std::println(stderr, "[{:<5}] {}", levelName(level), message);
}

} // namespace mcphub::log
