// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcphub::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty callback to revert to stderr output. The callback is invoked
/// under the sink lock, but from whichever thread logged: connection readers,
/// request workers or the manager's supervisor.
void setCallback(LogCallback callback);

/// @brief Installs a callback for the lifetime of the guard and restores stderr output afterwards.
class ScopedCallback
{
  public:
    explicit ScopedCallback(LogCallback callback) { setCallback(std::move(callback)); }
    ~ScopedCallback() { setCallback({}); }

    ScopedCallback(const ScopedCallback&) = delete;
    ScopedCallback& operator=(const ScopedCallback&) = delete;
};

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages at @p level pass the current verbosity.
[[nodiscard]] inline auto isEnabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Returns the upper-case name of @p level ("ERROR", "WARN", ...).
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Maps a textual level name onto a Level.
///
/// Accepts the local names and the syslog-style names used by MCP log notifications
/// ("notice", "critical", "alert", "emergency"). Matching is case-insensitive.
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Writes an already formatted message at the given level.
void write(Level level, std::string_view message);

/// @brief Formats and writes a message, skipping the formatting when @p level is filtered out.
template <typename... Args>
void at(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (isEnabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace mcphub::log
