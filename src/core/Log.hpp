// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string_view>

namespace talktype::log
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

/// @brief Receives every message that passes the level filter, instead of stderr.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to the callback; an empty callback reverts to stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages of the given level are currently written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @return The level, or Level::Info for unknown names.
[[nodiscard]] auto levelFromString(std::string_view name) -> Level;

/// @brief Returns the lower-case name levelFromString() accepts.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Tags stderr output of the calling thread ("capture", "stt-1", ...).
///
/// The audio callback, the capture thread and the recognition workers all log; the tag tells
/// their lines apart. An empty name removes the tag.
void setThreadName(std::string_view name);

/// @brief Writes a message at the given level. Safe to call from any thread.
///
/// Without a callback the line goes to stderr, prefixed with the seconds since start-up, the
/// level and the thread tag.
void write(Level level, std::string_view message);

/// @brief Formats and writes a message, skipping the formatting if the level is filtered out.
template <typename... Args>
void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Info, fmt, std::forward<Args>(args)...);
}

/// @brief Per-utterance details: segmentation decisions, queue activity, recognition timing.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Per-frame details and engine chatter.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace talktype::log
