// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <string>

namespace talktype::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto const startTime = std::chrono::steady_clock::now();

    // Guards globalCallback and keeps lines from different threads apart.
    auto writeMutex = std::mutex {};

    thread_local auto threadName = std::string {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(writeMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> Level
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return Level::Info;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

void setThreadName(std::string_view name)
{
    threadName = std::string(name);
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto callback = LogCallback {};
    {
        auto lock = std::lock_guard(writeMutex);
        callback = globalCallback;
    }

    // Called unlocked, so the callback may log or replace itself.
    if (callback)
    {
        callback(level, message);
        return;
    }

    auto lock = std::lock_guard(writeMutex);
    auto const uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    if (threadName.empty())
        std::println(stderr, "{:9.3f} {:<7} {}", uptime, levelName(level), message);
    else
        std::println(stderr, "{:9.3f} {:<7} [{}] {}", uptime, levelName(level), threadName, message);
}

} // namespace talktype::log
