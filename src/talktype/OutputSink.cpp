// SPDX-License-Identifier: Apache-2.0
#include "OutputSink.hpp"

#include <format>
#include <print>
#include <string>

namespace talktype
{

namespace
{

    auto formatTime(Microseconds time) -> std::string
    {
        auto const totalMs = time.count() / 1000;
        return std::format("{:02}:{:02}.{:03}", totalMs / 60'000, (totalMs / 1000) % 60, totalMs % 1000);
    }

} // namespace

ConsoleSink::ConsoleSink(std::FILE* stream, bool withTimestamps): _stream(stream), _withTimestamps(withTimestamps)
{
}

void ConsoleSink::deliver(const TranscriptionResult& result)
{
    auto lock = std::lock_guard(_mutex);
    if (_withTimestamps)
        std::println(_stream, "[{} --> {}] {}", formatTime(result.startTime), formatTime(result.endTime), result.text);
    else
        std::println(_stream, "{}", result.text);
    std::fflush(_stream);
}

} // namespace talktype
