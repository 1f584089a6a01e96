// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdio>
#include <mutex>

namespace talktype
{

/// @brief Consumer of the ordered transcription stream.
///
/// Inserting text into the foreground application (and falling back when that fails) is the
/// sink's own concern. deliver() is called from dispatcher threads, one call at a time.
class OutputSink
{
  public:
    virtual ~OutputSink() = default;

    virtual void deliver(const TranscriptionResult& result) = 0;
};

/// @brief Writes each transcription as one line to a stdio stream.
class ConsoleSink final: public OutputSink
{
  public:
    /// @param stream Destination stream (not owned).
    /// @param withTimestamps Prefix each line with the utterance time span.
    explicit ConsoleSink(std::FILE* stream = stdout, bool withTimestamps = false);

    void deliver(const TranscriptionResult& result) override;

  private:
    std::mutex _mutex;
    std::FILE* _stream;
    bool _withTimestamps;
};

} // namespace talktype
