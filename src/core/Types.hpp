// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace talktype
{

using Microseconds = std::chrono::microseconds;

/// @brief Format of the frames produced by a frame source.
struct FrameFormat
{
    unsigned sampleRate = 16000;
    unsigned channels = 1;

    /// Samples per channel in one frame.
    std::size_t frameSamples = 320;

    /// @brief Returns the duration of one frame.
    [[nodiscard]] auto frameDuration() const -> Microseconds
    {
        return Microseconds { static_cast<std::int64_t>(frameSamples) * 1'000'000 / sampleRate };
    }

    /// @brief Returns the start time of the frame with the given sequence index.
    ///
    /// Derived from the index (not from a wall clock) so consecutive frames are exactly contiguous.
    [[nodiscard]] auto timestampOf(std::uint64_t index) const -> Microseconds
    {
        return Microseconds { static_cast<std::int64_t>(index * frameSamples * 1'000'000 / sampleRate) };
    }
};

/// @brief A fixed-duration block of float32 PCM samples in [-1, 1].
///
/// Immutable once captured; moved from stage to stage.
struct AudioFrame
{
    /// Sequence number within the capture session. Gaps mean frames were lost.
    std::uint64_t index = 0;

    /// Start time relative to the beginning of the session.
    Microseconds timestamp { 0 };

    unsigned sampleRate = 16000;
    unsigned channels = 1;
    std::vector<float> samples;

    [[nodiscard]] auto duration() const -> Microseconds
    {
        if (sampleRate == 0 || channels == 0)
            return Microseconds { 0 };
        return Microseconds { static_cast<std::int64_t>(samples.size() / channels) * 1'000'000 / sampleRate };
    }

    [[nodiscard]] auto endTime() const -> Microseconds { return timestamp + duration(); }
};

/// @brief An AudioFrame labeled by the energy detector.
struct LabeledFrame
{
    AudioFrame frame;
    bool speech = false;

    /// Loudness measure the label was derived from (RMS, possibly smoothed).
    float energy = 0.0f;
};

/// @brief A contiguous span of audio bounded by silence, treated as one transcription unit.
struct Utterance
{
    std::uint64_t id = 0;
    Microseconds startTime { 0 };
    Microseconds endTime { 0 };
    unsigned sampleRate = 16000;

    std::uint64_t firstFrameIndex = 0;
    std::size_t frameCount = 0;
    std::size_t speechFrameCount = 0;

    /// Concatenated samples of all frames, lead and trail padding included.
    std::vector<float> samples;

    [[nodiscard]] auto duration() const -> Microseconds { return endTime - startTime; }
};

/// @brief Recognized text for one utterance.
struct TranscriptionResult
{
    std::uint64_t utteranceId = 0;

    /// Text after post-processing.
    std::string text;

    /// Text as returned by the recognition engine.
    std::string rawText;

    Microseconds startTime { 0 };
    Microseconds endTime { 0 };

    /// Engine-dependent confidence in [0, 1], if the engine reports one.
    std::optional<float> confidence;

    /// Detected or configured language code.
    std::string language;

    /// Wall time spent inside the recognition engine.
    std::chrono::milliseconds processingTime { 0 };
};

} // namespace talktype
