// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/EnergyDetector.hpp>
#include <audio/FrameSource.hpp>
#include <audio/SegmentBuffer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <stt/Recognizer.hpp>
#include <stt/TranscriptionDispatcher.hpp>
#include <text/TextPostProcessor.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace talktype
{

/// @brief Noise-floor measurement run before detection starts.
struct CalibrationSettings
{
    bool enabled = false;

    /// Frames measured; they are not fed to the detector.
    std::size_t frames = 50;

    float multiplier = 3.0f;
    float minThreshold = 0.009f;
    float maxThreshold = 0.03f;
};

/// @brief Everything one listening session is configured with.
///
/// Taken as a snapshot by start(); reconfigure() replaces it for the next session.
struct PipelineSettings
{
    FrameFormat format;
    EnergyDetectorConfig detector;

    /// Removes the DC offset of each frame before measuring it.
    bool noiseReduction = true;

    CalibrationSettings calibration;
    SegmentBufferConfig segmenter;
    DispatcherConfig dispatcher;

    /// On stop: finish queued utterances (true) or abandon them (false).
    bool drainOnStop = true;

    TextConfig text;

    bool debug = false;

    /// Where utterance WAV files are written while debug mode is on. Empty disables the dumps.
    std::string debugDirectory;
};

/// @brief Creates the frame source for a new session.
using FrameSourceFactory = std::function<Result<std::unique_ptr<FrameSource>>(const FrameFormat& format)>;

/// @brief Notifications raised by the pipeline.
///
/// onTranscription and recognition failures are raised on dispatcher threads, the others on the
/// capture thread. None of them may call AudioPipeline::stop().
struct PipelineEvents
{
    /// Post-processed text, in utterance order. Results that end up empty are not reported.
    std::function<void(TranscriptionResult result)> onTranscription;

    /// Backpressure, RecognitionFailed and RecognitionTimeout (session continues) or
    /// StreamInterrupted (session over, restart required).
    std::function<void(const Error& error)> onError;

    /// The frame source reported EndOfStream. The last utterance has been handed to the dispatcher.
    std::function<void()> onSourceExhausted;

    /// A calibration finished with the given threshold.
    std::function<void(float threshold)> onCalibrated;
};

enum class PipelineState : std::uint8_t
{
    Idle,
    Listening,

    /// The capture stream broke. The session ends and waits for stop() or a new start().
    Interrupted,
};

struct PipelineStats
{
    std::uint64_t framesProcessed = 0;
    std::uint64_t utterances = 0;
    std::uint64_t transcriptions = 0;
    std::uint64_t failures = 0;
    std::uint64_t backpressureDrops = 0;
};

/// @brief Orchestrates capture, speech detection, segmentation and transcription.
///
/// A dedicated capture thread reads frames from the source, labels them with the
/// EnergyDetector, groups them in the SegmentBuffer and submits finalized utterances to the
/// TranscriptionDispatcher. The capture thread only blocks on the frame source.
///
/// Control methods are thread safe and valid in every state.
class AudioPipeline
{
  public:
    AudioPipeline(PipelineSettings settings,
                  FrameSourceFactory sourceFactory,
                  std::shared_ptr<Recognizer> recognizer,
                  PipelineEvents events);
    ~AudioPipeline();

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    /// @brief Opens the frame source and starts listening. Does nothing if already listening.
    ///
    /// After an interruption this is the explicit restart: the broken session is torn down
    /// first and the new one starts with nothing queued.
    /// @return Success, DeviceUnavailable if the source cannot be opened, or the dispatcher's error.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops listening.
    ///
    /// Halts capture and releases the source first, then finalizes the open utterance and
    /// drains or abandons the dispatcher. Afterwards the pipeline is Idle with nothing queued.
    void stop();

    /// @brief Flips debug mode (debug logging and utterance WAV dumps).
    /// @return The new debug state.
    auto toggleDebug() -> bool;

    /// @brief Replaces the settings. They apply from the next start().
    void reconfigure(PipelineSettings settings);

    [[nodiscard]] auto state() const -> PipelineState;
    [[nodiscard]] auto debugEnabled() const -> bool;

    /// @brief Detection threshold of the current (or last) session.
    [[nodiscard]] auto threshold() const -> float;

    [[nodiscard]] auto stats() const -> PipelineStats;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
