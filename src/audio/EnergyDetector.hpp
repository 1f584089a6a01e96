// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <deque>
#include <memory>
#include <span>

namespace talktype
{

/// @brief Configuration for the energy-based speech/silence detector.
struct EnergyDetectorConfig
{
    /// RMS level (float PCM, 0..1) above which a frame counts as loud.
    float threshold = 0.015f;

    /// Consecutive frames on the other side of the threshold required to flip speech <-> silence.
    int confirmFrames = 2;

    /// Number of recent RMS values averaged before comparing (1 disables smoothing).
    int smoothingFrames = 1;
};

/// @brief A pure frame-to-frame transform applied before the loudness is measured.
///
/// Implementations must not keep state between frames.
class FrameFilter
{
  public:
    virtual ~FrameFilter() = default;

    [[nodiscard]] virtual auto apply(const AudioFrame& frame) const -> AudioFrame = 0;
};

/// @brief Removes the DC offset (the mean) of each frame.
///
/// Cheap noise reduction for cheap microphones whose bias would otherwise inflate the RMS.
class DcOffsetFilter final: public FrameFilter
{
  public:
    [[nodiscard]] auto apply(const AudioFrame& frame) const -> AudioFrame override;
};

/// @brief Labels frames as speech or silence from their RMS level, with hysteresis.
///
/// The detector starts in the silence state. A state change is confirmed only after
/// EnergyDetectorConfig::confirmFrames consecutive frames crossed the threshold in the same
/// direction; the confirming frame is the first one that carries the new label. Shorter runs
/// (transient clicks, short dips between words) leave the label unchanged.
class EnergyDetector
{
  public:
    explicit EnergyDetector(EnergyDetectorConfig config = {}, std::shared_ptr<const FrameFilter> filter = nullptr);

    /// @brief Filters, measures and labels one frame.
    [[nodiscard]] auto process(AudioFrame frame) -> LabeledFrame;

    /// @brief Returns true if the confirmed state is speech.
    [[nodiscard]] auto inSpeech() const noexcept -> bool { return _speech; }

    [[nodiscard]] auto config() const noexcept -> const EnergyDetectorConfig& { return _config; }

    /// @brief Returns to the initial silence state and forgets the smoothing history.
    void reset();

    /// @brief Computes the root-mean-square amplitude of the samples (0 for an empty span).
    [[nodiscard]] static auto rms(std::span<const float> samples) -> float;

    /// @brief Derives a detection threshold from noise-floor measurements.
    /// @param levels RMS levels measured while nobody speaks.
    /// @param multiplier Factor applied to the mean level.
    /// @param minThreshold Lower clamp.
    /// @param maxThreshold Upper clamp.
    /// @return mean(levels) * multiplier, clamped; minThreshold if levels is empty.
    [[nodiscard]] static auto calibrateThreshold(std::span<const float> levels,
                                                 float multiplier,
                                                 float minThreshold,
                                                 float maxThreshold) -> float;

  private:
    [[nodiscard]] auto smooth(float level) -> float;

    EnergyDetectorConfig _config;
    std::shared_ptr<const FrameFilter> _filter;

    std::deque<float> _history;
    float _historySum = 0.0f;

    bool _speech = false;
    int _crossingRun = 0;
};

} // namespace talktype
