// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>
#include <vector>

namespace talktype
{

/// @brief Clean-up applied to an utterance before it is handed to the recognizer.
struct PreprocessConfig
{
    bool normalize = true;

    /// Peak amplitude after normalization.
    float targetPeak = 0.9f;

    bool highPass = true;
    float highPassCutoffHz = 100.0f;
};

/// @brief Scales the samples so that the absolute peak equals targetPeak. Silence is returned unchanged.
[[nodiscard]] auto normalizePeak(std::span<const float> samples, float targetPeak) -> std::vector<float>;

/// @brief Applies a 2nd-order Butterworth high-pass filter in place.
///
/// Removes rumble and handling noise below the cutoff. Does nothing if the cutoff is not below
/// the Nyquist frequency.
void applyHighPass(std::span<float> samples, unsigned sampleRate, float cutoffHz);

/// @brief Converts mono samples from one sample rate to another (linear interpolation with low-pass).
///
/// Returns a copy when both rates are equal. The output holds about
/// samples.size() * toRate / fromRate samples.
[[nodiscard]] auto resample(std::span<const float> samples, unsigned fromRate, unsigned toRate)
    -> Result<std::vector<float>>;

/// @brief Runs the configured steps (normalization, then high-pass) on a copy of the samples.
[[nodiscard]] auto preprocess(std::span<const float> samples, unsigned sampleRate, const PreprocessConfig& config)
    -> std::vector<float>;

} // namespace talktype
