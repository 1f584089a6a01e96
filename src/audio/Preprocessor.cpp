// SPDX-License-Identifier: Apache-2.0
#include "Preprocessor.hpp"

#include <miniaudio.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace talktype
{

auto normalizePeak(std::span<const float> samples, float targetPeak) -> std::vector<float>
{
    auto out = std::vector<float>(samples.begin(), samples.end());

    auto peak = 0.0f;
    for (auto const sample: samples)
        peak = std::max(peak, std::abs(sample));

    if (peak <= 0.0f)
        return out;

    auto const gain = targetPeak / peak;
    for (auto& sample: out)
        sample *= gain;
    return out;
}

void applyHighPass(std::span<float> samples, unsigned sampleRate, float cutoffHz)
{
    if (samples.empty() || sampleRate == 0 || cutoffHz <= 0.0f
        || cutoffHz >= static_cast<float>(sampleRate) / 2.0f)
        return;

    // Bilinear-transformed biquad, Q = 1/sqrt(2) gives the Butterworth response.
    auto const w0 = 2.0 * std::numbers::pi * cutoffHz / sampleRate;
    auto const cosW0 = std::cos(w0);
    auto const alpha = std::sin(w0) / std::numbers::sqrt2; // sin(w0) / (2Q)

    auto const a0 = 1.0 + alpha;
    auto const b0 = (1.0 + cosW0) / 2.0 / a0;
    auto const b1 = -(1.0 + cosW0) / a0;
    auto const b2 = b0;
    auto const a1 = -2.0 * cosW0 / a0;
    auto const a2 = (1.0 - alpha) / a0;

    // Transposed direct form II
    auto z1 = 0.0;
    auto z2 = 0.0;
    for (auto& sample: samples)
    {
        auto const x = static_cast<double>(sample);
        auto const y = b0 * x + z1;
        z1 = b1 * x - a1 * y + z2;
        z2 = b2 * x - a2 * y;
        sample = static_cast<float>(y);
    }
}

auto resample(std::span<const float> samples, unsigned fromRate, unsigned toRate) -> Result<std::vector<float>>
{
    if (fromRate == 0 || toRate == 0)
        return makeError(ErrorCode::RecognitionFailed,
                         std::format("Cannot resample from {}Hz to {}Hz", fromRate, toRate));

    if (fromRate == toRate || samples.empty())
        return std::vector<float>(samples.begin(), samples.end());

    auto config = ma_resampler_config_init(ma_format_f32, 1, fromRate, toRate, ma_resample_algorithm_linear);
    auto resampler = ma_resampler {};
    if (auto const result = ma_resampler_init(&config, nullptr, &resampler); result != MA_SUCCESS)
        return makeError(ErrorCode::RecognitionFailed,
                         std::format("Failed to create {}Hz -> {}Hz resampler: {}",
                                     fromRate,
                                     toRate,
                                     static_cast<int>(result)));

    // Trailing zeros push the samples still held back by the filter out of the resampler. The
    // same delay shows up as leading output, which is skipped.
    auto const leading = static_cast<std::size_t>(ma_resampler_get_output_latency(&resampler));
    auto input = std::vector<float>(samples.begin(), samples.end());
    input.resize(input.size() + 2 * ma_resampler_get_input_latency(&resampler) + 2, 0.0f);

    auto const expected = static_cast<std::size_t>(static_cast<ma_uint64>(samples.size()) * toRate / fromRate);
    auto out = std::vector<float>(leading + expected + 1, 0.0f);

    auto framesIn = static_cast<ma_uint64>(input.size());
    auto framesOut = static_cast<ma_uint64>(out.size());
    auto const result = ma_resampler_process_pcm_frames(&resampler, input.data(), &framesIn, out.data(), &framesOut);
    ma_resampler_uninit(&resampler, nullptr);

    if (result != MA_SUCCESS)
        return makeError(ErrorCode::RecognitionFailed,
                         std::format("Resampling {}Hz -> {}Hz failed: {}", fromRate, toRate, static_cast<int>(result)));

    auto const produced = static_cast<std::size_t>(framesOut);
    auto const first = std::min(leading, produced);
    auto const last = std::min(first + expected, produced);
    out.erase(out.begin() + static_cast<std::ptrdiff_t>(last), out.end());
    out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(first));
    return out;
}

auto preprocess(std::span<const float> samples, unsigned sampleRate, const PreprocessConfig& config)
    -> std::vector<float>
{
    auto out = config.normalize ? normalizePeak(samples, config.targetPeak)
                                : std::vector<float>(samples.begin(), samples.end());

    if (config.highPass)
        applyHighPass(out, sampleRate, config.highPassCutoffHz);

    return out;
}

} // namespace talktype
