// SPDX-License-Identifier: Apache-2.0
#include "WavWriter.hpp"

#include <miniaudio.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace talktype
{

auto writeWav(std::string_view path, std::span<const float> samples, unsigned sampleRate) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto pcm = std::vector<std::int16_t>(samples.size());
    std::ranges::transform(samples, pcm.begin(), [](float s) {
        return static_cast<std::int16_t>(std::lround(std::clamp(s, -1.0f, 1.0f) * 32767.0f));
    });

    auto const filename = std::string(path);
    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, 1, sampleRate);
    auto encoder = ma_encoder {};
    auto const initResult = ma_encoder_init_file(filename.c_str(), &config, &encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create WAV file '{}': {}", path, static_cast<int>(initResult)));

    auto written = ma_uint64 { 0 };
    auto const writeResult = ma_encoder_write_pcm_frames(&encoder, pcm.data(), pcm.size(), &written);
    ma_encoder_uninit(&encoder);

    if (writeResult != MA_SUCCESS || written != pcm.size())
        return makeError(ErrorCode::IoError,
                         std::format("Failed to write WAV file '{}': {} of {} frames written",
                                     path,
                                     written,
                                     pcm.size()));
    return {};
}

} // namespace talktype
