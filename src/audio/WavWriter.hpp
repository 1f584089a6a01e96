// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>
#include <string_view>

namespace talktype
{

/// @brief Writes mono float32 samples to a 16-bit PCM WAV file using the miniaudio encoder.
/// @param path Destination file; parent directories are created as needed.
/// @param samples Samples in [-1, 1].
/// @param sampleRate Sample rate of the samples.
/// @return Success or an IoError.
[[nodiscard]] auto writeWav(std::string_view path, std::span<const float> samples, unsigned sampleRate)
    -> VoidResult;

} // namespace talktype
