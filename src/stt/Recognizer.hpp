// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief One recognition call.
struct RecognitionRequest
{
    /// Mono float32 PCM.
    std::span<const float> samples;
    unsigned sampleRate = 16000;

    /// The engine should give up with ErrorCode::RecognitionTimeout once this point has passed.
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();

    /// Fires when the caller abandons the call; the engine should return ErrorCode::Cancelled.
    std::stop_token stopToken;
};

/// @brief What the engine recognized.
struct Recognition
{
    std::string text;
    std::optional<float> confidence;
    std::string language;
};

/// @brief Capability interface of a speech recognition engine.
///
/// Model loading and caching belong to the implementation. recognize() may be called from
/// several dispatcher workers at once.
class Recognizer
{
  public:
    virtual ~Recognizer() = default;

    [[nodiscard]] virtual auto recognize(const RecognitionRequest& request) -> Result<Recognition> = 0;

    /// @brief Sample rate recognize() expects, or 0 if it takes any rate.
    ///
    /// The dispatcher resamples utterances captured at a different rate before the call.
    [[nodiscard]] virtual auto inputSampleRate() const -> unsigned { return 0; }

    /// @brief Human-readable engine description for logs.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace talktype
