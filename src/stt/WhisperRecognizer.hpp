// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stt/Recognizer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief Where recognition runs.
enum class ProcessingDevice : std::uint8_t
{
    Cpu,
    Gpu,
};

/// @brief Parses "cpu", "gpu" or "cuda".
/// @return The device, or std::nullopt for an unknown name.
[[nodiscard]] auto processingDeviceFromString(std::string_view name) -> std::optional<ProcessingDevice>;

[[nodiscard]] auto processingDeviceToString(ProcessingDevice device) -> std::string_view;

/// @brief Returns whisper's language code for a language id, or an empty string for an unknown id.
[[nodiscard]] auto whisperLanguageCode(int languageId) -> std::string;

/// @brief Configuration for the whisper.cpp recognizer.
struct WhisperConfig
{
    std::string modelPath;

    /// Language code, or "auto" to let whisper detect it.
    std::string language = "en";

    int threads = 4;
    bool translate = false;

    /// Beam width; 1 selects greedy sampling.
    int beamSize = 5;

    ProcessingDevice device = ProcessingDevice::Cpu;
};

/// @brief Speech recognition using whisper.cpp.
///
/// The model is loaded once by initialize(). Every recognize() call runs on its own whisper state,
/// so concurrent calls from several dispatcher workers are safe. Deadlines and stop requests are
/// honoured through whisper's abort callback.
class WhisperRecognizer final: public Recognizer
{
  public:
    WhisperRecognizer();
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    /// @brief Loads the whisper model.
    /// @param config Recognizer configuration.
    /// @return Success or ModelLoadError.
    [[nodiscard]] auto initialize(const WhisperConfig& config) -> VoidResult;

    [[nodiscard]] auto recognize(const RecognitionRequest& request) -> Result<Recognition> override;

    [[nodiscard]] auto inputSampleRate() const -> unsigned override;
    [[nodiscard]] auto name() const -> std::string_view override;

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Creates and loads the recognizer variant for the configured processing device.
///
/// Called once per session start; the variant does not change while a session runs.
[[nodiscard]] auto makeRecognizer(const WhisperConfig& config) -> Result<std::shared_ptr<Recognizer>>;

} // namespace talktype
