// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioPipeline.hpp>
#include <core/Error.hpp>
#include <stt/WhisperRecognizer.hpp>
#include <text/TextPostProcessor.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief Hotkey bindings, persisted for the desktop front end that registers them.
struct HotkeyConfig
{
    std::string toggleListening = "ctrl+alt+z";
    std::string exitApp = "ctrl+alt+x";
    std::string settings = "ctrl+alt+q";
    std::string testMic = "ctrl+alt+t";
    std::string debugMode = "ctrl+alt+d";
};

/// @brief Audio capture and segmentation section. Durations are in milliseconds.
struct AudioConfig
{
    int sampleRate = 16000;
    int frameMs = 20;

    /// Empty for the system default, a device index, or part of a device name.
    std::string device;

    /// RMS level separating speech from silence, used when no calibration applies.
    float silenceThreshold = 0.015f;
    int hysteresisFrames = 2;
    int smoothingFrames = 1;

    int preRollMs = 500;
    int trailPadMs = 300;
    int maxSilenceMs = 1000;
    int minUtteranceMs = 500;
    int maxUtteranceMs = 10000;

    bool noiseReduction = true;
    int captureQueueFrames = 100;
};

/// @brief Microphone calibration section, including the cached result of the last run.
struct CalibrationConfig
{
    bool enabled = true;
    int durationMs = 1000;
    float multiplier = 3.0f;
    float minThreshold = 0.009f;
    float maxThreshold = 0.03f;

    /// Threshold measured by the last calibration, if any.
    std::optional<float> threshold;

    /// Unix time (seconds) of the last calibration.
    std::int64_t timestamp = 0;

    /// Device the last calibration ran on.
    std::string device;
};

/// @brief Speech recognition section.
struct ProcessingConfig
{
    /// Whisper model size ("tiny", "base", "small", "medium", ...).
    std::string modelSize = "small";

    /// "cpu", "gpu" or "cuda".
    std::string device = "cpu";

    /// Explicit model file; overrides modelSize when set.
    std::string whisperModelPath;

    std::string language = "en";
    int threads = 4;
    int beamSize = 5;
    bool translate = false;
};

/// @brief Transcription dispatch section.
struct DispatchConfig
{
    int queueCapacity = 8;
    int maxInFlight = 1;
    int timeoutMs = 30000;
    bool drainOnStop = true;

    /// Peak normalization and high-pass filtering before recognition.
    bool preprocess = true;
};

/// @brief Debug section.
struct DebugConfig
{
    bool enabled = false;

    /// Where utterance recordings go in debug mode. Empty selects defaultDebugDir().
    std::string directory;

    std::string logLevel = "info";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    HotkeyConfig hotkeys;
    AudioConfig audio;
    CalibrationConfig calibration;
    ProcessingConfig processing;
    DispatchConfig dispatch;
    TextConfig text;
    DebugConfig debug;
};

/// @brief Loads the application configuration, falling back to defaults if the file does not exist.
/// @param path The path to the config file, usually defaultConfigPath().
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig(std::string_view path) -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and cross-field constraints.
/// @return Success, or ConfigError naming the first offending setting.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/talktype or ~/.local/share/talktype
/// On macOS: ~/Library/Application Support/talktype
/// On Windows: %APPDATA%\talktype
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default model directory path.
[[nodiscard]] auto defaultModelDir() -> std::string;

/// @brief Returns the default directory for debug recordings.
[[nodiscard]] auto defaultDebugDir() -> std::string;

/// @brief Metadata for a downloadable whisper model.
struct ModelInfo
{
    std::string_view size;      ///< Model size as used in the config (e.g. "small").
    std::string_view sizeLabel; ///< Human-readable download size (e.g. "~466 MB").
};

/// @brief Returns the whisper model sizes that can be downloaded.
[[nodiscard]] auto availableModels() -> std::span<const ModelInfo>;

/// @brief Returns the model filename for a size ("small" -> "ggml-small.bin").
[[nodiscard]] auto modelFilename(std::string_view size) -> std::string;

/// @brief Returns the download URL of the model of the given size.
[[nodiscard]] auto modelUrl(std::string_view size) -> std::string;

/// @brief Returns the local path of the model of the given size.
[[nodiscard]] auto modelPathForSize(std::string_view size) -> std::string;

/// @brief Returns the model file the processing section selects.
[[nodiscard]] auto resolveModelPath(const ProcessingConfig& processing) -> std::string;

/// @brief Downloads the whisper model of the given size to the default model directory.
/// @return Success or an error with download details.
[[nodiscard]] auto downloadModel(std::string_view size) -> VoidResult;

/// @brief Maximum age of a reusable calibration.
inline constexpr auto CalibrationMaxAgeSeconds = std::int64_t { 24 * 60 * 60 };

/// @brief Returns true if the cached calibration can be reused for the device at the given time.
[[nodiscard]] auto isCalibrationFresh(const CalibrationConfig& calibration, std::string_view device, std::int64_t now)
    -> bool;

/// @brief Returns the number of frames covering the duration, rounded up.
[[nodiscard]] auto framesFor(int durationMs, int frameMs) -> std::size_t;

/// @brief Derives the pipeline settings (durations converted to frame counts).
///
/// A fresh cached calibration replaces the configured threshold and disables measuring.
[[nodiscard]] auto makePipelineSettings(const AppConfig& config, std::int64_t now) -> PipelineSettings;

/// @brief Derives the recognizer configuration.
/// @return The whisper configuration, or ConfigError for an unknown processing device.
[[nodiscard]] auto makeWhisperConfig(const AppConfig& config) -> Result<WhisperConfig>;

} // namespace talktype
