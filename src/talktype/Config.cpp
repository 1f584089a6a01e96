// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace talktype
{

namespace
{

    constexpr auto ModelBaseUrl = std::string_view { "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/" };

    constexpr auto WhisperModels = std::array<ModelInfo, 10> { {
        { .size = "tiny", .sizeLabel = "~75 MB" },
        { .size = "tiny.en", .sizeLabel = "~75 MB" },
        { .size = "base", .sizeLabel = "~142 MB" },
        { .size = "base.en", .sizeLabel = "~142 MB" },
        { .size = "small", .sizeLabel = "~466 MB" },
        { .size = "small.en", .sizeLabel = "~466 MB" },
        { .size = "medium", .sizeLabel = "~1.5 GB" },
        { .size = "medium.en", .sizeLabel = "~1.5 GB" },
        { .size = "large-v3", .sizeLabel = "~2.9 GB" },
        { .size = "large-v3-turbo", .sizeLabel = "~1.5 GB" },
    } };

    auto configError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::move(message));
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\talktype";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/talktype";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/talktype";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/talktype";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\talktype";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/talktype";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/talktype";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/talktype";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultModelDir() -> std::string
{
    return defaultDataDir() + "/models";
}

auto defaultDebugDir() -> std::string
{
    return defaultDataDir() + "/debug";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return configError(std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return configError(std::format("Config file {} does not contain a JSON object", path));

    auto config = AppConfig {};

    auto hotkeys = json::SectionReader(root, "hotkeys");
    hotkeys.read("toggleListening", config.hotkeys.toggleListening);
    hotkeys.read("exitApp", config.hotkeys.exitApp);
    hotkeys.read("settings", config.hotkeys.settings);
    hotkeys.read("testMic", config.hotkeys.testMic);
    hotkeys.read("debugMode", config.hotkeys.debugMode);

    auto audio = json::SectionReader(root, "audio");
    audio.read("sampleRate", config.audio.sampleRate);
    audio.read("frameMs", config.audio.frameMs);
    audio.read("device", config.audio.device);
    audio.read("silenceThreshold", config.audio.silenceThreshold);
    audio.read("hysteresisFrames", config.audio.hysteresisFrames);
    audio.read("smoothingFrames", config.audio.smoothingFrames);
    audio.read("preRollMs", config.audio.preRollMs);
    audio.read("trailPadMs", config.audio.trailPadMs);
    audio.read("maxSilenceMs", config.audio.maxSilenceMs);
    audio.read("minUtteranceMs", config.audio.minUtteranceMs);
    audio.read("maxUtteranceMs", config.audio.maxUtteranceMs);
    audio.read("noiseReduction", config.audio.noiseReduction);
    audio.read("captureQueueFrames", config.audio.captureQueueFrames);

    auto calibration = json::SectionReader(root, "calibration");
    calibration.read("enabled", config.calibration.enabled);
    calibration.read("durationMs", config.calibration.durationMs);
    calibration.read("multiplier", config.calibration.multiplier);
    calibration.read("minThreshold", config.calibration.minThreshold);
    calibration.read("maxThreshold", config.calibration.maxThreshold);
    calibration.read("threshold", config.calibration.threshold);
    calibration.read("timestamp", config.calibration.timestamp);
    calibration.read("device", config.calibration.device);

    auto processing = json::SectionReader(root, "processing");
    processing.read("modelSize", config.processing.modelSize);
    processing.read("device", config.processing.device);
    processing.read("whisperModelPath", config.processing.whisperModelPath);
    processing.read("language", config.processing.language);
    processing.read("threads", config.processing.threads);
    processing.read("beamSize", config.processing.beamSize);
    processing.read("translate", config.processing.translate);

    auto dispatch = json::SectionReader(root, "dispatch");
    dispatch.read("queueCapacity", config.dispatch.queueCapacity);
    dispatch.read("maxInFlight", config.dispatch.maxInFlight);
    dispatch.read("timeoutMs", config.dispatch.timeoutMs);
    dispatch.read("drainOnStop", config.dispatch.drainOnStop);
    dispatch.read("preprocess", config.dispatch.preprocess);

    auto text = json::SectionReader(root, "text");
    text.read("removeFillers", config.text.removeFillers);
    text.read("fixCommonErrors", config.text.fixCommonErrors);
    text.read("collapseRepeats", config.text.collapseRepeats);
    text.read("capitalize", config.text.capitalize);
    text.read("terminalPunctuation", config.text.terminalPunctuation);

    auto debug = json::SectionReader(root, "debug");
    debug.read("enabled", config.debug.enabled);
    debug.read("directory", config.debug.directory);
    debug.read("logLevel", config.debug.logLevel);

    for (auto const* section: { &hotkeys, &audio, &calibration, &processing, &dispatch, &text, &debug })
        if (auto status = section->status(); !status)
            return configError(std::format("{}: {}", path, status.error().message));

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["hotkeys"] = {
        { "toggleListening", config.hotkeys.toggleListening },
        { "exitApp", config.hotkeys.exitApp },
        { "settings", config.hotkeys.settings },
        { "testMic", config.hotkeys.testMic },
        { "debugMode", config.hotkeys.debugMode },
    };

    auto audio = nlohmann::json::object();
    audio["sampleRate"] = config.audio.sampleRate;
    audio["frameMs"] = config.audio.frameMs;
    if (!config.audio.device.empty())
        audio["device"] = config.audio.device;
    audio["silenceThreshold"] = config.audio.silenceThreshold;
    audio["hysteresisFrames"] = config.audio.hysteresisFrames;
    audio["smoothingFrames"] = config.audio.smoothingFrames;
    audio["preRollMs"] = config.audio.preRollMs;
    audio["trailPadMs"] = config.audio.trailPadMs;
    audio["maxSilenceMs"] = config.audio.maxSilenceMs;
    audio["minUtteranceMs"] = config.audio.minUtteranceMs;
    audio["maxUtteranceMs"] = config.audio.maxUtteranceMs;
    audio["noiseReduction"] = config.audio.noiseReduction;
    audio["captureQueueFrames"] = config.audio.captureQueueFrames;
    root["audio"] = std::move(audio);

    auto calibration = nlohmann::json::object();
    calibration["enabled"] = config.calibration.enabled;
    calibration["durationMs"] = config.calibration.durationMs;
    calibration["multiplier"] = config.calibration.multiplier;
    calibration["minThreshold"] = config.calibration.minThreshold;
    calibration["maxThreshold"] = config.calibration.maxThreshold;
    if (config.calibration.threshold)
    {
        calibration["threshold"] = *config.calibration.threshold;
        calibration["timestamp"] = config.calibration.timestamp;
        calibration["device"] = config.calibration.device;
    }
    root["calibration"] = std::move(calibration);

    auto processing = nlohmann::json::object();
    processing["modelSize"] = config.processing.modelSize;
    processing["device"] = config.processing.device;
    if (!config.processing.whisperModelPath.empty())
        processing["whisperModelPath"] = config.processing.whisperModelPath;
    processing["language"] = config.processing.language;
    processing["threads"] = config.processing.threads;
    processing["beamSize"] = config.processing.beamSize;
    processing["translate"] = config.processing.translate;
    root["processing"] = std::move(processing);

    root["dispatch"] = {
        { "queueCapacity", config.dispatch.queueCapacity },
        { "maxInFlight", config.dispatch.maxInFlight },
        { "timeoutMs", config.dispatch.timeoutMs },
        { "drainOnStop", config.dispatch.drainOnStop },
        { "preprocess", config.dispatch.preprocess },
    };

    root["text"] = {
        { "removeFillers", config.text.removeFillers },
        { "fixCommonErrors", config.text.fixCommonErrors },
        { "collapseRepeats", config.text.collapseRepeats },
        { "capitalize", config.text.capitalize },
        { "terminalPunctuation", config.text.terminalPunctuation },
    };

    auto debug = nlohmann::json::object();
    debug["enabled"] = config.debug.enabled;
    if (!config.debug.directory.empty())
        debug["directory"] = config.debug.directory;
    debug["logLevel"] = config.debug.logLevel;
    root["debug"] = std::move(debug);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return configError(std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return configError(std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig(std::string_view path) -> Result<AppConfig>
{
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& audio = config.audio;
    if (audio.sampleRate < 8000 || audio.sampleRate > 48000)
        return configError(std::format("audio.sampleRate must be between 8000 and 48000, got {}", audio.sampleRate));
    if (audio.frameMs < 5 || audio.frameMs > 100)
        return configError(std::format("audio.frameMs must be between 5 and 100, got {}", audio.frameMs));
    if (audio.silenceThreshold <= 0.0f || audio.silenceThreshold >= 1.0f)
        return configError(std::format("audio.silenceThreshold must be in (0, 1), got {}", audio.silenceThreshold));
    if (audio.hysteresisFrames < 1)
        return configError("audio.hysteresisFrames must be at least 1");
    if (audio.smoothingFrames < 1)
        return configError("audio.smoothingFrames must be at least 1");
    if (audio.preRollMs < 0 || audio.trailPadMs < 0 || audio.minUtteranceMs < 0)
        return configError("audio padding and minimum durations must not be negative");
    if (audio.maxSilenceMs < audio.frameMs)
        return configError(std::format("audio.maxSilenceMs must cover at least one frame ({} ms)", audio.frameMs));
    if (audio.maxUtteranceMs <= audio.minUtteranceMs)
        return configError("audio.maxUtteranceMs must be greater than audio.minUtteranceMs");
    if (audio.captureQueueFrames < 1)
        return configError("audio.captureQueueFrames must be at least 1");

    auto const& calibration = config.calibration;
    if (calibration.durationMs < audio.frameMs)
        return configError("calibration.durationMs must cover at least one frame");
    if (calibration.multiplier <= 0.0f)
        return configError("calibration.multiplier must be positive");
    if (calibration.minThreshold <= 0.0f || calibration.minThreshold > calibration.maxThreshold)
        return configError("calibration.minThreshold must be positive and not above calibration.maxThreshold");

    auto const& processing = config.processing;
    if (processing.modelSize.empty() && processing.whisperModelPath.empty())
        return configError("processing.modelSize or processing.whisperModelPath must be set");
    if (!processingDeviceFromString(processing.device))
        return configError(
            std::format("processing.device must be one of cpu, gpu, cuda; got '{}'", processing.device));
    if (processing.threads < 1)
        return configError("processing.threads must be at least 1");
    if (processing.beamSize < 1)
        return configError("processing.beamSize must be at least 1");

    auto const& dispatch = config.dispatch;
    if (dispatch.queueCapacity < 1)
        return configError("dispatch.queueCapacity must be at least 1");
    if (dispatch.maxInFlight < 1)
        return configError("dispatch.maxInFlight must be at least 1");
    if (dispatch.timeoutMs < 0)
        return configError("dispatch.timeoutMs must not be negative");

    return {};
}

auto availableModels() -> std::span<const ModelInfo>
{
    return WhisperModels;
}

auto modelFilename(std::string_view size) -> std::string
{
    return std::format("ggml-{}.bin", size);
}

auto modelUrl(std::string_view size) -> std::string
{
    return std::format("{}{}", ModelBaseUrl, modelFilename(size));
}

auto modelPathForSize(std::string_view size) -> std::string
{
    return defaultModelDir() + "/" + modelFilename(size);
}

auto resolveModelPath(const ProcessingConfig& processing) -> std::string
{
    if (!processing.whisperModelPath.empty())
        return processing.whisperModelPath;
    return modelPathForSize(processing.modelSize);
}

auto downloadModel(std::string_view size) -> VoidResult
{
    auto const known = std::ranges::any_of(WhisperModels, [size](auto const& model) { return model.size == size; });
    if (!known)
        return makeError(ErrorCode::DownloadError, std::format("Unknown whisper model size '{}'", size));

    auto const modelDir = defaultModelDir();
    auto const path = modelPathForSize(size);

    auto ec = std::error_code {};
    std::filesystem::create_directories(modelDir, ec);
    if (ec)
        return makeError(ErrorCode::DownloadError,
                         std::format("Failed to create model directory '{}': {}", modelDir, ec.message()));

    log::info("Downloading whisper model '{}' to {}", size, path);
    auto const command = std::format("curl -fSL --progress-bar -o '{}' '{}'", path, modelUrl(size));
    auto const exitCode = std::system(command.c_str());
    if (exitCode != 0)
    {
        // Clean up partial download
        std::filesystem::remove(path, ec);
        return makeError(ErrorCode::DownloadError,
                         std::format("Failed to download whisper model '{}' (curl exit code: {}). "
                                     "Ensure curl is installed and you have internet access.",
                                     size,
                                     exitCode));
    }

    if (!std::filesystem::exists(path) || std::filesystem::file_size(path) == 0)
    {
        std::filesystem::remove(path, ec);
        return makeError(ErrorCode::DownloadError, std::format("Downloaded model file is empty or missing: {}", path));
    }

    log::info("Whisper model '{}' downloaded successfully", size);
    return {};
}

auto isCalibrationFresh(const CalibrationConfig& calibration, std::string_view device, std::int64_t now) -> bool
{
    if (!calibration.threshold || calibration.device != device)
        return false;

    auto const age = now - calibration.timestamp;
    return age >= 0 && age < CalibrationMaxAgeSeconds;
}

auto framesFor(int durationMs, int frameMs) -> std::size_t
{
    if (durationMs <= 0 || frameMs <= 0)
        return 0;
    return static_cast<std::size_t>((durationMs + frameMs - 1) / frameMs);
}

auto makePipelineSettings(const AppConfig& config, std::int64_t now) -> PipelineSettings
{
    auto const& audio = config.audio;
    auto const& calibration = config.calibration;

    auto settings = PipelineSettings {};
    settings.format.sampleRate = static_cast<unsigned>(audio.sampleRate);
    settings.format.channels = 1;
    settings.format.frameSamples = static_cast<std::size_t>(audio.sampleRate) * audio.frameMs / 1000;

    settings.detector = EnergyDetectorConfig {
        .threshold = audio.silenceThreshold,
        .confirmFrames = audio.hysteresisFrames,
        .smoothingFrames = audio.smoothingFrames,
    };
    settings.noiseReduction = audio.noiseReduction;

    settings.calibration = CalibrationSettings {
        .enabled = calibration.enabled,
        .frames = std::max<std::size_t>(1, framesFor(calibration.durationMs, audio.frameMs)),
        .multiplier = calibration.multiplier,
        .minThreshold = calibration.minThreshold,
        .maxThreshold = calibration.maxThreshold,
    };
    if (calibration.enabled && isCalibrationFresh(calibration, audio.device, now))
    {
        settings.detector.threshold = *calibration.threshold;
        settings.calibration.enabled = false;
    }

    settings.segmenter = SegmentBufferConfig {
        .preRollFrames = framesFor(audio.preRollMs, audio.frameMs),
        .trailPadFrames = framesFor(audio.trailPadMs, audio.frameMs),
        .maxSilenceFrames = framesFor(audio.maxSilenceMs, audio.frameMs),
        .minSpeechFrames = framesFor(audio.minUtteranceMs, audio.frameMs),
        .maxUtteranceFrames = framesFor(audio.maxUtteranceMs, audio.frameMs),
    };

    settings.dispatcher.queueCapacity = static_cast<std::size_t>(std::max(1, config.dispatch.queueCapacity));
    settings.dispatcher.maxInFlight = static_cast<std::size_t>(std::max(1, config.dispatch.maxInFlight));
    settings.dispatcher.recognitionTimeout = std::chrono::milliseconds { config.dispatch.timeoutMs };
    if (config.dispatch.preprocess)
        settings.dispatcher.preprocess = PreprocessConfig {};
    settings.drainOnStop = config.dispatch.drainOnStop;

    settings.text = config.text;
    settings.debug = config.debug.enabled;
    settings.debugDirectory = config.debug.directory.empty() ? defaultDebugDir() : config.debug.directory;
    return settings;
}

auto makeWhisperConfig(const AppConfig& config) -> Result<WhisperConfig>
{
    auto const device = processingDeviceFromString(config.processing.device);
    if (!device)
        return configError(std::format("Unknown processing device '{}'", config.processing.device));

    return WhisperConfig {
        .modelPath = resolveModelPath(config.processing),
        .language = config.processing.language,
        .threads = config.processing.threads,
        .translate = config.processing.translate,
        .beamSize = config.processing.beamSize,
        .device = *device,
    };
}

} // namespace talktype
