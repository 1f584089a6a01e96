// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/AudioPipeline.hpp>
#include <audio/FileSource.hpp>
#include <core/Log.hpp>
#include <stt/WhisperRecognizer.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <print>
#include <string>
#include <string_view>

namespace talktype
{

namespace
{

    /// @brief File input is read faster than real time; the queue must hold every utterance.
    constexpr auto FileQueueCapacity = std::size_t { 4096 };

    auto unixNow() -> std::int64_t
    {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const start = text.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return text.substr(start, end - start + 1);
    }

    void printControls()
    {
        std::println("");
        std::println("  Enter  start/stop listening");
        std::println("  d      toggle debug mode");
        std::println("  r      reload settings");
        std::println("  s      show status");
        std::println("  q      quit");
        std::println("");
    }

    auto stateName(PipelineState state) -> std::string_view
    {
        switch (state)
        {
            case PipelineState::Idle: return "idle";
            case PipelineState::Listening: return "listening";
            case PipelineState::Interrupted: return "interrupted";
        }
        return "unknown";
    }

} // namespace

struct App::Impl
{
    std::mutex configMutex;
    AppConfig config;
    std::string configPath;
    std::unique_ptr<OutputSink> sink;
    std::shared_ptr<Recognizer> recognizer;
    std::unique_ptr<AudioPipeline> pipeline;
    bool interactive = false;

    std::mutex sessionMutex;
    std::condition_variable sessionEnded;
    bool exhausted = false;
    bool interrupted = false;

    Impl(AppConfig cfg, std::string path, std::unique_ptr<OutputSink> outputSink):
        config(std::move(cfg)), configPath(std::move(path)), sink(std::move(outputSink))
    {
    }

    auto makeEvents(bool persistCalibration) -> PipelineEvents
    {
        return PipelineEvents {
            .onTranscription = [this](TranscriptionResult result) { sink->deliver(result); },
            .onError = [this](const Error& error) { reportError(error); },
            .onSourceExhausted =
                [this] {
                    auto lock = std::lock_guard(sessionMutex);
                    exhausted = true;
                    sessionEnded.notify_all();
                },
            .onCalibrated =
                [this, persistCalibration](float threshold) {
                    if (persistCalibration)
                        saveCalibration(threshold);
                },
        };
    }

    void reportError(const Error& error)
    {
        switch (error.code)
        {
            case ErrorCode::Backpressure: log::warning("{}", error.message); break;
            case ErrorCode::StreamInterrupted:
            {
                log::error("{}", error.message);
                if (interactive)
                    std::println("Capture interrupted. Press Enter to restart listening.");

                auto lock = std::lock_guard(sessionMutex);
                interrupted = true;
                sessionEnded.notify_all();
                break;
            }
            default: log::warning("{}", error); break;
        }
    }

    void saveCalibration(float threshold)
    {
        auto lock = std::lock_guard(configMutex);
        config.calibration.threshold = threshold;
        config.calibration.timestamp = unixNow();
        config.calibration.device = config.audio.device;

        if (auto result = saveConfigToFile(configPath, config); !result)
            log::warning("Could not save calibration: {}", result.error().message);
        else
            log::debug("Calibration saved to {}", configPath);
    }

    auto captureFactory() -> FrameSourceFactory
    {
        return [this](const FrameFormat& format) -> Result<std::unique_ptr<FrameSource>> {
            auto captureConfig = CaptureConfig {};
            {
                auto lock = std::lock_guard(configMutex);
                captureConfig.device = config.audio.device;
                captureConfig.queueFrames = static_cast<std::size_t>(config.audio.captureQueueFrames);
            }
            captureConfig.sampleRate = format.sampleRate;
            captureConfig.frameSamples = format.frameSamples;

            auto capture = std::make_unique<AudioCapture>();
            if (auto result = capture->initialize(captureConfig); !result)
                return std::unexpected(result.error());
            if (auto result = capture->start(); !result)
                return std::unexpected(result.error());
            return capture;
        };
    }

    auto currentPipelineSettings() -> PipelineSettings
    {
        auto lock = std::lock_guard(configMutex);
        return makePipelineSettings(config, unixNow());
    }

    void toggleListening()
    {
        if (pipeline->state() == PipelineState::Listening)
        {
            pipeline->stop();
            std::println("Stopped listening.");
            return;
        }

        {
            auto lock = std::lock_guard(sessionMutex);
            interrupted = false;
        }

        if (auto result = pipeline->start(); !result)
        {
            log::error("Cannot start listening: {}", result.error());
            return;
        }
        std::println("Listening... (Enter to stop)");
    }

    void reloadSettings()
    {
        auto loaded = loadConfig(configPath);
        if (!loaded)
        {
            log::error("Reload failed: {}", loaded.error());
            return;
        }
        if (auto valid = validateConfig(*loaded); !valid)
        {
            log::error("Reload failed: {}", valid.error());
            return;
        }

        {
            auto lock = std::lock_guard(configMutex);
            if (resolveModelPath(loaded->processing) != resolveModelPath(config.processing)
                || loaded->processing.device != config.processing.device)
                log::warning("Model and processing device changes take effect after a restart of talktype");
            config = std::move(*loaded);
        }

        pipeline->reconfigure(currentPipelineSettings());
    }

    void printStatus() const
    {
        auto const stats = pipeline->stats();
        std::println("State: {}, debug: {}, log level: {}, threshold: {:.4f}",
                     stateName(pipeline->state()),
                     pipeline->debugEnabled() ? "on" : "off",
                     log::levelName(log::getLevel()),
                     pipeline->threshold());
        std::println("Frames: {}, utterances: {}, transcribed: {}, failed: {}, dropped: {}",
                     stats.framesProcessed,
                     stats.utterances,
                     stats.transcriptions,
                     stats.failures,
                     stats.backpressureDrops);
    }
};

App::App(AppConfig config, std::string configPath, std::unique_ptr<OutputSink> sink):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath), std::move(sink)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto valid = validateConfig(_impl->config); !valid)
        return valid;

    auto whisperConfig = makeWhisperConfig(_impl->config);
    if (!whisperConfig)
        return std::unexpected(whisperConfig.error());

    // Auto-download the model of the configured size
    if (_impl->config.processing.whisperModelPath.empty() && !std::filesystem::exists(whisperConfig->modelPath))
    {
        log::info("Whisper model '{}' not found. Downloading {}...",
                  _impl->config.processing.modelSize,
                  modelFilename(_impl->config.processing.modelSize));
        if (auto downloaded = downloadModel(_impl->config.processing.modelSize); !downloaded)
            return downloaded;
    }

    auto recognizer = makeRecognizer(*whisperConfig);
    if (!recognizer)
        return std::unexpected(recognizer.error());

    _impl->recognizer = std::move(*recognizer);
    return {};
}

auto App::run() -> int
{
    _impl->interactive = true;
    _impl->pipeline = std::make_unique<AudioPipeline>(
        _impl->currentPipelineSettings(), _impl->captureFactory(), _impl->recognizer, _impl->makeEvents(true));

    printControls();
    _impl->toggleListening();

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        auto const command = trim(line);
        if (command.empty())
            _impl->toggleListening();
        else if (command == "q" || command == "quit")
            break;
        else if (command == "d")
            std::println("Debug mode {}.", _impl->pipeline->toggleDebug() ? "on" : "off");
        else if (command == "r")
            _impl->reloadSettings();
        else if (command == "s")
            _impl->printStatus();
        else
            printControls();
    }

    _impl->pipeline->stop();
    _impl->printStatus();
    return 0;
}

auto App::transcribeFile(std::string_view path) -> int
{
    auto settings = _impl->currentPipelineSettings();
    settings.calibration.enabled = false;
    settings.dispatcher.queueCapacity = std::max(settings.dispatcher.queueCapacity, FileQueueCapacity);
    settings.drainOnStop = true;

    auto factory = [file = std::string(path)](const FrameFormat& format) -> Result<std::unique_ptr<FrameSource>> {
        auto source = std::make_unique<FileSource>();
        if (auto result = source->open(file, format); !result)
            return std::unexpected(result.error());
        return source;
    };

    _impl->pipeline =
        std::make_unique<AudioPipeline>(std::move(settings), std::move(factory), _impl->recognizer, _impl->makeEvents(false));

    if (auto result = _impl->pipeline->start(); !result)
    {
        log::error("Cannot transcribe {}: {}", path, result.error());
        return 1;
    }

    {
        auto lock = std::unique_lock(_impl->sessionMutex);
        _impl->sessionEnded.wait(lock, [this] { return _impl->exhausted || _impl->interrupted; });
    }

    _impl->pipeline->stop();

    auto const stats = _impl->pipeline->stats();
    log::info("{} utterance(s), {} transcribed, {} failed", stats.utterances, stats.transcriptions, stats.failures);

    auto lock = std::lock_guard(_impl->sessionMutex);
    return _impl->interrupted ? 1 : 0;
}

} // namespace talktype
