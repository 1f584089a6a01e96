// SPDX-License-Identifier: Apache-2.0
#include "AudioPipeline.hpp"

#include <audio/WavWriter.hpp>
#include <core/Log.hpp>

#include <atomic>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace talktype
{

struct AudioPipeline::Impl
{
    FrameSourceFactory sourceFactory;
    std::shared_ptr<Recognizer> recognizer;
    PipelineEvents events;

    std::mutex settingsMutex;
    PipelineSettings settings;

    std::mutex debugMutex;
    std::atomic<bool> debug = false;
    log::Level levelBeforeDebug = log::Level::Info;

    std::mutex lifecycleMutex;
    std::atomic<PipelineState> state = PipelineState::Idle;
    std::atomic<float> threshold = 0.0f;
    std::uint64_t sessionNumber = 0;

    // Session, guarded by lifecycleMutex; detector and segmenter belong to the capture thread while it runs.
    PipelineSettings active;
    std::unique_ptr<FrameSource> source;
    std::unique_ptr<TextPostProcessor> textProcessor;
    std::unique_ptr<TranscriptionDispatcher> dispatcher;
    std::unique_ptr<EnergyDetector> detector;
    std::unique_ptr<SegmentBuffer> segmenter;
    std::jthread captureThread;

    std::atomic<std::uint64_t> framesProcessed = 0;
    std::atomic<std::uint64_t> utterances = 0;
    std::atomic<std::uint64_t> transcriptions = 0;
    std::atomic<std::uint64_t> failures = 0;
    std::atomic<std::uint64_t> backpressureDrops = 0;

    void raise(const Error& error)
    {
        if (events.onError)
            events.onError(error);
    }

    void run(const std::stop_token& stopToken)
    {
        log::setThreadName("capture");

        auto const filter =
            active.noiseReduction ? std::make_shared<const DcOffsetFilter>() : std::shared_ptr<const FrameFilter> {};

        auto detectorConfig = active.detector;
        if (active.calibration.enabled)
        {
            auto calibrated = calibrate(stopToken, filter.get());
            if (!calibrated)
            {
                handleSourceError(calibrated.error());
                return;
            }
            detectorConfig.threshold = *calibrated;
        }

        threshold = detectorConfig.threshold;
        detector = std::make_unique<EnergyDetector>(detectorConfig, filter);

        while (!stopToken.stop_requested())
        {
            auto frame = source->read(stopToken);
            if (!frame)
            {
                handleSourceError(frame.error());
                return;
            }

            ++framesProcessed;
            segmenter->push(detector->process(std::move(*frame)));
        }
    }

    /// @brief Measures the noise floor and derives the detection threshold from it.
    auto calibrate(const std::stop_token& stopToken, const FrameFilter* filter) -> Result<float>
    {
        auto const& calibration = active.calibration;
        log::info("Calibrating microphone over {} frame(s), please stay silent", calibration.frames);

        auto levels = std::vector<float> {};
        levels.reserve(calibration.frames);
        for (auto i = std::size_t { 0 }; i < calibration.frames; ++i)
        {
            auto frame = source->read(stopToken);
            if (!frame)
                return std::unexpected(frame.error());

            auto const measured = filter ? filter->apply(*frame) : std::move(*frame);
            levels.push_back(EnergyDetector::rms(measured.samples));
        }

        auto const calibrated = EnergyDetector::calibrateThreshold(
            levels, calibration.multiplier, calibration.minThreshold, calibration.maxThreshold);
        log::info("Calibrated speech threshold: {:.4f}", calibrated);

        if (events.onCalibrated)
            events.onCalibrated(calibrated);
        return calibrated;
    }

    void handleSourceError(const Error& error)
    {
        switch (error.code)
        {
            case ErrorCode::Cancelled: return;
            case ErrorCode::EndOfStream:
                log::info("Input exhausted after {} frame(s)", framesProcessed.load());
                if (segmenter)
                    segmenter->flush();
                if (events.onSourceExhausted)
                    events.onSourceExhausted();
                return;
            default: break;
        }

        auto interruption = error;
        if (interruption.code != ErrorCode::StreamInterrupted)
            interruption = Error { ErrorCode::StreamInterrupted, std::format("{}", error) };

        log::error("Capture stopped: {}", interruption.message);

        // Release the device right away and leave nothing behind for the next session.
        source->close();
        if (segmenter)
            segmenter->reset();
        dispatcher->stop(StopMode::Abandon);
        state = PipelineState::Interrupted;

        raise(interruption);
    }

    void submit(Utterance utterance)
    {
        ++utterances;
        auto receipt = dispatcher->submit(std::move(utterance));
        if (!receipt)
        {
            log::warning("Could not dispatch utterance: {}", receipt.error());
            return;
        }

        if (receipt->droppedUtteranceId)
        {
            ++backpressureDrops;
            raise(Error { ErrorCode::Backpressure,
                          std::format("Transcription queue full, dropped utterance #{}", *receipt->droppedUtteranceId) });
        }
    }

    void deliver(TranscriptionResult result)
    {
        result.text = textProcessor->process(result.rawText);
        if (result.text.empty())
        {
            log::debug("Utterance #{} produced no text", result.utteranceId);
            return;
        }

        ++transcriptions;
        if (events.onTranscription)
            events.onTranscription(std::move(result));
    }

    void fail(std::uint64_t utteranceId, const Error& error)
    {
        ++failures;
        raise(Error { error.code, std::format("Utterance #{}: {}", utteranceId, error.message) });
    }

    void dumpUtterance(const Utterance& utterance, const std::string& directory, std::uint64_t session) const
    {
        if (!debug || directory.empty())
            return;

        auto const path =
            (std::filesystem::path(directory) / std::format("session{:03}-utterance{:04}.wav", session, utterance.id))
                .string();

        if (auto result = writeWav(path, utterance.samples, utterance.sampleRate); !result)
            log::warning("Could not write debug recording: {}", result.error());
        else
            log::debug("Saved utterance #{} to {}", utterance.id, path);
    }

    /// @brief Ends the current session. Caller holds lifecycleMutex.
    void teardown()
    {
        if (!source && !dispatcher)
            return;

        captureThread.request_stop();
        if (source)
            source->close();
        if (captureThread.joinable())
            captureThread.join();

        if (segmenter && state == PipelineState::Listening)
            segmenter->flush();

        source.reset();

        if (dispatcher)
            dispatcher->stop(active.drainOnStop ? StopMode::Drain : StopMode::Abandon);

        dispatcher.reset();
        segmenter.reset();
        detector.reset();
        textProcessor.reset();
        state = PipelineState::Idle;
    }
};

AudioPipeline::AudioPipeline(PipelineSettings settings,
                             FrameSourceFactory sourceFactory,
                             std::shared_ptr<Recognizer> recognizer,
                             PipelineEvents events):
    _impl(std::make_unique<Impl>())
{
    _impl->sourceFactory = std::move(sourceFactory);
    _impl->recognizer = std::move(recognizer);
    _impl->events = std::move(events);
    _impl->debug = settings.debug;
    _impl->threshold = settings.detector.threshold;
    _impl->settings = std::move(settings);
}

AudioPipeline::~AudioPipeline()
{
    stop();
}

auto AudioPipeline::start() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->state == PipelineState::Listening)
        return {};

    if (_impl->state == PipelineState::Interrupted)
    {
        log::info("Restarting after capture interruption");
        _impl->teardown();
    }

    {
        auto settingsLock = std::lock_guard(_impl->settingsMutex);
        _impl->active = _impl->settings;
    }

    auto source = _impl->sourceFactory(_impl->active.format);
    if (!source)
        return std::unexpected(source.error());
    if (!*source)
        return makeError(ErrorCode::DeviceUnavailable, "No frame source available");

    auto const session = ++_impl->sessionNumber;
    _impl->textProcessor = std::make_unique<TextPostProcessor>(_impl->active.text);

    auto dispatcherConfig = _impl->active.dispatcher;
    dispatcherConfig.onDequeue = [impl = _impl.get(),
                                  hook = std::move(dispatcherConfig.onDequeue),
                                  directory = _impl->active.debugDirectory,
                                  session](const Utterance& utterance) {
        if (hook)
            hook(utterance);
        impl->dumpUtterance(utterance, directory, session);
    };

    _impl->dispatcher = std::make_unique<TranscriptionDispatcher>(
        _impl->recognizer,
        std::move(dispatcherConfig),
        [impl = _impl.get()](TranscriptionResult result) { impl->deliver(std::move(result)); },
        [impl = _impl.get()](std::uint64_t utteranceId, const Error& error) { impl->fail(utteranceId, error); });

    if (auto result = _impl->dispatcher->start(); !result)
    {
        (*source)->close();
        _impl->dispatcher.reset();
        _impl->textProcessor.reset();
        return result;
    }

    _impl->segmenter = std::make_unique<SegmentBuffer>(
        _impl->active.segmenter, [impl = _impl.get()](Utterance utterance) { impl->submit(std::move(utterance)); });

    _impl->source = std::move(*source);
    _impl->state = PipelineState::Listening;
    _impl->captureThread = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });

    log::info("Listening (session {}, {}Hz, {} samples/frame)",
              session,
              _impl->active.format.sampleRate,
              _impl->active.format.frameSamples);
    return {};
}

void AudioPipeline::stop()
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->source && !_impl->dispatcher)
        return;

    _impl->teardown();
    log::info("Stopped listening");
}

auto AudioPipeline::toggleDebug() -> bool
{
    auto lock = std::lock_guard(_impl->debugMutex);
    auto const enabled = !_impl->debug;

    if (enabled)
    {
        _impl->levelBeforeDebug = log::getLevel();
        if (_impl->levelBeforeDebug < log::Level::Debug)
            log::setLevel(log::Level::Debug);
    }
    else
    {
        log::setLevel(_impl->levelBeforeDebug);
    }

    _impl->debug = enabled;
    log::info("Debug mode {}", enabled ? "enabled" : "disabled");
    return enabled;
}

void AudioPipeline::reconfigure(PipelineSettings settings)
{
    {
        auto lock = std::lock_guard(_impl->settingsMutex);
        _impl->settings = std::move(settings);
    }

    if (_impl->state == PipelineState::Listening)
        log::info("Settings updated; they apply from the next session");
    else
        log::info("Settings updated");
}

auto AudioPipeline::state() const -> PipelineState
{
    return _impl->state;
}

auto AudioPipeline::debugEnabled() const -> bool
{
    return _impl->debug;
}

auto AudioPipeline::threshold() const -> float
{
    return _impl->threshold;
}

auto AudioPipeline::stats() const -> PipelineStats
{
    return PipelineStats {
        .framesProcessed = _impl->framesProcessed,
        .utterances = _impl->utterances,
        .transcriptions = _impl->transcriptions,
        .failures = _impl->failures,
        .backpressureDrops = _impl->backpressureDrops,
    };
}

} // namespace talktype
