// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioPipeline.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "TestHelpers.hpp"

using namespace talktype;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;
using test::appendFrames;
using test::Gate;
using test::LambdaRecognizer;
using test::ScriptedSource;

namespace
{

/// @brief Records pipeline events and lets the test wait for them.
struct EventLog
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<TranscriptionResult> transcriptions;
    std::vector<Error> errors;
    std::optional<float> calibrated;
    bool exhausted = false;

    auto events() -> PipelineEvents
    {
        return PipelineEvents {
            .onTranscription =
                [this](TranscriptionResult result) {
                    auto lock = std::lock_guard(mutex);
                    transcriptions.push_back(std::move(result));
                    cv.notify_all();
                },
            .onError =
                [this](const Error& error) {
                    auto lock = std::lock_guard(mutex);
                    errors.push_back(error);
                    cv.notify_all();
                },
            .onSourceExhausted =
                [this] {
                    auto lock = std::lock_guard(mutex);
                    exhausted = true;
                    cv.notify_all();
                },
            .onCalibrated =
                [this](float threshold) {
                    auto lock = std::lock_guard(mutex);
                    calibrated = threshold;
                    cv.notify_all();
                },
        };
    }

    template <typename Predicate>
    auto waitFor(Predicate predicate) -> bool
    {
        auto lock = std::unique_lock(mutex);
        return cv.wait_for(lock, 5s, [&] { return predicate(*this); });
    }
};

auto testSettings() -> PipelineSettings
{
    auto settings = PipelineSettings {};
    settings.format = FrameFormat { .sampleRate = 16000, .channels = 1, .frameSamples = 320 };
    settings.detector = EnergyDetectorConfig { .threshold = 0.05f, .confirmFrames = 2, .smoothingFrames = 1 };
    settings.segmenter = SegmentBufferConfig {
        .preRollFrames = 5, .trailPadFrames = 3, .maxSilenceFrames = 10, .minSpeechFrames = 5, .maxUtteranceFrames = 500
    };
    settings.dispatcher.recognitionTimeout = 0ms;
    return settings;
}

auto fixedRecognizer(std::string text) -> std::shared_ptr<Recognizer>
{
    return std::make_shared<LambdaRecognizer>([text = std::move(text)](const RecognitionRequest&) -> Result<Recognition> {
        return Recognition { .text = text, .confidence = std::nullopt, .language = "en" };
    });
}

/// @brief Factory handing out one scripted source per session.
auto scriptedFactory(std::vector<std::vector<float>> scripts, std::vector<std::optional<ErrorCode>> terminals)
    -> FrameSourceFactory
{
    auto session = std::make_shared<std::size_t>(0);
    return [=](const FrameFormat& format) -> Result<std::unique_ptr<FrameSource>> {
        auto const index = (*session)++;
        if (index >= scripts.size())
            return makeError(ErrorCode::DeviceUnavailable, "no more scripts");
        return std::make_unique<ScriptedSource>(scripts[index], terminals[index], format);
    };
}

/// @brief Waits until the capture thread has taken count frames from the source.
auto waitForFrames(const AudioPipeline& pipeline, std::uint64_t count) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (pipeline.stats().framesProcessed < count)
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

auto spokenScript() -> std::vector<float>
{
    auto script = std::vector<float> {};
    appendFrames(script, 10, 0.0f);
    appendFrames(script, 40, 0.2f);
    appendFrames(script, 60, 0.0f);
    return script;
}

} // namespace

TEST_CASE("AudioPipeline turns speech into post-processed text", "[pipeline]")
{
    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(testSettings(),
                                  scriptedFactory({ spokenScript() }, { ErrorCode::EndOfStream }),
                                  fixedRecognizer("hello world"),
                                  recorded.events());

    REQUIRE(pipeline.start().has_value());
    CHECK(pipeline.state() == PipelineState::Listening);

    REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
    pipeline.stop();
    CHECK(pipeline.state() == PipelineState::Idle);

    REQUIRE(recorded.transcriptions.size() == 1);
    auto const& result = recorded.transcriptions.front();
    CHECK(result.utteranceId == 1);
    CHECK(result.text == "Hello world.");
    CHECK(result.rawText == "hello world");
    CHECK(result.startTime < result.endTime);
    CHECK(recorded.errors.empty());

    auto const stats = pipeline.stats();
    CHECK(stats.framesProcessed == 110);
    CHECK(stats.utterances == 1);
    CHECK(stats.transcriptions == 1);
}

TEST_CASE("AudioPipeline flushes the open utterance when the input ends", "[pipeline]")
{
    auto script = std::vector<float> {};
    appendFrames(script, 5, 0.0f);
    appendFrames(script, 30, 0.2f);

    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(testSettings(),
                                  scriptedFactory({ script }, { ErrorCode::EndOfStream }),
                                  fixedRecognizer("cut short"),
                                  recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
    pipeline.stop();

    REQUIRE(recorded.transcriptions.size() == 1);
    CHECK(recorded.transcriptions.front().text == "Cut short.");
}

TEST_CASE("AudioPipeline::stop finalizes the utterance being spoken", "[pipeline]")
{
    // No terminal error: the source keeps the session open until stop().
    auto script = std::vector<float> {};
    appendFrames(script, 5, 0.0f);
    appendFrames(script, 30, 0.2f);

    SECTION("and transcribes it when draining")
    {
        auto recorded = EventLog {};
        auto pipeline = AudioPipeline(testSettings(),
                                      scriptedFactory({ script }, { std::nullopt }),
                                      fixedRecognizer("mid sentence"),
                                      recorded.events());

        REQUIRE(pipeline.start().has_value());
        REQUIRE(waitForFrames(pipeline, script.size()));
        CHECK(recorded.transcriptions.empty());

        pipeline.stop();

        CHECK(pipeline.state() == PipelineState::Idle);
        CHECK(pipeline.stats().utterances == 1);
        REQUIRE(recorded.transcriptions.size() == 1);
        CHECK(recorded.transcriptions.front().text == "Mid sentence.");
        CHECK(recorded.errors.empty());
        CHECK(!recorded.exhausted);
    }

    SECTION("and abandons it otherwise")
    {
        auto gate = Gate {};
        auto recognizer =
            std::make_shared<LambdaRecognizer>([&](const RecognitionRequest& request) -> Result<Recognition> {
                if (!gate.pass(request.stopToken))
                    return makeError(ErrorCode::Cancelled, "stopped");
                return Recognition { .text = "too late", .confidence = std::nullopt, .language = "en" };
            });

        auto settings = testSettings();
        settings.drainOnStop = false;

        auto recorded = EventLog {};
        auto pipeline =
            AudioPipeline(settings, scriptedFactory({ script }, { std::nullopt }), recognizer, recorded.events());

        REQUIRE(pipeline.start().has_value());
        REQUIRE(waitForFrames(pipeline, script.size()));
        pipeline.stop();

        CHECK(pipeline.state() == PipelineState::Idle);
        CHECK(pipeline.stats().utterances == 1);
        CHECK(recorded.transcriptions.empty());
        CHECK(recorded.errors.empty());
    }
}

TEST_CASE("AudioPipeline reports every utterance lost to a full queue", "[pipeline]")
{
    auto script = std::vector<float> {};
    appendFrames(script, 5, 0.0f);
    for (auto i = 0; i < 4; ++i)
    {
        appendFrames(script, 40, 0.2f);
        appendFrames(script, 15, 0.0f);
    }

    auto gate = Gate {};
    auto recognizer = std::make_shared<LambdaRecognizer>([&](const RecognitionRequest& request) -> Result<Recognition> {
        if (!gate.pass(request.stopToken))
            return makeError(ErrorCode::Cancelled, "stopped");
        return Recognition { .text = "kept", .confidence = std::nullopt, .language = "en" };
    });

    auto settings = testSettings();
    settings.dispatcher.queueCapacity = 1;
    settings.dispatcher.maxInFlight = 1;

    auto recorded = EventLog {};
    auto pipeline =
        AudioPipeline(settings, scriptedFactory({ script }, { ErrorCode::EndOfStream }), recognizer, recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
    gate.open();
    pipeline.stop();

    // One call in flight plus one queued: at least two of the four utterances are dropped.
    auto const stats = pipeline.stats();
    CHECK(stats.utterances == 4);
    CHECK(stats.backpressureDrops >= 2);
    REQUIRE(recorded.errors.size() == stats.backpressureDrops);
    for (auto const& error: recorded.errors)
        CHECK(error.code == ErrorCode::Backpressure);
    CHECK(recorded.transcriptions.size() + stats.backpressureDrops == 4);
}

TEST_CASE("AudioPipeline skips results that post-process to nothing", "[pipeline]")
{
    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(testSettings(),
                                  scriptedFactory({ spokenScript() }, { ErrorCode::EndOfStream }),
                                  fixedRecognizer("um uh"),
                                  recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
    pipeline.stop();

    CHECK(recorded.transcriptions.empty());
    CHECK(pipeline.stats().utterances == 1);
    CHECK(pipeline.stats().transcriptions == 0);
}

TEST_CASE("AudioPipeline reports recognition failures and keeps going", "[pipeline]")
{
    auto recognizer = std::make_shared<LambdaRecognizer>([](const RecognitionRequest&) -> Result<Recognition> {
        return makeError(ErrorCode::RecognitionFailed, "engine unavailable");
    });

    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(
        testSettings(), scriptedFactory({ spokenScript() }, { ErrorCode::EndOfStream }), recognizer, recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
    pipeline.stop();

    CHECK(recorded.transcriptions.empty());
    REQUIRE(recorded.errors.size() == 1);
    CHECK(recorded.errors.front().code == ErrorCode::RecognitionFailed);
    CHECK(recorded.errors.front().message == "Utterance #1: engine unavailable");
    CHECK(pipeline.stats().failures == 1);
}

TEST_CASE("AudioPipeline fails to start without a device", "[pipeline]")
{
    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(
        testSettings(),
        [](const FrameFormat&) -> Result<std::unique_ptr<FrameSource>> {
            return makeError(ErrorCode::DeviceUnavailable, "no microphone");
        },
        fixedRecognizer("never"),
        recorded.events());

    auto const started = pipeline.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::DeviceUnavailable);
    CHECK(pipeline.state() == PipelineState::Idle);
}

TEST_CASE("AudioPipeline ends the session on a stream interruption", "[pipeline]")
{
    auto broken = std::vector<float> {};
    appendFrames(broken, 10, 0.0f);
    appendFrames(broken, 20, 0.2f);

    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(
        testSettings(),
        scriptedFactory({ broken, spokenScript() }, { ErrorCode::StreamInterrupted, ErrorCode::EndOfStream }),
        fixedRecognizer("hello again"),
        recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return !l.errors.empty(); }));

    CHECK(pipeline.state() == PipelineState::Interrupted);
    CHECK(recorded.errors.front().code == ErrorCode::StreamInterrupted);

    SECTION("start() restarts with a fresh session")
    {
        REQUIRE(pipeline.start().has_value());
        CHECK(pipeline.state() == PipelineState::Listening);
        REQUIRE(recorded.waitFor([](auto const& l) { return l.exhausted; }));
        pipeline.stop();

        // The half-spoken utterance of the broken session is never transcribed.
        REQUIRE(recorded.transcriptions.size() == 1);
        CHECK(recorded.transcriptions.front().text == "Hello again.");
        CHECK(recorded.transcriptions.front().utteranceId == 1);
    }

    SECTION("stop() returns to idle")
    {
        pipeline.stop();
        CHECK(pipeline.state() == PipelineState::Idle);
        CHECK(recorded.transcriptions.empty());
    }
}

TEST_CASE("AudioPipeline calibrates the threshold from the noise floor", "[pipeline]")
{
    auto script = std::vector<float> {};
    appendFrames(script, 10, 0.004f);

    auto settings = testSettings();
    settings.calibration = CalibrationSettings {
        .enabled = true, .frames = 10, .multiplier = 3.0f, .minThreshold = 0.001f, .maxThreshold = 0.1f
    };

    auto recorded = EventLog {};
    auto pipeline =
        AudioPipeline(settings, scriptedFactory({ script }, { std::nullopt }), fixedRecognizer("quiet"), recorded.events());

    REQUIRE(pipeline.start().has_value());
    REQUIRE(recorded.waitFor([](auto const& l) { return l.calibrated.has_value(); }));
    pipeline.stop();

    CHECK_THAT(*recorded.calibrated, WithinAbs(0.012, 1e-5));
    CHECK_THAT(pipeline.threshold(), WithinAbs(0.012, 1e-5));
    CHECK(recorded.errors.empty());
}

TEST_CASE("AudioPipeline applies new settings on the next start", "[pipeline]")
{
    auto recorded = EventLog {};
    auto pipeline = AudioPipeline(testSettings(),
                                  scriptedFactory({ {}, {} }, { std::nullopt, std::nullopt }),
                                  fixedRecognizer("unused"),
                                  recorded.events());

    REQUIRE(pipeline.start().has_value());

    auto updated = testSettings();
    updated.detector.threshold = 0.07f;
    pipeline.reconfigure(updated);

    pipeline.stop();
    CHECK_THAT(pipeline.threshold(), WithinAbs(0.05, 1e-6));

    REQUIRE(pipeline.start().has_value());
    pipeline.stop();
    CHECK_THAT(pipeline.threshold(), WithinAbs(0.07, 1e-6));
}

TEST_CASE("AudioPipeline::toggleDebug raises and restores the log level", "[pipeline]")
{
    auto const previous = log::getLevel();
    log::setLevel(log::Level::Info);

    auto events = EventLog {};
    auto pipeline = AudioPipeline(
        testSettings(), scriptedFactory({}, {}), fixedRecognizer("unused"), events.events());

    CHECK(!pipeline.debugEnabled());
    CHECK(pipeline.toggleDebug());
    CHECK(pipeline.debugEnabled());
    CHECK(log::getLevel() == log::Level::Debug);

    CHECK(!pipeline.toggleDebug());
    CHECK(!pipeline.debugEnabled());
    CHECK(log::getLevel() == log::Level::Info);

    log::setLevel(previous);
}

TEST_CASE("AudioPipeline::stop is a no-op when idle", "[pipeline]")
{
    auto recorded = EventLog {};
    auto pipeline =
        AudioPipeline(testSettings(), scriptedFactory({}, {}), fixedRecognizer("unused"), recorded.events());

    pipeline.stop();
    pipeline.stop();
    CHECK(pipeline.state() == PipelineState::Idle);
    CHECK(recorded.errors.empty());
}
