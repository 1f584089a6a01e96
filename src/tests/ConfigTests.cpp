// SPDX-License-Identifier: Apache-2.0
#include <talktype/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

using namespace talktype;
using namespace std::chrono_literals;

namespace
{

/// @brief Writes content to a file in the temp directory and removes it again on destruction.
class TempFile
{
  public:
    TempFile(std::string const& name, std::string_view content):
        _path(std::filesystem::temp_directory_path() / name)
    {
        auto file = std::ofstream(_path);
        file << content;
    }

    ~TempFile()
    {
        auto ec = std::error_code {};
        std::filesystem::remove(_path, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] auto path() const -> std::string { return _path.string(); }

  private:
    std::filesystem::path _path;
};

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    CHECK(defaultConfigPath().ends_with("config.json"));
    CHECK(defaultModelDir().ends_with("models"));
    CHECK(defaultDebugDir().ends_with("debug"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.hotkeys.toggleListening == "ctrl+alt+z");
    CHECK(config.audio.sampleRate == 16000);
    CHECK(config.audio.silenceThreshold == 0.015f);
    CHECK(config.audio.maxSilenceMs == 1000);
    CHECK(config.calibration.enabled);
    CHECK(!config.calibration.threshold.has_value());
    CHECK(config.processing.modelSize == "small");
    CHECK(config.processing.device == "cpu");
    CHECK(config.dispatch.maxInFlight == 1);
    CHECK(config.dispatch.drainOnStop);
    CHECK(config.text.removeFillers);
    CHECK(config.debug.logLevel == "info");

    CHECK(validateConfig(config).has_value());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const file = TempFile("talktype_test_config.json", R"({
        "hotkeys": { "toggleListening": "ctrl+shift+space" },
        "audio": {
            "sampleRate": 48000,
            "frameMs": 30,
            "device": "USB Microphone",
            "silenceThreshold": 0.02,
            "hysteresisFrames": 3,
            "preRollMs": 300,
            "maxSilenceMs": 800,
            "noiseReduction": false
        },
        "calibration": {
            "enabled": false,
            "threshold": 0.011,
            "timestamp": 1700000000,
            "device": "USB Microphone"
        },
        "processing": {
            "modelSize": "base.en",
            "device": "cuda",
            "language": "auto",
            "threads": 8,
            "beamSize": 1
        },
        "dispatch": { "queueCapacity": 4, "maxInFlight": 2, "timeoutMs": 5000, "drainOnStop": false },
        "text": { "removeFillers": false, "terminalPunctuation": false },
        "debug": { "enabled": true, "directory": "/tmp/talktype-debug", "logLevel": "trace" }
    })");

    auto result = loadConfigFromFile(file.path());
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("hotkeys")
    {
        CHECK(config.hotkeys.toggleListening == "ctrl+shift+space");
        CHECK(config.hotkeys.exitApp == "ctrl+alt+x");
    }

    SECTION("audio")
    {
        CHECK(config.audio.sampleRate == 48000);
        CHECK(config.audio.frameMs == 30);
        CHECK(config.audio.device == "USB Microphone");
        CHECK(config.audio.silenceThreshold == 0.02f);
        CHECK(config.audio.hysteresisFrames == 3);
        CHECK(config.audio.preRollMs == 300);
        CHECK(config.audio.maxSilenceMs == 800);
        CHECK(config.audio.trailPadMs == 300);
        CHECK(!config.audio.noiseReduction);
    }

    SECTION("calibration")
    {
        CHECK(!config.calibration.enabled);
        REQUIRE(config.calibration.threshold.has_value());
        CHECK(*config.calibration.threshold == 0.011f);
        CHECK(config.calibration.timestamp == 1700000000);
        CHECK(config.calibration.device == "USB Microphone");
    }

    SECTION("processing")
    {
        CHECK(config.processing.modelSize == "base.en");
        CHECK(config.processing.device == "cuda");
        CHECK(config.processing.language == "auto");
        CHECK(config.processing.threads == 8);
        CHECK(config.processing.beamSize == 1);
    }

    SECTION("dispatch, text and debug")
    {
        CHECK(config.dispatch.queueCapacity == 4);
        CHECK(config.dispatch.maxInFlight == 2);
        CHECK(config.dispatch.timeoutMs == 5000);
        CHECK(!config.dispatch.drainOnStop);
        CHECK(config.dispatch.preprocess);
        CHECK(!config.text.removeFillers);
        CHECK(config.text.capitalize);
        CHECK(!config.text.terminalPunctuation);
        CHECK(config.debug.enabled);
        CHECK(config.debug.directory == "/tmp/talktype-debug");
        CHECK(config.debug.logLevel == "trace");
    }
}

TEST_CASE("loadConfigFromFile rejects malformed files", "[config]")
{
    SECTION("invalid JSON")
    {
        auto const file = TempFile("talktype_test_invalid.json", "{ not json");
        auto const result = loadConfigFromFile(file.path());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("not an object")
    {
        auto const file = TempFile("talktype_test_array.json", "[1, 2, 3]");
        auto const result = loadConfigFromFile(file.path());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("value of the wrong type")
    {
        auto const file = TempFile("talktype_test_type.json", R"({ "audio": { "sampleRate": "fast" } })");
        auto const result = loadConfigFromFile(file.path());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.find("audio.sampleRate") != std::string::npos);
    }

    SECTION("section that is not an object")
    {
        auto const file = TempFile("talktype_test_section.json", R"({ "processing": "small" })");
        auto const result = loadConfigFromFile(file.path());
        REQUIRE(!result.has_value());
        CHECK(result.error().message.find("processing") != std::string::npos);
    }

    SECTION("missing file")
    {
        auto const result = loadConfigFromFile("/nonexistent/talktype/config.json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("loadConfig falls back to defaults without a file", "[config]")
{
    auto const result = loadConfig("/nonexistent/talktype/config.json");
    REQUIRE(result.has_value());
    CHECK(result->processing.modelSize == "small");
}

TEST_CASE("saveConfigToFile writes a file loadConfigFromFile reads back", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "talktype_test_save";
    auto const path = (dir / "config.json").string();
    std::filesystem::remove_all(dir);

    auto config = AppConfig {};
    config.audio.device = "2";
    config.audio.minUtteranceMs = 250;
    config.calibration.threshold = 0.012f;
    config.calibration.timestamp = 1710000000;
    config.calibration.device = "2";
    config.processing.whisperModelPath = "/models/ggml-tiny.bin";
    config.dispatch.timeoutMs = 12000;
    config.text.collapseRepeats = false;

    REQUIRE(saveConfigToFile(path, config).has_value());

    auto const loaded = loadConfigFromFile(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->audio.device == "2");
    CHECK(loaded->audio.minUtteranceMs == 250);
    REQUIRE(loaded->calibration.threshold.has_value());
    CHECK(*loaded->calibration.threshold == 0.012f);
    CHECK(loaded->calibration.timestamp == 1710000000);
    CHECK(loaded->calibration.device == "2");
    CHECK(loaded->processing.whisperModelPath == "/models/ggml-tiny.bin");
    CHECK(loaded->dispatch.timeoutMs == 12000);
    CHECK(!loaded->text.collapseRepeats);

    std::filesystem::remove_all(dir);
}

TEST_CASE("validateConfig rejects out-of-range settings", "[config]")
{
    auto config = AppConfig {};

    SECTION("sample rate")
    {
        config.audio.sampleRate = 1000;
    }

    SECTION("utterance bounds")
    {
        config.audio.maxUtteranceMs = config.audio.minUtteranceMs;
    }

    SECTION("processing device")
    {
        config.processing.device = "tpu";
    }

    SECTION("calibration clamps")
    {
        config.calibration.minThreshold = 0.05f;
        config.calibration.maxThreshold = 0.01f;
    }

    SECTION("concurrency")
    {
        config.dispatch.maxInFlight = 0;
    }

    auto const result = validateConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("framesFor rounds durations up to whole frames", "[config]")
{
    CHECK(framesFor(1000, 20) == 50);
    CHECK(framesFor(310, 20) == 16);
    CHECK(framesFor(20, 20) == 1);
    CHECK(framesFor(0, 20) == 0);
    CHECK(framesFor(100, 0) == 0);
}

TEST_CASE("makePipelineSettings converts durations to frames", "[config]")
{
    auto const settings = makePipelineSettings(AppConfig {}, 0);

    CHECK(settings.format.sampleRate == 16000);
    CHECK(settings.format.frameSamples == 320);
    CHECK(settings.detector.threshold == 0.015f);
    CHECK(settings.detector.confirmFrames == 2);
    CHECK(settings.segmenter.preRollFrames == 25);
    CHECK(settings.segmenter.trailPadFrames == 15);
    CHECK(settings.segmenter.maxSilenceFrames == 50);
    CHECK(settings.segmenter.minSpeechFrames == 25);
    CHECK(settings.segmenter.maxUtteranceFrames == 500);
    CHECK(settings.calibration.enabled);
    CHECK(settings.calibration.frames == 50);
    CHECK(settings.dispatcher.queueCapacity == 8);
    CHECK(settings.dispatcher.recognitionTimeout == 30000ms);
    CHECK(settings.dispatcher.preprocess.has_value());
    CHECK(settings.drainOnStop);
    CHECK(settings.debugDirectory == defaultDebugDir());
}

TEST_CASE("makePipelineSettings reuses a fresh calibration", "[config]")
{
    constexpr auto Now = std::int64_t { 1'700'000'000 };

    auto config = AppConfig {};
    config.audio.device = "USB";
    config.calibration.threshold = 0.02f;
    config.calibration.device = "USB";

    SECTION("fresh")
    {
        config.calibration.timestamp = Now - 100;
        CHECK(isCalibrationFresh(config.calibration, "USB", Now));

        auto const settings = makePipelineSettings(config, Now);
        CHECK(settings.detector.threshold == 0.02f);
        CHECK(!settings.calibration.enabled);
    }

    SECTION("older than a day")
    {
        config.calibration.timestamp = Now - CalibrationMaxAgeSeconds - 1;
        CHECK(!isCalibrationFresh(config.calibration, "USB", Now));

        auto const settings = makePipelineSettings(config, Now);
        CHECK(settings.detector.threshold == 0.015f);
        CHECK(settings.calibration.enabled);
    }

    SECTION("measured on another device")
    {
        config.calibration.timestamp = Now - 100;
        CHECK(!isCalibrationFresh(config.calibration, "Webcam", Now));
    }

    SECTION("calibration disabled")
    {
        config.calibration.timestamp = Now - 100;
        config.calibration.enabled = false;

        auto const settings = makePipelineSettings(config, Now);
        CHECK(settings.detector.threshold == 0.015f);
        CHECK(!settings.calibration.enabled);
    }
}

TEST_CASE("whisper model helpers", "[config]")
{
    CHECK(modelFilename("small") == "ggml-small.bin");
    CHECK(modelUrl("base.en") == "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin");
    CHECK(modelPathForSize("tiny").ends_with("/models/ggml-tiny.bin"));
    CHECK(availableModels().size() == 10);

    auto processing = ProcessingConfig {};
    processing.modelSize = "medium";
    CHECK(resolveModelPath(processing).ends_with("ggml-medium.bin"));
    processing.whisperModelPath = "/opt/models/custom.bin";
    CHECK(resolveModelPath(processing) == "/opt/models/custom.bin");

    auto const download = downloadModel("enormous");
    REQUIRE(!download.has_value());
    CHECK(download.error().code == ErrorCode::DownloadError);
}

TEST_CASE("makeWhisperConfig maps the processing section", "[config]")
{
    auto config = AppConfig {};
    config.processing.device = "cuda";
    config.processing.language = "de";
    config.processing.beamSize = 1;

    auto const whisper = makeWhisperConfig(config);
    REQUIRE(whisper.has_value());
    CHECK(whisper->device == ProcessingDevice::Gpu);
    CHECK(whisper->language == "de");
    CHECK(whisper->beamSize == 1);
    CHECK(whisper->modelPath.ends_with("ggml-small.bin"));

    config.processing.device = "quantum";
    auto const rejected = makeWhisperConfig(config);
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::ConfigError);
}
