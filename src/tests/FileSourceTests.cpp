// SPDX-License-Identifier: Apache-2.0
#include <audio/FileSource.hpp>
#include <audio/WavWriter.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <vector>

using namespace talktype;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("FileSource replays a WAV file as zero-padded frames", "[file]")
{
    auto const path = (std::filesystem::temp_directory_path() / "talktype_test_source.wav").string();

    auto samples = std::vector<float>(1000);
    for (auto i = std::size_t { 0 }; i < samples.size(); ++i)
        samples[i] = (i % 2 == 0) ? 0.25f : -0.25f;
    REQUIRE(writeWav(path, samples, 16000).has_value());

    auto source = FileSource {};
    REQUIRE(source.open(path, FrameFormat { .sampleRate = 16000, .channels = 1, .frameSamples = 320 }).has_value());

    auto const stopToken = std::stop_token {};
    auto frames = std::vector<AudioFrame> {};
    while (true)
    {
        auto frame = source.read(stopToken);
        if (!frame)
        {
            CHECK(frame.error().code == ErrorCode::EndOfStream);
            break;
        }
        frames.push_back(std::move(*frame));
    }

    REQUIRE(frames.size() == 4);
    for (auto i = std::size_t { 0 }; i < frames.size(); ++i)
    {
        CHECK(frames[i].index == i);
        CHECK(frames[i].samples.size() == 320);
        CHECK(frames[i].timestamp == std::chrono::milliseconds { 20 * static_cast<int>(i) });
    }

    CHECK_THAT(frames[0].samples[0], WithinAbs(0.25, 1e-3));
    CHECK_THAT(frames[0].samples[1], WithinAbs(-0.25, 1e-3));

    // 1000 samples fill three frames and 40 samples of the fourth.
    CHECK_THAT(frames[3].samples[39], WithinAbs(-0.25, 1e-3));
    CHECK(frames[3].samples[40] == 0.0f);
    CHECK(frames[3].samples.back() == 0.0f);

    source.close();
    std::filesystem::remove(path);
}

TEST_CASE("FileSource reports a missing file as an unavailable device", "[file]")
{
    auto source = FileSource {};
    auto const result = source.open("/nonexistent/talktype/recording.wav", FrameFormat {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::DeviceUnavailable);
}

TEST_CASE("FileSource stops reading once closed", "[file]")
{
    auto const path = (std::filesystem::temp_directory_path() / "talktype_test_closed.wav").string();
    REQUIRE(writeWav(path, std::vector<float>(3200, 0.1f), 16000).has_value());

    auto source = FileSource {};
    REQUIRE(source.open(path, FrameFormat {}).has_value());
    REQUIRE(source.read(std::stop_token {}).has_value());

    source.close();
    auto const afterClose = source.read(std::stop_token {});
    REQUIRE(!afterClose.has_value());
    CHECK(afterClose.error().code == ErrorCode::Cancelled);

    std::filesystem::remove(path);
}
