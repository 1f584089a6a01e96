// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace talktype
{

/// @brief Configuration for microphone capture.
struct CaptureConfig
{
    /// Empty selects the system default, an integer selects by enumeration index,
    /// anything else is matched case-insensitively against the device names.
    std::string device;

    unsigned sampleRate = 16000;

    /// Samples per frame (320 = 20 ms at 16 kHz).
    std::size_t frameSamples = 320;

    /// Frames buffered between the device callback and read(). The oldest frame is dropped on overflow.
    std::size_t queueFrames = 100;
};

/// @brief Describes one capture device.
struct CaptureDeviceInfo
{
    unsigned index = 0;
    std::string name;
    bool isDefault = false;
};

/// @brief Enumerates the available capture devices.
[[nodiscard]] auto listCaptureDevices() -> Result<std::vector<CaptureDeviceInfo>>;

/// @brief Captures microphone audio through miniaudio and hands it out as fixed-size frames.
///
/// Captures float32 PCM mono. The device callback re-chunks device buffers into frames and pushes
/// them into a bounded queue that read() drains, so the callback never waits for the consumer.
/// The device handle is owned exclusively for the lifetime of the object and released by close().
class AudioCapture final: public FrameSource
{
  public:
    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Opens the capture device.
    /// @param config Capture configuration.
    /// @return Success, or DeviceUnavailable if the context or the configured device cannot be opened.
    [[nodiscard]] auto initialize(const CaptureConfig& config) -> VoidResult;

    /// @brief Starts capturing audio.
    /// @return Success or DeviceUnavailable.
    [[nodiscard]] auto start() -> VoidResult;

    [[nodiscard]] auto read(const std::stop_token& stopToken) -> Result<AudioFrame> override;

    void close() override;

    [[nodiscard]] auto format() const -> FrameFormat override;

    /// @brief Returns true if currently capturing.
    [[nodiscard]] auto isCapturing() const -> bool;

    /// @brief Returns the current peak audio level (0.0 to 1.0).
    ///
    /// Updated atomically from the audio callback thread. Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    /// @brief Returns the number of frames dropped because the consumer fell behind.
    [[nodiscard]] auto overruns() const -> std::uint64_t;

    // Impl must be accessible from the C audio callbacks
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
