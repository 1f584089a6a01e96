// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/BoundedQueue.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <cmath>
#include <mutex>
#include <optional>
#include <string>

namespace talktype
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    CaptureConfig config;
    FrameFormat frameFormat;

    std::unique_ptr<BoundedQueue<AudioFrame>> frames;

    // Owned by the device callback thread
    std::vector<float> pending;
    std::uint64_t nextIndex = 0;

    std::atomic<float> peakLevel { 0.0f };
    std::atomic<std::uint64_t> overruns { 0 };
    std::uint64_t reportedOverruns = 0;

    std::atomic<bool> stopping { false };
    std::atomic<bool> interrupted { false };

    std::mutex lifecycleMutex;
    bool contextInitialized = false;
    bool initialized = false;
    bool capturing = false;

    void pushSamples(const float* samples, std::size_t count)
    {
        for (auto i = std::size_t { 0 }; i < count; ++i)
        {
            pending.push_back(samples[i]);
            if (pending.size() < frameFormat.frameSamples)
                continue;

            auto frame = AudioFrame {
                .index = nextIndex,
                .timestamp = frameFormat.timestampOf(nextIndex),
                .sampleRate = frameFormat.sampleRate,
                .channels = frameFormat.channels,
                .samples = std::move(pending),
            };
            ++nextIndex;

            pending = std::vector<float> {};
            pending.reserve(frameFormat.frameSamples);

            auto outcome = frames->push(std::move(frame));
            if (outcome.dropped)
                overruns.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void release()
    {
        if (initialized)
        {
            ma_device_uninit(&device);
            initialized = false;
        }
        if (contextInitialized)
        {
            ma_context_uninit(&context);
            contextInitialized = false;
        }
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !input || impl->stopping.load(std::memory_order_relaxed))
            return;

        auto const* samples = static_cast<const float*>(input);

        // Compute peak amplitude for the level meter (lock-free)
        auto peak = 0.0f;
        for (auto i = ma_uint32 { 0 }; i < frameCount; ++i)
            peak = std::max(peak, std::abs(samples[i]));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        impl->pushSamples(samples, frameCount);
    }

    void deviceNotificationCallback(const ma_device_notification* notification)
    {
        if (notification->type != ma_device_notification_type_stopped)
            return;

        auto* impl = static_cast<AudioCapture::Impl*>(notification->pDevice->pUserData);
        if (!impl || impl->stopping.load(std::memory_order_relaxed))
            return;

        // The backend stopped the device on its own (unplugged, revoked, server gone).
        impl->interrupted.store(true, std::memory_order_relaxed);
        impl->frames->close();
    }

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    auto parseIndex(std::string_view text) -> std::optional<unsigned>
    {
        auto value = 0u;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

} // namespace

auto listCaptureDevices() -> Result<std::vector<CaptureDeviceInfo>>
{
    auto context = ma_context {};
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &pCaptureDevices, &captureCount);
    if (enumResult != MA_SUCCESS)
    {
        ma_context_uninit(&context);
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to enumerate capture devices: {}", static_cast<int>(enumResult)));
    }

    auto devices = std::vector<CaptureDeviceInfo> {};
    devices.reserve(captureCount);
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        devices.push_back(CaptureDeviceInfo {
            .index = i,
            .name = pCaptureDevices[i].name,
            .isDefault = pCaptureDevices[i].isDefault != 0,
        });

    ma_context_uninit(&context);
    return devices;
}

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    close();
}

auto AudioCapture::initialize(const CaptureConfig& config) -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);

    _impl->config = config;
    _impl->frameFormat = FrameFormat {
        .sampleRate = config.sampleRate,
        .channels = 1,
        .frameSamples = config.frameSamples,
    };
    _impl->frames = std::make_unique<BoundedQueue<AudioFrame>>(config.queueFrames);
    _impl->pending.reserve(config.frameSamples);

    // Initialize a persistent context — must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        if (!config.device.empty())
        {
            if (auto const index = parseIndex(config.device))
            {
                if (*index < captureCount)
                {
                    log::info("Selected capture device [{}] '{}'", *index, pCaptureDevices[*index].name);
                    matchedDeviceId = pCaptureDevices[*index].id;
                }
            }
            else
            {
                // Case-insensitive substring match against user-specified name
                auto const lowerTarget = toLower(config.device);
                for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
                {
                    if (toLower(pCaptureDevices[i].name).find(lowerTarget) != std::string::npos)
                    {
                        log::info("Matched capture device '{}' for filter '{}'",
                                  pCaptureDevices[i].name,
                                  config.device);
                        matchedDeviceId = pCaptureDevices[i].id;
                        break;
                    }
                }
            }

            if (!matchedDeviceId)
            {
                _impl->release();
                return makeError(ErrorCode::DeviceUnavailable,
                                 std::format("No capture device matching '{}' found", config.device));
            }
        }
        else
        {
            // Auto-select: pick the first non-monitor device (monitors are loopback sources, not microphones)
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!toLower(pCaptureDevices[i].name).starts_with("monitor"))
                {
                    log::debug("Auto-selected capture device '{}' (skipping monitor sources)",
                               pCaptureDevices[i].name);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        if (!config.device.empty())
        {
            _impl->release();
            return makeError(ErrorCode::DeviceUnavailable,
                             std::format("Failed to enumerate capture devices (code: {}), cannot select '{}'",
                                         static_cast<int>(enumResult),
                                         config.device));
        }
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = config.sampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.notificationCallback = deviceNotificationCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->release();
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(result)));
    }

    _impl->initialized = true;
    log::info("Audio capture device: {} ({}Hz, mono, float32, {} samples/frame)",
              _impl->device.capture.name,
              config.sampleRate,
              config.frameSamples);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);

    if (!_impl->initialized)
        return makeError(ErrorCode::DeviceUnavailable, "Audio device not initialized");

    if (_impl->capturing)
        return {};

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));

    _impl->capturing = true;
    log::debug("Audio capture started");
    return {};
}

auto AudioCapture::read(const std::stop_token& stopToken) -> Result<AudioFrame>
{
    if (!_impl->frames)
        return makeError(ErrorCode::DeviceUnavailable, "Audio device not initialized");

    auto frame = _impl->frames->pop(stopToken);

    auto const overruns = _impl->overruns.load(std::memory_order_relaxed);
    if (overruns != _impl->reportedOverruns)
    {
        log::warning("Audio capture overrun: {} frame(s) dropped", overruns - _impl->reportedOverruns);
        _impl->reportedOverruns = overruns;
    }

    if (frame)
        return std::move(*frame);

    if (_impl->interrupted.load(std::memory_order_relaxed))
        return makeError(ErrorCode::StreamInterrupted, "Audio capture device stopped unexpectedly");

    return makeError(ErrorCode::Cancelled, "Audio capture closed");
}

void AudioCapture::close()
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);

    _impl->stopping.store(true, std::memory_order_relaxed);

    if (_impl->capturing)
    {
        ma_device_stop(&_impl->device);
        _impl->capturing = false;
        log::debug("Audio capture stopped");
    }

    _impl->release();

    if (_impl->frames)
        _impl->frames->close();
}

auto AudioCapture::format() const -> FrameFormat
{
    return _impl->frameFormat;
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

auto AudioCapture::overruns() const -> std::uint64_t
{
    return _impl->overruns.load(std::memory_order_relaxed);
}

} // namespace talktype
