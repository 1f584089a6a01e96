// SPDX-License-Identifier: Apache-2.0
#include "FileSource.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <mutex>
#include <string>

namespace talktype
{

struct FileSource::Impl
{
    std::mutex mutex;
    ma_decoder decoder {};
    FrameFormat frameFormat;
    std::string path;
    std::uint64_t nextIndex = 0;
    bool opened = false;
    bool exhausted = false;

    ~Impl()
    {
        if (opened)
            ma_decoder_uninit(&decoder);
    }
};

FileSource::FileSource(): _impl(std::make_unique<Impl>())
{
}

FileSource::~FileSource() = default;

auto FileSource::open(std::string_view path, const FrameFormat& format) -> VoidResult
{
    _impl->path = std::string(path);
    _impl->frameFormat = format;
    _impl->frameFormat.channels = 1;

    auto config = ma_decoder_config_init(ma_format_f32, 1, format.sampleRate);
    auto const result = ma_decoder_init_file(_impl->path.c_str(), &config, &_impl->decoder);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to open audio file '{}': {}", path, static_cast<int>(result)));

    _impl->opened = true;
    log::info("Reading audio from {} ({}Hz, mono, {} samples/frame)",
              path,
              format.sampleRate,
              format.frameSamples);
    return {};
}

auto FileSource::read(const std::stop_token& stopToken) -> Result<AudioFrame>
{
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "File read cancelled");

    auto lock = std::lock_guard(_impl->mutex);

    if (!_impl->opened)
        return makeError(_impl->exhausted ? ErrorCode::EndOfStream : ErrorCode::Cancelled,
                         std::format("Audio file '{}' is closed", _impl->path));

    if (_impl->exhausted)
        return makeError(ErrorCode::EndOfStream, std::format("End of audio file '{}'", _impl->path));

    auto samples = std::vector<float>(_impl->frameFormat.frameSamples, 0.0f);
    auto framesRead = ma_uint64 { 0 };
    auto const result =
        ma_decoder_read_pcm_frames(&_impl->decoder, samples.data(), samples.size(), &framesRead);

    if (result != MA_SUCCESS && result != MA_AT_END)
        return makeError(ErrorCode::StreamInterrupted,
                         std::format("Failed to decode '{}': {}", _impl->path, static_cast<int>(result)));

    if (framesRead < samples.size())
        _impl->exhausted = true;

    if (framesRead == 0)
        return makeError(ErrorCode::EndOfStream, std::format("End of audio file '{}'", _impl->path));

    auto const index = _impl->nextIndex++;
    return AudioFrame {
        .index = index,
        .timestamp = _impl->frameFormat.timestampOf(index),
        .sampleRate = _impl->frameFormat.sampleRate,
        .channels = 1,
        .samples = std::move(samples),
    };
}

void FileSource::close()
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->opened)
        return;

    ma_decoder_uninit(&_impl->decoder);
    _impl->opened = false;
}

auto FileSource::format() const -> FrameFormat
{
    return _impl->frameFormat;
}

} // namespace talktype
