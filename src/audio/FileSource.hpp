// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string_view>

namespace talktype
{

/// @brief Reads an audio file (WAV, FLAC or MP3) through the miniaudio decoder and yields frames.
///
/// The file is converted to mono float32 at the requested sample rate. The last partial frame is
/// zero-padded; afterwards read() fails with ErrorCode::EndOfStream.
class FileSource final: public FrameSource
{
  public:
    FileSource();
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    /// @brief Opens the file for decoding.
    /// @return Success, or DeviceUnavailable if the file cannot be opened or decoded.
    [[nodiscard]] auto open(std::string_view path, const FrameFormat& format) -> VoidResult;

    [[nodiscard]] auto read(const std::stop_token& stopToken) -> Result<AudioFrame> override;

    void close() override;

    [[nodiscard]] auto format() const -> FrameFormat override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
