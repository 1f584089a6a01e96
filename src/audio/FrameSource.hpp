// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <stop_token>

namespace talktype
{

/// @brief Blocking, pull-style source of fixed-size audio frames.
///
/// A source is single-use: once closed, or once read() has failed, it cannot be restarted.
/// Create a new source for the next session.
class FrameSource
{
  public:
    virtual ~FrameSource() = default;

    /// @brief Blocks until the next frame is available.
    /// @param stopToken Cancels the wait; read() then fails with ErrorCode::Cancelled.
    /// @return The next frame, or StreamInterrupted / EndOfStream / Cancelled.
    [[nodiscard]] virtual auto read(const std::stop_token& stopToken) -> Result<AudioFrame> = 0;

    /// @brief Stops producing frames, releases the underlying handle and unblocks read().
    virtual void close() = 0;

    [[nodiscard]] virtual auto format() const -> FrameFormat = 0;
};

} // namespace talktype
