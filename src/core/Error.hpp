// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    DownloadError,

    /// The capture device could not be opened. Fatal for the session.
    DeviceUnavailable,

    /// Capture stopped unexpectedly. The session must be restarted explicitly.
    StreamInterrupted,

    /// A frame source has no more frames (file input).
    EndOfStream,

    /// The recognition engine failed on one utterance.
    RecognitionFailed,

    /// The recognition engine did not answer before the deadline.
    RecognitionTimeout,

    /// The dispatch queue was saturated and an utterance was dropped.
    Backpressure,

    /// The operation was abandoned because of a stop request.
    Cancelled,
};

/// @brief Returns a short, stable name for an error code (used in log output).
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::DownloadError: return "DownloadError";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::StreamInterrupted: return "StreamInterrupted";
        case ErrorCode::EndOfStream: return "EndOfStream";
        case ErrorCode::RecognitionFailed: return "RecognitionFailed";
        case ErrorCode::RecognitionTimeout: return "RecognitionTimeout";
        case ErrorCode::Backpressure: return "Backpressure";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace talktype

template <>
struct std::formatter<talktype::Error>: std::formatter<std::string>
{
    auto format(const talktype::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", talktype::errorCodeName(error.code), error.message), ctx);
    }
};
