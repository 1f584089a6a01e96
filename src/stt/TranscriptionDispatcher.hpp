// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/Preprocessor.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <stt/Recognizer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace talktype
{

/// @brief Configuration for the transcription dispatcher.
struct DispatcherConfig
{
    /// Utterances waiting for a worker. Submitting into a full queue drops the oldest one.
    std::size_t queueCapacity = 8;

    /// Concurrent recognition calls. 1 serializes recognition.
    std::size_t maxInFlight = 1;

    /// Per-utterance recognition deadline. Zero disables it.
    std::chrono::milliseconds recognitionTimeout { 30000 };

    /// Clean-up applied to the samples before recognition, if set.
    std::optional<PreprocessConfig> preprocess;

    /// Invoked on the worker thread when an utterance is taken off the queue.
    std::function<void(const Utterance&)> onDequeue;
};

/// @brief Returned by TranscriptionDispatcher::submit().
struct SubmitReceipt
{
    std::uint64_t utteranceId = 0;

    /// The queued utterance that was dropped to make room, if any.
    std::optional<std::uint64_t> droppedUtteranceId;
};

/// @brief How TranscriptionDispatcher::stop() treats outstanding work.
enum class StopMode : std::uint8_t
{
    /// Finish queued and in-flight utterances.
    Drain,

    /// Clear the queue and cancel the in-flight recognition.
    Abandon,
};

struct DispatcherStats
{
    std::uint64_t submitted = 0;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;
    std::uint64_t dropped = 0;
};

/// @brief Called once per successfully recognized utterance, in submission order.
using ResultCallback = std::function<void(TranscriptionResult result)>;

/// @brief Called once per failed utterance (RecognitionFailed or RecognitionTimeout), in submission order.
using FailureCallback = std::function<void(std::uint64_t utteranceId, const Error& error)>;

/// @brief Hands finalized utterances to a recognizer and emits the outcomes in order.
///
/// submit() never blocks: utterances wait in a bounded drop-oldest queue that maxInFlight
/// worker threads drain. Outcomes are reordered so that callbacks fire in the order the
/// utterances were submitted, even if a later utterance is recognized first. A failing
/// utterance is reported and skipped.
///
/// Callbacks run on worker threads, one at a time. They must not call stop().
class TranscriptionDispatcher
{
  public:
    TranscriptionDispatcher(std::shared_ptr<Recognizer> recognizer,
                            DispatcherConfig config,
                            ResultCallback onResult,
                            FailureCallback onFailure);
    ~TranscriptionDispatcher();

    TranscriptionDispatcher(const TranscriptionDispatcher&) = delete;
    TranscriptionDispatcher& operator=(const TranscriptionDispatcher&) = delete;

    /// @brief Spawns the workers. Does nothing if already running.
    /// @return Success, or InvalidArgument if no recognizer is set.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Queues an utterance for recognition.
    /// @return The receipt, or InvalidArgument if the dispatcher is not running.
    [[nodiscard]] auto submit(Utterance utterance) -> Result<SubmitReceipt>;

    /// @brief Stops the workers and returns to a restartable state with nothing queued.
    void stop(StopMode mode);

    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Number of utterances waiting for a worker.
    [[nodiscard]] auto pending() const -> std::size_t;

    [[nodiscard]] auto stats() const -> DispatcherStats;

    [[nodiscard]] auto config() const -> const DispatcherConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
