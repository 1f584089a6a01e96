// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

namespace talktype
{

/// @brief Segmentation parameters, expressed in frames.
struct SegmentBufferConfig
{
    /// Most recent silence frames kept as lead padding in front of an utterance.
    std::size_t preRollFrames = 25;

    /// Trailing silence frames kept at the end of a finalized utterance.
    std::size_t trailPadFrames = 15;

    /// Silence run that ends an utterance.
    std::size_t maxSilenceFrames = 50;

    /// Utterances whose voiced span (first to last speech frame) is shorter are discarded as noise.
    std::size_t minSpeechFrames = 25;

    /// Buffer length that forces an utterance out while speech continues.
    std::size_t maxUtteranceFrames = 500;
};

/// @brief Callback receiving each finalized utterance.
using UtteranceCallback = std::function<void(Utterance utterance)>;

/// @brief Groups labeled frames into utterances.
///
/// State machine with the states Idle and Accumulating:
///  - Idle keeps the most recent silence frames in a pre-roll ring. The first speech frame opens a
///    new utterance seeded with the ring.
///  - Accumulating appends every frame. A silence run of maxSilenceFrames finalizes the utterance;
///    trailing silence beyond trailPadFrames is trimmed and becomes the next pre-roll.
///  - Reaching maxUtteranceFrames emits the buffer as is and continues with an empty buffer and no
///    pre-roll, so consecutive chunks of continuous speech neither overlap nor leave gaps.
///  - A gap in frame indices (frames lost upstream) finalizes the current utterance first.
///
/// Utterances without any speech frame, or with a voiced span shorter than minSpeechFrames, are
/// discarded instead of emitted. The minimum does not apply to the pieces that follow a forced
/// split, since they continue speech that already qualified. Utterance ids increase by one per emitted utterance.
class SegmentBuffer
{
  public:
    enum class State : std::uint8_t
    {
        Idle,
        Accumulating,
    };

    SegmentBuffer(SegmentBufferConfig config, UtteranceCallback callback);

    /// @brief Feeds one labeled frame; may invoke the callback.
    void push(LabeledFrame frame);

    /// @brief Stop signal: finalizes the current utterance regardless of the silence run.
    ///
    /// Emits it if it qualifies, discards it otherwise, and returns to Idle with an empty pre-roll.
    void flush();

    /// @brief Drops all buffered frames without emitting anything.
    void reset();

    [[nodiscard]] auto state() const noexcept -> State { return _state; }

    /// @brief Number of frames currently buffered for the open utterance.
    [[nodiscard]] auto bufferedFrames() const noexcept -> std::size_t { return _frames.size(); }

    [[nodiscard]] auto emittedCount() const noexcept -> std::uint64_t { return _emitted; }
    [[nodiscard]] auto discardedCount() const noexcept -> std::uint64_t { return _discarded; }

  private:
    enum class FinalizeReason : std::uint8_t
    {
        Silence,
        Stop,
        Discontinuity,
    };

    void finalize(FinalizeReason reason);
    void emitIfQualified(std::vector<LabeledFrame>& frames);
    void keepInPreRoll(LabeledFrame frame);

    SegmentBufferConfig _config;
    UtteranceCallback _callback;

    State _state = State::Idle;
    std::deque<LabeledFrame> _preRoll;
    std::vector<LabeledFrame> _frames;
    std::size_t _silenceRun = 0;
    bool _continuation = false;
    std::optional<std::uint64_t> _lastIndex;

    std::uint64_t _nextId = 1;
    std::uint64_t _emitted = 0;
    std::uint64_t _discarded = 0;
};

} // namespace talktype
