// SPDX-License-Identifier: Apache-2.0
#include "SegmentBuffer.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <iterator>

namespace talktype
{

SegmentBuffer::SegmentBuffer(SegmentBufferConfig config, UtteranceCallback callback):
    _config(config), _callback(std::move(callback))
{
    _config.maxSilenceFrames = std::max<std::size_t>(1, _config.maxSilenceFrames);
    _config.maxUtteranceFrames = std::max<std::size_t>(1, _config.maxUtteranceFrames);
}

void SegmentBuffer::push(LabeledFrame frame)
{
    auto const index = frame.frame.index;
    if (_lastIndex && index != *_lastIndex + 1)
    {
        log::debug("Frame discontinuity ({} -> {}), closing current segment", *_lastIndex, index);
        if (_state == State::Accumulating)
            finalize(FinalizeReason::Discontinuity);
        _preRoll.clear();
    }
    _lastIndex = index;

    if (_state == State::Idle)
    {
        if (!frame.speech)
        {
            keepInPreRoll(std::move(frame));
            return;
        }

        _state = State::Accumulating;
        _silenceRun = 0;
        _frames.assign(std::make_move_iterator(_preRoll.begin()), std::make_move_iterator(_preRoll.end()));
        _preRoll.clear();
        _frames.push_back(std::move(frame));
    }
    else
    {
        auto const speech = frame.speech;
        _frames.push_back(std::move(frame));

        if (speech)
        {
            _silenceRun = 0;
        }
        else if (++_silenceRun >= _config.maxSilenceFrames)
        {
            finalize(FinalizeReason::Silence);
            return;
        }
    }

    if (_frames.size() >= _config.maxUtteranceFrames)
    {
        log::debug("Segment reached {} frames, forcing it out", _frames.size());
        emitIfQualified(_frames);
        _frames.clear();
        _continuation = true;
    }
}

void SegmentBuffer::flush()
{
    if (_state == State::Accumulating)
        finalize(FinalizeReason::Stop);

    _preRoll.clear();
    _lastIndex.reset();
}

void SegmentBuffer::reset()
{
    _state = State::Idle;
    _frames.clear();
    _preRoll.clear();
    _silenceRun = 0;
    _continuation = false;
    _lastIndex.reset();
}

void SegmentBuffer::finalize(FinalizeReason reason)
{
    auto const trailing = static_cast<std::size_t>(
        std::distance(_frames.rbegin(),
                      std::find_if(_frames.rbegin(), _frames.rend(), [](auto const& f) { return f.speech; })));

    if (trailing > _config.trailPadFrames)
    {
        auto const excess = trailing - _config.trailPadFrames;
        auto const firstTrimmed = _frames.end() - static_cast<std::ptrdiff_t>(excess);

        // Trimmed silence is the most recent audio, so it is exactly what the next pre-roll needs.
        if (reason == FinalizeReason::Silence)
            for (auto it = firstTrimmed; it != _frames.end(); ++it)
                keepInPreRoll(std::move(*it));

        _frames.erase(firstTrimmed, _frames.end());
    }

    emitIfQualified(_frames);

    _frames.clear();
    _silenceRun = 0;
    _continuation = false;
    _state = State::Idle;
}

void SegmentBuffer::emitIfQualified(std::vector<LabeledFrame>& frames)
{
    if (frames.empty())
        return;

    auto const isSpeech = [](auto const& f) { return f.speech; };
    auto const first = std::ranges::find_if(frames, isSpeech);
    if (first == frames.end())
    {
        ++_discarded;
        log::trace("Discarding segment without speech ({} frames)", frames.size());
        return;
    }

    auto const last = std::find_if(frames.rbegin(), frames.rend(), isSpeech);
    auto const voicedFrames = static_cast<std::size_t>(std::distance(first, last.base()));
    // The tail of a forced split continues qualified speech and is kept however short.
    if (voicedFrames < _config.minSpeechFrames && !_continuation)
    {
        ++_discarded;
        log::debug("Discarding short segment ({} voiced frame(s), minimum {})", voicedFrames, _config.minSpeechFrames);
        return;
    }

    auto utterance = Utterance {
        .id = _nextId++,
        .startTime = frames.front().frame.timestamp,
        .endTime = frames.back().frame.endTime(),
        .sampleRate = frames.front().frame.sampleRate,
        .firstFrameIndex = frames.front().frame.index,
        .frameCount = frames.size(),
        .speechFrameCount = static_cast<std::size_t>(std::ranges::count_if(frames, isSpeech)),
        .samples = {},
    };

    auto totalSamples = std::size_t { 0 };
    for (auto const& f: frames)
        totalSamples += f.frame.samples.size();
    utterance.samples.reserve(totalSamples);
    for (auto const& f: frames)
        utterance.samples.insert(utterance.samples.end(), f.frame.samples.begin(), f.frame.samples.end());

    ++_emitted;
    log::debug("Utterance #{} finalized: {} frame(s), {} speech, {:.2f}s",
               utterance.id,
               utterance.frameCount,
               utterance.speechFrameCount,
               static_cast<double>(utterance.duration().count()) / 1e6);

    _callback(std::move(utterance));
}

void SegmentBuffer::keepInPreRoll(LabeledFrame frame)
{
    if (_config.preRollFrames == 0)
        return;

    _preRoll.push_back(std::move(frame));
    while (_preRoll.size() > _config.preRollFrames)
        _preRoll.pop_front();
}

} // namespace talktype
