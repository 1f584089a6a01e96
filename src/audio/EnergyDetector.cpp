// SPDX-License-Identifier: Apache-2.0
#include "EnergyDetector.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace talktype
{

auto DcOffsetFilter::apply(const AudioFrame& frame) const -> AudioFrame
{
    auto filtered = frame;
    if (filtered.samples.empty())
        return filtered;

    auto const mean = std::accumulate(filtered.samples.begin(), filtered.samples.end(), 0.0)
                      / static_cast<double>(filtered.samples.size());
    for (auto& sample: filtered.samples)
        sample = static_cast<float>(sample - mean);
    return filtered;
}

EnergyDetector::EnergyDetector(EnergyDetectorConfig config, std::shared_ptr<const FrameFilter> filter):
    _config(config), _filter(std::move(filter))
{
    _config.confirmFrames = std::max(1, _config.confirmFrames);
    _config.smoothingFrames = std::max(1, _config.smoothingFrames);
}

auto EnergyDetector::process(AudioFrame frame) -> LabeledFrame
{
    if (_filter)
        frame = _filter->apply(frame);

    auto const level = smooth(rms(frame.samples));
    auto const loud = level > _config.threshold;

    if (loud != _speech)
    {
        ++_crossingRun;
        if (_crossingRun >= _config.confirmFrames)
        {
            _speech = loud;
            _crossingRun = 0;
        }
    }
    else
    {
        _crossingRun = 0;
    }

    return LabeledFrame { .frame = std::move(frame), .speech = _speech, .energy = level };
}

void EnergyDetector::reset()
{
    _history.clear();
    _historySum = 0.0f;
    _speech = false;
    _crossingRun = 0;
}

auto EnergyDetector::smooth(float level) -> float
{
    if (_config.smoothingFrames <= 1)
        return level;

    _history.push_back(level);
    _historySum += level;
    if (std::cmp_greater(_history.size(), _config.smoothingFrames))
    {
        _historySum -= _history.front();
        _history.pop_front();
    }
    return _historySum / static_cast<float>(_history.size());
}

auto EnergyDetector::rms(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto energy = 0.0;
    for (auto const sample: samples)
        energy += static_cast<double>(sample) * sample;

    return static_cast<float>(std::sqrt(energy / static_cast<double>(samples.size())));
}

auto EnergyDetector::calibrateThreshold(std::span<const float> levels,
                                        float multiplier,
                                        float minThreshold,
                                        float maxThreshold) -> float
{
    if (levels.empty())
        return minThreshold;

    auto const mean = std::accumulate(levels.begin(), levels.end(), 0.0f) / static_cast<float>(levels.size());
    return std::clamp(mean * multiplier, minThreshold, std::max(minThreshold, maxThreshold));
}

} // namespace talktype
