#include "GainAutomation.h"
#include "../CoherenceTuning.h"

#include <algorithm>
#include <cmath>

namespace stillpoint::dsp
{

GainAutomation::GainAutomation(float initialValue) noexcept
    : startValue(clampGain(initialValue)),
      endValue(clampGain(initialValue))
{
}

float GainAutomation::clampGain(float value) noexcept
{
    if (std::isnan(value))
        return 0.0f;

    return std::clamp(value, 0.0f, 1.0f);
}

float GainAutomation::getValueAt(double time) const noexcept
{
    if (time <= startTime)
        return startValue;

    if (time >= endTime)
        return endValue;

    const auto frac = static_cast<float>((time - startTime) / (endTime - startTime));

    if (shape == RampShape::Exponential)
    {
        // Exponential ramps cannot pass through zero; both ends sit on the floor.
        constexpr float floor = tuning::Crossfade::kGainFloor;
        const float from = std::max(startValue, floor);
        const float to = std::max(endValue, floor);
        return from * std::pow(to / from, frac);
    }

    return startValue + (endValue - startValue) * frac;
}

void GainAutomation::setValueAt(float value, double time) noexcept
{
    startTime = time;
    endTime = time;
    startValue = clampGain(value);
    endValue = startValue;
    shape = RampShape::Linear;
}

void GainAutomation::rampTo(float target, double now, double durationSeconds, RampShape newShape) noexcept
{
    rampFrom(getValueAt(now), now, target, durationSeconds, newShape);
}

void GainAutomation::rampFrom(float newStartValue, double newStartTime, float target,
                              double durationSeconds, RampShape newShape) noexcept
{
    if (durationSeconds <= 0.0)
    {
        setValueAt(target, newStartTime);
        return;
    }

    startTime = newStartTime;
    endTime = newStartTime + durationSeconds;
    startValue = clampGain(newStartValue);
    endValue = clampGain(target);
    shape = newShape;
}

} // namespace stillpoint::dsp
