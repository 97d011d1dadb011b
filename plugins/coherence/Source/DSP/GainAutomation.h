#pragma once

namespace stillpoint::dsp
{

enum class RampShape
{
    Linear,
    Exponential
};

/**
 * GainAutomation: a single scheduled ramp on an audio clock timeline.
 *
 * Holds at most one segment. Scheduling a new ramp cancels the pending
 * one and starts from the value the old timeline had at "now", so rapid
 * re-triggering never produces a gain discontinuity.
 *
 * All values are clamped to [0, 1].
 */
class GainAutomation
{
public:
    explicit GainAutomation(float initialValue = 0.0f) noexcept;

    /** Value of the timeline at the given clock time (seconds). */
    float getValueAt(double time) const noexcept;

    /** Cancel pending automation and hold value from time onwards. */
    void setValueAt(float value, double time) noexcept;

    /**
     * Cancel pending automation, read the current value at now, and ramp
     * to target over durationSeconds. A non-positive duration jumps.
     */
    void rampTo(float target, double now, double durationSeconds,
                RampShape shape = RampShape::Linear) noexcept;

    /**
     * Ramp from an explicit start value at startTime, ignoring the value
     * the timeline had. Used for session start where every layer is
     * rebased onto the shared start time.
     */
    void rampFrom(float startValue, double startTime, float target,
                  double durationSeconds, RampShape shape = RampShape::Linear) noexcept;

    float getTargetValue() const noexcept { return endValue; }
    double getRampEndTime() const noexcept { return endTime; }
    bool isRamping(double now) const noexcept { return now < endTime && startValue != endValue; }

private:
    static float clampGain(float value) noexcept;

    double startTime = 0.0;
    double endTime = 0.0;
    float startValue = 0.0f;
    float endValue = 0.0f;
    RampShape shape = RampShape::Linear;
};

} // namespace stillpoint::dsp
