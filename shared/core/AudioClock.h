#pragma once

#include <juce_core/juce_core.h>
#include <atomic>

namespace stillpoint::core
{

/**
 * AudioClock: the time base gain automation is scheduled against.
 *
 * Mirrors an audio context's "current time": it only moves forward while
 * the device is rendering, so ramps scheduled against it progress exactly
 * as fast as the audio they shape.
 */
class AudioClock
{
public:
    virtual ~AudioClock() = default;

    /** Current audio time in seconds. */
    virtual double getCurrentTime() const noexcept = 0;
};

/**
 * SampleClock: AudioClock driven by the render callback.
 *
 * The audio thread calls advance() after each block; any thread may read.
 */
class SampleClock final : public AudioClock
{
public:
    SampleClock() = default;

    void prepare(double newSampleRate) noexcept
    {
        if (newSampleRate <= 0.0)
        {
            jassertfalse;
            return;
        }

        sampleRate.store(newSampleRate);
    }

    void advance(int numSamples) noexcept
    {
        samplePosition.fetch_add(static_cast<juce::int64>(numSamples));
    }

    juce::int64 getSamplePosition() const noexcept { return samplePosition.load(); }
    double getSampleRate() const noexcept { return sampleRate.load(); }

    double getCurrentTime() const noexcept override
    {
        return static_cast<double>(samplePosition.load()) / sampleRate.load();
    }

private:
    std::atomic<juce::int64> samplePosition { 0 };
    std::atomic<double> sampleRate { 48000.0 };

    JUCE_DECLARE_NON_COPYABLE(SampleClock)
};

} // namespace stillpoint::core
