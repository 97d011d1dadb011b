#pragma once

#include <juce_audio_processors/juce_audio_processors.h>

#include "../DSP/LayerMixer.h"
#include "AudioClock.h"
#include "ProcessorBase.h"
#include "StateQueue.h"

namespace stillpoint
{

/**
 * CoherenceProcessor: output-only processor that renders the LayerMixer.
 *
 * Each block is rendered at the SampleClock's current time, then the clock
 * advances, so every ramp the engine schedules lands on the sample it names.
 * Host-facing parameters: output level and session sensitivity.
 */
class CoherenceProcessor final : public core::ProcessorBase
{
public:
    CoherenceProcessor(dsp::LayerMixer& mixer, core::SampleClock& clock);
    ~CoherenceProcessor() override = default;

    //==============================================================================
    void prepareToPlay(double sampleRate, int samplesPerBlock) override;
    void releaseResources() override;
    void reset() override;
    void processBlock(juce::AudioBuffer<float>&, juce::MidiBuffer&) override;

    //==============================================================================
    const juce::String getName() const override;

    //==============================================================================
    bool popMeterState(dsp::MixerMeterState& state) noexcept;

    float getSensitivity() const noexcept;
    float getCueLevel() const noexcept;

    static juce::AudioProcessorValueTreeState::ParameterLayout createParameterLayout();

protected:
    void onStateRestored(int storedVersion) override;

private:
    dsp::LayerMixer& mixer;
    core::SampleClock& clock;

    core::StateQueue<dsp::MixerMeterState> meterQueue;

    juce::AudioParameterFloat* outputParam = nullptr;
    juce::AudioParameterFloat* sensitivityParam = nullptr;
    juce::AudioParameterFloat* cueLevelParam = nullptr;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CoherenceProcessor)
};

} // namespace stillpoint
