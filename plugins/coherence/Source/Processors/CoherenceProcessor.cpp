#include "CoherenceProcessor.h"
#include "../CoherenceTuning.h"

namespace stillpoint
{

namespace
{
    constexpr int kStateVersion = 1;
}

CoherenceProcessor::CoherenceProcessor(dsp::LayerMixer& mixerToRender, core::SampleClock& sampleClock)
    : core::ProcessorBase(
          BusesProperties()
              .withOutput("Output", juce::AudioChannelSet::stereo(), true),
          createParameterLayout(),
          kStateVersion),
      mixer(mixerToRender),
      clock(sampleClock)
{
    const auto getFloat = [this](const juce::String& id)
    {
        return dynamic_cast<juce::AudioParameterFloat*>(apvts.getParameter(id));
    };

    outputParam = getFloat("output");
    sensitivityParam = getFloat("sensitivity");
    cueLevelParam = getFloat("cueLevel");
}

//==============================================================================
void CoherenceProcessor::prepareToPlay(double sampleRate, int samplesPerBlock)
{
    setLatencySamples(0);

    juce::dsp::ProcessSpec spec{
        sampleRate,
        static_cast<juce::uint32>(samplesPerBlock),
        static_cast<juce::uint32>(juce::jmax(1, getMainBusNumOutputChannels()))};

    clock.prepare(sampleRate);
    mixer.prepare(spec);
    meterQueue.reset();
}

void CoherenceProcessor::releaseResources() {}

void CoherenceProcessor::reset()
{
    meterQueue.reset();
}

void CoherenceProcessor::processBlock(juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midi)
{
    juce::ignoreUnused(midi);

    juce::ScopedNoDenormals noDenormals;

    const double blockStart = clock.getCurrentTime();
    mixer.render(buffer, blockStart);
    clock.advance(buffer.getNumSamples());

    const float outputDb = outputParam != nullptr ? outputParam->get() : 0.0f;
    buffer.applyGain(juce::Decibels::decibelsToGain(outputDb));

    meterQueue.push(mixer.getMeterState(blockStart));
}

//==============================================================================
const juce::String CoherenceProcessor::getName() const { return "Stillpoint Coherence"; }

bool CoherenceProcessor::popMeterState(dsp::MixerMeterState& state) noexcept
{
    return meterQueue.popLatest(state);
}

float CoherenceProcessor::getSensitivity() const noexcept
{
    return sensitivityParam != nullptr ? sensitivityParam->get() : 0.5f;
}

float CoherenceProcessor::getCueLevel() const noexcept
{
    return cueLevelParam != nullptr ? cueLevelParam->get() : tuning::Cues::kLayerGain;
}

//==============================================================================
juce::AudioProcessorValueTreeState::ParameterLayout CoherenceProcessor::createParameterLayout()
{
    std::vector<std::unique_ptr<juce::RangedAudioParameter>> params;

    params.push_back(std::make_unique<juce::AudioParameterFloat>(
        juce::ParameterID { "output", 1 }, "Output",
        juce::NormalisableRange<float>(-24.0f, 6.0f, 0.1f), 0.0f,
        juce::AudioParameterFloatAttributes().withLabel("dB")));

    params.push_back(std::make_unique<juce::AudioParameterFloat>(
        juce::ParameterID { "sensitivity", 1 }, "Sensitivity",
        juce::NormalisableRange<float>(0.0f, 1.0f, 0.01f), 0.5f));

    params.push_back(std::make_unique<juce::AudioParameterFloat>(
        juce::ParameterID { "cueLevel", 1 }, "Cue Level",
        juce::NormalisableRange<float>(0.0f, 1.0f, 0.01f), tuning::Cues::kLayerGain));

    return { params.begin(), params.end() };
}

//==============================================================================
void CoherenceProcessor::onStateRestored(int storedVersion)
{
    if (storedVersion > getStateVersion())
        juce::Logger::writeToLog("CoherenceProcessor: restoring newer state version " + juce::String(storedVersion));
}

} // namespace stillpoint
