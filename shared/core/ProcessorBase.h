#pragma once

#include <juce_audio_processors/juce_audio_processors.h>

namespace stillpoint::core
{

/**
 * ProcessorBase: shared plumbing for Stillpoint's generator processors.
 *
 * Owns the APVTS, stamps a state version onto saved trees and hands the
 * stored version back on restore. The bus layout is output-only (mono or
 * stereo); there is no editor and a single program.
 *
 * Subclasses implement prepareToPlay, releaseResources, reset, processBlock,
 * getName and a static createParameterLayout.
 */
class ProcessorBase : public juce::AudioProcessor
{
public:
    using BusesProperties = juce::AudioProcessor::BusesProperties;

    ProcessorBase(const BusesProperties& buses,
                  juce::AudioProcessorValueTreeState::ParameterLayout layout,
                  int currentStateVersion)
        : juce::AudioProcessor(buses),
          apvts(*this, nullptr, "StillpointParams", std::move(layout)),
          stateVersion(currentStateVersion)
    {
        jassert(stateVersion > 0);
    }

    ~ProcessorBase() override = default;

    juce::AudioProcessorValueTreeState& getValueTreeState() noexcept { return apvts; }
    const juce::AudioProcessorValueTreeState& getValueTreeState() const noexcept { return apvts; }

    int getStateVersion() const noexcept { return stateVersion; }

    //==========================================================================
    void getStateInformation(juce::MemoryBlock& destData) override
    {
        auto state = apvts.copyState();
        state.setProperty(kStateVersionId, stateVersion, nullptr);

        juce::MemoryOutputStream stream(destData, false);
        state.writeToStream(stream);
    }

    void setStateInformation(const void* data, int sizeInBytes) override
    {
        auto tree = juce::ValueTree::readFromData(data, static_cast<size_t>(sizeInBytes));

        if (! tree.isValid() || ! tree.hasType(apvts.state.getType()))
        {
            juce::Logger::writeToLog(getName() + ": ignoring unreadable state ("
                                     + juce::String(sizeInBytes) + " bytes)");
            return;
        }

        const int storedVersion = tree.getProperty(kStateVersionId, 0);
        apvts.replaceState(tree);
        onStateRestored(storedVersion);
    }

    //==========================================================================
    bool acceptsMidi() const override { return false; }
    bool producesMidi() const override { return false; }
    bool isMidiEffect() const override { return false; }
    double getTailLengthSeconds() const override { return 0.0; }

    bool hasEditor() const override { return false; }
    juce::AudioProcessorEditor* createEditor() override { return nullptr; }

    int getNumPrograms() override { return 1; }
    int getCurrentProgram() override { return 0; }
    void setCurrentProgram(int) override {}
    const juce::String getProgramName(int) override { return {}; }
    void changeProgramName(int, const juce::String&) override {}

    bool isBusesLayoutSupported(const BusesLayout& layouts) const override
    {
        if (! layouts.getMainInputChannelSet().isDisabled())
            return false;

        const auto& out = layouts.getMainOutputChannelSet();
        return out == juce::AudioChannelSet::mono() || out == juce::AudioChannelSet::stereo();
    }

    static inline const juce::Identifier kStateVersionId { "stateVersion" };

protected:
    /** Called after the APVTS has taken a restored tree; 0 means unversioned. */
    virtual void onStateRestored(int /*storedVersion*/) {}

    juce::AudioProcessorValueTreeState apvts;

private:
    const int stateVersion;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProcessorBase)
};

} // namespace stillpoint::core
