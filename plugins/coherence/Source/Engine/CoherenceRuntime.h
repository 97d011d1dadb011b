#pragma once

#include "AudioClock.h"
#include "TaskScheduler.h"
#include "CoherenceEngine.h"
#include "../Processors/CoherenceProcessor.h"

namespace stillpoint
{

/**
 * CoherenceRuntime: production wiring of the engine.
 *
 *   SampleClock ◄── CoherenceProcessor ◄── AudioProcessorPlayer ◄── device
 *        │                 │
 *        ▼                 ▼
 *   LayerMixer ◄────── CoherenceEngine ──► FileAssetLoader / MessageThreadScheduler
 *
 * Members are declared so that the engine goes first on destruction and the
 * device is closed before the processor and mixer it renders.
 */
class CoherenceRuntime final : private juce::AudioProcessorValueTreeState::Listener
{
public:
    struct Options
    {
        juce::File assetDirectory;
        engine::EngineCapabilities capabilities;
        int numOutputChannels = 2;
    };

    explicit CoherenceRuntime(const Options& options);
    ~CoherenceRuntime() override;

    engine::CoherenceEngine& getEngine() noexcept { return coherenceEngine; }
    CoherenceProcessor& getProcessor() noexcept { return processor; }
    const core::SampleClock& getClock() const noexcept { return clock; }

private:
    void parameterChanged(const juce::String& parameterID, float newValue) override;

    core::SampleClock clock;
    core::MessageThreadScheduler scheduler;
    engine::FileAssetLoader loader;
    dsp::LayerMixer mixer;
    CoherenceProcessor processor;
    engine::DeviceOutputBackend backend;
    engine::CoherenceEngine coherenceEngine;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CoherenceRuntime)
};

} // namespace stillpoint
