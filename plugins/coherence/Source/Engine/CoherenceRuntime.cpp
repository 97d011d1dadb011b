#include "CoherenceRuntime.h"

namespace stillpoint
{

CoherenceRuntime::CoherenceRuntime(const Options& options)
    : loader(options.assetDirectory),
      mixer(clock),
      processor(mixer, clock),
      backend(processor, options.numOutputChannels),
      coherenceEngine(mixer, loader, backend, scheduler, options.capabilities)
{
    processor.getValueTreeState().addParameterListener("sensitivity", this);
    processor.getValueTreeState().addParameterListener("cueLevel", this);

    coherenceEngine.setSensitivity(processor.getSensitivity());
    coherenceEngine.setCueLevel(processor.getCueLevel());
}

CoherenceRuntime::~CoherenceRuntime()
{
    processor.getValueTreeState().removeParameterListener("sensitivity", this);
    processor.getValueTreeState().removeParameterListener("cueLevel", this);
}

void CoherenceRuntime::parameterChanged(const juce::String& parameterID, float newValue)
{
    const bool isSensitivity = parameterID == "sensitivity";

    if (! isSensitivity && parameterID != "cueLevel")
        return;

    // Parameter changes can arrive on any thread; the engine is driven from the message thread.
    juce::WeakReference<engine::CoherenceEngine> weakEngine(&coherenceEngine);

    juce::MessageManager::callAsync([weakEngine, isSensitivity, newValue]
    {
        if (auto* target = weakEngine.get())
        {
            if (isSensitivity)
                target->setSensitivity(newValue);
            else
                target->setCueLevel(newValue);
        }
    });
}

} // namespace stillpoint
