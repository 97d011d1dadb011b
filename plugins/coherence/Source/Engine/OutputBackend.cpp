#include "OutputBackend.h"

namespace stillpoint::engine
{

DeviceOutputBackend::DeviceOutputBackend(juce::AudioProcessor& processorToPlay, int outputChannels)
    : processor(processorToPlay),
      numOutputChannels(juce::jlimit(1, 2, outputChannels))
{
}

DeviceOutputBackend::~DeviceOutputBackend()
{
    if (deviceOpened)
    {
        deviceManager.removeAudioCallback(&player);
        player.setProcessor(nullptr);
        deviceManager.closeAudioDevice();
    }
}

bool DeviceOutputBackend::isRunning() const
{
    const auto* device = deviceManager.getCurrentAudioDevice();
    return device != nullptr && device->isPlaying();
}

bool DeviceOutputBackend::resume()
{
    if (! deviceOpened)
    {
        const auto error = deviceManager.initialiseWithDefaultDevices(0, numOutputChannels);

        if (error.isNotEmpty())
        {
            juce::Logger::writeToLog("DeviceOutputBackend: cannot open output device: " + error);
            return false;
        }

        player.setProcessor(&processor);
        deviceManager.addAudioCallback(&player);
        deviceOpened = true;
    }
    else if (! isRunning())
    {
        deviceManager.restartLastAudioDevice();
    }

    return isRunning();
}

} // namespace stillpoint::engine
