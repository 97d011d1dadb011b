#pragma once

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_utils/juce_audio_utils.h>

namespace stillpoint::engine
{

/**
 * OutputBackend: the audio device as the engine sees it. A backend may be
 * suspended (no device open, device stopped) and need resuming before a
 * session can be heard.
 */
class OutputBackend
{
public:
    virtual ~OutputBackend() = default;

    virtual bool isRunning() const = 0;

    /** Try to (re)open the device. Returns true if it is running afterwards. */
    virtual bool resume() = 0;
};

/**
 * DeviceOutputBackend: default output device driving an AudioProcessor
 * through juce::AudioProcessorPlayer.
 */
class DeviceOutputBackend final : public OutputBackend
{
public:
    explicit DeviceOutputBackend(juce::AudioProcessor& processor, int numOutputChannels = 2);
    ~DeviceOutputBackend() override;

    bool isRunning() const override;
    bool resume() override;

    juce::AudioDeviceManager& getDeviceManager() noexcept { return deviceManager; }

private:
    juce::AudioProcessor& processor;
    int numOutputChannels;

    juce::AudioDeviceManager deviceManager;
    juce::AudioProcessorPlayer player;
    bool deviceOpened = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DeviceOutputBackend)
};

} // namespace stillpoint::engine
