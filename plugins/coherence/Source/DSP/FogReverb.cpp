#include "FogReverb.h"

#include <algorithm>

namespace stillpoint::dsp
{

FogReverb::FogReverb()
    : sendGain(0.0f),
      wetGain(0.0f)
{
}

void FogReverb::prepare(const juce::dsp::ProcessSpec& spec)
{
    if (spec.sampleRate <= 0.0)
    {
        jassertfalse;
        return;
    }

    sampleRate = spec.sampleRate;

    const auto maxDelaySamples = static_cast<std::size_t>(
        tuning::Fog::kMaxDelayMs * 0.001 * sampleRate) + 1;

    for (auto& line : delayLines)
    {
        line.assign(maxDelaySamples, 0.0f);
    }

    for (std::size_t i = 0; i < kNumTaps; ++i)
    {
        tapOffsets[i] = static_cast<int>(tuning::Fog::kTapTimesMs[i] * 0.001 * sampleRate);
        jassert(tapOffsets[i] > 0 && tapOffsets[i] < static_cast<int>(maxDelaySamples));
    }

    const auto coefficients = juce::dsp::IIR::Coefficients<float>::makeHighPass(
        sampleRate, tuning::Fog::kReturnHighPassHz);

    for (auto& filter : returnHighPass)
    {
        filter.coefficients = coefficients;
        filter.reset();
    }

    writeIndex = 0;
}

void FogReverb::reset() noexcept
{
    for (auto& line : delayLines)
        std::fill(line.begin(), line.end(), 0.0f);

    for (auto& filter : returnHighPass)
        filter.reset();

    writeIndex = 0;
    sendGain.setValueAt(0.0f, 0.0);
    wetGain.setValueAt(0.0f, 0.0);
}

float FogReverb::readTap(const std::vector<float>& line, int offset) const noexcept
{
    const int size = static_cast<int>(line.size());
    int index = writeIndex - offset;
    if (index < 0)
        index += size;

    return line[static_cast<std::size_t>(index)];
}

void FogReverb::process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                        double blockStartTime) noexcept
{
    if (delayLines[0].empty())
        return;

    const int numChannels = std::min(buffer.getNumChannels(), kMaxChannels);
    const int lineSize = static_cast<int>(delayLines[0].size());
    const double secondsPerSample = 1.0 / sampleRate;

    for (int i = 0; i < numSamples; ++i)
    {
        const double time = blockStartTime + static_cast<double>(i) * secondsPerSample;
        const float send = sendGain.getValueAt(time);
        const float wet = wetGain.getValueAt(time);

        for (int ch = 0; ch < numChannels; ++ch)
        {
            auto& line = delayLines[static_cast<std::size_t>(ch)];
            float* data = buffer.getWritePointer(ch, startSample);

            float tapSum = 0.0f;
            for (std::size_t tap = 0; tap < kNumTaps; ++tap)
                tapSum += readTap(line, tapOffsets[tap]);

            const float dry = data[i];
            line[static_cast<std::size_t>(writeIndex)] = dry * send + tapSum * feedback;

            const float wetSample = returnHighPass[static_cast<std::size_t>(ch)].processSample(tapSum);
            data[i] = dry + wetSample * wet;
        }

        if (++writeIndex >= lineSize)
            writeIndex = 0;
    }
}

void FogReverb::scheduleRamp(float sendTarget, float wetTarget, double durationSeconds, double now) noexcept
{
    sendGain.rampTo(sendTarget, now, durationSeconds);
    wetGain.rampTo(wetTarget, now, durationSeconds);
}

} // namespace stillpoint::dsp
