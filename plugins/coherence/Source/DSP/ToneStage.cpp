#include "ToneStage.h"
#include "../CoherenceTuning.h"

#include <algorithm>
#include <cmath>

namespace stillpoint::dsp
{

namespace
{
    constexpr float kNeutralTolerance = 1.0e-3f;
}

void ToneStage::prepare(const juce::dsp::ProcessSpec& spec)
{
    if (spec.sampleRate <= 0.0)
    {
        jassertfalse;
        return;
    }

    sampleRate = spec.sampleRate;

    shelfDbSmoother.reset(sampleRate, tuning::Tone::kSmoothingSeconds);
    lowPassSmoother.reset(sampleRate, tuning::Tone::kSmoothingSeconds);

    reset();
}

void ToneStage::reset() noexcept
{
    currentTargets = ToneTargets{};
    heartbeat = HeartbeatPulse{};
    appliedLowPassHz = currentTargets.lowPassHz;
    shelfDbSmoother.setCurrentAndTargetValue(currentTargets.highShelfDb);
    lowPassSmoother.setCurrentAndTargetValue(currentTargets.lowPassHz);

    updateCoefficients(currentTargets.highShelfDb, currentTargets.lowPassHz);

    for (auto& filter : shelfFilters)
        filter.reset();
    for (auto& filter : lowPassFilters)
        filter.reset();
}

void ToneStage::setTargets(const ToneTargets& targets) noexcept
{
    const auto nyquistLimit = static_cast<float>(sampleRate * 0.45);

    currentTargets.highShelfDb = std::clamp(targets.highShelfDb, -12.0f, 12.0f);
    currentTargets.lowPassHz = std::clamp(targets.lowPassHz, 200.0f, nyquistLimit);

    shelfDbSmoother.setTargetValue(currentTargets.highShelfDb);
    lowPassSmoother.setTargetValue(currentTargets.lowPassHz);
}

void ToneStage::setHeartbeat(const HeartbeatPulse& pulse) noexcept
{
    heartbeat = pulse;

    if (heartbeat.periodSeconds <= 0.0 || heartbeat.depthHz <= 0.0f)
        heartbeat.active = false;
}

float ToneStage::getHeartbeatDipHz(double time) const noexcept
{
    if (! heartbeat.active)
        return 0.0f;

    const double age = time - heartbeat.beatTime;
    const double maxAgeSeconds = static_cast<double>(tuning::HeartRate::kMaxBeatAgeMs) / 1000.0;

    if (age < 0.0 || age >= maxAgeSeconds)
        return 0.0f;

    const double phase = std::fmod(age, heartbeat.periodSeconds) / heartbeat.periodSeconds;
    const double pulse = 0.5 * (1.0 + std::cos(juce::MathConstants<double>::twoPi * phase));

    return heartbeat.depthHz * static_cast<float>(pulse);
}

bool ToneStage::isNeutral() const noexcept
{
    return ! heartbeat.active
        && ! shelfDbSmoother.isSmoothing()
        && ! lowPassSmoother.isSmoothing()
        && std::abs(shelfDbSmoother.getCurrentValue()) < kNeutralTolerance
        && lowPassSmoother.getCurrentValue() >= tuning::Tone::kNeutralLowPassHz - kNeutralTolerance;
}

void ToneStage::updateCoefficients(float shelfDb, float lowPassHz)
{
    const auto shelf = juce::dsp::IIR::Coefficients<float>::makeHighShelf(
        sampleRate, tuning::Tone::kShelfFrequencyHz, 0.707f,
        juce::Decibels::decibelsToGain(shelfDb));

    const auto lowPass = juce::dsp::IIR::Coefficients<float>::makeLowPass(
        sampleRate, std::min(lowPassHz, static_cast<float>(sampleRate * 0.45)));

    for (auto& filter : shelfFilters)
        filter.coefficients = shelf;
    for (auto& filter : lowPassFilters)
        filter.coefficients = lowPass;
}

void ToneStage::process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                        double blockStartTime) noexcept
{
    if (isNeutral())
    {
        appliedLowPassHz = lowPassSmoother.getCurrentValue();
        return;
    }

    // Block-rate coefficients: advance the smoothers by one block, then filter.
    const float shelfDb = shelfDbSmoother.skip(numSamples);
    const float lowPassHz = std::max(200.0f, lowPassSmoother.skip(numSamples) - getHeartbeatDipHz(blockStartTime));
    appliedLowPassHz = lowPassHz;
    updateCoefficients(shelfDb, lowPassHz);

    const int numChannels = std::min(buffer.getNumChannels(), kMaxChannels);

    for (int ch = 0; ch < numChannels; ++ch)
    {
        float* data = buffer.getWritePointer(ch, startSample);
        auto& shelf = shelfFilters[static_cast<std::size_t>(ch)];
        auto& lowPass = lowPassFilters[static_cast<std::size_t>(ch)];

        for (int i = 0; i < numSamples; ++i)
            data[i] = lowPass.processSample(shelf.processSample(data[i]));
    }
}

} // namespace stillpoint::dsp
