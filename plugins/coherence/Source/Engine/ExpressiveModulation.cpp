#include "ExpressiveModulation.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

void ExpressiveModulator::update(float scoreA, float scoreB) noexcept
{
    mean = 0.5f * (sanitiseUnit(scoreA) + sanitiseUnit(scoreB));
    received = true;
}

void ExpressiveModulator::reset() noexcept
{
    mean = 0.0f;
    received = false;
}

float ExpressiveModulator::getShelfDb(CoherenceFsmState state) const noexcept
{
    if (! received)
        return 0.0f;

    const float boost = tuning::Tone::kMaxShelfBoostDb * mean;

    switch (state)
    {
        case CoherenceFsmState::Coherent:    return boost;
        case CoherenceFsmState::Stabilizing: return 0.5f * boost;
        case CoherenceFsmState::Baseline:    break;
    }

    return 0.0f;
}

//==============================================================================
void HeartRateModulator::update(const HeartRateSample& sample) noexcept
{
    latest = sample;
    received = true;
}

void HeartRateModulator::reset() noexcept
{
    latest = {};
    received = false;
}

bool HeartRateModulator::isValid(juce::int64 now) const noexcept
{
    return received
        && latest.confidence >= tuning::HeartRate::kMinConfidence
        && latest.bpm >= tuning::HeartRate::kMinBpm
        && latest.bpm <= tuning::HeartRate::kMaxBpm
        && now >= latest.lastBeatMs
        && now - latest.lastBeatMs < tuning::HeartRate::kMaxBeatAgeMs;
}

dsp::HeartbeatPulse HeartRateModulator::getPulse(CoherenceFsmState state, juce::int64 now,
                                                double audioNow) const noexcept
{
    dsp::HeartbeatPulse pulse;

    if (state == CoherenceFsmState::Baseline || ! isValid(now))
        return pulse;

    pulse.beatTime = audioNow - static_cast<double>(now - latest.lastBeatMs) / 1000.0;
    pulse.periodSeconds = 60.0 / static_cast<double>(latest.bpm);
    pulse.depthHz = tuning::Tone::kHeartbeatDipHz;
    pulse.active = true;
    return pulse;
}

//==============================================================================
dsp::ToneTargets computeToneTargets(const ExpressiveModulator* expressive,
                                    CoherenceFsmState state) noexcept
{
    dsp::ToneTargets targets;

    if (expressive != nullptr)
        targets.highShelfDb = expressive->getShelfDb(state);

    return targets;
}

} // namespace stillpoint::engine
