#pragma once

#include <array>

#include <juce_dsp/juce_dsp.h>

namespace stillpoint::dsp
{

/** Targets for the master tone stage. Neutral values leave audio untouched. */
struct ToneTargets
{
    float highShelfDb = 0.0f;
    float lowPassHz = 18000.0f;
};

/**
 * Beat-locked low-pass dip. beatTime is a heartbeat on the audio clock;
 * the dip peaks on every beat and falls to zero half a period later.
 */
struct HeartbeatPulse
{
    double beatTime = 0.0;
    double periodSeconds = 0.0;
    float depthHz = 0.0f;
    bool active = false;
};

/**
 * ToneStage: high-shelf + low-pass on the master bus, driven by the
 * expressive and heart-rate modulators.
 *
 * Targets are smoothed and coefficients are recalculated once per block
 * (never per sample). The heartbeat dip is evaluated at each block's start
 * time on top of the smoothed low-pass. When both smoothers are settled at
 * neutral and no pulse is set the stage is bypassed entirely.
 */
class ToneStage
{
public:
    ToneStage() = default;

    void prepare(const juce::dsp::ProcessSpec& spec);
    void reset() noexcept;

    void setTargets(const ToneTargets& targets) noexcept;
    ToneTargets getCurrentTargets() const noexcept { return currentTargets; }

    void setHeartbeat(const HeartbeatPulse& pulse) noexcept;
    const HeartbeatPulse& getHeartbeat() const noexcept { return heartbeat; }

    /** Dip below the low-pass target at the given audio-clock time. */
    float getHeartbeatDipHz(double time) const noexcept;

    /** Low-pass cutoff used for the most recently processed block. */
    float getAppliedLowPassHz() const noexcept { return appliedLowPassHz; }

    void process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                 double blockStartTime) noexcept;

private:
    static constexpr int kMaxChannels = 2;

    double sampleRate = 48000.0;
    ToneTargets currentTargets;
    HeartbeatPulse heartbeat;
    float appliedLowPassHz = 18000.0f;

    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Linear> shelfDbSmoother;
    juce::SmoothedValue<float, juce::ValueSmoothingTypes::Multiplicative> lowPassSmoother;

    std::array<juce::dsp::IIR::Filter<float>, kMaxChannels> shelfFilters;
    std::array<juce::dsp::IIR::Filter<float>, kMaxChannels> lowPassFilters;

    bool isNeutral() const noexcept;
    void updateCoefficients(float shelfDb, float lowPassHz);
};

} // namespace stillpoint::dsp
