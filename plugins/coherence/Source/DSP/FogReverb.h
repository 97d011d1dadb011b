#pragma once

#include <array>
#include <vector>

#include <juce_dsp/juce_dsp.h>
#include "GainAutomation.h"
#include "../CoherenceTuning.h"

namespace stillpoint::dsp
{

/**
 * FogReverb: small multi-tap delay "fog" in parallel with an always-present
 * dry path.
 *
 *   in ──┬──────────────────────────────────────────────► (+) ─► out
 *        └─► send ─► [ tap 30 | tap 50 | tap 70 ms ] ─► HPF ─► wet ─┘
 *                         ▲            │
 *                         └─ feedback ─┘
 *
 * The topology never changes; only the send and wet gains are automated.
 */
class FogReverb
{
public:
    FogReverb();

    void prepare(const juce::dsp::ProcessSpec& spec);
    void reset() noexcept;

    /**
     * Process numSamples of buffer in place starting at startSample.
     * blockStartTime is the clock time of startSample, used to evaluate
     * the send/wet automation per sample.
     */
    void process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples,
                 double blockStartTime) noexcept;

    /** Ramp send and wet gains from their current values. */
    void scheduleRamp(float sendTarget, float wetTarget, double durationSeconds, double now) noexcept;

    float getSendAt(double time) const noexcept { return sendGain.getValueAt(time); }
    float getWetAt(double time) const noexcept { return wetGain.getValueAt(time); }

private:
    static constexpr std::size_t kNumTaps = tuning::Fog::kNumTaps;
    static constexpr int kMaxChannels = 2;

    double sampleRate = 48000.0;
    float feedback = tuning::Fog::kRoomSize * tuning::Fog::kFeedbackScale;

    GainAutomation sendGain;
    GainAutomation wetGain;

    // One circular buffer per channel, read at three fixed taps.
    std::array<std::vector<float>, kMaxChannels> delayLines;
    std::array<int, kNumTaps> tapOffsets {};
    int writeIndex = 0;

    std::array<juce::dsp::IIR::Filter<float>, kMaxChannels> returnHighPass;

    float readTap(const std::vector<float>& line, int offset) const noexcept;
};

} // namespace stillpoint::dsp
