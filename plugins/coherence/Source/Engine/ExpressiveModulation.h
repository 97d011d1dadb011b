#pragma once

#include "CoherenceTypes.h"
#include "../DSP/ToneStage.h"

namespace stillpoint::engine
{

/**
 * ExpressiveModulator: two auxiliary 0..1 scores brighten the master
 * through the high shelf. Full depth while Coherent, half while
 * Stabilizing, flat otherwise.
 */
class ExpressiveModulator
{
public:
    void update(float scoreA, float scoreB) noexcept;
    void reset() noexcept;

    float getShelfDb(CoherenceFsmState state) const noexcept;
    bool hasInput() const noexcept { return received; }

private:
    float mean = 0.0f;
    bool received = false;
};

/**
 * HeartRateModulator: a beat-locked raised-cosine dip of the master
 * low-pass. Low-confidence, out-of-range or stale input is ignored and
 * leaves the filter open.
 *
 * The modulator only describes the pulse (beat time and period); the tone
 * stage evaluates it per block so the dip follows the beat regardless of
 * how often heart-rate samples arrive.
 */
class HeartRateModulator
{
public:
    void update(const HeartRateSample& sample) noexcept;
    void reset() noexcept;

    bool isValid(juce::int64 now) const noexcept;
    /**
     * Pulse for the mixer. now is control time in ms and audioNow is the
     * audio-clock time at that same instant.
     */
    dsp::HeartbeatPulse getPulse(CoherenceFsmState state, juce::int64 now, double audioNow) const noexcept;

private:
    HeartRateSample latest;
    bool received = false;
};

/** Smoothed tone targets. A null modulator contributes nothing. */
dsp::ToneTargets computeToneTargets(const ExpressiveModulator* expressive,
                                    CoherenceFsmState state) noexcept;

} // namespace stillpoint::engine
