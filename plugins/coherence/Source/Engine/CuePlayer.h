#pragma once

#include <optional>

#include "AssetLibrary.h"
#include "../DSP/LayerMixer.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

/**
 * CuePlayer: round-robin one-shot movement cues on the mixer's cue layer.
 *
 * The slot index advances on every accepted trigger, whether or not the
 * slot's buffer is present, so the rotation never depends on loading.
 * Triggers inside the spam guard are rejected and leave the index alone.
 * Earlier voices keep playing; each one-shot frees itself when done.
 */
class CuePlayer
{
public:
    enum class TriggerResult
    {
        Rejected,   // inside the spam guard
        Played,     // voice started
        Missing,    // slot buffer absent, reload requested
        Dropped     // mixer at its voice limit
    };

    CuePlayer(dsp::LayerMixer& mixer, AssetLibrary& assets,
              juce::int64 minIntervalMs = tuning::Cues::kMinIntervalMs);

    TriggerResult trigger(juce::int64 now);

    void reset() noexcept;

    int getNextIndex() const noexcept { return nextIndex; }
    std::optional<juce::int64> getLastTriggerMs() const noexcept { return lastTriggerMs; }
    int getNumAccepted() const noexcept { return numAccepted; }

private:
    dsp::LayerMixer& mixer;
    AssetLibrary& assets;
    juce::int64 minIntervalMs;

    int nextIndex = 0;
    std::optional<juce::int64> lastTriggerMs;
    int numAccepted = 0;
};

} // namespace stillpoint::engine
