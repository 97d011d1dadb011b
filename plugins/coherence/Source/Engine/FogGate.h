#pragma once

#include <optional>

#include "CoherenceTypes.h"
#include "SustainTimer.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

/**
 * FogGate: decides when the fog reverb is on.
 *
 * Fog rolls in after activeSustainMs of continuous Baseline and is cut the
 * moment the state machine reports Coherent. Stabilizing breaks the
 * Baseline run without turning an active fog off.
 */
class FogGate
{
public:
    enum class Event
    {
        Enabled,
        Disabled
    };

    explicit FogGate(juce::int64 activeSustainMs = tuning::Fog::kActiveSustainMs) noexcept;

    std::optional<Event> update(CoherenceFsmState state, juce::int64 now);
    void reset() noexcept;

    bool isEnabled() const noexcept { return enabled; }
    std::optional<juce::int64> getNonCoherentSince() const noexcept { return nonCoherentSince.getStart(); }

private:
    juce::int64 activeSustainMs;
    bool enabled = false;
    SustainTimer nonCoherentSince;
};

} // namespace stillpoint::engine
