#include "FogGate.h"

namespace stillpoint::engine
{

FogGate::FogGate(juce::int64 sustainMs) noexcept
    : activeSustainMs(juce::jmax<juce::int64>(0, sustainMs))
{
}

std::optional<FogGate::Event> FogGate::update(CoherenceFsmState state, juce::int64 now)
{
    switch (state)
    {
        case CoherenceFsmState::Coherent:
            nonCoherentSince.cancel();

            if (enabled)
            {
                enabled = false;
                return Event::Disabled;
            }
            break;

        case CoherenceFsmState::Stabilizing:
            nonCoherentSince.cancel();
            break;

        case CoherenceFsmState::Baseline:
            nonCoherentSince.start(now);

            if (! enabled && nonCoherentSince.hasElapsed(now, activeSustainMs))
            {
                enabled = true;
                return Event::Enabled;
            }
            break;
    }

    return std::nullopt;
}

void FogGate::reset() noexcept
{
    enabled = false;
    nonCoherentSince.cancel();
}

} // namespace stillpoint::engine
