#include "CoherenceStateMachine.h"

#include <cmath>

namespace stillpoint::engine
{

const char* getStateName(CoherenceFsmState state) noexcept
{
    switch (state)
    {
        case CoherenceFsmState::Baseline:    return "baseline";
        case CoherenceFsmState::Stabilizing: return "stabilizing";
        case CoherenceFsmState::Coherent:    return "coherent";
    }

    return "unknown";
}

namespace
{
    juce::int64 secondsToMs(float seconds) noexcept
    {
        return static_cast<juce::int64>(std::llround(static_cast<double>(seconds) * 1000.0));
    }
}

CoherenceStateMachine::CoherenceStateMachine()
    : CoherenceStateMachine(Config{})
{
}

CoherenceStateMachine::CoherenceStateMachine(const Config& initialConfig)
{
    setConfig(initialConfig);
}

CoherenceStateMachine::Config CoherenceStateMachine::sanitise(Config c)
{
    c.enterThreshold = sanitiseUnit(c.enterThreshold);
    c.exitThreshold = sanitiseUnit(c.exitThreshold);

    // Exit above enter would let Coherent flap on a single value.
    if (c.exitThreshold > c.enterThreshold)
    {
        jassertfalse;
        c.exitThreshold = c.enterThreshold;
    }

    c.enterSustainSeconds = juce::jmax(0.0f, c.enterSustainSeconds);
    c.exitSustainSeconds = juce::jmax(0.0f, c.exitSustainSeconds);
    c.maxPacketGapMs = juce::jmax<juce::int64>(0, c.maxPacketGapMs);
    c.minContactQuality = sanitiseUnit(c.minContactQuality);
    return c;
}

void CoherenceStateMachine::setConfig(const Config& newConfig)
{
    config = sanitise(newConfig);
    enterSustainMs = secondsToMs(config.enterSustainSeconds);
    exitSustainMs = secondsToMs(config.exitSustainSeconds);
}

bool CoherenceStateMachine::isSignalValid(const SignalQuality& quality) const noexcept
{
    return quality.connected
        && sanitiseUnit(quality.contactQuality) >= config.minContactQuality
        && quality.timeSinceLastUpdateMs <= config.maxPacketGapMs;
}

std::optional<Transition> CoherenceStateMachine::moveTo(CoherenceFsmState next)
{
    if (next == state)
        return std::nullopt;

    const Transition transition { state, next };
    state = next;

    DBG("CoherenceStateMachine: " << getStateName(transition.from) << " -> " << getStateName(transition.to));
    return transition;
}

std::optional<Transition> CoherenceStateMachine::update(float coherence, const SignalQuality& quality, juce::int64 now)
{
    if (! isSignalValid(quality))
    {
        enterTimer.cancel();
        exitTimer.cancel();
        return moveTo(CoherenceFsmState::Baseline);
    }

    const float c = sanitiseUnit(coherence);

    switch (state)
    {
        case CoherenceFsmState::Baseline:
            if (c >= config.enterThreshold)
            {
                enterTimer.restart(now);
                return moveTo(CoherenceFsmState::Stabilizing);
            }
            break;

        case CoherenceFsmState::Stabilizing:
            if (c < config.enterThreshold)
            {
                enterTimer.cancel();
                return moveTo(CoherenceFsmState::Baseline);
            }

            if (enterTimer.hasElapsed(now, enterSustainMs))
            {
                enterTimer.cancel();
                exitTimer.cancel();
                return moveTo(CoherenceFsmState::Coherent);
            }
            break;

        case CoherenceFsmState::Coherent:
            if (c <= config.exitThreshold)
            {
                exitTimer.start(now);

                if (exitTimer.hasElapsed(now, exitSustainMs))
                {
                    exitTimer.cancel();
                    return moveTo(CoherenceFsmState::Baseline);
                }
            }
            else
            {
                exitTimer.cancel();
            }
            break;
    }

    return std::nullopt;
}

std::optional<Transition> CoherenceStateMachine::reset()
{
    enterTimer.cancel();
    exitTimer.cancel();
    return moveTo(CoherenceFsmState::Baseline);
}

} // namespace stillpoint::engine
