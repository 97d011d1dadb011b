#pragma once

#include <optional>

#include "CoherenceTypes.h"
#include "SustainTimer.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

/**
 * CoherenceStateMachine: hysteretic Baseline / Stabilizing / Coherent
 * classifier gated by signal quality.
 *
 *   Baseline ──(c >= enter)──► Stabilizing ──(held enterSustain)──► Coherent
 *      ▲                            │                                   │
 *      └────────(c < enter)─────────┘                                   │
 *      └──────────────(c <= exit, held exitSustain)─────────────────────┘
 *
 * A failing signal check forces Baseline before anything else is looked at.
 * update() is pure with respect to the outside world: it returns the
 * transition (if any) instead of calling back into the mixer.
 */
class CoherenceStateMachine
{
public:
    struct Config
    {
        float enterThreshold = tuning::StateMachine::kEnterThreshold;
        float exitThreshold = tuning::StateMachine::kExitThreshold;
        float enterSustainSeconds = tuning::StateMachine::kEnterSustainSeconds;
        float exitSustainSeconds = tuning::StateMachine::kExitSustainSeconds;
        juce::int64 maxPacketGapMs = tuning::StateMachine::kMaxPacketGapMs;
        float minContactQuality = tuning::StateMachine::kMinContactQuality;
    };

    CoherenceStateMachine();
    explicit CoherenceStateMachine(const Config& config);

    /** Feed one tick. Returns the transition if the state changed. */
    std::optional<Transition> update(float coherence, const SignalQuality& quality, juce::int64 now);

    /** Back to Baseline with both timers cleared. */
    std::optional<Transition> reset();

    /** Replace thresholds and sustain times. State and running timers are kept. */
    void setConfig(const Config& newConfig);
    const Config& getConfig() const noexcept { return config; }

    CoherenceFsmState getState() const noexcept { return state; }
    bool isEnterTimerRunning() const noexcept { return enterTimer.isRunning(); }
    bool isExitTimerRunning() const noexcept { return exitTimer.isRunning(); }

private:
    static Config sanitise(Config c);

    bool isSignalValid(const SignalQuality& quality) const noexcept;
    std::optional<Transition> moveTo(CoherenceFsmState next);

    Config config;
    juce::int64 enterSustainMs = 0;
    juce::int64 exitSustainMs = 0;

    CoherenceFsmState state = CoherenceFsmState::Baseline;
    SustainTimer enterTimer;
    SustainTimer exitTimer;
};

} // namespace stillpoint::engine
