#pragma once

#include <optional>

#include "CoherenceTypes.h"
#include "SustainTimer.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

/**
 * BonusLayerTrigger: hold/cooldown threshold detector on the raw coherence
 * value. It never looks at the state machine.
 *
 * Entry: coherence >= triggerThreshold continuously for holdMs, and no
 * enable/disable happened within the last cooldownMs.
 *
 * Exit: coherence < exitThreshold continuously for exitHoldMs. With
 * exitThreshold == triggerThreshold and exitHoldMs == 0 (shimmer) this is
 * an immediate disable on the first tick below the trigger. Values between
 * exitThreshold and triggerThreshold cancel a running exit clock.
 *
 * Also keeps an EMA of coherence strength above the trigger, used for the
 * adaptive target gain while enabled.
 */
class BonusLayerTrigger
{
public:
    struct Config
    {
        float triggerThreshold = 0.0f;
        juce::int64 holdMs = 0;
        juce::int64 cooldownMs = 0;
        float exitThreshold = 0.0f;
        juce::int64 exitHoldMs = 0;

        float baseGain = 0.0f;
        float gainRange = 0.0f;
        float strengthSmoothing = tuning::BonusBus::kStrengthSmoothing;
    };

    enum class Event
    {
        Enabled,
        Disabled
    };

    static Config shimmerDefaults() noexcept;
    static Config sustainedDefaults() noexcept;

    explicit BonusLayerTrigger(const Config& config);

    /** Feed one raw coherence value. Returns an event on enable/disable. */
    std::optional<Event> update(float coherence, juce::int64 now);

    void reset() noexcept;

    bool isEnabled() const noexcept { return enabled; }
    float getSmoothedStrength() const noexcept { return smoothedStrength; }

    /** baseGain + smoothedStrength * gainRange, within [0, 1]. */
    float getTargetGain() const noexcept;

    std::optional<juce::int64> getAboveEntrySince() const noexcept { return aboveEntry.getStart(); }
    std::optional<juce::int64> getLastTriggerOrFadeOut() const noexcept { return lastTriggerOrFadeOut; }
    std::optional<juce::int64> getExitStartedAt() const noexcept { return exitTimer.getStart(); }

    const Config& getConfig() const noexcept { return config; }

private:
    bool isCooledDown(juce::int64 now) const noexcept;

    Config config;

    bool enabled = false;
    SustainTimer aboveEntry;
    SustainTimer exitTimer;
    std::optional<juce::int64> lastTriggerOrFadeOut;
    float smoothedStrength = 0.0f;
};

} // namespace stillpoint::engine
