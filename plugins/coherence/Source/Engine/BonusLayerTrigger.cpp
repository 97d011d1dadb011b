#include "BonusLayerTrigger.h"

namespace stillpoint::engine
{

BonusLayerTrigger::Config BonusLayerTrigger::shimmerDefaults() noexcept
{
    Config c;
    c.triggerThreshold = tuning::Shimmer::kTriggerThreshold;
    c.holdMs = tuning::Shimmer::kHoldMs;
    c.cooldownMs = tuning::Shimmer::kCooldownMs;
    c.exitThreshold = tuning::Shimmer::kTriggerThreshold;
    c.exitHoldMs = 0;
    c.baseGain = tuning::Shimmer::kBaseGain;
    c.gainRange = tuning::Shimmer::kGainRange;
    return c;
}

BonusLayerTrigger::Config BonusLayerTrigger::sustainedDefaults() noexcept
{
    Config c;
    c.triggerThreshold = tuning::Sustained::kTriggerThreshold;
    c.holdMs = tuning::Sustained::kHoldMs;
    c.cooldownMs = tuning::Sustained::kCooldownMs;
    c.exitThreshold = tuning::Sustained::kExitThreshold;
    c.exitHoldMs = tuning::Sustained::kExitHoldMs;
    c.baseGain = tuning::Sustained::kBaseGain;
    c.gainRange = tuning::Sustained::kGainRange;
    return c;
}

BonusLayerTrigger::BonusLayerTrigger(const Config& initialConfig)
    : config(initialConfig)
{
    config.triggerThreshold = sanitiseUnit(config.triggerThreshold);
    config.exitThreshold = sanitiseUnit(config.exitThreshold);

    if (config.exitThreshold > config.triggerThreshold)
    {
        jassertfalse;
        config.exitThreshold = config.triggerThreshold;
    }

    config.holdMs = juce::jmax<juce::int64>(0, config.holdMs);
    config.cooldownMs = juce::jmax<juce::int64>(0, config.cooldownMs);
    config.exitHoldMs = juce::jmax<juce::int64>(0, config.exitHoldMs);
}

bool BonusLayerTrigger::isCooledDown(juce::int64 now) const noexcept
{
    return ! lastTriggerOrFadeOut.has_value() || now - *lastTriggerOrFadeOut >= config.cooldownMs;
}

float BonusLayerTrigger::getTargetGain() const noexcept
{
    return sanitiseUnit(config.baseGain + smoothedStrength * config.gainRange);
}

std::optional<BonusLayerTrigger::Event> BonusLayerTrigger::update(float coherence, juce::int64 now)
{
    const float c = sanitiseUnit(coherence);

    const float headroom = 1.0f - config.triggerThreshold;
    const float strength = headroom > 0.0f ? sanitiseUnit((c - config.triggerThreshold) / headroom) : 0.0f;
    smoothedStrength += config.strengthSmoothing * (strength - smoothedStrength);

    if (! enabled)
    {
        if (c < config.triggerThreshold)
        {
            aboveEntry.cancel();
            return std::nullopt;
        }

        aboveEntry.start(now);

        if (aboveEntry.hasElapsed(now, config.holdMs) && isCooledDown(now))
        {
            enabled = true;
            lastTriggerOrFadeOut = now;
            aboveEntry.cancel();
            exitTimer.cancel();
            return Event::Enabled;
        }

        return std::nullopt;
    }

    if (c >= config.exitThreshold)
    {
        exitTimer.cancel();
        return std::nullopt;
    }

    exitTimer.start(now);

    if (exitTimer.hasElapsed(now, config.exitHoldMs))
    {
        enabled = false;
        lastTriggerOrFadeOut = now;
        exitTimer.cancel();
        aboveEntry.cancel();
        return Event::Disabled;
    }

    return std::nullopt;
}

void BonusLayerTrigger::reset() noexcept
{
    enabled = false;
    aboveEntry.cancel();
    exitTimer.cancel();
    lastTriggerOrFadeOut.reset();
    smoothedStrength = 0.0f;
}

} // namespace stillpoint::engine
