#include "SessionMetrics.h"

namespace stillpoint::engine
{

void SessionMetrics::reset() noexcept
{
    totalCoherentSeconds = 0.0;
    longestStreakSeconds = 0.0;
    closedAudioTimeMs = 0;
    streakStart.reset();
}

void SessionMetrics::onTransition(const Transition& transition, juce::int64 now) noexcept
{
    if (transition.to == CoherenceFsmState::Coherent)
    {
        if (! streakStart.has_value())
            streakStart = now;
    }
    else if (transition.from == CoherenceFsmState::Coherent)
    {
        closeStreak(now);
    }
}

void SessionMetrics::finish(juce::int64 now) noexcept
{
    closeStreak(now);
}

void SessionMetrics::closeStreak(juce::int64 now) noexcept
{
    if (! streakStart.has_value())
        return;

    const auto durationMs = juce::jmax<juce::int64>(0, now - *streakStart);
    const auto seconds = static_cast<double>(durationMs) / 1000.0;

    totalCoherentSeconds += seconds;
    longestStreakSeconds = juce::jmax(longestStreakSeconds, seconds);
    closedAudioTimeMs += durationMs;
    streakStart.reset();
}

MetricsSnapshot SessionMetrics::getSnapshot(juce::int64 now) const noexcept
{
    MetricsSnapshot snapshot;
    snapshot.totalCoherentSeconds = totalCoherentSeconds;
    snapshot.longestCoherentStreakSeconds = longestStreakSeconds;
    snapshot.totalCoherenceAudioTimeMs = closedAudioTimeMs;

    if (streakStart.has_value())
        snapshot.totalCoherenceAudioTimeMs += juce::jmax<juce::int64>(0, now - *streakStart);

    return snapshot;
}

} // namespace stillpoint::engine
