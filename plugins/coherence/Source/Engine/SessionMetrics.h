#pragma once

#include <optional>

#include "CoherenceTypes.h"

namespace stillpoint::engine
{

/**
 * SessionMetrics: coherent-time accounting for one session.
 *
 * totalCoherentSeconds and longestCoherentStreakSeconds only grow when a
 * streak closes. totalCoherenceAudioTimeMs also counts the streak that is
 * still open at query time.
 */
class SessionMetrics
{
public:
    SessionMetrics() = default;

    void reset() noexcept;

    /** Feed every state machine transition. */
    void onTransition(const Transition& transition, juce::int64 now) noexcept;

    /** Close any open streak (session end). */
    void finish(juce::int64 now) noexcept;

    MetricsSnapshot getSnapshot(juce::int64 now) const noexcept;

    bool isStreakOpen() const noexcept { return streakStart.has_value(); }

private:
    void closeStreak(juce::int64 now) noexcept;

    double totalCoherentSeconds = 0.0;
    double longestStreakSeconds = 0.0;
    juce::int64 closedAudioTimeMs = 0;
    std::optional<juce::int64> streakStart;
};

} // namespace stillpoint::engine
