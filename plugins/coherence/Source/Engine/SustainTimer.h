#pragma once

#include <juce_core/juce_core.h>
#include <optional>

namespace stillpoint::engine
{

/**
 * SustainTimer: an optional start timestamp with start/cancel/elapsed.
 *
 * start() only arms an idle timer; a running timer keeps its original
 * start so "continuously above for N ms" is measured from the first tick.
 */
class SustainTimer
{
public:
    void start(juce::int64 now) noexcept
    {
        if (! since.has_value())
            since = now;
    }

    void restart(juce::int64 now) noexcept { since = now; }
    void cancel() noexcept { since.reset(); }

    bool isRunning() const noexcept { return since.has_value(); }
    std::optional<juce::int64> getStart() const noexcept { return since; }

    juce::int64 elapsed(juce::int64 now) const noexcept
    {
        return since.has_value() ? now - *since : 0;
    }

    bool hasElapsed(juce::int64 now, juce::int64 durationMs) const noexcept
    {
        return since.has_value() && now - *since >= durationMs;
    }

private:
    std::optional<juce::int64> since;
};

} // namespace stillpoint::engine
