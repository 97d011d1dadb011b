#pragma once

#include <juce_events/juce_events.h>
#include <functional>

namespace stillpoint::core
{

/**
 * TaskScheduler: runs a callback once after a delay, without blocking
 * the caller. Used wherever work must be sequenced after a scheduled
 * ramp completes (e.g. releasing voices after a fade-out).
 */
class TaskScheduler
{
public:
    virtual ~TaskScheduler() = default;

    virtual void callAfter(int delayMs, std::function<void()> task) = 0;
};

/**
 * MessageThreadScheduler: TaskScheduler backed by juce::Timer::callAfterDelay.
 * Tasks run on the message thread.
 */
class MessageThreadScheduler final : public TaskScheduler
{
public:
    MessageThreadScheduler() = default;

    void callAfter(int delayMs, std::function<void()> task) override;

private:
    JUCE_DECLARE_NON_COPYABLE(MessageThreadScheduler)
};

} // namespace stillpoint::core
