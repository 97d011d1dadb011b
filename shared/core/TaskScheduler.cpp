#include "TaskScheduler.h"

namespace stillpoint::core
{

void MessageThreadScheduler::callAfter(int delayMs, std::function<void()> task)
{
    if (task == nullptr)
        return;

    juce::Timer::callAfterDelay(juce::jmax(0, delayMs), std::move(task));
}

} // namespace stillpoint::core
