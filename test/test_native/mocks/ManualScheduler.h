#pragma once

#include <vector>
#include "TaskScheduler.h"

namespace stillpoint::test
{

/** Collects deferred tasks until the test runs them. */
class ManualScheduler final : public core::TaskScheduler
{
public:
    void callAfter(int delayMs, std::function<void()> task) override
    {
        pending.push_back({ delayMs, std::move(task) });
    }

    int getNumPending() const noexcept { return static_cast<int>(pending.size()); }
    int getLastDelayMs() const noexcept { return pending.empty() ? -1 : pending.back().delayMs; }

    void runAll()
    {
        auto tasks = std::move(pending);
        pending.clear();

        for (auto& entry : tasks)
            if (entry.task != nullptr)
                entry.task();
    }

private:
    struct Entry
    {
        int delayMs;
        std::function<void()> task;
    };

    std::vector<Entry> pending;
};

} // namespace stillpoint::test
