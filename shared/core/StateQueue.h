#pragma once

#include <juce_core/juce_core.h>
#include <array>
#include <type_traits>

namespace stillpoint::core
{

/**
 * StateQueue: single-producer / single-consumer snapshot queue.
 *
 * The audio thread pushes one snapshot per block; a reader on another thread
 * drains it. When full, the oldest snapshot is dropped so the producer never
 * blocks and the reader always sees the most recent state.
 */
template <typename StateT, int Capacity = 16>
class StateQueue
{
public:
    static_assert(std::is_trivially_copyable_v<StateT>,
                  "StateT must be trivially copyable to cross the audio thread");
    static_assert(Capacity > 1, "StateQueue needs room for at least two snapshots");

    void reset() noexcept { fifo.reset(); }

    int getNumReady() const noexcept { return fifo.getNumReady(); }

    bool push(const StateT& state) noexcept
    {
        if (fifo.getFreeSpace() == 0)
            fifo.read(1).forEach([](int) {});

        if (fifo.getFreeSpace() == 0)
            return false;

        fifo.write(1).forEach([this, &state](int index)
        {
            slots[static_cast<std::size_t>(index)] = state;
        });

        return true;
    }

    bool pop(StateT& state) noexcept
    {
        if (fifo.getNumReady() == 0)
            return false;

        fifo.read(1).forEach([this, &state](int index)
        {
            state = slots[static_cast<std::size_t>(index)];
        });

        return true;
    }

    /** Drains everything queued and returns only the newest snapshot. */
    bool popLatest(StateT& state) noexcept
    {
        const int ready = fifo.getNumReady();

        if (ready == 0)
            return false;

        fifo.read(ready).forEach([this, &state](int index)
        {
            state = slots[static_cast<std::size_t>(index)];
        });

        return true;
    }

private:
    std::array<StateT, Capacity> slots{};
    juce::AbstractFifo fifo { Capacity };
};

} // namespace stillpoint::core
