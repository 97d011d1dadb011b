#pragma once

#include "CoherenceStateMachine.h"

namespace stillpoint::engine
{

enum class Difficulty
{
    Easy,
    Medium,
    Hard
};

const char* getDifficultyName(Difficulty difficulty) noexcept;

/** Map a 0..1 sensitivity slider value onto a named preset. */
Difficulty difficultyForSensitivity(float sensitivity) noexcept;

/**
 * Apply a preset's thresholds and sustain times on top of base.
 * Signal-gating fields (packet gap, contact quality) are left as they are.
 */
CoherenceStateMachine::Config applyDifficulty(Difficulty difficulty,
                                              CoherenceStateMachine::Config base = {});

} // namespace stillpoint::engine
