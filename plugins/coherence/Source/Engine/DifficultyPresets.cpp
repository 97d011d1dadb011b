#include "DifficultyPresets.h"

namespace stillpoint::engine
{

const char* getDifficultyName(Difficulty difficulty) noexcept
{
    switch (difficulty)
    {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
    }

    return "unknown";
}

Difficulty difficultyForSensitivity(float sensitivity) noexcept
{
    const float s = sanitiseUnit(sensitivity);

    if (s < tuning::Difficulty::kEasyUpperBound)
        return Difficulty::Easy;

    if (s < tuning::Difficulty::kMediumUpperBound)
        return Difficulty::Medium;

    return Difficulty::Hard;
}

CoherenceStateMachine::Config applyDifficulty(Difficulty difficulty, CoherenceStateMachine::Config base)
{
    const auto& values = [difficulty]() -> const tuning::Difficulty::Values&
    {
        switch (difficulty)
        {
            case Difficulty::Easy: return tuning::Difficulty::kEasy;
            case Difficulty::Hard: return tuning::Difficulty::kHard;
            case Difficulty::Medium:
            default:               return tuning::Difficulty::kMedium;
        }
    }();

    base.enterThreshold = values.enterThreshold;
    base.exitThreshold = values.exitThreshold;
    base.enterSustainSeconds = values.enterSustainSeconds;
    base.exitSustainSeconds = values.exitSustainSeconds;
    return base;
}

} // namespace stillpoint::engine
