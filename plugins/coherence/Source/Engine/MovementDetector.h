#pragma once

#include <optional>

#include "CoherenceTypes.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

/**
 * MovementDetector: EMA-baseline deviation tracker over the accelerometer
 * stream, plus a conservative artifact fallback for when there is no
 * accelerometer data.
 *
 * Primary path, per non-zero sample:
 *   1. first sample snaps the baseline
 *   2. remaining warmup samples blend quickly (warmupAlpha)
 *   3. delta = |x-bx| + |y-by| + |z-bz| against the baseline *before*
 *      it absorbs this sample, then baseline += alpha * (sample - baseline)
 *   4. delta > threshold and debounce elapsed since the last detection
 *      counts as a detection; it becomes an event only outside cooldown
 *
 * Slow nods spread over many ticks build up deviation from a slow baseline
 * even when every tick-to-tick delta is tiny.
 */
class MovementDetector
{
public:
    struct Config
    {
        float axisDeltaThreshold = tuning::Movement::kAxisDeltaThreshold;
        juce::int64 debounceMs = tuning::Movement::kDebounceMs;
        juce::int64 cooldownMs = tuning::Movement::kCooldownMs;
        int warmupSamples = tuning::Movement::kWarmupSamples;
        float baselineAlpha = tuning::Movement::kBaselineAlpha;
        float warmupAlpha = tuning::Movement::kWarmupAlpha;

        float artifactPowerRatio = tuning::Movement::kArtifactPowerRatio;
        juce::int64 artifactCooldownMs = tuning::Movement::kArtifactCooldownMs;
        int artifactMinPoorChannels = tuning::Movement::kArtifactMinPoorChannels;
        float artifactBaselineAlpha = tuning::Movement::kArtifactBaselineAlpha;
    };

    struct Stats
    {
        int accelSamples = 0;
        int movementDetections = 0;
        int eventsEmitted = 0;
        int artifactEvents = 0;
    };

    MovementDetector();
    explicit MovementDetector(const Config& config);

    /** Feed one accelerometer sample. All-zero samples are skipped. */
    std::optional<MovementEvent> processMotion(const MotionSample& sample, juce::int64 now);

    /** Feed one artifact summary. Ignored while the accelerometer is delivering data. */
    std::optional<MovementEvent> processArtifact(const ArtifactSample& sample, juce::int64 now);

    void reset() noexcept;

    const Stats& getStats() const noexcept { return stats; }
    MotionSample getBaseline() const noexcept { return baseline; }
    bool isBaselineInitialised() const noexcept { return baselineInitialised; }
    const Config& getConfig() const noexcept { return config; }

private:
    bool isCooledDown(juce::int64 now) const noexcept;
    MovementEvent emit(float magnitude, MovementSource source, juce::int64 now);

    Config config;

    MotionSample baseline;
    bool baselineInitialised = false;
    bool accelerometerActive = false;

    std::optional<juce::int64> lastDetectionMs;
    std::optional<juce::int64> lastEventMs;
    std::optional<juce::int64> lastArtifactEventMs;
    float artifactBaseline = 0.0f;

    Stats stats;
};

} // namespace stillpoint::engine
