#pragma once

#include <juce_core/juce_core.h>
#include <cmath>

namespace stillpoint::engine
{

/** Signal-quality record produced by the analyzer alongside every coherence value. */
struct SignalQuality
{
    bool connected = false;
    float contactQuality = 0.0f;          // 0..1
    juce::int64 timeSinceLastUpdateMs = 0;
};

/** One analyzer tick. */
struct CoherenceSample
{
    float value = 0.0f;                   // 0..1
    SignalQuality signalQuality;
    juce::int64 timestampMs = 0;
};

enum class CoherenceFsmState
{
    Baseline,
    Stabilizing,
    Coherent
};

const char* getStateName(CoherenceFsmState state) noexcept;

/** Emitted by CoherenceStateMachine::update() whenever the state changes. */
struct Transition
{
    CoherenceFsmState from = CoherenceFsmState::Baseline;
    CoherenceFsmState to = CoherenceFsmState::Baseline;
};

/** Accelerometer sample in g. All-zero means "no data". */
struct MotionSample
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    bool isZero() const noexcept { return x == 0.0f && y == 0.0f && z == 0.0f; }
};

enum class MovementSource
{
    Accelerometer,
    ArtifactFallback
};

struct MovementEvent
{
    float deltaMagnitude = 0.0f;
    MovementSource source = MovementSource::Accelerometer;
};

/** Broadband EEG power summary used by the artifact fallback. */
struct ArtifactSample
{
    float totalBandPower = 0.0f;
    int poorChannelCount = 0;
};

struct HeartRateSample
{
    float bpm = 0.0f;
    float confidence = 0.0f;
    juce::int64 lastBeatMs = 0;
};

struct MetricsSnapshot
{
    double totalCoherentSeconds = 0.0;
    double longestCoherentStreakSeconds = 0.0;
    juce::int64 totalCoherenceAudioTimeMs = 0;
};

/** Optional modulation paths. A disabled capability is never constructed. */
struct EngineCapabilities
{
    bool expressiveModulation = false;
    bool heartRateModulation = false;
};

/** Clamp to [0, 1], mapping NaN to 0. */
inline float sanitiseUnit(float value) noexcept
{
    if (std::isnan(value))
        return 0.0f;

    return juce::jlimit(0.0f, 1.0f, value);
}

} // namespace stillpoint::engine
