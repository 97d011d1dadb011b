#pragma once

#include <future>
#include <memory>
#include <optional>

#include "TaskScheduler.h"
#include "AssetLibrary.h"
#include "BonusLayerTrigger.h"
#include "CoherenceStateMachine.h"
#include "CuePlayer.h"
#include "DifficultyPresets.h"
#include "ExpressiveModulation.h"
#include "FogGate.h"
#include "MovementDetector.h"
#include "OutputBackend.h"
#include "SessionMetrics.h"
#include "../DSP/LayerMixer.h"

namespace stillpoint::engine
{

/**
 * CoherenceEngine: the session facade.
 *
 * Owns every control-side component (state machine, bonus triggers, fog
 * gate, movement detector, cue player, metrics) and translates their
 * events into LayerMixer automation. It never touches audio buffers.
 *
 * Control timestamps are wall-clock milliseconds supplied by the caller.
 * Ramps are scheduled against the mixer's AudioClock.
 *
 * Coherence ticks are only classified while a session is active, so the
 * metrics of a stopped session stay final until the next start.
 */
class CoherenceEngine
{
public:
    CoherenceEngine(dsp::LayerMixer& mixer,
                    AssetLoader& loader,
                    OutputBackend& backend,
                    core::TaskScheduler& scheduler,
                    EngineCapabilities capabilities = {});
    ~CoherenceEngine();

    //==========================================================================
    // Lifecycle

    /** Single-flight asset load. Safe to call repeatedly and concurrently. */
    std::shared_future<bool> initialise();

    /**
     * Load assets if needed, resume the backend, start every loop in sync and
     * fade the baseline in. Returns false (and starts nothing) if a required
     * asset is missing or the backend will not run.
     */
    bool startSession(juce::int64 now);

    /** Fade the master out and release this session's voices afterwards. Idempotent. */
    void stopSession(juce::int64 now);

    bool isSessionActive() const noexcept { return sessionActive; }
    bool hasPendingTeardown() const noexcept { return pendingTeardown.has_value(); }

    //==========================================================================
    // Inputs
    CoherenceFsmState updateCoherence(const CoherenceSample& sample);
    std::optional<MovementEvent> updateMotion(const MotionSample& sample, juce::int64 now);
    std::optional<MovementEvent> updateArtifacts(const ArtifactSample& sample, juce::int64 now);

    /** No-op unless built with the expressiveModulation capability. */
    void updateExpressive(float scoreA, float scoreB, juce::int64 now);

    /** No-op unless built with the heartRateModulation capability. */
    void updateHeartRate(const HeartRateSample& sample, juce::int64 now);

    void setSensitivity(float sensitivity);
    Difficulty getDifficulty() const noexcept { return difficulty; }

    /** Cue layer level, applied at the next session start or faded in now. */
    void setCueLevel(float level);
    float getCueLevel() const noexcept { return cueLevel; }

    //==========================================================================
    // Entrainment
    bool startEntrainment();
    void stopEntrainment();
    void setEntrainmentVolume(float volume);
    bool isEntrainmentPlaying() const noexcept { return entrainmentPlaying; }
    float getEntrainmentVolume() const noexcept { return entrainmentVolume; }

    //==========================================================================
    // Outputs
    CoherenceFsmState getState() const noexcept { return stateMachine.getState(); }
    MetricsSnapshot getMetrics(juce::int64 now) const noexcept { return metrics.getSnapshot(now); }

    const CoherenceStateMachine& getStateMachine() const noexcept { return stateMachine; }
    const BonusLayerTrigger& getShimmerTrigger() const noexcept { return shimmer; }
    const BonusLayerTrigger& getSustainedTrigger() const noexcept { return sustained; }
    const FogGate& getFogGate() const noexcept { return fogGate; }
    const MovementDetector& getMovementDetector() const noexcept { return movementDetector; }
    const CuePlayer& getCuePlayer() const noexcept { return cuePlayer; }
    const EngineCapabilities& getCapabilities() const noexcept { return capabilities; }

    dsp::LayerMixer& getMixer() noexcept { return mixer; }
    AssetLibrary& getAssets() noexcept { return assets; }

private:
    struct BonusFades
    {
        double fadeInSeconds;
        double fadeOutSeconds;
        double updateSeconds;
    };

    double audioNow() const noexcept { return mixer.getClock().getCurrentTime(); }

    bool ensureBackendRunning();
    void assignLayerSources();
    void resetControlState();
    void scheduleTeardown(juce::uint32 generation, double delaySeconds, int deferrals);
    void finishTeardown(juce::uint32 generation, int deferrals);

    void handleTransition(const Transition& transition, juce::int64 now);
    void handleBonus(BonusLayerTrigger& trigger, dsp::Layer layer, const BonusFades& fades,
                     float coherence, juce::int64 now);
    void fadeInBonus(const BonusLayerTrigger& trigger, dsp::Layer layer, const BonusFades& fades);
    void handleFog(juce::int64 now);
    void handleMovement(const std::optional<MovementEvent>& event, juce::int64 now);
    void refreshTone(juce::int64 now);

    dsp::LayerMixer& mixer;
    OutputBackend& backend;
    core::TaskScheduler& scheduler;
    const EngineCapabilities capabilities;

    AssetLibrary assets;

    CoherenceStateMachine stateMachine;
    BonusLayerTrigger shimmer;
    BonusLayerTrigger sustained;
    FogGate fogGate;
    MovementDetector movementDetector;
    CuePlayer cuePlayer;
    SessionMetrics metrics;

    std::unique_ptr<ExpressiveModulator> expressive;
    std::unique_ptr<HeartRateModulator> heartRate;

    Difficulty difficulty = Difficulty::Medium;
    float cueLevel = tuning::Cues::kLayerGain;

    bool sessionActive = false;
    juce::uint32 sessionGeneration = 0;
    std::optional<juce::uint32> pendingTeardown;

    bool entrainmentPlaying = false;
    float entrainmentVolume = tuning::Entrainment::kDefaultVolume;

    JUCE_DECLARE_WEAK_REFERENCEABLE(CoherenceEngine)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CoherenceEngine)
};

} // namespace stillpoint::engine
