#include "CoherenceEngine.h"

#include <cmath>

namespace stillpoint::engine
{

namespace
{
    using dsp::Layer;

    constexpr float kFloor = tuning::Crossfade::kGainFloor;
}

CoherenceEngine::CoherenceEngine(dsp::LayerMixer& mixerToUse,
                                 AssetLoader& loader,
                                 OutputBackend& backendToUse,
                                 core::TaskScheduler& schedulerToUse,
                                 EngineCapabilities caps)
    : mixer(mixerToUse),
      backend(backendToUse),
      scheduler(schedulerToUse),
      capabilities(caps),
      assets(loader),
      shimmer(BonusLayerTrigger::shimmerDefaults()),
      sustained(BonusLayerTrigger::sustainedDefaults()),
      cuePlayer(mixerToUse, assets)
{
    if (capabilities.expressiveModulation)
        expressive = std::make_unique<ExpressiveModulator>();

    if (capabilities.heartRateModulation)
        heartRate = std::make_unique<HeartRateModulator>();
}

CoherenceEngine::~CoherenceEngine()
{
    if (pendingTeardown.has_value())
        mixer.releaseGeneration(*pendingTeardown);

    if (sessionActive)
        mixer.releaseGeneration(sessionGeneration);
}

//==============================================================================
std::shared_future<bool> CoherenceEngine::initialise()
{
    return assets.loadAll();
}

bool CoherenceEngine::ensureBackendRunning()
{
    for (int attempt = 1; attempt <= tuning::Backend::kMaxResumeAttempts; ++attempt)
    {
        if (backend.isRunning())
            return true;

        if (backend.resume())
            return true;

        juce::Logger::writeToLog("CoherenceEngine: output resume attempt " + juce::String(attempt) + " failed");
    }

    return backend.isRunning();
}

void CoherenceEngine::assignLayerSources()
{
    mixer.setLayerSource(Layer::Baseline, assets.get(AssetId::Baseline));
    mixer.setLayerSource(Layer::Coherence, assets.get(AssetId::Coherence));
    mixer.setLayerSource(Layer::Shimmer, assets.get(AssetId::Shimmer));
    mixer.setLayerSource(Layer::Sustained, assets.get(AssetId::Sustained));
    mixer.setLayerSource(Layer::Entrainment, assets.get(AssetId::Entrainment));
}

void CoherenceEngine::resetControlState()
{
    juce::ignoreUnused(stateMachine.reset());
    shimmer.reset();
    sustained.reset();
    fogGate.reset();
    movementDetector.reset();
    cuePlayer.reset();

    if (expressive != nullptr)
        expressive->reset();

    if (heartRate != nullptr)
        heartRate->reset();

    entrainmentPlaying = false;
}

bool CoherenceEngine::startSession(juce::int64 now)
{
    if (sessionActive)
    {
        juce::Logger::writeToLog("CoherenceEngine: startSession ignored, session already active");
        return true;
    }

    // A restart inside the previous fade drops the old voices right away.
    if (pendingTeardown.has_value())
    {
        mixer.releaseGeneration(*pendingTeardown);
        pendingTeardown.reset();
    }

    resetControlState();
    metrics.reset();

    if (! initialise().get())
    {
        juce::Logger::writeToLog("CoherenceEngine: required audio assets unavailable, session not started");
        return false;
    }

    if (! ensureBackendRunning())
    {
        juce::Logger::writeToLog("CoherenceEngine: output device not running, session not started");
        return false;
    }

    assignLayerSources();

    const double current = audioNow();
    const double startTime = current + tuning::Crossfade::kStartOffsetSeconds;

    sessionGeneration = mixer.beginGeneration();

    for (std::size_t i = 0; i < dsp::kNumLayers; ++i)
        mixer.setGain(static_cast<Layer>(i), 0.0f, current);

    mixer.setMasterGain(1.0f, current);
    mixer.scheduleFogRamp(0.0f, 0.0f, 0.0, current);
    mixer.setToneTargets({});
    mixer.setHeartbeat({});

    const int numLoops = mixer.startLoops(startTime);
    mixer.rampLayerFrom(Layer::Baseline, 0.0f, startTime, 1.0f, tuning::Crossfade::kStartFadeSeconds);
    mixer.setGain(Layer::Cue, cueLevel, current);

    sessionActive = true;

    juce::Logger::writeToLog("CoherenceEngine: session started at " + juce::String(now)
                             + " with " + juce::String(numLoops) + " loops, difficulty "
                             + getDifficultyName(difficulty));
    return true;
}

void CoherenceEngine::stopSession(juce::int64 now)
{
    if (! sessionActive)
    {
        DBG("CoherenceEngine: stopSession ignored, no active session");
        return;
    }

    sessionActive = false;
    metrics.finish(now);

    const double current = audioNow();
    mixer.scheduleMasterRamp(kFloor, tuning::Crossfade::kSessionEndFadeSeconds, current);

    pendingTeardown = sessionGeneration;
    scheduleTeardown(sessionGeneration,
                     tuning::Crossfade::kSessionEndFadeSeconds + tuning::Crossfade::kReleaseMarginSeconds, 0);

    resetControlState();

    juce::Logger::writeToLog("CoherenceEngine: session stopped at " + juce::String(now));
}

void CoherenceEngine::scheduleTeardown(juce::uint32 generation, double delaySeconds, int deferrals)
{
    const auto delayMs = juce::jmax(1, static_cast<int>(std::ceil(delaySeconds * 1000.0)));

    juce::WeakReference<CoherenceEngine> weakThis(this);
    scheduler.callAfter(delayMs, [weakThis, generation, deferrals]
    {
        if (auto* engine = weakThis.get())
            engine->finishTeardown(generation, deferrals);
    });
}

void CoherenceEngine::finishTeardown(juce::uint32 generation, int deferrals)
{
    if (! pendingTeardown.has_value() || *pendingTeardown != generation)
        return;

    // The timer runs on wall time; the fade runs on the audio clock.
    const double remaining = mixer.getMasterRampEndTime() - audioNow();

    if (remaining > 0.0)
    {
        if (deferrals < tuning::Crossfade::kMaxTeardownDeferrals)
        {
            scheduleTeardown(generation, remaining + tuning::Crossfade::kReleaseMarginSeconds, deferrals + 1);
            return;
        }

        juce::Logger::writeToLog("CoherenceEngine: audio clock stalled, releasing voices before the fade ended");
    }

    pendingTeardown.reset();
    mixer.releaseGeneration(generation);

    if (! sessionActive)
        mixer.setMasterGain(1.0f, audioNow());

    DBG("CoherenceEngine: released session generation " << (int) generation);
}

//==============================================================================
CoherenceFsmState CoherenceEngine::updateCoherence(const CoherenceSample& sample)
{
    // Outside a session nothing is classified, so a finished session's
    // metrics stay final and the next session starts from Baseline.
    if (! sessionActive)
        return stateMachine.getState();

    const auto now = sample.timestampMs;

    if (const auto transition = stateMachine.update(sample.value, sample.signalQuality, now))
        handleTransition(*transition, now);

    const float coherence = sanitiseUnit(sample.value);

    handleBonus(shimmer, Layer::Shimmer,
                { tuning::Shimmer::kFadeInSeconds, tuning::Shimmer::kFadeOutSeconds,
                  tuning::Shimmer::kUpdateSmoothSeconds },
                coherence, now);

    handleBonus(sustained, Layer::Sustained,
                { tuning::Sustained::kFadeInSeconds, tuning::Sustained::kFadeOutSeconds,
                  tuning::Sustained::kUpdateSmoothSeconds },
                coherence, now);

    handleFog(now);
    refreshTone(now);

    return stateMachine.getState();
}

void CoherenceEngine::handleTransition(const Transition& transition, juce::int64 now)
{
    metrics.onTransition(transition, now);

    const double current = audioNow();

    if (transition.to == CoherenceFsmState::Coherent)
    {
        mixer.scheduleRamp(Layer::Baseline, 0.0f, tuning::Crossfade::kAttackSeconds, current);
        mixer.scheduleRamp(Layer::Coherence, 1.0f, tuning::Crossfade::kAttackSeconds, current);

        // Triggers that fired while the FSM was elsewhere become audible now.
        fadeInBonus(shimmer, Layer::Shimmer,
                    { tuning::Shimmer::kFadeInSeconds, tuning::Shimmer::kFadeOutSeconds,
                      tuning::Shimmer::kUpdateSmoothSeconds });
        fadeInBonus(sustained, Layer::Sustained,
                    { tuning::Sustained::kFadeInSeconds, tuning::Sustained::kFadeOutSeconds,
                      tuning::Sustained::kUpdateSmoothSeconds });
    }
    else if (transition.from == CoherenceFsmState::Coherent)
    {
        mixer.scheduleRamp(Layer::Coherence, 0.0f, tuning::Crossfade::kReleaseSeconds, current);
        mixer.scheduleRamp(Layer::Baseline, 1.0f, tuning::Crossfade::kReleaseSeconds, current);

        // Bonus layers are never audible outside Coherent.
        mixer.scheduleRamp(Layer::Shimmer, kFloor, tuning::Shimmer::kFadeOutSeconds, current);
        mixer.scheduleRamp(Layer::Sustained, kFloor, tuning::Sustained::kFadeOutSeconds, current);
    }
}

void CoherenceEngine::fadeInBonus(const BonusLayerTrigger& trigger, Layer layer, const BonusFades& fades)
{
    if (! trigger.isEnabled() || ! mixer.hasLayerSource(layer))
        return;

    const double current = audioNow();
    const bool atFloor = mixer.getGain(layer, current) <= kFloor + 1.0e-4f;

    mixer.scheduleRamp(layer, juce::jmax(kFloor, trigger.getTargetGain()),
                       atFloor ? fades.fadeInSeconds : fades.updateSeconds, current);
}

void CoherenceEngine::handleBonus(BonusLayerTrigger& trigger, Layer layer, const BonusFades& fades,
                                  float coherence, juce::int64 now)
{
    const auto event = trigger.update(coherence, now);

    if (event.has_value())
        DBG("CoherenceEngine: " << dsp::getLayerName(layer)
            << (*event == BonusLayerTrigger::Event::Enabled ? " enabled" : " disabled"));

    const double current = audioNow();
    const bool coherent = stateMachine.getState() == CoherenceFsmState::Coherent;

    if (event == BonusLayerTrigger::Event::Disabled)
    {
        mixer.scheduleRamp(layer, kFloor, fades.fadeOutSeconds, current);
        return;
    }

    if (! coherent || ! trigger.isEnabled() || ! mixer.hasLayerSource(layer))
        return;

    if (event == BonusLayerTrigger::Event::Enabled)
    {
        fadeInBonus(trigger, layer, fades);
        return;
    }

    // Adaptive gain: follow the smoothed strength once the fade has landed.
    if (mixer.isRamping(layer, current))
        return;

    const float target = juce::jmax(kFloor, trigger.getTargetGain());

    if (std::abs(target - mixer.getGain(layer, current)) > tuning::Crossfade::kGainUpdateEpsilon)
        mixer.scheduleRamp(layer, target, fades.updateSeconds, current);
}

void CoherenceEngine::handleFog(juce::int64 now)
{
    const auto event = fogGate.update(stateMachine.getState(), now);

    if (! event.has_value())
        return;

    const double current = audioNow();

    if (*event == FogGate::Event::Enabled)
    {
        DBG("CoherenceEngine: fog on");
        mixer.scheduleFogRamp(tuning::Fog::kSendLevel, tuning::Fog::kWetLevel, tuning::Fog::kAttackSeconds, current);
    }
    else
    {
        DBG("CoherenceEngine: fog off");
        mixer.scheduleFogRamp(0.0f, 0.0f, tuning::Fog::kReleaseSeconds, current);
    }
}

void CoherenceEngine::refreshTone(juce::int64 now)
{
    if (! sessionActive || (expressive == nullptr && heartRate == nullptr))
        return;

    const auto state = stateMachine.getState();
    mixer.setToneTargets(computeToneTargets(expressive.get(), state));

    if (heartRate != nullptr)
        mixer.setHeartbeat(heartRate->getPulse(state, now, audioNow()));
}

//==============================================================================
std::optional<MovementEvent> CoherenceEngine::updateMotion(const MotionSample& sample, juce::int64 now)
{
    auto event = movementDetector.processMotion(sample, now);
    handleMovement(event, now);
    return event;
}

std::optional<MovementEvent> CoherenceEngine::updateArtifacts(const ArtifactSample& sample, juce::int64 now)
{
    auto event = movementDetector.processArtifact(sample, now);
    handleMovement(event, now);
    return event;
}

void CoherenceEngine::handleMovement(const std::optional<MovementEvent>& event, juce::int64 now)
{
    if (! event.has_value() || ! sessionActive)
        return;

    switch (cuePlayer.trigger(now))
    {
        case CuePlayer::TriggerResult::Played:
            break;
        case CuePlayer::TriggerResult::Rejected:
            DBG("CoherenceEngine: cue rejected by spam guard");
            break;
        case CuePlayer::TriggerResult::Missing:
            DBG("CoherenceEngine: cue slot empty");
            break;
        case CuePlayer::TriggerResult::Dropped:
            DBG("CoherenceEngine: cue dropped at voice limit");
            break;
    }
}

void CoherenceEngine::updateExpressive(float scoreA, float scoreB, juce::int64 now)
{
    if (expressive == nullptr)
        return;

    expressive->update(scoreA, scoreB);
    refreshTone(now);
}

void CoherenceEngine::updateHeartRate(const HeartRateSample& sample, juce::int64 now)
{
    if (heartRate == nullptr)
        return;

    heartRate->update(sample);
    refreshTone(now);
}

void CoherenceEngine::setSensitivity(float sensitivity)
{
    difficulty = difficultyForSensitivity(sensitivity);
    stateMachine.setConfig(applyDifficulty(difficulty, stateMachine.getConfig()));

    juce::Logger::writeToLog(juce::String("CoherenceEngine: difficulty ") + getDifficultyName(difficulty));
}

void CoherenceEngine::setCueLevel(float level)
{
    cueLevel = sanitiseUnit(level);

    if (sessionActive)
        mixer.scheduleRamp(Layer::Cue, cueLevel, tuning::Cues::kLayerFadeSeconds, audioNow());
}

//==============================================================================
bool CoherenceEngine::startEntrainment()
{
    if (! sessionActive || ! mixer.hasLayerSource(Layer::Entrainment))
    {
        juce::Logger::writeToLog("CoherenceEngine: entrainment unavailable");
        return false;
    }

    if (entrainmentPlaying)
        return true;

    const double current = audioNow();
    mixer.setGain(Layer::Entrainment, kFloor, current);
    mixer.scheduleRamp(Layer::Entrainment, entrainmentVolume + kFloor, tuning::Entrainment::kFadeInSeconds,
                       current, dsp::RampShape::Exponential);

    entrainmentPlaying = true;
    return true;
}

void CoherenceEngine::stopEntrainment()
{
    if (! entrainmentPlaying)
        return;

    entrainmentPlaying = false;

    if (sessionActive)
        mixer.scheduleRamp(Layer::Entrainment, kFloor, tuning::Entrainment::kFadeOutSeconds,
                           audioNow(), dsp::RampShape::Exponential);
}

void CoherenceEngine::setEntrainmentVolume(float volume)
{
    entrainmentVolume = sanitiseUnit(volume);

    if (entrainmentPlaying && sessionActive)
        mixer.scheduleRamp(Layer::Entrainment, juce::jmax(kFloor, entrainmentVolume),
                           tuning::Entrainment::kVolumeChangeSeconds, audioNow());
}

} // namespace stillpoint::engine
