#pragma once

#include <array>
#include <memory>
#include <vector>

#include <juce_dsp/juce_dsp.h>
#include "AudioClock.h"
#include "GainAutomation.h"
#include "FogReverb.h"
#include "ToneStage.h"

namespace stillpoint::dsp
{

/** Named gain layers owned by the mixer. */
enum class Layer
{
    Baseline = 0,
    Coherence,
    Shimmer,
    Sustained,
    Entrainment,
    Cue
};

inline constexpr std::size_t kNumLayers = 6;

const char* getLayerName(Layer layer) noexcept;

/** A decoded sample buffer plus the rate it was recorded at. */
struct AudioAsset
{
    juce::AudioBuffer<float> buffer;
    double sampleRate = 48000.0;
};

using AudioAssetPtr = std::shared_ptr<const AudioAsset>;

/** Read-only view of a layer's automation at a given time. */
struct GainLayerSnapshot
{
    const char* name = "";
    float currentGain = 0.0f;
    float targetGain = 0.0f;
    double rampDeadline = 0.0;
};

/** Trivially copyable meter snapshot handed to collaborators via StateQueue. */
struct MixerMeterState
{
    std::array<float, kNumLayers> layerGains {};
    float masterGain = 0.0f;
    float fogWet = 0.0f;
    float outputPeak = 0.0f;
    int activeVoices = 0;
};

/**
 * LayerMixer: owns the master bus, the six gain layers, every playing
 * voice, and the fog/tone stages on the master.
 *
 * Control-thread API (scheduleRamp, startLoops, playOneShot ...) and the
 * audio-thread render() share one lock, the same way juce::Synthesiser
 * guards its voice list. Nothing else in the engine touches audio state.
 *
 * Gain changes are always scheduled against the AudioClock, never applied
 * instantly, and always start from the layer's current value.
 */
class LayerMixer
{
public:
    explicit LayerMixer(const core::AudioClock& clock);

    void prepare(const juce::dsp::ProcessSpec& spec);
    void reset();

    //==========================================================================
    // Sources
    void setLayerSource(Layer layer, AudioAssetPtr asset);
    bool hasLayerSource(Layer layer) const;

    /** Begin a new session generation. Voices started afterwards belong to it. */
    juce::uint32 beginGeneration();
    juce::uint32 getCurrentGeneration() const;

    /**
     * Start a looping voice for every loop layer that has a source, all at
     * the same startTime so the loops stay sample-aligned.
     * @return number of loops started
     */
    int startLoops(double startTime);

    /** Start a fresh one-shot voice on layer. It disposes itself when done. */
    bool playOneShot(Layer layer, AudioAssetPtr asset, double startTime);

    /** Remove every voice of the given generation. */
    void releaseGeneration(juce::uint32 generation);

    int getNumActiveVoices() const;
    int getNumActiveVoices(Layer layer) const;

    //==========================================================================
    // Automation
    void scheduleRamp(Layer layer, float targetGain, double durationSeconds, double now,
                      RampShape shape = RampShape::Linear);
    void rampLayerFrom(Layer layer, float startGain, double startTime, float targetGain,
                       double durationSeconds);
    void setGain(Layer layer, float gain, double time);

    float getGain(Layer layer, double time) const;
    float getTargetGain(Layer layer) const;
    bool isRamping(Layer layer, double now) const;
    GainLayerSnapshot getLayerSnapshot(Layer layer, double time) const;

    void scheduleMasterRamp(float targetGain, double durationSeconds, double now);
    void setMasterGain(float gain, double time);
    float getMasterGain(double time) const;
    double getMasterRampEndTime() const;

    void scheduleFogRamp(float sendTarget, float wetTarget, double durationSeconds, double now);
    float getFogWet(double time) const;

    void setToneTargets(const ToneTargets& targets);
    ToneTargets getToneTargets() const;

    void setHeartbeat(const HeartbeatPulse& pulse);
    /** Low-pass target including the heartbeat dip at the given time. */
    float getLowPassHz(double time) const;
    float getAppliedLowPassHz() const;

    //==========================================================================
    /** Render one block. blockStartTime is the clock time of sample 0. */
    void render(juce::AudioBuffer<float>& output, double blockStartTime);

    MixerMeterState getMeterState(double time) const;

    const core::AudioClock& getClock() const noexcept { return clock; }

private:
    struct Voice
    {
        Layer layer = Layer::Baseline;
        AudioAssetPtr asset;
        juce::int64 startSample = 0;
        double position = 0.0;
        double increment = 1.0;
        juce::uint32 generation = 0;
        bool looping = false;
        bool finished = false;
    };

    static bool isBonusLayer(Layer layer) noexcept;
    static std::size_t indexOf(Layer layer) noexcept { return static_cast<std::size_t>(layer); }

    juce::int64 toSamples(double time) const noexcept;
    void addVoice(Voice voice);
    void renderChunk(juce::AudioBuffer<float>& output, int startSample, int numSamples, double chunkStartTime);
    void renderVoice(Voice& voice, juce::AudioBuffer<float>& destination, int numSamples,
                     juce::int64 chunkStartSample);

    const core::AudioClock& clock;

    mutable juce::CriticalSection lock;

    double sampleRate = 48000.0;
    int maxBlockSize = 512;
    int numOutputChannels = 2;

    std::array<GainAutomation, kNumLayers> layerGains;
    std::array<AudioAssetPtr, kNumLayers> layerSources;
    GainAutomation masterGain { 1.0f };

    std::vector<Voice> voices;
    juce::uint32 generation = 0;

    // Scratch: one buffer per layer, a bonus bus, and the gain curve.
    std::array<juce::AudioBuffer<float>, kNumLayers> layerScratch;
    juce::AudioBuffer<float> bonusBus;
    std::vector<float> gainCurve;

    juce::dsp::Compressor<float> bonusLimiter;
    ToneStage toneStage;
    FogReverb fog;

    float lastOutputPeak = 0.0f;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LayerMixer)
};

} // namespace stillpoint::dsp
