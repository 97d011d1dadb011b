#include "LayerMixer.h"
#include "../CoherenceTuning.h"

#include <algorithm>
#include <cmath>

namespace stillpoint::dsp
{

namespace
{
    constexpr std::array<const char*, kNumLayers> kLayerNames {
        "baseline", "coherence", "shimmer", "sustained", "entrainment", "cue"
    };

    constexpr std::array<Layer, 5> kLoopLayers {
        Layer::Baseline, Layer::Coherence, Layer::Shimmer, Layer::Sustained, Layer::Entrainment
    };

    inline float lerp(float a, float b, float frac) noexcept
    {
        return a + (b - a) * frac;
    }
}

const char* getLayerName(Layer layer) noexcept
{
    return kLayerNames[static_cast<std::size_t>(layer)];
}

LayerMixer::LayerMixer(const core::AudioClock& clockToUse)
    : clock(clockToUse)
{
    voices.reserve(static_cast<std::size_t>(tuning::Voices::kMaxVoices));
}

void LayerMixer::prepare(const juce::dsp::ProcessSpec& spec)
{
    if (spec.sampleRate <= 0.0 || spec.maximumBlockSize == 0)
    {
        jassertfalse;
        return;
    }

    const juce::ScopedLock sl(lock);

    sampleRate = spec.sampleRate;
    maxBlockSize = static_cast<int>(spec.maximumBlockSize);
    numOutputChannels = juce::jlimit(1, 2, static_cast<int>(spec.numChannels));

    for (auto& scratch : layerScratch)
        scratch.setSize(numOutputChannels, maxBlockSize, false, true, false);

    bonusBus.setSize(numOutputChannels, maxBlockSize, false, true, false);
    gainCurve.assign(static_cast<std::size_t>(maxBlockSize), 0.0f);

    const juce::dsp::ProcessSpec busSpec { sampleRate,
                                           static_cast<juce::uint32>(maxBlockSize),
                                           static_cast<juce::uint32>(numOutputChannels) };

    bonusLimiter.setThreshold(tuning::BonusBus::kLimiterThresholdDb);
    bonusLimiter.setRatio(tuning::BonusBus::kLimiterRatio);
    bonusLimiter.setAttack(tuning::BonusBus::kLimiterAttackMs);
    bonusLimiter.setRelease(tuning::BonusBus::kLimiterReleaseMs);
    bonusLimiter.prepare(busSpec);

    toneStage.prepare(busSpec);
    fog.prepare(busSpec);
}

void LayerMixer::reset()
{
    const juce::ScopedLock sl(lock);

    voices.clear();

    for (auto& gain : layerGains)
        gain.setValueAt(0.0f, 0.0);

    masterGain.setValueAt(1.0f, 0.0);

    bonusLimiter.reset();
    toneStage.reset();
    fog.reset();
    lastOutputPeak = 0.0f;
}

//==============================================================================
void LayerMixer::setLayerSource(Layer layer, AudioAssetPtr asset)
{
    const juce::ScopedLock sl(lock);
    layerSources[indexOf(layer)] = std::move(asset);
}

bool LayerMixer::hasLayerSource(Layer layer) const
{
    const juce::ScopedLock sl(lock);
    return layerSources[indexOf(layer)] != nullptr;
}

juce::uint32 LayerMixer::beginGeneration()
{
    const juce::ScopedLock sl(lock);
    return ++generation;
}

juce::uint32 LayerMixer::getCurrentGeneration() const
{
    const juce::ScopedLock sl(lock);
    return generation;
}

juce::int64 LayerMixer::toSamples(double time) const noexcept
{
    return static_cast<juce::int64>(std::llround(time * sampleRate));
}

void LayerMixer::addVoice(Voice voice)
{
    if (static_cast<int>(voices.size()) >= tuning::Voices::kMaxVoices)
    {
        DBG("LayerMixer: voice limit reached, dropping " << getLayerName(voice.layer) << " voice");
        return;
    }

    voices.push_back(std::move(voice));
}

int LayerMixer::startLoops(double startTime)
{
    const juce::ScopedLock sl(lock);

    int started = 0;
    const auto startSample = toSamples(startTime);

    for (const auto layer : kLoopLayers)
    {
        const auto& asset = layerSources[indexOf(layer)];
        if (asset == nullptr || asset->buffer.getNumSamples() == 0)
            continue;

        Voice voice;
        voice.layer = layer;
        voice.asset = asset;
        voice.startSample = startSample;
        voice.increment = asset->sampleRate / sampleRate;
        voice.generation = generation;
        voice.looping = true;

        addVoice(std::move(voice));
        ++started;
    }

    return started;
}

bool LayerMixer::playOneShot(Layer layer, AudioAssetPtr asset, double startTime)
{
    if (asset == nullptr || asset->buffer.getNumSamples() == 0)
        return false;

    const juce::ScopedLock sl(lock);

    const auto before = voices.size();

    Voice voice;
    voice.layer = layer;
    voice.asset = std::move(asset);
    voice.startSample = toSamples(startTime);
    voice.increment = voice.asset->sampleRate / sampleRate;
    voice.generation = generation;
    voice.looping = false;

    addVoice(std::move(voice));
    return voices.size() > before;
}

void LayerMixer::releaseGeneration(juce::uint32 generationToRelease)
{
    const juce::ScopedLock sl(lock);

    voices.erase(std::remove_if(voices.begin(), voices.end(),
                                [generationToRelease](const Voice& v) { return v.generation == generationToRelease; }),
                 voices.end());
}

int LayerMixer::getNumActiveVoices() const
{
    const juce::ScopedLock sl(lock);
    return static_cast<int>(voices.size());
}

int LayerMixer::getNumActiveVoices(Layer layer) const
{
    const juce::ScopedLock sl(lock);
    return static_cast<int>(std::count_if(voices.begin(), voices.end(),
                                          [layer](const Voice& v) { return v.layer == layer; }));
}

//==============================================================================
void LayerMixer::scheduleRamp(Layer layer, float targetGain, double durationSeconds, double now, RampShape shape)
{
    const juce::ScopedLock sl(lock);
    layerGains[indexOf(layer)].rampTo(targetGain, now, durationSeconds, shape);
}

void LayerMixer::rampLayerFrom(Layer layer, float startGain, double startTime, float targetGain, double durationSeconds)
{
    const juce::ScopedLock sl(lock);
    layerGains[indexOf(layer)].rampFrom(startGain, startTime, targetGain, durationSeconds);
}

void LayerMixer::setGain(Layer layer, float gain, double time)
{
    const juce::ScopedLock sl(lock);
    layerGains[indexOf(layer)].setValueAt(gain, time);
}

float LayerMixer::getGain(Layer layer, double time) const
{
    const juce::ScopedLock sl(lock);
    return layerGains[indexOf(layer)].getValueAt(time);
}

float LayerMixer::getTargetGain(Layer layer) const
{
    const juce::ScopedLock sl(lock);
    return layerGains[indexOf(layer)].getTargetValue();
}

bool LayerMixer::isRamping(Layer layer, double now) const
{
    const juce::ScopedLock sl(lock);
    return layerGains[indexOf(layer)].isRamping(now);
}

GainLayerSnapshot LayerMixer::getLayerSnapshot(Layer layer, double time) const
{
    const juce::ScopedLock sl(lock);
    const auto& automation = layerGains[indexOf(layer)];

    GainLayerSnapshot snapshot;
    snapshot.name = getLayerName(layer);
    snapshot.currentGain = automation.getValueAt(time);
    snapshot.targetGain = automation.getTargetValue();
    snapshot.rampDeadline = automation.getRampEndTime();
    return snapshot;
}

void LayerMixer::scheduleMasterRamp(float targetGain, double durationSeconds, double now)
{
    const juce::ScopedLock sl(lock);
    masterGain.rampTo(targetGain, now, durationSeconds);
}

void LayerMixer::setMasterGain(float gain, double time)
{
    const juce::ScopedLock sl(lock);
    masterGain.setValueAt(gain, time);
}

float LayerMixer::getMasterGain(double time) const
{
    const juce::ScopedLock sl(lock);
    return masterGain.getValueAt(time);
}

double LayerMixer::getMasterRampEndTime() const
{
    const juce::ScopedLock sl(lock);
    return masterGain.getRampEndTime();
}

void LayerMixer::scheduleFogRamp(float sendTarget, float wetTarget, double durationSeconds, double now)
{
    const juce::ScopedLock sl(lock);
    fog.scheduleRamp(sendTarget, wetTarget, durationSeconds, now);
}

float LayerMixer::getFogWet(double time) const
{
    const juce::ScopedLock sl(lock);
    return fog.getWetAt(time);
}

void LayerMixer::setToneTargets(const ToneTargets& targets)
{
    const juce::ScopedLock sl(lock);
    toneStage.setTargets(targets);
}

ToneTargets LayerMixer::getToneTargets() const
{
    const juce::ScopedLock sl(lock);
    return toneStage.getCurrentTargets();
}

void LayerMixer::setHeartbeat(const HeartbeatPulse& pulse)
{
    const juce::ScopedLock sl(lock);
    toneStage.setHeartbeat(pulse);
}

float LayerMixer::getLowPassHz(double time) const
{
    const juce::ScopedLock sl(lock);
    return toneStage.getCurrentTargets().lowPassHz - toneStage.getHeartbeatDipHz(time);
}

float LayerMixer::getAppliedLowPassHz() const
{
    const juce::ScopedLock sl(lock);
    return toneStage.getAppliedLowPassHz();
}

//==============================================================================
bool LayerMixer::isBonusLayer(Layer layer) noexcept
{
    return layer == Layer::Shimmer || layer == Layer::Sustained;
}

void LayerMixer::render(juce::AudioBuffer<float>& output, double blockStartTime)
{
    const juce::ScopedLock sl(lock);
    juce::ScopedNoDenormals noDenormals;

    output.clear();

    const int totalSamples = output.getNumSamples();
    if (totalSamples == 0 || gainCurve.empty())
        return;

    int done = 0;
    while (done < totalSamples)
    {
        const int chunk = std::min(maxBlockSize, totalSamples - done);
        renderChunk(output, done, chunk, blockStartTime + static_cast<double>(done) / sampleRate);
        done += chunk;
    }

    voices.erase(std::remove_if(voices.begin(), voices.end(),
                                [](const Voice& v) { return v.finished; }),
                 voices.end());

    lastOutputPeak = output.getMagnitude(0, totalSamples);
}

void LayerMixer::renderChunk(juce::AudioBuffer<float>& output, int startSample, int numSamples, double chunkStartTime)
{
    const auto chunkStartSample = toSamples(chunkStartTime);
    const double secondsPerSample = 1.0 / sampleRate;
    const int outChannels = output.getNumChannels();

    for (auto& scratch : layerScratch)
        scratch.clear(0, numSamples);

    bonusBus.clear(0, numSamples);

    for (auto& voice : voices)
        renderVoice(voice, layerScratch[indexOf(voice.layer)], numSamples, chunkStartSample);

    // Apply per-layer gain curves and sum into the main or bonus bus.
    for (std::size_t i = 0; i < kNumLayers; ++i)
    {
        for (int k = 0; k < numSamples; ++k)
            gainCurve[static_cast<std::size_t>(k)] = layerGains[i].getValueAt(chunkStartTime + k * secondsPerSample);

        const auto& scratch = layerScratch[i];
        const bool toBonus = isBonusLayer(static_cast<Layer>(i));

        const int destChannels = toBonus ? numOutputChannels : outChannels;
        for (int ch = 0; ch < destChannels; ++ch)
        {
            const float* src = scratch.getReadPointer(std::min(ch, numOutputChannels - 1));
            float* dest = toBonus ? bonusBus.getWritePointer(ch)
                                  : output.getWritePointer(ch, startSample);

            for (int k = 0; k < numSamples; ++k)
                dest[k] += src[k] * gainCurve[static_cast<std::size_t>(k)];
        }
    }

    // Bonus layers share one limiter so stacked shimmer + sustained stay polite.
    {
        auto block = juce::dsp::AudioBlock<float>(bonusBus).getSubBlock(0, static_cast<std::size_t>(numSamples));
        juce::dsp::ProcessContextReplacing<float> context(block);
        bonusLimiter.process(context);
    }

    for (int ch = 0; ch < outChannels; ++ch)
        output.addFrom(ch, startSample, bonusBus, std::min(ch, numOutputChannels - 1), 0, numSamples);

    for (int k = 0; k < numSamples; ++k)
        gainCurve[static_cast<std::size_t>(k)] = masterGain.getValueAt(chunkStartTime + k * secondsPerSample);

    for (int ch = 0; ch < outChannels; ++ch)
    {
        float* data = output.getWritePointer(ch, startSample);
        for (int k = 0; k < numSamples; ++k)
            data[k] *= gainCurve[static_cast<std::size_t>(k)];
    }

    toneStage.process(output, startSample, numSamples, chunkStartTime);
    fog.process(output, startSample, numSamples, chunkStartTime);
}

void LayerMixer::renderVoice(Voice& voice, juce::AudioBuffer<float>& destination, int numSamples,
                             juce::int64 chunkStartSample)
{
    if (voice.finished || voice.asset == nullptr)
        return;

    const auto& source = voice.asset->buffer;
    const int length = source.getNumSamples();
    const int sourceChannels = source.getNumChannels();

    if (length == 0 || sourceChannels == 0)
    {
        voice.finished = true;
        return;
    }

    // Voices scheduled in the future stay silent until their start sample.
    const auto offset = voice.startSample - chunkStartSample;
    if (offset >= numSamples)
        return;

    const int firstSample = static_cast<int>(std::max<juce::int64>(0, offset));
    const int destChannels = destination.getNumChannels();
    const auto dLength = static_cast<double>(length);

    for (int k = firstSample; k < numSamples; ++k)
    {
        if (voice.position >= dLength)
        {
            if (! voice.looping)
            {
                voice.finished = true;
                return;
            }

            voice.position = std::fmod(voice.position, dLength);
        }

        const int index = static_cast<int>(voice.position);
        const float frac = static_cast<float>(voice.position - index);
        int next = index + 1;
        if (next >= length)
            next = voice.looping ? 0 : index;

        for (int ch = 0; ch < destChannels; ++ch)
        {
            const float* src = source.getReadPointer(std::min(ch, sourceChannels - 1));
            destination.addSample(ch, k, lerp(src[index], src[next], frac));
        }

        voice.position += voice.increment;
    }

    if (! voice.looping && voice.position >= dLength)
        voice.finished = true;
}

//==============================================================================
MixerMeterState LayerMixer::getMeterState(double time) const
{
    const juce::ScopedLock sl(lock);

    MixerMeterState state;
    for (std::size_t i = 0; i < kNumLayers; ++i)
        state.layerGains[i] = layerGains[i].getValueAt(time);

    state.masterGain = masterGain.getValueAt(time);
    state.fogWet = fog.getWetAt(time);
    state.outputPeak = lastOutputPeak;
    state.activeVoices = static_cast<int>(voices.size());
    return state;
}

} // namespace stillpoint::dsp
