#include "CuePlayer.h"

namespace stillpoint::engine
{

CuePlayer::CuePlayer(dsp::LayerMixer& mixerToUse, AssetLibrary& assetsToUse, juce::int64 minInterval)
    : mixer(mixerToUse),
      assets(assetsToUse),
      minIntervalMs(juce::jmax<juce::int64>(0, minInterval))
{
}

CuePlayer::TriggerResult CuePlayer::trigger(juce::int64 now)
{
    if (lastTriggerMs.has_value() && now - *lastTriggerMs < minIntervalMs)
        return TriggerResult::Rejected;

    lastTriggerMs = now;
    ++numAccepted;

    const int slot = nextIndex;
    nextIndex = (nextIndex + 1) % tuning::Cues::kNumSlots;

    const auto id = cueAssetForSlot(slot);
    auto buffer = assets.get(id);

    if (buffer == nullptr)
    {
        if (assets.reloadAsync(id))
            DBG("CuePlayer: slot " << slot << " missing, reload requested");
        else
            DBG("CuePlayer: slot " << slot << " missing, reload already in flight");

        return TriggerResult::Missing;
    }

    const double startTime = mixer.getClock().getCurrentTime();

    if (! mixer.playOneShot(dsp::Layer::Cue, std::move(buffer), startTime))
    {
        DBG("CuePlayer: voice limit reached, slot " << slot << " not played");
        return TriggerResult::Dropped;
    }

    return TriggerResult::Played;
}

void CuePlayer::reset() noexcept
{
    nextIndex = 0;
    lastTriggerMs.reset();
    numAccepted = 0;
}

} // namespace stillpoint::engine
