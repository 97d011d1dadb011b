#pragma once

#include <array>
#include <future>
#include <limits>

#include <juce_audio_formats/juce_audio_formats.h>
#include "../DSP/LayerMixer.h"
#include "../CoherenceTuning.h"

namespace stillpoint::engine
{

enum class AssetId
{
    Baseline = 0,
    Coherence,
    Shimmer,
    Sustained,
    Entrainment,
    Cue1,
    Cue2,
    Cue3
};

inline constexpr std::size_t kNumAssets = 8;

const char* getAssetName(AssetId id) noexcept;

/** Baseline and coherence are required; everything else degrades one layer. */
bool isRequiredAsset(AssetId id) noexcept;

/** Cue slot index (0..2) to asset id. */
AssetId cueAssetForSlot(int slot) noexcept;

/**
 * AssetLoader: resolves an asset name to decoded audio.
 * Returns nullptr when the asset is missing or undecodable.
 * Must be callable from several pool threads at once.
 */
class AssetLoader
{
public:
    virtual ~AssetLoader() = default;

    virtual dsp::AudioAssetPtr load(const juce::String& name) = 0;
};

/**
 * FileAssetLoader: looks for <directory>/<name>.<ext> for each format the
 * AudioFormatManager knows (wav, flac, ogg, mp3, aiff) and decodes the
 * first match completely into memory. Files longer than maxSamples are
 * rejected rather than truncated.
 */
class FileAssetLoader final : public AssetLoader
{
public:
    explicit FileAssetLoader(const juce::File& directory,
                             juce::int64 maxSamples = tuning::Assets::kMaxSamples);

    dsp::AudioAssetPtr load(const juce::String& name) override;

    const juce::File& getDirectory() const noexcept { return directory; }

private:
    juce::File findFile(const juce::String& name) const;

    juce::File directory;
    juce::int64 maxSamples;
    juce::AudioFormatManager formatManager;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FileAssetLoader)
};

/**
 * AssetLibrary: owns every decoded asset and the single-flight load.
 *
 *   Uninitialised ──loadAll()──► Loading ──► Ready
 *                                   │
 *                                   └──────► Failed ──loadAll()──► Loading ...
 *
 * All assets are fetched in parallel on a thread pool. Concurrent loadAll()
 * callers share one std::shared_future. The load only fails when a
 * required asset is missing; missing optional assets are logged.
 */
class AssetLibrary
{
public:
    enum class Status
    {
        Uninitialised,
        Loading,
        Ready,
        Failed
    };

    explicit AssetLibrary(AssetLoader& loader, int numThreads = 4);
    ~AssetLibrary();

    /** Start (or join) the load. The future yields true when Ready. */
    std::shared_future<bool> loadAll();

    Status getStatus() const;

    dsp::AudioAssetPtr get(AssetId id) const;
    bool has(AssetId id) const { return get(id) != nullptr; }

    /**
     * Reload one asset in the background. Returns false if a reload of
     * that asset is already in flight.
     */
    bool reloadAsync(AssetId id);
    bool isReloading(AssetId id) const;

private:
    void finishLoad();

    AssetLoader& loader;

    mutable juce::CriticalSection lock;
    Status status = Status::Uninitialised;
    std::shared_future<bool> inFlight;
    std::shared_ptr<std::promise<bool>> pendingResult;
    int remainingLoads = 0;

    std::array<dsp::AudioAssetPtr, kNumAssets> assets;
    std::array<bool, kNumAssets> reloading {};

    // Declared last: destroyed first, so no job outlives the state it writes.
    juce::ThreadPool pool;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetLibrary)
};

} // namespace stillpoint::engine
