#include "AssetLibrary.h"

namespace stillpoint::engine
{

namespace
{
    constexpr std::array<const char*, kNumAssets> kAssetNames {
        "baseline", "coherence", "shimmer", "sustained", "entrainment", "cue_1", "cue_2", "cue_3"
    };

    constexpr std::array<const char*, 5> kExtensions { ".wav", ".flac", ".ogg", ".mp3", ".aiff" };

    std::size_t indexOf(AssetId id) noexcept { return static_cast<std::size_t>(id); }
}

const char* getAssetName(AssetId id) noexcept
{
    return kAssetNames[indexOf(id)];
}

bool isRequiredAsset(AssetId id) noexcept
{
    return id == AssetId::Baseline || id == AssetId::Coherence;
}

AssetId cueAssetForSlot(int slot) noexcept
{
    jassert(slot >= 0 && slot < 3);
    return static_cast<AssetId>(static_cast<int>(AssetId::Cue1) + juce::jlimit(0, 2, slot));
}

//==============================================================================
FileAssetLoader::FileAssetLoader(const juce::File& assetDirectory, juce::int64 maxSamplesToLoad)
    : directory(assetDirectory),
      maxSamples(juce::jlimit<juce::int64>(1, std::numeric_limits<int>::max(), maxSamplesToLoad))
{
    formatManager.registerBasicFormats();
}

juce::File FileAssetLoader::findFile(const juce::String& name) const
{
    for (const auto* extension : kExtensions)
    {
        const auto candidate = directory.getChildFile(name + extension);
        if (candidate.existsAsFile())
            return candidate;
    }

    return {};
}

dsp::AudioAssetPtr FileAssetLoader::load(const juce::String& name)
{
    const auto file = findFile(name);

    if (file == juce::File())
    {
        juce::Logger::writeToLog("FileAssetLoader: no audio file for '" + name + "' in "
                                 + directory.getFullPathName());
        return nullptr;
    }

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(file));

    if (reader == nullptr)
    {
        juce::Logger::writeToLog("FileAssetLoader: cannot decode " + file.getFullPathName());
        return nullptr;
    }

    const juce::int64 length = reader->lengthInSamples;
    const auto numChannels = static_cast<int>(juce::jlimit(1u, 2u, reader->numChannels));

    if (length <= 0)
    {
        juce::Logger::writeToLog("FileAssetLoader: empty file " + file.getFullPathName());
        return nullptr;
    }

    if (length > maxSamples)
    {
        juce::Logger::writeToLog("FileAssetLoader: " + file.getFullPathName() + " is too long ("
                                 + juce::String(length) + " samples, limit " + juce::String(maxSamples) + ")");
        return nullptr;
    }

    const auto numSamples = static_cast<int>(length);

    auto asset = std::make_shared<dsp::AudioAsset>();
    asset->sampleRate = reader->sampleRate;
    asset->buffer.setSize(numChannels, numSamples);

    if (! reader->read(&asset->buffer, 0, numSamples, 0, true, numChannels > 1))
    {
        juce::Logger::writeToLog("FileAssetLoader: read failed for " + file.getFullPathName());
        return nullptr;
    }

    return asset;
}

//==============================================================================
AssetLibrary::AssetLibrary(AssetLoader& assetLoader, int numThreads)
    : loader(assetLoader),
      pool(juce::jmax(1, numThreads))
{
}

AssetLibrary::~AssetLibrary()
{
    pool.removeAllJobs(true, 10000);
}

std::shared_future<bool> AssetLibrary::loadAll()
{
    const juce::ScopedLock sl(lock);

    if (status == Status::Loading || status == Status::Ready)
        return inFlight;

    status = Status::Loading;
    pendingResult = std::make_shared<std::promise<bool>>();
    inFlight = pendingResult->get_future().share();
    remainingLoads = static_cast<int>(kNumAssets);

    for (std::size_t i = 0; i < kNumAssets; ++i)
    {
        const auto id = static_cast<AssetId>(i);

        pool.addJob([this, id]
        {
            auto asset = loader.load(getAssetName(id));

            bool last = false;
            {
                const juce::ScopedLock jobLock(lock);
                assets[indexOf(id)] = std::move(asset);
                last = --remainingLoads == 0;
            }

            if (last)
                finishLoad();
        });
    }

    return inFlight;
}

void AssetLibrary::finishLoad()
{
    std::shared_ptr<std::promise<bool>> result;
    bool ok = true;

    {
        const juce::ScopedLock sl(lock);

        for (std::size_t i = 0; i < kNumAssets; ++i)
        {
            const auto id = static_cast<AssetId>(i);
            if (assets[i] != nullptr)
                continue;

            if (isRequiredAsset(id))
            {
                juce::Logger::writeToLog(juce::String("AssetLibrary: required asset missing: ") + getAssetName(id));
                ok = false;
            }
            else
            {
                juce::Logger::writeToLog(juce::String("AssetLibrary: optional asset missing, layer disabled: ")
                                         + getAssetName(id));
            }
        }

        status = ok ? Status::Ready : Status::Failed;
        result = std::move(pendingResult);
    }

    juce::Logger::writeToLog(ok ? "AssetLibrary: assets ready" : "AssetLibrary: load failed, retry allowed");

    if (result != nullptr)
        result->set_value(ok);
}

AssetLibrary::Status AssetLibrary::getStatus() const
{
    const juce::ScopedLock sl(lock);
    return status;
}

dsp::AudioAssetPtr AssetLibrary::get(AssetId id) const
{
    const juce::ScopedLock sl(lock);
    return assets[indexOf(id)];
}

bool AssetLibrary::reloadAsync(AssetId id)
{
    const juce::ScopedLock sl(lock);

    if (reloading[indexOf(id)])
        return false;

    reloading[indexOf(id)] = true;

    pool.addJob([this, id]
    {
        auto asset = loader.load(getAssetName(id));
        const bool loaded = asset != nullptr;

        {
            const juce::ScopedLock jobLock(lock);
            if (loaded)
                assets[indexOf(id)] = std::move(asset);

            reloading[indexOf(id)] = false;
        }

        DBG("AssetLibrary: reload of " << getAssetName(id) << (loaded ? " succeeded" : " failed"));
    });

    return true;
}

bool AssetLibrary::isReloading(AssetId id) const
{
    const juce::ScopedLock sl(lock);
    return reloading[indexOf(id)];
}

} // namespace stillpoint::engine
