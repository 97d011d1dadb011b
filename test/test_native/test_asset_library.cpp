/**
 * @file test_asset_library.cpp
 * @brief Unit tests for single-flight asset loading and file decoding
 */

#include <unity.h>
#include <memory>

#include "Engine/AssetLibrary.h"
#include "mocks/MemoryAssetLoader.h"

using namespace stillpoint;
using namespace stillpoint::engine;
using stillpoint::test::MemoryAssetLoader;

//==============================================================================
// Single-Flight Tests
//==============================================================================

void test_assets_concurrent_load_is_single_flight() {
    MemoryAssetLoader loader;
    loader.addAll();

    juce::WaitableEvent gate(true);
    loader.setGate(&gate);

    AssetLibrary library(loader);

    auto first = library.loadAll();
    auto second = library.loadAll();

    TEST_ASSERT_TRUE(library.getStatus() == AssetLibrary::Status::Loading);

    gate.signal();

    TEST_ASSERT_TRUE(first.get());
    TEST_ASSERT_TRUE(second.get());
    TEST_ASSERT_TRUE(library.getStatus() == AssetLibrary::Status::Ready);

    TEST_ASSERT_TRUE(library.loadAll().get());
    TEST_ASSERT_EQUAL_INT_MESSAGE(1, loader.getLoadCount("baseline"), "Each asset is fetched once");
    TEST_ASSERT_EQUAL_INT(1, loader.getLoadCount("cue_3"));

    loader.setGate(nullptr);
}

void test_assets_failed_load_can_retry() {
    MemoryAssetLoader loader;
    loader.addAll();
    loader.remove("coherence");

    AssetLibrary library(loader);

    TEST_ASSERT_FALSE(library.loadAll().get());
    TEST_ASSERT_TRUE(library.getStatus() == AssetLibrary::Status::Failed);
    TEST_ASSERT_FALSE(library.has(AssetId::Coherence));

    loader.add("coherence", test::makeConstantAsset(0.25f, 4800));

    TEST_ASSERT_TRUE(library.loadAll().get());
    TEST_ASSERT_TRUE(library.getStatus() == AssetLibrary::Status::Ready);
    TEST_ASSERT_EQUAL_INT(2, loader.getLoadCount("baseline"));
}

void test_assets_optional_missing_still_ready() {
    MemoryAssetLoader loader;
    loader.add("baseline", test::makeConstantAsset(0.25f, 4800));
    loader.add("coherence", test::makeConstantAsset(0.25f, 4800));

    AssetLibrary library(loader);

    TEST_ASSERT_TRUE(library.loadAll().get());
    TEST_ASSERT_TRUE(library.has(AssetId::Baseline));
    TEST_ASSERT_FALSE(library.has(AssetId::Shimmer));
    TEST_ASSERT_FALSE(library.has(AssetId::Cue2));
}

void test_assets_reload_is_single_flight_per_asset() {
    MemoryAssetLoader loader;

    juce::WaitableEvent gate(true);
    loader.setGate(&gate);

    AssetLibrary library(loader);

    TEST_ASSERT_TRUE(library.reloadAsync(AssetId::Cue2));
    TEST_ASSERT_FALSE(library.reloadAsync(AssetId::Cue2));
    TEST_ASSERT_TRUE(library.isReloading(AssetId::Cue2));

    gate.signal();

    for (int i = 0; i < 200 && library.isReloading(AssetId::Cue2); ++i)
        juce::Thread::sleep(10);

    TEST_ASSERT_FALSE(library.isReloading(AssetId::Cue2));
    TEST_ASSERT_EQUAL_INT(1, loader.getLoadCount("cue_2"));

    loader.setGate(nullptr);
}

void test_asset_names_and_requirements() {
    TEST_ASSERT_EQUAL_STRING("baseline", getAssetName(AssetId::Baseline));
    TEST_ASSERT_EQUAL_STRING("cue_3", getAssetName(AssetId::Cue3));
    TEST_ASSERT_TRUE(isRequiredAsset(AssetId::Coherence));
    TEST_ASSERT_FALSE(isRequiredAsset(AssetId::Entrainment));
    TEST_ASSERT_TRUE(cueAssetForSlot(1) == AssetId::Cue2);
}

//==============================================================================
// File Loader Tests
//==============================================================================

namespace
{

juce::File makeAssetDirectory()
{
    const auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory)
                         .getChildFile("stillpoint_asset_test");
    TEST_ASSERT_TRUE(dir.createDirectory().wasOk());
    return dir;
}

/** Writes a 16-bit mono WAV holding numSamples of 0.25. */
void writeConstantWav(const juce::File& file, int numSamples)
{
    file.deleteFile();

    juce::AudioBuffer<float> source(1, numSamples);
    for (int i = 0; i < source.getNumSamples(); ++i)
        source.setSample(0, i, 0.25f);

    juce::WavAudioFormat wav;
    auto stream = std::make_unique<juce::FileOutputStream>(file);
    TEST_ASSERT_TRUE(stream->openedOk());

    std::unique_ptr<juce::AudioFormatWriter> writer(
        wav.createWriterFor(stream.get(), 44100.0, 1, 16, {}, 0));
    TEST_ASSERT_NOT_NULL(writer.get());
    stream.release();

    TEST_ASSERT_TRUE(writer->writeFromAudioSampleBuffer(source, 0, source.getNumSamples()));
}

} // namespace

void test_file_loader_decodes_wav() {
    const auto dir = makeAssetDirectory();
    writeConstantWav(dir.getChildFile("baseline.wav"), 4800);

    engine::FileAssetLoader loader(dir);

    const auto asset = loader.load("baseline");
    TEST_ASSERT_NOT_NULL(asset.get());
    TEST_ASSERT_EQUAL_INT(4800, asset->buffer.getNumSamples());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 44100.0f, static_cast<float>(asset->sampleRate));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.25f, asset->buffer.getSample(0, 100));

    TEST_ASSERT_NULL(loader.load("coherence").get());

    dir.deleteRecursively();
}

void test_file_loader_rejects_overlong_file() {
    const auto dir = makeAssetDirectory();
    writeConstantWav(dir.getChildFile("baseline.wav"), 4800);

    engine::FileAssetLoader shortLimit(dir, 1000);
    TEST_ASSERT_NULL_MESSAGE(shortLimit.load("baseline").get(), "Longer than the limit is rejected, not truncated");

    engine::FileAssetLoader exactLimit(dir, 4800);
    const auto asset = exactLimit.load("baseline");
    TEST_ASSERT_NOT_NULL(asset.get());
    TEST_ASSERT_EQUAL_INT(4800, asset->buffer.getNumSamples());

    dir.deleteRecursively();
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_asset_library_tests() {
    RUN_TEST(test_assets_concurrent_load_is_single_flight);
    RUN_TEST(test_assets_failed_load_can_retry);
    RUN_TEST(test_assets_optional_missing_still_ready);
    RUN_TEST(test_assets_reload_is_single_flight_per_asset);
    RUN_TEST(test_asset_names_and_requirements);
    RUN_TEST(test_file_loader_decodes_wav);
    RUN_TEST(test_file_loader_rejects_overlong_file);
}
