/**
 * @file test_coherence_processor.cpp
 * @brief Unit tests for the output processor: rendering, metering and state
 */

#include <unity.h>

#include "Processors/CoherenceProcessor.h"
#include "mocks/MemoryAssetLoader.h"

using namespace stillpoint;
using stillpoint::test::makeConstantAsset;

namespace
{

void setParameter(CoherenceProcessor& processor, const juce::String& id, float value)
{
    auto* parameter = processor.getValueTreeState().getParameter(id);
    TEST_ASSERT_NOT_NULL(parameter);
    parameter->setValueNotifyingHost(parameter->convertTo0to1(value));
}

} // namespace

void test_processor_is_output_only() {
    core::SampleClock clock;
    dsp::LayerMixer mixer(clock);
    CoherenceProcessor processor(mixer, clock);

    TEST_ASSERT_EQUAL_INT(0, processor.getTotalNumInputChannels());
    TEST_ASSERT_EQUAL_INT(2, processor.getTotalNumOutputChannels());
    TEST_ASSERT_FALSE(processor.hasEditor());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, processor.getSensitivity());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, tuning::Cues::kLayerGain, processor.getCueLevel());
}

void test_processor_renders_and_advances_clock() {
    core::SampleClock clock;
    dsp::LayerMixer mixer(clock);
    CoherenceProcessor processor(mixer, clock);
    processor.prepareToPlay(48000.0, 512);

    mixer.setLayerSource(dsp::Layer::Baseline, makeConstantAsset(0.5f, 4800));
    mixer.beginGeneration();
    mixer.startLoops(0.0);
    mixer.setGain(dsp::Layer::Baseline, 1.0f, 0.0);

    juce::AudioBuffer<float> buffer(2, 512);
    juce::MidiBuffer midi;
    processor.processBlock(buffer, midi);

    TEST_ASSERT_EQUAL_INT(512, static_cast<int>(clock.getSamplePosition()));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.5f, buffer.getSample(0, 511));

    dsp::MixerMeterState meter;
    TEST_ASSERT_TRUE(processor.popMeterState(meter));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.5f, meter.outputPeak);
    TEST_ASSERT_EQUAL_INT(1, meter.activeVoices);
    TEST_ASSERT_FALSE(processor.popMeterState(meter));

    setParameter(processor, "output", -6.0f);
    processor.processBlock(buffer, midi);

    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 0.5f * juce::Decibels::decibelsToGain(-6.0f), buffer.getSample(0, 511));
}

void test_processor_state_round_trip() {
    core::SampleClock clock;
    dsp::LayerMixer mixer(clock);

    juce::MemoryBlock saved;
    {
        CoherenceProcessor processor(mixer, clock);
        setParameter(processor, "sensitivity", 0.8f);
        processor.getStateInformation(saved);
    }

    const auto tree = juce::ValueTree::readFromData(saved.getData(), saved.getSize());
    TEST_ASSERT_TRUE(tree.isValid());
    TEST_ASSERT_EQUAL_INT(1, static_cast<int>(tree.getProperty("stateVersion", 0)));

    CoherenceProcessor restored(mixer, clock);
    restored.setStateInformation(saved.getData(), static_cast<int>(saved.getSize()));

    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.8f, restored.getSensitivity());
}

void test_processor_ignores_foreign_state() {
    core::SampleClock clock;
    dsp::LayerMixer mixer(clock);
    CoherenceProcessor processor(mixer, clock);
    setParameter(processor, "sensitivity", 0.2f);

    juce::ValueTree foreign("SomethingElse");
    foreign.setProperty("sensitivity", 0.9f, nullptr);

    juce::MemoryBlock block;
    {
        juce::MemoryOutputStream stream(block, false);
        foreign.writeToStream(stream);
    }

    processor.setStateInformation(block.getData(), static_cast<int>(block.getSize()));

    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.2f, processor.getSensitivity());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_coherence_processor_tests() {
    RUN_TEST(test_processor_is_output_only);
    RUN_TEST(test_processor_renders_and_advances_clock);
    RUN_TEST(test_processor_state_round_trip);
    RUN_TEST(test_processor_ignores_foreign_state);
}
