/**
 * @file test_movement_detector.cpp
 * @brief Unit tests for accelerometer movement detection and the artifact fallback
 */

#include <unity.h>

#include "Engine/MovementDetector.h"

using namespace stillpoint::engine;

namespace
{

constexpr juce::int64 kPollMs = 50;    // 20 Hz

const MotionSample kRest { 0.0f, 0.0f, 1.0f };

void feedRest(MovementDetector& detector, juce::int64 fromMs, juce::int64 toMs)
{
    for (juce::int64 t = fromMs; t < toMs; t += kPollMs)
        detector.processMotion(kRest, t);
}

} // namespace

//==============================================================================
// Accelerometer Tests
//==============================================================================

void test_movement_step_emits_event() {
    MovementDetector detector;
    feedRest(detector, 0, 2000);

    int events = 0;
    for (juce::int64 t = 2000; t < 2300; t += kPollMs)
        if (const auto event = detector.processMotion({ 0.05f, 0.0f, 1.0f }, t))
        {
            ++events;
            TEST_ASSERT_TRUE(event->source == MovementSource::Accelerometer);
            TEST_ASSERT_TRUE(event->deltaMagnitude > 0.025f);
        }

    TEST_ASSERT_EQUAL_INT(1, events);
    TEST_ASSERT_EQUAL_INT(1, detector.getStats().eventsEmitted);
}

void test_movement_rest_noise_is_ignored() {
    MovementDetector detector;
    juce::Random random(42);

    const auto jitter = [&random] { return (random.nextFloat() * 2.0f - 1.0f) * 0.003f; };

    int events = 0;
    for (juce::int64 t = 0; t < 30000; t += kPollMs)
        if (detector.processMotion({ 0.01f + jitter(), -0.02f + jitter(), 0.98f + jitter() }, t))
            ++events;

    TEST_ASSERT_EQUAL_INT(0, events);
    TEST_ASSERT_EQUAL_INT(0, detector.getStats().movementDetections);
    TEST_ASSERT_EQUAL_INT(600, detector.getStats().accelSamples);
}

void test_movement_zero_samples_are_skipped() {
    MovementDetector detector;

    for (juce::int64 t = 0; t < 1000; t += kPollMs)
        TEST_ASSERT_FALSE(detector.processMotion({}, t).has_value());

    TEST_ASSERT_EQUAL_INT(0, detector.getStats().accelSamples);
    TEST_ASSERT_FALSE(detector.isBaselineInitialised());

    detector.processMotion({ 0.1f, 0.2f, 0.9f }, 1000);
    TEST_ASSERT_TRUE(detector.isBaselineInitialised());
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.2f, detector.getBaseline().y);
}

void test_movement_cooldown_limits_events() {
    MovementDetector detector;
    feedRest(detector, 0, 2000);

    // Sustained shaking: every other sample jumps by 0.2 g.
    int events = 0;
    for (juce::int64 t = 2000; t < 5000; t += kPollMs)
    {
        const float offset = ((t / kPollMs) % 2 == 0) ? 0.2f : 0.0f;
        if (detector.processMotion({ offset, 0.0f, 1.0f }, t))
            ++events;
    }

    TEST_ASSERT_EQUAL_INT(2, events);
    TEST_ASSERT_GREATER_THAN(events, detector.getStats().movementDetections);
}

//==============================================================================
// Artifact Fallback Tests
//==============================================================================

void test_artifact_spike_without_accelerometer() {
    MovementDetector detector;

    for (juce::int64 t = 0; t < 1000; t += kPollMs)
        TEST_ASSERT_FALSE(detector.processArtifact({ 10.0f, 0 }, t).has_value());

    const auto event = detector.processArtifact({ 100.0f, 4 }, 1000);
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_TRUE(event->source == MovementSource::ArtifactFallback);
    TEST_ASSERT_EQUAL_INT(1, detector.getStats().artifactEvents);

    TEST_ASSERT_FALSE_MESSAGE(detector.processArtifact({ 100.0f, 4 }, 2500).has_value(),
                              "Artifact fallback has its own long cooldown");
}

void test_artifact_needs_poor_channels() {
    MovementDetector detector;

    for (juce::int64 t = 0; t < 1000; t += kPollMs)
        detector.processArtifact({ 10.0f, 0 }, t);

    TEST_ASSERT_FALSE(detector.processArtifact({ 100.0f, 2 }, 1000).has_value());
}

void test_artifact_disabled_while_accelerometer_active() {
    MovementDetector detector;

    detector.processArtifact({ 10.0f, 0 }, 0);
    detector.processMotion(kRest, 50);

    TEST_ASSERT_FALSE(detector.processArtifact({ 100.0f, 4 }, 100).has_value());

    detector.processMotion({}, 150);
    TEST_ASSERT_TRUE(detector.processArtifact({ 100.0f, 4 }, 200).has_value());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_movement_detector_tests() {
    RUN_TEST(test_movement_step_emits_event);
    RUN_TEST(test_movement_rest_noise_is_ignored);
    RUN_TEST(test_movement_zero_samples_are_skipped);
    RUN_TEST(test_movement_cooldown_limits_events);
    RUN_TEST(test_artifact_spike_without_accelerometer);
    RUN_TEST(test_artifact_needs_poor_channels);
    RUN_TEST(test_artifact_disabled_while_accelerometer_active);
}
