/**
 * @file test_state_machine.cpp
 * @brief Unit tests for CoherenceStateMachine hysteresis and signal gating
 */

#include <unity.h>
#include <limits>
#include <vector>

#include "Engine/CoherenceStateMachine.h"

using namespace stillpoint::engine;

namespace
{

SignalQuality goodSignal()
{
    return { true, 1.0f, 0 };
}

struct RecordedTransition
{
    juce::int64 timeMs;
    Transition transition;
};

} // namespace

//==============================================================================
// Basic State Tests
//==============================================================================

void test_fsm_starts_in_baseline() {
    CoherenceStateMachine fsm;

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);
    TEST_ASSERT_FALSE(fsm.isEnterTimerRunning());
    TEST_ASSERT_FALSE(fsm.isExitTimerRunning());
}

void test_fsm_linear_rise_then_drop() {
    CoherenceStateMachine fsm;
    std::vector<RecordedTransition> seen;

    for (juce::int64 t = 0; t <= 5000; t += 25)
    {
        float value = 0.5f;
        if (t <= 1000)
            value = 0.5f + 0.4f * (static_cast<float>(t) / 1000.0f);
        else if (t < 3500)
            value = 0.9f;

        if (const auto transition = fsm.update(value, goodSignal(), t))
            seen.push_back({ t, *transition });

        TEST_ASSERT_FALSE_MESSAGE(fsm.isEnterTimerRunning() && fsm.isExitTimerRunning(),
                                  "Enter and exit timers must never run together");
    }

    TEST_ASSERT_EQUAL_INT(3, static_cast<int>(seen.size()));

    TEST_ASSERT_TRUE(seen[0].transition.to == CoherenceFsmState::Stabilizing);
    TEST_ASSERT_TRUE(seen[0].timeMs >= 600 && seen[0].timeMs <= 650);

    TEST_ASSERT_TRUE(seen[1].transition.from == CoherenceFsmState::Stabilizing);
    TEST_ASSERT_TRUE(seen[1].transition.to == CoherenceFsmState::Coherent);
    TEST_ASSERT_EQUAL_INT(static_cast<int>(seen[0].timeMs + 1800), static_cast<int>(seen[1].timeMs));

    TEST_ASSERT_TRUE(seen[2].transition.from == CoherenceFsmState::Coherent);
    TEST_ASSERT_TRUE(seen[2].transition.to == CoherenceFsmState::Baseline);
    TEST_ASSERT_EQUAL_INT(4100, static_cast<int>(seen[2].timeMs));
}

//==============================================================================
// Hysteresis Tests
//==============================================================================

void test_fsm_oscillation_never_reaches_coherent() {
    CoherenceStateMachine fsm;

    // 1 s above enter, 200 ms in the dead band, repeated for 20 s.
    for (juce::int64 t = 0; t <= 20000; t += 100)
    {
        const float value = (t % 1200) < 1000 ? 0.76f : 0.72f;
        fsm.update(value, goodSignal(), t);

        TEST_ASSERT_TRUE_MESSAGE(fsm.getState() != CoherenceFsmState::Coherent,
                                 "Coherent requires enter threshold held for the full sustain");
    }
}

void test_fsm_brief_dip_does_not_exit() {
    CoherenceStateMachine fsm;

    for (juce::int64 t = 0; t <= 1800; t += 100)
        fsm.update(0.9f, goodSignal(), t);

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Coherent);

    fsm.update(0.65f, goodSignal(), 2000);
    TEST_ASSERT_TRUE(fsm.isExitTimerRunning());

    fsm.update(0.72f, goodSignal(), 2300);
    TEST_ASSERT_FALSE(fsm.isExitTimerRunning());

    for (juce::int64 t = 2400; t <= 5000; t += 100)
        TEST_ASSERT_FALSE(fsm.update(0.72f, goodSignal(), t).has_value());

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Coherent);
}

void test_fsm_drop_during_stabilizing_returns_to_baseline() {
    CoherenceStateMachine fsm;

    fsm.update(0.8f, goodSignal(), 0);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Stabilizing);

    const auto drop = fsm.update(0.74f, goodSignal(), 1000);
    TEST_ASSERT_TRUE(drop.has_value());
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);
    TEST_ASSERT_FALSE(fsm.isEnterTimerRunning());

    fsm.update(0.8f, goodSignal(), 1100);
    fsm.update(0.8f, goodSignal(), 2800);
    TEST_ASSERT_TRUE_MESSAGE(fsm.getState() == CoherenceFsmState::Stabilizing,
                             "Sustain restarts from the re-entry tick");

    fsm.update(0.8f, goodSignal(), 2900);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Coherent);
}

//==============================================================================
// Signal Quality Tests
//==============================================================================

void test_fsm_poor_contact_forces_baseline() {
    CoherenceStateMachine fsm;

    for (juce::int64 t = 0; t <= 1800; t += 100)
        fsm.update(0.9f, goodSignal(), t);

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Coherent);

    const auto transition = fsm.update(1.0f, { true, 0.4f, 0 }, 1900);
    TEST_ASSERT_TRUE(transition.has_value());
    TEST_ASSERT_TRUE(transition->from == CoherenceFsmState::Coherent);
    TEST_ASSERT_TRUE(transition->to == CoherenceFsmState::Baseline);
    TEST_ASSERT_FALSE(fsm.isEnterTimerRunning());
    TEST_ASSERT_FALSE(fsm.isExitTimerRunning());
}

void test_fsm_disconnected_and_stale_input_veto() {
    CoherenceStateMachine fsm;

    fsm.update(0.9f, goodSignal(), 0);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Stabilizing);

    fsm.update(0.9f, { false, 1.0f, 0 }, 100);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);

    fsm.update(0.9f, goodSignal(), 200);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Stabilizing);

    fsm.update(0.9f, { true, 1.0f, 1500 }, 300);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);

    // Already in Baseline: a veto reports no transition.
    TEST_ASSERT_FALSE(fsm.update(0.9f, { false, 0.0f, 0 }, 400).has_value());
}

void test_fsm_nan_coherence_treated_as_zero() {
    CoherenceStateMachine fsm;

    fsm.update(0.9f, goodSignal(), 0);
    fsm.update(std::numeric_limits<float>::quiet_NaN(), goodSignal(), 100);

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);
}

//==============================================================================
// Configuration Tests
//==============================================================================

void test_fsm_set_config_keeps_state() {
    CoherenceStateMachine fsm;

    fsm.update(0.8f, goodSignal(), 0);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Stabilizing);

    CoherenceStateMachine::Config config;
    config.enterThreshold = 0.6f;
    config.exitThreshold = 0.5f;
    config.enterSustainSeconds = 1.0f;
    fsm.setConfig(config);

    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Stabilizing);
    TEST_ASSERT_TRUE(fsm.isEnterTimerRunning());

    fsm.update(0.65f, goodSignal(), 1000);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Coherent);
}

void test_fsm_reset_reports_transition() {
    CoherenceStateMachine fsm;

    TEST_ASSERT_FALSE(fsm.reset().has_value());

    fsm.update(0.9f, goodSignal(), 0);
    const auto transition = fsm.reset();
    TEST_ASSERT_TRUE(transition.has_value());
    TEST_ASSERT_TRUE(transition->from == CoherenceFsmState::Stabilizing);
    TEST_ASSERT_TRUE(fsm.getState() == CoherenceFsmState::Baseline);
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_state_machine_tests() {
    RUN_TEST(test_fsm_starts_in_baseline);
    RUN_TEST(test_fsm_linear_rise_then_drop);
    RUN_TEST(test_fsm_oscillation_never_reaches_coherent);
    RUN_TEST(test_fsm_brief_dip_does_not_exit);
    RUN_TEST(test_fsm_drop_during_stabilizing_returns_to_baseline);
    RUN_TEST(test_fsm_poor_contact_forces_baseline);
    RUN_TEST(test_fsm_disconnected_and_stale_input_veto);
    RUN_TEST(test_fsm_nan_coherence_treated_as_zero);
    RUN_TEST(test_fsm_set_config_keeps_state);
    RUN_TEST(test_fsm_reset_reports_transition);
}
