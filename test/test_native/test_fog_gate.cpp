/**
 * @file test_fog_gate.cpp
 * @brief Unit tests for the fog on/off decision
 */

#include <unity.h>

#include "Engine/FogGate.h"

using namespace stillpoint::engine;

void test_fog_enables_after_continuous_baseline() {
    FogGate gate;

    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Baseline, 0).has_value());
    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Baseline, 2999).has_value());

    const auto event = gate.update(CoherenceFsmState::Baseline, 3000);
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_TRUE(*event == FogGate::Event::Enabled);
    TEST_ASSERT_TRUE(gate.isEnabled());

    TEST_ASSERT_FALSE_MESSAGE(gate.update(CoherenceFsmState::Baseline, 4000).has_value(),
                              "Enabled is reported once");
}

void test_fog_stabilizing_breaks_the_run() {
    FogGate gate;

    gate.update(CoherenceFsmState::Baseline, 0);
    gate.update(CoherenceFsmState::Baseline, 2000);
    gate.update(CoherenceFsmState::Stabilizing, 2500);
    TEST_ASSERT_FALSE(gate.getNonCoherentSince().has_value());

    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Baseline, 2600).has_value());
    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Baseline, 5599).has_value());
    TEST_ASSERT_TRUE(gate.update(CoherenceFsmState::Baseline, 5600).has_value());
}

void test_fog_coherent_disables_stabilizing_does_not() {
    FogGate gate;

    gate.update(CoherenceFsmState::Baseline, 0);
    gate.update(CoherenceFsmState::Baseline, 3000);
    TEST_ASSERT_TRUE(gate.isEnabled());

    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Stabilizing, 3100).has_value());
    TEST_ASSERT_TRUE(gate.isEnabled());

    const auto event = gate.update(CoherenceFsmState::Coherent, 4900);
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_TRUE(*event == FogGate::Event::Disabled);
    TEST_ASSERT_FALSE(gate.isEnabled());

    TEST_ASSERT_FALSE(gate.update(CoherenceFsmState::Coherent, 5000).has_value());
}

void test_fog_reset_clears_state() {
    FogGate gate(1000);

    gate.update(CoherenceFsmState::Baseline, 0);
    gate.update(CoherenceFsmState::Baseline, 1000);
    TEST_ASSERT_TRUE(gate.isEnabled());

    gate.reset();
    TEST_ASSERT_FALSE(gate.isEnabled());
    TEST_ASSERT_FALSE(gate.getNonCoherentSince().has_value());
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_fog_gate_tests() {
    RUN_TEST(test_fog_enables_after_continuous_baseline);
    RUN_TEST(test_fog_stabilizing_breaks_the_run);
    RUN_TEST(test_fog_coherent_disables_stabilizing_does_not);
    RUN_TEST(test_fog_reset_clears_state);
}
