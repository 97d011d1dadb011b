/**
 * @file test_gain_automation.cpp
 * @brief Unit tests for scheduled gain ramps
 */

#include <unity.h>
#include <cmath>
#include <limits>

#include "DSP/GainAutomation.h"

using namespace stillpoint::dsp;

//==============================================================================
// Linear Ramp Tests
//==============================================================================

void test_gain_linear_ramp_midpoint() {
    GainAutomation gain;

    gain.rampTo(1.0f, 0.0, 2.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, gain.getValueAt(0.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, gain.getValueAt(1.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, gain.getValueAt(2.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, gain.getValueAt(10.0));
    TEST_ASSERT_TRUE(gain.isRamping(1.0));
    TEST_ASSERT_FALSE(gain.isRamping(2.5));
}

void test_gain_retrigger_starts_from_current_value() {
    GainAutomation gain;

    gain.rampTo(1.0f, 0.0, 2.0);
    gain.rampTo(0.0f, 1.0, 1.0);

    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-6f, 0.5f, gain.getValueAt(1.0),
                                     "A new ramp must start where the old one was");
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.25f, gain.getValueAt(1.5));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, gain.getTargetValue());
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 2.0f, static_cast<float>(gain.getRampEndTime()));
}

void test_gain_zero_duration_jumps() {
    GainAutomation gain(0.2f);

    gain.rampTo(0.8f, 3.0, 0.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.8f, gain.getValueAt(3.0));
    TEST_ASSERT_FALSE(gain.isRamping(3.0));
}

void test_gain_values_are_clamped() {
    GainAutomation gain;

    gain.rampTo(1.5f, 0.0, 1.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, gain.getTargetValue());

    gain.setValueAt(-1.0f, 0.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, gain.getValueAt(0.0));

    gain.setValueAt(std::numeric_limits<float>::quiet_NaN(), 0.0);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, gain.getValueAt(0.0));
}

//==============================================================================
// Exponential Ramp Tests
//==============================================================================

void test_gain_exponential_ramp_from_floor() {
    GainAutomation gain;

    gain.setValueAt(0.001f, 0.0);
    gain.rampTo(0.301f, 0.0, 1.5, RampShape::Exponential);

    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.001f, gain.getValueAt(0.0));
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, std::sqrt(0.001f * 0.301f), gain.getValueAt(0.75));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.301f, gain.getValueAt(1.5));
}

void test_gain_rebased_ramp_ignores_previous_value() {
    GainAutomation gain(0.7f);

    gain.rampFrom(0.0f, 0.1, 1.0f, 4.0);

    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, gain.getValueAt(0.1));
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.5f, gain.getValueAt(2.1));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, gain.getValueAt(4.1));
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_gain_automation_tests() {
    RUN_TEST(test_gain_linear_ramp_midpoint);
    RUN_TEST(test_gain_retrigger_starts_from_current_value);
    RUN_TEST(test_gain_zero_duration_jumps);
    RUN_TEST(test_gain_values_are_clamped);
    RUN_TEST(test_gain_exponential_ramp_from_floor);
    RUN_TEST(test_gain_rebased_ramp_ignores_previous_value);
}
