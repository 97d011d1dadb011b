#pragma once

#include <cstddef>

namespace stillpoint::tuning {

struct StateMachine {
    // Coherence needed to enter Stabilizing, and to stay there.
    static constexpr float kEnterThreshold = 0.75f;

    // Coherence at or below this starts the exit clock while Coherent.
    // Kept below kEnterThreshold so the classifier has a dead band.
    static constexpr float kExitThreshold = 0.70f;

    static constexpr float kEnterSustainSeconds = 1.8f;
    static constexpr float kExitSustainSeconds = 0.6f;

    // Signal gating: stale or poorly-contacted input forces Baseline.
    static constexpr long long kMaxPacketGapMs = 1000;
    static constexpr float kMinContactQuality = 0.5f;
};

struct Difficulty {
    // Sensitivity slider boundaries (0..1).
    static constexpr float kEasyUpperBound = 0.33f;
    static constexpr float kMediumUpperBound = 0.67f;

    struct Values {
        float enterThreshold;
        float exitThreshold;
        float enterSustainSeconds;
        float exitSustainSeconds;
    };

    static constexpr Values kEasy   { 0.65f, 0.60f, 1.2f, 0.80f };
    static constexpr Values kMedium { 0.75f, 0.70f, 1.8f, 0.60f };
    static constexpr Values kHard   { 0.82f, 0.77f, 2.6f, 0.45f };
};

struct Crossfade {
    // Baseline <-> coherence crossfade windows (seconds).
    static constexpr double kAttackSeconds = 5.5;
    static constexpr double kReleaseSeconds = 7.5;

    // Baseline fade-in at session start.
    static constexpr double kStartFadeSeconds = 4.0;

    // Lead time before all loops start, so every layer shares one start sample.
    static constexpr double kStartOffsetSeconds = 0.1;

    // Master fade on session end, plus the margin before voices are released.
    static constexpr double kSessionEndFadeSeconds = 4.0;
    static constexpr double kReleaseMarginSeconds = 0.1;

    // Times a release may wait again for an audio clock that lags the timer.
    static constexpr int kMaxTeardownDeferrals = 20;

    // Lowest gain an active layer is ever driven to. Exact zero clicks.
    static constexpr float kGainFloor = 0.001f;

    // Adaptive updates smaller than this are not scheduled.
    static constexpr float kGainUpdateEpsilon = 0.01f;
};

struct Shimmer {
    static constexpr float kTriggerThreshold = 0.78f;
    static constexpr long long kHoldMs = 3000;
    static constexpr long long kCooldownMs = 20000;

    static constexpr float kBaseGain = 0.10f;
    static constexpr float kGainRange = 0.15f;   // max 0.25

    static constexpr double kFadeInSeconds = 4.0;
    static constexpr double kFadeOutSeconds = 5.0;
    static constexpr double kUpdateSmoothSeconds = 0.8;
};

struct Sustained {
    static constexpr float kTriggerThreshold = 0.85f;
    static constexpr long long kHoldMs = 10000;
    static constexpr long long kCooldownMs = 30000;

    // Exit is asymmetric: lower threshold, sustained for kExitHoldMs.
    static constexpr float kExitThreshold = 0.75f;
    static constexpr long long kExitHoldMs = 3000;

    static constexpr float kBaseGain = 0.08f;
    static constexpr float kGainRange = 0.12f;

    static constexpr double kFadeInSeconds = 6.0;
    static constexpr double kFadeOutSeconds = 8.0;
    static constexpr double kUpdateSmoothSeconds = 0.8;
};

struct BonusBus {
    // EMA factor for coherence strength (adaptive bonus gain).
    static constexpr float kStrengthSmoothing = 0.1f;

    // Brick-wall-ish limiter on the bonus bus so stacked layers never poke out.
    static constexpr float kLimiterThresholdDb = -6.0f;
    static constexpr float kLimiterRatio = 20.0f;
    static constexpr float kLimiterAttackMs = 1.0f;
    static constexpr float kLimiterReleaseMs = 100.0f;
};

struct Fog {
    // Continuous Baseline time before the fog rolls in.
    static constexpr long long kActiveSustainMs = 3000;

    static constexpr float kWetLevel = 0.15f;     // subtle, spatial not washy
    static constexpr float kSendLevel = 1.0f;
    static constexpr double kAttackSeconds = 3.0;
    static constexpr double kReleaseSeconds = 4.0;

    // Static delay topology.
    static constexpr std::size_t kNumTaps = 3;
    static constexpr float kTapTimesMs[kNumTaps] = { 30.0f, 50.0f, 70.0f };
    static constexpr float kMaxDelayMs = 100.0f;

    static constexpr float kRoomSize = 0.8f;
    static constexpr float kFeedbackScale = 0.3f;  // feedback = room * scale

    // Keeps the low end of the return clean.
    static constexpr float kReturnHighPassHz = 80.0f;
};

struct Movement {
    // Sum of per-axis deviation from the EMA baseline (g).
    // Rest noise sits around 0.005-0.015; a gentle nod is 0.05-0.20.
    static constexpr float kAxisDeltaThreshold = 0.025f;

    static constexpr long long kDebounceMs = 150;
    static constexpr long long kCooldownMs = 2000;
    static constexpr int kWarmupSamples = 3;

    // 0.05 at 20 Hz polling gives a ~1 s time constant.
    static constexpr float kBaselineAlpha = 0.05f;
    static constexpr float kWarmupAlpha = 0.3f;

    // Artifact fallback, deliberately conservative.
    static constexpr float kArtifactPowerRatio = 3.0f;
    static constexpr long long kArtifactCooldownMs = 10000;
    static constexpr int kArtifactMinPoorChannels = 3;
    static constexpr float kArtifactBaselineAlpha = 0.1f;
};

struct Cues {
    static constexpr int kNumSlots = 3;

    // Spam guard only. Cues may overlap.
    static constexpr long long kMinIntervalMs = 250;

    static constexpr float kLayerGain = 0.6f;
    static constexpr double kLayerFadeSeconds = 0.05;
};

struct Entrainment {
    static constexpr float kDefaultVolume = 0.3f;
    static constexpr double kFadeInSeconds = 1.5;
    static constexpr double kFadeOutSeconds = 0.8;
    static constexpr double kVolumeChangeSeconds = 0.1;
};

struct Tone {
    static constexpr float kShelfFrequencyHz = 4000.0f;
    static constexpr float kMaxShelfBoostDb = 3.0f;

    static constexpr float kNeutralLowPassHz = 18000.0f;
    static constexpr float kHeartbeatDipHz = 2500.0f;

    static constexpr double kSmoothingSeconds = 0.25;
};

struct HeartRate {
    static constexpr float kMinConfidence = 0.6f;
    static constexpr float kMinBpm = 40.0f;
    static constexpr float kMaxBpm = 180.0f;
    static constexpr long long kMaxBeatAgeMs = 3000;
};

struct Backend {
    // Attempts to resume a suspended output device before giving up.
    static constexpr int kMaxResumeAttempts = 3;
};

struct Assets {
    // Longest file decoded into memory: ten minutes at 48 kHz.
    static constexpr long long kMaxSamples = 48000LL * 60 * 10;
};

struct Voices {
    // Headroom for overlapping cue voices plus the loops.
    static constexpr int kMaxVoices = 32;
};

} // namespace stillpoint::tuning
