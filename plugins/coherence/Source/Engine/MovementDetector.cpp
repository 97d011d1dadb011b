#include "MovementDetector.h"

#include <cmath>

namespace stillpoint::engine
{

MovementDetector::MovementDetector()
    : MovementDetector(Config{})
{
}

MovementDetector::MovementDetector(const Config& initialConfig)
    : config(initialConfig)
{
    jassert(config.baselineAlpha > 0.0f && config.baselineAlpha <= 1.0f);
    jassert(config.warmupAlpha > 0.0f && config.warmupAlpha <= 1.0f);
}

bool MovementDetector::isCooledDown(juce::int64 now) const noexcept
{
    return ! lastEventMs.has_value() || now - *lastEventMs >= config.cooldownMs;
}

MovementEvent MovementDetector::emit(float magnitude, MovementSource source, juce::int64 now)
{
    lastEventMs = now;
    ++stats.eventsEmitted;

    DBG("MovementDetector: event #" << stats.eventsEmitted
        << (source == MovementSource::Accelerometer ? " accel" : " artifact")
        << " magnitude=" << magnitude);

    return { magnitude, source };
}

std::optional<MovementEvent> MovementDetector::processMotion(const MotionSample& sample, juce::int64 now)
{
    if (sample.isZero())
    {
        accelerometerActive = false;
        return std::nullopt;
    }

    accelerometerActive = true;
    ++stats.accelSamples;

    if (! baselineInitialised)
    {
        baseline = sample;
        baselineInitialised = true;
        return std::nullopt;
    }

    if (stats.accelSamples < config.warmupSamples)
    {
        baseline.x += config.warmupAlpha * (sample.x - baseline.x);
        baseline.y += config.warmupAlpha * (sample.y - baseline.y);
        baseline.z += config.warmupAlpha * (sample.z - baseline.z);
        return std::nullopt;
    }

    const float delta = std::abs(sample.x - baseline.x)
                      + std::abs(sample.y - baseline.y)
                      + std::abs(sample.z - baseline.z);

    baseline.x += config.baselineAlpha * (sample.x - baseline.x);
    baseline.y += config.baselineAlpha * (sample.y - baseline.y);
    baseline.z += config.baselineAlpha * (sample.z - baseline.z);

    if (lastDetectionMs.has_value() && now - *lastDetectionMs < config.debounceMs)
        return std::nullopt;

    if (delta <= config.axisDeltaThreshold)
        return std::nullopt;

    lastDetectionMs = now;
    ++stats.movementDetections;

    if (! isCooledDown(now))
        return std::nullopt;

    return emit(delta, MovementSource::Accelerometer, now);
}

std::optional<MovementEvent> MovementDetector::processArtifact(const ArtifactSample& sample, juce::int64 now)
{
    if (accelerometerActive || ! isCooledDown(now))
        return std::nullopt;

    if (lastArtifactEventMs.has_value() && now - *lastArtifactEventMs < config.artifactCooldownMs)
        return std::nullopt;

    const float power = std::isnan(sample.totalBandPower) ? 0.0f : sample.totalBandPower;

    if (artifactBaseline == 0.0f)
        artifactBaseline = power;
    else
        artifactBaseline += config.artifactBaselineAlpha * (power - artifactBaseline);

    const float ratio = power / juce::jmax(1.0f, artifactBaseline);

    if (ratio <= config.artifactPowerRatio || sample.poorChannelCount < config.artifactMinPoorChannels)
        return std::nullopt;

    lastArtifactEventMs = now;
    ++stats.artifactEvents;

    return emit(ratio, MovementSource::ArtifactFallback, now);
}

void MovementDetector::reset() noexcept
{
    baseline = {};
    baselineInitialised = false;
    accelerometerActive = false;
    lastDetectionMs.reset();
    lastEventMs.reset();
    lastArtifactEventMs.reset();
    artifactBaseline = 0.0f;
    stats = {};
}

} // namespace stillpoint::engine
