#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <iostream>

#include "Engine/CoherenceRuntime.h"

namespace
{

using namespace stillpoint;

/**
 * One line of a replay file:
 *
 *   <ms>,coherence,<value>,<connected 0|1>,<contact 0..1>,<gapMs>
 *   <ms>,motion,<x>,<y>,<z>
 *   <ms>,artifact,<totalBandPower>,<poorChannels>
 *   <ms>,heart,<bpm>,<confidence>,<lastBeatMs>
 *   <ms>,expressive,<a>,<b>
 *   <ms>,sensitivity,<0..1>
 *   <ms>,entrainment,<on|off>
 *
 * Blank lines and lines starting with '#' are skipped.
 */
struct ReplayLine
{
    juce::int64 timeMs = 0;
    juce::String kind;
    juce::StringArray fields;
};

std::vector<ReplayLine> parseReplayFile(const juce::File& file)
{
    std::vector<ReplayLine> lines;
    juce::StringArray raw;
    file.readLines(raw);

    for (int i = 0; i < raw.size(); ++i)
    {
        const auto text = raw[i].trim();
        if (text.isEmpty() || text.startsWithChar('#'))
            continue;

        auto tokens = juce::StringArray::fromTokens(text, ",", "");
        tokens.trim();

        if (tokens.size() < 2)
            juce::ConsoleApplication::fail("line " + juce::String(i + 1) + ": expected <ms>,<kind>,...");

        ReplayLine line;
        line.timeMs = tokens[0].getLargeIntValue();
        line.kind = tokens[1].toLowerCase();
        tokens.removeRange(0, 2);
        line.fields = tokens;
        lines.push_back(std::move(line));
    }

    return lines;
}

float field(const ReplayLine& line, int index, float fallback = 0.0f)
{
    return index < line.fields.size() ? line.fields[index].getFloatValue() : fallback;
}

void applyLine(engine::CoherenceEngine& coherenceEngine, const ReplayLine& line)
{
    if (line.kind == "coherence")
    {
        engine::CoherenceSample sample;
        sample.value = field(line, 0);
        sample.signalQuality.connected = field(line, 1, 1.0f) != 0.0f;
        sample.signalQuality.contactQuality = field(line, 2, 1.0f);
        sample.signalQuality.timeSinceLastUpdateMs = static_cast<juce::int64>(field(line, 3));
        sample.timestampMs = line.timeMs;

        const auto before = coherenceEngine.getState();
        const auto after = coherenceEngine.updateCoherence(sample);

        if (before != after)
            std::cout << line.timeMs << " ms: " << engine::getStateName(before)
                      << " -> " << engine::getStateName(after) << std::endl;
    }
    else if (line.kind == "motion")
    {
        if (const auto event = coherenceEngine.updateMotion({ field(line, 0), field(line, 1), field(line, 2) }, line.timeMs))
            std::cout << line.timeMs << " ms: movement " << event->deltaMagnitude << std::endl;
    }
    else if (line.kind == "artifact")
    {
        engine::ArtifactSample sample;
        sample.totalBandPower = field(line, 0);
        sample.poorChannelCount = static_cast<int>(field(line, 1));

        if (const auto event = coherenceEngine.updateArtifacts(sample, line.timeMs))
            std::cout << line.timeMs << " ms: artifact movement " << event->deltaMagnitude << std::endl;
    }
    else if (line.kind == "heart")
    {
        coherenceEngine.updateHeartRate({ field(line, 0), field(line, 1), static_cast<juce::int64>(field(line, 2)) },
                               line.timeMs);
    }
    else if (line.kind == "expressive")
    {
        coherenceEngine.updateExpressive(field(line, 0), field(line, 1), line.timeMs);
    }
    else if (line.kind == "sensitivity")
    {
        coherenceEngine.setSensitivity(field(line, 0, 0.5f));
    }
    else if (line.kind == "entrainment")
    {
        if (line.fields[0] == "on")
        {
            if (! coherenceEngine.startEntrainment())
                std::cout << line.timeMs << " ms: entrainment unavailable" << std::endl;
        }
        else
        {
            coherenceEngine.stopEntrainment();
        }
    }
    else
    {
        juce::Logger::writeToLog("replay: unknown line kind '" + line.kind + "'");
    }
}

void runReplay(const juce::ArgumentList& args)
{
    const auto replayFile = args.getExistingFileForOption("--replay");
    const auto assetDir = args.containsOption("--assets")
                            ? args.getExistingFolderForOption("--assets")
                            : juce::File::getCurrentWorkingDirectory();
    const bool fast = args.containsOption("--fast");

    const auto lines = parseReplayFile(replayFile);
    if (lines.empty())
        juce::ConsoleApplication::fail("replay file has no ticks");

    juce::ScopedJuceInitialiser_GUI juceInit;

    CoherenceRuntime::Options options;
    options.assetDirectory = assetDir;
    options.capabilities.expressiveModulation = args.containsOption("--expressive");
    options.capabilities.heartRateModulation = args.containsOption("--heart-rate");

    CoherenceRuntime runtime(options);
    auto& coherenceEngine = runtime.getEngine();

    const auto firstMs = lines.front().timeMs;

    if (! coherenceEngine.startSession(firstMs))
        juce::ConsoleApplication::fail("session did not start (missing assets or no output device)");

    auto* messageManager = juce::MessageManager::getInstance();
    auto previousMs = firstMs;

    for (const auto& line : lines)
    {
        const auto waitMs = static_cast<int>(juce::jmax<juce::int64>(0, line.timeMs - previousMs));
        if (! fast && waitMs > 0)
            messageManager->runDispatchLoopUntil(waitMs);

        applyLine(coherenceEngine, line);
        previousMs = line.timeMs;
    }

    coherenceEngine.stopSession(previousMs);

    const auto metrics = coherenceEngine.getMetrics(previousMs);
    std::cout << "coherent seconds: " << metrics.totalCoherentSeconds << std::endl
              << "longest streak seconds: " << metrics.longestCoherentStreakSeconds << std::endl
              << "coherence audio ms: " << metrics.totalCoherenceAudioTimeMs << std::endl;

    // Let the session-end fade finish before the device closes.
    messageManager->runDispatchLoopUntil(static_cast<int>(
        (tuning::Crossfade::kSessionEndFadeSeconds + tuning::Crossfade::kReleaseMarginSeconds) * 1000.0) + 100);
}

} // namespace

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "Usage:", true);

    app.addCommand({ "--replay",
                     "--replay <ticks.csv> [--assets <dir>] [--fast] [--expressive] [--heart-rate]",
                     "Replays a CSV of sensor ticks through the coherence engine.",
                     "Plays the session on the default output device and prints state transitions,\n"
                     "movement events and the final session metrics.",
                     runReplay });

    return app.findAndRunCommand(argc, argv);
}
