#include <juce_events/juce_events.h>

#include <functional>
#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include "audio/JuceAudioBackend.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/TimelineUtils.hpp"
#include "engine/PlaybackPositionTimer.hpp"
#include "state/ProjectStore.hpp"

namespace {

struct ClipArgument {
    juce::File file;
    double startSeconds = 0.0;
};

struct Options {
    juce::String configFile;
    std::optional<double> bpm;
    std::vector<ClipArgument> clips;
};

void printUsage() {
    std::cout << "Usage: beatline [--config file] [--bpm N] file.wav@seconds ..." << std::endl;
}

/** @return false on a malformed command line */
bool parseArguments(const juce::StringArray& args, Options& options) {
    for (int i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--config" || arg == "--bpm") {
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            auto value = args[++i];
            if (arg == "--config") {
                options.configFile = value;
            } else {
                options.bpm = value.getDoubleValue();
            }
            continue;
        }

        ClipArgument clip;
        auto at = arg.lastIndexOfChar('@');
        if (at > 0) {
            clip.file = juce::File::getCurrentWorkingDirectory().getChildFile(arg.substring(0, at));
            clip.startSeconds = juce::jmax(0.0, arg.substring(at + 1).getDoubleValue());
        } else {
            clip.file = juce::File::getCurrentWorkingDirectory().getChildFile(arg);
        }
        options.clips.push_back(clip);
    }
    return true;
}

void runMessageLoopWhile(const std::function<bool()>& condition) {
    auto* mm = juce::MessageManager::getInstance();
    while (condition()) {
        mm->runDispatchLoopUntil(20);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    juce::ScopedJuceInitialiser_GUI juceInit;

    juce::StringArray args;
    for (int i = 1; i < argc; ++i) {
        args.add(juce::String::fromUTF8(argv[i]));
    }

    Options options;
    if (!parseArguments(args, options) || options.clips.empty()) {
        printUsage();
        return 1;
    }

    auto& config = beatline::Config::getInstance();
    if (options.configFile.isNotEmpty()) {
        config.loadFromFile(options.configFile.toStdString());
    }

    beatline::JuceAudioBackend backend;
    int exitCode = 0;

    {
        beatline::ProjectStore store(backend);
        if (options.bpm) {
            store.setTempo(*options.bpm);
        }

        const auto& tempo = store.getState().tempo;
        for (const auto& clip : options.clips) {
            double x = beatline::TimelineUtils::secondsToPixels(
                clip.startSeconds, tempo.bpm, tempo.beatsPerMeasure, config.getMeasureWidthPx());
            store.addTrack(beatline::TrackType::Audio, clip.file.getFileNameWithoutExtension(),
                           clip.file, {x, 0.0});
        }

        beatline::PlaybackPositionTimer positionTimer(store.getTransport(), store.getController());
        positionTimer.start();

        try {
            if (store.play()) {
                double end = store.getTransport().getMaxPosition();
                std::cout << "Playing " << store.getTracks().size() << " track(s), "
                          << end << " s at " << store.getTempo() << " BPM" << std::endl;

                runMessageLoopWhile(
                    [&store, end] { return store.isPlaying() && store.getPosition() < end; });

                bool stopped = false;
                store.stop([&stopped] { stopped = true; });
                runMessageLoopWhile([&stopped] { return !stopped; });
            } else {
                std::cerr << "Playback failed to start" << std::endl;
                exitCode = 1;
            }
        } catch (const beatline::InitializationError& e) {
            std::cerr << "ERROR: " << e.what() << std::endl;
            exitCode = 1;
        }

        positionTimer.stop();
    }

    backend.shutdown();
    return exitCode;
}
