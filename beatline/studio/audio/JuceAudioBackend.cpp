#include "JuceAudioBackend.hpp"

#include <iostream>

#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "ChannelStrip.hpp"
#include "FilePlaybackUnit.hpp"

namespace beatline {

namespace {

constexpr int THREAD_STOP_TIMEOUT_MS = 2000;

}  // namespace

JuceAudioBackend::JuceAudioBackend() {
    formatManager_.registerBasicFormats();

    // Buffering sources block in prepareToPlay until the first chunk is read
    readAheadThread_.startThread();
}

JuceAudioBackend::~JuceAudioBackend() {
    shutdown();
    readAheadThread_.stopThread(THREAD_STOP_TIMEOUT_MS);
}

// ============================================================================
// Lifecycle
// ============================================================================

void JuceAudioBackend::initialize() {
    if (initialized_) {
        return;
    }

    auto& config = Config::getInstance();
    juce::String preferred(config.getPreferredAudioDevice());

    auto error = deviceManager_.initialise(0, 2, nullptr, true, preferred, nullptr);
    if (error.isNotEmpty()) {
        throw InitializationError("Could not open audio device: " + error.toStdString());
    }

    auto* device = deviceManager_.getCurrentAudioDevice();
    if (device == nullptr) {
        throw InitializationError("No audio output device available");
    }

    player_.setSource(&clock_);
    deviceManager_.addAudioCallback(&player_);
    clock_.startDispatching(config.getSchedulerIntervalMs());
    noteOutput_.open();

    initialized_ = true;
    std::cout << "JuceAudioBackend: Using " << device->getName() << " at "
              << device->getCurrentSampleRate() << " Hz" << std::endl;
}

void JuceAudioBackend::shutdown() {
    if (!initialized_) {
        return;
    }

    clock_.stopDispatching();
    deviceManager_.removeAudioCallback(&player_);
    player_.setSource(nullptr);
    deviceManager_.closeAudioDevice();
    noteOutput_.close();

    initialized_ = false;
    std::cout << "JuceAudioBackend: Shut down" << std::endl;
}

// ============================================================================
// Node creation
// ============================================================================

std::unique_ptr<MixChannel> JuceAudioBackend::createChannel() {
    return std::make_unique<ChannelStrip>(masterBus_);
}

std::unique_ptr<PlaybackUnit> JuceAudioBackend::createUnit(const juce::File& file,
                                                           MixChannel& channel) {
    auto* strip = dynamic_cast<ChannelStrip*>(&channel);
    if (strip == nullptr) {
        throw std::runtime_error("Channel was not created by this backend");
    }

    if (!file.existsAsFile()) {
        throw std::runtime_error("File not found: " + file.getFullPathName().toStdString());
    }

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager_.createReaderFor(file));
    if (reader == nullptr) {
        throw std::runtime_error("Could not decode " + file.getFullPathName().toStdString());
    }

    return std::make_unique<FilePlaybackUnit>(std::move(reader), clock_, readAheadThread_,
                                              *strip);
}

}  // namespace beatline
