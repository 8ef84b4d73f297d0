#include "FilePlaybackUnit.hpp"

#include "AudioClock.hpp"
#include "ChannelStrip.hpp"

namespace beatline {

namespace {

constexpr int READ_AHEAD_SAMPLES = 32768;

}  // namespace

FilePlaybackUnit::FilePlaybackUnit(std::unique_ptr<juce::AudioFormatReader> reader,
                                   AudioClock& clock, juce::TimeSliceThread& readAheadThread,
                                   ChannelStrip& channel)
    : clock_(clock), channel_(channel) {
    double sourceRate = reader->sampleRate;
    int numChannels = juce::jlimit(1, 2, static_cast<int>(reader->numChannels));
    if (sourceRate > 0.0) {
        duration_ = static_cast<double>(reader->lengthInSamples) / sourceRate;
    }

    readerSource_ = std::make_unique<juce::AudioFormatReaderSource>(reader.release(), true);
    transport_.setSource(readerSource_.get(), READ_AHEAD_SAMPLES, &readAheadThread, sourceRate,
                         numChannels);

    channel_.addInput(this);
}

FilePlaybackUnit::~FilePlaybackUnit() {
    channel_.removeInput(this);
    transport_.setSource(nullptr);
}

// ===== PlaybackUnit =====

UnitState FilePlaybackUnit::getState() const {
    return transport_.isPlaying() ? UnitState::Started : UnitState::Stopped;
}

void FilePlaybackUnit::start(double when, double offset) {
    transport_.setPosition(juce::jlimit(0.0, duration_, offset));
    startDelaySamples_.store(static_cast<int64_t>(juce::jmax(0.0, when) * sampleRate_.load()));
    transport_.start();
}

void FilePlaybackUnit::stop() {
    transport_.stop();
    startDelaySamples_.store(0);
}

void FilePlaybackUnit::seek(double offset) {
    transport_.setPosition(juce::jlimit(0.0, duration_, offset));
}

void FilePlaybackUnit::sync() {
    synced_.store(true);
}

void FilePlaybackUnit::unsync() {
    synced_.store(false);
}

bool FilePlaybackUnit::isSynced() const {
    return synced_.load();
}

double FilePlaybackUnit::getVolumeDb() const {
    return volumeDb_;
}

void FilePlaybackUnit::setVolumeDb(double db) {
    requestGain(db, 0.0);
}

void FilePlaybackUnit::rampVolumeTo(double db, double seconds) {
    requestGain(db, seconds);
}

void FilePlaybackUnit::cancelRamps() {
    holdRequested_.store(true);
}

double FilePlaybackUnit::getDuration() const {
    return duration_;
}

void FilePlaybackUnit::requestGain(double db, double seconds) {
    volumeDb_ = db;
    requestedGain_.store(juce::Decibels::decibelsToGain(static_cast<float>(db)));
    requestedRampSeconds_.store(seconds);
    gainRequestPending_.store(true);
}

// ===== AudioSource =====

void FilePlaybackUnit::prepareToPlay(int samplesPerBlockExpected, double sampleRate) {
    sampleRate_.store(sampleRate);
    transport_.prepareToPlay(samplesPerBlockExpected, sampleRate);
    gain_.reset(sampleRate, 0.0);
    gain_.setCurrentAndTargetValue(requestedGain_.load());
}

void FilePlaybackUnit::releaseResources() {
    transport_.releaseResources();
}

void FilePlaybackUnit::getNextAudioBlock(const juce::AudioSourceChannelInfo& info) {
    if (holdRequested_.exchange(false)) {
        gain_.setCurrentAndTargetValue(gain_.getCurrentValue());
    }

    if (gainRequestPending_.exchange(false)) {
        float target = requestedGain_.load();
        double seconds = requestedRampSeconds_.load();
        if (seconds <= 0.0) {
            gain_.setCurrentAndTargetValue(target);
        } else {
            float current = gain_.getCurrentValue();
            gain_.reset(sampleRate_.load(), seconds);
            gain_.setCurrentAndTargetValue(current);
            gain_.setTargetValue(target);
        }
    }

    // Only a playing transport is held back. Once stop() has cleared the playing
    // flag the block must reach the transport, which fades it out and signals the
    // waiting stop() call.
    if (transport_.isPlaying()) {
        // A synced unit is silent and holds its place while the clock is stopped
        if (synced_.load() && !clock_.isRunning()) {
            info.clearActiveBufferRegion();
            return;
        }

        auto delay = startDelaySamples_.load();
        if (delay > 0) {
            info.clearActiveBufferRegion();
            startDelaySamples_.store(juce::jmax<int64_t>(0, delay - info.numSamples));
            return;
        }
    }

    transport_.getNextAudioBlock(info);

    auto* buffer = info.buffer;
    const int numChannels = buffer->getNumChannels();
    float* left = numChannels > 0 ? buffer->getWritePointer(0, info.startSample) : nullptr;
    float* right = numChannels > 1 ? buffer->getWritePointer(1, info.startSample) : nullptr;

    for (int i = 0; i < info.numSamples; ++i) {
        float gain = gain_.getNextValue();
        if (left != nullptr)
            left[i] *= gain;
        if (right != nullptr)
            right[i] *= gain;
    }
}

}  // namespace beatline
