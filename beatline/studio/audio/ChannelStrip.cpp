#include "ChannelStrip.hpp"

#include <cmath>

namespace beatline {

ChannelStrip::ChannelStrip(juce::MixerAudioSource& masterBus) : masterBus_(masterBus) {
    masterBus_.addInputSource(this, false);
}

ChannelStrip::~ChannelStrip() {
    masterBus_.removeInputSource(this);
    inputs_.removeAllInputs();
}

// ===== MixChannel =====

void ChannelStrip::setVolumeDb(double db) {
    volumeDb_.store(db);
    updateTargets();
}

double ChannelStrip::getVolumeDb() const {
    return volumeDb_.load();
}

void ChannelStrip::setPan(double pan) {
    pan_.store(juce::jlimit(-1.0, 1.0, pan));
    updateTargets();
}

double ChannelStrip::getPan() const {
    return pan_.load();
}

void ChannelStrip::setMute(bool muted) {
    muted_.store(muted);
    updateTargets();
}

bool ChannelStrip::isMuted() const {
    return muted_.load();
}

void ChannelStrip::updateTargets() {
    float gain = 0.0f;
    if (!muted_.load()) {
        gain = juce::Decibels::decibelsToGain(static_cast<float>(volumeDb_.load()));
    }
    auto pan = static_cast<float>(pan_.load());

    // Balance law: centre leaves both sides at unity
    targetLeft_.store(gain * juce::jmin(1.0f, 1.0f - pan));
    targetRight_.store(gain * juce::jmin(1.0f, 1.0f + pan));
}

// ===== Inputs =====

void ChannelStrip::addInput(juce::AudioSource* source) {
    inputs_.addInputSource(source, false);
}

void ChannelStrip::removeInput(juce::AudioSource* source) {
    inputs_.removeInputSource(source);
}

// ===== AudioSource =====

void ChannelStrip::prepareToPlay(int samplesPerBlockExpected, double sampleRate) {
    inputs_.prepareToPlay(samplesPerBlockExpected, sampleRate);
    leftGain_.reset(sampleRate, SMOOTHING_SECONDS);
    rightGain_.reset(sampleRate, SMOOTHING_SECONDS);
    leftGain_.setCurrentAndTargetValue(targetLeft_.load());
    rightGain_.setCurrentAndTargetValue(targetRight_.load());
}

void ChannelStrip::releaseResources() {
    inputs_.releaseResources();
}

void ChannelStrip::getNextAudioBlock(const juce::AudioSourceChannelInfo& info) {
    inputs_.getNextAudioBlock(info);

    leftGain_.setTargetValue(targetLeft_.load());
    rightGain_.setTargetValue(targetRight_.load());

    auto* buffer = info.buffer;
    const int numChannels = buffer->getNumChannels();
    float* left = numChannels > 0 ? buffer->getWritePointer(0, info.startSample) : nullptr;
    float* right = numChannels > 1 ? buffer->getWritePointer(1, info.startSample) : nullptr;

    for (int i = 0; i < info.numSamples; ++i) {
        float leftGain = leftGain_.getNextValue();
        float rightGain = rightGain_.getNextValue();

        if (left != nullptr)
            left[i] *= leftGain;
        if (right != nullptr)
            right[i] *= rightGain;
    }
}

}  // namespace beatline
