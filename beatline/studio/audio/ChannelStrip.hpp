#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <atomic>

#include "../engine/AudioBackend.hpp"

namespace beatline {

/**
 * @brief Per-track channel: sums its inputs, applies fader, pan and mute
 *
 * Adds itself to the master bus on construction and removes itself on
 * destruction. Parameter changes are smoothed on the audio thread.
 */
class ChannelStrip : public MixChannel, public juce::AudioSource {
  public:
    explicit ChannelStrip(juce::MixerAudioSource& masterBus);
    ~ChannelStrip() override;

    // ===== MixChannel =====
    void setVolumeDb(double db) override;
    double getVolumeDb() const override;
    void setPan(double pan) override;
    double getPan() const override;
    void setMute(bool muted) override;
    bool isMuted() const override;

    // ===== Inputs =====
    void addInput(juce::AudioSource* source);
    void removeInput(juce::AudioSource* source);

    // ===== AudioSource =====
    void prepareToPlay(int samplesPerBlockExpected, double sampleRate) override;
    void releaseResources() override;
    void getNextAudioBlock(const juce::AudioSourceChannelInfo& info) override;

  private:
    void updateTargets();

    juce::MixerAudioSource& masterBus_;
    juce::MixerAudioSource inputs_;

    std::atomic<double> volumeDb_{0.0};
    std::atomic<double> pan_{0.0};
    std::atomic<bool> muted_{false};

    std::atomic<float> targetLeft_{1.0f};
    std::atomic<float> targetRight_{1.0f};
    juce::LinearSmoothedValue<float> leftGain_{1.0f};
    juce::LinearSmoothedValue<float> rightGain_{1.0f};

    static constexpr double SMOOTHING_SECONDS = 0.02;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ChannelStrip)
};

}  // namespace beatline
