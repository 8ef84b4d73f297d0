#pragma once

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include "../engine/AudioBackend.hpp"
#include "AudioClock.hpp"
#include "MidiNoteOutput.hpp"

namespace beatline {

/**
 * @brief AudioBackend on top of the JUCE audio device layer
 *
 * Signal flow:
 *   FilePlaybackUnit -> ChannelStrip -> master bus -> AudioClock -> device
 *
 * Must outlive every channel and unit it creates.
 */
class JuceAudioBackend : public AudioBackend {
  public:
    JuceAudioBackend();
    ~JuceAudioBackend() override;

    // ===== Lifecycle =====
    void initialize() override;
    void shutdown() override;
    bool isInitialized() const override {
        return initialized_;
    }

    // ===== Node creation =====
    std::unique_ptr<MixChannel> createChannel() override;
    std::unique_ptr<PlaybackUnit> createUnit(const juce::File& file, MixChannel& channel) override;

    TransportClock& getClock() override {
        return clock_;
    }
    NoteOutput& getNoteOutput() override {
        return noteOutput_;
    }

    juce::AudioDeviceManager& getDeviceManager() {
        return deviceManager_;
    }

  private:
    juce::AudioDeviceManager deviceManager_;
    juce::AudioFormatManager formatManager_;
    juce::TimeSliceThread readAheadThread_{"Beatline Read-Ahead"};

    juce::MixerAudioSource masterBus_;
    AudioClock clock_{masterBus_};
    juce::AudioSourcePlayer player_;
    MidiNoteOutput noteOutput_;

    bool initialized_ = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceAudioBackend)
};

}  // namespace beatline
