#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <cstdint>
#include <memory>

#include "../engine/AudioBackend.hpp"

namespace beatline {

class AudioClock;
class ChannelStrip;

/**
 * @brief Audio file playing through a channel strip
 *
 * Reads ahead on a shared background thread. While synced, output follows
 * the clock: a stopped clock gives silence and holds the read position.
 *
 * stop() waits for the next audio block to pass through the transport, so
 * it returns within one device buffer while the device is running.
 *
 * Thread Safety:
 * - Control calls: message thread
 * - getNextAudioBlock: audio thread; shares only atomics with the control side
 */
class FilePlaybackUnit : public PlaybackUnit, public juce::AudioSource {
  public:
    FilePlaybackUnit(std::unique_ptr<juce::AudioFormatReader> reader, AudioClock& clock,
                     juce::TimeSliceThread& readAheadThread, ChannelStrip& channel);
    ~FilePlaybackUnit() override;

    // ===== PlaybackUnit =====
    UnitState getState() const override;
    void start(double when, double offset) override;
    void stop() override;
    void seek(double offset) override;

    void sync() override;
    void unsync() override;
    bool isSynced() const override;

    double getVolumeDb() const override;
    void setVolumeDb(double db) override;
    void rampVolumeTo(double db, double seconds) override;
    void cancelRamps() override;

    double getDuration() const override;

    // ===== AudioSource =====
    void prepareToPlay(int samplesPerBlockExpected, double sampleRate) override;
    void releaseResources() override;
    void getNextAudioBlock(const juce::AudioSourceChannelInfo& info) override;

  private:
    void requestGain(double db, double seconds);

    AudioClock& clock_;
    ChannelStrip& channel_;

    std::unique_ptr<juce::AudioFormatReaderSource> readerSource_;
    juce::AudioTransportSource transport_;
    double duration_ = 0.0;

    std::atomic<bool> synced_{false};
    std::atomic<int64_t> startDelaySamples_{0};
    std::atomic<double> sampleRate_{44100.0};

    // Gain requests from the message thread, applied on the audio thread
    double volumeDb_ = 0.0;
    std::atomic<float> requestedGain_{1.0f};
    std::atomic<double> requestedRampSeconds_{0.0};
    std::atomic<bool> gainRequestPending_{false};
    std::atomic<bool> holdRequested_{false};
    juce::LinearSmoothedValue<float> gain_{1.0f};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FilePlaybackUnit)
};

}  // namespace beatline
