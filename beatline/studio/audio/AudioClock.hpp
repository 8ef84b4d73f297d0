#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_events/juce_events.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "../engine/AudioBackend.hpp"

namespace beatline {

/**
 * @brief Sample-counting transport clock
 *
 * Wraps the master bus: every block pulled through it advances the position
 * while the clock runs. Scheduled and wall-clock callbacks are collected on
 * the message thread by a timer, so they never run on the audio thread.
 *
 * Thread Safety:
 * - Position and run state: atomics, written by both threads
 * - Schedules: message thread only
 */
class AudioClock : public TransportClock, public juce::AudioSource, private juce::Timer {
  public:
    explicit AudioClock(juce::AudioSource& input);
    ~AudioClock() override;

    // ===== TransportClock =====
    double getPosition() const override;
    void setPosition(double seconds) override;

    bool isRunning() const override;
    void start() override;
    void pause() override;
    void stop() override;

    double getBpm() const override;
    void setBpm(double bpm) override;

    ScheduleId scheduleOnce(std::function<void()> callback, double transportTime) override;
    void clear(ScheduleId id) override;
    void callAfter(double seconds, std::function<void()> callback) override;

    // ===== AudioSource =====
    void prepareToPlay(int samplesPerBlockExpected, double sampleRate) override;
    void releaseResources() override;
    void getNextAudioBlock(const juce::AudioSourceChannelInfo& info) override;

    // ===== Dispatch =====
    void startDispatching(int intervalMs);
    void stopDispatching();

    /** Fire every callback that is due, in time order. */
    void dispatchDueEvents();

  private:
    void timerCallback() override;

    struct PendingCallback {
        double time;  // Transport seconds, or wall seconds for delayed calls
        std::function<void()> callback;
    };

    juce::AudioSource& input_;

    std::atomic<int64_t> samplePosition_{0};
    std::atomic<bool> running_{false};
    std::atomic<double> sampleRate_{44100.0};
    double bpm_ = 120.0;

    std::map<ScheduleId, PendingCallback> scheduled_;
    std::vector<PendingCallback> delayed_;
    ScheduleId nextId_ = 1;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioClock)
};

}  // namespace beatline
