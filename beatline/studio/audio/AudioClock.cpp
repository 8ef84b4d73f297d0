#include "AudioClock.hpp"

#include <algorithm>

namespace beatline {

namespace {

double wallSeconds() {
    return juce::Time::getMillisecondCounterHiRes() * 0.001;
}

}  // namespace

AudioClock::AudioClock(juce::AudioSource& input) : input_(input) {}

AudioClock::~AudioClock() {
    stopTimer();
}

// ===== TransportClock =====

double AudioClock::getPosition() const {
    return static_cast<double>(samplePosition_.load()) / sampleRate_.load();
}

void AudioClock::setPosition(double seconds) {
    samplePosition_.store(static_cast<int64_t>(std::max(0.0, seconds) * sampleRate_.load()));
}

bool AudioClock::isRunning() const {
    return running_.load();
}

void AudioClock::start() {
    running_.store(true);
}

void AudioClock::pause() {
    running_.store(false);
}

void AudioClock::stop() {
    running_.store(false);
    samplePosition_.store(0);
}

double AudioClock::getBpm() const {
    return bpm_;
}

void AudioClock::setBpm(double bpm) {
    bpm_ = bpm;
}

TransportClock::ScheduleId AudioClock::scheduleOnce(std::function<void()> callback,
                                                    double transportTime) {
    auto id = nextId_++;
    scheduled_[id] = {transportTime, std::move(callback)};
    return id;
}

void AudioClock::clear(ScheduleId id) {
    scheduled_.erase(id);
}

void AudioClock::callAfter(double seconds, std::function<void()> callback) {
    delayed_.push_back({wallSeconds() + seconds, std::move(callback)});
}

// ===== AudioSource =====

void AudioClock::prepareToPlay(int samplesPerBlockExpected, double sampleRate) {
    // Keep the position in seconds across a device rate change
    double position = getPosition();
    sampleRate_.store(sampleRate > 0.0 ? sampleRate : 44100.0);
    setPosition(position);

    input_.prepareToPlay(samplesPerBlockExpected, sampleRate);
}

void AudioClock::releaseResources() {
    input_.releaseResources();
}

void AudioClock::getNextAudioBlock(const juce::AudioSourceChannelInfo& info) {
    input_.getNextAudioBlock(info);

    if (running_.load()) {
        samplePosition_.fetch_add(info.numSamples);
    }
}

// ===== Dispatch =====

void AudioClock::startDispatching(int intervalMs) {
    startTimer(std::max(1, intervalMs));
}

void AudioClock::stopDispatching() {
    stopTimer();
}

void AudioClock::timerCallback() {
    dispatchDueEvents();
}

void AudioClock::dispatchDueEvents() {
    std::vector<PendingCallback> due;

    if (running_.load()) {
        double now = getPosition();
        for (auto it = scheduled_.begin(); it != scheduled_.end();) {
            if (it->second.time <= now) {
                due.push_back(std::move(it->second));
                it = scheduled_.erase(it);
            } else {
                ++it;
            }
        }
        std::stable_sort(due.begin(), due.end(),
                         [](const auto& a, const auto& b) { return a.time < b.time; });
    }

    double wallNow = wallSeconds();
    auto firstFuture =
        std::stable_partition(delayed_.begin(), delayed_.end(),
                              [wallNow](const PendingCallback& c) { return c.time <= wallNow; });
    for (auto it = delayed_.begin(); it != firstFuture; ++it) {
        due.push_back(std::move(*it));
    }
    delayed_.erase(delayed_.begin(), firstFuture);

    // Callbacks may schedule or clear, so they run after the containers settle
    for (auto& pending : due) {
        if (pending.callback) {
            pending.callback();
        }
    }
}

}  // namespace beatline
