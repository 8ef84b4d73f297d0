#pragma once

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "beatline/studio/core/Errors.hpp"
#include "beatline/studio/engine/AudioBackend.hpp"

/**
 * In-memory AudioBackend for tests
 *
 * The clock only moves when advance() is called. Scheduled callbacks fire
 * in transport-time order while the clock runs; callAfter() callbacks fire
 * on the fake wall clock whether or not the transport runs.
 */

namespace beatline::test {

// ============================================================================
// FakeTransportClock
// ============================================================================

class FakeTransportClock : public TransportClock {
  public:
    double getPosition() const override {
        return position_;
    }
    void setPosition(double seconds) override {
        position_ = std::max(0.0, seconds);
    }

    bool isRunning() const override {
        return running_;
    }
    void start() override {
        running_ = true;
    }
    void pause() override {
        running_ = false;
    }
    void stop() override {
        running_ = false;
        position_ = 0.0;
    }

    double getBpm() const override {
        return bpm_;
    }
    void setBpm(double bpm) override {
        bpm_ = bpm;
    }

    ScheduleId scheduleOnce(std::function<void()> callback, double transportTime) override {
        auto id = nextId_++;
        scheduled_[id] = {transportTime, std::move(callback)};
        return id;
    }

    void clear(ScheduleId id) override {
        scheduled_.erase(id);
    }

    void callAfter(double seconds, std::function<void()> callback) override {
        delayed_.push_back({wallTime_ + std::max(0.0, seconds), std::move(callback)});
    }

    /** Move wall time forward, firing everything that falls due on the way. */
    void advance(double seconds) {
        const double wallEnd = wallTime_ + seconds;

        while (true) {
            double remaining = wallEnd - wallTime_;
            double bestDelta = std::numeric_limits<double>::infinity();
            ScheduleId bestScheduled = 0;
            int bestDelayed = -1;

            if (running_) {
                for (const auto& [id, pending] : scheduled_) {
                    double delta = std::max(0.0, pending.time - position_);
                    if (delta <= remaining && delta < bestDelta) {
                        bestDelta = delta;
                        bestScheduled = id;
                        bestDelayed = -1;
                    }
                }
            }
            for (size_t i = 0; i < delayed_.size(); ++i) {
                double delta = std::max(0.0, delayed_[i].time - wallTime_);
                if (delta <= remaining && delta < bestDelta) {
                    bestDelta = delta;
                    bestScheduled = 0;
                    bestDelayed = static_cast<int>(i);
                }
            }

            if (bestScheduled == 0 && bestDelayed < 0) {
                break;
            }

            wallTime_ += bestDelta;
            if (running_) {
                position_ += bestDelta;
            }

            std::function<void()> callback;
            if (bestDelayed >= 0) {
                callback = std::move(delayed_[static_cast<size_t>(bestDelayed)].callback);
                delayed_.erase(delayed_.begin() + bestDelayed);
            } else {
                callback = std::move(scheduled_[bestScheduled].callback);
                scheduled_.erase(bestScheduled);
            }
            if (callback) {
                callback();
            }
        }

        if (running_) {
            position_ += wallEnd - wallTime_;
        }
        wallTime_ = wallEnd;
    }

    size_t getScheduledCount() const {
        return scheduled_.size();
    }
    size_t getDelayedCount() const {
        return delayed_.size();
    }

  private:
    struct Pending {
        double time = 0.0;
        std::function<void()> callback;
    };

    double position_ = 0.0;
    double wallTime_ = 0.0;
    bool running_ = false;
    double bpm_ = 120.0;

    std::map<ScheduleId, Pending> scheduled_;
    std::vector<Pending> delayed_;
    ScheduleId nextId_ = 1;
};

// ============================================================================
// FakePlaybackUnit
// ============================================================================

class FakePlaybackUnit : public PlaybackUnit {
  public:
    explicit FakePlaybackUnit(double duration) : duration_(duration) {}

    UnitState getState() const override {
        return state_;
    }

    void start(double when, double offset) override {
        if (failStart) {
            throw std::runtime_error("Device rejected start");
        }
        if (state_ == UnitState::Started) {
            throw std::runtime_error("start() on a started unit");
        }
        state_ = UnitState::Started;
        lastWhen = when;
        lastOffset = offset;
        startOffsets.push_back(offset);
    }

    void stop() override {
        if (state_ != UnitState::Started) {
            throw std::runtime_error("stop() on a stopped unit");
        }
        state_ = UnitState::Stopped;
        ++stopCount;
    }

    void seek(double offset) override {
        lastOffset = offset;
    }

    void sync() override {
        synced_ = true;
    }
    void unsync() override {
        synced_ = false;
    }
    bool isSynced() const override {
        return synced_;
    }

    double getVolumeDb() const override {
        return volumeDb_;
    }
    void setVolumeDb(double db) override {
        volumeDb_ = db;
    }
    void rampVolumeTo(double db, double seconds) override {
        volumeDb_ = db;
        lastRampTarget = db;
        lastRampSeconds = seconds;
        ++rampCount;
    }
    void cancelRamps() override {
        ++cancelCount;
    }

    double getDuration() const override {
        return duration_;
    }

    bool failStart = false;

    // Recorded calls
    std::vector<double> startOffsets;
    double lastWhen = 0.0;
    double lastOffset = 0.0;
    int stopCount = 0;
    int rampCount = 0;
    int cancelCount = 0;
    double lastRampTarget = 0.0;
    double lastRampSeconds = 0.0;

  private:
    double duration_;
    UnitState state_ = UnitState::Stopped;
    bool synced_ = false;
    double volumeDb_ = 0.0;
};

// ============================================================================
// FakeMixChannel
// ============================================================================

class FakeMixChannel : public MixChannel {
  public:
    void setVolumeDb(double db) override {
        volumeDb_ = db;
    }
    double getVolumeDb() const override {
        return volumeDb_;
    }
    void setPan(double pan) override {
        pan_ = pan;
    }
    double getPan() const override {
        return pan_;
    }
    void setMute(bool muted) override {
        muted_ = muted;
    }
    bool isMuted() const override {
        return muted_;
    }

  private:
    double volumeDb_ = 0.0;
    double pan_ = 0.0;
    bool muted_ = false;
};

// ============================================================================
// FakeNoteOutput
// ============================================================================

class FakeNoteOutput : public NoteOutput {
  public:
    enum class Kind { On, Off, AllOff };

    struct Event {
        Kind kind;
        int channel;
        int noteNumber;
        int velocity;
    };

    void noteOn(int channel, int noteNumber, int velocity) override {
        events.push_back({Kind::On, channel, noteNumber, velocity});
    }
    void noteOff(int channel, int noteNumber) override {
        events.push_back({Kind::Off, channel, noteNumber, 0});
    }
    void allNotesOff() override {
        events.push_back({Kind::AllOff, 0, 0, 0});
    }

    std::vector<Event> noteOns() const {
        std::vector<Event> result;
        for (const auto& e : events) {
            if (e.kind == Kind::On) {
                result.push_back(e);
            }
        }
        return result;
    }

    std::vector<Event> events;
};

// ============================================================================
// FakeAudioBackend
// ============================================================================

class FakeAudioBackend : public AudioBackend {
  public:
    void initialize() override {
        ++initializeCalls;
        if (failInitialize) {
            throw InitializationError("No output device");
        }
        initialized_ = true;
    }
    void shutdown() override {
        initialized_ = false;
    }
    bool isInitialized() const override {
        return initialized_;
    }

    std::unique_ptr<MixChannel> createChannel() override {
        return std::make_unique<FakeMixChannel>();
    }

    /** Decodes only files registered with addFile(), by file name. */
    std::unique_ptr<PlaybackUnit> createUnit(const juce::File& file, MixChannel&) override {
        auto it = fileDurations_.find(file.getFileName().toStdString());
        if (it == fileDurations_.end()) {
            throw std::runtime_error("Unable to decode " + file.getFileName().toStdString());
        }
        return std::make_unique<FakePlaybackUnit>(it->second);
    }

    TransportClock& getClock() override {
        return clock;
    }
    NoteOutput& getNoteOutput() override {
        return notes;
    }

    /** Register a decodable file and return it. */
    juce::File addFile(const std::string& name, double duration) {
        fileDurations_[name] = duration;
        return juce::File("/tmp/beatline-tests").getChildFile(name);
    }

    FakeTransportClock clock;
    FakeNoteOutput notes;
    bool failInitialize = false;
    int initializeCalls = 0;

  private:
    bool initialized_ = false;
    std::map<std::string, double> fileDurations_;
};

}  // namespace beatline::test
