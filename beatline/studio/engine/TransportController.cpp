#include "TransportController.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/MixUtils.hpp"
#include "../core/TimelineUtils.hpp"

namespace beatline {

TransportController::TransportController(AudioEngine& engine) : engine_(engine) {
    auto& config = Config::getInstance();
    beatsPerMeasure_ = config.getDefaultBeatsPerMeasure();
    beatUnit_ = config.getDefaultBeatUnit();
    setTempo(config.getDefaultBpm());
}

TransportController::~TransportController() {
    ++generation_;
    cancelScheduled();
}

// ============================================================================
// Transitions
// ============================================================================

bool TransportController::play() {
    // Device failures go straight to the caller
    engine_.initialize();

    try {
        auto& clock = engine_.getClock();
        ++generation_;

        // Clean reference point for every offset computed below
        if (clock.isRunning()) {
            clock.pause();
        }
        cancelScheduled();
        resetUnits();

        for (auto* track : engine_.getAllTracks()) {
            try {
                scheduleTrack(*track);
            } catch (const PlaybackError& e) {
                std::cerr << "TRANSPORT: Track " << e.getTrackId()
                          << " failed to start: " << e.what() << std::endl;
            }
        }

        clock.start();
        playing_ = true;
        std::cout << "TRANSPORT: Playing from " << clock.getPosition() << "s, "
                  << scheduled_.size() << " deferred" << std::endl;
        return true;
    } catch (const InitializationError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "TRANSPORT: Playback failed, stopping: " << e.what() << std::endl;
        stop();
        return false;
    }
}

void TransportController::pause(CompletionCallback onComplete) {
    auto& clock = engine_.getClock();
    bool wasPlaying = playing_;
    playing_ = false;
    auto generation = ++generation_;

    cancelScheduled();
    engine_.getNoteOutput().allNotesOff();

    bool fading = wasPlaying && fadeOutActiveUnits();
    clock.pause();
    engine_.pauseAllPlayback();
    std::cout << "TRANSPORT: Paused at " << clock.getPosition() << "s" << std::endl;

    auto finish = [safeThis = juce::WeakReference<TransportController>(this), generation,
                   onComplete] {
        auto* self = safeThis.get();
        if (self == nullptr) {
            return;
        }
        // A newer transition already owns the units
        if (generation == self->generation_) {
            self->engine_.stopAllPlayback();
        }
        if (onComplete) {
            onComplete();
        }
    };

    if (fading) {
        clock.callAfter(Config::getInstance().getFadeTimeSeconds(), std::move(finish));
    } else {
        finish();
    }
}

void TransportController::stop(CompletionCallback onComplete) {
    auto& clock = engine_.getClock();
    bool wasPlaying = playing_;
    playing_ = false;
    auto generation = ++generation_;

    cancelScheduled();
    engine_.getNoteOutput().allNotesOff();

    bool fading = wasPlaying && fadeOutActiveUnits();
    clock.stop();
    std::cout << "TRANSPORT: Stopped" << std::endl;

    auto finish = [safeThis = juce::WeakReference<TransportController>(this), generation,
                   onComplete] {
        auto* self = safeThis.get();
        if (self == nullptr) {
            return;
        }
        if (generation == self->generation_) {
            self->engine_.stopAllPlayback();
            self->resetUnits();
        }
        if (onComplete) {
            onComplete();
        }
    };

    if (fading) {
        clock.callAfter(Config::getInstance().getFadeTimeSeconds(), std::move(finish));
    } else {
        finish();
    }
}

void TransportController::seek(double position) {
    auto& clock = engine_.getClock();
    double target = juce::jlimit(0.0, getMaxPosition(), position);
    bool wasPlaying = playing_;

    ++generation_;
    clock.pause();
    cancelScheduled();
    resetUnits();
    clock.setPosition(target);
    playing_ = false;

    DBG("TRANSPORT: Seek to " << target << "s" << (wasPlaying ? " (resuming)" : ""));

    if (wasPlaying) {
        play();
    }
}

// ============================================================================
// Tempo and meter
// ============================================================================

void TransportController::setTempo(double bpm) {
    auto& config = Config::getInstance();
    double clamped = juce::jlimit(config.getMinBpm(), config.getMaxBpm(), bpm);
    engine_.getClock().setBpm(clamped);
}

double TransportController::getTempo() const {
    return engine_.getClock().getBpm();
}

void TransportController::setTimeSignature(int beatsPerMeasure, int beatUnit) {
    beatsPerMeasure_ = juce::jlimit(1, 32, beatsPerMeasure);
    if (beatUnit > 0 && beatUnit <= 32 && juce::isPowerOfTwo(beatUnit)) {
        beatUnit_ = beatUnit;
    }
}

// ============================================================================
// Layout changes
// ============================================================================

void TransportController::handleTrackPositionChange(TrackId trackId, double newX) {
    engine_.setTrackPosition(trackId, newX);

    if (!playing_) {
        return;
    }

    // The clock cannot move one pending callback, so every track is rescheduled
    reschedule();
}

void TransportController::handleTrackTrimChange(TrackId trackId, double trimStart,
                                                std::optional<double> trimEnd) {
    engine_.setTrackTrim(trackId, trimStart, trimEnd);

    if (playing_) {
        reschedule();
    }
}

void TransportController::handleTempoChange() {
    if (playing_) {
        reschedule();
    }
}

// ============================================================================
// Queries
// ============================================================================

double TransportController::getPosition() const {
    return engine_.getClock().getPosition();
}

double TransportController::getMaxPosition() const {
    double maxPosition = 0.0;
    bool anyDuration = false;

    for (auto* track : engine_.getAllTracks()) {
        if (track->duration) {
            maxPosition = std::max(maxPosition, getTrackOffset(*track) + *track->duration);
            anyDuration = true;
        }
    }

    return anyDuration ? maxPosition : Config::getInstance().getDefaultMaxPosition();
}

double TransportController::getTrackOffset(const EngineTrack& track) const {
    return TimelineUtils::pixelsToSeconds(track.positionX, getTempo(), beatsPerMeasure_,
                                          Config::getInstance().getMeasureWidthPx());
}

// ============================================================================
// Scheduling
// ============================================================================

void TransportController::scheduleTrack(EngineTrack& track) {
    // Re-read for every track, never reuse a stale position
    double transportPosition = engine_.getClock().getPosition();
    double offset = getTrackOffset(track);

    try {
        switch (track.type) {
            case TrackType::Audio:
                if (track.unit) {
                    scheduleUnit(track, transportPosition - offset, offset);
                }
                break;
            case TrackType::MIDI:
            case TrackType::Drum:
                scheduleSequence(track, transportPosition, offset);
                break;
        }
    } catch (const PlaybackError&) {
        throw;
    } catch (const std::exception& e) {
        throw PlaybackError(track.id, e.what());
    }
}

void TransportController::scheduleUnit(EngineTrack& track, double trackPlayTime, double offset) {
    auto& unit = *track.unit;
    double trimEnd = track.trimEnd.value_or(unit.getDuration());
    double playable = trimEnd - track.trimStart;
    if (playable <= 0.0) {
        return;
    }

    double endTime = offset + playable;

    if (trackPlayTime >= 0.0) {
        // Already inside the track's region
        if (trackPlayTime >= playable) {
            return;
        }
        unit.start(0.0, track.trimStart + trackPlayTime);
        unit.setVolumeDb(0.0);
        unit.sync();
    } else {
        double startAt = offset + Config::getInstance().getSafetyBufferSeconds();
        auto generation = generation_;
        auto trackId = track.id;
        scheduled_.push_back(engine_.getClock().scheduleOnce(
            [this, generation, trackId] { startDeferred(generation, trackId); }, startAt));
        endTime = std::max(endTime, startAt);
    }

    // The file itself plays on past a trimmed end
    if (trimEnd < unit.getDuration()) {
        scheduleTrimEnd(track, endTime);
    }
}

void TransportController::scheduleSequence(EngineTrack& track, double transportPosition,
                                           double offset) {
    if (track.sequence.empty()) {
        return;
    }

    auto& clock = engine_.getClock();
    double stepSeconds =
        TimelineUtils::secondsPerStep(getTempo(), Config::getInstance().getGridStepsPerBeat());
    auto generation = generation_;
    auto trackId = track.id;

    for (const auto& note : track.sequence) {
        double onTime = offset + note.startStep * stepSeconds;
        double offTime = onTime + std::max(1, note.lengthSteps) * stepSeconds;

        // Notes already sounding or finished are not retriggered
        if (onTime < transportPosition) {
            continue;
        }

        int channel = note.channel;
        int noteNumber = note.noteNumber;
        int velocity = note.velocity;

        scheduled_.push_back(clock.scheduleOnce(
            [this, generation, trackId, channel, noteNumber, velocity] {
                if (generation != generation_) {
                    return;
                }
                if (std::isinf(engine_.getEffectiveVolumeDb(trackId))) {
                    return;
                }
                engine_.getNoteOutput().noteOn(channel, noteNumber, velocity);
            },
            onTime));

        scheduled_.push_back(clock.scheduleOnce(
            [this, generation, channel, noteNumber] {
                if (generation == generation_) {
                    engine_.getNoteOutput().noteOff(channel, noteNumber);
                }
            },
            offTime));
    }
}

void TransportController::startDeferred(uint64_t generation, TrackId trackId) {
    if (generation != generation_ || !playing_) {
        return;
    }

    auto* track = engine_.getTrack(trackId);
    if (track == nullptr || !track->unit) {
        return;
    }

    try {
        auto& unit = *track->unit;
        if (unit.getState() == UnitState::Started) {
            unit.stop();
        }
        unit.setVolumeDb(MixUtils::silenceDb());
        unit.start(0.0, track->trimStart);
        unit.rampVolumeTo(0.0, Config::getInstance().getFadeTimeSeconds());
        unit.sync();
        DBG("TRANSPORT: Deferred start of track " << trackId << " at " << getPosition() << "s");
    } catch (const std::exception& e) {
        std::cerr << "TRANSPORT: Track " << trackId << " failed to start: " << e.what()
                  << std::endl;
    }
}

void TransportController::scheduleTrimEnd(EngineTrack& track, double endTime) {
    auto generation = generation_;
    auto trackId = track.id;
    scheduled_.push_back(engine_.getClock().scheduleOnce(
        [this, generation, trackId] { endTrimmed(generation, trackId); }, endTime));
}

void TransportController::endTrimmed(uint64_t generation, TrackId trackId) {
    if (generation != generation_ || !playing_) {
        return;
    }

    auto* track = engine_.getTrack(trackId);
    if (track == nullptr || !track->unit || track->unit->getState() != UnitState::Started) {
        return;
    }

    double fadeTime = Config::getInstance().getFadeTimeSeconds();
    track->unit->rampVolumeTo(MixUtils::silenceDb(), fadeTime);
    DBG("TRANSPORT: Track " << trackId << " reached its trim end at " << getPosition() << "s");

    engine_.getClock().callAfter(
        fadeTime, [safeThis = juce::WeakReference<TransportController>(this), generation, trackId] {
            auto* self = safeThis.get();
            if (self == nullptr || generation != self->generation_) {
                return;
            }
            auto* t = self->engine_.getTrack(trackId);
            if (t != nullptr && t->unit && t->unit->getState() == UnitState::Started) {
                t->unit->stop();
            }
        });
}

// ============================================================================
// Helpers
// ============================================================================

void TransportController::cancelScheduled() {
    auto& clock = engine_.getClock();
    for (auto id : scheduled_) {
        clock.clear(id);
    }
    scheduled_.clear();
}

void TransportController::resetUnits() {
    engine_.getNoteOutput().allNotesOff();

    // stop + unsync is safe on a unit that is already stopped
    for (auto* track : engine_.getAllTracks()) {
        if (!track->unit) {
            continue;
        }
        auto& unit = *track->unit;
        if (unit.getState() == UnitState::Started) {
            unit.stop();
        }
        unit.unsync();
        unit.cancelRamps();
        unit.setVolumeDb(0.0);
    }
}

void TransportController::reschedule() {
    auto& clock = engine_.getClock();
    double snapshot = clock.getPosition();

    ++generation_;
    clock.pause();
    cancelScheduled();
    resetUnits();
    clock.setPosition(snapshot);

    DBG("TRANSPORT: Rescheduling all tracks at " << snapshot << "s");
    play();
}

bool TransportController::fadeOutActiveUnits() {
    double fadeTime = Config::getInstance().getFadeTimeSeconds();
    bool anyActive = false;

    for (auto* track : engine_.getAllTracks()) {
        if (track->unit && track->unit->getState() == UnitState::Started) {
            // Free-running while the ramp finishes, the clock is about to stop
            track->unit->unsync();
            track->unit->rampVolumeTo(MixUtils::silenceDb(), fadeTime);
            anyActive = true;
        }
    }

    return anyActive;
}

}  // namespace beatline
