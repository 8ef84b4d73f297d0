#pragma once

#include <juce_core/juce_core.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "AudioEngine.hpp"

namespace beatline {

/**
 * @brief Drives every track from one global clock
 *
 * States: STOPPED -> play() -> PLAYING -> pause() -> PAUSED -> play() -> PLAYING,
 * and {PLAYING, PAUSED} -> stop() -> STOPPED with the position back at zero.
 * seek() is valid from any state and keeps the play/pause state it found.
 *
 * Every transition cancels all pending scheduled callbacks before doing
 * anything else. A generation counter additionally guards each callback so
 * one queued by the clock before cancellation still does nothing.
 */
class TransportController {
  public:
    using CompletionCallback = std::function<void()>;

    explicit TransportController(AudioEngine& engine);
    ~TransportController();

    // ===== Transitions =====

    /**
     * Start playback from the current clock position.
     * Tracks whose offset has been reached start immediately inside their
     * audio; later tracks get a deferred start.
     * @return false if playback failed and the transport was stopped
     * @throws InitializationError if the audio device cannot be opened
     */
    bool play();

    /**
     * Fade out, stop the units and keep the position.
     * isPlaying() is false as soon as this returns; `onComplete` fires once
     * the fade has finished.
     */
    void pause(CompletionCallback onComplete = nullptr);

    /**
     * Fade out, stop the units and return to zero.
     */
    void stop(CompletionCallback onComplete = nullptr);

    /**
     * Jump to `position` (clamped to [0, getMaxPosition()]).
     * When playing, teardown and replay happen before this returns.
     */
    void seek(double position);

    // ===== Tempo and meter =====

    /** Clamp to the configured tempo range and update the clock. */
    void setTempo(double bpm);
    double getTempo() const;

    void setTimeSignature(int beatsPerMeasure, int beatUnit);
    int getBeatsPerMeasure() const {
        return beatsPerMeasure_;
    }
    int getBeatUnit() const {
        return beatUnit_;
    }

    // ===== Layout changes =====

    /**
     * A track moved on the timeline. Offsets are recomputed lazily when
     * stopped; while playing every schedule is rebuilt at the current position.
     */
    void handleTrackPositionChange(TrackId trackId, double newX);

    /**
     * An audio track's trim region changed. Playback starts at trimStart when
     * the track's offset is reached and is cut at trimEnd.
     */
    void handleTrackTrimChange(TrackId trackId, double trimStart, std::optional<double> trimEnd);

    /** Tempo or meter changed. Rebuilds every schedule while playing. */
    void handleTempoChange();

    // ===== Queries =====
    double getPosition() const;
    bool isPlaying() const {
        return playing_;
    }

    /** Latest end point of any track, or the configured default if none has a length. */
    double getMaxPosition() const;

    /** Timeline offset of a track in seconds at the current tempo. */
    double getTrackOffset(const EngineTrack& track) const;

    size_t getPendingScheduleCount() const {
        return scheduled_.size();
    }

  private:
    void scheduleTrack(EngineTrack& track);
    void scheduleUnit(EngineTrack& track, double trackPlayTime, double offset);
    void scheduleSequence(EngineTrack& track, double transportPosition, double offset);
    void startDeferred(uint64_t generation, TrackId trackId);
    void scheduleTrimEnd(EngineTrack& track, double endTime);
    void endTrimmed(uint64_t generation, TrackId trackId);

    void cancelScheduled();
    void resetUnits();
    void reschedule();
    bool fadeOutActiveUnits();

    AudioEngine& engine_;
    std::vector<TransportClock::ScheduleId> scheduled_;
    uint64_t generation_ = 0;
    bool playing_ = false;

    int beatsPerMeasure_ = 4;
    int beatUnit_ = 4;

    JUCE_DECLARE_WEAK_REFERENCEABLE(TransportController)
    JUCE_DECLARE_NON_COPYABLE(TransportController)
};

}  // namespace beatline
