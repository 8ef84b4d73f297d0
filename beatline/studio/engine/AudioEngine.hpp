#pragma once

#include <juce_core/juce_core.h>

#include <memory>
#include <optional>
#include <vector>

#include "../core/TrackTypes.hpp"
#include "AudioBackend.hpp"

namespace beatline {

/**
 * @brief A note the transport schedules for a MIDI or drum track
 *
 * Timing is in grid steps so the sequence stays valid across tempo changes.
 */
struct SequenceNote {
    int startStep = 0;
    int lengthSteps = 1;
    int channel = 1;  // 1-16
    int noteNumber = 60;
    int velocity = 100;
};

/**
 * @brief Engine-side view of a track: its audio nodes and what the transport needs
 *
 * The unit is declared after the channel so it is destroyed first.
 */
struct EngineTrack {
    TrackId id = INVALID_TRACK_ID;
    juce::String name;
    TrackType type = TrackType::Audio;

    std::unique_ptr<MixChannel> channel;
    std::unique_ptr<PlaybackUnit> unit;  // Audio tracks with a decoded file only

    double volume = 80.0;  // Fader value (0-100)
    double pan = 0.0;      // -100 to 100
    bool muted = false;
    bool soloed = false;

    double positionX = 0.0;          // Timeline offset in pixels
    std::optional<double> duration;  // Seconds, after trimming
    double trimStart = 0.0;          // Seconds into the unit's audio
    std::optional<double> trimEnd;   // Empty plays to the end
    std::vector<SequenceNote> sequence;
};

/**
 * @brief Owns the mixing graph and every track's playback nodes
 *
 * One instance per session, constructed explicitly and handed to the
 * transport and the project controller.
 */
class AudioEngine {
  public:
    explicit AudioEngine(AudioBackend& backend);
    ~AudioEngine();

    // ===== Lifecycle =====

    /** Open the audio device if not yet open. Throws InitializationError. */
    void initialize();
    void shutdown();
    bool isInitialized() const;

    // ===== Tracks =====

    /**
     * Create a track with its own channel on the master bus.
     * Any existing track with the same id is disposed first. If `file` is
     * given it is decoded into a playback unit; a decode failure is logged
     * and leaves the track without a unit.
     */
    EngineTrack& createTrack(TrackId id, const juce::String& name, TrackType type,
                             const juce::File& file = {});

    /** Stop and dispose a track's nodes. No-op for unknown ids. */
    void removeTrack(TrackId id);

    EngineTrack* getTrack(TrackId id);
    const EngineTrack* getTrack(TrackId id) const;

    /** Snapshot of the current tracks in creation order. */
    std::vector<EngineTrack*> getAllTracks() const;

    // ===== Mixer =====
    void setTrackVolume(TrackId id, double volume);
    void setTrackPan(TrackId id, double pan);
    void setTrackMute(TrackId id, bool muted);
    void setTrackSolo(TrackId id, bool soloed);

    /** Audible level of a track after mute and solo are applied. */
    double getEffectiveVolumeDb(TrackId id) const;

    // ===== Timeline data used by the transport =====
    void setTrackPosition(TrackId id, double x);
    void setTrackDuration(TrackId id, std::optional<double> duration);
    void setTrackTrim(TrackId id, double trimStart, std::optional<double> trimEnd);
    void setTrackSequence(TrackId id, std::vector<SequenceNote> sequence);

    /** Decoded length of the track's unit, empty without one. */
    std::optional<double> getSourceDuration(TrackId id) const;

    // ===== Playback =====

    /** Stop units that are started. Units keep their sync state. */
    void stopAllPlayback();

    /** Units stay synced to the clock, so pausing the clock is enough. */
    void pauseAllPlayback();

    TransportClock& getClock();
    NoteOutput& getNoteOutput();

  private:
    bool isSilencedBySolo(const EngineTrack& track) const;
    void applyMix(EngineTrack& track);
    void applyMixToAll();

    AudioBackend& backend_;
    std::vector<std::unique_ptr<EngineTrack>> tracks_;

    JUCE_DECLARE_NON_COPYABLE(AudioEngine)
};

}  // namespace beatline
