#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <memory>

namespace beatline {

/**
 * @brief Play state of a playback unit
 */
enum class UnitState { Started, Stopped };

/**
 * @brief A decoded audio buffer that can be started at an offset
 *
 * A synced unit only produces sound while the transport clock runs.
 * An unsynced unit plays freely once started.
 */
class PlaybackUnit {
  public:
    virtual ~PlaybackUnit() = default;

    virtual UnitState getState() const = 0;

    /**
     * Start playing.
     * @param when Seconds from now before audio begins (0 = immediately)
     * @param offset Seconds into the buffer to start from
     */
    virtual void start(double when, double offset) = 0;
    virtual void stop() = 0;
    virtual void seek(double offset) = 0;

    virtual void sync() = 0;
    virtual void unsync() = 0;
    virtual bool isSynced() const = 0;

    // ===== Unit gain (separate from the track fader) =====
    virtual double getVolumeDb() const = 0;
    virtual void setVolumeDb(double db) = 0;
    virtual void rampVolumeTo(double db, double seconds) = 0;
    virtual void cancelRamps() = 0;

    /** Length of the decoded buffer in seconds. */
    virtual double getDuration() const = 0;
};

/**
 * @brief Per-track mixing channel feeding the master bus
 */
class MixChannel {
  public:
    virtual ~MixChannel() = default;

    virtual void setVolumeDb(double db) = 0;
    virtual double getVolumeDb() const = 0;

    /** @param pan -1 (left) to 1 (right) */
    virtual void setPan(double pan) = 0;
    virtual double getPan() const = 0;

    virtual void setMute(bool muted) = 0;
    virtual bool isMuted() const = 0;
};

/**
 * @brief The global transport clock
 *
 * Scheduled callbacks fire on the message thread once the clock position
 * passes their transport time. Wall-clock callbacks fire regardless of
 * whether the clock runs.
 */
class TransportClock {
  public:
    using ScheduleId = int;

    virtual ~TransportClock() = default;

    virtual double getPosition() const = 0;
    virtual void setPosition(double seconds) = 0;

    virtual bool isRunning() const = 0;
    virtual void start() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;  // Pause and return to zero

    virtual double getBpm() const = 0;
    virtual void setBpm(double bpm) = 0;

    /** Run `callback` once the clock reaches `transportTime` seconds. */
    virtual ScheduleId scheduleOnce(std::function<void()> callback, double transportTime) = 0;
    virtual void clear(ScheduleId id) = 0;

    /** Run `callback` after `seconds` of wall-clock time. */
    virtual void callAfter(double seconds, std::function<void()> callback) = 0;
};

/**
 * @brief Destination for MIDI and drum track notes
 */
class NoteOutput {
  public:
    virtual ~NoteOutput() = default;

    /** @param channel 1-16 */
    virtual void noteOn(int channel, int noteNumber, int velocity) = 0;
    virtual void noteOff(int channel, int noteNumber) = 0;
    virtual void allNotesOff() = 0;
};

/**
 * @brief Factory for the native audio objects the engine is built from
 *
 * Concrete implementations: JuceAudioBackend (audio device) and the
 * fake backend used by the tests.
 */
class AudioBackend {
  public:
    virtual ~AudioBackend() = default;

    // ===== Lifecycle =====

    /** Open the output device. Throws InitializationError on failure. */
    virtual void initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool isInitialized() const = 0;

    // ===== Node creation =====
    virtual std::unique_ptr<MixChannel> createChannel() = 0;

    /**
     * Decode `file` into a unit that plays through `channel`.
     * Throws std::runtime_error if the file cannot be decoded.
     */
    virtual std::unique_ptr<PlaybackUnit> createUnit(const juce::File& file,
                                                     MixChannel& channel) = 0;

    virtual TransportClock& getClock() = 0;
    virtual NoteOutput& getNoteOutput() = 0;
};

}  // namespace beatline
