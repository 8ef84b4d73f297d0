#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "../core/HistoryManager.hpp"
#include "../engine/AudioEngine.hpp"
#include "../engine/TransportController.hpp"
#include "ProjectController.hpp"

namespace beatline {

/**
 * @brief Session coordinator
 *
 * Builds the engine, transport, reducer and history for one session and
 * turns UI intents into Actions. Grid editors (piano roll, drum machine)
 * read tracks, notes and pads through the query accessors and subscribe for
 * change notifications.
 *
 *   UI intent -> ProjectStore -> Action -> HistoryManager
 *   -> ProjectController -> AudioEngine/Transport + ProjectState -> subscribers
 */
class ProjectStore : private ProjectStateListener, private HistoryListener {
  public:
    using Subscriber = std::function<void()>;

    explicit ProjectStore(AudioBackend& backend);
    ~ProjectStore() override;

    // ===== Transport =====
    bool play();
    void pause(TransportController::CompletionCallback onComplete = nullptr);
    void stop(TransportController::CompletionCallback onComplete = nullptr);
    void seek(double position);

    double getPosition() const;
    bool isPlaying() const;
    double getTempo() const;

    // ===== Track intents =====

    /**
     * Add a track. An empty name gets the default "<Type> Track N".
     * @return The new track's id
     */
    TrackId addTrack(TrackType type, const juce::String& name = {}, const juce::File& file = {},
                     TrackPosition position = {});
    void deleteTrack(TrackId trackId);

    /** Delete several tracks as a single undo step. */
    void deleteTracks(const std::vector<TrackId>& trackIds);

    void moveTrack(TrackId trackId, TrackPosition position);

    /** Play only [trimStart, trimEnd) seconds of an audio track's file. */
    void trimTrack(TrackId trackId, double trimStart, std::optional<double> trimEnd = {});
    void setTrackVolume(TrackId trackId, double volume);
    void setTrackPan(TrackId trackId, double pan);
    void setTrackMute(TrackId trackId, bool muted);
    void setTrackSolo(TrackId trackId, bool soloed);

    // ===== Project intents =====

    /** Tempo from the UI is rounded and limited to 1-999; the transport clamps further. */
    void setTempo(double bpm);
    void setTimeSignature(int numerator, int denominator);
    void setKeySignature(const juce::String& key);

    // ===== Note intents =====
    NoteId createNote(TrackId trackId, int pitch, int column, int length, int velocity = 100);
    void moveNote(TrackId trackId, NoteId noteId, int pitch, int column);
    void resizeNote(TrackId trackId, NoteId noteId, int length);
    void setNoteVelocity(TrackId trackId, NoteId noteId, int velocity);
    void deleteNote(TrackId trackId, NoteId noteId);
    void toggleDrumPad(TrackId trackId, int column, int row);

    // ===== History =====
    bool undo();
    bool redo();
    bool canUndo() const;
    bool canRedo() const;

    // ===== Queries =====
    const std::vector<TrackInfo>& getTracks() const;
    const TrackInfo* getTrackById(TrackId trackId) const;
    std::vector<DrumPad> getDrumPads(TrackId trackId) const;
    std::vector<MidiNote> getNotes(TrackId trackId) const;
    const ProjectState& getState() const;

    // ===== Subscription =====

    /** @return token for unsubscribe() */
    int subscribe(Subscriber subscriber);
    void unsubscribe(int token);

    // ===== Components =====
    AudioEngine& getEngine() {
        return engine_;
    }
    TransportController& getTransport() {
        return transport_;
    }
    ProjectController& getController() {
        return controller_;
    }
    HistoryManager& getHistory() {
        return history_;
    }

  private:
    void projectStateChanged(const ProjectState& state,
                             ProjectController::ChangeFlags changes) override;
    void historyChanged() override;

    void submit(std::unique_ptr<Action> action);
    void syncPlayhead();
    void notifySubscribers();
    juce::String makeDefaultName(TrackType type) const;

    // Declaration order is destruction order in reverse: history goes first
    AudioEngine engine_;
    TransportController transport_;
    ProjectController controller_;
    HistoryManager history_;

    std::map<int, Subscriber> subscribers_;
    int nextSubscriberToken_ = 1;

    TrackId nextTrackId_ = 1;
    NoteId nextNoteId_ = 1;

    JUCE_DECLARE_NON_COPYABLE(ProjectStore)
};

}  // namespace beatline
