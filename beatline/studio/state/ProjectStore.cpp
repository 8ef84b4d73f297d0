#include "ProjectStore.hpp"

#include <algorithm>
#include <iostream>

#include "../core/Config.hpp"
#include "NoteActions.hpp"
#include "ProjectActions.hpp"
#include "TrackActions.hpp"

namespace beatline {

ProjectStore::ProjectStore(AudioBackend& backend)
    : engine_(backend),
      transport_(engine_),
      controller_(engine_, transport_),
      history_(static_cast<size_t>(Config::getInstance().getMaxUndoSteps())) {
    controller_.addListener(this);
    history_.addListener(this);
}

ProjectStore::~ProjectStore() {
    history_.removeListener(this);
    controller_.removeListener(this);
    subscribers_.clear();
}

// ============================================================================
// Transport
// ============================================================================

bool ProjectStore::play() {
    bool started = transport_.play();
    syncPlayhead();
    return started;
}

void ProjectStore::pause(TransportController::CompletionCallback onComplete) {
    transport_.pause(std::move(onComplete));
    syncPlayhead();
}

void ProjectStore::stop(TransportController::CompletionCallback onComplete) {
    transport_.stop(std::move(onComplete));
    syncPlayhead();
}

void ProjectStore::seek(double position) {
    transport_.seek(position);
    syncPlayhead();
}

double ProjectStore::getPosition() const {
    return transport_.getPosition();
}

bool ProjectStore::isPlaying() const {
    return transport_.isPlaying();
}

double ProjectStore::getTempo() const {
    return controller_.getState().tempo.bpm;
}

// ============================================================================
// Track intents
// ============================================================================

TrackId ProjectStore::addTrack(TrackType type, const juce::String& name, const juce::File& file,
                               TrackPosition position) {
    TrackInfo track;
    track.id = nextTrackId_++;
    track.name = name.isNotEmpty() ? name : makeDefaultName(type);
    track.content = makeTrackContent(type, file);
    track.volume = Config::getInstance().getDefaultTrackVolume();
    track.position = position;

    submit(std::make_unique<AddTrackAction>(controller_, track));
    return track.id;
}

void ProjectStore::deleteTrack(TrackId trackId) {
    submit(std::make_unique<DeleteTrackAction>(controller_, trackId));
}

void ProjectStore::deleteTracks(const std::vector<TrackId>& trackIds) {
    if (trackIds.empty()) {
        return;
    }
    if (trackIds.size() == 1) {
        deleteTrack(trackIds.front());
        return;
    }

    auto group = std::make_unique<CompositeAction>("Delete " + juce::String(trackIds.size()) +
                                                   " Tracks");
    for (auto trackId : trackIds) {
        group->addAction(std::make_unique<DeleteTrackAction>(controller_, trackId));
    }
    submit(std::move(group));
}

void ProjectStore::moveTrack(TrackId trackId, TrackPosition position) {
    submit(std::make_unique<MoveTrackAction>(controller_, trackId, position));
}

void ProjectStore::trimTrack(TrackId trackId, double trimStart, std::optional<double> trimEnd) {
    submit(std::make_unique<TrimTrackAction>(controller_, trackId, trimStart, trimEnd));
}

void ProjectStore::setTrackVolume(TrackId trackId, double volume) {
    submit(std::make_unique<ChangeVolumeAction>(controller_, trackId, volume));
}

void ProjectStore::setTrackPan(TrackId trackId, double pan) {
    submit(std::make_unique<ChangePanAction>(controller_, trackId, pan));
}

void ProjectStore::setTrackMute(TrackId trackId, bool muted) {
    submit(std::make_unique<ChangeMuteAction>(controller_, trackId, muted));
}

void ProjectStore::setTrackSolo(TrackId trackId, bool soloed) {
    submit(std::make_unique<ChangeSoloAction>(controller_, trackId, soloed));
}

// ============================================================================
// Project intents
// ============================================================================

void ProjectStore::setTempo(double bpm) {
    int validated = juce::jlimit(1, 999, juce::roundToInt(bpm));
    submit(std::make_unique<ChangeBpmAction>(controller_, static_cast<double>(validated)));
}

void ProjectStore::setTimeSignature(int numerator, int denominator) {
    submit(std::make_unique<ChangeTimeSignatureAction>(controller_, numerator, denominator));
}

void ProjectStore::setKeySignature(const juce::String& key) {
    submit(std::make_unique<ChangeKeySignatureAction>(controller_, key));
}

// ============================================================================
// Note intents
// ============================================================================

NoteId ProjectStore::createNote(TrackId trackId, int pitch, int column, int length,
                                int velocity) {
    MidiNote note;
    note.id = nextNoteId_++;
    note.pitch = pitch;
    note.column = column;
    note.length = length;
    note.velocity = velocity;

    submit(std::make_unique<CreateNoteAction>(controller_, trackId, note));
    return note.id;
}

void ProjectStore::moveNote(TrackId trackId, NoteId noteId, int pitch, int column) {
    submit(std::make_unique<MoveNoteAction>(controller_, trackId, noteId, pitch, column));
}

void ProjectStore::resizeNote(TrackId trackId, NoteId noteId, int length) {
    submit(std::make_unique<ResizeNoteAction>(controller_, trackId, noteId, length));
}

void ProjectStore::setNoteVelocity(TrackId trackId, NoteId noteId, int velocity) {
    submit(std::make_unique<ChangeNoteVelocityAction>(controller_, trackId, noteId, velocity));
}

void ProjectStore::deleteNote(TrackId trackId, NoteId noteId) {
    submit(std::make_unique<DeleteNoteAction>(controller_, trackId, noteId));
}

void ProjectStore::toggleDrumPad(TrackId trackId, int column, int row) {
    submit(std::make_unique<ToggleDrumPadAction>(controller_, trackId, column, row));
}

// ============================================================================
// History
// ============================================================================

bool ProjectStore::undo() {
    return history_.undo();
}

bool ProjectStore::redo() {
    return history_.redo();
}

bool ProjectStore::canUndo() const {
    return history_.canUndo();
}

bool ProjectStore::canRedo() const {
    return history_.canRedo();
}

// ============================================================================
// Queries
// ============================================================================

const std::vector<TrackInfo>& ProjectStore::getTracks() const {
    return controller_.getState().tracks;
}

const TrackInfo* ProjectStore::getTrackById(TrackId trackId) const {
    return controller_.getState().findTrack(trackId);
}

std::vector<DrumPad> ProjectStore::getDrumPads(TrackId trackId) const {
    const auto* track = getTrackById(trackId);
    if (track == nullptr || track->getPads() == nullptr) {
        return {};
    }
    return *track->getPads();
}

std::vector<MidiNote> ProjectStore::getNotes(TrackId trackId) const {
    const auto* track = getTrackById(trackId);
    if (track == nullptr || track->getNotes() == nullptr) {
        return {};
    }
    return *track->getNotes();
}

const ProjectState& ProjectStore::getState() const {
    return controller_.getState();
}

// ============================================================================
// Subscription
// ============================================================================

int ProjectStore::subscribe(Subscriber subscriber) {
    int token = nextSubscriberToken_++;
    subscribers_[token] = std::move(subscriber);
    return token;
}

void ProjectStore::unsubscribe(int token) {
    subscribers_.erase(token);
}

void ProjectStore::projectStateChanged(const ProjectState&,
                                       ProjectController::ChangeFlags changes) {
    // The moving playhead is polled, not pushed
    if (changes == ProjectController::ChangeFlags::Playhead) {
        return;
    }
    notifySubscribers();
}

void ProjectStore::historyChanged() {
    notifySubscribers();
}

// ============================================================================
// Helpers
// ============================================================================

void ProjectStore::submit(std::unique_ptr<Action> action) {
    history_.executeAction(std::move(action));
}

void ProjectStore::syncPlayhead() {
    controller_.dispatch(SetPlaybackStateEvent{transport_.isPlaying()});
    controller_.dispatch(SetPlaybackPositionEvent{transport_.getPosition()});
}

void ProjectStore::notifySubscribers() {
    // Copy so a subscriber may unsubscribe from inside its callback
    auto subscribers = subscribers_;
    for (auto& [token, subscriber] : subscribers) {
        juce::ignoreUnused(token);
        if (subscriber) {
            subscriber();
        }
    }
}

juce::String ProjectStore::makeDefaultName(TrackType type) const {
    const auto& tracks = controller_.getState().tracks;
    auto count = std::count_if(tracks.begin(), tracks.end(),
                               [type](const TrackInfo& t) { return t.getType() == type; });
    return juce::String(getTrackTypeName(type)) + " Track " +
           juce::String(static_cast<int>(count) + 1);
}

}  // namespace beatline
