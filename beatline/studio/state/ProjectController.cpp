#include "ProjectController.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

#include "../core/Config.hpp"
#include "../core/MixUtils.hpp"
#include "../core/TimelineUtils.hpp"

namespace beatline {

namespace {

// General MIDI percussion
constexpr int MIDI_CHANNEL = 1;
constexpr int DRUM_CHANNEL = 10;
constexpr int DRUM_BASE_NOTE = 36;

MidiNote clampNote(MidiNote note) {
    note.pitch = MixUtils::clampMidi(note.pitch);
    note.velocity = MixUtils::clampMidi(note.velocity);
    note.column = std::max(0, note.column);
    note.length = std::max(1, note.length);
    return note;
}

// Keep the trim region inside the decoded file, when its length is known
void clampTrim(AudioContent& audio, std::optional<double> sourceDuration) {
    audio.trimStart = std::max(0.0, audio.trimStart);
    if (sourceDuration) {
        audio.trimStart = std::min(audio.trimStart, *sourceDuration);
    }
    if (audio.trimEnd) {
        double end = std::max(audio.trimStart, *audio.trimEnd);
        audio.trimEnd = sourceDuration ? std::min(end, *sourceDuration) : end;
    }
}

}  // namespace

ProjectController::ProjectController(AudioEngine& engine, TransportController& transport)
    : engine_(engine), transport_(transport) {
    state.tempo.bpm = transport_.getTempo();
    state.tempo.beatsPerMeasure = transport_.getBeatsPerMeasure();
    state.tempo.beatUnit = transport_.getBeatUnit();
}

ProjectController::~ProjectController() = default;

void ProjectController::dispatch(const ProjectEvent& event) {
    ChangeFlags changes =
        std::visit([this](const auto& e) -> ChangeFlags { return this->handleEvent(e); }, event);

    // Notify listeners if anything changed
    if (changes != ChangeFlags::None) {
        notifyListeners(changes);
    }
}

void ProjectController::addListener(ProjectStateListener* listener) {
    if (listener && std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
    }
}

void ProjectController::removeListener(ProjectStateListener* listener) {
    listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

// ===== Track Event Handlers =====

ProjectController::ChangeFlags ProjectController::handleEvent(const AddTrackEvent& e) {
    if (state.findTrack(e.track.id) != nullptr) {
        std::cerr << "Track " << e.track.id << " already exists, ignoring add" << std::endl;
        return ChangeFlags::None;
    }

    TrackInfo track = e.track;
    track.volume = MixUtils::clampVolume(track.volume);
    track.pan = MixUtils::clampPan(track.pan);

    juce::File file;
    if (auto* audio = std::get_if<AudioContent>(&track.content)) {
        file = audio->file;
    }

    auto& engineTrack = engine_.createTrack(track.id, track.name, track.getType(), file);
    if (engineTrack.duration) {
        track.duration = engineTrack.duration;
    }
    if (auto* audio = std::get_if<AudioContent>(&track.content)) {
        clampTrim(*audio, engine_.getSourceDuration(track.id));
        engine_.setTrackTrim(track.id, audio->trimStart, audio->trimEnd);
    }

    engine_.setTrackVolume(track.id, track.volume);
    engine_.setTrackPan(track.id, track.pan);
    engine_.setTrackMute(track.id, track.muted);
    engine_.setTrackSolo(track.id, track.soloed);

    int index = e.index;
    if (index < 0 || index > static_cast<int>(state.tracks.size())) {
        index = static_cast<int>(state.tracks.size());
    }
    auto& inserted = *state.tracks.insert(state.tracks.begin() + index, std::move(track));

    updateDerivedLayout(inserted);
    syncSequence(inserted);

    // Joins a running transport on the spot
    transport_.handleTrackPositionChange(inserted.id, inserted.position.x);

    return ChangeFlags::Tracks | ChangeFlags::Mixer;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const RemoveTrackEvent& e) {
    int index = state.indexOf(e.trackId);
    if (index < 0) {
        return ChangeFlags::None;
    }

    engine_.removeTrack(e.trackId);
    state.tracks.erase(state.tracks.begin() + index);
    return ChangeFlags::Tracks | ChangeFlags::Mixer;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackPositionEvent& e) {
    auto* track = state.findTrack(e.trackId);
    if (track == nullptr || track->position == e.position) {
        return ChangeFlags::None;
    }

    bool movedInTime = track->position.x != e.position.x;
    track->position = e.position;

    if (movedInTime) {
        transport_.handleTrackPositionChange(track->id, track->position.x);
    }
    return ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackTrimEvent& e) {
    auto* track = state.findTrack(e.trackId);
    auto* audio = track ? std::get_if<AudioContent>(&track->content) : nullptr;
    if (audio == nullptr) {
        return ChangeFlags::None;
    }

    AudioContent trimmed = *audio;
    trimmed.trimStart = e.trimStart;
    trimmed.trimEnd = e.trimEnd;
    clampTrim(trimmed, engine_.getSourceDuration(track->id));
    if (trimmed.trimStart == audio->trimStart && trimmed.trimEnd == audio->trimEnd) {
        return ChangeFlags::None;
    }

    audio->trimStart = trimmed.trimStart;
    audio->trimEnd = trimmed.trimEnd;

    updateDerivedLayout(*track);
    transport_.handleTrackTrimChange(track->id, audio->trimStart, audio->trimEnd);
    return ChangeFlags::Tracks;
}

// ===== Mixer Event Handlers =====

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackVolumeEvent& e) {
    auto* track = state.findTrack(e.trackId);
    double volume = MixUtils::clampVolume(e.volume);
    if (track == nullptr || track->volume == volume) {
        return ChangeFlags::None;
    }

    track->volume = volume;
    engine_.setTrackVolume(track->id, volume);
    return ChangeFlags::Mixer;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackPanEvent& e) {
    auto* track = state.findTrack(e.trackId);
    double pan = MixUtils::clampPan(e.pan);
    if (track == nullptr || track->pan == pan) {
        return ChangeFlags::None;
    }

    track->pan = pan;
    engine_.setTrackPan(track->id, pan);
    return ChangeFlags::Mixer;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackMuteEvent& e) {
    auto* track = state.findTrack(e.trackId);
    if (track == nullptr || track->muted == e.muted) {
        return ChangeFlags::None;
    }

    track->muted = e.muted;
    engine_.setTrackMute(track->id, e.muted);
    return ChangeFlags::Mixer;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTrackSoloEvent& e) {
    auto* track = state.findTrack(e.trackId);
    if (track == nullptr || track->soloed == e.soloed) {
        return ChangeFlags::None;
    }

    track->soloed = e.soloed;
    engine_.setTrackSolo(track->id, e.soloed);
    return ChangeFlags::Mixer;
}

// ===== Tempo Event Handlers =====

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTempoEvent& e) {
    transport_.setTempo(e.bpm);
    double bpm = transport_.getTempo();
    if (bpm == state.tempo.bpm) {
        return ChangeFlags::None;
    }

    state.tempo.bpm = bpm;

    // Widths and sequence lengths follow the tempo in the same step
    updateAllDerivedLayouts();

    // Pending deferred starts were computed under the old tempo
    transport_.handleTempoChange();

    return ChangeFlags::Tempo | ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetTimeSignatureEvent& e) {
    transport_.setTimeSignature(e.numerator, e.denominator);
    int numerator = transport_.getBeatsPerMeasure();
    int denominator = transport_.getBeatUnit();
    if (numerator == state.tempo.beatsPerMeasure && denominator == state.tempo.beatUnit) {
        return ChangeFlags::None;
    }

    state.tempo.beatsPerMeasure = numerator;
    state.tempo.beatUnit = denominator;

    updateAllDerivedLayouts();

    // Pixel offsets map to different times under the new meter
    transport_.handleTempoChange();

    return ChangeFlags::Tempo | ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetKeySignatureEvent& e) {
    if (e.key == state.tempo.keySignature) {
        return ChangeFlags::None;
    }
    state.tempo.keySignature = e.key;
    return ChangeFlags::Tempo;
}

// ===== Note Event Handlers =====

ProjectController::ChangeFlags ProjectController::handleEvent(const SetDrumPadEvent& e) {
    auto* track = state.findTrack(e.trackId);
    auto* pads = track ? track->getPads() : nullptr;
    if (pads == nullptr) {
        return ChangeFlags::None;
    }

    auto& config = Config::getInstance();
    DrumPad pad = e.pad;
    pad.row = juce::jlimit(0, config.getDrumGridRows() - 1, pad.row);
    pad.column = juce::jlimit(0, config.getDrumGridColumns() - 1, pad.column);
    pad.velocity = MixUtils::clampMidi(pad.velocity);

    auto it = std::find_if(pads->begin(), pads->end(), [&pad](const DrumPad& p) {
        return p.row == pad.row && p.column == pad.column;
    });

    if (e.active) {
        if (it == pads->end()) {
            int index = e.index;
            if (index < 0 || index > static_cast<int>(pads->size())) {
                index = static_cast<int>(pads->size());
            }
            pads->insert(pads->begin() + index, pad);
        } else if (!(*it == pad)) {
            *it = pad;
        } else {
            return ChangeFlags::None;
        }
    } else {
        if (it == pads->end()) {
            return ChangeFlags::None;
        }
        pads->erase(it);
    }

    updateDerivedLayout(*track);
    syncSequence(*track);
    return ChangeFlags::Notes | ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const AddNoteEvent& e) {
    auto* track = state.findTrack(e.trackId);
    auto* notes = track ? track->getNotes() : nullptr;
    if (notes == nullptr) {
        return ChangeFlags::None;
    }

    bool exists = std::any_of(notes->begin(), notes->end(),
                              [&e](const MidiNote& n) { return n.id == e.note.id; });
    if (exists) {
        return ChangeFlags::None;
    }

    int index = e.index;
    if (index < 0 || index > static_cast<int>(notes->size())) {
        index = static_cast<int>(notes->size());
    }
    notes->insert(notes->begin() + index, clampNote(e.note));

    updateDerivedLayout(*track);
    syncSequence(*track);
    return ChangeFlags::Notes | ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const UpdateNoteEvent& e) {
    auto* track = state.findTrack(e.trackId);
    auto* notes = track ? track->getNotes() : nullptr;
    if (notes == nullptr) {
        return ChangeFlags::None;
    }

    auto it = std::find_if(notes->begin(), notes->end(),
                           [&e](const MidiNote& n) { return n.id == e.note.id; });
    MidiNote updated = clampNote(e.note);
    if (it == notes->end() || *it == updated) {
        return ChangeFlags::None;
    }

    *it = updated;

    updateDerivedLayout(*track);
    syncSequence(*track);
    return ChangeFlags::Notes | ChangeFlags::Tracks;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const RemoveNoteEvent& e) {
    auto* track = state.findTrack(e.trackId);
    auto* notes = track ? track->getNotes() : nullptr;
    if (notes == nullptr) {
        return ChangeFlags::None;
    }

    auto it = std::find_if(notes->begin(), notes->end(),
                           [&e](const MidiNote& n) { return n.id == e.noteId; });
    if (it == notes->end()) {
        return ChangeFlags::None;
    }

    notes->erase(it);

    updateDerivedLayout(*track);
    syncSequence(*track);
    return ChangeFlags::Notes | ChangeFlags::Tracks;
}

// ===== Playhead Event Handlers =====

ProjectController::ChangeFlags ProjectController::handleEvent(const SetPlaybackPositionEvent& e) {
    if (e.position == state.playhead.position) {
        return ChangeFlags::None;
    }
    state.playhead.position = e.position;
    return ChangeFlags::Playhead;
}

ProjectController::ChangeFlags ProjectController::handleEvent(const SetPlaybackStateEvent& e) {
    if (e.isPlaying == state.playhead.isPlaying) {
        return ChangeFlags::None;
    }
    state.playhead.isPlaying = e.isPlaying;
    return ChangeFlags::Playhead;
}

// ===== Helper Methods =====

void ProjectController::notifyListeners(ChangeFlags changes) {
    auto copy = listeners;
    for (auto* listener : copy) {
        listener->projectStateChanged(state, changes);
    }
}

void ProjectController::updateDerivedLayout(TrackInfo& track) {
    auto& config = Config::getInstance();
    const auto& tempo = state.tempo;
    const int stepsPerBeat = config.getGridStepsPerBeat();

    auto sequenceDuration = [&](int endStep) {
        int measures =
            TimelineUtils::measuresForSteps(endStep, stepsPerBeat, tempo.beatsPerMeasure);
        return measures * TimelineUtils::secondsPerMeasure(tempo.bpm, tempo.beatsPerMeasure);
    };

    std::visit(
        [&](const auto& content) {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, MidiContent>) {
                int endStep = 0;
                for (const auto& note : content.notes) {
                    endStep = std::max(endStep, note.column + std::max(1, note.length));
                }
                track.duration = sequenceDuration(endStep);
            } else if constexpr (std::is_same_v<T, DrumContent>) {
                int endStep = 0;
                for (const auto& pad : content.pads) {
                    endStep = std::max(endStep, pad.column + 1);
                }
                track.duration = sequenceDuration(endStep);
            } else if constexpr (std::is_same_v<T, AudioContent>) {
                // Audio plays the trimmed part of the decoded file
                if (auto source = engine_.getSourceDuration(track.id)) {
                    track.duration = content.trimEnd.value_or(*source) - content.trimStart;
                }
            }
        },
        track.content);

    track.calculatedWidth =
        track.duration ? TimelineUtils::calculateTrackWidth(*track.duration, tempo.bpm,
                                                            tempo.beatsPerMeasure,
                                                            config.getMeasureWidthPx())
                       : 0.0;

    engine_.setTrackDuration(track.id, track.duration);
}

void ProjectController::updateAllDerivedLayouts() {
    for (auto& track : state.tracks) {
        updateDerivedLayout(track);
    }
}

void ProjectController::syncSequence(const TrackInfo& track) {
    std::vector<SequenceNote> sequence;

    std::visit(
        [&sequence](const auto& content) {
            using T = std::decay_t<decltype(content)>;
            if constexpr (std::is_same_v<T, MidiContent>) {
                for (const auto& note : content.notes) {
                    sequence.push_back(
                        {note.column, note.length, MIDI_CHANNEL, note.pitch, note.velocity});
                }
            } else if constexpr (std::is_same_v<T, DrumContent>) {
                for (const auto& pad : content.pads) {
                    sequence.push_back({pad.column, 1, DRUM_CHANNEL,
                                        MixUtils::clampMidi(DRUM_BASE_NOTE + pad.row),
                                        pad.velocity});
                }
            }
        },
        track.content);

    engine_.setTrackSequence(track.id, std::move(sequence));
}

}  // namespace beatline
