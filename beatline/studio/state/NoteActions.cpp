#include "NoteActions.hpp"

#include <stdexcept>

#include "../core/Config.hpp"

namespace beatline {

namespace {

const std::vector<MidiNote>& requireNotes(const ProjectController& controller, TrackId trackId) {
    const auto* track = controller.getState().findTrack(trackId);
    const auto* notes = track ? track->getNotes() : nullptr;
    if (notes == nullptr) {
        throw std::runtime_error("Track " + std::to_string(trackId) + " is not a MIDI track");
    }
    return *notes;
}

int findNoteIndex(const std::vector<MidiNote>& notes, NoteId noteId) {
    for (size_t i = 0; i < notes.size(); ++i) {
        if (notes[i].id == noteId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace

// ============================================================================
// CreateNoteAction
// ============================================================================

CreateNoteAction::CreateNoteAction(ProjectController& controller, TrackId trackId, MidiNote note)
    : controller_(controller), trackId_(trackId), note_(note) {}

void CreateNoteAction::execute() {
    requireNotes(controller_, trackId_);
    controller_.dispatch(AddNoteEvent{trackId_, note_});
}

void CreateNoteAction::undo() {
    controller_.dispatch(RemoveNoteEvent{trackId_, note_.id});
}

// ============================================================================
// DeleteNoteAction
// ============================================================================

DeleteNoteAction::DeleteNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId)
    : controller_(controller), trackId_(trackId), noteId_(noteId) {}

void DeleteNoteAction::execute() {
    const auto& notes = requireNotes(controller_, trackId_);
    int index = findNoteIndex(notes, noteId_);
    if (index < 0) {
        throw std::runtime_error("Note " + std::to_string(noteId_) + " not found");
    }

    deletedNote_ = notes[static_cast<size_t>(index)];
    deletedIndex_ = index;

    controller_.dispatch(RemoveNoteEvent{trackId_, noteId_});
    executed_ = true;
}

void DeleteNoteAction::undo() {
    if (!executed_) {
        return;
    }
    controller_.dispatch(AddNoteEvent{trackId_, deletedNote_, deletedIndex_});
}

// ============================================================================
// NoteEditAction
// ============================================================================

NoteEditAction::NoteEditAction(ProjectController& controller, TrackId trackId, NoteId noteId)
    : controller_(controller), trackId_(trackId), noteId_(noteId) {}

void NoteEditAction::execute() {
    const auto& notes = requireNotes(controller_, trackId_);
    int index = findNoteIndex(notes, noteId_);
    if (index < 0) {
        throw std::runtime_error("Note " + std::to_string(noteId_) + " not found");
    }

    oldNote_ = notes[static_cast<size_t>(index)];
    controller_.dispatch(UpdateNoteEvent{trackId_, applyEdit(oldNote_)});
    executed_ = true;
}

void NoteEditAction::undo() {
    if (!executed_) {
        return;
    }
    controller_.dispatch(UpdateNoteEvent{trackId_, oldNote_});
}

// ============================================================================
// MoveNoteAction
// ============================================================================

MoveNoteAction::MoveNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId,
                               int newPitch, int newColumn)
    : NoteEditAction(controller, trackId, noteId), newPitch_(newPitch), newColumn_(newColumn) {}

MidiNote MoveNoteAction::applyEdit(MidiNote note) const {
    note.pitch = newPitch_;
    note.column = newColumn_;
    return note;
}

// ============================================================================
// ResizeNoteAction
// ============================================================================

ResizeNoteAction::ResizeNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId,
                                   int newLength)
    : NoteEditAction(controller, trackId, noteId), newLength_(newLength) {}

MidiNote ResizeNoteAction::applyEdit(MidiNote note) const {
    note.length = newLength_;
    return note;
}

// ============================================================================
// ChangeNoteVelocityAction
// ============================================================================

ChangeNoteVelocityAction::ChangeNoteVelocityAction(ProjectController& controller,
                                                   TrackId trackId, NoteId noteId,
                                                   int newVelocity)
    : NoteEditAction(controller, trackId, noteId), newVelocity_(newVelocity) {}

MidiNote ChangeNoteVelocityAction::applyEdit(MidiNote note) const {
    note.velocity = newVelocity_;
    return note;
}

// ============================================================================
// ToggleDrumPadAction
// ============================================================================

ToggleDrumPadAction::ToggleDrumPadAction(ProjectController& controller, TrackId trackId,
                                         int column, int row)
    : controller_(controller), trackId_(trackId) {
    // Out-of-grid indices land on the nearest cell
    auto& config = Config::getInstance();
    column_ = juce::jlimit(0, config.getDrumGridColumns() - 1, column);
    row_ = juce::jlimit(0, config.getDrumGridRows() - 1, row);
}

void ToggleDrumPadAction::execute() {
    const auto* track = controller_.getState().findTrack(trackId_);
    const auto* pads = track ? track->getPads() : nullptr;
    if (pads == nullptr) {
        throw std::runtime_error("Track " + std::to_string(trackId_) + " is not a drum track");
    }

    previousIndex_ = -1;
    for (size_t i = 0; i < pads->size(); ++i) {
        const auto& pad = (*pads)[i];
        if (pad.row == row_ && pad.column == column_) {
            previousPad_ = pad;
            previousIndex_ = static_cast<int>(i);
            break;
        }
    }
    wasActive_ = previousIndex_ >= 0;

    if (wasActive_) {
        controller_.dispatch(SetDrumPadEvent{trackId_, previousPad_, false});
    } else {
        controller_.dispatch(SetDrumPadEvent{trackId_, DrumPad{row_, column_, 100}, true});
    }
    executed_ = true;
}

void ToggleDrumPadAction::undo() {
    if (!executed_) {
        return;
    }

    if (wasActive_) {
        controller_.dispatch(SetDrumPadEvent{trackId_, previousPad_, true, previousIndex_});
    } else {
        controller_.dispatch(SetDrumPadEvent{trackId_, DrumPad{row_, column_, 100}, false});
    }
}

}  // namespace beatline
