#include "TrackActions.hpp"

#include <stdexcept>

namespace beatline {

namespace {

const TrackInfo& requireTrack(const ProjectController& controller, TrackId trackId) {
    const auto* track = controller.getState().findTrack(trackId);
    if (track == nullptr) {
        throw std::runtime_error("Track " + std::to_string(trackId) + " not found");
    }
    return *track;
}

}  // namespace

// ============================================================================
// AddTrackAction
// ============================================================================

AddTrackAction::AddTrackAction(ProjectController& controller, TrackInfo track)
    : controller_(controller), track_(std::move(track)) {}

void AddTrackAction::execute() {
    controller_.dispatch(AddTrackEvent{track_});
}

void AddTrackAction::undo() {
    controller_.dispatch(RemoveTrackEvent{track_.id});
}

juce::String AddTrackAction::getDescription() const {
    return "Add " + juce::String(getTrackTypeName(track_.getType())) + " Track";
}

// ============================================================================
// DeleteTrackAction
// ============================================================================

DeleteTrackAction::DeleteTrackAction(ProjectController& controller, TrackId trackId)
    : controller_(controller), trackId_(trackId) {}

void DeleteTrackAction::execute() {
    // Store full state for undo
    deletedTrack_ = requireTrack(controller_, trackId_);
    deletedIndex_ = controller_.getState().indexOf(trackId_);

    controller_.dispatch(RemoveTrackEvent{trackId_});
    executed_ = true;
}

void DeleteTrackAction::undo() {
    if (!executed_) {
        return;
    }

    controller_.dispatch(AddTrackEvent{deletedTrack_, deletedIndex_});
}

juce::String DeleteTrackAction::getDescription() const {
    if (deletedTrack_.name.isNotEmpty()) {
        return "Delete " + deletedTrack_.name;
    }
    return Action::getDescription();
}

// ============================================================================
// MoveTrackAction
// ============================================================================

MoveTrackAction::MoveTrackAction(ProjectController& controller, TrackId trackId,
                                 TrackPosition newPosition)
    : controller_(controller), trackId_(trackId), newPosition_(newPosition) {}

void MoveTrackAction::execute() {
    oldPosition_ = requireTrack(controller_, trackId_).position;
    controller_.dispatch(SetTrackPositionEvent{trackId_, newPosition_});
}

void MoveTrackAction::undo() {
    controller_.dispatch(SetTrackPositionEvent{trackId_, oldPosition_});
}

// ============================================================================
// TrimTrackAction
// ============================================================================

TrimTrackAction::TrimTrackAction(ProjectController& controller, TrackId trackId,
                                 double trimStart, std::optional<double> trimEnd)
    : controller_(controller),
      trackId_(trackId),
      newTrimStart_(trimStart),
      newTrimEnd_(trimEnd) {}

void TrimTrackAction::execute() {
    const auto* audio = std::get_if<AudioContent>(&requireTrack(controller_, trackId_).content);
    if (audio == nullptr) {
        throw std::runtime_error("Track " + std::to_string(trackId_) + " has no audio to trim");
    }

    oldTrimStart_ = audio->trimStart;
    oldTrimEnd_ = audio->trimEnd;
    controller_.dispatch(SetTrackTrimEvent{trackId_, newTrimStart_, newTrimEnd_});
}

void TrimTrackAction::undo() {
    controller_.dispatch(SetTrackTrimEvent{trackId_, oldTrimStart_, oldTrimEnd_});
}

// ============================================================================
// ChangeVolumeAction
// ============================================================================

ChangeVolumeAction::ChangeVolumeAction(ProjectController& controller, TrackId trackId,
                                       double newVolume)
    : controller_(controller), trackId_(trackId), newVolume_(newVolume) {}

void ChangeVolumeAction::execute() {
    oldVolume_ = requireTrack(controller_, trackId_).volume;
    controller_.dispatch(SetTrackVolumeEvent{trackId_, newVolume_});
}

void ChangeVolumeAction::undo() {
    controller_.dispatch(SetTrackVolumeEvent{trackId_, oldVolume_});
}

// ============================================================================
// ChangePanAction
// ============================================================================

ChangePanAction::ChangePanAction(ProjectController& controller, TrackId trackId, double newPan)
    : controller_(controller), trackId_(trackId), newPan_(newPan) {}

void ChangePanAction::execute() {
    oldPan_ = requireTrack(controller_, trackId_).pan;
    controller_.dispatch(SetTrackPanEvent{trackId_, newPan_});
}

void ChangePanAction::undo() {
    controller_.dispatch(SetTrackPanEvent{trackId_, oldPan_});
}

// ============================================================================
// ChangeMuteAction
// ============================================================================

ChangeMuteAction::ChangeMuteAction(ProjectController& controller, TrackId trackId, bool muted)
    : controller_(controller), trackId_(trackId), newMuted_(muted) {}

void ChangeMuteAction::execute() {
    oldMuted_ = requireTrack(controller_, trackId_).muted;
    controller_.dispatch(SetTrackMuteEvent{trackId_, newMuted_});
}

void ChangeMuteAction::undo() {
    controller_.dispatch(SetTrackMuteEvent{trackId_, oldMuted_});
}

// ============================================================================
// ChangeSoloAction
// ============================================================================

ChangeSoloAction::ChangeSoloAction(ProjectController& controller, TrackId trackId, bool soloed)
    : controller_(controller), trackId_(trackId), newSoloed_(soloed) {}

void ChangeSoloAction::execute() {
    oldSoloed_ = requireTrack(controller_, trackId_).soloed;
    controller_.dispatch(SetTrackSoloEvent{trackId_, newSoloed_});
}

void ChangeSoloAction::undo() {
    controller_.dispatch(SetTrackSoloEvent{trackId_, oldSoloed_});
}

}  // namespace beatline
