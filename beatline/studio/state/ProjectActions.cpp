#include "ProjectActions.hpp"

namespace beatline {

// ============================================================================
// ChangeBpmAction
// ============================================================================

ChangeBpmAction::ChangeBpmAction(ProjectController& controller, double newBpm)
    : controller_(controller), newBpm_(newBpm) {}

void ChangeBpmAction::execute() {
    oldBpm_ = controller_.getState().tempo.bpm;
    controller_.dispatch(SetTempoEvent{newBpm_});
}

void ChangeBpmAction::undo() {
    controller_.dispatch(SetTempoEvent{oldBpm_});
}

juce::String ChangeBpmAction::getDescription() const {
    return "Change BPM to " + juce::String(newBpm_, 1);
}

// ============================================================================
// ChangeTimeSignatureAction
// ============================================================================

ChangeTimeSignatureAction::ChangeTimeSignatureAction(ProjectController& controller,
                                                     int numerator, int denominator)
    : controller_(controller), newNumerator_(numerator), newDenominator_(denominator) {}

void ChangeTimeSignatureAction::execute() {
    const auto& tempo = controller_.getState().tempo;
    oldNumerator_ = tempo.beatsPerMeasure;
    oldDenominator_ = tempo.beatUnit;
    controller_.dispatch(SetTimeSignatureEvent{newNumerator_, newDenominator_});
}

void ChangeTimeSignatureAction::undo() {
    controller_.dispatch(SetTimeSignatureEvent{oldNumerator_, oldDenominator_});
}

// ============================================================================
// ChangeKeySignatureAction
// ============================================================================

ChangeKeySignatureAction::ChangeKeySignatureAction(ProjectController& controller,
                                                   juce::String newKey)
    : controller_(controller), newKey_(std::move(newKey)) {}

void ChangeKeySignatureAction::execute() {
    oldKey_ = controller_.getState().tempo.keySignature;
    controller_.dispatch(SetKeySignatureEvent{newKey_});
}

void ChangeKeySignatureAction::undo() {
    controller_.dispatch(SetKeySignatureEvent{oldKey_});
}

}  // namespace beatline
