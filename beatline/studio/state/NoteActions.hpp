#pragma once

#include "../core/HistoryManager.hpp"
#include "ProjectController.hpp"

namespace beatline {

/**
 * @brief Action for adding a note to a MIDI track
 */
class CreateNoteAction : public Action {
  public:
    CreateNoteAction(ProjectController& controller, TrackId trackId, MidiNote note);

    ActionType getType() const override {
        return ActionType::CreateNote;
    }
    void execute() override;
    void undo() override;

    NoteId getNoteId() const {
        return note_.id;
    }

  private:
    ProjectController& controller_;
    TrackId trackId_;
    MidiNote note_;
};

/**
 * @brief Action for removing a note; undo restores it at its old index
 */
class DeleteNoteAction : public Action {
  public:
    DeleteNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId);

    ActionType getType() const override {
        return ActionType::DeleteNote;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    NoteId noteId_;

    MidiNote deletedNote_;
    int deletedIndex_ = -1;
    bool executed_ = false;
};

/**
 * @brief Base for actions that rewrite fields of one existing note
 */
class NoteEditAction : public Action {
  public:
    void execute() override;
    void undo() override;

  protected:
    NoteEditAction(ProjectController& controller, TrackId trackId, NoteId noteId);

    /** Return `note` with this action's edit applied. */
    virtual MidiNote applyEdit(MidiNote note) const = 0;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    NoteId noteId_;
    MidiNote oldNote_;
    bool executed_ = false;
};

/**
 * @brief Action for moving a note (pitch and/or start column)
 */
class MoveNoteAction : public NoteEditAction {
  public:
    MoveNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId, int newPitch,
                   int newColumn);

    ActionType getType() const override {
        return ActionType::MoveNote;
    }

  protected:
    MidiNote applyEdit(MidiNote note) const override;

  private:
    int newPitch_;
    int newColumn_;
};

/**
 * @brief Action for changing a note's length
 */
class ResizeNoteAction : public NoteEditAction {
  public:
    ResizeNoteAction(ProjectController& controller, TrackId trackId, NoteId noteId,
                     int newLength);

    ActionType getType() const override {
        return ActionType::ResizeNote;
    }

  protected:
    MidiNote applyEdit(MidiNote note) const override;

  private:
    int newLength_;
};

/**
 * @brief Action for changing a note's velocity
 */
class ChangeNoteVelocityAction : public NoteEditAction {
  public:
    ChangeNoteVelocityAction(ProjectController& controller, TrackId trackId, NoteId noteId,
                             int newVelocity);

    ActionType getType() const override {
        return ActionType::ChangeNoteVelocity;
    }

  protected:
    MidiNote applyEdit(MidiNote note) const override;

  private:
    int newVelocity_;
};

/**
 * @brief Action for switching one drum pad on or off
 *
 * Undo puts a removed pad back with its velocity and position in the list.
 */
class ToggleDrumPadAction : public Action {
  public:
    ToggleDrumPadAction(ProjectController& controller, TrackId trackId, int column, int row);

    ActionType getType() const override {
        return ActionType::ToggleDrumPad;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    int column_;
    int row_;

    bool wasActive_ = false;
    DrumPad previousPad_;
    int previousIndex_ = -1;
    bool executed_ = false;
};

}  // namespace beatline
