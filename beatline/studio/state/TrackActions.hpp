#pragma once

#include <optional>

#include "../core/HistoryManager.hpp"
#include "ProjectController.hpp"

namespace beatline {

/**
 * @brief Action for creating a new track
 *
 * The track id is fixed at construction so redo recreates the same track.
 */
class AddTrackAction : public Action {
  public:
    AddTrackAction(ProjectController& controller, TrackInfo track);

    ActionType getType() const override {
        return ActionType::AddTrack;
    }
    void execute() override;
    void undo() override;
    juce::String getDescription() const override;

    TrackId getTrackId() const {
        return track_.id;
    }

  private:
    ProjectController& controller_;
    TrackInfo track_;
};

/**
 * @brief Action for deleting a track
 *
 * Stores the complete track state and its index for undo.
 */
class DeleteTrackAction : public Action {
  public:
    DeleteTrackAction(ProjectController& controller, TrackId trackId);

    ActionType getType() const override {
        return ActionType::DeleteTrack;
    }
    void execute() override;
    void undo() override;
    juce::String getDescription() const override;

  private:
    ProjectController& controller_;
    TrackId trackId_;

    TrackInfo deletedTrack_;
    int deletedIndex_ = -1;
    bool executed_ = false;
};

/**
 * @brief Action for moving a track on the timeline
 */
class MoveTrackAction : public Action {
  public:
    MoveTrackAction(ProjectController& controller, TrackId trackId, TrackPosition newPosition);

    ActionType getType() const override {
        return ActionType::MoveTrack;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    TrackPosition newPosition_;
    TrackPosition oldPosition_;
};

/**
 * @brief Action for trimming an audio track's file
 */
class TrimTrackAction : public Action {
  public:
    TrimTrackAction(ProjectController& controller, TrackId trackId, double trimStart,
                    std::optional<double> trimEnd);

    ActionType getType() const override {
        return ActionType::TrimTrack;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    double newTrimStart_;
    std::optional<double> newTrimEnd_;
    double oldTrimStart_ = 0.0;
    std::optional<double> oldTrimEnd_;
};

/**
 * @brief Action for changing a track's fader value
 */
class ChangeVolumeAction : public Action {
  public:
    ChangeVolumeAction(ProjectController& controller, TrackId trackId, double newVolume);

    ActionType getType() const override {
        return ActionType::ChangeVolume;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    double newVolume_;
    double oldVolume_ = 0.0;
};

/**
 * @brief Action for changing a track's pan
 */
class ChangePanAction : public Action {
  public:
    ChangePanAction(ProjectController& controller, TrackId trackId, double newPan);

    ActionType getType() const override {
        return ActionType::ChangePan;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    double newPan_;
    double oldPan_ = 0.0;
};

/**
 * @brief Action for muting/unmuting a track
 */
class ChangeMuteAction : public Action {
  public:
    ChangeMuteAction(ProjectController& controller, TrackId trackId, bool muted);

    ActionType getType() const override {
        return ActionType::ChangeMute;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    bool newMuted_;
    bool oldMuted_ = false;
};

/**
 * @brief Action for soloing/unsoloing a track
 */
class ChangeSoloAction : public Action {
  public:
    ChangeSoloAction(ProjectController& controller, TrackId trackId, bool soloed);

    ActionType getType() const override {
        return ActionType::ChangeSolo;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    TrackId trackId_;
    bool newSoloed_;
    bool oldSoloed_ = false;
};

}  // namespace beatline
