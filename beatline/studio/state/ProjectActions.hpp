#pragma once

#include "../core/HistoryManager.hpp"
#include "ProjectController.hpp"

namespace beatline {

/**
 * @brief Action for changing the project tempo
 *
 * The reducer recomputes every track width with the tempo, so undo restores
 * the tempo and all widths together.
 */
class ChangeBpmAction : public Action {
  public:
    ChangeBpmAction(ProjectController& controller, double newBpm);

    ActionType getType() const override {
        return ActionType::ChangeBpm;
    }
    void execute() override;
    void undo() override;
    juce::String getDescription() const override;

  private:
    ProjectController& controller_;
    double newBpm_;
    double oldBpm_ = 0.0;
};

/**
 * @brief Action for changing the time signature
 */
class ChangeTimeSignatureAction : public Action {
  public:
    ChangeTimeSignatureAction(ProjectController& controller, int numerator, int denominator);

    ActionType getType() const override {
        return ActionType::ChangeTimeSignature;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    int newNumerator_;
    int newDenominator_;
    int oldNumerator_ = 4;
    int oldDenominator_ = 4;
};

/**
 * @brief Action for changing the key signature
 */
class ChangeKeySignatureAction : public Action {
  public:
    ChangeKeySignatureAction(ProjectController& controller, juce::String newKey);

    ActionType getType() const override {
        return ActionType::ChangeKeySignature;
    }
    void execute() override;
    void undo() override;

  private:
    ProjectController& controller_;
    juce::String newKey_;
    juce::String oldKey_;
};

}  // namespace beatline
