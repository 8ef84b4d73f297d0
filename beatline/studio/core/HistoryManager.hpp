#pragma once

#include <juce_core/juce_core.h>

#include <deque>
#include <memory>
#include <vector>

namespace beatline {

/**
 * @brief Tag for every kind of reversible mutation
 */
enum class ActionType {
    AddTrack,
    DeleteTrack,
    MoveTrack,
    ChangeVolume,
    ChangePan,
    ChangeMute,
    ChangeSolo,
    ChangeBpm,
    ChangeTimeSignature,
    ChangeKeySignature,
    ToggleDrumPad,
    CreateNote,
    MoveNote,
    ResizeNote,
    DeleteNote,
    ChangeNoteVelocity,
    TrimTrack,
    Composite
};

/**
 * @brief Display name for an action type
 */
inline const char* getActionTypeName(ActionType type) {
    switch (type) {
        case ActionType::AddTrack:
            return "Add Track";
        case ActionType::DeleteTrack:
            return "Delete Track";
        case ActionType::MoveTrack:
            return "Move Track";
        case ActionType::ChangeVolume:
            return "Change Volume";
        case ActionType::ChangePan:
            return "Change Pan";
        case ActionType::ChangeMute:
            return "Change Mute";
        case ActionType::ChangeSolo:
            return "Change Solo";
        case ActionType::ChangeBpm:
            return "Change BPM";
        case ActionType::ChangeTimeSignature:
            return "Change Time Signature";
        case ActionType::ChangeKeySignature:
            return "Change Key Signature";
        case ActionType::ToggleDrumPad:
            return "Toggle Drum Pad";
        case ActionType::CreateNote:
            return "Create Note";
        case ActionType::MoveNote:
            return "Move Note";
        case ActionType::ResizeNote:
            return "Resize Note";
        case ActionType::DeleteNote:
            return "Delete Note";
        case ActionType::ChangeNoteVelocity:
            return "Change Note Velocity";
        case ActionType::TrimTrack:
            return "Trim Track";
        case ActionType::Composite:
            return "Composite Action";
    }
    return "Unknown";
}

/**
 * @brief Base class for reversible actions
 *
 * undo() must be the exact inverse of execute(). execute() is called again
 * on redo, from the state undo() left behind.
 */
class Action {
  public:
    virtual ~Action() = default;

    virtual ActionType getType() const = 0;
    virtual void execute() = 0;
    virtual void undo() = 0;

    virtual juce::String getDescription() const {
        return getActionTypeName(getType());
    }
};

/**
 * @brief Several actions recorded as one undo step
 *
 * Children execute in order and undo in reverse order. If a child fails
 * while executing, the children already run are undone before the error
 * propagates.
 */
class CompositeAction : public Action {
  public:
    explicit CompositeAction(juce::String label,
                             std::vector<std::unique_ptr<Action>> actions = {});

    void addAction(std::unique_ptr<Action> action);

    size_t size() const {
        return actions_.size();
    }

    ActionType getType() const override {
        return ActionType::Composite;
    }
    void execute() override;
    void undo() override;

    juce::String getDescription() const override {
        return label_;
    }

  private:
    juce::String label_;
    std::vector<std::unique_ptr<Action>> actions_;
};

/**
 * @brief Listener for undo/redo stack changes
 */
class HistoryListener {
  public:
    virtual ~HistoryListener() = default;
    virtual void historyChanged() = 0;
};

/**
 * @brief Undo/redo stacks for Actions
 *
 * Requests are serialized: an execute, undo or redo issued while another is
 * still running (for example from a listener callback) is queued and run in
 * submission order once the current one finishes.
 *
 * Failures are wrapped in ActionExecutionError and rethrown. The stacks are
 * not rolled back; the failing action is dropped, and requests queued behind
 * it are discarded.
 */
class HistoryManager {
  public:
    explicit HistoryManager(size_t maxUndoSteps = 100);
    ~HistoryManager();

    /**
     * Execute an action and push it onto the undo stack.
     * Clears the redo stack.
     */
    void executeAction(std::unique_ptr<Action> action);

    /**
     * Undo the most recent action.
     * @return false if there was nothing to undo
     */
    bool undo();

    /**
     * Redo the most recently undone action.
     * @return false if there was nothing to redo
     */
    bool redo();

    bool canUndo() const {
        return !undoStack_.empty();
    }
    bool canRedo() const {
        return !redoStack_.empty();
    }

    juce::String getUndoDescription() const;
    juce::String getRedoDescription() const;

    size_t getUndoStackSize() const {
        return undoStack_.size();
    }
    size_t getRedoStackSize() const {
        return redoStack_.size();
    }
    size_t getPendingCount() const {
        return pending_.size();
    }

    /** Drop both stacks (session reset). */
    void clearHistory();

    void setMaxUndoSteps(size_t steps);
    size_t getMaxUndoSteps() const {
        return maxUndoSteps_;
    }

    void addListener(HistoryListener* listener);
    void removeListener(HistoryListener* listener);

  private:
    enum class RequestKind { Execute, Undo, Redo };

    struct Request {
        RequestKind kind;
        std::unique_ptr<Action> action;  // Execute only
    };

    void submit(Request request);
    void drain();
    void run(Request& request);

    void notifyListeners();
    void trimUndoStack();

    std::deque<std::unique_ptr<Action>> undoStack_;
    std::deque<std::unique_ptr<Action>> redoStack_;
    std::deque<Request> pending_;
    bool busy_ = false;
    size_t maxUndoSteps_;

    std::vector<HistoryListener*> listeners_;

    JUCE_DECLARE_NON_COPYABLE(HistoryManager)
};

}  // namespace beatline
