#include "HistoryManager.hpp"

#include <algorithm>
#include <iostream>

#include "Errors.hpp"

namespace beatline {

namespace {

std::string describeFailure(const Action& action, const char* phase, const std::exception& e) {
    return action.getDescription().toStdString() + " " + phase + " failed: " + e.what();
}

}  // namespace

HistoryManager::HistoryManager(size_t maxUndoSteps)
    : maxUndoSteps_(std::max<size_t>(1, maxUndoSteps)) {}

HistoryManager::~HistoryManager() = default;

void HistoryManager::executeAction(std::unique_ptr<Action> action) {
    if (!action) {
        std::cout << "HISTORY: executeAction called with null action!" << std::endl;
        return;
    }
    submit({RequestKind::Execute, std::move(action)});
}

bool HistoryManager::undo() {
    if (!busy_ && undoStack_.empty()) {
        return false;
    }
    submit({RequestKind::Undo, nullptr});
    return true;
}

bool HistoryManager::redo() {
    if (!busy_ && redoStack_.empty()) {
        return false;
    }
    submit({RequestKind::Redo, nullptr});
    return true;
}

juce::String HistoryManager::getUndoDescription() const {
    if (undoStack_.empty()) {
        return {};
    }
    return undoStack_.back()->getDescription();
}

juce::String HistoryManager::getRedoDescription() const {
    if (redoStack_.empty()) {
        return {};
    }
    return redoStack_.back()->getDescription();
}

void HistoryManager::clearHistory() {
    undoStack_.clear();
    redoStack_.clear();
    notifyListeners();
}

void HistoryManager::setMaxUndoSteps(size_t steps) {
    maxUndoSteps_ = std::max<size_t>(1, steps);
    trimUndoStack();
}

void HistoryManager::addListener(HistoryListener* listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void HistoryManager::removeListener(HistoryListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

// ============================================================================
// Request queue
// ============================================================================

void HistoryManager::submit(Request request) {
    pending_.push_back(std::move(request));

    if (busy_) {
        DBG("HISTORY: Queued request behind running action (" << (int)pending_.size()
                                                               << " pending)");
        return;
    }

    drain();
}

void HistoryManager::drain() {
    busy_ = true;

    while (!pending_.empty()) {
        auto request = std::move(pending_.front());
        pending_.pop_front();

        try {
            run(request);
        } catch (...) {
            if (!pending_.empty()) {
                std::cerr << "HISTORY: Discarding " << pending_.size()
                          << " queued request(s) after failure" << std::endl;
                pending_.clear();
            }
            busy_ = false;
            throw;
        }
    }

    busy_ = false;
}

void HistoryManager::run(Request& request) {
    switch (request.kind) {
        case RequestKind::Execute: {
            auto& action = request.action;
            std::cout << "HISTORY: Executing " << action->getDescription() << std::endl;

            try {
                action->execute();
            } catch (const std::exception& e) {
                throw ActionExecutionError(describeFailure(*action, "execute", e));
            }

            undoStack_.push_back(std::move(action));
            trimUndoStack();

            // New action invalidates redo history
            redoStack_.clear();

            notifyListeners();
            break;
        }

        case RequestKind::Undo: {
            if (undoStack_.empty()) {
                return;
            }

            auto action = std::move(undoStack_.back());
            undoStack_.pop_back();

            std::cout << "HISTORY: Undoing '" << action->getDescription() << "'" << std::endl;

            try {
                action->undo();
            } catch (const std::exception& e) {
                throw ActionExecutionError(describeFailure(*action, "undo", e));
            }

            redoStack_.push_back(std::move(action));
            notifyListeners();
            break;
        }

        case RequestKind::Redo: {
            if (redoStack_.empty()) {
                return;
            }

            auto action = std::move(redoStack_.back());
            redoStack_.pop_back();

            std::cout << "HISTORY: Redoing '" << action->getDescription() << "'" << std::endl;

            try {
                action->execute();
            } catch (const std::exception& e) {
                throw ActionExecutionError(describeFailure(*action, "redo", e));
            }

            undoStack_.push_back(std::move(action));
            trimUndoStack();
            notifyListeners();
            break;
        }
    }
}

void HistoryManager::notifyListeners() {
    // Copy so listeners may unsubscribe from inside the callback
    auto listeners = listeners_;
    for (auto* listener : listeners) {
        listener->historyChanged();
    }
}

void HistoryManager::trimUndoStack() {
    while (undoStack_.size() > maxUndoSteps_) {
        undoStack_.pop_front();
    }
}

// ============================================================================
// CompositeAction
// ============================================================================

CompositeAction::CompositeAction(juce::String label, std::vector<std::unique_ptr<Action>> actions)
    : label_(std::move(label)) {
    for (auto& action : actions) {
        addAction(std::move(action));
    }
}

void CompositeAction::addAction(std::unique_ptr<Action> action) {
    if (action) {
        actions_.push_back(std::move(action));
    }
}

void CompositeAction::execute() {
    size_t done = 0;
    try {
        for (; done < actions_.size(); ++done) {
            actions_[done]->execute();
        }
    } catch (const std::exception&) {
        // Leave no half-applied group behind
        while (done > 0) {
            --done;
            actions_[done]->undo();
        }
        throw;
    }
}

void CompositeAction::undo() {
    for (auto it = actions_.rbegin(); it != actions_.rend(); ++it) {
        (*it)->undo();
    }
}

}  // namespace beatline
