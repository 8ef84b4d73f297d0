#pragma once

#include <juce_core/juce_core.h>

#include <cstdint>
#include <vector>

#include "../core/ProjectState.hpp"
#include "../engine/AudioEngine.hpp"
#include "../engine/TransportController.hpp"
#include "ProjectEvents.hpp"

namespace beatline {

class ProjectStateListener;

/**
 * @brief Single reducer for the project
 *
 * Owns the canonical ProjectState and applies every event to it and to the
 * audio graph in one step, so engine state and UI state never diverge:
 *
 *   Action -> dispatch(Event) -> ProjectController
 *   -> Update State + AudioEngine/Transport -> Notify Listeners
 */
class ProjectController {
  public:
    ProjectController(AudioEngine& engine, TransportController& transport);
    ~ProjectController();

    // ===== State Access =====

    /**
     * Read-only access to the current state.
     */
    const ProjectState& getState() const {
        return state;
    }

    AudioEngine& getEngine() {
        return engine_;
    }
    TransportController& getTransport() {
        return transport_;
    }

    // ===== Event Dispatching =====

    /**
     * Dispatch an event to modify the project.
     * This is the ONLY way to modify project state.
     */
    void dispatch(const ProjectEvent& event);

    // ===== Listener Management =====
    void addListener(ProjectStateListener* listener);
    void removeListener(ProjectStateListener* listener);

    /**
     * @brief Flags for what changed in a dispatch
     */
    enum class ChangeFlags : uint32_t {
        None = 0,
        Tracks = 1 << 0,
        Mixer = 1 << 1,
        Tempo = 1 << 2,
        Notes = 1 << 3,
        Playhead = 1 << 4,
        All = 0xFFFFFFFF
    };

  private:
    // The single source of truth
    ProjectState state;

    AudioEngine& engine_;
    TransportController& transport_;

    std::vector<ProjectStateListener*> listeners;

    // ===== Event Handlers =====
    // Each handler modifies state and returns flags indicating what changed

    ChangeFlags handleEvent(const AddTrackEvent& e);
    ChangeFlags handleEvent(const RemoveTrackEvent& e);
    ChangeFlags handleEvent(const SetTrackPositionEvent& e);
    ChangeFlags handleEvent(const SetTrackTrimEvent& e);

    ChangeFlags handleEvent(const SetTrackVolumeEvent& e);
    ChangeFlags handleEvent(const SetTrackPanEvent& e);
    ChangeFlags handleEvent(const SetTrackMuteEvent& e);
    ChangeFlags handleEvent(const SetTrackSoloEvent& e);

    ChangeFlags handleEvent(const SetTempoEvent& e);
    ChangeFlags handleEvent(const SetTimeSignatureEvent& e);
    ChangeFlags handleEvent(const SetKeySignatureEvent& e);

    ChangeFlags handleEvent(const SetDrumPadEvent& e);
    ChangeFlags handleEvent(const AddNoteEvent& e);
    ChangeFlags handleEvent(const UpdateNoteEvent& e);
    ChangeFlags handleEvent(const RemoveNoteEvent& e);

    ChangeFlags handleEvent(const SetPlaybackPositionEvent& e);
    ChangeFlags handleEvent(const SetPlaybackStateEvent& e);

    // ===== Helper Methods =====
    void notifyListeners(ChangeFlags changes);

    /** Recompute duration and width of one track from its content and the tempo. */
    void updateDerivedLayout(TrackInfo& track);
    void updateAllDerivedLayouts();

    /** Push a MIDI/drum track's notes to the engine as a step sequence. */
    void syncSequence(const TrackInfo& track);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProjectController)
};

// Helper operators for ChangeFlags
inline ProjectController::ChangeFlags operator|(ProjectController::ChangeFlags a,
                                                ProjectController::ChangeFlags b) {
    return static_cast<ProjectController::ChangeFlags>(static_cast<uint32_t>(a) |
                                                       static_cast<uint32_t>(b));
}

inline ProjectController::ChangeFlags operator&(ProjectController::ChangeFlags a,
                                                ProjectController::ChangeFlags b) {
    return static_cast<ProjectController::ChangeFlags>(static_cast<uint32_t>(a) &
                                                       static_cast<uint32_t>(b));
}

inline bool hasFlag(ProjectController::ChangeFlags flags, ProjectController::ChangeFlags flag) {
    return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * @brief Listener interface for project state changes
 */
class ProjectStateListener {
  public:
    virtual ~ProjectStateListener() = default;

    /**
     * Called after every dispatch that changed something.
     */
    virtual void projectStateChanged(const ProjectState& state,
                                     ProjectController::ChangeFlags changes) = 0;
};

}  // namespace beatline
