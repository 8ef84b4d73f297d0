#pragma once

#include <juce_events/juce_events.h>

#include <functional>

namespace beatline {

class TransportController;
class ProjectController;

/**
 * @brief Timer that polls the transport for playhead position updates
 *
 * Periodically reads the transport clock and dispatches
 * SetPlaybackPositionEvent to the ProjectController, which then notifies
 * all listeners.
 */
class PlaybackPositionTimer : private juce::Timer {
  public:
    PlaybackPositionTimer(TransportController& transport, ProjectController& project);
    ~PlaybackPositionTimer() override;

    void start();
    void stop();
    bool isRunning() const;

    /** One polling step; the timer calls this on the message thread. */
    void poll();

    /** Callback fired when the play state changes. */
    std::function<void(bool)> onPlayStateChanged;

  private:
    void timerCallback() override;

    TransportController& transport_;
    ProjectController& project_;

    bool wasPlaying_ = false;  // Track transport playing state for change detection
};

}  // namespace beatline
