#include "PlaybackPositionTimer.hpp"

#include "../core/Config.hpp"
#include "../state/ProjectController.hpp"
#include "TransportController.hpp"

namespace beatline {

PlaybackPositionTimer::PlaybackPositionTimer(TransportController& transport,
                                             ProjectController& project)
    : transport_(transport), project_(project) {}

PlaybackPositionTimer::~PlaybackPositionTimer() {
    stopTimer();
}

void PlaybackPositionTimer::start() {
    startTimer(Config::getInstance().getPositionPollIntervalMs());
}

void PlaybackPositionTimer::stop() {
    stopTimer();
}

bool PlaybackPositionTimer::isRunning() const {
    return isTimerRunning();
}

void PlaybackPositionTimer::timerCallback() {
    poll();
}

void PlaybackPositionTimer::poll() {
    bool isPlaying = transport_.isPlaying();

    // Detect transitions that happened outside the UI
    if (isPlaying != wasPlaying_) {
        project_.dispatch(SetPlaybackStateEvent{isPlaying});
        if (onPlayStateChanged)
            onPlayStateChanged(isPlaying);
        wasPlaying_ = isPlaying;
    }

    if (isPlaying) {
        project_.dispatch(SetPlaybackPositionEvent{transport_.getPosition()});
    }
}

}  // namespace beatline
