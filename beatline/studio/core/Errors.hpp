#pragma once

#include <stdexcept>
#include <string>

namespace beatline {

/**
 * @brief The audio device or output context could not be started
 *
 * Fatal to playback. Always propagated to the caller of play() and never
 * allowed to touch the undo/redo stacks.
 */
class InitializationError : public std::runtime_error {
  public:
    explicit InitializationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A single track failed to decode, schedule or start
 *
 * Caught per track by the transport and logged; sibling tracks keep playing.
 */
class PlaybackError : public std::runtime_error {
  public:
    PlaybackError(int trackId, const std::string& message)
        : std::runtime_error(message), trackId_(trackId) {}

    int getTrackId() const {
        return trackId_;
    }

  private:
    int trackId_;
};

/**
 * @brief An action threw from execute() or undo()
 *
 * The history stacks are not rolled back when this is raised.
 */
class ActionExecutionError : public std::runtime_error {
  public:
    explicit ActionExecutionError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace beatline
