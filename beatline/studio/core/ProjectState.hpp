#pragma once

#include <juce_core/juce_core.h>

#include <algorithm>
#include <vector>

#include "TrackInfo.hpp"

namespace beatline {

/**
 * @brief Tempo and meter of the project
 */
struct TempoState {
    double bpm = 120.0;
    int beatsPerMeasure = 4;  // Time signature numerator
    int beatUnit = 4;         // Time signature denominator
    juce::String keySignature = "C major";
};

/**
 * @brief Playhead state as seen by the UI (polled from the transport)
 */
struct PlayheadState {
    double position = 0.0;
    bool isPlaying = false;
};

/**
 * @brief The canonical, UI-facing project model
 *
 * Only ProjectController writes to this. Everything else reads it.
 */
struct ProjectState {
    std::vector<TrackInfo> tracks;
    TempoState tempo;
    PlayheadState playhead;

    TrackInfo* findTrack(TrackId id) {
        auto it = std::find_if(tracks.begin(), tracks.end(),
                               [id](const TrackInfo& t) { return t.id == id; });
        return it != tracks.end() ? &*it : nullptr;
    }

    const TrackInfo* findTrack(TrackId id) const {
        auto it = std::find_if(tracks.begin(), tracks.end(),
                               [id](const TrackInfo& t) { return t.id == id; });
        return it != tracks.end() ? &*it : nullptr;
    }

    int indexOf(TrackId id) const {
        for (size_t i = 0; i < tracks.size(); ++i) {
            if (tracks[i].id == id) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
};

}  // namespace beatline
