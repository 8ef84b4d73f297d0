#pragma once

namespace beatline {

using TrackId = int;
constexpr TrackId INVALID_TRACK_ID = -1;

using NoteId = int;
constexpr NoteId INVALID_NOTE_ID = -1;

/**
 * @brief Track types
 */
enum class TrackType {
    Audio,  // Decoded audio file on the timeline
    MIDI,   // Piano-roll notes
    Drum    // Step-sequencer pads
};

/**
 * @brief Get display name for track type
 */
inline const char* getTrackTypeName(TrackType type) {
    switch (type) {
        case TrackType::Audio:
            return "Audio";
        case TrackType::MIDI:
            return "MIDI";
        case TrackType::Drum:
            return "Drum";
    }
    return "Unknown";
}

}  // namespace beatline
