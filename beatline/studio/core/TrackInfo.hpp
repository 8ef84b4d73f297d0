#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

#include "TrackTypes.hpp"

namespace beatline {

/**
 * @brief Timeline placement of a track, in pixels
 *
 * x is the timeline offset, y the vertical order.
 */
struct TrackPosition {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const TrackPosition& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const TrackPosition& other) const {
        return !(*this == other);
    }
};

/**
 * @brief A note in a MIDI track, placed on the sixteenth grid
 */
struct MidiNote {
    NoteId id = INVALID_NOTE_ID;
    int pitch = 60;      // MIDI note number (0-127), the piano-roll row
    int column = 0;      // Start step
    int length = 1;      // Length in steps
    int velocity = 100;  // 0-127

    bool operator==(const MidiNote& other) const {
        return id == other.id && pitch == other.pitch && column == other.column &&
               length == other.length && velocity == other.velocity;
    }
};

/**
 * @brief An active cell in a drum step grid (row = sound, column = step)
 */
struct DrumPad {
    int row = 0;
    int column = 0;
    int velocity = 100;

    bool operator==(const DrumPad& other) const {
        return row == other.row && column == other.column && velocity == other.velocity;
    }
};

/**
 * @brief Audio file payload with its trim region
 *
 * Trim points are seconds into the file. The track's timeline position marks
 * where trimStart sounds; an empty trimEnd plays to the end of the file.
 */
struct AudioContent {
    juce::File file;
    double trimStart = 0.0;
    std::optional<double> trimEnd;
};

struct MidiContent {
    std::vector<MidiNote> notes;
};

struct DrumContent {
    std::vector<DrumPad> pads;
};

using TrackContent = std::variant<AudioContent, MidiContent, DrumContent>;

/**
 * @brief Track data structure containing all track properties
 */
struct TrackInfo {
    TrackId id = INVALID_TRACK_ID;  // Unique identifier
    juce::String name;              // Track name
    TrackContent content;           // Per-kind payload, also decides the track type

    // Mixer state
    double volume = 80.0;  // Fader value (0-100), 80 is unity gain
    double pan = 0.0;      // Pan position (-100 to 100)
    bool muted = false;
    bool soloed = false;

    // Timeline
    TrackPosition position;
    std::optional<double> duration;  // Seconds; empty until known
    double calculatedWidth = 0.0;    // Derived from duration and tempo

    TrackType getType() const {
        return std::visit(
            [](const auto& c) -> TrackType {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, AudioContent>) {
                    return TrackType::Audio;
                } else if constexpr (std::is_same_v<T, MidiContent>) {
                    return TrackType::MIDI;
                } else {
                    return TrackType::Drum;
                }
            },
            content);
    }

    std::vector<MidiNote>* getNotes() {
        auto* midi = std::get_if<MidiContent>(&content);
        return midi ? &midi->notes : nullptr;
    }
    const std::vector<MidiNote>* getNotes() const {
        auto* midi = std::get_if<MidiContent>(&content);
        return midi ? &midi->notes : nullptr;
    }

    std::vector<DrumPad>* getPads() {
        auto* drum = std::get_if<DrumContent>(&content);
        return drum ? &drum->pads : nullptr;
    }
    const std::vector<DrumPad>* getPads() const {
        auto* drum = std::get_if<DrumContent>(&content);
        return drum ? &drum->pads : nullptr;
    }
};

/**
 * @brief Build an empty payload for a track type
 */
inline TrackContent makeTrackContent(TrackType type, const juce::File& file = {}) {
    switch (type) {
        case TrackType::Audio:
            return AudioContent{file, 0.0, std::nullopt};
        case TrackType::MIDI:
            return MidiContent{};
        case TrackType::Drum:
            return DrumContent{};
    }
    return AudioContent{file, 0.0, std::nullopt};
}

}  // namespace beatline
