#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <variant>

#include "../core/TrackInfo.hpp"

namespace beatline {

// ===== Track Events =====

/**
 * @brief Insert a track with its full state
 *
 * Used both for new tracks and to restore a deleted one.
 * index = -1 appends.
 */
struct AddTrackEvent {
    TrackInfo track;
    int index = -1;
};

/**
 * @brief Remove a track and dispose its audio nodes
 */
struct RemoveTrackEvent {
    TrackId trackId;
};

/**
 * @brief Move a track on the timeline
 *
 * A change of x reschedules playback when the transport is running.
 */
struct SetTrackPositionEvent {
    TrackId trackId;
    TrackPosition position;
};

/**
 * @brief Set the played region of an audio track's file
 *
 * Seconds into the file; trimEnd empty plays to the end. Values are clamped
 * to the decoded length.
 */
struct SetTrackTrimEvent {
    TrackId trackId;
    double trimStart;
    std::optional<double> trimEnd;
};

// ===== Mixer Events =====

struct SetTrackVolumeEvent {
    TrackId trackId;
    double volume;  // 0-100
};

struct SetTrackPanEvent {
    TrackId trackId;
    double pan;  // -100 to 100
};

struct SetTrackMuteEvent {
    TrackId trackId;
    bool muted;
};

struct SetTrackSoloEvent {
    TrackId trackId;
    bool soloed;
};

// ===== Tempo Events =====

/**
 * @brief Change tempo; every track width is recomputed in the same step
 */
struct SetTempoEvent {
    double bpm;
};

struct SetTimeSignatureEvent {
    int numerator;
    int denominator;
};

struct SetKeySignatureEvent {
    juce::String key;
};

// ===== Note Events =====

/**
 * @brief Activate or clear one drum pad
 *
 * index places a newly activated pad (-1 appends).
 */
struct SetDrumPadEvent {
    TrackId trackId;
    DrumPad pad;
    bool active;
    int index = -1;
};

/**
 * @brief Insert a note; index = -1 appends
 */
struct AddNoteEvent {
    TrackId trackId;
    MidiNote note;
    int index = -1;
};

/**
 * @brief Replace the note with the same id
 */
struct UpdateNoteEvent {
    TrackId trackId;
    MidiNote note;
};

struct RemoveNoteEvent {
    TrackId trackId;
    NoteId noteId;
};

// ===== Playhead Events =====

/**
 * @brief Polled transport position (used by the position timer)
 */
struct SetPlaybackPositionEvent {
    double position;
};

struct SetPlaybackStateEvent {
    bool isPlaying;
};

/**
 * @brief Variant type for all project events
 */
using ProjectEvent = std::variant<
    // Track events
    AddTrackEvent, RemoveTrackEvent, SetTrackPositionEvent, SetTrackTrimEvent,
    // Mixer events
    SetTrackVolumeEvent, SetTrackPanEvent, SetTrackMuteEvent, SetTrackSoloEvent,
    // Tempo events
    SetTempoEvent, SetTimeSignatureEvent, SetKeySignatureEvent,
    // Note events
    SetDrumPadEvent, AddNoteEvent, UpdateNoteEvent, RemoveNoteEvent,
    // Playhead events
    SetPlaybackPositionEvent, SetPlaybackStateEvent>;

}  // namespace beatline
