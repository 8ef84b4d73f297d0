#pragma once

#include <algorithm>
#include <cmath>

namespace beatline {

/**
 * @brief Utility functions for timeline pixel/time conversions
 *
 * These are pure functions. A timeline measure is a fixed number of pixels
 * wide, so every conversion depends on tempo, beats per measure and that width.
 */
namespace TimelineUtils {

/**
 * Length of one measure in seconds
 * @param bpm Tempo in beats per minute
 * @param beatsPerMeasure Time signature numerator
 */
inline double secondsPerMeasure(double bpm, int beatsPerMeasure) {
    if (bpm <= 0.0) {
        return 0.0;
    }
    return beatsPerMeasure * (60.0 / bpm);
}

/**
 * Convert a timeline x position to a time offset
 * @param x Pixel position on the timeline
 * @param bpm Tempo in beats per minute
 * @param beatsPerMeasure Time signature numerator
 * @param measureWidthPx Width of one measure in pixels
 * @return Offset in seconds
 */
inline double pixelsToSeconds(double x, double bpm, int beatsPerMeasure, double measureWidthPx) {
    if (measureWidthPx <= 0.0) {
        return 0.0;
    }
    return (x / measureWidthPx) * secondsPerMeasure(bpm, beatsPerMeasure);
}

/**
 * Convert a time offset to a timeline x position
 * @return Pixel position
 */
inline double secondsToPixels(double seconds, double bpm, int beatsPerMeasure,
                              double measureWidthPx) {
    double measureSeconds = secondsPerMeasure(bpm, beatsPerMeasure);
    if (measureSeconds <= 0.0) {
        return 0.0;
    }
    return (seconds / measureSeconds) * measureWidthPx;
}

/**
 * Width in pixels of a region lasting `duration` seconds
 *
 * duration * bpm / 60 / beatsPerMeasure * measureWidthPx
 */
inline double calculateTrackWidth(double duration, double bpm, int beatsPerMeasure,
                                  double measureWidthPx) {
    if (beatsPerMeasure <= 0) {
        return 0.0;
    }
    return duration * (bpm / 60.0) / beatsPerMeasure * measureWidthPx;
}

/**
 * Length of one grid step in seconds
 * @param stepsPerBeat Grid resolution (4 = sixteenth notes)
 */
inline double secondsPerStep(double bpm, int stepsPerBeat) {
    if (bpm <= 0.0 || stepsPerBeat <= 0) {
        return 0.0;
    }
    return 60.0 / bpm / stepsPerBeat;
}

/**
 * Number of whole measures needed to hold `steps` grid steps (at least one)
 */
inline int measuresForSteps(int steps, int stepsPerBeat, int beatsPerMeasure) {
    int stepsPerMeasure = std::max(1, stepsPerBeat * beatsPerMeasure);
    int measures = (steps + stepsPerMeasure - 1) / stepsPerMeasure;
    return std::max(1, measures);
}

}  // namespace TimelineUtils

}  // namespace beatline
