#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

namespace beatline {

/**
 * @brief Fader and pan mapping shared by the engine and the project model
 *
 * Track volume is a 0..100 fader value with unity gain at 80.
 * Track pan is -100..100 and maps to -1..1 on the mixing channel.
 */
namespace MixUtils {

constexpr double UNITY_FADER = 80.0;
constexpr double MAX_FADER = 100.0;
constexpr double MAX_BOOST_DB = 6.0;
constexpr double FADER_RANGE_DB = 60.0;

inline double silenceDb() {
    return -std::numeric_limits<double>::infinity();
}

/**
 * Convert a fader value to decibels
 *
 * Above unity the fader is linear up to +6 dB. Below unity a cubic curve
 * gives finer resolution near 0 dB and reaches -60 dB just above zero.
 */
inline double volumeToDecibels(double volume, bool muted = false) {
    if (muted || volume <= 0.0) {
        return silenceDb();
    }
    if (volume > UNITY_FADER) {
        double boost = (std::min(volume, MAX_FADER) - UNITY_FADER) / (MAX_FADER - UNITY_FADER);
        return boost * MAX_BOOST_DB;
    }
    double normalized = volume / UNITY_FADER;
    return -FADER_RANGE_DB * (1.0 - normalized * normalized * normalized);
}

inline double clampVolume(double volume) {
    return std::clamp(volume, 0.0, MAX_FADER);
}

inline double clampPan(double pan) {
    return std::clamp(pan, -100.0, 100.0);
}

// Track pan (-100..100) to channel pan (-1..1)
inline double panToChannel(double pan) {
    return clampPan(pan) / 100.0;
}

inline int clampMidi(int value) {
    return std::clamp(value, 0, 127);
}

}  // namespace MixUtils

}  // namespace beatline
