#pragma once

#include <string>

namespace beatline {

/**
 * Configuration class to manage all tunable settings of the studio core
 * Values are read once at startup from a key=value file
 */
class Config {
  public:
    static Config& getInstance();

    // Grid Configuration
    double getMeasureWidthPx() const {
        return measureWidthPx;
    }
    void setMeasureWidthPx(double width) {
        measureWidthPx = width;
    }

    int getGridStepsPerBeat() const {
        return gridStepsPerBeat;
    }
    void setGridStepsPerBeat(int steps) {
        gridStepsPerBeat = steps;
    }

    int getDrumGridColumns() const {
        return drumGridColumns;
    }
    void setDrumGridColumns(int columns) {
        drumGridColumns = columns;
    }

    int getDrumGridRows() const {
        return drumGridRows;
    }
    void setDrumGridRows(int rows) {
        drumGridRows = rows;
    }

    // Tempo Configuration
    double getDefaultBpm() const {
        return defaultBpm;
    }
    void setDefaultBpm(double bpm) {
        defaultBpm = bpm;
    }

    double getMinBpm() const {
        return minBpm;
    }
    void setMinBpm(double bpm) {
        minBpm = bpm;
    }

    double getMaxBpm() const {
        return maxBpm;
    }
    void setMaxBpm(double bpm) {
        maxBpm = bpm;
    }

    int getDefaultBeatsPerMeasure() const {
        return defaultBeatsPerMeasure;
    }
    void setDefaultBeatsPerMeasure(int beats) {
        defaultBeatsPerMeasure = beats;
    }

    int getDefaultBeatUnit() const {
        return defaultBeatUnit;
    }
    void setDefaultBeatUnit(int unit) {
        defaultBeatUnit = unit;
    }

    // Track Configuration
    double getDefaultTrackVolume() const {
        return defaultTrackVolume;
    }
    void setDefaultTrackVolume(double volume) {
        defaultTrackVolume = volume;
    }

    // Transport Configuration
    double getFadeTimeSeconds() const {
        return fadeTimeSeconds;
    }
    void setFadeTimeSeconds(double seconds) {
        fadeTimeSeconds = seconds;
    }

    double getSafetyBufferSeconds() const {
        return safetyBufferSeconds;
    }
    void setSafetyBufferSeconds(double seconds) {
        safetyBufferSeconds = seconds;
    }

    double getDefaultMaxPosition() const {
        return defaultMaxPosition;
    }
    void setDefaultMaxPosition(double seconds) {
        defaultMaxPosition = seconds;
    }

    int getSchedulerIntervalMs() const {
        return schedulerIntervalMs;
    }
    void setSchedulerIntervalMs(int ms) {
        schedulerIntervalMs = ms;
    }

    int getPositionPollIntervalMs() const {
        return positionPollIntervalMs;
    }
    void setPositionPollIntervalMs(int ms) {
        positionPollIntervalMs = ms;
    }

    // History Configuration
    int getMaxUndoSteps() const {
        return maxUndoSteps;
    }
    void setMaxUndoSteps(int steps) {
        maxUndoSteps = steps;
    }

    // Audio Device Configuration
    std::string getPreferredAudioDevice() const {
        return preferredAudioDevice;
    }
    void setPreferredAudioDevice(const std::string& deviceName) {
        preferredAudioDevice = deviceName;
    }

    // Restore every value to its built-in default
    void resetToDefaults();

    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

  private:
    Config() = default;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    // Grid settings
    double measureWidthPx = 200.0;  // Width of one measure on the timeline
    int gridStepsPerBeat = 4;       // Sixteenth-note grid
    int drumGridColumns = 64;
    int drumGridRows = 16;

    // Tempo settings
    double defaultBpm = 120.0;
    double minBpm = 20.0;
    double maxBpm = 300.0;
    int defaultBeatsPerMeasure = 4;
    int defaultBeatUnit = 4;

    // Track settings
    double defaultTrackVolume = 80.0;  // 80 on the fader is unity gain

    // Transport settings
    double fadeTimeSeconds = 0.01;       // Click-free ramp before pause/stop
    double safetyBufferSeconds = 0.005;  // Added to every deferred start
    double defaultMaxPosition = 3600.0;  // Seek limit when no track has a length
    int schedulerIntervalMs = 5;         // Scheduled callback dispatch rate
    int positionPollIntervalMs = 30;     // ~33fps for the moving playhead

    // History settings
    int maxUndoSteps = 100;

    // Audio device settings
    std::string preferredAudioDevice = "";  // Preferred output device (empty = system default)
};

}  // namespace beatline
