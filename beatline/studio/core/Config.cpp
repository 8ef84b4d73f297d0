#include "Config.hpp"

#include <fstream>
#include <iostream>

namespace beatline {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    *this = Config();
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "measureWidthPx=" << measureWidthPx << std::endl;
    file << "gridStepsPerBeat=" << gridStepsPerBeat << std::endl;
    file << "drumGridColumns=" << drumGridColumns << std::endl;
    file << "drumGridRows=" << drumGridRows << std::endl;
    file << "defaultBpm=" << defaultBpm << std::endl;
    file << "minBpm=" << minBpm << std::endl;
    file << "maxBpm=" << maxBpm << std::endl;
    file << "defaultBeatsPerMeasure=" << defaultBeatsPerMeasure << std::endl;
    file << "defaultBeatUnit=" << defaultBeatUnit << std::endl;
    file << "defaultTrackVolume=" << defaultTrackVolume << std::endl;
    file << "fadeTimeSeconds=" << fadeTimeSeconds << std::endl;
    file << "safetyBufferSeconds=" << safetyBufferSeconds << std::endl;
    file << "defaultMaxPosition=" << defaultMaxPosition << std::endl;
    file << "schedulerIntervalMs=" << schedulerIntervalMs << std::endl;
    file << "positionPollIntervalMs=" << positionPollIntervalMs << std::endl;
    file << "maxUndoSteps=" << maxUndoSteps << std::endl;
    file << "preferredAudioDevice=" << preferredAudioDevice << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        // Handle string values
        if (key == "preferredAudioDevice") {
            preferredAudioDevice = value;
            return;
        }

        // Handle numeric values
        double numValue = std::stod(value);

        if (key == "measureWidthPx") {
            measureWidthPx = numValue;
        } else if (key == "gridStepsPerBeat") {
            gridStepsPerBeat = static_cast<int>(numValue);
        } else if (key == "drumGridColumns") {
            drumGridColumns = static_cast<int>(numValue);
        } else if (key == "drumGridRows") {
            drumGridRows = static_cast<int>(numValue);
        } else if (key == "defaultBpm") {
            defaultBpm = numValue;
        } else if (key == "minBpm") {
            minBpm = numValue;
        } else if (key == "maxBpm") {
            maxBpm = numValue;
        } else if (key == "defaultBeatsPerMeasure") {
            defaultBeatsPerMeasure = static_cast<int>(numValue);
        } else if (key == "defaultBeatUnit") {
            defaultBeatUnit = static_cast<int>(numValue);
        } else if (key == "defaultTrackVolume") {
            defaultTrackVolume = numValue;
        } else if (key == "fadeTimeSeconds") {
            fadeTimeSeconds = numValue;
        } else if (key == "safetyBufferSeconds") {
            safetyBufferSeconds = numValue;
        } else if (key == "defaultMaxPosition") {
            defaultMaxPosition = numValue;
        } else if (key == "schedulerIntervalMs") {
            schedulerIntervalMs = static_cast<int>(numValue);
        } else if (key == "positionPollIntervalMs") {
            positionPollIntervalMs = static_cast<int>(numValue);
        } else if (key == "maxUndoSteps") {
            maxUndoSteps = static_cast<int>(numValue);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace beatline
