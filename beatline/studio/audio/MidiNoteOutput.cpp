#include "MidiNoteOutput.hpp"

#include <iostream>

#include "../core/MixUtils.hpp"

namespace beatline {

MidiNoteOutput::~MidiNoteOutput() {
    close();
}

bool MidiNoteOutput::open() {
    if (output_ != nullptr) {
        return true;
    }

    auto devices = juce::MidiOutput::getAvailableDevices();
    for (const auto& device : devices) {
        output_ = juce::MidiOutput::openDevice(device.identifier);
        if (output_ != nullptr) {
            std::cout << "MidiNoteOutput: Opened " << device.name << std::endl;
            return true;
        }
    }

    std::cout << "MidiNoteOutput: No MIDI output available, note tracks will be silent"
              << std::endl;
    return false;
}

void MidiNoteOutput::close() {
    if (output_ != nullptr) {
        allNotesOff();
        output_.reset();
    }
}

juce::String MidiNoteOutput::getDeviceName() const {
    return output_ != nullptr ? output_->getName() : juce::String();
}

void MidiNoteOutput::noteOn(int channel, int noteNumber, int velocity) {
    if (output_ == nullptr) {
        return;
    }
    output_->sendMessageNow(juce::MidiMessage::noteOn(
        juce::jlimit(1, 16, channel), MixUtils::clampMidi(noteNumber),
        static_cast<juce::uint8>(MixUtils::clampMidi(velocity))));
}

void MidiNoteOutput::noteOff(int channel, int noteNumber) {
    if (output_ == nullptr) {
        return;
    }
    output_->sendMessageNow(
        juce::MidiMessage::noteOff(juce::jlimit(1, 16, channel), MixUtils::clampMidi(noteNumber)));
}

void MidiNoteOutput::allNotesOff() {
    if (output_ == nullptr) {
        return;
    }
    for (int channel = 1; channel <= 16; ++channel) {
        output_->sendMessageNow(juce::MidiMessage::allNotesOff(channel));
    }
}

}  // namespace beatline
