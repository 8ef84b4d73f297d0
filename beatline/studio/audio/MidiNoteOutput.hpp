#pragma once

#include <juce_audio_devices/juce_audio_devices.h>

#include <memory>

#include "../engine/AudioBackend.hpp"

namespace beatline {

/**
 * @brief Sends MIDI and drum track notes to a hardware or virtual MIDI port
 *
 * Without an available output device every call is a no-op.
 */
class MidiNoteOutput : public NoteOutput {
  public:
    MidiNoteOutput() = default;
    ~MidiNoteOutput() override;

    /** Open the first available output. @return false if none could be opened */
    bool open();
    void close();
    bool isOpen() const {
        return output_ != nullptr;
    }

    juce::String getDeviceName() const;

    // ===== NoteOutput =====
    void noteOn(int channel, int noteNumber, int velocity) override;
    void noteOff(int channel, int noteNumber) override;
    void allNotesOff() override;

  private:
    std::unique_ptr<juce::MidiOutput> output_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MidiNoteOutput)
};

}  // namespace beatline
