#pragma once

/**
 * @file MidiPort.hpp
 * @brief Raw MIDI output port used by MidiChordSink
 */

#include <memory>
#include <string>
#include <vector>

namespace airchord {
namespace midi {

/**
 * Byte-level MIDI output
 *
 * Failures of the underlying API are raised as core::MidiException.
 * Not thread-safe; MidiChordSink serializes all calls.
 */
class MidiPort {
public:
    virtual ~MidiPort() = default;

    virtual unsigned int getPortCount() = 0;
    virtual std::string getPortName(unsigned int port) = 0;

    virtual void openPort(unsigned int port) = 0;
    virtual void closePort() = 0;
    virtual bool isPortOpen() const = 0;

    virtual void sendMessage(const std::vector<unsigned char>& message) = 0;
};

/**
 * Port backed by RtMidiOut with the default system API
 * @throws core::MidiException if no MIDI API can be initialized
 */
std::unique_ptr<MidiPort> createRtMidiPort(const std::string& clientName);

} // namespace midi
} // namespace airchord
