#include "airchord/midi/MidiPort.hpp"
#include "airchord/core/exception.h"

#include <RtMidi.h>

namespace airchord {
namespace midi {

namespace {

/**
 * RtMidiOut adapter; RtMidiError becomes core::MidiException
 */
class RtMidiPort : public MidiPort {
public:
    explicit RtMidiPort(const std::string& clientName) {
        try {
            output_ = std::make_unique<RtMidiOut>(RtMidi::UNSPECIFIED, clientName);
        } catch (const RtMidiError& error) {
            AIRCHORD_THROW(core::MidiException, "Cannot create MIDI output: " + error.getMessage());
        }
    }

    unsigned int getPortCount() override {
        return output_->getPortCount();
    }

    std::string getPortName(unsigned int port) override {
        try {
            return output_->getPortName(port);
        } catch (const RtMidiError& error) {
            AIRCHORD_THROW(core::MidiException, error.getMessage());
        }
    }

    void openPort(unsigned int port) override {
        try {
            output_->openPort(port, "AirChord Output");
        } catch (const RtMidiError& error) {
            AIRCHORD_THROW(core::MidiException, error.getMessage());
        }
    }

    void closePort() override {
        output_->closePort();
    }

    bool isPortOpen() const override {
        return output_->isPortOpen();
    }

    void sendMessage(const std::vector<unsigned char>& message) override {
        try {
            output_->sendMessage(&message);
        } catch (const RtMidiError& error) {
            AIRCHORD_THROW(core::MidiException, error.getMessage());
        }
    }

private:
    std::unique_ptr<RtMidiOut> output_;
};

} // anonymous namespace

std::unique_ptr<MidiPort> createRtMidiPort(const std::string& clientName) {
    return std::make_unique<RtMidiPort>(clientName);
}

} // namespace midi
} // namespace airchord
