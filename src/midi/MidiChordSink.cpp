#include "airchord/midi/MidiChordSink.hpp"
#include "airchord/midi/ChordBank.hpp"
#include "airchord/core/Logger.hpp"
#include "airchord/core/exception.h"

#include <algorithm>

namespace airchord {
namespace midi {

namespace {
constexpr unsigned char NOTE_OFF = 0x80;
constexpr unsigned char NOTE_ON = 0x90;
}

MidiChordSink::MidiChordSink(std::shared_ptr<ChordBank> bank, std::unique_ptr<MidiPort> port)
    : bank_(std::move(bank))
    , output_(std::move(port)) {
}

MidiChordSink::~MidiChordSink() {
    disconnect();
}

bool MidiChordSink::ensureOutput() {
    if (output_) {
        return true;
    }
    try {
        output_ = createRtMidiPort("AirChord");
        return true;
    } catch (const core::MidiException& error) {
        setError(error.getMessage());
        return false;
    }
}

std::vector<std::string> MidiChordSink::listDevices() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> devices;
    if (!ensureOutput()) {
        return devices;
    }

    unsigned int count = output_->getPortCount();
    for (unsigned int i = 0; i < count; ++i) {
        try {
            devices.push_back(output_->getPortName(i));
        } catch (const core::MidiException& error) {
            LOG_WARNING("MIDI port " + std::to_string(i) + " name unavailable: " + error.getMessage());
            devices.push_back("Port " + std::to_string(i));
        }
    }
    return devices;
}

bool MidiChordSink::connect(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureOutput()) {
        return false;
    }

    if (output_->isPortOpen()) {
        stopAllNotesLocked();
        output_->closePort();
        connectedPort_ = -1;
        deviceName_.clear();
    }

    unsigned int count = output_->getPortCount();
    if (count == 0) {
        setError("No MIDI output devices found");
        return false;
    }

    if (port == AUTO_SELECT_PORT) {
        port = 0;
    }
    if (port < 0 || static_cast<unsigned int>(port) >= count) {
        setError("MIDI port " + std::to_string(port) + " does not exist");
        return false;
    }

    try {
        deviceName_ = output_->getPortName(port);
        output_->openPort(static_cast<unsigned int>(port));
    } catch (const core::MidiException& error) {
        deviceName_.clear();
        setError("Failed to connect to MIDI device: " + error.getMessage());
        return false;
    }

    connectedPort_ = port;
    LOG_INFO("Connected to MIDI device " + std::to_string(port) + ": " + deviceName_);
    return true;
}

void MidiChordSink::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!output_ || !output_->isPortOpen()) {
        return;
    }
    stopAllNotesLocked();
    output_->closePort();
    LOG_INFO("Disconnected from MIDI device " + deviceName_);
    connectedPort_ = -1;
    deviceName_.clear();
}

bool MidiChordSink::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_ && output_->isPortOpen();
}

bool MidiChordSink::startChord(int chordId) {
    std::vector<int> notes = bank_ ? bank_->getChord(chordId) : std::vector<int>();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!output_ || !output_->isPortOpen()) {
        setError("MIDI output not connected");
        return false;
    }
    if (notes.empty()) {
        setError("Chord " + std::to_string(chordId) + " not configured");
        return false;
    }

    AIRCHORD_LOG_INFO("MIDI") << "Playing chord " << chordId << ": " << ChordBank::describe(notes);
    bool ok = true;

    // Restarting a sounding chord: release what the new voicing drops
    auto previous = activeChords_.find(chordId);
    if (previous != activeChords_.end()) {
        for (int note : previous->second) {
            if (std::find(notes.begin(), notes.end(), note) == notes.end()) {
                ok = noteOffLocked(note) && ok;
            }
        }
    }

    for (int note : notes) {
        ok = noteOnLocked(note, velocity_) && ok;
    }
    activeChords_[chordId] = notes;
    return ok;
}

bool MidiChordSink::stopChord(int chordId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!output_ || !output_->isPortOpen()) {
        setError("MIDI output not connected");
        return false;
    }

    // Release the notes sent by startChord, even if the bank changed since
    auto active = activeChords_.find(chordId);
    if (active == activeChords_.end()) {
        return true;
    }
    std::vector<int> notes = std::move(active->second);
    activeChords_.erase(active);

    AIRCHORD_LOG_INFO("MIDI") << "Stopping chord " << chordId << ": " << ChordBank::describe(notes);
    bool ok = true;
    for (int note : notes) {
        ok = noteOffLocked(note) && ok;
    }
    return ok;
}

bool MidiChordSink::noteOn(int note, int velocity) {
    std::lock_guard<std::mutex> lock(mutex_);
    return noteOnLocked(note, velocity < 0 ? velocity_ : std::min(velocity, 127));
}

bool MidiChordSink::noteOff(int note) {
    std::lock_guard<std::mutex> lock(mutex_);
    return noteOffLocked(note);
}

void MidiChordSink::stopAllNotes() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopAllNotesLocked();
}

std::set<int> MidiChordSink::getSoundingNotes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return soundingNotes_;
}

void MidiChordSink::setVelocity(int velocity) {
    std::lock_guard<std::mutex> lock(mutex_);
    velocity_ = std::max(0, std::min(127, velocity));
}

int MidiChordSink::getVelocity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return velocity_;
}

void MidiChordSink::setChannel(int channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::max(0, std::min(15, channel));
}

int MidiChordSink::getChannel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

int MidiChordSink::getConnectedPort() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectedPort_;
}

std::string MidiChordSink::getConnectedDeviceName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deviceName_;
}

std::string MidiChordSink::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool MidiChordSink::sendLocked(unsigned char status, int data1, int data2) {
    if (!output_ || !output_->isPortOpen()) {
        return false;
    }
    std::vector<unsigned char> message = {
        static_cast<unsigned char>(status | (channel_ & 0x0F)),
        static_cast<unsigned char>(data1 & 0x7F),
        static_cast<unsigned char>(data2 & 0x7F)
    };
    try {
        output_->sendMessage(message);
    } catch (const core::MidiException& error) {
        setError("MIDI send failed: " + error.getMessage());
        return false;
    }
    return true;
}

bool MidiChordSink::noteOnLocked(int note, int velocity) {
    if (note < 0 || note > 127) {
        return false;
    }
    // Re-trigger: avoid a stuck note if the same key is still down
    if (soundingNotes_.count(note) && !sendLocked(NOTE_OFF, note, 0)) {
        return false;
    }
    if (!sendLocked(NOTE_ON, note, velocity)) {
        return false;
    }
    soundingNotes_.insert(note);
    return true;
}

bool MidiChordSink::noteOffLocked(int note) {
    if (note < 0 || note > 127) {
        return false;
    }
    if (!sendLocked(NOTE_OFF, note, 0)) {
        return false;
    }
    soundingNotes_.erase(note);
    return true;
}

void MidiChordSink::stopAllNotesLocked() {
    std::set<int> sounding = soundingNotes_;
    for (int note : sounding) {
        if (!noteOffLocked(note)) {
            LOG_WARNING("Note off failed for " + ChordBank::noteToName(note));
        }
    }
    soundingNotes_.clear();
    activeChords_.clear();
}

void MidiChordSink::setError(const std::string& message) {
    lastError_ = message;
    LOG_WARNING(message);
}

} // namespace midi
} // namespace airchord
