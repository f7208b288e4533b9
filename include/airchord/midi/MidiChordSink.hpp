#pragma once

#include "airchord/midi/ChordSink.hpp"
#include "airchord/midi/MidiPort.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace airchord {
namespace midi {

class ChordBank;

/**
 * MIDI output through RtMidi
 *
 * Resolves chord ids through a shared ChordBank when a chord starts and
 * remembers the notes it sent, so stopChord() releases exactly those even
 * if the chord is edited while it sounds. Sounding notes are tracked so
 * that disconnect() and stopAllNotes() never leave a note hanging. Without
 * a connection every command is a no-op returning false.
 *
 * Thread-safe: the GUI thread (preview/test buttons) and the gesture worker
 * may issue commands concurrently.
 */
class MidiChordSink : public ChordSink {
public:
    static constexpr int AUTO_SELECT_PORT = -1;

    /**
     * @param port Output port; null creates an RtMidi port on first use
     */
    explicit MidiChordSink(std::shared_ptr<ChordBank> bank,
                           std::unique_ptr<MidiPort> port = nullptr);
    ~MidiChordSink() override;

    // Delete copy/move
    MidiChordSink(const MidiChordSink&) = delete;
    MidiChordSink& operator=(const MidiChordSink&) = delete;

    /**
     * Output port names, indexed by port number
     */
    std::vector<std::string> listDevices();

    /**
     * Open an output port
     * @param port Port number, AUTO_SELECT_PORT picks the first one
     */
    bool connect(int port = AUTO_SELECT_PORT);

    /**
     * Silence all sounding notes and close the port
     */
    void disconnect();

    bool isConnected() const override;
    std::string getLastError() const override;

    // ChordSink
    bool startChord(int chordId) override;
    bool stopChord(int chordId) override;

    /**
     * Note on; a note already sounding is re-triggered with a note off first
     * @param velocity 0..127, negative uses the configured velocity
     */
    bool noteOn(int note, int velocity = -1);
    bool noteOff(int note);
    void stopAllNotes();

    std::set<int> getSoundingNotes() const;

    void setVelocity(int velocity);     ///< clamped to 0..127
    int getVelocity() const;

    void setChannel(int channel);       ///< clamped to 0..15
    int getChannel() const;

    int getConnectedPort() const;
    std::string getConnectedDeviceName() const;

    std::shared_ptr<ChordBank> getChordBank() const { return bank_; }

private:
    // mutex_ held by caller
    bool ensureOutput();
    bool sendLocked(unsigned char status, int data1, int data2);
    bool noteOnLocked(int note, int velocity);
    bool noteOffLocked(int note);
    void stopAllNotesLocked();
    void setError(const std::string& message);

    std::shared_ptr<ChordBank> bank_;
    std::unique_ptr<MidiPort> output_;

    mutable std::mutex mutex_;
    std::set<int> soundingNotes_;
    std::map<int, std::vector<int>> activeChords_;   ///< chord id -> notes sent
    int velocity_ = 100;
    int channel_ = 0;
    int connectedPort_ = -1;
    std::string deviceName_;
    std::string lastError_;
};

} // namespace midi
} // namespace airchord
