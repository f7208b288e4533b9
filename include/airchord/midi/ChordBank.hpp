#pragma once

#include "airchord/core/Configuration.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace airchord {
namespace midi {

/**
 * Chord table shared by the editor (GUI thread) and the MIDI sink
 * (gesture worker thread).
 *
 * Ids outside 1..5 are rejected; notes outside 0..127 are dropped.
 */
class ChordBank {
public:
    using ChordMap = core::Configuration::ChordMap;

    static constexpr int MIN_CHORD_ID = 1;
    static constexpr int MAX_CHORD_ID = 5;

    ChordBank();
    explicit ChordBank(const ChordMap& chords);

    /**
     * Replace one chord
     * @return false if chordId is outside 1..5
     */
    bool setChord(int chordId, const std::vector<int>& notes);

    /**
     * Notes of a chord, empty if unset
     */
    std::vector<int> getChord(int chordId) const;

    ChordMap getAllChords() const;

    /**
     * Replace the whole table (invalid entries skipped)
     */
    void setAllChords(const ChordMap& chords);

    void resetToDefaults();

    /**
     * 60 -> "C4"; "Invalid" outside 0..127
     */
    static std::string noteToName(int note);

    /**
     * "F#3" -> 54, flats accepted ("Bb2"); -1 when unparseable
     */
    static int nameToNote(const std::string& name);

    /**
     * "C4 E4 G4" style label for a note list
     */
    static std::string describe(const std::vector<int>& notes);

private:
    static std::vector<int> sanitize(const std::vector<int>& notes);

    mutable std::mutex mutex_;
    ChordMap chords_;
};

} // namespace midi
} // namespace airchord
