#include "airchord/midi/ChordBank.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <map>

namespace airchord {
namespace midi {

namespace {

const std::array<const char*, 12> NOTE_NAMES = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

const std::map<std::string, int> PITCH_CLASSES = {
    {"C", 0}, {"C#", 1}, {"DB", 1}, {"D", 2}, {"D#", 3}, {"EB", 3},
    {"E", 4}, {"F", 5}, {"F#", 6}, {"GB", 6}, {"G", 7}, {"G#", 8},
    {"AB", 8}, {"A", 9}, {"A#", 10}, {"BB", 10}, {"B", 11}
};

} // anonymous namespace

ChordBank::ChordBank()
    : chords_(core::Configuration::defaultChords()) {
}

ChordBank::ChordBank(const ChordMap& chords) {
    setAllChords(chords);
}

bool ChordBank::setChord(int chordId, const std::vector<int>& notes) {
    if (chordId < MIN_CHORD_ID || chordId > MAX_CHORD_ID) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    chords_[chordId] = sanitize(notes);
    return true;
}

std::vector<int> ChordBank::getChord(int chordId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chords_.find(chordId);
    return it == chords_.end() ? std::vector<int>() : it->second;
}

ChordBank::ChordMap ChordBank::getAllChords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chords_;
}

void ChordBank::setAllChords(const ChordMap& chords) {
    ChordMap cleaned;
    for (const auto& [chordId, notes] : chords) {
        if (chordId >= MIN_CHORD_ID && chordId <= MAX_CHORD_ID) {
            cleaned[chordId] = sanitize(notes);
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    chords_ = std::move(cleaned);
}

void ChordBank::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    chords_ = core::Configuration::defaultChords();
}

std::string ChordBank::noteToName(int note) {
    if (note < 0 || note > 127) {
        return "Invalid";
    }
    int octave = note / 12 - 1;
    return std::string(NOTE_NAMES[note % 12]) + std::to_string(octave);
}

int ChordBank::nameToNote(const std::string& name) {
    if (name.size() < 2) {
        return -1;
    }

    // Split "F#3" / "C-1" into pitch and octave
    size_t octaveStart = name.find_first_of("-0123456789");
    if (octaveStart == std::string::npos || octaveStart == 0) {
        return -1;
    }

    std::string pitch = name.substr(0, octaveStart);
    std::transform(pitch.begin(), pitch.end(), pitch.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = PITCH_CLASSES.find(pitch);
    if (it == PITCH_CLASSES.end()) {
        return -1;
    }

    int octave = 0;
    try {
        size_t consumed = 0;
        octave = std::stoi(name.substr(octaveStart), &consumed);
        if (octaveStart + consumed != name.size()) {
            return -1;
        }
    } catch (const std::exception&) {
        return -1;
    }

    int note = (octave + 1) * 12 + it->second;
    return (note >= 0 && note <= 127) ? note : -1;
}

std::string ChordBank::describe(const std::vector<int>& notes) {
    std::string text;
    for (int note : notes) {
        if (!text.empty()) {
            text += ' ';
        }
        text += noteToName(note);
    }
    return text;
}

std::vector<int> ChordBank::sanitize(const std::vector<int>& notes) {
    std::vector<int> result;
    result.reserve(notes.size());
    for (int note : notes) {
        if (note >= 0 && note <= 127) {
            result.push_back(note);
        }
    }
    return result;
}

} // namespace midi
} // namespace airchord
