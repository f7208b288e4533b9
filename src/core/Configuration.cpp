#include "airchord/core/Configuration.hpp"
#include "airchord/core/Logger.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace airchord {
namespace core {

namespace {

constexpr int MIN_CHORD_ID = 1;
constexpr int MAX_CHORD_ID = 5;
constexpr int MIN_MIDI_NOTE = 0;
constexpr int MAX_MIDI_NOTE = 127;

// Reads a scalar into `value`, leaving it untouched when absent or mistyped
template<typename T>
void readScalar(const YAML::Node& section, const char* key, T& value) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::BadConversion&) {
        LOG_WARNING(std::string("Config key '") + key + "' has wrong type, keeping default");
    }
}

/**
 * Parse a "chords" mapping; invalid ids are skipped, invalid notes dropped.
 * Returns the number of chord entries accepted.
 */
int readChords(const YAML::Node& chordsNode, Configuration::ChordMap& out) {
    if (!chordsNode || !chordsNode.IsMap()) {
        return 0;
    }

    int accepted = 0;
    for (const auto& entry : chordsNode) {
        int chordId = 0;
        try {
            chordId = entry.first.as<int>();
        } catch (const YAML::BadConversion&) {
            continue;
        }
        if (chordId < MIN_CHORD_ID || chordId > MAX_CHORD_ID || !entry.second.IsSequence()) {
            continue;
        }

        std::vector<int> notes;
        for (const auto& noteNode : entry.second) {
            try {
                int note = noteNode.as<int>();
                if (note >= MIN_MIDI_NOTE && note <= MAX_MIDI_NOTE) {
                    notes.push_back(note);
                }
            } catch (const YAML::BadConversion&) {
                continue;
            }
        }
        out[chordId] = notes;
        ++accepted;
    }
    return accepted;
}

YAML::Node chordsToNode(const Configuration::ChordMap& chords) {
    YAML::Node node(YAML::NodeType::Map);
    for (const auto& [chordId, notes] : chords) {
        YAML::Node list(YAML::NodeType::Sequence);
        for (int note : notes) {
            list.push_back(note);
        }
        list.SetStyle(YAML::EmitterStyle::Flow);
        node[std::to_string(chordId)] = list;
    }
    return node;
}

} // anonymous namespace

Configuration::Configuration()
    : chords_(defaultChords()) {
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

Configuration::ChordMap Configuration::defaultChords() {
    return {
        {1, {60, 64, 67}},  // C major
        {2, {62, 66, 69}},  // D major
        {3, {64, 68, 71}},  // E major
        {4, {65, 69, 72}},  // F major
        {5, {67, 71, 74}}   // G major
    };
}

bool Configuration::load(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    currentFile_ = filename;
    chords_ = defaultChords();
    midi_ = MidiSettings{};
    gesture_ = GestureConfigSection{};
    ui_ = UiSettings{};
    modified_ = false;
    lastError_.clear();

    std::ifstream file(filename);
    if (!file.good()) {
        LOG_INFO("No configuration at " + filename + ", using defaults");
        return true;
    }
    file.close();

    return parseFile(filename);
}

bool Configuration::save(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writeFile(filename)) {
        return false;
    }
    modified_ = false;
    return true;
}

bool Configuration::save() const {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = currentFile_.empty() ? DEFAULT_FILENAME : currentFile_;
    }
    return save(target);
}

bool Configuration::reload() {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (currentFile_.empty()) {
            setError("No configuration file loaded");
            return false;
        }
        target = currentFile_;
    }
    return load(target);
}

void Configuration::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    chords_ = defaultChords();
    midi_ = MidiSettings{};
    gesture_ = GestureConfigSection{};
    ui_ = UiSettings{};
    modified_ = true;
}

bool Configuration::exportChords(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Node root;
    root["chords"] = chordsToNode(chords_);
    root["exported_from"] = "AirChord";

    std::ofstream file(filename);
    if (!file.is_open()) {
        setError("Cannot open " + filename + " for writing");
        return false;
    }
    file << root << "\n";
    if (!file.good()) {
        setError("Write failed for " + filename);
        return false;
    }
    LOG_INFO("Exported " + std::to_string(chords_.size()) + " chords to " + filename);
    return true;
}

bool Configuration::importChords(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        setError("Cannot import chords from " + filename + ": " + e.what());
        return false;
    }

    ChordMap imported;
    if (readChords(root["chords"], imported) == 0) {
        setError("No valid chords in " + filename);
        return false;
    }

    for (const auto& [chordId, notes] : imported) {
        chords_[chordId] = notes;
    }
    modified_ = true;
    LOG_INFO("Imported " + std::to_string(imported.size()) + " chords from " + filename);
    return true;
}

Configuration::ChordMap Configuration::getChords() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chords_;
}

std::vector<int> Configuration::getChord(int chordId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chords_.find(chordId);
    if (it == chords_.end()) {
        return {};
    }
    return it->second;
}

void Configuration::setChord(int chordId, const std::vector<int>& notes) {
    std::lock_guard<std::mutex> lock(mutex_);
    chords_[chordId] = notes;
    modified_ = true;
}

Configuration::MidiSettings Configuration::getMidiSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return midi_;
}

void Configuration::setMidiSettings(const MidiSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    midi_ = settings;
    modified_ = true;
}

Configuration::GestureConfigSection Configuration::getGestureSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gesture_;
}

void Configuration::setGestureSettings(const GestureConfigSection& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    gesture_ = settings;
    modified_ = true;
}

Configuration::UiSettings Configuration::getUiSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ui_;
}

void Configuration::setUiSettings(const UiSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    ui_ = settings;
    modified_ = true;
}

std::string Configuration::getSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "AirChord Configuration:\n\nChords:\n";
    for (int chordId = MIN_CHORD_ID; chordId <= MAX_CHORD_ID; ++chordId) {
        auto it = chords_.find(chordId);
        oss << "  Chord " << chordId << ": ";
        if (it == chords_.end() || it->second.empty()) {
            oss << "Not set\n";
            continue;
        }
        oss << "[";
        for (size_t i = 0; i < it->second.size(); ++i) {
            oss << (i ? ", " : "") << it->second[i];
        }
        oss << "]\n";
    }

    oss << "\nMIDI Settings:\n"
        << "  Device ID: " << (midi_.deviceId < 0 ? std::string("auto") : std::to_string(midi_.deviceId)) << "\n"
        << "  Velocity: " << midi_.velocity << "\n"
        << "  Channel: " << midi_.channel << "\n";

    oss << "\nGesture Settings:\n"
        << "  Stability Threshold: " << gesture_.stabilityThreshold << "\n"
        << "  History Length: " << gesture_.historyLength << "\n"
        << "  Camera Index: " << gesture_.cameraIndex << "\n";

    return oss.str();
}

bool Configuration::isModified() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modified_;
}

std::string Configuration::getFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentFile_;
}

std::string Configuration::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool Configuration::parseFile(const std::string& filename) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        setError("Error loading config " + filename + ": " + e.what());
        return false;
    }

    if (!root.IsNull() && !root.IsMap()) {
        setError("Config root of " + filename + " is not a mapping");
        return false;
    }

    applyNode(root);
    LOG_INFO("Configuration loaded from " + filename);
    return true;
}

void Configuration::applyNode(const YAML::Node& root) {
    readChords(root["chords"], chords_);

    const YAML::Node midi = root["midi_settings"];
    if (midi.IsMap()) {
        readScalar(midi, "device_id", midi_.deviceId);
        readScalar(midi, "velocity", midi_.velocity);
        readScalar(midi, "channel", midi_.channel);
    }

    const YAML::Node gesture = root["gesture_settings"];
    if (gesture.IsMap()) {
        readScalar(gesture, "history_length", gesture_.historyLength);
        readScalar(gesture, "stability_threshold", gesture_.stabilityThreshold);
        readScalar(gesture, "camera_index", gesture_.cameraIndex);
    }

    const YAML::Node ui = root["ui_settings"];
    if (ui.IsMap()) {
        readScalar(ui, "window_width", ui_.windowWidth);
        readScalar(ui, "window_height", ui_.windowHeight);
        readScalar(ui, "piano_width", ui_.pianoWidth);
        readScalar(ui, "piano_height", ui_.pianoHeight);
    }
}

bool Configuration::writeFile(const std::string& filename) const {
    YAML::Node root;
    root["chords"] = chordsToNode(chords_);

    root["midi_settings"]["device_id"] = midi_.deviceId;
    root["midi_settings"]["velocity"] = midi_.velocity;
    root["midi_settings"]["channel"] = midi_.channel;

    root["gesture_settings"]["history_length"] = gesture_.historyLength;
    root["gesture_settings"]["stability_threshold"] = gesture_.stabilityThreshold;
    root["gesture_settings"]["camera_index"] = gesture_.cameraIndex;

    root["ui_settings"]["window_width"] = ui_.windowWidth;
    root["ui_settings"]["window_height"] = ui_.windowHeight;
    root["ui_settings"]["piano_width"] = ui_.pianoWidth;
    root["ui_settings"]["piano_height"] = ui_.pianoHeight;

    std::ofstream file(filename);
    if (!file.is_open()) {
        setError("Cannot open " + filename + " for writing");
        return false;
    }
    file << root << "\n";
    if (!file.good()) {
        setError("Write failed for " + filename);
        return false;
    }
    return true;
}

void Configuration::setError(const std::string& message) const {
    lastError_ = message;
    LOG_WARNING(message);
}

} // namespace core
} // namespace airchord
