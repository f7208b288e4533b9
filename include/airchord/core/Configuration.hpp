#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>

namespace YAML {
class Node;
}

namespace airchord {
namespace core {

/**
 * Configuration management class
 *
 * YAML-backed application settings: chord table, MIDI output, gesture
 * recognition and window geometry. Thread-safe; values are stored as read and
 * range checks are left to the consumers (GestureSettings, MidiChordSink).
 */
class Configuration {
public:
    /// Chord id (1..5) -> MIDI note numbers
    using ChordMap = std::map<int, std::vector<int>>;

    struct MidiSettings {
        int deviceId = -1;      ///< -1 = auto-select first port
        int velocity = 100;
        int channel = 0;
    };

    struct GestureConfigSection {
        int historyLength = 4;
        double stabilityThreshold = 0.75;
        int cameraIndex = 0;
    };

    struct UiSettings {
        int windowWidth = 1000;
        int windowHeight = 700;
        int pianoWidth = 900;
        int pianoHeight = 200;
    };

    static constexpr const char* DEFAULT_FILENAME = "airchord_config.yaml";

    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from file
     *
     * A missing file leaves the defaults in place and returns true. A file
     * that fails to parse also falls back to defaults but returns false.
     * Keys absent from the file keep their default values.
     */
    bool load(const std::string& filename);

    /**
     * Save configuration to file
     */
    bool save(const std::string& filename) const;

    /**
     * Save to the file last passed to load()
     */
    bool save() const;

    /**
     * Reload configuration from the current file
     */
    bool reload();

    void resetToDefaults();

    /**
     * Write only the chord table to a separate file
     */
    bool exportChords(const std::string& filename) const;

    /**
     * Merge chords from a file written by exportChords()
     *
     * Only ids 1..5 are accepted; notes outside 0..127 are dropped.
     * @return false if the file is unreadable or holds no usable chord
     */
    bool importChords(const std::string& filename);

    // Chords
    ChordMap getChords() const;
    std::vector<int> getChord(int chordId) const;
    void setChord(int chordId, const std::vector<int>& notes);
    static ChordMap defaultChords();

    // Sections
    MidiSettings getMidiSettings() const;
    void setMidiSettings(const MidiSettings& settings);

    GestureConfigSection getGestureSettings() const;
    void setGestureSettings(const GestureConfigSection& settings);

    UiSettings getUiSettings() const;
    void setUiSettings(const UiSettings& settings);

    /**
     * Human-readable dump used by the About dialog and --print-config
     */
    std::string getSummary() const;

    /**
     * Check if configuration has been modified since the last load/save
     */
    bool isModified() const;

    /**
     * Get configuration filename
     */
    std::string getFilename() const;

    std::string getLastError() const;

private:
    Configuration();
    ~Configuration() = default;

    // Delete copy/move
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Internal methods (mutex_ held by caller)
    bool parseFile(const std::string& filename);
    bool writeFile(const std::string& filename) const;
    void applyNode(const YAML::Node& root);
    void setError(const std::string& message) const;

    // Member variables
    mutable std::mutex mutex_;
    ChordMap chords_;
    MidiSettings midi_;
    GestureConfigSection gesture_;
    UiSettings ui_;
    std::string currentFile_;
    mutable bool modified_ = false;
    mutable std::string lastError_;
};

} // namespace core
} // namespace airchord
