#pragma once

/**
 * @file ChordSink.hpp
 * @brief Output side of the gesture pipeline
 */

#include <string>

namespace airchord {
namespace midi {

/**
 * @brief Receiver of chord start/stop commands
 *
 * Chord ids are 1..5; the implementation resolves them to notes. Commands
 * on a disconnected sink are no-ops that return false, never exceptions.
 */
class ChordSink {
public:
    virtual ~ChordSink() = default;

    /**
     * @brief Start sounding a chord
     * @return true if the command reached the output
     */
    virtual bool startChord(int chordId) = 0;

    /**
     * @brief Stop a sounding chord
     * @return true if the command reached the output
     */
    virtual bool stopChord(int chordId) = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Reason for the most recent failed command
     */
    virtual std::string getLastError() const = 0;
};

} // namespace midi
} // namespace airchord
