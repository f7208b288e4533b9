/**
 * @file types.hpp
 * @brief Common type definitions for AirChord
 *
 * Result codes carried by the exception hierarchy.
 */

#ifndef AIRCHORD_CORE_TYPES_HPP
#define AIRCHORD_CORE_TYPES_HPP

namespace airchord {
namespace core {

/**
 * @brief Error categories for the exception hierarchy
 */
enum class ResultCode {
    ERROR_CONFIG_INVALID = 1,
    ERROR_DETECTOR_FAILURE,
    ERROR_MIDI_UNAVAILABLE
};

} // namespace core
} // namespace airchord

#endif // AIRCHORD_CORE_TYPES_HPP
