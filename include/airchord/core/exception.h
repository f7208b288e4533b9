#pragma once

#include "airchord/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for AirChord
 */

namespace airchord {
namespace core {

/**
 * @brief Base exception class for all AirChord exceptions
 *
 * Carries a result code and the source context next to the message so
 * the GUI can show the text while the log keeps the location.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message
     * @return Error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid configuration values (raised at session start)
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Hand landmark detector failures
 */
class DetectorException : public Exception {
public:
    DetectorException(const std::string& message,
                      const std::string& context = "")
        : Exception(ResultCode::ERROR_DETECTOR_FAILURE, message, context) {}
};

/**
 * @brief MIDI API failures (port creation, open, send)
 */
class MidiException : public Exception {
public:
    MidiException(const std::string& message,
                  const std::string& context = "")
        : Exception(ResultCode::ERROR_MIDI_UNAVAILABLE, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define AIRCHORD_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace airchord
