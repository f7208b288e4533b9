#include "airchord/core/exception.h"
#include <sstream>

namespace airchord {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_DETECTOR_FAILURE:
            return "ERROR_DETECTOR_FAILURE";
        case ResultCode::ERROR_MIDI_UNAVAILABLE:
            return "ERROR_MIDI_UNAVAILABLE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace airchord
