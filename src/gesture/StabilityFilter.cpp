/**
 * @file StabilityFilter.cpp
 * @brief Stability filter implementation
 */

#include "airchord/gesture/StabilityFilter.hpp"
#include "airchord/core/exception.h"

namespace airchord {
namespace gesture {

namespace {

// Validates before the history is sized from history_length
const GestureSettings& checked(const GestureSettings& settings) {
    if (!settings.is_valid()) {
        AIRCHORD_THROW(core::ConfigurationException,
                       "Invalid gesture settings: " + settings.validation_error());
    }
    return settings;
}

} // anonymous namespace

StabilityFilter::StabilityFilter(const GestureSettings& settings)
    : settings_(checked(settings))
    , history_(static_cast<size_t>(settings.history_length))
{
}

int StabilityFilter::feed(int raw_count) {
    history_.push(raw_count);

    if (!history_.is_full()) {
        return stable_;
    }

    size_t occurrences = 0;
    int candidate = history_.mode(occurrences);
    last_ratio_ = static_cast<double>(occurrences) / static_cast<double>(history_.capacity());

    if (last_ratio_ >= settings_.stability_threshold) {
        stable_ = candidate;
    }
    return stable_;
}

void StabilityFilter::reset() {
    history_.clear();
    stable_ = MIN_GESTURE;
    last_ratio_ = 0.0;
}

} // namespace gesture
} // namespace airchord
