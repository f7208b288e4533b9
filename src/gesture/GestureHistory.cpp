/**
 * @file GestureHistory.cpp
 * @brief Ring buffer implementation
 */

#include "airchord/gesture/GestureHistory.hpp"
#include <stdexcept>
#include <map>

namespace airchord {
namespace gesture {

GestureHistory::GestureHistory(size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("GestureHistory capacity must be >= 1");
    }
    values_.assign(capacity, 0);
}

void GestureHistory::push(int value) {
    if (is_full()) {
        values_[head_] = value;
        head_ = (head_ + 1) % values_.size();
        return;
    }
    values_[(head_ + size_) % values_.size()] = value;
    ++size_;
}

void GestureHistory::clear() {
    head_ = 0;
    size_ = 0;
}

size_t GestureHistory::frequency(int value) const {
    size_t count = 0;
    for (size_t i = 0; i < size_; ++i) {
        if (values_[(head_ + i) % values_.size()] == value) {
            ++count;
        }
    }
    return count;
}

int GestureHistory::mode(size_t& count) const {
    count = 0;
    if (size_ == 0) {
        return 0;
    }

    // Ordered map: iterating ascending keeps the smallest value on ties
    std::map<int, size_t> histogram;
    for (size_t i = 0; i < size_; ++i) {
        ++histogram[values_[(head_ + i) % values_.size()]];
    }

    int best = histogram.begin()->first;
    for (const auto& [value, occurrences] : histogram) {
        if (occurrences > count) {
            best = value;
            count = occurrences;
        }
    }
    return best;
}

std::vector<int> GestureHistory::to_vector() const {
    std::vector<int> result;
    result.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        result.push_back(values_[(head_ + i) % values_.size()]);
    }
    return result;
}

} // namespace gesture
} // namespace airchord
