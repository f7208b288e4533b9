/**
 * @file GestureHistory.hpp
 * @brief Bounded ring buffer of raw gesture counts
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_HISTORY_HPP
#define AIRCHORD_GESTURE_HISTORY_HPP

#include <vector>
#include <cstddef>

namespace airchord {
namespace gesture {

/**
 * @brief Fixed-capacity ring buffer of raw finger counts
 *
 * Pushing onto a full buffer overwrites the oldest entry. Storage is
 * allocated once at construction.
 *
 * Thread-safety: Not thread-safe. Owned by the gesture worker thread.
 *
 * Performance: O(1) push, O(N) frequency/mode queries.
 */
class GestureHistory {
public:
    /**
     * @brief Constructor with capacity
     * @param capacity Window size in frames (must be >= 1)
     * @throws std::invalid_argument if capacity is 0
     */
    explicit GestureHistory(size_t capacity);

    /**
     * @brief Append a count, evicting the oldest when full
     */
    void push(int value);

    size_t size() const { return size_; }
    size_t capacity() const { return values_.size(); }
    bool is_full() const { return size_ == values_.size(); }
    bool is_empty() const { return size_ == 0; }

    /**
     * @brief Remove all entries (capacity unchanged)
     */
    void clear();

    /**
     * @brief Occurrences of value in the window
     */
    size_t frequency(int value) const;

    /**
     * @brief Most frequent value; ties go to the smallest value
     * @param[out] count Occurrences of the returned value
     * @return Mode of the window (0 when empty)
     */
    int mode(size_t& count) const;

    /**
     * @brief Entries in chronological order (oldest first)
     */
    std::vector<int> to_vector() const;

private:
    std::vector<int> values_;
    size_t head_ = 0;   ///< Index of the oldest entry
    size_t size_ = 0;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_HISTORY_HPP
