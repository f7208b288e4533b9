/**
 * @file HandSelector.cpp
 * @brief Hand selection implementation
 */

#include "airchord/gesture/HandSelector.hpp"

namespace airchord {
namespace gesture {

int HandSelector::select_index(const std::vector<HandLandmarks>& hands) {
    if (hands.empty()) {
        return NO_HAND;
    }

    for (size_t i = 0; i < hands.size(); ++i) {
        if (hands[i].is_right_hand) {
            return static_cast<int>(i);
        }
    }
    return 0;
}

const HandLandmarks* HandSelector::select(const std::vector<HandLandmarks>& hands) {
    int index = select_index(hands);
    return index == NO_HAND ? nullptr : &hands[index];
}

} // namespace gesture
} // namespace airchord
