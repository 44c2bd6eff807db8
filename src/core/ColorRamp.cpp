/**
 * @file ColorRamp.cpp
 * @brief Intensity palette lookup
 */

#include "ColorRamp.hpp"

namespace prefmap {

std::string ColorRamp::color_of(int level) {
    if (level >= 0 && level < static_cast<int>(PALETTE.size())) {
        return PALETTE[level];
    }

    // Out of range; unreachable once input validation enforces [0,7]
    if (level > 6) {
        return FALLBACK_DARKEST;
    }
    if (level > 5) {
        return FALLBACK_SECOND_DARKEST;
    }
    return PALETTE[0];
}

} // namespace prefmap
