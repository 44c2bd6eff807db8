/**
 * @file RenderOptions.cpp
 * @brief Size class and font weight parsing
 */

#include "prefmap.hpp"
#include "Logger.hpp"

namespace prefmap {

double size_multiplier(SizeClass size_class) {
    switch (size_class) {
        case SizeClass::STANDARD:    return 1.0;
        case SizeClass::LARGE:       return 2.0;
        case SizeClass::EXTRA_LARGE: return 4.0;
    }
    return 1.0;
}

SizeClass parse_size_class(const std::string& value) {
    if (value == "1") return SizeClass::STANDARD;
    if (value == "2") return SizeClass::LARGE;
    if (value == "3") return SizeClass::EXTRA_LARGE;

    if (!value.empty()) {
        Logger logger("RenderOptions");
        logger.warning("Unknown size class '" + value + "', using 1");
    }
    return SizeClass::STANDARD;
}

FontWeight parse_font_weight(int weight) {
    if (weight == static_cast<int>(FontWeight::MEDIUM)) {
        return FontWeight::MEDIUM;
    }
    if (weight != static_cast<int>(FontWeight::REGULAR)) {
        Logger logger("RenderOptions");
        logger.warning("Unsupported font weight " + std::to_string(weight) + ", using 400");
    }
    return FontWeight::REGULAR;
}

} // namespace prefmap
