/**
 * @file ColorRamp.hpp
 * @brief Fixed intensity-level color palette
 */

#pragma once

#include <array>
#include <string>

namespace prefmap {

/**
 * @brief Maps an intensity level to its display color
 *
 * Levels 0..7 use the fixed 8-entry palette. Levels outside that range are
 * rejected upstream by InputValidator; color_of() still answers them with the
 * fallback tiers (darkest for > 6, second darkest for > 5, base otherwise).
 */
class ColorRamp {
public:
    static constexpr std::array<const char*, 8> PALETTE = {
        "#27272a",  // 0 inactive / dark gray
        "#bae6fd",  // 1 pale cyan
        "#4ade80",  // 2 green
        "#facc15",  // 3 yellow
        "#f97316",  // 4 orange
        "#dc2626",  // 5 red
        "#86198f",  // 6 magenta
        "#500724"   // 7 deep maroon
    };

    static constexpr const char* FALLBACK_DARKEST = "#4a044e";
    static constexpr const char* FALLBACK_SECOND_DARKEST = "#b91c1c";

    /**
     * @brief Color for an intensity level
     * @param level Intensity level (expected in [0,7])
     * @return "#rrggbb" color string
     */
    static std::string color_of(int level);

    /// Color used for regions without an assigned level
    static std::string inactive_color() { return PALETTE[0]; }
};

} // namespace prefmap
