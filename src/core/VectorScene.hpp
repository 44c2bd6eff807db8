/**
 * @file VectorScene.hpp
 * @brief Styled vector scene handed from the composer to the rasterizer
 *
 * The scene keeps path and style data in their textual form (the same form
 * an SVG document carries), plus the parsers the rasterizer uses to read
 * them back.
 */

#pragma once

#include "prefmap.hpp"
#include <optional>
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief One styled (multi-subpath) path, one per region
 */
struct SceneElement {
    int region_id = 0;
    std::string path_data;   ///< "M.. L.. Z M.. L.. Z " subpaths
    std::string style;       ///< "fill:#..;stroke:#..;stroke-width:..;fill-opacity:.."
};

/**
 * @brief Complete vector scene: background rectangle, then elements in order
 */
struct VectorScene {
    int width = 0;
    int height = 0;
    std::string background_style;          ///< Style of the full-canvas rectangle
    std::vector<SceneElement> elements;
};

/**
 * @brief Parsed style declaration
 *
 * Unset properties keep their defaults: no fill, no stroke, opacity 1.
 */
struct SceneStyle {
    std::optional<std::string> fill;       ///< "#rrggbb", nullopt for none
    std::optional<std::string> stroke;
    double stroke_width = 1.0;
    double fill_opacity = 1.0;
};

/// Closed subpath in pixel coordinates, vertices in path order
using Subpath = std::vector<PixelPoint>;

/**
 * @brief Parse move/line/close path data
 *
 * Accepts "M x y", "L x y" (with or without a space after the command) and
 * "Z". Each M starts a new subpath.
 *
 * @throws RenderingError on unknown commands or malformed numbers
 */
std::vector<Subpath> parse_path_data(const std::string& path_data);

/**
 * @brief Parse a "name:value;name:value" style declaration
 *
 * Recognized names: fill, stroke, stroke-width, fill-opacity. Unknown names
 * are ignored.
 *
 * @throws RenderingError on malformed declarations or numbers
 */
SceneStyle parse_style(const std::string& style);

} // namespace prefmap
