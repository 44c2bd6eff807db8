/**
 * @file SVGExporter.hpp
 * @brief SVG export of a composed map scene
 *
 * Writes the same scene the rasterizer consumes: background rectangle, one
 * path per region with its style string, then label and footer text.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "../core/LabelPlacer.hpp"
#include "../core/VectorScene.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief SVG export configuration
 */
struct SVGConfig {
    std::string text_color = "#fafafa";
    std::string font_family = "Roboto, sans-serif";
    int font_weight = 400;
    double base_font_size_px = 14.0;    ///< Scaled by size_multiplier
    double size_multiplier = 1.0;
    std::string default_footer;         ///< Used when the caller passes no footer
};

class SVGExporter {
public:
    explicit SVGExporter(const SVGConfig& config = SVGConfig{});

    /// Complete SVG document
    std::string to_svg(const VectorScene& scene,
                       const std::vector<RegionLabel>& labels,
                       const std::string& footer_text) const;

    /**
     * @brief Write an SVG document to a file ("-" writes to stdout)
     * @return true if successful
     */
    static bool write_file(const std::string& document, const std::string& filename);

    /// Escape &, <, >, " and ' for attribute and text content
    static std::string escape_xml(const std::string& text);

    const SVGConfig& get_config() const { return config_; }

private:
    SVGConfig config_;

    void write_svg_header(std::ostream& out, int width, int height) const;
    void write_background(std::ostream& out, const VectorScene& scene) const;
    void write_regions(std::ostream& out, const VectorScene& scene) const;
    void write_text(std::ostream& out, int x, int y, const std::string& text) const;
};

} // namespace prefmap
