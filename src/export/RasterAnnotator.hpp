/**
 * @file RasterAnnotator.hpp
 * @brief Draws lines and text on a RasterCanvas
 *
 * Text goes through FreeType with antialiased glyph coverage blended onto
 * the canvas. Coordinates are canvas pixels; text origins are baselines.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "prefmap.hpp"
#include "RasterCanvas.hpp"
#include <ft2build.h>
#include FT_FREETYPE_H
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief Font selection for raster text
 */
struct AnnotationConfig {
    std::string font_directory = "./fonts";        ///< Searched for roboto-*.ttf first
    FontWeight font_weight = FontWeight::REGULAR;
    std::string font_path = "";                   ///< Explicit font file (empty = resolve)
};

/**
 * @brief Utility class for drawing annotations on a RasterCanvas
 *
 * Owns its FreeType library and face handles; one instance per render.
 */
class RasterAnnotator {
public:
    explicit RasterAnnotator(const AnnotationConfig& config = AnnotationConfig{});
    ~RasterAnnotator();

    RasterAnnotator(const RasterAnnotator&) = delete;
    RasterAnnotator& operator=(const RasterAnnotator&) = delete;

    /**
     * @brief Draw a line with Bresenham's algorithm
     *
     * Widths of 1px or more are drawn as squares of side 2*int(width/2)+1 at
     * each step; thinner lines are single pixels blended at alpha = width.
     * Every covered pixel is blended once per call.
     */
    void draw_polyline(RasterCanvas& canvas,
                       const std::vector<PixelPoint>& points,
                       bool closed,
                       const RGBA& color,
                       double width);

    /**
     * @brief Draw UTF-8 text with its baseline origin at (x, y)
     * @return true if successful, false if no font could be loaded
     */
    bool draw_text(RasterCanvas& canvas,
                   const std::string& text,
                   int x, int y,
                   int font_size_px,
                   const RGBA& color);

    /**
     * @brief Measure text advance width in pixels
     * @return Width in pixels, or -1 if font not loaded
     */
    int measure_text_width(const std::string& text, int font_size_px);

    /**
     * @brief Font file that draw_text() will use
     * @return Resolved path, or empty if none was found
     */
    std::string resolve_font_path() const;

    /// Decode UTF-8 into code points; invalid bytes become U+FFFD
    static std::vector<char32_t> decode_utf8(const std::string& text);

    const AnnotationConfig& get_config() const { return config_; }

private:
    AnnotationConfig config_;

    // FreeType state
    FT_Library ft_library_;
    FT_Face ft_face_;
    bool ft_initialized_;
    std::string loaded_font_path_;

    bool initialize_freetype();
    bool load_font(const std::string& font_path);
    void cleanup_freetype();

    /// Resolve, load and size the face
    bool prepare_face(int font_size_px);

    void stamp(std::vector<uint8_t>& mask, int mask_x, int mask_y, int mask_w, int mask_h,
               int x, int y, int half_width) const;
};

} // namespace prefmap
