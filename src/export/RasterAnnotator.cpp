/**
 * @file RasterAnnotator.cpp
 * @brief Implementation of raster line and text drawing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterAnnotator.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <filesystem>

namespace prefmap {

namespace {

// Tried in order after the configured font directory
const std::vector<std::string> SYSTEM_FONT_PATHS = {
    "/usr/share/fonts/truetype/roboto/unhinted/RobotoTTF/Roboto-Regular.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    "/System/Library/Fonts/Supplemental/Arial.ttf",
    "/System/Library/Fonts/Helvetica.ttc"
};

} // namespace

RasterAnnotator::RasterAnnotator(const AnnotationConfig& config)
    : config_(config)
    , ft_library_(nullptr)
    , ft_face_(nullptr)
    , ft_initialized_(false)
    , loaded_font_path_("") {
}

RasterAnnotator::~RasterAnnotator() {
    cleanup_freetype();
}

void RasterAnnotator::stamp(std::vector<uint8_t>& mask, int mask_x, int mask_y, int mask_w, int mask_h,
                            int x, int y, int half_width) const {
    for (int dy = -half_width; dy <= half_width; ++dy) {
        for (int dx = -half_width; dx <= half_width; ++dx) {
            int mx = x + dx - mask_x;
            int my = y + dy - mask_y;
            if (mx < 0 || mx >= mask_w || my < 0 || my >= mask_h) continue;
            mask[static_cast<size_t>(my) * mask_w + mx] = 1;
        }
    }
}

void RasterAnnotator::draw_polyline(RasterCanvas& canvas,
                                    const std::vector<PixelPoint>& points,
                                    bool closed,
                                    const RGBA& color,
                                    double width) {
    if (points.empty() || width <= 0.0) return;

    std::vector<std::pair<int, int>> vertices;
    vertices.reserve(points.size() + 1);
    for (const auto& point : points) {
        vertices.emplace_back(static_cast<int>(std::lround(point.x)),
                              static_cast<int>(std::lround(point.y)));
    }
    if (closed && vertices.size() > 1) {
        vertices.push_back(vertices.front());
    }

    int half_width = width >= 1.0 ? static_cast<int>(width / 2.0) : 0;
    double alpha = std::min(width, 1.0);

    // Coverage mask over the clipped bounding box
    int min_x = INT_MAX, min_y = INT_MAX, max_x = INT_MIN, max_y = INT_MIN;
    for (const auto& [vx, vy] : vertices) {
        min_x = std::min(min_x, vx);
        min_y = std::min(min_y, vy);
        max_x = std::max(max_x, vx);
        max_y = std::max(max_y, vy);
    }
    int mask_x = std::max(0, min_x - half_width);
    int mask_y = std::max(0, min_y - half_width);
    int mask_x1 = std::min(canvas.width() - 1, max_x + half_width);
    int mask_y1 = std::min(canvas.height() - 1, max_y + half_width);
    if (mask_x > mask_x1 || mask_y > mask_y1) return;

    int mask_w = mask_x1 - mask_x + 1;
    int mask_h = mask_y1 - mask_y + 1;
    std::vector<uint8_t> mask(static_cast<size_t>(mask_w) * mask_h, 0);

    if (vertices.size() == 1) {
        stamp(mask, mask_x, mask_y, mask_w, mask_h, vertices[0].first, vertices[0].second, half_width);
    }

    // Bresenham's line algorithm per segment
    for (size_t i = 1; i < vertices.size(); ++i) {
        int x1 = vertices[i - 1].first, y1 = vertices[i - 1].second;
        int x2 = vertices[i].first, y2 = vertices[i].second;

        int dx = std::abs(x2 - x1);
        int dy = std::abs(y2 - y1);
        int sx = (x1 < x2) ? 1 : -1;
        int sy = (y1 < y2) ? 1 : -1;
        int err = dx - dy;

        int x = x1;
        int y = y1;
        while (true) {
            stamp(mask, mask_x, mask_y, mask_w, mask_h, x, y, half_width);

            if (x == x2 && y == y2) break;

            int e2 = 2 * err;
            if (e2 > -dy) {
                err -= dy;
                x += sx;
            }
            if (e2 < dx) {
                err += dx;
                y += sy;
            }
        }
    }

    for (int my = 0; my < mask_h; ++my) {
        for (int mx = 0; mx < mask_w; ++mx) {
            if (mask[static_cast<size_t>(my) * mask_w + mx]) {
                canvas.blend_pixel(mask_x + mx, mask_y + my, color, alpha);
            }
        }
    }
}

// FreeType initialization and management

bool RasterAnnotator::initialize_freetype() {
    if (ft_initialized_) {
        return true;
    }

    Logger logger("RasterAnnotator");
    FT_Error error = FT_Init_FreeType(&ft_library_);
    if (error) {
        logger.error("Failed to initialize FreeType library (error " + std::to_string(error) + ")");
        return false;
    }

    ft_initialized_ = true;
    return true;
}

bool RasterAnnotator::load_font(const std::string& font_path) {
    if (!ft_initialized_ && !initialize_freetype()) {
        return false;
    }

    if (ft_face_ != nullptr && loaded_font_path_ == font_path) {
        return true;
    }

    if (ft_face_ != nullptr) {
        FT_Done_Face(ft_face_);
        ft_face_ = nullptr;
    }

    Logger logger("RasterAnnotator");
    FT_Error error = FT_New_Face(ft_library_, font_path.c_str(), 0, &ft_face_);
    if (error) {
        ft_face_ = nullptr;
        logger.error("Failed to load font from " + font_path + " (error " + std::to_string(error) + ")");
        return false;
    }

    loaded_font_path_ = font_path;
    logger.debug("Loaded font " + font_path);
    return true;
}

void RasterAnnotator::cleanup_freetype() {
    if (ft_face_ != nullptr) {
        FT_Done_Face(ft_face_);
        ft_face_ = nullptr;
    }

    if (ft_initialized_) {
        FT_Done_FreeType(ft_library_);
        ft_library_ = nullptr;
        ft_initialized_ = false;
    }

    loaded_font_path_.clear();
}

std::string RasterAnnotator::resolve_font_path() const {
    Logger logger("RasterAnnotator");

    if (!config_.font_path.empty()) {
        if (std::filesystem::exists(config_.font_path)) {
            return config_.font_path;
        }
        logger.warning("Specified font not found: " + config_.font_path);
    }

    std::string file_name = config_.font_weight == FontWeight::MEDIUM
        ? "roboto-medium.ttf" : "roboto-regular.ttf";
    std::filesystem::path bundled = std::filesystem::path(config_.font_directory) / file_name;
    if (std::filesystem::exists(bundled)) {
        return bundled.string();
    }

    for (const auto& path : SYSTEM_FONT_PATHS) {
        if (std::filesystem::exists(path)) {
            logger.detailed("Using system font " + path + " instead of " + bundled.string());
            return path;
        }
    }

    logger.error("No suitable font found in " + config_.font_directory + " or system font paths");
    return "";
}

bool RasterAnnotator::prepare_face(int font_size_px) {
    Logger logger("RasterAnnotator");

    std::string font_path = resolve_font_path();
    if (font_path.empty()) {
        return false;
    }

    if (!load_font(font_path)) {
        return false;
    }

    FT_Error error = FT_Set_Pixel_Sizes(ft_face_, 0, static_cast<FT_UInt>(font_size_px));
    if (error) {
        logger.error("Failed to set font size " + std::to_string(font_size_px) +
                     " (error " + std::to_string(error) + ")");
        return false;
    }
    return true;
}

std::vector<char32_t> RasterAnnotator::decode_utf8(const std::string& text) {
    std::vector<char32_t> code_points;
    code_points.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t length = 0;

        if (lead < 0x80) {
            cp = lead;
            length = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            length = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            length = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            length = 4;
        } else {
            code_points.push_back(0xFFFD);
            ++i;
            continue;
        }

        bool valid = i + length <= text.size();
        for (size_t k = 1; valid && k < length; ++k) {
            unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (next & 0x3F);
            }
        }

        if (!valid) {
            code_points.push_back(0xFFFD);
            ++i;
            continue;
        }

        code_points.push_back(cp);
        i += length;
    }
    return code_points;
}

int RasterAnnotator::measure_text_width(const std::string& text, int font_size_px) {
    if (text.empty()) return 0;

    if (!prepare_face(font_size_px)) {
        return -1;
    }

    int total_width = 0;
    for (char32_t c : decode_utf8(text)) {
        if (FT_Load_Char(ft_face_, c, FT_LOAD_DEFAULT)) continue;
        total_width += ft_face_->glyph->advance.x >> 6; // 26.6 fixed-point
    }
    return total_width;
}

bool RasterAnnotator::draw_text(RasterCanvas& canvas,
                                const std::string& text,
                                int x, int y,
                                int font_size_px,
                                const RGBA& color) {
    Logger logger("RasterAnnotator");

    if (text.empty()) return true;

    if (!prepare_face(font_size_px)) {
        logger.error("No font available for text rendering");
        return false;
    }

    std::vector<char32_t> code_points = decode_utf8(text);

    int pen_x = x;

    int pen_y = y;
    for (char32_t c : code_points) {
        FT_Error error = FT_Load_Char(ft_face_, c, FT_LOAD_RENDER);
        if (error) {
            logger.warning("Failed to load glyph U+" + std::to_string(static_cast<unsigned long>(c)) +
                           " (error " + std::to_string(error) + ")");
            continue;
        }

        FT_GlyphSlot glyph = ft_face_->glyph;
        FT_Bitmap& bitmap = glyph->bitmap;

        int glyph_x = pen_x + glyph->bitmap_left;
        int glyph_y = pen_y - glyph->bitmap_top; // FreeType uses baseline coordinates

        for (unsigned int row = 0; row < bitmap.rows; ++row) {
            for (unsigned int col = 0; col < bitmap.width; ++col) {
                uint8_t coverage = bitmap.buffer[row * bitmap.pitch + col];
                if (coverage > 0) {
                    canvas.blend_pixel(glyph_x + static_cast<int>(col),
                                       glyph_y + static_cast<int>(row),
                                       color, coverage / 255.0);
                }
            }
        }

        pen_x += glyph->advance.x >> 6;
    }

    return true;
}

} // namespace prefmap
