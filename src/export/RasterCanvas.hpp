/**
 * @file RasterCanvas.hpp
 * @brief In-memory RGBA pixel buffer used while compositing a map
 *
 * Drawing goes to an interleaved RGBA buffer; the finished canvas is handed
 * to GDAL as a MEM dataset for encoding.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <gdal_priv.h>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace prefmap {

using RGBA = std::array<uint8_t, 4>;

/**
 * @brief Parse "#rrggbb" (or "rrggbb") into an RGBA color
 * @throws RenderingError if the string is not a 6-digit hex color
 */
RGBA parse_hex_color(const std::string& hex_color, uint8_t alpha = 255);

class RasterCanvas {
public:
    /// Canvas filled with an opaque background color
    RasterCanvas(int width, int height, const RGBA& background);

    int width() const { return width_; }
    int height() const { return height_; }

    bool contains(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    RGBA pixel(int x, int y) const;

    /**
     * @brief Source-over blend onto an opaque canvas
     * @param alpha Coverage in [0, 1]
     */
    void blend_pixel(int x, int y, const RGBA& color, double alpha);

    /// Interleaved RGBA, row-major, top row first
    const std::vector<uint8_t>& data() const { return pixels_; }

    /**
     * @brief Copy the canvas into a new 4-band MEM dataset
     * @return Dataset (caller must GDALClose()), or nullptr on failure
     */
    GDALDataset* to_dataset() const;

private:
    int width_;
    int height_;
    std::vector<uint8_t> pixels_;

    size_t offset(int x, int y) const {
        return (static_cast<size_t>(y) * width_ + x) * 4;
    }
};

} // namespace prefmap
