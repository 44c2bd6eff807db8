/**
 * @file RasterCanvas.cpp
 * @brief Implementation of the RGBA compositing canvas
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterCanvas.hpp"
#include "../core/Logger.hpp"
#include "../core/RenderError.hpp"
#include <algorithm>
#include <cmath>

namespace prefmap {

RGBA parse_hex_color(const std::string& hex_color, uint8_t alpha) {
    std::string color = hex_color;
    if (!color.empty() && color[0] == '#') {
        color = color.substr(1);
    }

    if (color.length() != 6 ||
        color.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        throw RenderingError("invalid color '" + hex_color + "'");
    }

    uint8_t r = static_cast<uint8_t>(std::stoi(color.substr(0, 2), nullptr, 16));
    uint8_t g = static_cast<uint8_t>(std::stoi(color.substr(2, 2), nullptr, 16));
    uint8_t b = static_cast<uint8_t>(std::stoi(color.substr(4, 2), nullptr, 16));
    return {r, g, b, alpha};
}

RasterCanvas::RasterCanvas(int width, int height, const RGBA& background)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw RenderingError("invalid canvas size " + std::to_string(width) + "x" +
                             std::to_string(height));
    }

    pixels_.resize(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels_.size(); i += 4) {
        pixels_[i] = background[0];
        pixels_[i + 1] = background[1];
        pixels_[i + 2] = background[2];
        pixels_[i + 3] = 255;
    }
}

RGBA RasterCanvas::pixel(int x, int y) const {
    if (!contains(x, y)) {
        return {0, 0, 0, 0};
    }
    size_t i = offset(x, y);
    return {pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
}

void RasterCanvas::blend_pixel(int x, int y, const RGBA& color, double alpha) {
    if (!contains(x, y) || alpha <= 0.0) return;

    double a = std::min(alpha, 1.0);
    size_t i = offset(x, y);
    for (int c = 0; c < 3; ++c) {
        double value = color[c] * a + pixels_[i + c] * (1.0 - a);
        pixels_[i + c] = static_cast<uint8_t>(std::lround(value));
    }
    pixels_[i + 3] = 255;
}

GDALDataset* RasterCanvas::to_dataset() const {
    Logger logger("RasterCanvas");

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        logger.error("MEM driver not available");
        return nullptr;
    }

    GDALDataset* dataset = mem_driver->Create("", width_, height_, 4, GDT_Byte, nullptr);
    if (!dataset) {
        logger.error("Failed to create MEM dataset");
        return nullptr;
    }

    CPLErr err = dataset->RasterIO(GF_Write, 0, 0, width_, height_,
                                   const_cast<uint8_t*>(pixels_.data()), width_, height_,
                                   GDT_Byte, 4, nullptr,
                                   4, static_cast<GSpacing>(width_) * 4, 1, nullptr);
    if (err != CE_None) {
        logger.error("Failed to write canvas into dataset");
        GDALClose(dataset);
        return nullptr;
    }

    dataset->GetRasterBand(1)->SetColorInterpretation(GCI_RedBand);
    dataset->GetRasterBand(2)->SetColorInterpretation(GCI_GreenBand);
    dataset->GetRasterBand(3)->SetColorInterpretation(GCI_BlueBand);
    dataset->GetRasterBand(4)->SetColorInterpretation(GCI_AlphaBand);
    return dataset;
}

} // namespace prefmap
