/**
 * @file SceneRasterizer.cpp
 * @brief Implementation of scene rasterization
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SceneRasterizer.hpp"
#include "PNGExporter.hpp"
#include "../core/Logger.hpp"
#include "../core/RenderError.hpp"
#include <gdal_alg.h>
#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>

namespace prefmap {

SceneRasterizer::SceneRasterizer(const RasterizerConfig& config)
    : config_(config)
    , annotator_(config.fonts) {
}

void SceneRasterizer::ensure_drivers_registered() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

int SceneRasterizer::font_size_px() const {
    return static_cast<int>(std::lround(config_.base_font_size_px * config_.size_multiplier));
}

void SceneRasterizer::fill_element(RasterCanvas& canvas,
                                   const std::vector<Subpath>& subpaths,
                                   const RGBA& color,
                                   double opacity) const {
    Logger logger("SceneRasterizer");

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();

    OGRPolygon polygon;
    for (const auto& subpath : subpaths) {
        if (subpath.size() < 3) continue;

        OGRLinearRing ring;
        for (const auto& point : subpath) {
            ring.addPoint(point.x, point.y);
            min_x = std::min(min_x, point.x);
            min_y = std::min(min_y, point.y);
            max_x = std::max(max_x, point.x);
            max_y = std::max(max_y, point.y);
        }
        ring.closeRings();
        polygon.addRing(&ring);
    }

    if (polygon.IsEmpty()) return;

    // Mask window: element bounding box clipped to the canvas
    int x0 = std::max(0, static_cast<int>(std::floor(min_x)));
    int y0 = std::max(0, static_cast<int>(std::floor(min_y)));
    int x1 = std::min(canvas.width(), static_cast<int>(std::ceil(max_x)) + 1);
    int y1 = std::min(canvas.height(), static_cast<int>(std::ceil(max_y)) + 1);
    if (x0 >= x1 || y0 >= y1) return;

    int mask_w = x1 - x0;
    int mask_h = y1 - y0;

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        throw RenderingError("MEM driver not available");
    }

    GDALDataset* mask = mem_driver->Create("", mask_w, mask_h, 1, GDT_Byte, nullptr);
    if (!mask) {
        throw RenderingError("failed to create " + std::to_string(mask_w) + "x" +
                             std::to_string(mask_h) + " fill mask");
    }

    // Pixel space offset to the window, y grows downward
    double geotransform[6] = {static_cast<double>(x0), 1.0, 0.0, static_cast<double>(y0), 0.0, 1.0};
    mask->SetGeoTransform(geotransform);

    int band_list[1] = {1};
    double burn_values[1] = {255.0};
    OGRGeometryH geometries[1] = {OGRGeometry::ToHandle(&polygon)};

    CPLErr err = GDALRasterizeGeometries(
        GDALDataset::ToHandle(mask),
        1, band_list,
        1, geometries,
        nullptr, nullptr,    // Transformer from the geotransform
        burn_values,
        nullptr,             // Options
        nullptr, nullptr     // Progress
    );
    if (err != CE_None) {
        GDALClose(mask);
        throw RenderingError("polygon rasterization failed: " + std::string(CPLGetLastErrorMsg()));
    }

    std::vector<uint8_t> coverage(static_cast<size_t>(mask_w) * mask_h, 0);
    err = mask->GetRasterBand(1)->RasterIO(GF_Read, 0, 0, mask_w, mask_h,
                                           coverage.data(), mask_w, mask_h,
                                           GDT_Byte, 0, 0);
    GDALClose(mask);
    if (err != CE_None) {
        throw RenderingError("failed to read fill mask");
    }

    size_t covered = 0;
    for (int my = 0; my < mask_h; ++my) {
        for (int mx = 0; mx < mask_w; ++mx) {
            if (coverage[static_cast<size_t>(my) * mask_w + mx]) {
                canvas.blend_pixel(x0 + mx, y0 + my, color, opacity);
                ++covered;
            }
        }
    }
    logger.trace("Filled " + std::to_string(covered) + " pixels");
}

void SceneRasterizer::paint_element(RasterCanvas& canvas, const SceneElement& element) {
    std::vector<Subpath> subpaths = parse_path_data(element.path_data);
    SceneStyle style = parse_style(element.style);

    if (style.fill) {
        fill_element(canvas, subpaths, parse_hex_color(*style.fill), style.fill_opacity);
    }

    if (style.stroke && style.stroke_width > 0.0) {
        RGBA stroke = parse_hex_color(*style.stroke);
        for (const auto& subpath : subpaths) {
            annotator_.draw_polyline(canvas, subpath, true, stroke, style.stroke_width);
        }
    }
}

RasterCanvas SceneRasterizer::paint_scene(const VectorScene& scene, int width, int height) {
    Logger logger("SceneRasterizer");
    ensure_drivers_registered();

    SceneStyle background = parse_style(scene.background_style);
    if (!background.fill) {
        throw RenderingError("scene background has no fill");
    }

    RasterCanvas canvas(width, height, parse_hex_color(*background.fill));

    for (const auto& element : scene.elements) {
        try {
            paint_element(canvas, element);
        } catch (const RenderingError& e) {
            throw RenderingError("region " + std::to_string(element.region_id) + ": " + e.detail());
        }
    }

    logger.detailed("Painted " + std::to_string(scene.elements.size()) + " elements on " +
                    std::to_string(width) + "x" + std::to_string(height) + " canvas");
    return canvas;
}

void SceneRasterizer::draw_labels(RasterCanvas& canvas, const std::vector<RegionLabel>& labels) {
    RGBA color = parse_hex_color(config_.text_color);
    int size = font_size_px();

    for (const auto& label : labels) {
        int x = static_cast<int>(label.anchor.x) - 5;
        int y = static_cast<int>(label.anchor.y) + 5;
        if (!annotator_.draw_text(canvas, label.text, x, y, size, color)) {
            throw RenderingError("failed to draw label for region " + std::to_string(label.region_id));
        }
    }
}

void SceneRasterizer::draw_footer(RasterCanvas& canvas, const std::string& footer_text) {
    const std::string& text = footer_text.empty() ? config_.default_footer : footer_text;
    if (text.empty()) return;

    double m = config_.size_multiplier;
    int x = static_cast<int>(10.0 * m);
    int y = canvas.height() - static_cast<int>(config_.base_font_size_px * m);

    if (!annotator_.draw_text(canvas, text, x, y, font_size_px(), parse_hex_color(config_.text_color))) {
        throw RenderingError("failed to draw footer text");
    }
}

std::vector<uint8_t> SceneRasterizer::encode_png(const RasterCanvas& canvas) const {
    ensure_drivers_registered();

    GDALDataset* dataset = canvas.to_dataset();
    if (!dataset) {
        throw RenderingError("failed to create raster dataset");
    }

    PNGExporter exporter;
    std::vector<uint8_t> bytes;
    bool encoded = exporter.encode(dataset, bytes);
    GDALClose(dataset);

    if (!encoded) {
        throw RenderingError("PNG encoding failed");
    }
    return bytes;
}

RenderedImage SceneRasterizer::rasterize(const VectorScene& scene,
                                         int width, int height,
                                         const std::vector<RegionLabel>& labels,
                                         const std::string& footer_text) {
    RasterCanvas canvas = paint_scene(scene, width, height);
    draw_labels(canvas, labels);
    draw_footer(canvas, footer_text);

    RenderedImage image;
    image.bytes = encode_png(canvas);
    image.width = width;
    image.height = height;
    return image;
}

} // namespace prefmap
