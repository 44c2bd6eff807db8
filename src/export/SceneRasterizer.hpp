/**
 * @file SceneRasterizer.hpp
 * @brief Turns a VectorScene plus text overlays into a PNG image
 *
 * Region fills are rasterized by GDAL (GDALRasterizeGeometries into a
 * per-element coverage mask), blended onto a RasterCanvas, stroked, and the
 * labels and footer are drawn with FreeType before PNG encoding.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "prefmap.hpp"
#include "../core/LabelPlacer.hpp"
#include "../core/VectorScene.hpp"
#include "RasterAnnotator.hpp"
#include "RasterCanvas.hpp"
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief Configuration for raster generation
 */
struct RasterizerConfig {
    std::string text_color = "#fafafa";
    double base_font_size_px = 14.0;   ///< Scaled by size_multiplier
    double size_multiplier = 1.0;
    std::string default_footer;        ///< Used when the caller passes no footer
    AnnotationConfig fonts;
};

class SceneRasterizer {
public:
    explicit SceneRasterizer(const RasterizerConfig& config = RasterizerConfig{});

    /**
     * @brief Rasterize, annotate and encode
     * @param scene Composed vector scene (pixel coordinates)
     * @param width Output width in pixels
     * @param height Output height in pixels
     * @param labels Region labels (may be empty)
     * @param footer_text Footer text, empty for the default attribution
     * @return PNG image of exactly width x height
     * @throws RenderingError on any drawing or encoding failure
     */
    RenderedImage rasterize(const VectorScene& scene,
                            int width, int height,
                            const std::vector<RegionLabel>& labels,
                            const std::string& footer_text);

    /// Background and every element (fill then stroke), without text
    RasterCanvas paint_scene(const VectorScene& scene, int width, int height);

    /// Label text with its baseline at (int(x) - 5, int(y) + 5)
    void draw_labels(RasterCanvas& canvas, const std::vector<RegionLabel>& labels);

    /// Footer at (int(10m), height - int(14m))
    void draw_footer(RasterCanvas& canvas, const std::string& footer_text);

    /// Encode a finished canvas
    std::vector<uint8_t> encode_png(const RasterCanvas& canvas) const;

    /// GDALAllRegister() once per process
    static void ensure_drivers_registered();

    const RasterizerConfig& get_config() const { return config_; }

private:
    RasterizerConfig config_;
    RasterAnnotator annotator_;

    int font_size_px() const;

    /**
     * @brief Even-odd fill of all subpaths of one element
     *
     * The subpaths become the rings of a single OGRPolygon so that GDAL's
     * scanline fill counts crossings across all of them.
     */
    void fill_element(RasterCanvas& canvas,
                      const std::vector<Subpath>& subpaths,
                      const RGBA& color,
                      double opacity) const;

    void paint_element(RasterCanvas& canvas, const SceneElement& element);
};

} // namespace prefmap
