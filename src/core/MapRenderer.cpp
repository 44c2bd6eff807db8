/**
 * @file MapRenderer.cpp
 * @brief Rendering pipeline: bounds, projection, scene, labels, raster
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "prefmap.hpp"
#include "BoundsCalculator.hpp"
#include "LabelPlacer.hpp"
#include "Logger.hpp"
#include "Projector.hpp"
#include "RenderError.hpp"
#include "SceneComposer.hpp"
#include "../export/SceneRasterizer.hpp"
#include "../export/SVGExporter.hpp"
#include <chrono>
#include <cmath>

namespace prefmap {

class MapRenderer::Impl {
public:
    explicit Impl(const RendererConfig& config)
        : config_(config),
          logger_("MapRenderer") {
    }

    std::pair<int, int> canvas_size(SizeClass size_class) const {
        double m = size_multiplier(size_class);
        return {static_cast<int>(std::lround(config_.base_width_px * m)),
                static_cast<int>(std::lround(config_.base_height_px * m))};
    }

    ComposedMap compose_scene(const GeoDataset& dataset,
                              const IntensityAssignment& intensities,
                              const RenderOptions& options) const {
        auto [width, height] = canvas_size(options.size_class);
        double m = size_multiplier(options.size_class);

        ComposedMap composed;
        composed.size_multiplier = m;
        composed.view_bounds = BoundsCalculator::resolve_view_bounds(dataset.regions, intensities);

        Projector projector = Projector::fit(composed.view_bounds, width, height,
                                             config_.margin_fraction, config_.min_span_degrees);

        SceneStyleConfig style;
        style.background_color = config_.background_color;
        style.stroke_color = config_.stroke_color;
        style.base_stroke_width = config_.base_stroke_width;
        style.fill_opacity = config_.fill_opacity;
        style.size_multiplier = m;

        SceneComposer composer(style);
        composed.scene = composer.compose(dataset.regions, intensities, projector, width, height);

        if (options.show_scale_labels) {
            composed.labels = LabelPlacer::place_labels(dataset.regions, intensities, projector);
        }

        logger_.debug("View bounds [" + std::to_string(composed.view_bounds.min_lon) + ", " +
                      std::to_string(composed.view_bounds.min_lat) + "] - [" +
                      std::to_string(composed.view_bounds.max_lon) + ", " +
                      std::to_string(composed.view_bounds.max_lat) + "], scale " +
                      std::to_string(projector.scale()));
        return composed;
    }

    RenderedImage render(const GeoDataset& dataset,
                         const IntensityAssignment& intensities,
                         const RenderOptions& options) const {
        auto start_time = std::chrono::steady_clock::now();

        ComposedMap composed = compose_scene(dataset, intensities, options);

        RasterizerConfig raster;
        raster.text_color = config_.text_color;
        raster.base_font_size_px = config_.base_font_size_px;
        raster.size_multiplier = composed.size_multiplier;
        raster.default_footer = config_.default_footer;
        raster.fonts.font_directory = config_.font_directory;
        raster.fonts.font_weight = config_.font_weight;

        SceneRasterizer rasterizer(raster);
        RenderedImage image = rasterizer.rasterize(composed.scene,
                                                   composed.scene.width,
                                                   composed.scene.height,
                                                   composed.labels,
                                                   options.footer_text);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logger_.info("Rendered " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                     " map (" + std::to_string(intensities.size()) + " assignments, " +
                     std::to_string(image.bytes.size()) + " bytes) in " +
                     std::to_string(elapsed.count()) + " ms");
        return image;
    }

    std::string render_svg(const GeoDataset& dataset,
                           const IntensityAssignment& intensities,
                           const RenderOptions& options) const {
        ComposedMap composed = compose_scene(dataset, intensities, options);

        SVGConfig svg;
        svg.text_color = config_.text_color;
        svg.font_weight = static_cast<int>(config_.font_weight);
        svg.base_font_size_px = config_.base_font_size_px;
        svg.size_multiplier = composed.size_multiplier;
        svg.default_footer = config_.default_footer;

        SVGExporter exporter(svg);
        return exporter.to_svg(composed.scene, composed.labels, options.footer_text);
    }

    const RendererConfig& get_config() const { return config_; }

private:
    RendererConfig config_;
    Logger logger_;
};

MapRenderer::MapRenderer(const RendererConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

MapRenderer::~MapRenderer() = default;

RenderedImage MapRenderer::render(const GeoDataset& dataset,
                                  const IntensityAssignment& intensities,
                                  const RenderOptions& options) const {
    return impl_->render(dataset, intensities, options);
}

ComposedMap MapRenderer::compose_scene(const GeoDataset& dataset,
                                       const IntensityAssignment& intensities,
                                       const RenderOptions& options) const {
    return impl_->compose_scene(dataset, intensities, options);
}

std::string MapRenderer::render_svg(const GeoDataset& dataset,
                                    const IntensityAssignment& intensities,
                                    const RenderOptions& options) const {
    return impl_->render_svg(dataset, intensities, options);
}

std::pair<int, int> MapRenderer::canvas_size(SizeClass size_class) const {
    return impl_->canvas_size(size_class);
}

const RendererConfig& MapRenderer::get_config() const {
    return impl_->get_config();
}

} // namespace prefmap
