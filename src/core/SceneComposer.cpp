/**
 * @file SceneComposer.cpp
 * @brief Implementation of vector scene composition
 */

#include "SceneComposer.hpp"
#include "ColorRamp.hpp"
#include "Logger.hpp"
#include "PathBuilder.hpp"
#include <iomanip>
#include <sstream>

namespace prefmap {

SceneComposer::SceneComposer(const SceneStyleConfig& config)
    : config_(config) {
}

std::string SceneComposer::background_style() const {
    return "fill:" + config_.background_color;
}

std::string SceneComposer::region_style(const std::string& fill_color) const {
    std::ostringstream style;
    style << "fill:" << fill_color
          << ";stroke:" << config_.stroke_color
          << ";stroke-width:" << std::fixed << std::setprecision(1)
          << config_.base_stroke_width * config_.size_multiplier
          << ";fill-opacity:" << std::defaultfloat << config_.fill_opacity;
    return style.str();
}

VectorScene SceneComposer::compose(const std::vector<Region>& regions,
                                   const IntensityAssignment& intensities,
                                   const Projector& projector,
                                   int canvas_width,
                                   int canvas_height) const {
    Logger logger("SceneComposer");

    VectorScene scene;
    scene.width = canvas_width;
    scene.height = canvas_height;
    scene.background_style = background_style();
    scene.elements.reserve(regions.size());

    size_t active = 0;
    for (const auto& region : regions) {
        int level = level_of(intensities, region.id);
        if (level > 0) ++active;

        std::string path_data;
        for (const auto& path : PathBuilder::build_paths(region.geometry, projector)) {
            path_data += path + " ";
        }

        SceneElement element;
        element.region_id = region.id;
        element.path_data = std::move(path_data);
        element.style = region_style(ColorRamp::color_of(level));
        scene.elements.push_back(std::move(element));
    }

    logger.detailed("Composed scene " + std::to_string(canvas_width) + "x" +
                    std::to_string(canvas_height) + " with " +
                    std::to_string(scene.elements.size()) + " regions (" +
                    std::to_string(active) + " active)");
    return scene;
}

} // namespace prefmap
