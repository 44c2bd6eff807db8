/**
 * @file SceneComposer.hpp
 * @brief Builds the styled vector scene for one request
 */

#pragma once

#include "prefmap.hpp"
#include "LabelPlacer.hpp"
#include "Projector.hpp"
#include "VectorScene.hpp"
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief Styling constants applied to every region path
 */
struct SceneStyleConfig {
    std::string background_color = "#18181b";
    std::string stroke_color = "#a1a1aa";
    double base_stroke_width = 0.4;   ///< Multiplied by size_multiplier
    double fill_opacity = 0.8;
    double size_multiplier = 1.0;
};

/**
 * @brief Everything needed to draw one request, before rasterization
 */
struct ComposedMap {
    VectorScene scene;
    std::vector<RegionLabel> labels;   ///< Empty unless labels were requested
    ViewBounds view_bounds;            ///< Extent the projection was fitted to
    double size_multiplier = 1.0;
};

class SceneComposer {
public:
    explicit SceneComposer(const SceneStyleConfig& config = SceneStyleConfig{});

    /**
     * @brief Compose background plus one element per region
     *
     * Regions are emitted in dataset order, inactive ones included (level 0
     * color). All rings of a region are joined into one multi-subpath path
     * sharing a single style.
     *
     * @param regions Dataset regions
     * @param intensities Per-request levels
     * @param projector Fitted projection
     * @param canvas_width Canvas width in pixels
     * @param canvas_height Canvas height in pixels
     */
    VectorScene compose(const std::vector<Region>& regions,
                        const IntensityAssignment& intensities,
                        const Projector& projector,
                        int canvas_width,
                        int canvas_height) const;

    /// Style string for a region path filled with fill_color
    std::string region_style(const std::string& fill_color) const;

    std::string background_style() const;

    const SceneStyleConfig& get_config() const { return config_; }

private:
    SceneStyleConfig config_;
};

} // namespace prefmap
