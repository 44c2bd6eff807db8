/**
 * @file BoundsCalculator.cpp
 * @brief Implementation of active-region bounds
 */

#include "BoundsCalculator.hpp"
#include "Logger.hpp"
#include "RenderError.hpp"
#include <sstream>

namespace prefmap {

void BoundsCalculator::extend_with_geometry(ViewBounds& bounds, const Geometry& geometry) {
    for (const auto& polygon : geometry.polygons) {
        for (const auto& ring : polygon.rings) {
            for (const auto& point : ring) {
                bounds.extend(point);
            }
        }
    }
}

ViewBounds BoundsCalculator::compute_bounds(const std::vector<Region>& regions,
                                            const IntensityAssignment& intensities) {
    ViewBounds bounds;  // starts inverted: min = (180, 90), max = (-180, -90)

    for (const auto& region : regions) {
        // Inactive regions are drawn but never widen the view
        if (level_of(intensities, region.id) == 0) {
            continue;
        }
        extend_with_geometry(bounds, region.geometry);
    }
    return bounds;
}

ViewBounds BoundsCalculator::compute_dataset_bounds(const std::vector<Region>& regions) {
    ViewBounds bounds;
    for (const auto& region : regions) {
        extend_with_geometry(bounds, region.geometry);
    }
    return bounds;
}

ViewBounds BoundsCalculator::resolve_view_bounds(const std::vector<Region>& regions,
                                                 const IntensityAssignment& intensities) {
    Logger logger("BoundsCalculator");

    ViewBounds bounds = compute_bounds(regions, intensities);
    if (bounds.is_valid()) {
        std::ostringstream oss;
        oss << "Active bounds: lon [" << bounds.min_lon << ", " << bounds.max_lon
            << "], lat [" << bounds.min_lat << ", " << bounds.max_lat << "]";
        logger.debug(oss.str());
        return bounds;
    }

    logger.detailed("No active region, falling back to whole-dataset bounds");
    bounds = compute_dataset_bounds(regions);
    if (!bounds.is_valid()) {
        throw RenderingError("cannot fit view: dataset contains no coordinates");
    }
    return bounds;
}

} // namespace prefmap
