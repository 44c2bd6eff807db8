/**
 * @file LabelPlacer.cpp
 * @brief Implementation of label anchor placement
 */

#include "LabelPlacer.hpp"
#include "RenderError.hpp"

namespace prefmap {

GeoPoint LabelPlacer::vertex_centroid(const Ring& ring) {
    if (ring.empty()) {
        throw GeometryShapeError("cannot place label on an empty ring");
    }

    double sum_lon = 0.0;
    double sum_lat = 0.0;
    for (const auto& point : ring) {
        sum_lon += point.lon;
        sum_lat += point.lat;
    }
    double count = static_cast<double>(ring.size());
    return {sum_lon / count, sum_lat / count};
}

std::vector<RegionLabel> LabelPlacer::place_labels(const std::vector<Region>& regions,
                                                   const IntensityAssignment& intensities,
                                                   const Projector& projector) {
    std::vector<RegionLabel> labels;

    for (const auto& region : regions) {
        int level = level_of(intensities, region.id);
        if (level == 0) continue;

        if (region.geometry.polygons.empty() || region.geometry.polygons.front().rings.empty()) {
            throw GeometryShapeError("region " + std::to_string(region.id) + " has no ring to label");
        }

        GeoPoint center = vertex_centroid(region.geometry.first_ring());

        RegionLabel label;
        label.region_id = region.id;
        label.text = std::to_string(level);
        label.anchor = projector.project(center);
        labels.push_back(std::move(label));
    }
    return labels;
}

} // namespace prefmap
