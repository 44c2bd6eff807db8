/**
 * @file LabelPlacer.hpp
 * @brief Intensity value labels for active regions
 */

#pragma once

#include "prefmap.hpp"
#include "Projector.hpp"
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief Text anchored at a projected point
 */
struct RegionLabel {
    int region_id = 0;
    std::string text;
    PixelPoint anchor;
};

/**
 * @brief Places one label per active region
 *
 * The anchor is the unweighted mean of the vertices of the first ring. For a
 * MultiPolygon only the first ring of the first sub-polygon is used, so the
 * label of a multi-part region sits on its first part, not at the centroid
 * of the whole region.
 */
class LabelPlacer {
public:
    /**
     * @brief Labels for every region with level > 0, in dataset order
     */
    static std::vector<RegionLabel> place_labels(const std::vector<Region>& regions,
                                                 const IntensityAssignment& intensities,
                                                 const Projector& projector);

    /// Unweighted vertex mean of a ring (no area weighting)
    static GeoPoint vertex_centroid(const Ring& ring);
};

} // namespace prefmap
