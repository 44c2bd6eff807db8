/**
 * @file PathBuilder.hpp
 * @brief Region geometry to closed move/line/close path strings
 */

#pragma once

#include "prefmap.hpp"
#include "Projector.hpp"
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief Converts polygon geometry into projected path data
 *
 * Path vocabulary: "M<x> <y>" for the first vertex, " L<x> <y>" for each
 * following vertex and " Z" to close, coordinates with one decimal place.
 * Every input vertex is projected and emitted; ring order and winding are
 * preserved.
 */
class PathBuilder {
public:
    /**
     * @brief One path per ring
     * @param geometry Polygon or MultiPolygon (flattened across sub-polygons)
     * @param projector Fitted projection
     * @return Path strings in ring order
     */
    static std::vector<std::string> build_paths(const Geometry& geometry,
                                                const Projector& projector);

    /**
     * @brief Path string for a single ring
     * @return Empty string for an empty ring
     */
    static std::string ring_to_path_data(const Ring& ring, const Projector& projector);
};

} // namespace prefmap
