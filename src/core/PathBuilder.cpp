/**
 * @file PathBuilder.cpp
 * @brief Implementation of projected path generation
 */

#include "PathBuilder.hpp"
#include <iomanip>
#include <sstream>

namespace prefmap {

std::string PathBuilder::ring_to_path_data(const Ring& ring, const Projector& projector) {
    if (ring.empty()) return "";

    std::ostringstream path;
    path << std::fixed << std::setprecision(1);

    for (size_t i = 0; i < ring.size(); ++i) {
        PixelPoint p = projector.project(ring[i]);
        if (i == 0) {
            path << "M" << p.x << " " << p.y;
        } else {
            path << " L" << p.x << " " << p.y;
        }
    }
    path << " Z";

    return path.str();
}

std::vector<std::string> PathBuilder::build_paths(const Geometry& geometry,
                                                  const Projector& projector) {
    std::vector<std::string> paths;
    paths.reserve(geometry.ring_count());

    for (const auto& polygon : geometry.polygons) {
        for (const auto& ring : polygon.rings) {
            std::string path_data = ring_to_path_data(ring, projector);
            if (!path_data.empty()) {
                paths.push_back(std::move(path_data));
            }
        }
    }
    return paths;
}

} // namespace prefmap
