/**
 * @file Projector.cpp
 * @brief Projection fitting
 */

#include "Projector.hpp"
#include "Logger.hpp"
#include "RenderError.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace prefmap {

Projector Projector::fit(const ViewBounds& bounds,
                         double canvas_width,
                         double canvas_height,
                         double margin_fraction,
                         double min_span) {
    if (!bounds.is_valid()) {
        throw RenderingError("cannot fit projection to inverted bounds");
    }
    if (canvas_width <= 0.0 || canvas_height <= 0.0) {
        throw RenderingError("canvas dimensions must be positive");
    }
    if (margin_fraction < 0.0 || margin_fraction >= 0.5) {
        throw RenderingError("margin fraction must be in [0, 0.5)");
    }

    Projector projector;
    double effective_width = canvas_width * (1.0 - 2.0 * margin_fraction);
    double effective_height = canvas_height * (1.0 - 2.0 * margin_fraction);

    GeoPoint center = bounds.center();
    projector.center_lon_ = center.lon;
    projector.center_lat_ = center.lat;
    projector.center_x_ = canvas_width / 2.0;
    projector.center_y_ = canvas_height / 2.0;

    projector.lon_correction_ = std::cos(center.lat * M_PI / 180.0);

    // A single-point or zero-width extent would divide by zero
    double lon_span = std::max(bounds.lon_span() * projector.lon_correction_, min_span);
    double lat_span = std::max(bounds.lat_span(), min_span);

    double scale_x = effective_width / lon_span;
    double scale_y = effective_height / lat_span;
    projector.scale_ = std::min(scale_x, scale_y);

    Logger logger("Projector");
    if (logger.shouldOutput(LogLevel::TRACE)) {
        std::ostringstream oss;
        oss << "center=(" << center.lon << ", " << center.lat << ") lon_correction="
            << projector.lon_correction_ << " scale=" << projector.scale_;
        logger.trace(oss.str());
    }

    return projector;
}

} // namespace prefmap
