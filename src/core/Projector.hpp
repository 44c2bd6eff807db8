/**
 * @file Projector.hpp
 * @brief Auto-fit rectilinear projection from geographic to canvas pixels
 *
 * Longitude distances are shortened by cos(center latitude), a local
 * flat-earth correction that holds for the narrow latitude band of a single
 * country. Both axes share one scale (letterbox fit), so one axis may keep
 * more margin than configured.
 */

#pragma once

#include "prefmap.hpp"

namespace prefmap {

/**
 * @brief Immutable projection fitted to a view extent and canvas
 *
 * Built once per request and passed by const reference to every consumer
 * (path building and label placement).
 */
class Projector {
public:
    static constexpr double DEFAULT_MARGIN_FRACTION = 0.1;
    static constexpr double DEFAULT_MIN_SPAN = 1e-6;

    /**
     * @brief Fit a projection to bounds and canvas
     * @param bounds View extent (must be valid)
     * @param canvas_width Canvas width in pixels
     * @param canvas_height Canvas height in pixels
     * @param margin_fraction Margin on each side as a fraction of the canvas
     * @param min_span Floor for the corrected spans, guards zero-size bounds
     * @return Fitted projector
     */
    static Projector fit(const ViewBounds& bounds,
                         double canvas_width,
                         double canvas_height,
                         double margin_fraction = DEFAULT_MARGIN_FRACTION,
                         double min_span = DEFAULT_MIN_SPAN);

    /// Project a geographic point to canvas pixels
    PixelPoint project(double lon, double lat) const {
        return {(lon - center_lon_) * lon_correction_ * scale_ + center_x_,
                (center_lat_ - lat) * scale_ + center_y_};
    }

    PixelPoint project(const GeoPoint& point) const { return project(point.lon, point.lat); }

    double scale() const { return scale_; }
    double lon_correction() const { return lon_correction_; }

private:
    Projector() = default;

    double center_lon_ = 0.0;
    double center_lat_ = 0.0;
    double center_x_ = 0.0;
    double center_y_ = 0.0;
    double lon_correction_ = 1.0;
    double scale_ = 1.0;
};

} // namespace prefmap
