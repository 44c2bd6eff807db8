#pragma once

/**
 * @file prefmap.hpp
 * @brief Main header for PrefMap, the prefecture intensity map renderer
 *
 * Core value types shared by the rendering pipeline: region geometry,
 * intensity assignments, view bounds, render options and configuration.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace prefmap {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief Geographic point in decimal degrees
 */
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;

    GeoPoint() = default;
    GeoPoint(double longitude, double latitude) : lon(longitude), lat(latitude) {}

    bool operator==(const GeoPoint& other) const {
        return lon == other.lon && lat == other.lat;
    }
};

/**
 * @brief Point in canvas pixel space (y grows downward)
 */
struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

/// Ordered ring of points; implicitly closed (first and last point coincide)
using Ring = std::vector<GeoPoint>;

/**
 * @brief Polygon as an ordered list of rings
 *
 * rings[0] is the outer boundary, any further rings are kept in source order.
 */
struct PolygonData {
    std::vector<Ring> rings;
};

enum class GeometryType {
    POLYGON,       ///< Exactly one PolygonData
    MULTI_POLYGON  ///< One or more PolygonData
};

/**
 * @brief Region boundary geometry
 *
 * A POLYGON is stored as a single entry in polygons so that consumers can
 * flatten both geometry types with the same loop.
 */
struct Geometry {
    GeometryType type = GeometryType::POLYGON;
    std::vector<PolygonData> polygons;

    /// First ring of the first polygon (label anchor source)
    const Ring& first_ring() const { return polygons.front().rings.front(); }

    size_t ring_count() const {
        size_t count = 0;
        for (const auto& polygon : polygons) {
            count += polygon.rings.size();
        }
        return count;
    }

    size_t vertex_count() const {
        size_t count = 0;
        for (const auto& polygon : polygons) {
            for (const auto& ring : polygon.rings) {
                count += ring.size();
            }
        }
        return count;
    }
};

/**
 * @brief One administrative unit (prefecture) of the geometry dataset
 */
struct Region {
    int id = 0;
    Geometry geometry;
};

/**
 * @brief Parsed geometry dataset, regions kept in file order
 */
struct GeoDataset {
    std::string source_path;
    std::vector<Region> regions;
};

/// Region id -> intensity level in [0,7]; absent ids are level 0
using IntensityAssignment = std::map<int, int>;

/// Level assigned to a region, 0 when the id is not present
inline int level_of(const IntensityAssignment& intensities, int region_id) {
    auto it = intensities.find(region_id);
    return it != intensities.end() ? it->second : 0;
}

constexpr int MIN_INTENSITY_LEVEL = 0;
constexpr int MAX_INTENSITY_LEVEL = 7;

/**
 * @brief Geographic view extent
 *
 * Default-constructed bounds are inverted (min > max) so that the first
 * extend() call defines them.
 */
struct ViewBounds {
    double min_lon = 180.0;
    double min_lat = 90.0;
    double max_lon = -180.0;
    double max_lat = -90.0;

    ViewBounds() = default;
    ViewBounds(double minlon, double minlat, double maxlon, double maxlat)
        : min_lon(minlon), min_lat(minlat), max_lon(maxlon), max_lat(maxlat) {}

    /// False while no point has been added (inverted extent)
    bool is_valid() const { return min_lon <= max_lon && min_lat <= max_lat; }

    void extend(const GeoPoint& point) {
        if (point.lon < min_lon) min_lon = point.lon;
        if (point.lat < min_lat) min_lat = point.lat;
        if (point.lon > max_lon) max_lon = point.lon;
        if (point.lat > max_lat) max_lat = point.lat;
    }

    bool contains(const GeoPoint& point) const {
        return point.lon >= min_lon && point.lon <= max_lon &&
               point.lat >= min_lat && point.lat <= max_lat;
    }

    double lon_span() const { return max_lon - min_lon; }
    double lat_span() const { return max_lat - min_lat; }
    GeoPoint center() const { return {(max_lon + min_lon) / 2.0, (max_lat + min_lat) / 2.0}; }

    bool operator==(const ViewBounds& other) const {
        return min_lon == other.min_lon && min_lat == other.min_lat &&
               max_lon == other.max_lon && max_lat == other.max_lat;
    }
};

// ============================================================================
// Render Options and Configuration
// ============================================================================

/**
 * @brief Output size class selected by the request
 */
enum class SizeClass {
    STANDARD = 1,     ///< 1x, 1280x720
    LARGE = 2,        ///< 2x, 2560x1440
    EXTRA_LARGE = 3   ///< 4x, 5120x2880
};

/// Canvas multiplier for a size class
double size_multiplier(SizeClass size_class);

/// "1", "2", "3" map to their size classes; anything else is STANDARD
SizeClass parse_size_class(const std::string& value);

enum class FontWeight {
    REGULAR = 400,
    MEDIUM = 500
};

/// 400 / 500; unknown weights fall back to REGULAR
FontWeight parse_font_weight(int weight);

enum class OutputFormat { PNG, SVG };

/**
 * @brief Per-request render options
 */
struct RenderOptions {
    SizeClass size_class = SizeClass::STANDARD;
    std::string footer_text;          ///< Empty = default attribution
    bool show_scale_labels = false;   ///< Draw intensity value at each active region
};

/**
 * @brief Process-wide renderer configuration
 */
struct RendererConfig {
    // Data sources
    std::string dataset_path = "japan.geojson";
    std::string font_directory = "./fonts";
    FontWeight font_weight = FontWeight::REGULAR;

    // Canvas
    int base_width_px = 1280;
    int base_height_px = 720;
    double margin_fraction = 0.1;      ///< Margin on each side, fraction of canvas
    double min_span_degrees = 1e-6;    ///< Span floor for degenerate bounds

    // Style (colors as "#rrggbb")
    std::string background_color = "#18181b";
    std::string stroke_color = "#a1a1aa";
    std::string text_color = "#fafafa";
    double base_stroke_width = 0.4;    ///< Scaled by the size multiplier
    double fill_opacity = 0.8;
    double base_font_size_px = 14.0;   ///< Scaled by the size multiplier

    std::string default_footer = "Code available under the MIT License (GitHub: evacuate).";

    // HTTP front end
    std::string server_host = "0.0.0.0";
    int server_port = 8080;

    // Logging
    std::string log_config = "3";
    std::string log_file;
};

/**
 * @brief Final encoded raster image
 */
struct RenderedImage {
    std::vector<std::uint8_t> bytes;   ///< PNG file contents
    int width = 0;
    int height = 0;
};

// ============================================================================
// Renderer
// ============================================================================

struct ComposedMap;

/**
 * @brief Main interface: dataset + intensities + options -> map image
 *
 * Each call is independent and synchronous; one renderer may be shared by
 * concurrent callers.
 */
class MapRenderer {
public:
    explicit MapRenderer(const RendererConfig& config = RendererConfig{});
    ~MapRenderer();

    MapRenderer(const MapRenderer&) = delete;
    MapRenderer& operator=(const MapRenderer&) = delete;

    /**
     * @brief Render a PNG map
     * @throws RenderError subclass on failure; no partial image is returned
     */
    RenderedImage render(const GeoDataset& dataset,
                         const IntensityAssignment& intensities,
                         const RenderOptions& options) const;

    /// Scene, labels and view extent for a request, without rasterizing
    ComposedMap compose_scene(const GeoDataset& dataset,
                              const IntensityAssignment& intensities,
                              const RenderOptions& options) const;

    /// Same map as an SVG document
    std::string render_svg(const GeoDataset& dataset,
                           const IntensityAssignment& intensities,
                           const RenderOptions& options) const;

    /// Canvas pixel size for a size class
    std::pair<int, int> canvas_size(SizeClass size_class) const;

    const RendererConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace prefmap
