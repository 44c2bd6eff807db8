/**
 * @file TestDatasets.hpp
 * @brief Small synthetic region datasets shared by the test suites
 */

#pragma once

#include "prefmap.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace prefmap::test {

/// Closed axis-aligned square ring (5 points, first == last)
inline Ring square_ring(double lon0, double lat0, double size) {
    return {
        {lon0, lat0},
        {lon0 + size, lat0},
        {lon0 + size, lat0 + size},
        {lon0, lat0 + size},
        {lon0, lat0}
    };
}

inline Region polygon_region(int id, double lon0, double lat0, double size) {
    Region region;
    region.id = id;
    region.geometry.type = GeometryType::POLYGON;
    region.geometry.polygons.push_back(PolygonData{{square_ring(lon0, lat0, size)}});
    return region;
}

/// One square sub-polygon per origin
inline Region multi_polygon_region(int id, const std::vector<GeoPoint>& origins, double size) {
    Region region;
    region.id = id;
    region.geometry.type = GeometryType::MULTI_POLYGON;
    for (const auto& origin : origins) {
        region.geometry.polygons.push_back(PolygonData{{square_ring(origin.lon, origin.lat, size)}});
    }
    return region;
}

/**
 * Four regions loosely placed like Japanese prefectures:
 * 1 north, 13 center, 27 west, 47 a two-island MultiPolygon in the south.
 */
inline GeoDataset sample_dataset() {
    GeoDataset dataset;
    dataset.source_path = "sample";
    dataset.regions.push_back(polygon_region(1, 141.0, 42.0, 2.0));
    dataset.regions.push_back(polygon_region(13, 139.0, 35.5, 0.5));
    dataset.regions.push_back(polygon_region(27, 135.0, 34.4, 0.4));
    dataset.regions.push_back(multi_polygon_region(47, {{127.0, 26.0}, {128.0, 26.5}}, 0.3));
    return dataset;
}

/// sample_dataset() as GeoJSON text
inline std::string sample_geojson() {
    return R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {"id": 1, "name": "north"},
     "geometry": {"type": "Polygon", "coordinates": [[[141.0, 42.0], [143.0, 42.0], [143.0, 44.0], [141.0, 44.0], [141.0, 42.0]]]}},
    {"type": "Feature", "properties": {"id": 13, "name": "center"},
     "geometry": {"type": "Polygon", "coordinates": [[[139.0, 35.5], [139.5, 35.5], [139.5, 36.0], [139.0, 36.0], [139.0, 35.5]]]}},
    {"type": "Feature", "properties": {"id": 27, "name": "west"},
     "geometry": {"type": "Polygon", "coordinates": [[[135.0, 34.4], [135.4, 34.4], [135.4, 34.8], [135.0, 34.8], [135.0, 34.4]]]}},
    {"type": "Feature", "properties": {"id": 47, "name": "islands"},
     "geometry": {"type": "MultiPolygon", "coordinates": [
       [[[127.0, 26.0], [127.3, 26.0], [127.3, 26.3], [127.0, 26.3], [127.0, 26.0]]],
       [[[128.0, 26.5], [128.3, 26.5], [128.3, 26.8], [128.0, 26.8], [128.0, 26.5]]]
     ]}}
  ]
})";
}

/**
 * @brief Temporary file removed when the object goes out of scope
 */
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_, std::ios::binary);
        out << contents;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace prefmap::test
