/**
 * @file GeoDatasetLoader.cpp
 * @brief Implementation of GeoJSON dataset loading
 */

#include "GeoDatasetLoader.hpp"
#include "RenderError.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace prefmap {

GeoDatasetLoader::GeoDatasetLoader()
    : logger_("GeoDatasetLoader") {
}

GeoDataset GeoDatasetLoader::load_file(const std::string& path) const {
    logger_.detailed("Loading dataset " + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DatasetError("Failed to read geojson: cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw DatasetError("Failed to read geojson: I/O error on " + path);
    }

    return parse(buffer.str(), path);
}

GeoDataset GeoDatasetLoader::parse(const std::string& text, const std::string& source_name) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DatasetError("Failed to unmarshal geojson " + source_name + ": " + e.what());
    }
    return parse_document(document, source_name);
}

GeoDataset GeoDatasetLoader::parse_document(const json& document, const std::string& source_name) const {
    if (!document.is_object()) {
        throw DatasetError("Failed to unmarshal geojson " + source_name + ": top level is not an object");
    }

    auto features_it = document.find("features");
    if (features_it == document.end() || !features_it->is_array()) {
        throw DatasetError("Failed to unmarshal geojson " + source_name + ": missing features array");
    }

    GeoDataset dataset;
    dataset.source_path = source_name;
    dataset.regions.reserve(features_it->size());

    for (size_t i = 0; i < features_it->size(); ++i) {
        dataset.regions.push_back(parse_feature((*features_it)[i], i));
    }

    size_t vertices = 0;
    for (const auto& region : dataset.regions) {
        vertices += region.geometry.vertex_count();
    }
    logger_.info("Loaded " + std::to_string(dataset.regions.size()) + " regions (" +
                 std::to_string(vertices) + " vertices) from " + source_name);
    return dataset;
}

Region GeoDatasetLoader::parse_feature(const json& feature, size_t index) const {
    if (!feature.is_object()) {
        throw GeometryShapeError("feature " + std::to_string(index) + " is not an object");
    }

    auto properties = feature.find("properties");
    if (properties == feature.end() || !properties->is_object()) {
        throw GeometryShapeError("Invalid ID format in GeoJSON: feature " + std::to_string(index) +
                                 " has no properties");
    }

    auto id_it = properties->find("id");
    if (id_it == properties->end() || !id_it->is_number()) {
        throw GeometryShapeError("Invalid ID format in GeoJSON: feature " + std::to_string(index) +
                                 " has no numeric id");
    }

    // Fractional ids truncate toward zero
    double raw_id = std::trunc(id_it->get<double>());
    if (!std::isfinite(raw_id) ||
        raw_id < static_cast<double>(std::numeric_limits<int>::min()) ||
        raw_id > static_cast<double>(std::numeric_limits<int>::max())) {
        throw GeometryShapeError("Invalid ID format in GeoJSON: feature " + std::to_string(index) +
                                 " has an id out of range");
    }

    Region region;
    region.id = static_cast<int>(raw_id);

    auto geometry = feature.find("geometry");
    if (geometry == feature.end() || !geometry->is_object()) {
        throw GeometryShapeError("region " + std::to_string(region.id) + " has no geometry");
    }
    region.geometry = parse_geometry(*geometry, region.id);

    logger_.trace("Region " + std::to_string(region.id) + ": " +
                  std::to_string(region.geometry.ring_count()) + " rings");
    return region;
}

Geometry GeoDatasetLoader::parse_geometry(const json& geometry, int region_id) const {
    std::string type = geometry.value("type", "");

    auto coordinates = geometry.find("coordinates");
    if (coordinates == geometry.end() || !coordinates->is_array()) {
        throw GeometryShapeError("region " + std::to_string(region_id) + " has no coordinates");
    }

    Geometry result;
    if (type == "Polygon") {
        result.type = GeometryType::POLYGON;
        result.polygons.push_back(parse_polygon(*coordinates, region_id));
    } else if (type == "MultiPolygon") {
        result.type = GeometryType::MULTI_POLYGON;
        if (coordinates->empty()) {
            throw GeometryShapeError("region " + std::to_string(region_id) +
                                     " has an empty MultiPolygon");
        }
        for (const auto& polygon : *coordinates) {
            result.polygons.push_back(parse_polygon(polygon, region_id));
        }
    } else {
        throw GeometryShapeError("region " + std::to_string(region_id) +
                                 " has unsupported geometry type '" + type + "'");
    }
    return result;
}

PolygonData GeoDatasetLoader::parse_polygon(const json& coordinates, int region_id) const {
    if (!coordinates.is_array() || coordinates.empty()) {
        throw GeometryShapeError("region " + std::to_string(region_id) + " has a polygon without rings");
    }

    PolygonData polygon;
    polygon.rings.reserve(coordinates.size());
    for (const auto& ring : coordinates) {
        polygon.rings.push_back(parse_ring(ring, region_id));
    }
    return polygon;
}

Ring GeoDatasetLoader::parse_ring(const json& coordinates, int region_id) const {
    if (!coordinates.is_array() || coordinates.empty()) {
        throw GeometryShapeError("region " + std::to_string(region_id) + " has an empty ring");
    }

    Ring ring;
    ring.reserve(coordinates.size());
    for (const auto& position : coordinates) {
        if (!position.is_array() || position.size() < 2 ||
            !position[0].is_number() || !position[1].is_number()) {
            throw GeometryShapeError("region " + std::to_string(region_id) +
                                     " has a malformed position");
        }
        ring.emplace_back(position[0].get<double>(), position[1].get<double>());
    }
    return ring;
}

// ============================================================================
// DatasetCache
// ============================================================================

std::shared_ptr<const GeoDataset> DatasetCache::get(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = datasets_.find(path);
    if (it != datasets_.end()) {
        return it->second;
    }

    std::shared_ptr<const GeoDataset> dataset = std::make_shared<GeoDataset>(loader_.load_file(path));
    datasets_.emplace(path, dataset);
    return dataset;
}

void DatasetCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    datasets_.clear();
}

size_t DatasetCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return datasets_.size();
}

} // namespace prefmap
