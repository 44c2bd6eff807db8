/**
 * @file GeoDatasetLoader.hpp
 * @brief GeoJSON region dataset loading and per-path caching
 */

#pragma once

#include "prefmap.hpp"
#include "Logger.hpp"
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace prefmap {

/**
 * @brief Reads a GeoJSON FeatureCollection into a GeoDataset
 *
 * Each feature needs a numeric properties.id and a Polygon or MultiPolygon
 * geometry. Features are kept in file order; positions keep only their first
 * two coordinates.
 */
class GeoDatasetLoader {
public:
    GeoDatasetLoader();

    /**
     * @brief Load and parse a dataset file
     * @throws DatasetError if the file is missing, unreadable or not a FeatureCollection
     * @throws GeometryShapeError if a feature has no usable id or geometry
     */
    GeoDataset load_file(const std::string& path) const;

    /**
     * @brief Parse dataset text already held in memory
     * @param source_name Recorded as GeoDataset::source_path and used in messages
     */
    GeoDataset parse(const std::string& text, const std::string& source_name) const;

    /// Parse an already decoded GeoJSON document
    GeoDataset parse_document(const nlohmann::json& document, const std::string& source_name) const;

private:
    Logger logger_;

    Region parse_feature(const nlohmann::json& feature, size_t index) const;
    Geometry parse_geometry(const nlohmann::json& geometry, int region_id) const;
    PolygonData parse_polygon(const nlohmann::json& coordinates, int region_id) const;
    Ring parse_ring(const nlohmann::json& coordinates, int region_id) const;
};

/**
 * @brief Process-wide cache of parsed datasets keyed by path
 *
 * Entries are immutable once inserted and shared between concurrent
 * requests. A failed load is not cached. The lock is held while a missing
 * entry is read and parsed, so first loads of different paths run one at a
 * time.
 */
class DatasetCache {
public:
    DatasetCache() = default;

    DatasetCache(const DatasetCache&) = delete;
    DatasetCache& operator=(const DatasetCache&) = delete;

    /**
     * @brief Cached dataset for a path, loading it on first use
     * @throws DatasetError, GeometryShapeError from GeoDatasetLoader
     */
    std::shared_ptr<const GeoDataset> get(const std::string& path);

    /// Drop every cached dataset
    void clear();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const GeoDataset>> datasets_;
    GeoDatasetLoader loader_;
};

} // namespace prefmap
