/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for the renderer
 */

#pragma once

#include "prefmap.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace prefmap {

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Keys mirror RendererConfig field names ("dataset_path", "font_directory",
 * "margin_fraction", ...). Values of the wrong type are reported and the
 * default is kept.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load configuration from a JSON file
     * @return true if successful, false if the file is missing or not a JSON object
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from JSON text
     * @return true if successful
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Save configuration to a JSON file
     * @return true if successful
     */
    bool save_to_file(const std::string& filename) const;

    /// Defaults overlaid with every loaded key
    RendererConfig to_renderer_config() const;

    /// Replace all values with those of config
    void from_renderer_config(const RendererConfig& config);

    void set_value(const std::string& key, const nlohmann::json& value) {
        values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return values_.contains(key);
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& key, int default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;

    const nlohmann::json& values() const { return values_; }

private:
    nlohmann::json values_ = nlohmann::json::object();
};

} // namespace prefmap
