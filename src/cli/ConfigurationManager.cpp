/**
 * @file ConfigurationManager.cpp
 * @brief Implementation of JSON configuration loading and saving
 */

#include "ConfigurationManager.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace prefmap {

bool ConfigurationManager::load_from_file(const std::string& filename) {
    Logger logger("ConfigurationManager");

    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not open config file: " + filename);
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!load_from_string(text)) {
        logger.error("Invalid config file: " + filename);
        return false;
    }

    logger.info("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    Logger logger("ConfigurationManager");

    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        logger.error(std::string("Config parse error: ") + e.what());
        return false;
    }

    if (!parsed.is_object()) {
        logger.error("Config root must be a JSON object");
        return false;
    }

    for (const auto& [key, value] : parsed.items()) {
        values_[key] = value;
    }
    return true;
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    Logger logger("ConfigurationManager");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Could not create config file: " + filename);
        return false;
    }

    file << values_.dump(2) << "\n";
    if (!file) {
        logger.error("Failed to write config file: " + filename);
        return false;
    }
    return true;
}

std::string ConfigurationManager::get_string(const std::string& key, const std::string& default_value) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->is_null()) {
        return default_value;
    }
    if (!it->is_string()) {
        Logger("ConfigurationManager").warning("'" + key + "' is not a string, using default");
        return default_value;
    }
    return it->get<std::string>();
}

int ConfigurationManager::get_int(const std::string& key, int default_value) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->is_null()) {
        return default_value;
    }
    if (!it->is_number_integer()) {
        Logger("ConfigurationManager").warning("'" + key + "' is not an integer, using default");
        return default_value;
    }
    return it->get<int>();
}

double ConfigurationManager::get_double(const std::string& key, double default_value) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->is_null()) {
        return default_value;
    }
    if (!it->is_number()) {
        Logger("ConfigurationManager").warning("'" + key + "' is not a number, using default");
        return default_value;
    }
    return it->get<double>();
}

RendererConfig ConfigurationManager::to_renderer_config() const {
    RendererConfig config;

    config.dataset_path = get_string("dataset_path", config.dataset_path);
    config.font_directory = get_string("font_directory", config.font_directory);
    config.font_weight = parse_font_weight(get_int("font_weight", static_cast<int>(config.font_weight)));

    config.base_width_px = get_int("base_width_px", config.base_width_px);
    config.base_height_px = get_int("base_height_px", config.base_height_px);
    config.margin_fraction = get_double("margin_fraction", config.margin_fraction);
    config.min_span_degrees = get_double("min_span_degrees", config.min_span_degrees);

    config.background_color = get_string("background_color", config.background_color);
    config.stroke_color = get_string("stroke_color", config.stroke_color);
    config.text_color = get_string("text_color", config.text_color);
    config.base_stroke_width = get_double("base_stroke_width", config.base_stroke_width);
    config.fill_opacity = get_double("fill_opacity", config.fill_opacity);
    config.base_font_size_px = get_double("base_font_size_px", config.base_font_size_px);
    config.default_footer = get_string("default_footer", config.default_footer);

    config.server_host = get_string("server_host", config.server_host);
    config.server_port = get_int("server_port", config.server_port);

    // "log_level" may be a bare number or a facility list string
    auto level = values_.find("log_level");
    if (level != values_.end() && level->is_number_integer()) {
        config.log_config = std::to_string(level->get<int>());
    } else {
        config.log_config = get_string("log_level", config.log_config);
    }
    config.log_file = get_string("log_file", config.log_file);

    return config;
}

void ConfigurationManager::from_renderer_config(const RendererConfig& config) {
    values_ = json::object();
    values_["dataset_path"] = config.dataset_path;
    values_["font_directory"] = config.font_directory;
    values_["font_weight"] = static_cast<int>(config.font_weight);
    values_["base_width_px"] = config.base_width_px;
    values_["base_height_px"] = config.base_height_px;
    values_["margin_fraction"] = config.margin_fraction;
    values_["min_span_degrees"] = config.min_span_degrees;
    values_["background_color"] = config.background_color;
    values_["stroke_color"] = config.stroke_color;
    values_["text_color"] = config.text_color;
    values_["base_stroke_width"] = config.base_stroke_width;
    values_["fill_opacity"] = config.fill_opacity;
    values_["base_font_size_px"] = config.base_font_size_px;
    values_["default_footer"] = config.default_footer;
    values_["server_host"] = config.server_host;
    values_["server_port"] = config.server_port;
    values_["log_level"] = config.log_config;
    if (!config.log_file.empty()) {
        values_["log_file"] = config.log_file;
    }
}

} // namespace prefmap
