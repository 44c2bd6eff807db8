/**
 * @file CommandLineInterface.cpp
 * @brief Implementation of command line parsing
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <iostream>
#include <iterator>

namespace prefmap {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("prefmap",
        "Render a prefecture intensity map as PNG or SVG\n"
        "\n"
        "Examples:\n"
        "  prefmap --scale '[{\"id\":13,\"scale\":5}]' --output tokyo.png\n"
        "  prefmap --scale-file levels.json --size 2 --scale-text --output -\n"
        "  prefmap --scale '[{\"id\":1,\"scale\":3}]' --format svg --output map.svg");

    parser.add_option("config", "c", "Load configuration from JSON file");
    parser.add_option("scale", "s", "Intensity list as JSON: [{\"id\":N,\"scale\":N},...]");
    parser.add_option("scale-file", "", "Read the intensity list from a file (- for stdin)");
    parser.add_option("size", "", "Size class: 1 (1280x720), 2 (2x), 3 (4x)", false, "1");
    parser.add_option("footer", "", "Footer text (default: attribution line)");
    parser.add_flag("scale-text", "", "Draw the intensity value on each active region");
    parser.add_option("geojson", "g", "Region dataset (GeoJSON FeatureCollection)");
    parser.add_option("font-dir", "", "Directory holding roboto-regular.ttf / roboto-medium.ttf");
    parser.add_option("font-weight", "", "Font weight: 400 or 500");
    parser.add_option("output", "o", "Output file (- for stdout; default: map.png / map.svg)");
    parser.add_option("format", "f", "Output format: png or svg", false, "png");
    parser.add_option("log-level", "", "Verbosity 1-6, or facility list like \"3,SceneRasterizer=6\"");
    parser.add_option("log-file", "", "Append log output to file");

    if (!parser.parse(argc, argv)) {
        help_requested_ = parser.help_requested();
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        return false;
    }

    auto config_file = parser.get("config");
    if (config_file.has_value()) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return false;
        }
    }

    parse_all_options(parser);

    auto scale = parser.get("scale");
    auto scale_file = parser.get("scale-file");
    if (scale.has_value() && scale_file.has_value()) {
        std::cerr << "Use either --scale or --scale-file, not both" << std::endl;
        return false;
    }
    if (scale.has_value()) {
        request_.scale_payload = scale.value();
    } else if (scale_file.has_value()) {
        if (!read_scale_file(scale_file.value())) {
            return false;
        }
    }

    if (!parse_format(parser.get("format").value_or("png"))) {
        return false;
    }

    request_.output_path = parser.get("output").value_or(
        request_.format == OutputFormat::SVG ? "map.svg" : "map.png");

    return true;
}

void CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto value = parser.get("geojson")) config_.dataset_path = *value;
    if (auto value = parser.get("font-dir")) config_.font_directory = *value;
    if (auto value = parser.get("log-level")) config_.log_config = *value;
    if (auto value = parser.get("log-file")) config_.log_file = *value;

    if (parser.get("font-weight").has_value()) {
        auto weight = parser.get_as<int>("font-weight");
        if (weight.has_value()) {
            config_.font_weight = parse_font_weight(weight.value());
        } else {
            std::cerr << "Warning: invalid --font-weight, using 400" << std::endl;
            config_.font_weight = FontWeight::REGULAR;
        }
    }

    request_.options.size_class = parse_size_class(parser.get("size").value_or("1"));
    request_.options.footer_text = parser.get("footer").value_or("");
    request_.options.show_scale_labels = parser.get_flag("scale-text");
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        return false;
    }
    config_ = manager.to_renderer_config();
    return true;
}

bool CommandLineInterface::read_scale_file(const std::string& filename) {
    if (filename == "-") {
        request_.scale_payload.assign(std::istreambuf_iterator<char>(std::cin),
                                      std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open scale file: " << filename << std::endl;
        return false;
    }

    request_.scale_payload.assign(std::istreambuf_iterator<char>(file),
                                  std::istreambuf_iterator<char>());
    return true;
}

bool CommandLineInterface::parse_format(const std::string& format_str) {
    if (format_str == "png") {
        request_.format = OutputFormat::PNG;
    } else if (format_str == "svg") {
        request_.format = OutputFormat::SVG;
    } else {
        std::cerr << "Invalid output format: " << format_str << " (use png or svg)" << std::endl;
        return false;
    }
    return true;
}

bool CommandLineInterface::apply_logging(const RendererConfig& config) {
    bool ok = true;
    if (!Logger::parseLogConfig(config.log_config)) {
        std::cerr << "Warning: could not fully parse log level '" << config.log_config << "'" << std::endl;
        ok = false;
    }
    if (!config.log_file.empty() && !Logger::setLogFile(config.log_file)) {
        std::cerr << "Warning: could not open log file " << config.log_file << std::endl;
        ok = false;
    }
    return ok;
}

void CommandLineInterface::print_config() const {
    Logger logger("CommandLineInterface");
    logger.detailed("Dataset: " + config_.dataset_path);
    logger.detailed("Fonts: " + config_.font_directory + " (weight " +
                    std::to_string(static_cast<int>(config_.font_weight)) + ")");
    logger.detailed("Size multiplier: " + std::to_string(size_multiplier(request_.options.size_class)));
    logger.detailed("Labels: " + std::string(request_.options.show_scale_labels ? "on" : "off"));
    logger.detailed("Output: " + request_.output_path +
                    (request_.format == OutputFormat::SVG ? " (svg)" : " (png)"));
}

} // namespace prefmap
