/**
 * @file main.cpp
 * @brief Entry point for prefmap-server
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "prefmap.hpp"
#include "MapServer.hpp"
#include "../cli/CommandLineInterface.hpp"
#include "../cli/ConfigurationManager.hpp"
#include "../cli/SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include <iostream>

using namespace prefmap;

int main(int argc, char* argv[]) {
    SimpleCommandLineParser parser("prefmap-server",
        "Serve prefecture intensity maps over HTTP\n"
        "\n"
        "  GET /map?scale=[{\"id\":13,\"scale\":5}]&size=1&footer=...&scale_text=true");

    parser.add_option("config", "c", "Load configuration from JSON file");
    parser.add_option("host", "", "Listen address (default: 0.0.0.0)");
    parser.add_option("port", "p", "Listen port (default: 8080)");
    parser.add_option("geojson", "g", "Region dataset (GeoJSON FeatureCollection)");
    parser.add_option("font-dir", "", "Directory holding roboto-regular.ttf / roboto-medium.ttf");
    parser.add_option("log-level", "", "Verbosity 1-6, or facility list like \"3,MapServer=6\"");
    parser.add_option("log-file", "", "Append log output to file");

    if (!parser.parse(argc, argv)) {
        return parser.help_requested() ? 0 : 2;
    }

    ConfigurationManager manager;
    if (auto config_file = parser.get("config")) {
        if (!manager.load_from_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return 2;
        }
    }

    RendererConfig config = manager.to_renderer_config();
    if (auto value = parser.get("host")) config.server_host = *value;
    if (auto value = parser.get("geojson")) config.dataset_path = *value;
    if (auto value = parser.get("font-dir")) config.font_directory = *value;
    if (auto value = parser.get("log-level")) config.log_config = *value;
    if (auto value = parser.get("log-file")) config.log_file = *value;
    if (parser.get("port").has_value()) {
        auto port = parser.get_as<int>("port");
        if (!port.has_value() || port.value() <= 0 || port.value() > 65535) {
            std::cerr << "Invalid port: " << parser.get("port").value() << std::endl;
            return 2;
        }
        config.server_port = port.value();
    }

    Logger logger("MapServer");
    if (!CommandLineInterface::apply_logging(config)) {
        logger.warning("Logging configuration partially applied");
    }

    MapServer server(config);
    return server.listen() ? 0 : 1;
}
