/**
 * @file main.cpp
 * @brief Main entry point for the prefmap command line renderer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "prefmap.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/GeoDatasetLoader.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/RenderError.hpp"
#include "export/PNGExporter.hpp"
#include "export/SVGExporter.hpp"
#include <iostream>

using namespace prefmap;

/**
 * @brief Main entry point
 *
 * Exit status: 0 on success, 2 for usage or input validation errors,
 * 1 for dataset, geometry or rendering failures.
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.help_requested() ? 0 : 2;
    }

    const RendererConfig& config = cli.get_config();
    const RenderRequest& request = cli.get_request();
    Logger logger("prefmap");
    if (!CommandLineInterface::apply_logging(config)) {
        logger.warning("Logging configuration partially applied");
    }
    cli.print_config();

    try {
        InputValidator validator;
        IntensityAssignment intensities = validator.parse_intensities(request.scale_payload);

        GeoDatasetLoader loader;
        GeoDataset dataset = loader.load_file(config.dataset_path);

        MapRenderer renderer(config);

        if (request.format == OutputFormat::SVG) {
            std::string document = renderer.render_svg(dataset, intensities, request.options);
            if (!SVGExporter::write_file(document, request.output_path)) {
                logger.error("Failed to write " + request.output_path);
                return 1;
            }
        } else {
            RenderedImage image = renderer.render(dataset, intensities, request.options);
            if (!PNGExporter::write_file(image.bytes, request.output_path)) {
                logger.error("Failed to write " + request.output_path);
                return 1;
            }
        }

        return 0;

    } catch (const InputValidationError& e) {
        logger.error(e.what());
        return 2;
    } catch (const RenderError& e) {
        logger.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
