/**
 * @file MapRequestHandler.cpp
 * @brief Implementation of map request handling
 */

#include "MapRequestHandler.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "../core/RenderError.hpp"

namespace prefmap {

MapRequestHandler::MapRequestHandler(const RendererConfig& config, DatasetCache& cache)
    : config_(config), cache_(cache), renderer_(config) {
}

int MapRequestHandler::status_for(ErrorKind kind) {
    return kind == ErrorKind::INPUT_VALIDATION ? 400 : 500;
}

MapResponse MapRequestHandler::handle_map(const QueryParams& params) const {
    Logger logger("MapRequestHandler");

    auto param = [&params](const std::string& name) -> std::string {
        auto it = params.find(name);
        return it != params.end() ? it->second : std::string();
    };

    MapResponse response;
    try {
        InputValidator validator;
        IntensityAssignment intensities = validator.parse_intensities(param("scale"));

        RenderOptions options;
        options.size_class = parse_size_class(param("size"));
        options.footer_text = param("footer");
        options.show_scale_labels = param("scale_text") == "true";

        std::shared_ptr<const GeoDataset> dataset = cache_.get(config_.dataset_path);
        RenderedImage image = renderer_.render(*dataset, intensities, options);

        response.status = 200;
        response.content_type = "image/png";
        response.body.assign(image.bytes.begin(), image.bytes.end());
    } catch (const RenderError& e) {
        response.status = status_for(e.kind());
        response.content_type = "text/plain";
        response.body = e.detail();
        if (e.is_client_error()) {
            logger.info("Rejected request: " + e.detail());
        } else {
            logger.error(e.what());
        }
    }
    return response;
}

} // namespace prefmap
