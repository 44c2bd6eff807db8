/**
 * @file MapRequestHandler.hpp
 * @brief Transport-independent handling of map requests
 *
 * Maps query parameters to a render call and render errors to HTTP status
 * codes. MapServer wires it to cpp-httplib.
 */

#pragma once

#include "prefmap.hpp"
#include "../core/GeoDatasetLoader.hpp"
#include "../core/RenderError.hpp"
#include <map>
#include <string>

namespace prefmap {

struct MapResponse {
    int status = 200;
    std::string content_type = "text/plain";
    std::string body;
};

class MapRequestHandler {
public:
    using QueryParams = std::map<std::string, std::string>;

    /**
     * @param config Renderer configuration (dataset path, fonts, style)
     * @param cache Dataset cache shared by all requests
     */
    MapRequestHandler(const RendererConfig& config, DatasetCache& cache);

    /**
     * @brief Handle GET /map
     *
     * Parameters: scale (required JSON list), size ("1"/"2"/"3"), footer,
     * scale_text ("true" draws labels). 400 for input errors, 500 for
     * dataset or rendering errors, 200 with image/png otherwise.
     */
    MapResponse handle_map(const QueryParams& params) const;

    /// HTTP status for an error kind
    static int status_for(ErrorKind kind);

private:
    RendererConfig config_;
    DatasetCache& cache_;
    MapRenderer renderer_;
};

} // namespace prefmap
