/**
 * @file MapServer.hpp
 * @brief HTTP front end serving rendered maps
 */

#pragma once

#include "prefmap.hpp"
#include "MapRequestHandler.hpp"
#include "../core/GeoDatasetLoader.hpp"
#include "../core/Logger.hpp"
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace prefmap {

/**
 * @brief cpp-httplib server exposing GET /map
 *
 * Requests run on httplib worker threads; they share the renderer and the
 * dataset cache, both safe for concurrent use.
 */
class MapServer {
public:
    explicit MapServer(const RendererConfig& config);
    ~MapServer();

    MapServer(const MapServer&) = delete;
    MapServer& operator=(const MapServer&) = delete;

    /**
     * @brief Block serving requests on the configured host and port
     * @return false if the socket could not be bound
     */
    bool listen();

    /// Stop a running listen() from another thread
    void stop();

private:
    RendererConfig config_;
    DatasetCache cache_;
    MapRequestHandler handler_;
    std::unique_ptr<httplib::Server> server_;
    Logger logger_;

    void register_routes();
};

} // namespace prefmap
