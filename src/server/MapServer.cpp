/**
 * @file MapServer.cpp
 * @brief Implementation of the HTTP front end
 */

#include "MapServer.hpp"
#include <httplib.h>
#include <exception>

namespace prefmap {

MapServer::MapServer(const RendererConfig& config)
    : config_(config),
      handler_(config_, cache_),
      server_(std::make_unique<httplib::Server>()),
      logger_("MapServer") {
    register_routes();
}

MapServer::~MapServer() = default;

void MapServer::register_routes() {
    server_->Get("/map", [this](const httplib::Request& req, httplib::Response& res) {
        MapRequestHandler::QueryParams params;
        for (const auto& [name, value] : req.params) {
            params.emplace(name, value);   // first occurrence wins
        }

        MapResponse response = handler_.handle_map(params);
        res.status = response.status;
        res.set_content(response.body, response.content_type);
    });

    server_->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        logger_.detailed(req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                          std::exception_ptr e) {
        res.status = 500;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            logger_.error("Unhandled exception for " + req.path + ": " + ex.what());
            res.set_content(std::string("Internal error: ") + ex.what(), "text/plain");
        } catch (...) {
            logger_.error("Unknown exception for " + req.path);
            res.set_content("Internal error", "text/plain");
        }
    });
}

bool MapServer::listen() {
    logger_.info("Server starting on " + config_.server_host + ":" + std::to_string(config_.server_port));
    if (!server_->listen(config_.server_host, config_.server_port)) {
        logger_.error("Failed to listen on " + config_.server_host + ":" + std::to_string(config_.server_port));
        return false;
    }
    return true;
}

void MapServer::stop() {
    server_->stop();
}

} // namespace prefmap
