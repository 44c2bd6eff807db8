/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the prefmap renderer
 */

#pragma once

#include "prefmap.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>

namespace prefmap {

/**
 * @brief One render job described on the command line
 */
struct RenderRequest {
    std::string scale_payload;          ///< Raw JSON intensity list
    RenderOptions options;
    OutputFormat format = OutputFormat::PNG;
    std::string output_path;            ///< "-" for stdout
};

/**
 * @brief Command line interface for parsing arguments and configuring the renderer
 *
 * Values from --config are applied first; explicit options override them.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if parsing was successful, false on errors or --help
     */
    bool parse_arguments(int argc, char* argv[]);

    bool help_requested() const { return help_requested_; }

    const RendererConfig& get_config() const { return config_; }

    const RenderRequest& get_request() const { return request_; }

    /// Apply log level and log file from the configuration
    static bool apply_logging(const RendererConfig& config);

    /// Configuration summary at DETAILED level
    void print_config() const;

private:
    RendererConfig config_;
    RenderRequest request_;
    bool help_requested_ = false;

    bool load_config_file(const std::string& filename);
    bool read_scale_file(const std::string& filename);
    bool parse_format(const std::string& format_str);
    void parse_all_options(const SimpleCommandLineParser& parser);
};

} // namespace prefmap
