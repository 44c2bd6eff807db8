/**
 * @file SVGExporter.cpp
 * @brief Implementation of scene SVG export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SVGExporter.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace prefmap {

SVGExporter::SVGExporter(const SVGConfig& config)
    : config_(config) {
}

std::string SVGExporter::escape_xml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

void SVGExporter::write_svg_header(std::ostream& out, int width, int height) const {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n";
    out << "<svg\n";
    out << "  width=\"" << width << "\"\n";
    out << "  height=\"" << height << "\"\n";
    out << "  viewBox=\"0 0 " << width << " " << height << "\"\n";
    out << "  version=\"1.1\"\n";
    out << "  xmlns=\"http://www.w3.org/2000/svg\">\n";
}

void SVGExporter::write_background(std::ostream& out, const VectorScene& scene) const {
    out << "  <rect x=\"0\" y=\"0\" width=\"" << scene.width << "\" height=\"" << scene.height
        << "\" style=\"" << escape_xml(scene.background_style) << "\"/>\n";
}

void SVGExporter::write_regions(std::ostream& out, const VectorScene& scene) const {
    out << "  <g id=\"regions\" fill-rule=\"evenodd\">\n";
    for (const auto& element : scene.elements) {
        out << "    <path\n";
        out << "      id=\"region-" << element.region_id << "\"\n";
        out << "      d=\"" << element.path_data << "\"\n";
        out << "      style=\"" << escape_xml(element.style) << "\"\n";
        out << "    />\n";
    }
    out << "  </g>\n";
}

void SVGExporter::write_text(std::ostream& out, int x, int y, const std::string& text) const {
    int font_size = static_cast<int>(std::lround(config_.base_font_size_px * config_.size_multiplier));
    out << "    <text x=\"" << x << "\" y=\"" << y << "\""
        << " fill=\"" << config_.text_color << "\""
        << " font-family=\"" << escape_xml(config_.font_family) << "\""
        << " font-weight=\"" << config_.font_weight << "\""
        << " font-size=\"" << font_size << "px\">"
        << escape_xml(text) << "</text>\n";
}

std::string SVGExporter::to_svg(const VectorScene& scene,
                                const std::vector<RegionLabel>& labels,
                                const std::string& footer_text) const {
    std::ostringstream out;
    write_svg_header(out, scene.width, scene.height);
    write_background(out, scene);
    write_regions(out, scene);

    if (!labels.empty()) {
        out << "  <g id=\"labels\">\n";
        for (const auto& label : labels) {
            write_text(out, static_cast<int>(label.anchor.x) - 5,
                       static_cast<int>(label.anchor.y) + 5, label.text);
        }
        out << "  </g>\n";
    }

    const std::string& footer = footer_text.empty() ? config_.default_footer : footer_text;
    if (!footer.empty()) {
        double m = config_.size_multiplier;
        out << "  <g id=\"footer\">\n";
        write_text(out, static_cast<int>(10.0 * m),
                   scene.height - static_cast<int>(config_.base_font_size_px * m), footer);
        out << "  </g>\n";
    }

    out << "</svg>\n";
    return out.str();
}

bool SVGExporter::write_file(const std::string& document, const std::string& filename) {
    Logger logger("SVGExporter");

    if (filename == "-") {
        std::cout << document;
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create SVG file: " + filename);
        return false;
    }

    file << document;
    if (!file) {
        logger.error("Failed to write SVG file: " + filename);
        return false;
    }

    logger.info("Wrote " + filename + " (" + std::to_string(document.size()) + " bytes)");
    return true;
}

} // namespace prefmap
