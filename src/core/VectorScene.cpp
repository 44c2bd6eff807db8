/**
 * @file VectorScene.cpp
 * @brief Path data and style parsing
 */

#include "VectorScene.hpp"
#include "RenderError.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace prefmap {

namespace {

void skip_separators(const std::string& text, size_t& pos) {
    while (pos < text.size() &&
           (std::isspace(static_cast<unsigned char>(text[pos])) || text[pos] == ',')) {
        ++pos;
    }
}

double read_number(const std::string& text, size_t& pos) {
    skip_separators(text, pos);
    if (pos >= text.size()) {
        throw RenderingError("path data ends where a coordinate was expected");
    }

    const char* begin = text.c_str() + pos;
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        throw RenderingError("invalid coordinate in path data at offset " + std::to_string(pos));
    }
    pos += static_cast<size_t>(end - begin);
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

double parse_style_number(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        double number = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw RenderingError("trailing characters in style value " + name + ":" + value);
        }
        return number;
    } catch (const std::logic_error&) {
        throw RenderingError("invalid number in style value " + name + ":" + value);
    }
}

} // namespace

std::vector<Subpath> parse_path_data(const std::string& path_data) {
    std::vector<Subpath> subpaths;
    size_t pos = 0;

    while (true) {
        skip_separators(path_data, pos);
        if (pos >= path_data.size()) break;

        char command = path_data[pos++];
        switch (command) {
            case 'M': {
                double x = read_number(path_data, pos);
                double y = read_number(path_data, pos);
                subpaths.push_back(Subpath{{x, y}});
                break;
            }
            case 'L': {
                if (subpaths.empty()) {
                    throw RenderingError("line-to before move-to in path data");
                }
                double x = read_number(path_data, pos);
                double y = read_number(path_data, pos);
                subpaths.back().push_back({x, y});
                break;
            }
            case 'Z':
            case 'z':
                if (subpaths.empty()) {
                    throw RenderingError("close-path before move-to in path data");
                }
                break;
            default:
                throw RenderingError(std::string("unsupported path command '") + command + "'");
        }
    }
    return subpaths;
}

SceneStyle parse_style(const std::string& style) {
    SceneStyle parsed;

    std::stringstream ss(style);
    std::string declaration;
    while (std::getline(ss, declaration, ';')) {
        declaration = trim(declaration);
        if (declaration.empty()) continue;

        size_t colon = declaration.find(':');
        if (colon == std::string::npos) {
            throw RenderingError("malformed style declaration '" + declaration + "'");
        }
        std::string name = trim(declaration.substr(0, colon));
        std::string value = trim(declaration.substr(colon + 1));

        if (name == "fill") {
            parsed.fill = (value == "none") ? std::nullopt : std::optional<std::string>(value);
        } else if (name == "stroke") {
            parsed.stroke = (value == "none") ? std::nullopt : std::optional<std::string>(value);
        } else if (name == "stroke-width") {
            parsed.stroke_width = parse_style_number(name, value);
        } else if (name == "fill-opacity") {
            parsed.fill_opacity = parse_style_number(name, value);
        }
    }
    return parsed;
}

} // namespace prefmap
