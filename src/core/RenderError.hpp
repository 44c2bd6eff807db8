/**
 * @file RenderError.hpp
 * @brief Exceptions raised by the map rendering pipeline
 *
 * Every failure is terminal for its request. The kind tells the caller how
 * to report it (client error vs server error).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace prefmap {

enum class ErrorKind {
    INPUT_VALIDATION,  ///< Missing/unparseable intensity payload or scale outside [0,7]
    DATASET,           ///< Geometry dataset missing, unreadable or malformed
    GEOMETRY_SHAPE,    ///< Missing id property or unsupported geometry
    RENDERING          ///< Scene parsing, rasterization, text or encoding failure
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INPUT_VALIDATION: return "InputValidationError";
        case ErrorKind::DATASET:          return "DatasetError";
        case ErrorKind::GEOMETRY_SHAPE:   return "GeometryShapeError";
        case ErrorKind::RENDERING:        return "RenderingError";
    }
    return "RenderError";
}

/**
 * @brief Base class of all pipeline errors
 */
class RenderError : public std::runtime_error {
public:
    RenderError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
          kind_(kind), detail_(message) {}

    ErrorKind kind() const { return kind_; }

    /// Message without the kind prefix
    const std::string& detail() const { return detail_; }

    /// True for errors caused by the request rather than the server
    bool is_client_error() const { return kind_ == ErrorKind::INPUT_VALIDATION; }

private:
    ErrorKind kind_;
    std::string detail_;
};

class InputValidationError : public RenderError {
public:
    explicit InputValidationError(const std::string& message)
        : RenderError(ErrorKind::INPUT_VALIDATION, message) {}
};

class DatasetError : public RenderError {
public:
    explicit DatasetError(const std::string& message)
        : RenderError(ErrorKind::DATASET, message) {}
};

class GeometryShapeError : public RenderError {
public:
    explicit GeometryShapeError(const std::string& message)
        : RenderError(ErrorKind::GEOMETRY_SHAPE, message) {}
};

class RenderingError : public RenderError {
public:
    explicit RenderingError(const std::string& message)
        : RenderError(ErrorKind::RENDERING, message) {}
};

} // namespace prefmap
