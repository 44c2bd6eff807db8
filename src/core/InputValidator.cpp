/**
 * @file InputValidator.cpp
 * @brief Implementation of intensity payload validation
 */

#include "InputValidator.hpp"
#include "Logger.hpp"
#include "RenderError.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace prefmap {

std::string ValidationResult::format_error_message() const {
    if (is_valid || issues.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << issues[i].description;
    }
    return oss.str();
}

namespace {

// JSON integer as int64; nullopt for non-integers and unsigned values past INT64_MAX
std::optional<std::int64_t> as_int64(const json& value) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return value.get<std::int64_t>();
}

// Omitted and null fields both decode as 0
bool has_field(const json& entry, const char* name) {
    auto it = entry.find(name);
    return it != entry.end() && !it->is_null();
}

} // namespace

void InputValidator::check_entry(const json& entry, size_t index, ValidationResult& result) const {
    if (!entry.is_object()) {
        result.issues.push_back({"Invalid scale data format: entry " + std::to_string(index) +
                                 " is not an object", 0});
        return;
    }

    std::int64_t id = 0;
    std::int64_t scale = 0;

    if (has_field(entry, "id")) {
        auto value = as_int64(entry["id"]);
        if (!value.has_value()) {
            result.issues.push_back({"Invalid scale data format: entry " + std::to_string(index) +
                                     " has a non-integer id", 0});
            return;
        }
        id = *value;
    }

    // Region ids are int
    if (id < std::numeric_limits<int>::min() || id > std::numeric_limits<int>::max()) {
        result.issues.push_back({"Invalid scale data format: entry " + std::to_string(index) +
                                 " has an id out of range: " + std::to_string(id), 0});
        return;
    }
    int region_id = static_cast<int>(id);

    if (has_field(entry, "scale")) {
        auto value = as_int64(entry["scale"]);
        if (!value.has_value()) {
            result.issues.push_back({"Invalid scale data format: entry " + std::to_string(index) +
                                     " has a non-integer scale", region_id});
            return;
        }
        scale = *value;
    }

    if (scale < MIN_INTENSITY_LEVEL || scale > MAX_INTENSITY_LEVEL) {
        result.issues.push_back({"Invalid scale value for ID " + std::to_string(region_id) + ": " +
                                 std::to_string(scale), region_id});
        return;
    }

    result.intensities[region_id] = static_cast<int>(scale);
}

ValidationResult InputValidator::validate(const json& payload) const {
    ValidationResult result;

    if (!payload.is_array()) {
        result.issues.push_back({"Invalid scale data format: expected a JSON array", 0});
    } else {
        for (size_t i = 0; i < payload.size(); ++i) {
            check_entry(payload[i], i, result);
        }
    }

    result.is_valid = result.issues.empty();
    if (!result.is_valid) {
        result.intensities.clear();
    }
    return result;
}

IntensityAssignment InputValidator::parse_intensities(const std::string& payload) const {
    Logger logger("InputValidator");

    if (payload.empty()) {
        throw InputValidationError("scale parameter is required");
    }

    json parsed;
    try {
        parsed = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw InputValidationError(std::string("Invalid scale data format: ") + e.what());
    }

    ValidationResult result = validate(parsed);
    if (result.has_errors()) {
        throw InputValidationError(result.format_error_message());
    }

    logger.debug("Accepted " + std::to_string(result.intensities.size()) + " intensity entries");
    return result.intensities;
}

} // namespace prefmap
