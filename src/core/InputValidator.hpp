/**
 * @file InputValidator.hpp
 * @brief Validation of caller-supplied intensity payloads
 *
 * Turns the JSON list of {"id": n, "scale": n} pairs received from the
 * command line or the HTTP query into an IntensityAssignment, rejecting the
 * whole payload before any rendering step when anything is wrong.
 */

#pragma once

#include "prefmap.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace prefmap {

/**
 * @brief One problem found in an intensity payload
 */
struct IntensityIssue {
    std::string description;
    int region_id = 0;       ///< Region the issue refers to (0 if unknown)
};

/**
 * @brief Result of payload validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<IntensityIssue> issues;
    IntensityAssignment intensities;   ///< Only meaningful when is_valid

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    /// All issues joined into one message ("" when valid)
    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate an already parsed payload
     *
     * Collects every issue instead of stopping at the first one. Entries
     * omitting "id" or "scale", or setting it to null, take 0 for that field; later entries
     * for the same id replace earlier ones.
     */
    ValidationResult validate(const nlohmann::json& payload) const;

    /**
     * @brief Parse and validate a JSON payload string
     * @param payload JSON text, e.g. [{"id":13,"scale":5}]
     * @return Validated assignment
     * @throws InputValidationError if the payload is empty, not JSON, or invalid
     */
    IntensityAssignment parse_intensities(const std::string& payload) const;

private:
    void check_entry(const nlohmann::json& entry, size_t index, ValidationResult& result) const;
};

} // namespace prefmap
