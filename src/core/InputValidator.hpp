/**
 * @file InputValidator.hpp
 * @brief Validation of contradictory or out-of-range generation parameters
 *
 * Every problem is reported together with the parameters involved and
 * suggested fixes, before any image is loaded.
 */

#pragma once

#include "planet_generator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace planet {

/**
 * @brief A parameter problem detected in user inputs
 */
struct ParameterConflict {
    std::string description;
    std::vector<std::string> involved_params;
    std::vector<std::string> suggestions;
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    ValidationResult validate(const PlanetConfig& config) const;

private:
    /**
     * @brief caps must be "auto", "none" or an angle strictly between 0 and 90
     */
    std::optional<ParameterConflict> check_caps(const PlanetConfig& config) const;

    /**
     * @brief Relief must keep every radius positive; logo relief may be negative
     */
    std::optional<ParameterConflict> check_relief(const PlanetConfig& config) const;

    std::optional<ParameterConflict> check_feature_bands(const PlanetConfig& config) const;

    std::optional<ParameterConflict> check_half_sphere(const PlanetConfig& config) const;

    std::optional<ParameterConflict> check_output_formats(const PlanetConfig& config) const;
};

} // namespace planet
