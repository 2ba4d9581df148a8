/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include "PointSampler.hpp"
#include "../export/MeshExporter.hpp"
#include <sstream>
#include <cmath>
#include <stdexcept>

namespace planet {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const PlanetConfig& config) const {
    ValidationResult result;

    for (auto check : {&InputValidator::check_caps, &InputValidator::check_relief,
                       &InputValidator::check_feature_bands, &InputValidator::check_half_sphere,
                       &InputValidator::check_output_formats}) {
        auto conflict = (this->*check)(config);
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_caps(const PlanetConfig& config) const {
    try {
        CapPolicy::parse(config.caps);
    } catch (const std::invalid_argument& e) {
        ParameterConflict conflict;
        conflict.description = e.what();
        conflict.involved_params = {"--caps " + config.caps};
        conflict.suggestions = {
            "Use --caps auto to start the caps where the image ends",
            "Use --caps none to leave the poles open",
            "Give the polar angle of the caps in degrees, e.g. --caps 10"
        };
        return conflict;
    }
    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_relief(const PlanetConfig& config) const {
    std::vector<std::string> params;
    if (!(config.scale >= 0.0 && config.scale < 1.0)) {
        params.push_back("--scale " + std::to_string(config.scale) + " (must be in [0, 1))");
    }
    if (!(config.protrusion > 0.0)) {
        params.push_back("--protrusion " + std::to_string(config.protrusion) + " (must be positive)");
    }
    auto check_height = [&params](const std::optional<double>& height, const std::string& name) {
        if (height && !(*height > 0.0)) {
            params.push_back(name + " " + std::to_string(*height) + " (must be positive)");
        }
    };
    check_height(config.caps_height, "--caps-height");
    check_height(config.meridians_height, "--meridians-height");
    check_height(config.equator_height, "--equator-height");
    if (params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Relief parameters would produce non-positive radii";
    conflict.involved_params = params;
    conflict.suggestions = {
        "Keep --scale small (the default is 0.02, i.e. +/-2% of the radius)",
        "Use a protrusion slightly above 1, e.g. --protrusion 1.02"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_feature_bands(const PlanetConfig& config) const {
    std::vector<std::string> params;
    for (const auto& meridian : config.meridians) {
        if (!(meridian.width >= 0.0 && meridian.width < 2.0 * M_PI)) {
            std::ostringstream oss;
            oss << "meridian at " << meridian.longitude * 180.0 / M_PI << " deg has width "
                << meridian.width * 180.0 / M_PI << " deg";
            params.push_back(oss.str());
        }
    }
    if (!(config.equator_width >= 0.0 && config.equator_width < M_PI)) {
        params.push_back("--equator-width " + std::to_string(config.equator_width * 180.0 / M_PI) + " deg");
    }
    if (params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Meridian and equator widths must be between 0 and a full turn";
    conflict.involved_params = params;
    conflict.suggestions = {"Widths are given in degrees, e.g. --meridian-widths 2"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_half_sphere(const PlanetConfig& config) const {
    if (config.projection != ProjectionKind::HALF_SPHERE) {
        return std::nullopt;
    }

    std::vector<std::string> params;
    if (config.caps != "auto" && config.caps != "none") {
        params.push_back("--caps " + config.caps);
    }
    if (config.logo_north) {
        params.push_back("--logo-north " + *config.logo_north);
    }
    if (config.logo_south) {
        params.push_back("--logo-south " + *config.logo_south);
    }
    if (params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "A half-sphere map covers the pole itself and has no caps or logos";
    conflict.involved_params = params;
    conflict.suggestions = {
        "Use --caps none with --projection half-sphere",
        "Drop the logos, or use a projection of the whole body"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_formats(const PlanetConfig& config) const {
    std::vector<std::string> params;
    for (const auto& format : config.output_formats) {
        if (!MultiFormatExporter::is_supported_format(format)) {
            params.push_back("--type " + format);
        }
    }
    if (config.output_formats.empty()) {
        params.push_back("--type (empty)");
    }
    if (params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Unsupported output format";
    conflict.involved_params = params;
    conflict.suggestions = {"Choose from ply, stl and asc (comma separated for several)"};
    return conflict;
}

} // namespace planet
