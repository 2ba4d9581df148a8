/**
 * @file PointSampler.hpp
 * @brief Adaptive sampling of a projected height field into latitude rows
 */

#pragma once

#include "planet_generator.hpp"
#include "Projection.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace planet {

/**
 * @brief How far the map reaches toward the poles
 *
 * NONE samples the whole projection and leaves the poles open; the angle
 * it resolves to only bounds logo placement. AUTO stops at the image
 * edge. ANGLE stops at a polar angle given in degrees.
 */
struct CapPolicy {
    enum class Mode { NONE, AUTO, ANGLE };
    Mode mode = Mode::AUTO;
    double degrees = 0.0;  ///< Polar angle of the cap, 0 < degrees < 90 (ANGLE only)

    /**
     * @brief Parse "none", "auto" or a number of degrees
     * @throws std::invalid_argument for anything else, or an angle outside (0, 90)
     */
    static CapPolicy parse(const std::string& text);

    std::string to_string() const;
};

/**
 * @brief Parameters for map sampling
 */
struct SamplingConfig {
    ProjectionKind projection = ProjectionKind::MERCATOR;
    size_t target_points = 0;      ///< Approximate output size, 0 keeps every pixel
    double scale = 0.02;           ///< Relief amplitude relative to the unit radius
    CapPolicy caps;
    std::vector<Meridian> meridians;
    double equator_width = 0.0;    ///< Full band width in radians, 0 disables it
    double protrusion = 1.02;      ///< Relief multiplier for raised meridians and the equator

    // Absolute radii overriding the protrusion-derived ones
    std::optional<double> meridians_height;
    std::optional<double> equator_height;
    std::optional<double> caps_height;  ///< Meridians rise toward it as they approach the caps
};

/**
 * @brief Turns a height grid into a Patch of rows ordered north to south
 *
 * Rows run from the top image row downward; points inside a row run in
 * increasing azimuth starting at -pi. A row lying on a pole collapses to
 * a single point. Half-sphere maps are sampled by image scan lines
 * instead, see sample_half_sphere().
 */
class PointSampler {
public:
    explicit PointSampler(const SamplingConfig& config);

    /**
     * @brief Sample the map body
     * @param heights Elevation grid, row 0 is the north edge
     * @param start_id First id to assign
     * @return Patch "map" with ids [start_id, patch.next_id)
     */
    Patch sample(const HeightGrid& heights, PointId start_id) const;

    /**
     * @brief Elevation where the caps begin for this projection and image size
     */
    double cap_angle(const Projection& projection) const;

    /**
     * @brief Default radius of raised meridian and equator samples
     */
    double feature_radius() const { return 1.0 + config_.protrusion * config_.scale; }

    /**
     * @brief Radius of a meridian sample at latitude phi
     *
     * Grows quadratically from meridians_height on the equator to
     * caps_height at phi_cap when a cap height is set.
     */
    double meridian_radius(double phi, double phi_cap) const;

    double equator_radius() const { return config_.equator_height.value_or(feature_radius()); }

    const SamplingConfig& config() const { return config_; }

private:
    SamplingConfig config_;
    Logger logger_;

    bool on_meridian(double theta, double min_half_width) const;

    /**
     * @brief Every pixel inside the disc, one row per image scan line
     *
     * No caps, meridians or equator band apply; rows are not rings.
     */
    Patch sample_half_sphere(const HeightGrid& heights, PointId start_id) const;
};

} // namespace planet
