/**
 * @file Projection.hpp
 * @brief Forward and inverse map projection math
 *
 * Pixel offsets are measured from the image center, x to the right and
 * y upwards. Angles are radians: azimuth theta in (-pi, pi], elevation
 * phi in [-pi/2, pi/2].
 */

#pragma once

#include "planet_generator.hpp"
#include <optional>
#include <string>

namespace planet {

/**
 * @brief Parse a projection name ("mercator", "cylindrical",
 *        "mollweide", "equirectangular", "sinusoidal", "half-sphere")
 * @return Parsed kind, or nullopt for an unknown name
 */
std::optional<ProjectionKind> parse_projection_kind(const std::string& name);

std::string projection_name(ProjectionKind kind);

/**
 * @brief Wrap an angle into [-pi, pi)
 */
double wrap_angle(double angle);

/**
 * @brief Image-space projection of a sphere of radius width/(2*pi) pixels
 *
 * Every inverse returns nullopt when the pixel lies outside the
 * projection's domain. Instances are immutable.
 */
class Projection {
public:
    Projection(ProjectionKind kind, size_t width_px, size_t height_px);

    ProjectionKind kind() const { return kind_; }
    double radius() const { return radius_; }
    size_t width() const { return width_; }
    size_t height() const { return height_; }

    /**
     * @brief Azimuth of the pixel offset (x, y)
     */
    std::optional<double> theta_of(double x, double y) const;

    /**
     * @brief Elevation of the pixel row offset y
     *
     * Undefined for the half-sphere, whose elevation depends on both
     * offsets; use phi_at() there.
     */
    std::optional<double> phi_of(double y) const;

    /**
     * @brief Elevation of the pixel offset (x, y), for every projection
     */
    std::optional<double> phi_at(double x, double y) const;

    /**
     * @brief True when rows of the image are not parallels of latitude
     */
    bool is_azimuthal() const { return kind_ == ProjectionKind::HALF_SPHERE; }

    /**
     * @brief Pixel offset of (theta, phi), the exact inverse of theta_of/phi_of
     * @return nullopt where the projection is singular (mercator at the poles)
     */
    std::optional<std::pair<double, double>> forward(double theta, double phi) const;

    /**
     * @brief Elevation at the top edge of the image (row offset height/2)
     */
    std::optional<double> edge_phi() const;

    /**
     * @brief True when rows already shrink toward the poles
     *
     * Mollweide and sinusoidal are equal-area, so sampling them at a fixed
     * pixel step does not oversample high latitudes.
     */
    bool compensates_ring_shrink() const {
        return kind_ == ProjectionKind::MOLLWEIDE || kind_ == ProjectionKind::SINUSOIDAL;
    }

    /**
     * @brief Height in whole pixels the image should have for its width, if the projection fixes it
     */
    std::optional<size_t> expected_height() const;

private:
    ProjectionKind kind_;
    size_t width_;
    size_t height_;
    double radius_;
};

} // namespace planet
