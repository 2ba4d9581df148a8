/**
 * @file PolarPatchGenerator.hpp
 * @brief Polar cap and logo patches generated independently of the map
 */

#pragma once

#include "planet_generator.hpp"
#include "Logger.hpp"

namespace planet {

/**
 * @brief Smooth spherical cap between a pole and a latitude
 */
class CapGenerator {
public:
    CapGenerator();

    /**
     * @brief Sample a cap of the given radius
     *
     * A positive phi_max gives the north cap, a negative one the south
     * cap. Rows always run from the pole, which collapses to a single point,
     * out to phi_max, so the south cap is marked reversed. A phi_max on the
     * pole gives just the pole point.
     *
     * @param radius Sphere radius of the cap
     * @param phi_max Latitude where the cap meets the map, radians
     * @param start_id First id to assign
     */
    Patch cap(double radius, double phi_max, PointId start_id) const;

    static constexpr size_t kMinRings = 10;
    static constexpr size_t kMinRingPoints = 9;
    static constexpr double kEquatorRingPoints = 300.0;
    static constexpr double kPoleTolerance = 1e-9;

private:
    Logger logger_;
};

/**
 * @brief Projects a square image onto an azimuthal disc around a pole
 */
class LogoGenerator {
public:
    /**
     * @param relief Multiplier on the image's relief around the protrusion radius
     */
    explicit LogoGenerator(double relief = 1.0);

    /**
     * @brief Build the logo patch
     *
     * The inscribed circle of the image maps to the cap between the pole
     * and phi_max, the image center sits on the pole. Pixel intensity
     * raises the surface above protrusion.
     *
     * @param image Grayscale image, row 0 at the top
     * @param phi_max Latitude of the disc edge, sign selects the pole
     * @param protrusion Base radius of the disc
     * @param start_id First id to assign
     */
    Patch logo(const HeightGrid& image, double phi_max, double protrusion, PointId start_id) const;

private:
    double relief_;
    Logger logger_;
};

} // namespace planet
