/**
 * @file PolarPatchGenerator.cpp
 * @brief Implementation of cap and logo generation
 */

#include "PolarPatchGenerator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace planet {

CapGenerator::CapGenerator() : logger_("CapGenerator") {
}

Patch CapGenerator::cap(double radius, double phi_max, PointId start_id) const {
    if (radius <= 0) {
        throw std::invalid_argument("Cap radius must be positive");
    }
    if (std::abs(phi_max) > M_PI / 2.0) {
        throw std::invalid_argument("Cap latitude must lie within [-pi/2, pi/2]");
    }

    // Both caps start at their pole, so the pole fan is the first band
    const bool north = phi_max > 0;
    const double pole = north ? M_PI / 2.0 : -M_PI / 2.0;
    const double phi_start = pole;
    const double phi_end = phi_max;

    Patch patch(north ? "north-cap" : "south-cap", start_id);
    patch.reversed = !north;
    PointId next_id = start_id;

    // Nothing left to cover: the pole point alone closes the map's last ring
    if (std::abs(phi_end - phi_start) < kPoleTolerance) {
        patch.rows.push_back(Row{SurfacePoint(next_id++, 0.0, 0.0, north ? radius : -radius)});
        patch.next_id = next_id;
        logger_.detailed("Generated " + patch.name + " as a single pole point");
        return patch;
    }

    const size_t num_rings = std::max<size_t>(
        kMinRings, 21 * static_cast<size_t>(std::abs(phi_end - phi_start)));

    for (size_t k = 0; k < num_rings; ++k) {
        const double phi = phi_start + (phi_end - phi_start) *
                           static_cast<double>(k) / static_cast<double>(num_rings - 1);
        const double z = radius * std::sin(phi);

        Row ring;
        if (std::abs(std::abs(z) - radius) < 1e-6) {
            ring.emplace_back(next_id++, 0.0, 0.0, z);
        } else {
            const double cos_phi = std::cos(phi);
            const size_t count = std::max<size_t>(
                kMinRingPoints, static_cast<size_t>(kEquatorRingPoints * cos_phi));
            for (size_t i = 0; i < count; ++i) {
                const double theta = -M_PI + 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(count);
                ring.emplace_back(next_id++,
                                  radius * std::cos(theta) * cos_phi,
                                  radius * std::sin(theta) * cos_phi,
                                  z);
            }
        }
        patch.rows.push_back(std::move(ring));
    }

    patch.next_id = next_id;
    logger_.detailed("Generated " + patch.name + " with " + std::to_string(patch.rows.size()) +
                     " rings, " + std::to_string(patch.point_count()) + " points");
    return patch;
}

LogoGenerator::LogoGenerator(double relief)
    : relief_(relief), logger_("LogoGenerator") {
}

Patch LogoGenerator::logo(const HeightGrid& image, double phi_max, double protrusion,
                          PointId start_id) const {
    if (image.empty()) {
        throw std::invalid_argument("Logo image is empty");
    }
    if (image.width != image.height) {
        logger_.warning("Logo image is not square (" + std::to_string(image.width) + "x" +
                        std::to_string(image.height) + "), it will be clipped to its inscribed circle");
    }

    const double sign = phi_max >= 0 ? 1.0 : -1.0;
    const double nx_2 = static_cast<double>(image.width) / 2.0;
    const double ny_2 = static_cast<double>(image.height) / 2.0;
    const double half_extent = std::max(nx_2, ny_2);
    const double polar_span = M_PI / 2.0 - std::abs(phi_max);

    const double hmax = *std::max_element(image.values.begin(), image.values.end());
    const double height_factor = hmax > 0 ? (protrusion - 1.0) * relief_ / hmax : 0.0;

    Patch patch(sign > 0 ? "north-logo" : "south-logo", start_id);
    PointId next_id = start_id;
    size_t dropped_rows = 0;

    for (size_t j = 0; j < image.height; ++j) {
        Row row;
        for (size_t i = 0; i < image.width; ++i) {
            const double dx = static_cast<double>(i) - nx_2;
            const double dy = ny_2 - static_cast<double>(j);
            const double dist = std::sqrt(dx * dx + dy * dy) / half_extent;
            if (dist > 1.0) {
                continue;
            }

            const double r = protrusion + height_factor * image.at(i, j);
            const double theta = sign * std::atan2(dy, dx);
            const double phi = sign * (M_PI / 2.0 - polar_span * dist);

            SurfacePoint point(0,
                               r * std::cos(theta) * std::cos(phi),
                               r * std::sin(theta) * std::cos(phi),
                               r * std::sin(phi));
            if (image.colors) {
                point.color = (*image.colors)[j * image.width + i];
            }
            row.push_back(point);
        }

        // Ids are handed out only to kept rows so the sequence stays contiguous
        if (row.size() < 2) {
            ++dropped_rows;
            continue;
        }
        for (auto& point : row) {
            point.id = next_id++;
        }
        patch.rows.push_back(std::move(row));
    }

    patch.next_id = next_id;
    logger_.detailed("Generated " + patch.name + " with " + std::to_string(patch.rows.size()) +
                     " rows (" + std::to_string(dropped_rows) + " dropped), " +
                     std::to_string(patch.point_count()) + " points");
    return patch;
}

} // namespace planet
