/**
 * @file PointSampler.cpp
 * @brief Implementation of map sampling
 */

#include "PointSampler.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace planet {

namespace {

constexpr double kPoleCos = 1e-9;

} // namespace

CapPolicy CapPolicy::parse(const std::string& text) {
    CapPolicy policy;
    if (text == "auto") {
        policy.mode = Mode::AUTO;
        return policy;
    }
    if (text == "none") {
        policy.mode = Mode::NONE;
        return policy;
    }

    size_t consumed = 0;
    double degrees = 0.0;
    try {
        degrees = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("caps must be 'auto', 'none' or an angle in degrees, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("caps must be 'auto', 'none' or an angle in degrees, got '" + text + "'");
    }
    if (!(degrees > 0.0 && degrees < 90.0)) {
        throw std::invalid_argument("caps angle must be between 0 and 90 degrees, got " + text);
    }
    policy.mode = Mode::ANGLE;
    policy.degrees = degrees;
    return policy;
}

std::string CapPolicy::to_string() const {
    switch (mode) {
        case Mode::NONE: return "none";
        case Mode::AUTO: return "auto";
        case Mode::ANGLE: {
            std::ostringstream oss;
            oss << degrees;
            return oss.str();
        }
    }
    return "auto";
}

PointSampler::PointSampler(const SamplingConfig& config)
    : config_(config), logger_("PointSampler") {
}

double PointSampler::cap_angle(const Projection& projection) const {
    if (config_.caps.mode == CapPolicy::Mode::ANGLE) {
        return M_PI / 2.0 - M_PI * config_.caps.degrees / 180.0;
    }
    // NONE and AUTO both resolve to the image edge; only AUTO clips sampling to it
    return projection.edge_phi().value_or(M_PI / 2.0);
}

double PointSampler::meridian_radius(double phi, double phi_cap) const {
    const double base = config_.meridians_height.value_or(feature_radius());
    if (!config_.caps_height || phi_cap <= 0.0) {
        return base;
    }
    const double t = phi / phi_cap;
    return base + (*config_.caps_height - base) * t * t;
}

bool PointSampler::on_meridian(double theta, double min_half_width) const {
    for (const auto& meridian : config_.meridians) {
        double half_width = std::max(meridian.width / 2.0, min_half_width);
        if (std::abs(wrap_angle(theta - meridian.longitude)) <= half_width) {
            return true;
        }
    }
    return false;
}

Patch PointSampler::sample(const HeightGrid& heights, PointId start_id) const {
    if (heights.empty()) {
        throw std::invalid_argument("Cannot sample an empty height grid");
    }

    const size_t nx = heights.width;
    const size_t ny = heights.height;
    Projection projection(config_.projection, nx, ny);
    if (projection.is_azimuthal()) {
        return sample_half_sphere(heights, start_id);
    }

    const bool capped = config_.caps.mode != CapPolicy::Mode::NONE;
    const double phi_cap = cap_angle(projection);
    const auto edge = projection.edge_phi();
    if (capped && edge && phi_cap > *edge) {
        std::ostringstream oss;
        oss << "Gap between caps and the map projection (cap ends at "
            << 90.0 - phi_cap * 180.0 / M_PI << " deg from the pole, the map at "
            << 90.0 - *edge * 180.0 / M_PI << " deg). Consider a different caps value.";
        logger_.warning(oss.str());
    }

    auto [hmin_it, hmax_it] = std::minmax_element(heights.values.begin(), heights.values.end());
    const double hmin = *hmin_it;
    const double hmax = *hmax_it;
    const bool flat = (hmax - hmin) <= 1e-6;
    if (flat) {
        logger_.detailed("Height field is flat, every sample gets radius 1");
    }

    auto radius_at = [&](size_t col, size_t row) {
        if (flat) {
            return 1.0;
        }
        double normalized = (heights.at(col, row) - hmin) / (hmax - hmin);
        return 1.0 + config_.scale * (2.0 * normalized - 1.0);
    };

    const double n = std::sqrt(static_cast<double>(config_.target_points));
    const size_t stepy = (config_.target_points == 0) ? 1 :
        static_cast<size_t>(std::max(1.0, static_cast<double>(ny) / (3.0 * n)));

    Patch patch("map", start_id);
    PointId next_id = start_id;

    for (size_t j = 0; j < ny; j += stepy) {
        const double y = static_cast<double>(static_cast<long>(ny / 2) - static_cast<long>(j));
        auto phi = projection.phi_of(y);
        if (!phi || (capped && std::abs(*phi) > phi_cap)) {
            continue;
        }

        size_t stepx = 1;
        if (config_.target_points != 0) {
            double dilation = 1.0;
            if (!projection.compensates_ring_shrink()) {
                double cos_phi = std::cos(*phi);
                dilation = cos_phi > 1e-12 ? 1.0 / cos_phi : static_cast<double>(nx);
            }
            double step = std::max(1.0, static_cast<double>(nx) / n) * dilation;
            stepx = step >= static_cast<double>(nx) ? nx : std::max<size_t>(1, static_cast<size_t>(step));
        }
        const double min_half_width = 2.0 * M_PI * static_cast<double>(stepx) / static_cast<double>(nx);

        const double cos_phi = std::cos(*phi);
        const double sin_phi = std::sin(*phi);

        // A ring of coincident points would only give degenerate faces
        if (cos_phi < kPoleCos) {
            double sum = 0.0;
            for (size_t i = 0; i < nx; ++i) {
                sum += radius_at(i, j);
            }
            const double r = sum / static_cast<double>(nx);
            SurfacePoint pole(next_id++, 0.0, 0.0, *phi > 0 ? r : -r);
            if (heights.colors) {
                pole.color = (*heights.colors)[j * nx + nx / 2];
            }
            logger_.trace("Row " + std::to_string(j) + " collapsed to the pole");
            patch.rows.push_back(Row{pole});
            continue;
        }

        const bool in_equator_band = !flat && config_.equator_width > 0 &&
                                     std::abs(*phi) < config_.equator_width / 2.0;

        Row row;
        for (size_t i = 0; i < nx; i += stepx) {
            const double x = static_cast<double>(static_cast<long>(i) - static_cast<long>(nx / 2));
            auto theta = projection.theta_of(x, y);
            if (!theta) {
                continue;
            }

            double r = 0.0;
            if (in_equator_band) {
                r = equator_radius();
            } else if (!flat && on_meridian(*theta, min_half_width)) {
                r = meridian_radius(*phi, phi_cap);
            } else {
                r = radius_at(i, j);
            }

            SurfacePoint point(next_id++,
                               r * std::cos(*theta) * cos_phi,
                               r * std::sin(*theta) * cos_phi,
                               r * sin_phi);
            if (heights.colors) {
                point.color = (*heights.colors)[j * nx + i];
            }
            row.push_back(point);
        }

        if (!row.empty()) {
            logger_.trace("Row " + std::to_string(j) + ": " + std::to_string(row.size()) + " points");
            patch.rows.push_back(std::move(row));
        }
    }

    patch.next_id = next_id;
    logger_.detailed("Sampled " + std::to_string(patch.point_count()) + " points in " +
                     std::to_string(patch.rows.size()) + " rows");
    return patch;
}

Patch PointSampler::sample_half_sphere(const HeightGrid& heights, PointId start_id) const {
    const size_t nx = heights.width;
    const size_t ny = heights.height;
    Projection projection(ProjectionKind::HALF_SPHERE, nx, ny);

    auto [hmin_it, hmax_it] = std::minmax_element(heights.values.begin(), heights.values.end());
    const double hmin = *hmin_it;
    const double hmax = *hmax_it;
    const bool flat = (hmax - hmin) <= 1e-6;

    Patch patch("half-sphere", start_id);
    PointId next_id = start_id;

    for (size_t j = 0; j < ny; ++j) {
        const double y = static_cast<double>(static_cast<long>(ny / 2) - static_cast<long>(j));
        Row row;
        for (size_t i = 0; i < nx; ++i) {
            const double x = static_cast<double>(static_cast<long>(i) - static_cast<long>(nx / 2));
            auto phi = projection.phi_at(x, y);
            auto theta = projection.theta_of(x, y);
            if (!phi || !theta) {
                continue;
            }

            const double r = flat ? 1.0 :
                1.0 + config_.scale * (2.0 * (heights.at(i, j) - hmin) / (hmax - hmin) - 1.0);
            const double cos_phi = std::cos(*phi);
            SurfacePoint point(next_id++,
                               r * std::cos(*theta) * cos_phi,
                               r * std::sin(*theta) * cos_phi,
                               r * std::sin(*phi));
            if (heights.colors) {
                point.color = (*heights.colors)[j * nx + i];
            }
            row.push_back(point);
        }
        if (!row.empty()) {
            patch.rows.push_back(std::move(row));
        }
    }

    patch.next_id = next_id;
    logger_.detailed("Sampled half-sphere: " + std::to_string(patch.point_count()) + " points in " +
                     std::to_string(patch.rows.size()) + " rows");
    return patch;
}

} // namespace planet
