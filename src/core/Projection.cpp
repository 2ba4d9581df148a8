/**
 * @file Projection.cpp
 * @brief Closed-form projection formulas
 */

#include "Projection.hpp"
#include <cmath>
#include <stdexcept>

namespace planet {

namespace {

constexpr double kPi = M_PI;
constexpr double kHalfPi = M_PI / 2.0;
constexpr double kDomainSlack = 1e-9;

bool strictly_inside_pi(double angle) {
    return angle > -kPi && angle < kPi;
}

// Solves 2a + sin(2a) = pi * sin(phi) for the mollweide auxiliary angle
double mollweide_auxiliary(double phi) {
    if (std::abs(std::abs(phi) - kHalfPi) < 1e-12) {
        return phi;
    }
    const double target = kPi * std::sin(phi);
    double a = phi;
    for (int i = 0; i < 50; ++i) {
        double f = 2.0 * a + std::sin(2.0 * a) - target;
        double df = 2.0 + 2.0 * std::cos(2.0 * a);
        if (df < 1e-15) {
            break;
        }
        double step = f / df;
        a -= step;
        if (std::abs(step) < 1e-14) {
            break;
        }
    }
    return a;
}

} // namespace

std::optional<ProjectionKind> parse_projection_kind(const std::string& name) {
    if (name == "mercator") return ProjectionKind::MERCATOR;
    if (name == "cylindrical" || name == "central-cylindrical") return ProjectionKind::CENTRAL_CYLINDRICAL;
    if (name == "mollweide") return ProjectionKind::MOLLWEIDE;
    if (name == "equirectangular") return ProjectionKind::EQUIRECTANGULAR;
    if (name == "sinusoidal") return ProjectionKind::SINUSOIDAL;
    if (name == "half-sphere") return ProjectionKind::HALF_SPHERE;
    return std::nullopt;
}

std::string projection_name(ProjectionKind kind) {
    switch (kind) {
        case ProjectionKind::MERCATOR:            return "mercator";
        case ProjectionKind::CENTRAL_CYLINDRICAL: return "central-cylindrical";
        case ProjectionKind::MOLLWEIDE:           return "mollweide";
        case ProjectionKind::EQUIRECTANGULAR:     return "equirectangular";
        case ProjectionKind::SINUSOIDAL:          return "sinusoidal";
        case ProjectionKind::HALF_SPHERE:         return "half-sphere";
    }
    throw std::invalid_argument("Unknown projection kind");
}

double wrap_angle(double angle) {
    double wrapped = std::fmod(angle + kPi, 2.0 * kPi);
    if (wrapped < 0) {
        wrapped += 2.0 * kPi;
    }
    return wrapped - kPi;
}

Projection::Projection(ProjectionKind kind, size_t width_px, size_t height_px)
    : kind_(kind), width_(width_px), height_(height_px),
      radius_(static_cast<double>(width_px) / (2.0 * kPi)) {
    if (width_px == 0 || height_px == 0) {
        throw std::invalid_argument("Projection needs a non-empty image");
    }
}

std::optional<double> Projection::theta_of(double x, double y) const {
    switch (kind_) {
        case ProjectionKind::MERCATOR:
        case ProjectionKind::CENTRAL_CYLINDRICAL:
        case ProjectionKind::EQUIRECTANGULAR:
            return x / radius_;

        case ProjectionKind::MOLLWEIDE: {
            double sin_aux = y / (radius_ * std::sqrt(2.0));
            if (!(sin_aux > -1.0 && sin_aux < 1.0)) {
                return std::nullopt;
            }
            double aux = std::asin(sin_aux);
            double theta = kPi * x / (2.0 * radius_ * std::sqrt(2.0) * std::cos(aux));
            if (!strictly_inside_pi(theta)) {
                return std::nullopt;
            }
            return theta;
        }

        case ProjectionKind::SINUSOIDAL: {
            double cos_phi = std::cos(y / radius_);
            if (std::abs(cos_phi) < 1e-12) {
                return std::nullopt;
            }
            double theta = x / (radius_ * cos_phi);
            if (!strictly_inside_pi(theta)) {
                return std::nullopt;
            }
            return theta;
        }

        case ProjectionKind::HALF_SPHERE:
            if (!phi_at(x, y)) {
                return std::nullopt;
            }
            return std::atan2(y, x);
    }
    return std::nullopt;
}

std::optional<double> Projection::phi_of(double y) const {
    switch (kind_) {
        case ProjectionKind::MERCATOR:
            return 2.0 * std::atan(std::exp(y / radius_)) - kHalfPi;

        case ProjectionKind::CENTRAL_CYLINDRICAL:
            return std::atan2(y, radius_);

        case ProjectionKind::MOLLWEIDE: {
            double sin_aux = y / (radius_ * std::sqrt(2.0));
            if (!(sin_aux > -1.0 && sin_aux < 1.0)) {
                return std::nullopt;
            }
            double aux = std::asin(sin_aux);
            double sin_phi = (2.0 * aux + std::sin(2.0 * aux)) / kPi;
            if (!(sin_phi > -1.0 && sin_phi < 1.0)) {
                return std::nullopt;
            }
            return std::asin(sin_phi);
        }

        case ProjectionKind::EQUIRECTANGULAR:
        case ProjectionKind::SINUSOIDAL: {
            double phi = y / radius_;
            if (std::abs(phi) > kHalfPi + kDomainSlack) {
                return std::nullopt;
            }
            return phi;
        }

        case ProjectionKind::HALF_SPHERE:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> Projection::phi_at(double x, double y) const {
    if (kind_ != ProjectionKind::HALF_SPHERE) {
        return phi_of(y);
    }
    // Distance from the image center falls linearly from the pole to the rim
    const double rim = static_cast<double>(width_) / 2.0;
    const double rho = std::sqrt(x * x + y * y);
    if (rho > rim) {
        return std::nullopt;
    }
    return kHalfPi * (1.0 - rho / rim);
}

std::optional<std::pair<double, double>> Projection::forward(double theta, double phi) const {
    switch (kind_) {
        case ProjectionKind::MERCATOR:
            if (std::abs(phi) >= kHalfPi) {
                return std::nullopt;
            }
            return std::make_pair(radius_ * theta,
                                  radius_ * std::log(std::tan(kPi / 4.0 + phi / 2.0)));

        case ProjectionKind::CENTRAL_CYLINDRICAL:
            if (std::abs(phi) >= kHalfPi) {
                return std::nullopt;
            }
            return std::make_pair(radius_ * theta, radius_ * std::tan(phi));

        case ProjectionKind::MOLLWEIDE: {
            double aux = mollweide_auxiliary(phi);
            double x = radius_ * 2.0 * std::sqrt(2.0) / kPi * theta * std::cos(aux);
            double y = radius_ * std::sqrt(2.0) * std::sin(aux);
            return std::make_pair(x, y);
        }

        case ProjectionKind::EQUIRECTANGULAR:
            return std::make_pair(radius_ * theta, radius_ * phi);

        case ProjectionKind::SINUSOIDAL:
            return std::make_pair(radius_ * theta * std::cos(phi), radius_ * phi);

        case ProjectionKind::HALF_SPHERE: {
            if (phi < 0.0) {
                return std::nullopt;
            }
            double rho = static_cast<double>(width_) / 2.0 * (1.0 - phi / kHalfPi);
            return std::make_pair(rho * std::cos(theta), rho * std::sin(theta));
        }
    }
    return std::nullopt;
}

std::optional<double> Projection::edge_phi() const {
    if (kind_ == ProjectionKind::HALF_SPHERE) {
        return kHalfPi;
    }
    return phi_of(static_cast<double>(height_ / 2));
}

std::optional<size_t> Projection::expected_height() const {
    switch (kind_) {
        case ProjectionKind::MOLLWEIDE:
            return static_cast<size_t>(std::floor(static_cast<double>(width_) * std::sqrt(2.0) / kPi));
        case ProjectionKind::EQUIRECTANGULAR:
        case ProjectionKind::SINUSOIDAL:
            return width_ / 2;
        case ProjectionKind::MERCATOR:
        case ProjectionKind::CENTRAL_CYLINDRICAL:
        case ProjectionKind::HALF_SPHERE:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace planet
