/**
 * @file HemisphereSplitter.cpp
 * @brief Implementation of the plane cut
 */

#include "HemisphereSplitter.hpp"
#include <algorithm>
#include <sstream>

namespace planet {

namespace {

void fan(const std::vector<Eigen::Vector3f>& polygon, std::vector<StlTriangle>& out) {
    for (size_t i = 1; i + 1 < polygon.size(); ++i) {
        out.emplace_back(polygon[0], polygon[i], polygon[i + 1]);
    }
}

} // namespace

HemisphereSplitter::HemisphereSplitter(const SplitConfig& config)
    : config_(config), logger_("HemisphereSplitter") {
}

double HemisphereSplitter::mean_z(const std::vector<StlTriangle>& triangles) {
    if (triangles.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& triangle : triangles) {
        for (const auto& vertex : triangle.vertices) {
            sum += vertex.z();
        }
    }
    return sum / (3.0 * static_cast<double>(triangles.size()));
}

void HemisphereSplitter::cut_triangle(const StlTriangle& triangle, double zcut,
                                      std::vector<StlTriangle>& north,
                                      std::vector<StlTriangle>& south) {
    std::vector<Eigen::Vector3f> upper;
    std::vector<Eigen::Vector3f> lower;

    for (int i = 0; i < 3; ++i) {
        const Eigen::Vector3f& p = triangle.vertices[i];
        const Eigen::Vector3f& q = triangle.vertices[(i + 1) % 3];
        const double dp = p.z() - zcut;
        const double dq = q.z() - zcut;

        if (dp >= 0) upper.push_back(p);
        if (dp <= 0) lower.push_back(p);

        if ((dp < 0 && dq > 0) || (dp > 0 && dq < 0)) {
            const Eigen::Vector3d pd = p.cast<double>();
            const Eigen::Vector3d qd = q.cast<double>();
            const Eigen::Vector3d m = pd + ((zcut - pd.z()) / (qd.z() - pd.z())) * (qd - pd);
            Eigen::Vector3f crossing = m.cast<float>();
            crossing.z() = static_cast<float>(zcut);
            upper.push_back(crossing);
            lower.push_back(crossing);
        }
    }

    fan(upper, north);
    fan(lower, south);
}

SplitResult HemisphereSplitter::split(const std::vector<StlTriangle>& triangles) const {
    SplitResult result;

    if (config_.mode == SplitConfig::Mode::COUNT) {
        const size_t boundary = std::min(config_.count, triangles.size());
        result.north.assign(triangles.begin(), triangles.begin() + static_cast<std::ptrdiff_t>(boundary));
        result.south.assign(triangles.begin() + static_cast<std::ptrdiff_t>(boundary), triangles.end());
        logger_.info("Split by count: " + std::to_string(result.north.size()) + " / " +
                     std::to_string(result.south.size()) + " triangles");
        return result;
    }

    // Vertices are float32, so the plane is snapped to float as well
    const float zcut_f = static_cast<float>(config_.zcut.value_or(mean_z(triangles)));
    result.zcut = static_cast<double>(zcut_f);
    {
        std::ostringstream oss;
        oss << "Cutting " << triangles.size() << " triangles at z = " << result.zcut
            << (config_.zcut ? "" : " (mean z)");
        logger_.info(oss.str());
    }

    for (const auto& triangle : triangles) {
        float zmin = triangle.vertices[0].z();
        float zmax = zmin;
        for (const auto& vertex : triangle.vertices) {
            zmin = std::min(zmin, vertex.z());
            zmax = std::max(zmax, vertex.z());
        }

        if (zmin >= zcut_f) {
            result.north.push_back(triangle);
        } else if (zmax <= zcut_f) {
            result.south.push_back(triangle);
        } else {
            result.straddling++;
            if (config_.discard_border) {
                result.discarded.push_back(triangle);
            } else {
                cut_triangle(triangle, result.zcut, result.north, result.south);
            }
        }
    }

    logger_.info("North: " + std::to_string(result.north.size()) + " triangles, south: " +
                 std::to_string(result.south.size()) + ", straddling: " +
                 std::to_string(result.straddling));
    return result;
}

} // namespace planet
