/**
 * @file RowTriangulator.cpp
 * @brief Implementation of the two-row triangulation
 */

#include "RowTriangulator.hpp"

namespace planet {

namespace {

double unit_distance_squared(const SurfacePoint& a, const SurfacePoint& b) {
    const Point3D ua = a.unit();
    const Point3D ub = b.unit();
    const double dx = ua.x() - ub.x();
    const double dy = ua.y() - ub.y();
    const double dz = ua.z() - ub.z();
    return dx * dx + dy * dy + dz * dz;
}

} // namespace

RowTriangulator::RowTriangulator() : logger_("RowTriangulator") {
}

std::vector<Face> RowTriangulator::triangulate(const Row& previous, const Row& current,
                                               bool close_figure) const {
    std::vector<Face> faces;
    faces.reserve(previous.size() + current.size());
    triangulate(previous, current, close_figure, faces);
    return faces;
}

void RowTriangulator::triangulate(const Row& previous, const Row& current, bool close_figure,
                                  std::vector<Face>& faces) const {
    if (previous.empty() || current.empty()) {
        logger_.debug("Skipping band with an empty row");
        return;
    }

    const size_t n = previous.size();
    const size_t m = current.size();
    size_t dog = 0;
    size_t steps = 0;

    for (size_t i = 0; i < m; ++i) {
        const SurfacePoint& human = current[i];
        double dist = unit_distance_squared(human, previous[dog]);

        // Strict inequality: ties never move the dog
        while (true) {
            const size_t dog_walking = (dog + 1) % n;
            const double dist_new = unit_distance_squared(human, previous[dog_walking]);
            if (!(dist_new < dist)) {
                break;
            }
            faces.emplace_back(human.id, previous[dog_walking].id, previous[dog].id);
            dog = dog_walking;
            dist = dist_new;
            ++steps;
        }

        if (i + 1 < m) {
            faces.emplace_back(human.id, current[i + 1].id, previous[dog].id);
        } else if (close_figure && m > 1) {
            // A single-point row has no seam of its own to close
            faces.emplace_back(human.id, current[0].id, previous[dog].id);
        }
    }

    // A dog that never moved (current row is a single point equidistant from
    // the whole previous ring) still has to go once around to fan the ring.
    if (close_figure && n > 1) {
        while (dog != 0 || steps == 0) {
            const size_t dog_walking = (dog + 1) % n;
            faces.emplace_back(current[0].id, previous[dog_walking].id, previous[dog].id);
            dog = dog_walking;
            ++steps;
        }
    }
}

std::vector<Face> RowTriangulator::triangulate_patch(const Patch& patch, bool close_figure) const {
    std::vector<Face> faces;
    for (size_t j = 1; j < patch.rows.size(); ++j) {
        triangulate(patch.rows[j - 1], patch.rows[j], close_figure, faces);
    }
    logger_.detailed("Triangulated " + patch.name + ": " + std::to_string(faces.size()) + " faces");
    return faces;
}

} // namespace planet
