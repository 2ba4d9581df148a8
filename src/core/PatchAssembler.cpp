/**
 * @file PatchAssembler.cpp
 * @brief Implementation of patch assembly and stitching
 */

#include "PatchAssembler.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace planet {

Row extract_boundary(const Patch& patch, BoundaryMode mode,
                     std::optional<size_t> sample_row, double tolerance) {
    Row boundary;
    if (patch.rows.empty()) {
        return boundary;
    }

    double min_r2 = std::numeric_limits<double>::max();
    double max_r2 = std::numeric_limits<double>::lowest();
    for (const auto& row : patch.rows) {
        for (const auto& point : row) {
            min_r2 = std::min(min_r2, point.planar_radius_squared());
            max_r2 = std::max(max_r2, point.planar_radius_squared());
        }
    }

    double threshold = 0.0;
    if (mode == BoundaryMode::ABOVE_SAMPLE_MEAN) {
        size_t index = sample_row.value_or(patch.rows.size() > 1 ? 1 : 0);
        if (index >= patch.rows.size()) {
            throw std::out_of_range("Sample row " + std::to_string(index) + " beyond patch " + patch.name);
        }
        const Row& sample = patch.rows[index];
        double sum = 0.0;
        for (const auto& point : sample) {
            sum += point.planar_radius_squared();
        }
        threshold = sample.empty() ? 0.0 : sum / static_cast<double>(sample.size());
    }

    for (const auto& row : patch.rows) {
        for (const auto& point : row) {
            const double r2 = point.planar_radius_squared();
            bool keep = false;
            switch (mode) {
                case BoundaryMode::LARGEST:
                    keep = r2 >= max_r2 - tolerance * std::max(1.0, max_r2);
                    break;
                case BoundaryMode::SMALLEST:
                    keep = r2 <= min_r2 + tolerance * std::max(1.0, max_r2);
                    break;
                case BoundaryMode::ABOVE_SAMPLE_MEAN:
                    keep = r2 > threshold;
                    break;
            }
            if (keep) {
                boundary.push_back(point);
            }
        }
    }

    std::stable_sort(boundary.begin(), boundary.end(),
                     [](const SurfacePoint& a, const SurfacePoint& b) {
                         return a.azimuth() < b.azimuth();
                     });
    return boundary;
}

void renumber(Patch& patch, PointId first_id) {
    for (auto& row : patch.rows) {
        for (auto& point : row) {
            point.id = point.id - patch.first_id + first_id;
        }
    }
    patch.next_id = patch.next_id - patch.first_id + first_id;
    patch.first_id = first_id;
}

bool is_pole_row(const Row& row) {
    return row.size() == 1 && row.front().planar_radius_squared() < 1e-18;
}

void invert_faces(std::vector<Face>& faces) {
    for (auto& face : faces) {
        std::swap(face.ids[1], face.ids[2]);
    }
}

PatchAssembler::PatchAssembler()
    : next_id_(0), logger_("PatchAssembler") {
}

const Patch& PatchAssembler::add_patch(Patch patch, bool close_figure) {
    if (patch.first_id != next_id_) {
        throw std::logic_error("Patch " + patch.name + " starts at id " + std::to_string(patch.first_id) +
                               ", expected " + std::to_string(next_id_));
    }
    if (patch.next_id < patch.first_id) {
        throw std::logic_error("Patch " + patch.name + " has a negative id range");
    }

    std::vector<Face> band_faces = triangulator_.triangulate_patch(patch, close_figure);
    if (patch.reversed) {
        invert_faces(band_faces);
    }
    faces_.insert(faces_.end(), band_faces.begin(), band_faces.end());

    next_id_ = patch.next_id;
    logger_.detailed("Added " + patch.name + ": " + std::to_string(patch.point_count()) + " points, " +
                     std::to_string(band_faces.size()) + " faces");
    patches_.push_back(std::move(patch));
    return patches_.back();
}

void PatchAssembler::stitch(const Row& upper, const Row& lower, bool close_figure) {
    size_t before = faces_.size();
    triangulator_.triangulate(upper, lower, close_figure, faces_);
    logger_.detailed("Stitched seam (" + std::to_string(upper.size()) + " / " +
                     std::to_string(lower.size()) + " points): " +
                     std::to_string(faces_.size() - before) + " faces");
}

SphereMesh PatchAssembler::build_mesh(bool invert, bool with_faces) const {
    SphereMesh mesh;
    for (const auto& patch : patches_) {
        for (const auto& row : patch.rows) {
            for (const auto& point : row) {
                mesh.add_point(point);
            }
            mesh.close_row(row.size());
        }
    }

    if (mesh.num_points() != next_id_) {
        throw std::logic_error("Patches produced " + std::to_string(mesh.num_points()) +
                               " points but ids reached " + std::to_string(next_id_));
    }

    if (with_faces) {
        for (const auto& face : faces_) {
            mesh.add_face(face);
        }
        if (invert) {
            mesh.invert_faces();
        }
    }
    return mesh;
}

} // namespace planet
