/**
 * @file SphereMesh.cpp
 * @brief Implementation of the assembled mesh
 */

#include "SphereMesh.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace planet {

PointId SphereMesh::add_point(const SurfacePoint& point) {
    if (point.id != points_.size()) {
        throw std::logic_error("Point id " + std::to_string(point.id) +
                               " out of sequence, expected " + std::to_string(points_.size()));
    }
    points_.push_back(point);
    return point.id;
}

FaceId SphereMesh::add_face(const Face& face) {
    for (PointId id : face.ids) {
        if (id >= points_.size()) {
            throw std::out_of_range("Face references unknown point id " + std::to_string(id));
        }
    }
    faces_.push_back(face);
    return static_cast<FaceId>(faces_.size() - 1);
}

const SurfacePoint& SphereMesh::get_point(PointId id) const {
    if (id >= points_.size()) {
        throw std::out_of_range("Point ID " + std::to_string(id) + " out of range");
    }
    return points_[id];
}

bool SphereMesh::has_colors() const {
    return std::any_of(points_.begin(), points_.end(),
                       [](const SurfacePoint& p) { return p.color.has_value(); });
}

void SphereMesh::invert_faces() {
    for (auto& face : faces_) {
        std::swap(face.ids[1], face.ids[2]);
    }
}

Vector3D SphereMesh::face_normal(const Face& face) const {
    const Point3D a = points_[face.ids[0]].position();
    const Point3D b = points_[face.ids[1]].position();
    const Point3D c = points_[face.ids[2]].position();
    Vector3D n = Vector3D(a, b).cross(Vector3D(a, c));
    double len = n.length();
    return len > 0 ? n * (1.0 / len) : Vector3D(0, 0, 0);
}

std::unordered_map<EdgeId, EdgeInfo> SphereMesh::build_edge_registry() const {
    std::unordered_map<EdgeId, EdgeInfo> registry;
    registry.reserve(faces_.size() * 3 / 2 + 1);
    for (size_t i = 0; i < faces_.size(); ++i) {
        for (int e = 0; e < 3; ++e) {
            registry[faces_[i].edge(e)].add_face(static_cast<FaceId>(i));
        }
    }
    return registry;
}

MeshValidationResult SphereMesh::validate_topology() const {
    MeshValidationResult result;

    for (PointId id = 0; id < points_.size(); ++id) {
        if (points_[id].id != id) {
            result.ids_consistent = false;
            break;
        }
    }

    for (const auto& [edge_id, edge_info] : build_edge_registry()) {
        if (edge_info.is_boundary()) {
            result.boundary_edge_count++;
        } else if (!edge_info.is_manifold()) {
            result.non_manifold_edge_count++;
        }
    }
    result.is_manifold = result.non_manifold_edge_count == 0;
    result.is_watertight = result.boundary_edge_count == 0 && result.is_manifold;

    for (const auto& face : faces_) {
        const Point3D a = points_[face.ids[0]].position();
        const Point3D b = points_[face.ids[1]].position();
        const Point3D c = points_[face.ids[2]].position();
        Vector3D n = Vector3D(a, b).cross(Vector3D(a, c));
        if (n.length() < 1e-14) {
            result.num_degenerate_faces++;
            continue;
        }
        Vector3D centroid((a.x() + b.x() + c.x()) / 3.0,
                          (a.y() + b.y() + c.y()) / 3.0,
                          (a.z() + b.z() + c.z()) / 3.0);
        if (n.dot(centroid) < 0) {
            result.inward_faces++;
        }
    }

    return result;
}

void SphereMesh::clear() {
    points_.clear();
    faces_.clear();
    row_lengths_.clear();
}

} // namespace planet
