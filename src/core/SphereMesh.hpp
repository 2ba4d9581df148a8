/**
 * @file SphereMesh.hpp
 * @brief Assembled mesh: point arena indexed by id plus face list
 *
 * Points are stored at the index equal to their id, so the arena order
 * is exactly the vertex order of index-based formats. Row lengths are
 * kept alongside to preserve the scan-line grouping for text output.
 */

#pragma once

#include "planet_generator.hpp"
#include <unordered_map>
#include <vector>

namespace planet {

/**
 * @brief Faces sharing an edge, for topology checks
 */
struct EdgeInfo {
    std::vector<FaceId> adjacent_faces;

    void add_face(FaceId face_id) { adjacent_faces.push_back(face_id); }
    bool is_boundary() const { return adjacent_faces.size() == 1; }
    bool is_manifold() const { return adjacent_faces.size() <= 2; }
};

class SphereMesh {
public:
    SphereMesh() = default;

    SphereMesh(SphereMesh&&) noexcept = default;
    SphereMesh& operator=(SphereMesh&&) noexcept = default;

    SphereMesh(const SphereMesh&) = delete;
    SphereMesh& operator=(const SphereMesh&) = delete;

    /**
     * @brief Append a point; its id must equal the current point count
     * @throws std::logic_error when ids are not contiguous
     */
    PointId add_point(const SurfacePoint& point);

    /**
     * @brief Append a face
     * @throws std::out_of_range when a face references an unknown point id
     */
    FaceId add_face(const Face& face);

    /**
     * @brief Record that the last `length` points form one row
     */
    void close_row(size_t length) { row_lengths_.push_back(length); }

    const SurfacePoint& get_point(PointId id) const;

    const std::vector<SurfacePoint>& points() const { return points_; }
    const std::vector<Face>& faces() const { return faces_; }
    const std::vector<size_t>& row_lengths() const { return row_lengths_; }

    size_t num_points() const { return points_.size(); }
    size_t num_faces() const { return faces_.size(); }

    bool has_colors() const;

    /**
     * @brief Flip every face normal by swapping the last two ids
     */
    void invert_faces();

    /**
     * @brief Outward unit normal of a face (zero vector for degenerate faces)
     */
    Vector3D face_normal(const Face& face) const;

    /**
     * @brief Check manifoldness, closure, degenerate faces and outward winding
     *
     * Winding is checked against the direction from the origin to the
     * face centroid, which holds for any star-shaped body.
     */
    MeshValidationResult validate_topology() const;

    void clear();

private:
    std::vector<SurfacePoint> points_;
    std::vector<Face> faces_;
    std::vector<size_t> row_lengths_;

    std::unordered_map<EdgeId, EdgeInfo> build_edge_registry() const;
};

} // namespace planet
