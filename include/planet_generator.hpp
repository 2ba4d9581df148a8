#pragma once

/**
 * @file planet_generator.hpp
 * @brief Main header for the planet mesh generator
 *
 * Converts a projected raster map of a planet or moon into a closed,
 * printable triangle mesh of the sphere-like body, and splits finished
 * meshes into hemispheres.
 */

#include <memory>
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <utility>

namespace planet {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D point with x, y, z coordinates
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
};

/**
 * @brief 3D vector for normals and directions
 */
struct Vector3D {
    double x_, y_, z_;

    Vector3D() : x_(0), y_(0), z_(1) {}
    Vector3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}
    Vector3D(const Point3D& from, const Point3D& to)
        : x_(to.x() - from.x()), y_(to.y() - from.y()), z_(to.z() - from.z()) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    Vector3D operator+(const Vector3D& other) const {
        return Vector3D(x_ + other.x_, y_ + other.y_, z_ + other.z_);
    }

    Vector3D operator-(const Vector3D& other) const {
        return Vector3D(x_ - other.x_, y_ - other.y_, z_ - other.z_);
    }

    Vector3D operator*(double scalar) const {
        return Vector3D(x_ * scalar, y_ * scalar, z_ * scalar);
    }

    double dot(const Vector3D& other) const {
        return x_ * other.x_ + y_ * other.y_ + z_ * other.z_;
    }

    Vector3D cross(const Vector3D& other) const {
        return Vector3D(
            y_ * other.z_ - z_ * other.y_,
            z_ * other.x_ - x_ * other.z_,
            x_ * other.y_ - y_ * other.x_
        );
    }

    double length() const {
        return std::sqrt(x_ * x_ + y_ * y_ + z_ * z_);
    }

    Vector3D normalized() const {
        double len = length();
        return len > 0 ? Vector3D(x_ / len, y_ / len, z_ / len) : Vector3D(0, 0, 1);
    }
};

/**
 * @brief Unique identifiers for mesh components
 *
 * Point ids are assigned once, in pipeline order, and double as the
 * vertex index in index-based output formats.
 */
using PointId = std::uint32_t;
using FaceId = std::uint32_t;
using EdgeId = std::uint64_t; // Combined point ids

using RGBA = std::array<std::uint8_t, 4>;

/**
 * @brief A sampled point on the body's surface
 */
struct SurfacePoint {
    PointId id = 0;
    double x = 0.0, y = 0.0, z = 0.0;
    std::optional<RGBA> color;

    SurfacePoint() = default;
    SurfacePoint(PointId point_id, double px, double py, double pz)
        : id(point_id), x(px), y(py), z(pz) {}

    double radius() const { return std::sqrt(x * x + y * y + z * z); }
    double planar_radius_squared() const { return x * x + y * y; }
    double azimuth() const { return std::atan2(y, x); }

    Point3D position() const { return Point3D(x, y, z); }

    /**
     * @brief Same direction, unit radius (origin maps to origin)
     */
    Point3D unit() const {
        double r = radius();
        return r > 0 ? Point3D(x / r, y / r, z / r) : Point3D();
    }
};

/**
 * @brief One scan line of a patch, e.g. a latitude ring
 *
 * Order is the triangulation adjacency; closed rings wrap circularly.
 */
using Row = std::vector<SurfacePoint>;

/**
 * @brief A coherent surface region (map body, cap or logo)
 *
 * Point ids inside a patch are the contiguous range [first_id, next_id).
 */
struct Patch {
    std::string name;
    PointId first_id = 0;
    PointId next_id = 0;
    std::vector<Row> rows;
    bool reversed = false;  ///< Rows run south to north, so band faces need inverting

    Patch() = default;
    Patch(std::string patch_name, PointId start_id)
        : name(std::move(patch_name)), first_id(start_id), next_id(start_id) {}

    size_t point_count() const { return static_cast<size_t>(next_id - first_id); }
    bool empty() const { return rows.empty(); }
};

/**
 * @brief Triangle defined by three point ids, wound counter-clockwise seen from outside
 */
struct Face {
    std::array<PointId, 3> ids;

    Face() : ids{0, 0, 0} {}
    Face(PointId a, PointId b, PointId c) : ids{a, b, c} {}

    EdgeId edge(int i) const {
        return make_edge_id(ids[i], ids[(i + 1) % 3]);
    }

    bool operator==(const Face& other) const { return ids == other.ids; }

    static EdgeId make_edge_id(PointId a, PointId b) {
        if (a > b) std::swap(a, b);
        return (static_cast<EdgeId>(a) << 32) | b;
    }
};

/**
 * @brief Row-major grid of elevation (or channel) values
 *
 * Row 0 is the top (north) edge of the source image.
 */
struct HeightGrid {
    size_t width = 0;
    size_t height = 0;
    std::vector<double> values;
    std::optional<std::vector<RGBA>> colors;  ///< Same layout as values, when color is carried

    HeightGrid() = default;
    HeightGrid(size_t w, size_t h, double fill = 0.0)
        : width(w), height(h), values(w * h, fill) {}

    double at(size_t col, size_t row) const { return values[row * width + col]; }
    double& at(size_t col, size_t row) { return values[row * width + col]; }

    bool empty() const { return width == 0 || height == 0; }
};

/**
 * @brief Supported map projections of the input image
 */
enum class ProjectionKind {
    MERCATOR,
    CENTRAL_CYLINDRICAL,
    MOLLWEIDE,
    EQUIRECTANGULAR,
    SINUSOIDAL,
    HALF_SPHERE     ///< Azimuthal disc, center at the pole and rim on the equator
};

/**
 * @brief A raised great-circle band at a fixed longitude
 */
struct Meridian {
    double longitude = 0.0;  ///< radians
    double width = 0.04;     ///< radians
};

/**
 * @brief Configuration for one planet generation run
 */
struct PlanetConfig {
    // Input
    std::string input_file;
    enum class Channel { VALUE, AVERAGE, RED, GREEN, BLUE, HUE, SATURATION, COLOR };
    Channel channel = Channel::VALUE;
    bool invert_heights = false;
    bool ratio_check = true;           ///< Resample images whose aspect ratio does not fit the projection
    bool fill_gaps = false;            ///< Paint over near-black no-data areas before extracting heights
    bool color_vertices = false;       ///< Carry the image's RGBA into ply vertices

    // Output
    std::string output_directory = ".";
    std::optional<std::string> output_name;  ///< Base name, defaults to the input stem
    std::vector<std::string> output_formats = {"ply"};
    bool binary_ply = true;
    bool overwrite = false;

    // Sampling
    ProjectionKind projection = ProjectionKind::MERCATOR;
    size_t target_points = 0;          ///< 0 keeps every pixel
    double scale = 0.02;
    std::string caps = "auto";         ///< "auto", "none" or a polar angle in degrees
    std::vector<Meridian> meridians = {Meridian{}};
    double equator_width = 0.0;        ///< radians, 0 disables the band
    double protrusion = 1.02;
    std::optional<double> caps_height;       ///< Cap radius, defaults to protrusion * (1 + scale / 2)
    std::optional<double> meridians_height;  ///< Meridian radius on the equator, defaults to 1 + protrusion * scale
    std::optional<double> equator_height;    ///< Equator band radius, same default as meridians

    // Logos
    std::optional<std::string> logo_north;
    std::optional<std::string> logo_south;
    double logo_north_scale = 1.0;     ///< Relief of the north logo, negative engraves it
    double logo_south_scale = 1.0;

    // Triangulation
    bool invert = false;
    bool close_figure = true;

    // Config file support
    std::optional<std::string> config_file;
    bool create_config = false;
    std::string create_config_path;

    // Logging options
    int log_level = 3;
    std::optional<std::string> log_file;
};

/**
 * @brief Results from mesh validation operations
 */
struct MeshValidationResult {
    bool is_manifold = true;
    bool is_watertight = true;
    bool ids_consistent = true;
    size_t boundary_edge_count = 0;
    size_t non_manifold_edge_count = 0;
    size_t num_degenerate_faces = 0;
    size_t inward_faces = 0;

    bool is_valid() const {
        return is_manifold && ids_consistent && num_degenerate_faces == 0;
    }
};

/**
 * @brief Timings and counts for one run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds image_loading_time{0};
    std::chrono::milliseconds sampling_time{0};
    std::chrono::milliseconds triangulation_time{0};
    std::chrono::milliseconds export_time{0};
    std::chrono::milliseconds total_time{0};

    size_t points_generated = 0;
    size_t faces_generated = 0;
};

class SphereMesh;

/**
 * @brief Main interface for planet model generation
 *
 * Runs the pipeline: load image, sample map and polar patches, assemble
 * and stitch them into one mesh, validate, export.
 */
class PlanetGenerator {
public:
    explicit PlanetGenerator(const PlanetConfig& config);
    ~PlanetGenerator();

    // Main generation pipeline
    bool generate_model();

    // Individual pipeline stages
    bool load_image();
    bool generate_mesh();
    bool validate_mesh();
    bool export_models();

    /**
     * @brief Use an already decoded grid instead of reading input_file
     */
    void set_heights(HeightGrid heights);

    // Accessors
    const SphereMesh& get_mesh() const;
    const PerformanceMetrics& get_metrics() const;
    const MeshValidationResult& get_validation_result() const;
    const PlanetConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace planet
