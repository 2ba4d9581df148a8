/**
 * @file MeshExporter.cpp
 * @brief Implementation of the mesh writers
 */

#include "MeshExporter.hpp"
#include <bit>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace planet {

namespace {

std::array<PointId, 3> ordered_ids(const Face& face, bool invert) {
    if (invert) {
        return {face.ids[0], face.ids[2], face.ids[1]};
    }
    return face.ids;
}

// Binary PLY and STL are written as little-endian in host byte order
static_assert(std::endian::native == std::endian::little, "Binary mesh output requires a little-endian host");

template <typename T>
void write_raw(std::ostream& out, T value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

} // namespace

// ============================================================================
// PLYExporter Implementation
// ============================================================================

PLYExporter::PLYExporter() : PLYExporter(Options()) {
}

PLYExporter::PLYExporter(const Options& options)
    : options_(options), logger_("PLYExporter") {
}

bool PLYExporter::export_mesh(const SphereMesh& mesh, const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        logger_.error("Cannot open " + filename + " for writing");
        return false;
    }

    const bool colors = options_.include_colors && mesh.has_colors();

    file << "ply\n";
    file << "format " << (options_.binary ? "binary_little_endian" : "ascii") << " 1.0\n";
    file << "comment made by planet-gen\n";
    file << "element vertex " << mesh.num_points() << "\n";
    file << "property float x\n";
    file << "property float y\n";
    file << "property float z\n";
    if (colors) {
        file << "property uchar red\n";
        file << "property uchar green\n";
        file << "property uchar blue\n";
        file << "property uchar alpha\n";
    }
    file << "element face " << mesh.num_faces() << "\n";
    file << "property list uchar int vertex_index\n";
    file << "end_header\n";

    const RGBA opaque_white = {255, 255, 255, 255};

    if (options_.binary) {
        for (const auto& point : mesh.points()) {
            write_raw(file, static_cast<float>(point.x));
            write_raw(file, static_cast<float>(point.y));
            write_raw(file, static_cast<float>(point.z));
            if (colors) {
                const RGBA& c = point.color.value_or(opaque_white);
                file.write(reinterpret_cast<const char*>(c.data()), 4);
            }
        }
        for (const auto& face : mesh.faces()) {
            write_raw(file, static_cast<std::uint8_t>(3));
            for (PointId id : ordered_ids(face, options_.invert)) {
                mesh.get_point(id);  // throws on unknown ids
                write_raw(file, static_cast<std::int32_t>(id));
            }
        }
    } else {
        file << std::setprecision(9);
        for (const auto& point : mesh.points()) {
            file << static_cast<float>(point.x) << " " << static_cast<float>(point.y) << " "
                 << static_cast<float>(point.z);
            if (colors) {
                const RGBA& c = point.color.value_or(opaque_white);
                file << " " << static_cast<int>(c[0]) << " " << static_cast<int>(c[1]) << " "
                     << static_cast<int>(c[2]) << " " << static_cast<int>(c[3]);
            }
            file << "\n";
        }
        for (const auto& face : mesh.faces()) {
            auto ids = ordered_ids(face, options_.invert);
            for (PointId id : ids) {
                mesh.get_point(id);  // throws on unknown ids
            }
            file << "3 " << ids[0] << " " << ids[1] << " " << ids[2] << "\n";
        }
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(mesh.num_points()) + " vertices, " +
                 std::to_string(mesh.num_faces()) + " faces)");
    return static_cast<bool>(file);
}

// ============================================================================
// STLExporter Implementation
// ============================================================================

STLExporter::STLExporter() : STLExporter(Options()) {
}

STLExporter::STLExporter(const Options& options)
    : options_(options), logger_("STLExporter") {
}

bool STLExporter::export_mesh(const SphereMesh& mesh, const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        logger_.error("Cannot open " + filename + " for writing");
        return false;
    }

    char header[80] = {0};
    file.write(header, 80);
    write_raw(file, static_cast<std::uint32_t>(mesh.num_faces()));

    for (const auto& face : mesh.faces()) {
        float normal[3] = {0.0f, 0.0f, 0.0f};
        file.write(reinterpret_cast<const char*>(normal), 12);

        for (PointId id : ordered_ids(face, options_.invert)) {
            const SurfacePoint& point = mesh.get_point(id);
            write_raw(file, static_cast<float>(point.x));
            write_raw(file, static_cast<float>(point.y));
            write_raw(file, static_cast<float>(point.z));
        }

        write_raw(file, static_cast<std::uint16_t>(0));
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(mesh.num_faces()) + " triangles)");
    return static_cast<bool>(file);
}

// ============================================================================
// ASCExporter Implementation
// ============================================================================

ASCExporter::ASCExporter() : logger_("ASCExporter") {
}

bool ASCExporter::export_mesh(const SphereMesh& mesh, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Cannot open " + filename + " for writing");
        return false;
    }

    file << std::setprecision(9);
    const auto& points = mesh.points();
    size_t index = 0;
    for (size_t length : mesh.row_lengths()) {
        for (size_t k = 0; k < length && index < points.size(); ++k, ++index) {
            const auto& p = points[index];
            file << p.id << " " << p.x << " " << p.y << " " << p.z << "\n";
        }
        file << "\n";
    }
    // Points not covered by a recorded row form one trailing row
    if (index < points.size()) {
        for (; index < points.size(); ++index) {
            const auto& p = points[index];
            file << p.id << " " << p.x << " " << p.y << " " << p.z << "\n";
        }
        file << "\n";
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(points.size()) + " points, " +
                 std::to_string(mesh.row_lengths().size()) + " rows)");
    return static_cast<bool>(file);
}

// ============================================================================
// MultiFormatExporter Implementation
// ============================================================================

MultiFormatExporter::MultiFormatExporter(const GlobalOptions& opts)
    : global_options_(opts), logger_("MultiFormatExporter") {
}

bool MultiFormatExporter::is_supported_format(const std::string& format) {
    return format == "ply" || format == "stl" || format == "asc";
}

std::string MultiFormatExporter::output_path(const std::string& format) const {
    return (std::filesystem::path(global_options_.output_directory) /
            (global_options_.base_filename + "." + format)).string();
}

bool MultiFormatExporter::export_all_formats(const SphereMesh& mesh,
                                             const std::vector<std::string>& formats) {
    bool success = true;
    std::filesystem::create_directories(global_options_.output_directory);

    for (const auto& format : formats) {
        if (!is_supported_format(format)) {
            logger_.error("Unknown format: " + format);
            success = false;
            continue;
        }

        const std::string filename = output_path(format);
        if (std::filesystem::exists(filename) && !global_options_.overwrite) {
            logger_.error("File " + filename + " already exists (use --overwrite to replace it)");
            success = false;
            continue;
        }

        bool written = false;
        if (format == "ply") {
            PLYExporter::Options options;
            options.binary = global_options_.binary_ply;
            options.invert = global_options_.invert;
            written = PLYExporter(options).export_mesh(mesh, filename);
        } else if (format == "stl") {
            STLExporter::Options options;
            options.invert = global_options_.invert;
            written = STLExporter(options).export_mesh(mesh, filename);
        } else {
            written = ASCExporter().export_mesh(mesh, filename);
        }

        if (written) {
            written_files_.push_back(filename);
        }
        success &= written;
    }

    return success;
}

} // namespace planet
