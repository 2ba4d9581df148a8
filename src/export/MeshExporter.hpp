/**
 * @file MeshExporter.hpp
 * @brief Mesh serialization to PLY, binary STL and the ASC point format
 *
 * All writers emit points in id order, so a point's position in the
 * vertex list equals its id.
 */

#pragma once

#include "../core/SphereMesh.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>

namespace planet {

/**
 * @brief Stanford PLY writer (ascii or binary little endian)
 */
class PLYExporter {
public:
    struct Options {
        bool binary = true;
        bool invert = false;
        bool include_colors = true;  ///< Only used when the mesh carries colors
    };

    PLYExporter();
    explicit PLYExporter(const Options& options);

    /**
     * @throws std::out_of_range when a face references an unknown id
     */
    bool export_mesh(const SphereMesh& mesh, const std::string& filename) const;

private:
    Options options_;
    Logger logger_;
};

/**
 * @brief Binary STL writer with zero normals and an empty header
 */
class STLExporter {
public:
    struct Options {
        bool invert = false;
    };

    STLExporter();
    explicit STLExporter(const Options& options);

    /**
     * @throws std::out_of_range when a face references an unknown id
     */
    bool export_mesh(const SphereMesh& mesh, const std::string& filename) const;

private:
    Options options_;
    Logger logger_;
};

/**
 * @brief Text point list, one "id x y z" line per point, a blank line after each row
 */
class ASCExporter {
public:
    ASCExporter();

    bool export_mesh(const SphereMesh& mesh, const std::string& filename) const;

private:
    Logger logger_;
};

/**
 * @brief Writes one mesh to every requested format
 */
class MultiFormatExporter {
public:
    struct GlobalOptions {
        std::string output_directory = ".";
        std::string base_filename = "planet";
        bool overwrite = false;
        bool invert = false;
        bool binary_ply = true;
    };

    explicit MultiFormatExporter(const GlobalOptions& opts);

    static bool is_supported_format(const std::string& format);

    /**
     * @brief Path the given format is written to
     */
    std::string output_path(const std::string& format) const;

    /**
     * @return true if every format was written
     */
    bool export_all_formats(const SphereMesh& mesh, const std::vector<std::string>& formats);

    const std::vector<std::string>& written_files() const { return written_files_; }

private:
    GlobalOptions global_options_;
    std::vector<std::string> written_files_;
    Logger logger_;
};

} // namespace planet
