/**
 * @file StlFile.hpp
 * @brief Binary STL triangle soup reading and writing
 *
 * Layout: 80-byte header, little-endian uint32 triangle count, then 50
 * bytes per triangle (normal, three vertices as float32 triples, uint16
 * attribute).
 */

#pragma once

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace planet {

/**
 * @brief One STL record
 */
struct StlTriangle {
    Eigen::Vector3f normal = Eigen::Vector3f::Zero();
    std::array<Eigen::Vector3f, 3> vertices;
    std::uint16_t attribute = 0;

    StlTriangle() {
        vertices.fill(Eigen::Vector3f::Zero());
    }
    StlTriangle(const Eigen::Vector3f& a, const Eigen::Vector3f& b, const Eigen::Vector3f& c)
        : vertices{a, b, c} {}
};

/**
 * @brief Raised for malformed or truncated STL input
 */
class StlFormatError : public std::runtime_error {
public:
    explicit StlFormatError(const std::string& message) : std::runtime_error(message) {}
};

constexpr size_t kStlHeaderBytes = 80;
constexpr size_t kStlRecordBytes = 50;

/**
 * @brief Read every triangle of a binary STL file
 *
 * The header's declared count must match the file size unless `force`
 * is set, in which case the declared count is trusted.
 *
 * @throws std::runtime_error when the file cannot be opened
 * @throws StlFormatError on an inconsistent header (without force) or a
 *         record cut short by end of file
 */
std::vector<StlTriangle> read_binary_stl(const std::string& filename, bool force = false);

/**
 * @brief Declared triangle count and whether it agrees with the file size
 */
struct StlHeaderInfo {
    std::uint32_t declared_count = 0;
    std::uintmax_t file_size = 0;
    bool consistent = false;
};

StlHeaderInfo inspect_stl_header(const std::string& filename);

/**
 * @brief Write triangles with an empty header
 * @return false when the file cannot be written
 */
bool write_binary_stl(const std::string& filename, const std::vector<StlTriangle>& triangles);

} // namespace planet
