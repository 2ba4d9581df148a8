/**
 * @file StlFile.cpp
 * @brief Implementation of binary STL I/O
 */

#include "StlFile.hpp"
#include <bit>
#include <filesystem>
#include <fstream>

namespace planet {

namespace {

// Binary STL is little-endian; values are copied in host byte order
static_assert(std::endian::native == std::endian::little, "Binary STL I/O requires a little-endian host");

bool read_vector(std::istream& in, Eigen::Vector3f& v) {
    float xyz[3];
    if (!in.read(reinterpret_cast<char*>(xyz), sizeof(xyz))) {
        return false;
    }
    v = Eigen::Vector3f(xyz[0], xyz[1], xyz[2]);
    return true;
}

void write_vector(std::ostream& out, const Eigen::Vector3f& v) {
    float xyz[3] = {v.x(), v.y(), v.z()};
    out.write(reinterpret_cast<const char*>(xyz), sizeof(xyz));
}

} // namespace

StlHeaderInfo inspect_stl_header(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open STL file: " + filename);
    }

    StlHeaderInfo info;
    info.file_size = std::filesystem::file_size(filename);

    char header[kStlHeaderBytes];
    if (!file.read(header, kStlHeaderBytes) ||
        !file.read(reinterpret_cast<char*>(&info.declared_count), sizeof(std::uint32_t))) {
        throw StlFormatError("File too short for an STL header: " + filename);
    }

    const std::uintmax_t expected = kStlHeaderBytes + sizeof(std::uint32_t) +
                                    static_cast<std::uintmax_t>(info.declared_count) * kStlRecordBytes;
    info.consistent = expected == info.file_size;
    return info;
}

std::vector<StlTriangle> read_binary_stl(const std::string& filename, bool force) {
    StlHeaderInfo info = inspect_stl_header(filename);
    if (!info.consistent && !force) {
        throw StlFormatError("STL header declares " + std::to_string(info.declared_count) +
                             " triangles, which does not match the file size of " +
                             std::to_string(info.file_size) + " bytes");
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open STL file: " + filename);
    }
    file.seekg(static_cast<std::streamoff>(kStlHeaderBytes + sizeof(std::uint32_t)));

    std::vector<StlTriangle> triangles;
    triangles.reserve(info.declared_count);
    for (std::uint32_t i = 0; i < info.declared_count; ++i) {
        StlTriangle triangle;
        bool ok = read_vector(file, triangle.normal);
        for (auto& vertex : triangle.vertices) {
            ok = ok && read_vector(file, vertex);
        }
        ok = ok && static_cast<bool>(file.read(reinterpret_cast<char*>(&triangle.attribute),
                                               sizeof(std::uint16_t)));
        if (!ok) {
            throw StlFormatError("Unexpected end of file in triangle " + std::to_string(i) +
                                 " of " + std::to_string(info.declared_count));
        }
        triangles.push_back(triangle);
    }
    return triangles;
}

bool write_binary_stl(const std::string& filename, const std::vector<StlTriangle>& triangles) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    char header[kStlHeaderBytes] = {0};
    file.write(header, kStlHeaderBytes);

    std::uint32_t count = static_cast<std::uint32_t>(triangles.size());
    file.write(reinterpret_cast<const char*>(&count), sizeof(std::uint32_t));

    for (const auto& triangle : triangles) {
        write_vector(file, triangle.normal);
        for (const auto& vertex : triangle.vertices) {
            write_vector(file, vertex);
        }
        file.write(reinterpret_cast<const char*>(&triangle.attribute), sizeof(std::uint16_t));
    }

    return static_cast<bool>(file);
}

} // namespace planet
