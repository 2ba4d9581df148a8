/**
 * @file test_mesh_exporter.cpp
 * @brief Tests for the PLY, STL and ASC writers
 */

#include "export/MeshExporter.hpp"
#include "export/StlFile.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace planet;
namespace fs = std::filesystem;

namespace {

SphereMesh tetrahedron() {
    SphereMesh mesh;
    mesh.add_point(SurfacePoint(0, 0.0, 0.0, 1.0));
    mesh.close_row(1);
    mesh.add_point(SurfacePoint(1, 1.0, 0.0, -0.5));
    mesh.add_point(SurfacePoint(2, -0.5, 0.75, -0.5));
    mesh.add_point(SurfacePoint(3, -0.5, -0.75, -0.5));
    mesh.close_row(3);
    mesh.add_face(Face(0, 1, 2));
    mesh.add_face(Face(0, 2, 3));
    mesh.add_face(Face(0, 3, 1));
    mesh.add_face(Face(1, 3, 2));
    return mesh;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

class MeshExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("planet_export_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

TEST_F(MeshExporterTest, AsciiPlyListsPointsInIdOrder) {
    SphereMesh mesh = tetrahedron();
    PLYExporter::Options options;
    options.binary = false;
    const fs::path path = dir_ / "tetra.ply";
    ASSERT_TRUE(PLYExporter(options).export_mesh(mesh, path.string()));

    auto lines = read_lines(path);
    auto end = std::find(lines.begin(), lines.end(), "end_header");
    ASSERT_NE(end, lines.end());
    EXPECT_NE(std::find(lines.begin(), end, "element vertex 4"), end);
    EXPECT_NE(std::find(lines.begin(), end, "element face 4"), end);
    EXPECT_EQ(std::find(lines.begin(), end, "property uchar red"), end);

    std::vector<std::string> body(end + 1, lines.end());
    ASSERT_EQ(body.size(), 8u);
    for (size_t i = 0; i < 4; ++i) {
        std::istringstream row(body[i]);
        double x, y, z;
        row >> x >> y >> z;
        const auto& p = mesh.get_point(static_cast<PointId>(i));
        EXPECT_NEAR(x, p.x, 1e-6);
        EXPECT_NEAR(y, p.y, 1e-6);
        EXPECT_NEAR(z, p.z, 1e-6);
    }
    EXPECT_EQ(body[4], "3 0 1 2");
    EXPECT_EQ(body[7], "3 1 3 2");
}

TEST_F(MeshExporterTest, PlyInvertSwapsWinding) {
    SphereMesh mesh = tetrahedron();
    PLYExporter::Options options;
    options.binary = false;
    options.invert = true;
    const fs::path path = dir_ / "inverted.ply";
    ASSERT_TRUE(PLYExporter(options).export_mesh(mesh, path.string()));

    auto lines = read_lines(path);
    EXPECT_EQ(lines[lines.size() - 4], "3 0 2 1");
}

TEST_F(MeshExporterTest, PlyCarriesColors) {
    SphereMesh mesh;
    SurfacePoint p(0, 1.0, 0.0, 0.0);
    p.color = RGBA{10, 20, 30, 255};
    mesh.add_point(p);
    mesh.add_point(SurfacePoint(1, 0.0, 1.0, 0.0));

    PLYExporter::Options options;
    options.binary = false;
    const fs::path path = dir_ / "colors.ply";
    ASSERT_TRUE(PLYExporter(options).export_mesh(mesh, path.string()));

    auto lines = read_lines(path);
    EXPECT_NE(std::find(lines.begin(), lines.end(), "property uchar alpha"), lines.end());
    EXPECT_EQ(lines[lines.size() - 2], "1 0 0 10 20 30 255");
    // Points without a color fall back to opaque white
    EXPECT_EQ(lines.back(), "0 1 0 255 255 255 255");
}

TEST_F(MeshExporterTest, BinaryPlyHeaderAndSize) {
    SphereMesh mesh = tetrahedron();
    const fs::path path = dir_ / "tetra_bin.ply";
    ASSERT_TRUE(PLYExporter().export_mesh(mesh, path.string()));

    std::ifstream in(path, std::ios::binary);
    std::string line;
    size_t header_bytes = 0;
    bool binary = false;
    while (std::getline(in, line)) {
        header_bytes += line.size() + 1;
        if (line == "format binary_little_endian 1.0") binary = true;
        if (line == "end_header") break;
    }
    EXPECT_TRUE(binary);
    // 12 bytes per vertex, 13 bytes per face
    EXPECT_EQ(fs::file_size(path), header_bytes + 4 * 12 + 4 * 13);
}

TEST_F(MeshExporterTest, BinaryPlyVerticesReadBack) {
    SphereMesh mesh = tetrahedron();
    const fs::path path = dir_ / "tetra_back.ply";
    ASSERT_TRUE(PLYExporter().export_mesh(mesh, path.string()));

    std::ifstream in(path, std::ios::binary);
    std::string line;
    while (std::getline(in, line) && line != "end_header") {
    }
    ASSERT_EQ(line, "end_header");

    for (PointId id = 0; id < 4; ++id) {
        float xyz[3];
        ASSERT_TRUE(in.read(reinterpret_cast<char*>(xyz), sizeof(xyz)));
        const auto& p = mesh.get_point(id);
        EXPECT_FLOAT_EQ(xyz[0], static_cast<float>(p.x));
        EXPECT_FLOAT_EQ(xyz[1], static_cast<float>(p.y));
        EXPECT_FLOAT_EQ(xyz[2], static_cast<float>(p.z));
    }

    // First face: count byte then three int32 ids
    std::uint8_t count = 0;
    std::int32_t ids[3];
    ASSERT_TRUE(in.read(reinterpret_cast<char*>(&count), 1));
    ASSERT_TRUE(in.read(reinterpret_cast<char*>(ids), sizeof(ids)));
    EXPECT_EQ(count, 3);
    EXPECT_EQ(ids[0], 0);
    EXPECT_EQ(ids[1], 1);
    EXPECT_EQ(ids[2], 2);
}

TEST_F(MeshExporterTest, StlMatchesTriangleCount) {
    SphereMesh mesh = tetrahedron();
    const fs::path path = dir_ / "tetra.stl";
    ASSERT_TRUE(STLExporter().export_mesh(mesh, path.string()));

    EXPECT_EQ(fs::file_size(path), 84u + 50u * 4u);

    auto triangles = read_binary_stl(path.string());
    ASSERT_EQ(triangles.size(), 4u);
    EXPECT_FLOAT_EQ(triangles[0].vertices[0].z(), 1.0f);
    EXPECT_FLOAT_EQ(triangles[0].vertices[1].x(), 1.0f);
    EXPECT_TRUE(triangles[0].normal.isZero());
}

TEST_F(MeshExporterTest, AscGroupsRows) {
    SphereMesh mesh = tetrahedron();
    const fs::path path = dir_ / "tetra.asc";
    ASSERT_TRUE(ASCExporter().export_mesh(mesh, path.string()));

    auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "0 0 0 1");
    EXPECT_TRUE(lines[1].empty());
    EXPECT_EQ(lines[2].substr(0, 2), "1 ");
    EXPECT_TRUE(lines[5].empty());
}

TEST_F(MeshExporterTest, MultiFormatWritesEveryFormat) {
    SphereMesh mesh = tetrahedron();
    MultiFormatExporter::GlobalOptions options;
    options.output_directory = (dir_ / "out").string();
    options.base_filename = "moon";

    MultiFormatExporter exporter(options);
    ASSERT_TRUE(exporter.export_all_formats(mesh, {"ply", "stl", "asc"}));
    EXPECT_EQ(exporter.written_files().size(), 3u);
    EXPECT_TRUE(fs::exists(dir_ / "out" / "moon.ply"));
    EXPECT_TRUE(fs::exists(dir_ / "out" / "moon.stl"));
    EXPECT_TRUE(fs::exists(dir_ / "out" / "moon.asc"));
}

TEST_F(MeshExporterTest, RefusesToOverwrite) {
    SphereMesh mesh = tetrahedron();
    MultiFormatExporter::GlobalOptions options;
    options.output_directory = dir_.string();
    options.base_filename = "moon";

    {
        std::ofstream existing(dir_ / "moon.stl");
        existing << "keep me";
    }

    MultiFormatExporter exporter(options);
    EXPECT_FALSE(exporter.export_all_formats(mesh, {"stl"}));
    EXPECT_EQ(fs::file_size(dir_ / "moon.stl"), 7u);

    options.overwrite = true;
    MultiFormatExporter overwriting(options);
    EXPECT_TRUE(overwriting.export_all_formats(mesh, {"stl"}));
    EXPECT_EQ(fs::file_size(dir_ / "moon.stl"), 84u + 50u * 4u);
}

TEST_F(MeshExporterTest, UnknownFormatFails) {
    SphereMesh mesh = tetrahedron();
    MultiFormatExporter::GlobalOptions options;
    options.output_directory = dir_.string();

    EXPECT_FALSE(MultiFormatExporter::is_supported_format("obj"));
    MultiFormatExporter exporter(options);
    EXPECT_FALSE(exporter.export_all_formats(mesh, {"obj", "ply"}));
    EXPECT_EQ(exporter.written_files().size(), 1u);
}
