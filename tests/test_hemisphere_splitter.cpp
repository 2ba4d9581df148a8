/**
 * @file test_hemisphere_splitter.cpp
 * @brief Tests for the STL plane cut and binary STL I/O
 */

#include "core/HemisphereSplitter.hpp"
#include "export/StlFile.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace planet;
namespace fs = std::filesystem;

namespace {

std::vector<StlTriangle> octahedron() {
    const Eigen::Vector3f top(0, 0, 1), bottom(0, 0, -1);
    const std::array<Eigen::Vector3f, 4> equator = {
        Eigen::Vector3f(1, 0, 0), Eigen::Vector3f(0, 1, 0),
        Eigen::Vector3f(-1, 0, 0), Eigen::Vector3f(0, -1, 0)};

    std::vector<StlTriangle> triangles;
    for (size_t i = 0; i < 4; ++i) {
        triangles.emplace_back(top, equator[i], equator[(i + 1) % 4]);
    }
    for (size_t i = 0; i < 4; ++i) {
        triangles.emplace_back(bottom, equator[(i + 1) % 4], equator[i]);
    }
    return triangles;
}

Eigen::Vector3f normal_of(const StlTriangle& t) {
    return (t.vertices[1] - t.vertices[0]).cross(t.vertices[2] - t.vertices[0]);
}

double area_of(const std::vector<StlTriangle>& triangles) {
    double area = 0.0;
    for (const auto& t : triangles) {
        area += 0.5 * static_cast<double>(normal_of(t).norm());
    }
    return area;
}

} // namespace

TEST(HemisphereSplitterTest, OctahedronSplitsAtEquator) {
    SplitConfig config;
    config.zcut = 0.0;
    SplitResult result = HemisphereSplitter(config).split(octahedron());

    EXPECT_EQ(result.north.size(), 4u);
    EXPECT_EQ(result.south.size(), 4u);
    EXPECT_EQ(result.straddling, 0u);
    EXPECT_TRUE(result.discarded.empty());
}

TEST(HemisphereSplitterTest, HalvesLieOnTheirSide) {
    for (double zcut : {0.3, -0.45, 0.9}) {
        SplitConfig config;
        config.zcut = zcut;
        SplitResult result = HemisphereSplitter(config).split(octahedron());
        const float plane = static_cast<float>(zcut);

        for (const auto& t : result.north) {
            for (const auto& v : t.vertices) EXPECT_GE(v.z(), plane);
        }
        for (const auto& t : result.south) {
            for (const auto& v : t.vertices) EXPECT_LE(v.z(), plane);
        }
        EXPECT_NEAR(area_of(result.north) + area_of(result.south), area_of(octahedron()), 1e-5);
        EXPECT_EQ(result.straddling, 4u);
    }
}

TEST(HemisphereSplitterTest, CutKeepsWinding) {
    StlTriangle triangle(Eigen::Vector3f(0, 0, 1), Eigen::Vector3f(1, 0, -1), Eigen::Vector3f(0, 1, -1));
    std::vector<StlTriangle> north, south;
    HemisphereSplitter::cut_triangle(triangle, 0.0, north, south);

    ASSERT_EQ(north.size(), 1u);
    ASSERT_EQ(south.size(), 2u);
    const Eigen::Vector3f reference = normal_of(triangle);
    for (const auto& piece : north) EXPECT_GT(normal_of(piece).dot(reference), 0.0f);
    for (const auto& piece : south) EXPECT_GT(normal_of(piece).dot(reference), 0.0f);

    EXPECT_TRUE(north[0].vertices[1].isApprox(Eigen::Vector3f(0.5f, 0, 0)));
    EXPECT_FLOAT_EQ(north[0].vertices[2].z(), 0.0f);
}

TEST(HemisphereSplitterTest, VertexOnPlaneBelongsToBothSides) {
    StlTriangle triangle(Eigen::Vector3f(0, 0, 1), Eigen::Vector3f(1, 0, 0), Eigen::Vector3f(0, 1, -1));
    std::vector<StlTriangle> north, south;
    HemisphereSplitter::cut_triangle(triangle, 0.0, north, south);

    ASSERT_EQ(north.size(), 1u);
    ASSERT_EQ(south.size(), 1u);
    EXPECT_TRUE(north[0].vertices[1].isApprox(Eigen::Vector3f(1, 0, 0)));
    EXPECT_TRUE(south[0].vertices[0].isApprox(Eigen::Vector3f(1, 0, 0)));
}

TEST(HemisphereSplitterTest, DefaultPlaneIsMeanZ) {
    auto triangles = octahedron();
    for (auto& t : triangles) {
        for (auto& v : t.vertices) v.z() += 2.0f;
    }
    EXPECT_NEAR(HemisphereSplitter::mean_z(triangles), 2.0, 1e-9);
    EXPECT_EQ(HemisphereSplitter::mean_z({}), 0.0);

    SplitResult result = HemisphereSplitter(SplitConfig()).split(triangles);
    EXPECT_NEAR(result.zcut, 2.0, 1e-6);
    EXPECT_EQ(result.north.size(), 4u);
    EXPECT_EQ(result.south.size(), 4u);
}

TEST(HemisphereSplitterTest, DiscardBorderSetsStraddlersAside) {
    SplitConfig config;
    config.zcut = 0.5;
    config.discard_border = true;
    SplitResult result = HemisphereSplitter(config).split(octahedron());

    EXPECT_EQ(result.discarded.size(), 4u);
    EXPECT_EQ(result.straddling, 4u);
    EXPECT_TRUE(result.north.empty());
    EXPECT_EQ(result.south.size(), 4u);
}

TEST(HemisphereSplitterTest, CountModeSplitsByPosition) {
    SplitConfig config;
    config.mode = SplitConfig::Mode::COUNT;
    config.count = 3;
    SplitResult result = HemisphereSplitter(config).split(octahedron());
    EXPECT_EQ(result.north.size(), 3u);
    EXPECT_EQ(result.south.size(), 5u);

    config.count = 100;
    result = HemisphereSplitter(config).split(octahedron());
    EXPECT_EQ(result.north.size(), 8u);
    EXPECT_TRUE(result.south.empty());
}

class StlFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("planet_stl_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".stl");
        ASSERT_TRUE(write_binary_stl(path_.string(), octahedron()));
    }

    void TearDown() override {
        fs::remove(path_);
    }

    fs::path path_;
};

TEST_F(StlFileTest, RoundTripsTriangles) {
    EXPECT_EQ(fs::file_size(path_), 84u + 8u * 50u);
    auto info = inspect_stl_header(path_.string());
    EXPECT_EQ(info.declared_count, 8u);
    EXPECT_TRUE(info.consistent);

    auto triangles = read_binary_stl(path_.string());
    ASSERT_EQ(triangles.size(), 8u);
    EXPECT_TRUE(triangles[5].vertices[0].isApprox(Eigen::Vector3f(0, 0, -1)));
}

TEST_F(StlFileTest, InconsistentHeaderNeedsForce) {
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        out << "trailing bytes";
    }
    EXPECT_FALSE(inspect_stl_header(path_.string()).consistent);
    EXPECT_THROW(read_binary_stl(path_.string()), StlFormatError);

    auto triangles = read_binary_stl(path_.string(), true);
    EXPECT_EQ(triangles.size(), 8u);
}

TEST_F(StlFileTest, TruncatedRecordFails) {
    fs::resize_file(path_, 84u + 7u * 50u + 20u);
    EXPECT_THROW(read_binary_stl(path_.string()), StlFormatError);
    EXPECT_THROW(read_binary_stl(path_.string(), true), StlFormatError);
}

TEST(StlFileErrors, MissingFileThrows) {
    EXPECT_THROW(read_binary_stl("/nonexistent/planet.stl"), std::runtime_error);
}
