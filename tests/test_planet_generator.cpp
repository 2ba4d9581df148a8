/**
 * @file test_planet_generator.cpp
 * @brief End-to-end tests of the generation pipeline on synthetic maps
 */

#include "planet_generator.hpp"
#include "core/PatchAssembler.hpp"
#include "core/PolarPatchGenerator.hpp"
#include "core/SphereMesh.hpp"
#include "export/MeshExporter.hpp"
#include <gtest/gtest.h>
#include <gdal_priv.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

using namespace planet;
namespace fs = std::filesystem;

namespace {

// Smooth relief with one mountain range, 2:1 like a typical world map
HeightGrid synthetic_map(size_t width = 64, size_t height = 48) {
    HeightGrid grid(width, height);
    for (size_t row = 0; row < height; ++row) {
        for (size_t col = 0; col < width; ++col) {
            const double u = static_cast<double>(col) / static_cast<double>(width);
            const double v = static_cast<double>(row) / static_cast<double>(height);
            grid.at(col, row) = 100.0 * std::sin(2.0 * M_PI * u) * std::cos(M_PI * (v - 0.5)) +
                                (std::abs(u - 0.3) < 0.05 ? 250.0 : 0.0);
        }
    }
    return grid;
}

} // namespace

class PlanetGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("planet_gen_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        config_.output_directory = dir_.string();
        config_.output_name = "synthetic";
        config_.log_level = 2;
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
    PlanetConfig config_;
};

TEST_F(PlanetGeneratorTest, MercatorWithCapsIsClosed) {
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map());
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_TRUE(result.ids_consistent);
    EXPECT_TRUE(result.is_manifold);
    EXPECT_TRUE(result.is_watertight);
    EXPECT_EQ(result.num_degenerate_faces, 0u);
    EXPECT_EQ(result.inward_faces, 0u);

    const SphereMesh& mesh = generator.get_mesh();
    EXPECT_EQ(generator.get_metrics().points_generated, mesh.num_points());
    EXPECT_EQ(generator.get_metrics().faces_generated, mesh.num_faces());

    // Relief stays within scale, raised features within the protrusion
    const double feature = 1.0 + config_.protrusion * config_.scale;
    const double cap = config_.protrusion * (1.0 + config_.scale / 2.0);
    for (const auto& p : mesh.points()) {
        EXPECT_GE(p.radius(), 1.0 - config_.scale - 1e-9);
        EXPECT_LE(p.radius(), std::max(feature, cap) + 1e-9);
    }
}

TEST_F(PlanetGeneratorTest, EquirectangularAutoCapsIsClosed) {
    // The top row lies on the north pole, the bottom row stops half a pixel short of the south pole
    config_.projection = ProjectionKind::EQUIRECTANGULAR;
    config_.caps = "auto";
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map(200, 100));
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_TRUE(result.ids_consistent);
    EXPECT_TRUE(result.is_manifold);
    EXPECT_TRUE(result.is_watertight);
    EXPECT_EQ(result.boundary_edge_count, 0u);
    EXPECT_EQ(result.num_degenerate_faces, 0u);
    EXPECT_EQ(result.inward_faces, 0u);

    // Exactly one point on each pole
    size_t north = 0;
    size_t south = 0;
    for (const auto& p : generator.get_mesh().points()) {
        if (p.planar_radius_squared() < 1e-18) {
            (p.z > 0 ? north : south) += 1;
        }
    }
    EXPECT_EQ(north, 1u);
    EXPECT_EQ(south, 1u);
}

TEST_F(PlanetGeneratorTest, CentralCylindricalAutoCapsIsClosed) {
    config_.projection = ProjectionKind::CENTRAL_CYLINDRICAL;
    config_.caps = "auto";
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map(120, 60));
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_TRUE(result.is_manifold);
    EXPECT_TRUE(result.is_watertight);
    EXPECT_EQ(result.num_degenerate_faces, 0u);
    EXPECT_EQ(result.inward_faces, 0u);
}

TEST_F(PlanetGeneratorTest, CapsHeightSetsPolarRadius) {
    config_.caps_height = 1.2;
    config_.meridians_height = 1.1;
    config_.equator_height = 1.04;
    config_.equator_width = 2.0 * M_PI / 180.0;
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map());
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());
    EXPECT_TRUE(generator.get_validation_result().is_watertight);

    double highest = 0.0;
    for (const auto& p : generator.get_mesh().points()) {
        highest = std::max(highest, p.radius());
    }
    EXPECT_NEAR(highest, 1.2, 1e-9);
}

TEST_F(PlanetGeneratorTest, HalfSphereIsOpenDome) {
    config_.projection = ProjectionKind::HALF_SPHERE;
    config_.caps = "none";
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map(48, 48));
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_FALSE(result.is_watertight);
    EXPECT_GT(result.boundary_edge_count, 0u);
    for (const auto& p : generator.get_mesh().points()) {
        EXPECT_GE(p.z, 0.0);
    }
}

TEST_F(PlanetGeneratorTest, FlatMapGivesUnitSphereBody) {
    PlanetGenerator generator(config_);
    generator.set_heights(HeightGrid(40, 30, 7.0));
    ASSERT_TRUE(generator.generate_mesh());

    const double cap = config_.protrusion * (1.0 + config_.scale / 2.0);
    for (const auto& p : generator.get_mesh().points()) {
        const double r = p.radius();
        EXPECT_TRUE(std::abs(r - 1.0) < 1e-9 || std::abs(r - cap) < 1e-9) << r;
    }
}

TEST_F(PlanetGeneratorTest, OpenPolesWithoutCaps) {
    config_.caps = "none";
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map());
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_FALSE(result.is_watertight);
    EXPECT_GT(result.boundary_edge_count, 0u);
    EXPECT_TRUE(result.is_manifold);
}

TEST_F(PlanetGeneratorTest, MollweideReachesThePoles) {
    config_.projection = ProjectionKind::MOLLWEIDE;
    PlanetGenerator generator(config_);
    // floor(80 * sqrt(2) / pi) = 36 rows
    generator.set_heights(synthetic_map(80, 36));
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    double max_z = 0.0;
    for (const auto& p : generator.get_mesh().points()) {
        max_z = std::max(max_z, p.z / p.radius());
    }
    EXPECT_GT(max_z, 0.95);
}

TEST_F(PlanetGeneratorTest, FlipNormalsTurnsFacesInward) {
    config_.invert = true;
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map());
    ASSERT_TRUE(generator.generate_mesh());
    ASSERT_TRUE(generator.validate_mesh());

    const MeshValidationResult& result = generator.get_validation_result();
    EXPECT_EQ(result.inward_faces, generator.get_mesh().num_faces() - result.num_degenerate_faces);
}

TEST_F(PlanetGeneratorTest, GenerateModelWritesEveryFormat) {
    config_.output_formats = {"ply", "stl", "asc"};
    config_.target_points = 500;
    PlanetGenerator generator(config_);
    generator.set_heights(synthetic_map());
    ASSERT_TRUE(generator.generate_model());

    EXPECT_TRUE(fs::exists(dir_ / "synthetic.ply"));
    EXPECT_TRUE(fs::exists(dir_ / "synthetic.asc"));
    ASSERT_TRUE(fs::exists(dir_ / "synthetic.stl"));
    EXPECT_EQ(fs::file_size(dir_ / "synthetic.stl"),
              84u + 50u * generator.get_metrics().faces_generated);

    // A second run refuses to replace the files
    PlanetGenerator again(config_);
    again.set_heights(synthetic_map());
    EXPECT_FALSE(again.generate_model());
}

TEST_F(PlanetGeneratorTest, InvalidParametersStopBeforeLoading) {
    config_.caps = "95";
    config_.input_file = "/nonexistent/map.png";
    PlanetGenerator generator(config_);
    EXPECT_FALSE(generator.generate_model());
}

TEST_F(PlanetGeneratorTest, MissingImageFails) {
    config_.input_file = (dir_ / "missing.png").string();
    PlanetGenerator generator(config_);
    EXPECT_FALSE(generator.load_image());
    EXPECT_FALSE(generator.generate_mesh());
}

TEST_F(PlanetGeneratorTest, AscPointsAreRetriangulated) {
    PatchAssembler assembler;
    assembler.add_patch(CapGenerator().cap(1.0, 0.5, 0), true);
    const size_t expected_faces = assembler.faces().size();
    SphereMesh cloud = assembler.build_mesh(false, false);
    const fs::path asc = dir_ / "cap.asc";
    ASSERT_TRUE(ASCExporter().export_mesh(cloud, asc.string()));

    config_.input_file = asc.string();
    PlanetGenerator generator(config_);
    ASSERT_TRUE(generator.load_image());
    ASSERT_TRUE(generator.generate_mesh());
    EXPECT_EQ(generator.get_mesh().num_points(), cloud.num_points());
    EXPECT_EQ(generator.get_mesh().num_faces(), expected_faces);
}

TEST_F(PlanetGeneratorTest, NorthLogoReplacesCap) {
    // Bright ring on a dark 32x32 logo
    GDALAllRegister();
    const fs::path logo = dir_ / "logo.tif";
    {
        std::vector<std::uint8_t> pixels(32 * 32, 0);
        for (int row = 0; row < 32; ++row) {
            for (int col = 0; col < 32; ++col) {
                const double d = std::hypot(col - 15.5, row - 15.5);
                if (d > 8.0 && d < 11.0) pixels[row * 32 + col] = 255;
            }
        }
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        ASSERT_NE(driver, nullptr);
        GDALDataset* dataset = driver->Create(logo.string().c_str(), 32, 32, 1, GDT_Byte, nullptr);
        ASSERT_NE(dataset, nullptr);
        EXPECT_EQ(dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, 32, 32, pixels.data(), 32, 32,
                                                      GDT_Byte, 0, 0), CE_None);
        GDALClose(dataset);
    }

    config_.logo_north = logo.string();
    PlanetGenerator with_logo(config_);
    with_logo.set_heights(synthetic_map());
    ASSERT_TRUE(with_logo.generate_mesh());

    // The raised ring stands out above the plain disc
    const double disc = config_.protrusion * (1.0 + config_.scale / 2.0);
    size_t raised = 0;
    for (const auto& p : with_logo.get_mesh().points()) {
        if (p.z > 0 && p.radius() > disc + 1e-6) ++raised;
    }
    EXPECT_GT(raised, 0u);

    config_.logo_north = (dir_ / "missing_logo.png").string();
    PlanetGenerator missing(config_);
    missing.set_heights(synthetic_map());
    EXPECT_FALSE(missing.generate_mesh());
}
