/**
 * @file test_projection.cpp
 * @brief Forward/inverse consistency and domain limits of the projections
 */

#include "core/Projection.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace planet;

namespace {

const ProjectionKind kAllKinds[] = {
    ProjectionKind::MERCATOR, ProjectionKind::CENTRAL_CYLINDRICAL, ProjectionKind::MOLLWEIDE,
    ProjectionKind::EQUIRECTANGULAR, ProjectionKind::SINUSOIDAL
};

} // namespace

TEST(ProjectionTest, RadiusFollowsImageWidth) {
    Projection projection(ProjectionKind::MERCATOR, 720, 360);
    EXPECT_DOUBLE_EQ(projection.radius(), 720.0 / (2.0 * M_PI));
}

TEST(ProjectionTest, EmptyImageThrows) {
    EXPECT_THROW(Projection(ProjectionKind::MOLLWEIDE, 0, 100), std::invalid_argument);
    EXPECT_THROW(Projection(ProjectionKind::MOLLWEIDE, 100, 0), std::invalid_argument);
}

TEST(ProjectionTest, InverseUndoesForwardInsideDomain) {
    for (ProjectionKind kind : kAllKinds) {
        Projection projection(kind, 1000, 500);
        for (double theta = -3.0; theta <= 3.0; theta += 0.25) {
            for (double phi = -1.4; phi <= 1.4; phi += 0.2) {
                auto xy = projection.forward(theta, phi);
                ASSERT_TRUE(xy.has_value()) << projection_name(kind);

                auto theta_back = projection.theta_of(xy->first, xy->second);
                auto phi_back = projection.phi_of(xy->second);
                ASSERT_TRUE(theta_back.has_value()) << projection_name(kind) << " theta=" << theta;
                ASSERT_TRUE(phi_back.has_value()) << projection_name(kind) << " phi=" << phi;
                EXPECT_NEAR(*theta_back, theta, 1e-9) << projection_name(kind);
                EXPECT_NEAR(*phi_back, phi, 1e-9) << projection_name(kind);
            }
        }
    }
}

TEST(ProjectionTest, EquatorMapsToImageCenterRow) {
    for (ProjectionKind kind : kAllKinds) {
        Projection projection(kind, 800, 400);
        auto phi = projection.phi_of(0.0);
        ASSERT_TRUE(phi.has_value());
        EXPECT_NEAR(*phi, 0.0, 1e-12) << projection_name(kind);
    }
}

TEST(ProjectionTest, MollweideOutsideEllipseIsUndefined) {
    Projection projection(ProjectionKind::MOLLWEIDE, 1000, 450);
    const double r = projection.radius();
    EXPECT_FALSE(projection.phi_of(r * std::sqrt(2.0)).has_value());
    EXPECT_FALSE(projection.phi_of(-r * std::sqrt(2.0) * 1.01).has_value());
    // Right of the ellipse on the equator
    EXPECT_FALSE(projection.theta_of(2.0 * r * std::sqrt(2.0) * 1.01, 0.0).has_value());
}

TEST(ProjectionTest, SinusoidalOutsideOutlineIsUndefined) {
    Projection projection(ProjectionKind::SINUSOIDAL, 1000, 500);
    const double r = projection.radius();
    // At phi = 60 deg the row is half as wide, so 0.9 pi of equator width falls outside
    const double y = r * M_PI / 3.0;
    EXPECT_FALSE(projection.theta_of(r * 0.9 * M_PI, y).has_value());
    EXPECT_TRUE(projection.theta_of(r * 0.4 * M_PI, y).has_value());
    // cos(phi) = 0 at the pole
    EXPECT_FALSE(projection.theta_of(1.0, r * M_PI / 2.0).has_value());
}

TEST(ProjectionTest, EquirectangularBeyondPoleIsUndefined) {
    Projection projection(ProjectionKind::EQUIRECTANGULAR, 4, 4);
    EXPECT_FALSE(projection.phi_of(2.0).has_value());
    auto pole = projection.phi_of(1.0);
    ASSERT_TRUE(pole.has_value());
    EXPECT_NEAR(*pole, M_PI / 2.0, 1e-12);
}

TEST(ProjectionTest, MercatorIsSingularAtPoles) {
    Projection projection(ProjectionKind::MERCATOR, 1000, 1000);
    EXPECT_FALSE(projection.forward(0.0, M_PI / 2.0).has_value());
    auto phi = projection.phi_of(1e6);
    ASSERT_TRUE(phi.has_value());
    EXPECT_LE(*phi, M_PI / 2.0);
}

TEST(ProjectionTest, EdgePhiOfSquareMercator) {
    // A square mercator map reaches about 85 degrees
    Projection projection(ProjectionKind::MERCATOR, 1000, 1000);
    auto edge = projection.edge_phi();
    ASSERT_TRUE(edge.has_value());
    EXPECT_NEAR(*edge * 180.0 / M_PI, 85.05, 0.01);
}

TEST(ProjectionTest, ExpectedHeight) {
    EXPECT_EQ(Projection(ProjectionKind::MOLLWEIDE, 1000, 1).expected_height(), size_t(450));
    EXPECT_EQ(Projection(ProjectionKind::EQUIRECTANGULAR, 1001, 1).expected_height(), size_t(500));
    EXPECT_EQ(Projection(ProjectionKind::SINUSOIDAL, 1000, 1).expected_height(), size_t(500));
    EXPECT_FALSE(Projection(ProjectionKind::MERCATOR, 1000, 1).expected_height().has_value());
}

TEST(ProjectionTest, RingShrinkCompensation) {
    EXPECT_TRUE(Projection(ProjectionKind::MOLLWEIDE, 10, 5).compensates_ring_shrink());
    EXPECT_TRUE(Projection(ProjectionKind::SINUSOIDAL, 10, 5).compensates_ring_shrink());
    EXPECT_FALSE(Projection(ProjectionKind::MERCATOR, 10, 5).compensates_ring_shrink());
    EXPECT_FALSE(Projection(ProjectionKind::EQUIRECTANGULAR, 10, 5).compensates_ring_shrink());
}

TEST(ProjectionTest, ParseNames) {
    EXPECT_EQ(parse_projection_kind("mercator"), ProjectionKind::MERCATOR);
    EXPECT_EQ(parse_projection_kind("cylindrical"), ProjectionKind::CENTRAL_CYLINDRICAL);
    EXPECT_EQ(parse_projection_kind("central-cylindrical"), ProjectionKind::CENTRAL_CYLINDRICAL);
    EXPECT_EQ(parse_projection_kind("mollweide"), ProjectionKind::MOLLWEIDE);
    EXPECT_FALSE(parse_projection_kind("robinson").has_value());
    EXPECT_EQ(projection_name(ProjectionKind::SINUSOIDAL), "sinusoidal");
    EXPECT_EQ(parse_projection_kind("half-sphere"), ProjectionKind::HALF_SPHERE);
    EXPECT_EQ(projection_name(ProjectionKind::HALF_SPHERE), "half-sphere");
}

TEST(ProjectionTest, HalfSphereIsAzimuthal) {
    Projection projection(ProjectionKind::HALF_SPHERE, 400, 400);
    EXPECT_TRUE(projection.is_azimuthal());
    EXPECT_FALSE(Projection(ProjectionKind::MERCATOR, 400, 200).is_azimuthal());

    // Center is the pole, rim is the equator
    EXPECT_NEAR(*projection.phi_at(0.0, 0.0), M_PI / 2.0, 1e-12);
    EXPECT_NEAR(*projection.phi_at(200.0, 0.0), 0.0, 1e-12);
    EXPECT_NEAR(*projection.phi_at(0.0, -100.0), M_PI / 4.0, 1e-12);
    EXPECT_FALSE(projection.phi_at(150.0, 150.0).has_value());
    EXPECT_FALSE(projection.phi_of(0.0).has_value());

    EXPECT_NEAR(*projection.theta_of(0.0, 50.0), M_PI / 2.0, 1e-12);
    EXPECT_NEAR(*projection.theta_of(-50.0, 0.0), M_PI, 1e-12);

    auto xy = projection.forward(0.75, 0.6);
    ASSERT_TRUE(xy.has_value());
    EXPECT_NEAR(*projection.phi_at(xy->first, xy->second), 0.6, 1e-12);
    EXPECT_NEAR(*projection.theta_of(xy->first, xy->second), 0.75, 1e-12);
    EXPECT_FALSE(projection.forward(0.0, -0.1).has_value());

    EXPECT_NEAR(*projection.edge_phi(), M_PI / 2.0, 1e-12);
    EXPECT_FALSE(projection.expected_height().has_value());
}

TEST(ProjectionTest, WrapAngle) {
    EXPECT_NEAR(wrap_angle(M_PI), -M_PI, 1e-12);
    EXPECT_NEAR(wrap_angle(1.5 * M_PI), -0.5 * M_PI, 1e-12);
    EXPECT_NEAR(wrap_angle(-1.5 * M_PI), 0.5 * M_PI, 1e-12);
    EXPECT_NEAR(wrap_angle(0.25), 0.25, 1e-12);
}
