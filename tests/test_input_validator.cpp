/**
 * @file test_input_validator.cpp
 * @brief Tests for parameter validation before generation
 */

#include "core/InputValidator.hpp"
#include <gtest/gtest.h>

using namespace planet;

TEST(InputValidatorTest, DefaultsAreValid) {
    PlanetConfig config;
    ValidationResult result = InputValidator().validate(config);
    EXPECT_FALSE(result.has_errors());
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.format_error_message(), "");
}

TEST(InputValidatorTest, RejectsBadCaps) {
    for (const char* caps : {"90", "0", "-5", "poles", "12deg"}) {
        PlanetConfig config;
        config.caps = caps;
        ValidationResult result = InputValidator().validate(config);
        ASSERT_TRUE(result.has_errors()) << caps;
        EXPECT_EQ(result.conflicts.front().involved_params.front(), std::string("--caps ") + caps);
    }

    PlanetConfig config;
    config.caps = "12.5";
    EXPECT_FALSE(InputValidator().validate(config).has_errors());
}

TEST(InputValidatorTest, RejectsNonPositiveRadii) {
    PlanetConfig config;
    config.scale = 1.5;
    config.protrusion = 0.0;
    ValidationResult result = InputValidator().validate(config);
    ASSERT_TRUE(result.has_errors());
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].involved_params.size(), 2u);
}

TEST(InputValidatorTest, RejectsBadBandWidths) {
    PlanetConfig config;
    config.meridians = {Meridian{0.0, 0.04}, Meridian{1.0, -0.1}};
    config.equator_width = 4.0;
    ValidationResult result = InputValidator().validate(config);
    ASSERT_TRUE(result.has_errors());
    EXPECT_EQ(result.conflicts[0].involved_params.size(), 2u);
}

TEST(InputValidatorTest, RejectsUnknownFormats) {
    PlanetConfig config;
    config.output_formats = {"ply", "obj"};
    ValidationResult result = InputValidator().validate(config);
    ASSERT_TRUE(result.has_errors());
    EXPECT_EQ(result.conflicts[0].involved_params, std::vector<std::string>{"--type obj"});

    config.output_formats.clear();
    EXPECT_TRUE(InputValidator().validate(config).has_errors());
}

TEST(InputValidatorTest, ReportsEveryProblem) {
    PlanetConfig config;
    config.caps = "none please";
    config.scale = -1.0;
    config.output_formats = {"svg"};
    ValidationResult result = InputValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 3u);

    const std::string message = result.format_error_message();
    EXPECT_NE(message.find("Problem 1"), std::string::npos);
    EXPECT_NE(message.find("Problem 3"), std::string::npos);
    EXPECT_NE(message.find("Suggested solutions"), std::string::npos);
}

TEST(InputValidatorTest, HeightsMustBePositive) {
    PlanetConfig config;
    config.logo_north_scale = -0.5;
    config.caps_height = 1.2;
    config.equator_height = 1.04;
    EXPECT_FALSE(InputValidator().validate(config).has_errors());

    config.caps_height = 0.0;
    config.meridians_height = -1.0;
    ValidationResult result = InputValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].involved_params.size(), 2u);
}

TEST(InputValidatorTest, HalfSphereTakesNoCapsOrLogos) {
    PlanetConfig config;
    config.projection = ProjectionKind::HALF_SPHERE;
    config.caps = "none";
    EXPECT_FALSE(InputValidator().validate(config).has_errors());

    config.caps = "10";
    config.logo_north = "logo.png";
    ValidationResult result = InputValidator().validate(config);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].involved_params,
              (std::vector<std::string>{"--caps 10", "--logo-north logo.png"}));
}
