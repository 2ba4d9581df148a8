/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation for planet-gen
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "../core/PointSampler.hpp"
#include "../core/Projection.hpp"
#include "../core/RasterLoader.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <numbers>

using json = nlohmann::json;

namespace planet {

namespace {

constexpr double kDegrees = std::numbers::pi / 180.0;

std::vector<double> parse_number_list(const std::string& text) {
    std::vector<double> numbers;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (token.empty()) {
            continue;
        }
        size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument("not a number: " + token);
        }
        numbers.push_back(value);
    }
    return numbers;
}

std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        result += (i ? "," : "") + items[i];
    }
    return result;
}

} // namespace

void CommandLineInterface::add_options(SimpleCommandLineParser& parser) const {
    parser.set_usage("[OPTIONS] IMAGE");
    parser.add_example("earth.png --projection equirectangular --type ply,stl");
    parser.add_example("moon.jpg --caps 80 --logo-north logo.png --points 200000");
    parser.add_example("mars.tif --projection mollweide --meridians 0,90 --meridian-widths 2");
    parser.add_example("planet.asc --type ply    (re-triangulate a point cloud)");

    // Output options
    parser.add_option("output", "o", "Output file (default: input name with the format's extension)");
    parser.add_option("output-dir", "", "Output directory");
    parser.add_option("type", "t", "Output formats: ply,stl,asc (comma-separated)", false, "ply");
    parser.add_flag("ascii", "", "Write ply files as text instead of binary");
    parser.add_flag("overwrite", "", "Replace existing output files");

    // Image options
    parser.add_option("channel", "", "Channel holding the elevation: r,g,b,average,hue,sat,val,color", false, "val");
    parser.add_flag("invert", "", "Invert the elevations (dark is high)");
    parser.add_flag("fix-gaps", "", "Fill near-black no-data areas with nearby color");
    parser.add_flag("ratio-check", "", "Resample images whose height/width ratio does not fit the projection (default)");
    parser.add_flag("no-ratio-check", "", "Use the image as is even if its ratio does not fit the projection");
    parser.add_flag("color", "", "Store the image colors in ply vertices");

    // Sampling options
    parser.add_option("projection", "p", "Map projection: mercator,cylindrical,mollweide,equirectangular,sinusoidal,half-sphere", false, "mercator");
    parser.add_option("points", "n", "Approximate number of points to use (0 uses every pixel)", false, "0");
    parser.add_option("scale", "", "Fraction of the radius between the lowest and highest point", false, "0.02");
    parser.add_option("caps", "", "Angle in degrees reached by the polar caps, or auto, or none", false, "auto");
    parser.add_option("meridians", "", "Longitudes in degrees of raised meridians (comma-separated)", false, "0");
    parser.add_option("meridian-widths", "", "Widths in degrees of the meridians (one, or one per meridian)", false, "2.29");
    parser.add_flag("no-meridian", "", "Do not add raised meridians");
    parser.add_option("equator-width", "", "Width in degrees of a raised equator (0 disables)", false, "0");
    parser.add_option("protrusion", "", "Fraction by which meridians and caps stand out of the highest point", false, "1.02");
    parser.add_option("caps-height", "", "Radius of the caps (default: from --protrusion)");
    parser.add_option("meridians-height", "", "Radius of the meridians at the equator, rising to the caps (default: from --protrusion)");
    parser.add_option("equator-height", "", "Radius of the raised equator (default: from --protrusion)");

    // Logo options
    parser.add_option("logo-north", "", "Image with the logo for the north cap");
    parser.add_option("logo-south", "", "Image with the logo for the south cap");
    parser.add_option("logo-scale", "", "Relief of both logos relative to the protrusion", false, "1");
    parser.add_option("logo-north-scale", "", "Relief of the north logo (negative engraves it)");
    parser.add_option("logo-south-scale", "", "Relief of the south logo (negative engraves it)");

    // Triangulation options
    parser.add_flag("flip-normals", "", "Reverse the orientation of every face");
    parser.add_flag("close-figure", "", "Join the end of each ring to its start (default)");
    parser.add_flag("no-close-figure", "", "Leave a seam where each ring ends");

    // Configuration and logging
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Create default configuration file at path");
    parser.add_flag("silent", "s", "Suppress all output except errors");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE. "
                                       "Facility-specific levels: \"3,PointSampler=6\"", false, "3");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool CommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("planet-gen",
        "Convert a map of a planet or moon into a 3D model of the whole body\n"
        "\n"
        "Reads the elevation from a channel of a projected map image and writes a\n"
        "closed sphere-like mesh with polar caps, optional logos and raised meridians.");
    add_options(parser);

    config_ = PlanetConfig();
    dry_run_ = false;
    exit_code_ = 0;

    if (!parser.parse(args)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "planet-gen " << PLANET_VERSION_STRING << std::endl;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 2;
            return false;
        }
        config_.config_file = config_file.value();
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 2;
        return false;
    }
    apply_environment();

    if (config_.input_file.empty()) {
        std::cerr << "Missing input image (see --help)" << std::endl;
        exit_code_ = 2;
        return false;
    }

    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    const auto& positional = parser.get_positional();
    if (positional.size() > 1) {
        std::cerr << "Expected one input image, got " << positional.size() << std::endl;
        return false;
    }
    if (!positional.empty()) {
        config_.input_file = positional.front();
    }

    try {
        // Values given on the command line win over the config file; defaults only
        // fill in what the config file left alone.
        auto value_of = [&](const std::string& name) -> std::optional<std::string> {
            if (parser.was_given(name) || !config_.config_file) {
                return parser.get(name);
            }
            return std::nullopt;
        };

        if (parser.was_given("type")) {
            config_.output_formats = parse_formats(parser.get("type").value());
        }

        if (auto output = parser.get("output")) {
            std::filesystem::path path(output.value());
            if (path.has_parent_path()) {
                config_.output_directory = path.parent_path().string();
            }
            config_.output_name = path.stem().string();
            if (path.has_extension() && !parser.was_given("type")) {
                config_.output_formats = {path.extension().string().substr(1)};
            }
        } else if (!config_.config_file && !config_.input_file.empty()) {
            // Default to writing beside the input
            auto parent = std::filesystem::path(config_.input_file).parent_path();
            if (!parent.empty()) {
                config_.output_directory = parent.string();
            }
        }
        if (auto dir = parser.get("output-dir")) {
            config_.output_directory = dir.value();
        }

        if (auto channel = value_of("channel")) {
            auto parsed = parse_channel(channel.value());
            if (!parsed) {
                std::cerr << "Unknown channel: " << channel.value() << std::endl;
                return false;
            }
            config_.channel = *parsed;
        }

        if (auto projection = value_of("projection")) {
            auto parsed = parse_projection_kind(projection.value());
            if (!parsed) {
                std::cerr << "Unknown projection: " << projection.value() << std::endl;
                return false;
            }
            config_.projection = *parsed;
        }

        if (value_of("points")) {
            auto points = parser.get_as<long long>("points");
            if (!points || *points < 0) {
                std::cerr << "--points must be a non-negative integer" << std::endl;
                return false;
            }
            config_.target_points = static_cast<size_t>(*points);
        }

        if (value_of("scale")) {
            auto scale = parser.get_as<double>("scale");
            if (!scale) {
                std::cerr << "--scale must be a number" << std::endl;
                return false;
            }
            config_.scale = *scale;
        }

        if (auto caps = value_of("caps")) {
            config_.caps = caps.value();
        }

        if (value_of("protrusion")) {
            auto protrusion = parser.get_as<double>("protrusion");
            if (!protrusion) {
                std::cerr << "--protrusion must be a number" << std::endl;
                return false;
            }
            config_.protrusion = *protrusion;
        }

        // Optional numbers that stay unset unless given
        auto number_of = [&](const std::string& name, auto assign) {
            if (!parser.was_given(name)) {
                return true;
            }
            auto number = parser.get_as<double>(name);
            if (!number) {
                std::cerr << "--" << name << " must be a number" << std::endl;
                return false;
            }
            assign(*number);
            return true;
        };

        if (value_of("logo-scale")) {
            auto logo_scale = parser.get_as<double>("logo-scale");
            if (!logo_scale) {
                std::cerr << "--logo-scale must be a number" << std::endl;
                return false;
            }
            config_.logo_north_scale = *logo_scale;
            config_.logo_south_scale = *logo_scale;
        }

        bool numbers_ok = number_of("logo-north-scale", [&](double v) { config_.logo_north_scale = v; });
        numbers_ok = number_of("logo-south-scale", [&](double v) { config_.logo_south_scale = v; }) && numbers_ok;
        numbers_ok = number_of("caps-height", [&](double v) { config_.caps_height = v; }) && numbers_ok;
        numbers_ok = number_of("meridians-height", [&](double v) { config_.meridians_height = v; }) && numbers_ok;
        numbers_ok = number_of("equator-height", [&](double v) { config_.equator_height = v; }) && numbers_ok;
        if (!numbers_ok) {
            return false;
        }

        if (value_of("equator-width")) {
            auto width = parser.get_as<double>("equator-width");
            if (!width) {
                std::cerr << "--equator-width must be a number" << std::endl;
                return false;
            }
            config_.equator_width = *width * kDegrees;
        }

        if (parser.was_given("meridians") || parser.was_given("meridian-widths") || !config_.config_file) {
            config_.meridians = parse_meridians(parser.get("meridians").value_or("0"),
                                                parser.get("meridian-widths").value_or("2.29"));
        }
        if (parser.get_flag("no-meridian")) {
            config_.meridians.clear();
        }

        if (auto logo = parser.get("logo-north")) config_.logo_north = logo.value();
        if (auto logo = parser.get("logo-south")) config_.logo_south = logo.value();

    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return false;
    }

    if (parser.get_flag("ascii")) config_.binary_ply = false;
    if (parser.get_flag("overwrite")) config_.overwrite = true;
    if (parser.get_flag("invert")) config_.invert_heights = true;
    if (parser.get_flag("fix-gaps")) config_.fill_gaps = true;
    if (parser.get_flag("color")) config_.color_vertices = true;
    if (parser.get_flag("flip-normals")) config_.invert = true;
    parse_boolean_option(parser, "close-figure", "no-close-figure", config_.close_figure);
    parse_boolean_option(parser, "ratio-check", "no-ratio-check", config_.ratio_check);
    dry_run_ = parser.get_flag("dry-run");

    // Logging options
    if (auto log_level = parser.get("log-level")) {
        if (parser.was_given("log-level") || !config_.config_file) {
            Logger::parseLogConfig(log_level.value());
            auto level = parse_log_level(log_level.value().substr(0, log_level.value().find(',')));
            if (level) {
                config_.log_level = static_cast<int>(*level);
            }
        }
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = static_cast<int>(LogLevel::TRACE);
        Logger::setDefaultLevel(LogLevel::TRACE);
    }
    if (parser.get_flag("silent")) {
        config_.log_level = static_cast<int>(LogLevel::ERROR);
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (auto log_file = parser.get("log-file")) {
        config_.log_file = log_file.value();
    }

    return true;
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
}

void CommandLineInterface::apply_environment() {
    if (const char* level = std::getenv("PLANET_LOG_LEVEL")) {
        Logger::parseLogConfig(level);
        if (auto parsed = parse_log_level(std::string(level).substr(0, std::string(level).find(',')))) {
            config_.log_level = static_cast<int>(*parsed);
        }
    }
    if (const char* file = std::getenv("PLANET_LOG_FILE")) {
        config_.log_file = std::string(file);
    }
}

std::vector<Meridian> CommandLineInterface::parse_meridians(const std::string& longitudes,
                                                            const std::string& widths) {
    auto lons = parse_number_list(longitudes);
    auto ws = parse_number_list(widths);
    if (!lons.empty() && ws.empty()) {
        throw std::invalid_argument("meridians given without widths");
    }
    if (ws.size() != 1 && ws.size() != lons.size()) {
        throw std::invalid_argument("expected 1 or " + std::to_string(lons.size()) +
                                    " meridian widths, got " + std::to_string(ws.size()));
    }

    std::vector<Meridian> meridians;
    for (size_t i = 0; i < lons.size(); ++i) {
        Meridian meridian;
        meridian.longitude = wrap_angle(lons[i] * kDegrees);
        meridian.width = (ws.size() == 1 ? ws[0] : ws[i]) * kDegrees;
        meridians.push_back(meridian);
    }
    return meridians;
}

std::vector<std::string> CommandLineInterface::parse_formats(const std::string& formats_str) {
    std::vector<std::string> formats;
    std::istringstream iss(formats_str);
    std::string format;

    while (std::getline(iss, format, ',')) {
        format.erase(0, format.find_first_not_of(" \t"));
        format.erase(format.find_last_not_of(" \t") + 1);

        if (!format.empty()) {
            formats.push_back(format);
        }
    }

    return formats;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    json config = {
        {"output_dir", "."},
        {"type", "ply"},
        {"ascii", false},
        {"overwrite", false},
        {"channel", "val"},
        {"invert", false},
        {"fix_gaps", false},
        {"ratio_check", true},
        {"color", false},
        {"projection", "mercator"},
        {"points", 0},
        {"scale", 0.02},
        {"caps", "auto"},
        {"meridians", json::array({json{{"longitude", 0.0}, {"width", 2.29}}})},
        {"equator_width", 0.0},
        {"protrusion", 1.02},
        {"caps_height", nullptr},
        {"meridians_height", nullptr},
        {"equator_height", nullptr},
        {"logo_north", nullptr},
        {"logo_south", nullptr},
        {"logo_north_scale", 1.0},
        {"logo_south_scale", 1.0},
        {"flip_normals", false},
        {"close_figure", true},
        {"log_level", 3}
    };

    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not create config file: " << filename << std::endl;
        return false;
    }
    file << config.dump(2) << std::endl;
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        if (config.contains("input")) config_.input_file = config["input"].get<std::string>();
        if (config.contains("output_dir")) config_.output_directory = config["output_dir"].get<std::string>();
        if (config.contains("output_name") && !config["output_name"].is_null())
            config_.output_name = config["output_name"].get<std::string>();
        if (config.contains("type")) {
            if (config["type"].is_array()) {
                config_.output_formats = config["type"].get<std::vector<std::string>>();
            } else {
                config_.output_formats = parse_formats(config["type"].get<std::string>());
            }
        }
        if (config.contains("ascii")) config_.binary_ply = !config["ascii"].get<bool>();
        if (config.contains("overwrite")) config_.overwrite = config["overwrite"];

        if (config.contains("channel")) {
            auto name = config["channel"].get<std::string>();
            auto channel = parse_channel(name);
            if (!channel) {
                std::cerr << "Error: Unknown channel in config file: " << name << std::endl;
                return false;
            }
            config_.channel = *channel;
        }
        if (config.contains("invert")) config_.invert_heights = config["invert"];
        if (config.contains("fix_gaps")) config_.fill_gaps = config["fix_gaps"];
        if (config.contains("ratio_check")) config_.ratio_check = config["ratio_check"];
        if (config.contains("color")) config_.color_vertices = config["color"];

        if (config.contains("projection")) {
            auto name = config["projection"].get<std::string>();
            auto kind = parse_projection_kind(name);
            if (!kind) {
                std::cerr << "Error: Unknown projection in config file: " << name << std::endl;
                return false;
            }
            config_.projection = *kind;
        }
        if (config.contains("points") && config["points"].is_number_unsigned())
            config_.target_points = config["points"];
        if (config.contains("scale") && config["scale"].is_number())
            config_.scale = config["scale"];
        if (config.contains("caps")) {
            config_.caps = config["caps"].is_number() ?
                CapPolicy{CapPolicy::Mode::ANGLE, config["caps"].get<double>()}.to_string() :
                config["caps"].get<std::string>();
        }
        if (config.contains("meridians")) {
            config_.meridians.clear();
            for (const auto& entry : config["meridians"]) {
                Meridian meridian;
                meridian.longitude = wrap_angle(entry.value("longitude", 0.0) * kDegrees);
                meridian.width = entry.value("width", 2.29) * kDegrees;
                config_.meridians.push_back(meridian);
            }
        }
        if (config.contains("equator_width") && config["equator_width"].is_number())
            config_.equator_width = config["equator_width"].get<double>() * kDegrees;
        if (config.contains("protrusion") && config["protrusion"].is_number())
            config_.protrusion = config["protrusion"];

        if (config.contains("logo_north") && !config["logo_north"].is_null())
            config_.logo_north = config["logo_north"].get<std::string>();
        if (config.contains("logo_south") && !config["logo_south"].is_null())
            config_.logo_south = config["logo_south"].get<std::string>();
        if (config.contains("logo_scale") && config["logo_scale"].is_number()) {
            config_.logo_north_scale = config["logo_scale"];
            config_.logo_south_scale = config["logo_scale"];
        }
        if (config.contains("logo_north_scale") && config["logo_north_scale"].is_number())
            config_.logo_north_scale = config["logo_north_scale"];
        if (config.contains("logo_south_scale") && config["logo_south_scale"].is_number())
            config_.logo_south_scale = config["logo_south_scale"];

        for (auto [key, target] : {std::pair{"caps_height", &config_.caps_height},
                                   std::pair{"meridians_height", &config_.meridians_height},
                                   std::pair{"equator_height", &config_.equator_height}}) {
            if (config.contains(key) && config[key].is_number())
                *target = config[key].get<double>();
        }

        if (config.contains("flip_normals")) config_.invert = config["flip_normals"];
        if (config.contains("close_figure")) config_.close_figure = config["close_figure"];

        if (config.contains("log_level")) {
            const auto& level = config["log_level"];
            std::string text = level.is_string() ? level.get<std::string>() : std::to_string(level.get<int>());
            Logger::parseLogConfig(text);
            if (auto parsed = parse_log_level(text.substr(0, text.find(',')))) {
                config_.log_level = static_cast<int>(*parsed);
            }
        }
        if (config.contains("log_file") && !config["log_file"].is_null())
            config_.log_file = config["log_file"].get<std::string>();

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error loading config file: " << e.what() << std::endl;
        return false;
    }
}

bool CommandLineInterface::check_config() const {
    ValidationResult result = InputValidator().validate(config_);
    if (result.has_errors()) {
        std::cerr << result.format_error_message() << std::endl;
        return false;
    }
    return true;
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== Planet Generator Configuration ===\n";
    std::cout << "Input: " << config_.input_file << "\n";
    std::cout << "Channel: " << channel_name(config_.channel)
              << (config_.invert_heights ? " (inverted)" : "") << "\n";
    std::cout << "Projection: " << projection_name(config_.projection) << "\n";
    std::cout << "Points: " << (config_.target_points ? std::to_string(config_.target_points) : "all") << "\n";
    std::cout << "Scale: " << config_.scale << ", protrusion: " << config_.protrusion << "\n";
    std::cout << "Caps: " << config_.caps << "\n";
    if (config_.caps_height) std::cout << "Caps height: " << *config_.caps_height << "\n";
    std::cout << "Meridians: " << config_.meridians.size() << "\n";
    if (config_.meridians_height) std::cout << "Meridians height: " << *config_.meridians_height << "\n";
    if (config_.equator_height) std::cout << "Equator height: " << *config_.equator_height << "\n";
    if (config_.logo_north) {
        std::cout << "North logo: " << *config_.logo_north << " (scale " << config_.logo_north_scale << ")\n";
    }
    if (config_.logo_south) {
        std::cout << "South logo: " << *config_.logo_south << " (scale " << config_.logo_south_scale << ")\n";
    }
    std::cout << "Output formats: " << join(config_.output_formats) << "\n";
    std::cout << "Output directory: " << config_.output_directory << "\n";
    std::cout << "======================================\n\n";
}

} // namespace planet
