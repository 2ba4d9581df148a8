/**
 * @file SplitCommandLineInterface.cpp
 * @brief Argument handling for planet-split
 */

#include "SplitCommandLineInterface.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <filesystem>
#include <iostream>

namespace planet {

bool SplitCommandLineInterface::parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return parse_arguments(args);
}

bool SplitCommandLineInterface::parse_arguments(const std::vector<std::string>& args) {
    SimpleCommandLineParser parser("planet-split",
        "Split a binary STL model into northern and southern halves\n"
        "\n"
        "Triangles crossing the cutting plane are cut along it, so both halves\n"
        "have a flat rim at z = zcut.");
    parser.set_usage("[OPTIONS] MODEL.stl");
    parser.add_example("earth.stl");
    parser.add_example("earth.stl --zcut 0.1 --name earth_cut");
    parser.add_example("earth.stl --number 5000");

    parser.add_option("zcut", "z", "Height of the cutting plane, or auto for the mean z of all vertices", false, "auto");
    parser.add_flag("discard-border", "", "Write triangles crossing the plane to <name>_border.stl instead of cutting them");
    parser.add_option("number", "n", "Split by order instead: the first N triangles go north, the rest south");
    parser.add_option("name", "", "Base name of the output files (default: input name)");
    parser.add_flag("force", "f", "Read the model even if its header disagrees with the file size");
    parser.add_option("log-level", "", "Logging level: 1=ERROR ... 6=TRACE, or \"3,HemisphereSplitter=6\"", false, "3");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("version", "", "Show version information");

    options_ = SplitOptions();
    exit_code_ = 0;

    if (!parser.parse(args)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "planet-split " << PLANET_VERSION_STRING << std::endl;
        return false;
    }

    const auto& positional = parser.get_positional();
    if (positional.size() != 1) {
        std::cerr << "Expected exactly one input model (see --help)" << std::endl;
        exit_code_ = 2;
        return false;
    }
    options_.input_file = positional.front();

    auto zcut = parser.get("zcut").value_or("auto");
    if (zcut != "auto") {
        auto value = parser.get_as<double>("zcut");
        if (!value) {
            std::cerr << "--zcut must be auto or a number, got " << zcut << std::endl;
            exit_code_ = 2;
            return false;
        }
        options_.split.zcut = *value;
    }

    if (parser.get("number")) {
        auto count = parser.get_as<long long>("number");
        if (!count || *count < 0) {
            std::cerr << "--number must be a non-negative integer" << std::endl;
            exit_code_ = 2;
            return false;
        }
        options_.split.mode = SplitConfig::Mode::COUNT;
        options_.split.count = static_cast<size_t>(*count);
    }

    options_.split.discard_border = parser.get_flag("discard-border");
    options_.force = parser.get_flag("force");

    options_.base_name = parser.get("name").value_or(
        (std::filesystem::path(options_.input_file).parent_path() /
         std::filesystem::path(options_.input_file).stem()).string());

    if (auto level = parser.get("log-level")) {
        Logger::parseLogConfig(level.value());
    }
    if (auto log_file = parser.get("log-file")) {
        options_.log_file = log_file.value();
    }

    return true;
}

std::string SplitCommandLineInterface::output_path(const std::string& part) const {
    return options_.base_name + "_" + part + ".stl";
}

} // namespace planet
