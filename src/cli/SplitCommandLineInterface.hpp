/**
 * @file SplitCommandLineInterface.hpp
 * @brief Command line interface for planet-split
 */

#pragma once

#include "../core/HemisphereSplitter.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace planet {

/**
 * @brief Everything one planet-split run needs
 */
struct SplitOptions {
    std::string input_file;
    std::string base_name;        ///< Outputs are <base>_north.stl, <base>_south.stl, <base>_border.stl
    SplitConfig split;
    bool force = false;           ///< Trust the header's triangle count even if the file size disagrees
    std::optional<std::string> log_file;
};

class SplitCommandLineInterface {
public:
    SplitCommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the split should run; otherwise see exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);

    bool parse_arguments(const std::vector<std::string>& args);

    const SplitOptions& get_options() const { return options_; }

    int exit_code() const { return exit_code_; }

    /**
     * @brief Output file for one part: "north", "south" or "border"
     */
    std::string output_path(const std::string& part) const;

private:
    SplitOptions options_;
    int exit_code_ = 0;
};

} // namespace planet
