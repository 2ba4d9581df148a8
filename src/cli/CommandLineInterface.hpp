/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for planet-gen
 */

#pragma once

#include "planet_generator.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace planet {

/**
 * @brief Parses planet-gen arguments and an optional JSON config into a PlanetConfig
 *
 * Precedence, lowest first: built-in defaults, --config file, command line,
 * PLANET_LOG_LEVEL / PLANET_LOG_FILE environment variables for logging.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if generation should run; false on error, --help,
     *         --version or --create-config (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    bool parse_arguments(const std::vector<std::string>& args);

    const PlanetConfig& get_config() const { return config_; }

    /**
     * @brief Process exit status to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    bool is_dry_run() const { return dry_run_; }

    void print_config() const;

    /**
     * @brief Run the parameter checks on the parsed configuration
     *
     * Problems are printed to stderr. Used by --dry-run, which stops
     * before the generator would run the same checks.
     */
    bool check_config() const;

    /**
     * @brief Load settings from a JSON file into the current configuration
     *
     * Keys mirror the long option names with underscores, e.g.
     * "projection", "points", "logo_north", "meridians".
     */
    bool load_config_file(const std::string& filename);

    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Parse "lon[,lon...]" in degrees, paired with widths in degrees
     *
     * A single width applies to every meridian.
     * @throws std::invalid_argument on malformed numbers or mismatched lengths
     */
    static std::vector<Meridian> parse_meridians(const std::string& longitudes,
                                                 const std::string& widths);

    static std::vector<std::string> parse_formats(const std::string& formats_str);

private:
    PlanetConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void add_options(SimpleCommandLineParser& parser) const;

    bool parse_all_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    void apply_environment();
};

} // namespace planet
