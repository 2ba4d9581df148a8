/**
 * @file split_main.cpp
 * @brief Entry point for planet-split
 */

#include "cli/SplitCommandLineInterface.hpp"
#include "core/HemisphereSplitter.hpp"
#include "core/Logger.hpp"
#include "export/StlFile.hpp"
#include <filesystem>
#include <iostream>

using namespace planet;

int main(int argc, char* argv[]) {
    try {
        SplitCommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();
        }

        const SplitOptions& options = cli.get_options();
        if (options.log_file) {
            Logger::setSharedLogFile(options.log_file);
        }
        Logger logger("planet-split");

        if (!std::filesystem::exists(options.input_file)) {
            logger.error("File " + options.input_file + " does not exist");
            return 1;
        }

        std::vector<StlTriangle> triangles;
        try {
            triangles = read_binary_stl(options.input_file, options.force);
        } catch (const StlFormatError& e) {
            logger.error(std::string(e.what()) + (options.force ? "" : " (use --force to read it anyway)"));
            return 1;
        }
        logger.info("Read " + std::to_string(triangles.size()) + " triangles from " + options.input_file);

        HemisphereSplitter splitter(options.split);
        SplitResult result = splitter.split(triangles);

        bool success = write_binary_stl(cli.output_path("north"), result.north);
        success = write_binary_stl(cli.output_path("south"), result.south) && success;
        if (options.split.discard_border) {
            success = write_binary_stl(cli.output_path("border"), result.discarded) && success;
        }
        if (!success) {
            logger.error("Could not write the output files");
            return 1;
        }

        logger.info("North: " + std::to_string(result.north.size()) + " triangles -> " + cli.output_path("north"));
        logger.info("South: " + std::to_string(result.south.size()) + " triangles -> " + cli.output_path("south"));
        if (options.split.discard_border) {
            logger.info("Border: " + std::to_string(result.discarded.size()) + " triangles -> " +
                        cli.output_path("border"));
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
