/**
 * @file main.cpp
 * @brief Entry point for planet-gen
 *
 * Turns a projected map image into a closed 3D model of the whole planet.
 */

#include "planet_generator.hpp"
#include "cli/CommandLineInterface.hpp"
#include "core/Logger.hpp"
#include <iostream>
#include <chrono>
#include <filesystem>

using namespace planet;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Image loading: " << metrics.image_loading_time.count() << "ms\n";
    std::cout << "Sampling: " << metrics.sampling_time.count() << "ms\n";
    std::cout << "Triangulation: " << metrics.triangulation_time.count() << "ms\n";
    std::cout << "Export time: " << metrics.export_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Points generated: " << metrics.points_generated << "\n";
    std::cout << "Faces generated: " << metrics.faces_generated << "\n";
    std::cout << "============================\n";
}

/**
 * @brief Print mesh validation results
 */
void print_validation_results(const MeshValidationResult& result) {
    std::cout << "\n=== Mesh Validation Results ===\n";
    std::cout << "Manifold: " << (result.is_manifold ? "YES" : "NO") << "\n";
    std::cout << "Watertight: " << (result.is_watertight ? "YES" : "NO") << "\n";

    if (result.boundary_edge_count > 0) {
        std::cout << "Boundary edges: " << result.boundary_edge_count << "\n";
    }
    if (result.non_manifold_edge_count > 0) {
        std::cout << "Non-manifold edges: " << result.non_manifold_edge_count << "\n";
    }
    if (result.num_degenerate_faces > 0) {
        std::cout << "Degenerate faces: " << result.num_degenerate_faces << "\n";
    }
    if (result.inward_faces > 0) {
        std::cout << "Inward-facing faces: " << result.inward_faces << "\n";
    }
    std::cout << "===============================\n";
}

int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, config creation or a usage error
        }

        const PlanetConfig& config = cli.get_config();
        if (config.log_file) {
            Logger::setSharedLogFile(config.log_file);
        }

        if (config.log_level >= static_cast<int>(LogLevel::DETAILED)) {
            cli.print_config();
        }

        if (cli.is_dry_run()) {
            if (!cli.check_config()) {
                return 2;
            }
            std::cout << "Dry run mode - configuration parsed successfully\n";
            return 0;
        }

        if (!std::filesystem::exists(config.input_file)) {
            std::cerr << "Error: File " << config.input_file << " does not exist\n";
            return 1;
        }

        std::filesystem::create_directories(config.output_directory);

        PlanetGenerator generator(config);
        if (!generator.generate_model()) {
            std::cerr << "Error: Model generation failed\n";
            return 1;
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);

        if (config.log_level >= static_cast<int>(LogLevel::DETAILED)) {
            print_performance_summary(generator.get_metrics());
            print_validation_results(generator.get_validation_result());
        }

        if (config.log_level >= static_cast<int>(LogLevel::INFO)) {
            std::cout << "Model generation completed successfully in "
                      << total_duration.count() << "ms\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
